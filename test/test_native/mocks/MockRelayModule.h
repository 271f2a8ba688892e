/**
 * @file MockRelayModule.h
 * @brief Recording HAL::IRelay for native tests
 *
 * Counts every ON/OFF command per channel, can reject writes on selected
 * channels and can report fault/fuse/current feedback.
 */

#ifndef MOCK_RELAY_MODULE_H
#define MOCK_RELAY_MODULE_H

#include <array>
#include <cstdint>
#include "hal/HardwareAbstractionLayer.h"

class MockRelayModule : public HAL::IRelay {
public:
    static constexpr uint8_t NUM_CHANNELS = 8;

    std::array<State, NUM_CHANNELS> states;
    std::array<uint32_t, NUM_CHANNELS> onCalls;
    std::array<uint32_t, NUM_CHANNELS> offCalls;
    std::array<bool, NUM_CHANNELS> rejectWrites;
    std::array<HealthReading, NUM_CHANNELS> health;
    bool healthAvailable;
    uint32_t rejectedWrites;

    MockRelayModule() {
        reset();
    }

    void reset() {
        states.fill(State::OFF);
        onCalls.fill(0);
        offCalls.fill(0);
        rejectWrites.fill(false);
        health.fill(HealthReading{false, false, 0.0f, false});
        healthAvailable = false;
        rejectedWrites = 0;
    }

    bool initialize() override {
        return true;
    }

    bool setState(uint8_t channel, State state) override {
        if (channel >= NUM_CHANNELS) {
            return false;
        }
        if (state == State::ON) {
            onCalls[channel]++;
        } else {
            offCalls[channel]++;
        }
        if (rejectWrites[channel]) {
            rejectedWrites++;
            return false;
        }
        states[channel] = state;
        return true;
    }

    State getState(uint8_t channel) const override {
        return channel < NUM_CHANNELS ? states[channel] : State::UNKNOWN;
    }

    bool readHealth(uint8_t channel, HealthReading& out) override {
        if (!healthAvailable || channel >= NUM_CHANNELS) {
            return false;
        }
        out = health[channel];
        return true;
    }

    uint8_t getChannelCount() const override {
        return NUM_CHANNELS;
    }

    const char* getName() const override {
        return "MockRelay";
    }

    bool isOn(uint8_t channel) const {
        return channel < NUM_CHANNELS && states[channel] == State::ON;
    }

    uint32_t totalOnCalls() const {
        uint32_t total = 0;
        for (uint32_t n : onCalls) total += n;
        return total;
    }

    uint32_t totalOffCalls() const {
        uint32_t total = 0;
        for (uint32_t n : offCalls) total += n;
        return total;
    }
};

#endif // MOCK_RELAY_MODULE_H
