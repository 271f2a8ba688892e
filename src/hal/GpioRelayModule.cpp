// src/hal/GpioRelayModule.cpp
// HAL implementation for a GPIO-driven relay board

#include "hal/GpioRelayModule.h"
#include "LoggingMacros.h"
#include <Arduino.h>

namespace HAL {

GpioRelayModule::GpioRelayModule(const std::array<uint8_t, RelayIndex::MAX_RELAYS>& relayPins,
                                 bool invert)
    : pins(relayPins), activeLow(invert), initialized(false) {
    lastStates.fill(State::UNKNOWN);
}

bool GpioRelayModule::initialize() {
    // Guard against double initialization
    if (initialized) {
        return true;
    }

    for (uint8_t ch = 0; ch < RelayIndex::MAX_RELAYS; ch++) {
        pinMode(pins[ch], OUTPUT);
        digitalWrite(pins[ch], activeLow ? HIGH : LOW);
        lastStates[ch] = State::OFF;
    }

    initialized = true;
    LOG_INFO(TAG, "GPIO relay board initialized, %u channels, %s",
             RelayIndex::MAX_RELAYS, activeLow ? "active-low" : "active-high");
    return true;
}

bool GpioRelayModule::setState(uint8_t channel, State state) {
    if (!initialized || channel >= RelayIndex::MAX_RELAYS || state == State::UNKNOWN) {
        return false;
    }

    bool energize = (state == State::ON);
    digitalWrite(pins[channel], (energize != activeLow) ? HIGH : LOW);
    lastStates[channel] = state;
    return true;
}

IRelay::State GpioRelayModule::getState(uint8_t channel) const {
    if (!initialized || channel >= RelayIndex::MAX_RELAYS) {
        return State::UNKNOWN;
    }
    return lastStates[channel];
}

bool GpioRelayModule::readHealth(uint8_t channel, HealthReading& out) {
    (void)channel;
    (void)out;
    // No fault or current sense lines on this board
    return false;
}

uint8_t GpioRelayModule::getChannelCount() const {
    return RelayIndex::MAX_RELAYS;
}

const char* GpioRelayModule::getName() const {
    return "GPIO";
}

} // namespace HAL
