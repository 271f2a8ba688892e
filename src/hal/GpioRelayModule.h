// src/hal/GpioRelayModule.h
// HAL binding for a plain GPIO-driven relay board

#pragma once

#include "hal/HardwareAbstractionLayer.h"
#include "config/RelayIndices.h"
#include <array>

namespace HAL {

/**
 * @brief Relay board driven directly from ESP32 GPIOs
 *
 * One output pin per channel, no fault or current feedback: readHealth()
 * always returns false and the Relay Bank falls back to Unknown -> Ok.
 */
class GpioRelayModule : public IRelay {
private:
    std::array<uint8_t, RelayIndex::MAX_RELAYS> pins;
    std::array<State, RelayIndex::MAX_RELAYS> lastStates;
    bool activeLow;
    bool initialized;
    static constexpr const char* TAG = "GpioRelay";

public:
    /**
     * @brief Construct the GPIO relay binding
     * @param relayPins GPIO number for each channel 0-7
     * @param invert true for boards whose inputs are active-low
     */
    GpioRelayModule(const std::array<uint8_t, RelayIndex::MAX_RELAYS>& relayPins, bool invert);

    /**
     * @brief Configure all pins as outputs, driven to OFF
     */
    bool initialize() override;

    bool setState(uint8_t channel, State state) override;

    /**
     * @brief Last commanded state (the board cannot be read back)
     */
    State getState(uint8_t channel) const override;

    bool readHealth(uint8_t channel, HealthReading& out) override;

    uint8_t getChannelCount() const override;

    const char* getName() const override;
};

} // namespace HAL
