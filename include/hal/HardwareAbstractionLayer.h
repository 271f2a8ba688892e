// include/hal/HardwareAbstractionLayer.h
#pragma once

#include <cstdint>

/**
 * @brief Hardware Abstraction Layer for the nitrous stage controller
 *
 * The control core never touches GPIO or bus drivers directly. Relay outputs
 * and their fault lines are reached through these interfaces, so the same
 * core runs against the board binding on target and against mocks on the host.
 */

namespace HAL {

/**
 * @brief Relay output bank interface (up to 8 channels)
 */
class IRelay {
public:
    enum class State {
        OFF = 0,
        ON = 1,
        UNKNOWN = 2
    };

    /**
     * @brief Fault-line and current feedback for one channel
     */
    struct HealthReading {
        bool relayFault;     // Contact/coil fault reported by the driver
        bool fuseBlown;      // Fuse sense line open
        float currentAmp;    // Measured current draw, 0 when not sensed
        bool currentValid;   // True when currentAmp comes from a sensor
    };

    virtual ~IRelay() = default;

    /**
     * @brief Initialize the relay module
     * @return true if successful
     */
    virtual bool initialize() = 0;

    /**
     * @brief Energize or de-energize a relay
     * @param channel Relay channel (0-7)
     * @param state Desired state (ON/OFF)
     * @return true if the driver accepted the command
     */
    virtual bool setState(uint8_t channel, State state) = 0;

    /**
     * @brief Get last commanded relay state
     * @param channel Relay channel
     * @return Current state, UNKNOWN for an invalid channel
     */
    virtual State getState(uint8_t channel) const = 0;

    /**
     * @brief Read fault lines and current for one channel
     * @param channel Relay channel
     * @param out Filled on success
     * @return false when the board has no feedback for this channel
     */
    virtual bool readHealth(uint8_t channel, HealthReading& out) = 0;

    /**
     * @brief Get number of relay channels
     */
    virtual uint8_t getChannelCount() const = 0;

    /**
     * @brief Get relay module name
     */
    virtual const char* getName() const = 0;
};

} // namespace HAL
