// include/modules/nitrous/RelayBank.h
#pragma once

#include <array>
#include <cstdint>
#include "config/RelayIndices.h"
#include "hal/HardwareAbstractionLayer.h"
#include "modules/nitrous/NitrousTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Per-relay result of one health check
 */
struct RelayHealthEntry {
    uint8_t relayId;
    uint8_t channel;
    RelayStatus status;
    RelayStatus fuseStatus;
    float currentAmp;
    bool overCurrent;
};

using RelayHealthList = std::array<RelayHealthEntry, RelayIndex::MAX_RELAYS>;

/**
 * @brief The 8 logical relay channels of the controller
 *
 * Commands go out through HAL::IRelay. Without a driver the bank runs in
 * simulation mode: commands are recorded and health checks resolve Unknown
 * to Ok. Not thread-safe; NitrousEngine's caller holds the lock.
 */
class RelayBank {
public:
    /**
     * @param driver Relay output driver, nullptr for simulation mode. Not owned.
     */
    explicit RelayBank(HAL::IRelay* driver);

    /**
     * @brief Energize a channel
     * @return false for an out-of-range channel (no-op) or a rejected write
     */
    bool activate(uint8_t channel);

    /**
     * @brief De-energize a channel
     * @return false for an out-of-range channel (no-op) or a rejected write
     */
    bool deactivate(uint8_t channel);

    /**
     * @brief Poll every relay, once per control loop tick
     *
     * Without driver feedback an Unknown relay or fuse becomes Ok on its
     * first check. Current above max_amp is flagged and logged, never acted on.
     * The returned list is owned by the bank and refilled on every call.
     */
    const RelayHealthList& checkHealth(uint32_t now);
    const RelayHealthList& lastHealth() const { return health_; }

    Result<void> updateConfig(uint8_t channel, const RelayConfigUpdate& update);

    /**
     * @brief De-energize every channel that is commanded on
     * @return false if any write was rejected
     */
    bool allOff();

    bool isEnergized(uint8_t channel) const;
    const Relay& relay(uint8_t channel) const { return relays_[channel]; }
    const std::array<Relay, RelayIndex::MAX_RELAYS>& relays() const { return relays_; }
    bool isSimulated() const { return driver_ == nullptr; }

    // Writes rejected by the driver since construction
    uint32_t getWriteFailures() const { return writeFailures_; }

private:
    bool write(uint8_t channel, bool energize);

    HAL::IRelay* driver_;
    std::array<Relay, RelayIndex::MAX_RELAYS> relays_;
    RelayHealthList health_;
    uint32_t writeFailures_;

    static const char* TAG;
};
