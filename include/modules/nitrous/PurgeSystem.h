// include/modules/nitrous/PurgeSystem.h
#pragma once

#include <array>
#include <cstdint>
#include "config/NitrousLimits.h"
#include "modules/nitrous/NitrousTypes.h"
#include "modules/nitrous/RelayBank.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Named purge solenoids, each bound to one relay channel
 *
 * Purges are caller-driven: activate() opens the solenoid and the caller
 * closes it with deactivate() once durationMs has passed. Two purges may share
 * a channel; the relay stays energized while either of them is active.
 */
class PurgeSystem {
public:
    explicit PurgeSystem(RelayBank& bank);

    /**
     * @brief Open a purge
     * @param purgeId 1-based purge id
     * @param now Current time in ms
     * @return false (no relay call) for an unknown id, a disabled purge or an
     *         out-of-range channel
     */
    bool activate(uint8_t purgeId, uint32_t now);

    /**
     * @brief Close a purge
     * @return false for an unknown id or an out-of-range channel
     */
    bool deactivate(uint8_t purgeId);

    /**
     * @brief Apply a sparse update to one purge
     *
     * Stage/purge channel conflicts are checked by NitrousEngine before this call.
     */
    Result<void> updateConfig(uint8_t purgeId, const PurgeConfigUpdate& update);

    // Copy the bound relay's fuse state into each purge
    void syncFuseStatus();

    // Close every active purge, false if a relay write was rejected
    bool allOff();

    bool usesChannel(uint8_t channel) const;
    uint8_t getCount() const { return NitrousConfig::Limits::MAX_PURGES; }
    const PurgeChannel* find(uint8_t purgeId) const;
    const std::array<PurgeChannel, NitrousConfig::Limits::MAX_PURGES>& purges() const { return purges_; }

private:
    PurgeChannel* findMutable(uint8_t purgeId);
    bool channelHeldByOther(const PurgeChannel& purge) const;

    RelayBank& bank_;
    std::array<PurgeChannel, NitrousConfig::Limits::MAX_PURGES> purges_;

    static const char* TAG;
};
