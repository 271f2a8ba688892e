// src/modules/nitrous/PurgeSystem.cpp
#include "modules/nitrous/PurgeSystem.h"
#include "config/RelayIndices.h"
#include "LoggingMacros.h"
#include <cstring>

const char* PurgeSystem::TAG = "Purge";

namespace {
    struct PurgeDefault {
        const char* name;
        uint8_t channel;
    };

    const PurgeDefault DEFAULT_PURGES[NitrousConfig::Limits::MAX_PURGES] = {
        {"Motor Purge",  RelayIndex::MOTOR_PURGE},
        {"Line Purge 1", RelayIndex::LINE_PURGE},
        {"Line Purge 2", RelayIndex::LINE_PURGE}
    };
}

PurgeSystem::PurgeSystem(RelayBank& bank)
    : bank_(bank), purges_{} {
    for (uint8_t i = 0; i < NitrousConfig::Limits::MAX_PURGES; i++) {
        PurgeChannel& purge = purges_[i];
        purge.purgeId = i + 1;
        strncpy(purge.name, DEFAULT_PURGES[i].name, sizeof(purge.name) - 1);
        purge.name[sizeof(purge.name) - 1] = '\0';
        purge.relayChannel = DEFAULT_PURGES[i].channel;
    }
}

bool PurgeSystem::activate(uint8_t purgeId, uint32_t now) {
    PurgeChannel* purge = findMutable(purgeId);
    if (purge == nullptr) {
        LOG_WARN(TAG, "activate: unknown purge %u", purgeId);
        return false;
    }
    if (!purge->enabled) {
        LOG_WARN(TAG, "activate: %s is disabled", purge->name);
        return false;
    }
    if (!RelayIndex::isValid(purge->relayChannel)) {
        LOG_WARN(TAG, "activate: %s bound to invalid channel %u", purge->name, purge->relayChannel);
        return false;
    }

    bool ok = bank_.activate(purge->relayChannel);
    purge->active = true;
    purge->activatedMs = now;
    LOG_INFO(TAG, "%s open on channel %u (%lums)", purge->name, purge->relayChannel,
             (unsigned long)purge->durationMs);
    return ok;
}

bool PurgeSystem::deactivate(uint8_t purgeId) {
    PurgeChannel* purge = findMutable(purgeId);
    if (purge == nullptr) {
        LOG_WARN(TAG, "deactivate: unknown purge %u", purgeId);
        return false;
    }
    if (!RelayIndex::isValid(purge->relayChannel)) {
        LOG_WARN(TAG, "deactivate: %s bound to invalid channel %u", purge->name, purge->relayChannel);
        return false;
    }

    bool wasActive = purge->active;
    purge->active = false;

    bool ok = true;
    if (channelHeldByOther(*purge)) {
        LOG_DEBUG(TAG, "%s closed, channel %u still held by another purge",
                  purge->name, purge->relayChannel);
    } else {
        ok = bank_.deactivate(purge->relayChannel);
    }

    if (wasActive) {
        LOG_INFO(TAG, "%s closed", purge->name);
    }
    return ok;
}

Result<void> PurgeSystem::updateConfig(uint8_t purgeId, const PurgeConfigUpdate& update) {
    PurgeChannel* purge = findMutable(purgeId);
    if (purge == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown purge id");
    }

    PurgeChannel merged = *purge;
    update.enabled.applyTo(merged.enabled);
    update.durationMs.applyTo(merged.durationMs);
    update.relayChannel.applyTo(merged.relayChannel);

    if (!RelayIndex::isValid(merged.relayChannel)) {
        return Result<void>(SystemError::CONFIG_INVALID, "relay channel out of range");
    }
    if (merged.durationMs < NitrousConfig::Limits::PURGE_DURATION_MIN_MS ||
        merged.durationMs > NitrousConfig::Limits::PURGE_DURATION_MAX_MS) {
        return Result<void>(SystemError::CONFIG_INVALID, "purge duration out of range");
    }
    if (purge->active && merged.relayChannel != purge->relayChannel) {
        return Result<void>(SystemError::INVALID_STATE, "cannot rebind an active purge");
    }

    *purge = merged;
    if (purge->active && !purge->enabled && !deactivate(purgeId)) {
        LOG_WARN(TAG, "%s disabled but relay release failed", purge->name);
    }

    LOG_INFO(TAG, "%s: %s, channel %u, %lums", purge->name,
             purge->enabled ? "enabled" : "disabled", purge->relayChannel,
             (unsigned long)purge->durationMs);
    return Result<void>();
}

void PurgeSystem::syncFuseStatus() {
    for (auto& purge : purges_) {
        if (RelayIndex::isValid(purge.relayChannel)) {
            purge.fuseStatus = bank_.relay(purge.relayChannel).fuseStatus;
        }
    }
}

bool PurgeSystem::allOff() {
    bool ok = true;
    for (auto& purge : purges_) {
        if (purge.active) {
            purge.active = false;
            if (!bank_.deactivate(purge.relayChannel)) {
                ok = false;
            }
        }
    }
    return ok;
}

bool PurgeSystem::usesChannel(uint8_t channel) const {
    for (const auto& purge : purges_) {
        if (purge.relayChannel == channel) {
            return true;
        }
    }
    return false;
}

const PurgeChannel* PurgeSystem::find(uint8_t purgeId) const {
    if (purgeId < 1 || purgeId > purges_.size()) {
        return nullptr;
    }
    return &purges_[purgeId - 1];
}

PurgeChannel* PurgeSystem::findMutable(uint8_t purgeId) {
    if (purgeId < 1 || purgeId > purges_.size()) {
        return nullptr;
    }
    return &purges_[purgeId - 1];
}

bool PurgeSystem::channelHeldByOther(const PurgeChannel& purge) const {
    for (const auto& other : purges_) {
        if (other.purgeId != purge.purgeId && other.active &&
            other.relayChannel == purge.relayChannel) {
            return true;
        }
    }
    return false;
}
