// src/modules/nitrous/RelayBank.cpp
#include "modules/nitrous/RelayBank.h"
#include "config/NitrousLimits.h"
#include "config/SystemConstants.h"
#include "LoggingMacros.h"
#include <cstdio>

const char* RelayBank::TAG = "RelayBank";

RelayBank::RelayBank(HAL::IRelay* driver)
    : driver_(driver), relays_{}, health_{}, writeFailures_(0) {
    for (uint8_t ch = 0; ch < RelayIndex::MAX_RELAYS; ch++) {
        Relay& relay = relays_[ch];
        relay.relayId = RelayIndex::toPhysical(ch);
        relay.channel = ch;
        snprintf(relay.name, sizeof(relay.name), "Relay %u", relay.relayId);
    }

    if (driver_ == nullptr) {
        LOG_WARN(TAG, "No relay driver - running in simulation mode");
    } else if (driver_->getChannelCount() < RelayIndex::MAX_RELAYS) {
        LOG_WARN(TAG, "Driver %s exposes %u channels, expected %u",
                 driver_->getName(), driver_->getChannelCount(), RelayIndex::MAX_RELAYS);
    }
}

bool RelayBank::activate(uint8_t channel) {
    if (!RelayIndex::isValid(channel)) {
        LOG_WARN(TAG, "activate: channel %u out of range - ignored", channel);
        return false;
    }
    return write(channel, true);
}

bool RelayBank::deactivate(uint8_t channel) {
    if (!RelayIndex::isValid(channel)) {
        LOG_WARN(TAG, "deactivate: channel %u out of range - ignored", channel);
        return false;
    }
    return write(channel, false);
}

bool RelayBank::write(uint8_t channel, bool energize) {
    Relay& relay = relays_[channel];

    // The commanded state is recorded even when the driver rejects it, so the
    // Active Set and the bank always agree on what was asked for
    relay.energized = energize;

    if (driver_ == nullptr) {
        LOG_DEBUG(TAG, "[SIM] %s %s", relay.name, energize ? "ON" : "OFF");
        return true;
    }

    bool ok = driver_->setState(channel, energize ? HAL::IRelay::State::ON
                                                  : HAL::IRelay::State::OFF);
    if (!ok) {
        writeFailures_++;
        if (relay.status != RelayStatus::FAILED) {
            LOG_TRANSITION(TAG, "Relay", relay.relayId,
                           relayStatusToString(relay.status),
                           relayStatusToString(RelayStatus::FAILED));
            relay.status = RelayStatus::FAILED;
        }
        LOG_ERROR(TAG, "%s: driver rejected %s command", relay.name, energize ? "ON" : "OFF");
        return false;
    }
    return true;
}

const RelayHealthList& RelayBank::checkHealth(uint32_t now) {
    for (uint8_t ch = 0; ch < RelayIndex::MAX_RELAYS; ch++) {
        Relay& relay = relays_[ch];
        RelayStatus newStatus = relay.status;
        RelayStatus newFuse = relay.fuseStatus;

        HAL::IRelay::HealthReading reading = {};
        if (driver_ != nullptr && driver_->readHealth(ch, reading)) {
            newStatus = reading.relayFault ? RelayStatus::FAILED : RelayStatus::OK;
            newFuse = reading.fuseBlown ? RelayStatus::BLOWN_FUSE : RelayStatus::OK;
            if (reading.currentValid) {
                relay.currentAmp = reading.currentAmp;
            }
        } else {
            // No feedback lines: assume healthy once checked
            if (newStatus == RelayStatus::UNKNOWN) {
                newStatus = RelayStatus::OK;
            }
            if (newFuse == RelayStatus::UNKNOWN) {
                newFuse = RelayStatus::OK;
            }
        }

        if (newStatus != relay.status) {
            LOG_TRANSITION(TAG, "Relay", relay.relayId,
                           relayStatusToString(relay.status), relayStatusToString(newStatus));
            if (newStatus == RelayStatus::FAILED) {
                ErrorHandler::logError(TAG, SystemError::RELAY_FAULT, relay.name);
            }
            relay.status = newStatus;
        }

        if (newFuse != relay.fuseStatus) {
            LOG_TRANSITION(TAG, "Fuse", relay.relayId,
                           relayStatusToString(relay.fuseStatus), relayStatusToString(newFuse));
            if (newFuse == RelayStatus::BLOWN_FUSE) {
                ErrorHandler::logError(TAG, SystemError::RELAY_BLOWN_FUSE, relay.name);
            }
            relay.fuseStatus = newFuse;
        }

        // Telemetry only, no automatic cutoff
        if (!relay.overCurrent && relay.currentAmp > relay.maxAmp) {
            relay.overCurrent = true;
            LOG_WARN(TAG, "%s drawing %.1fA, above %.1fA max",
                     relay.name, relay.currentAmp, relay.maxAmp);
        } else if (relay.overCurrent &&
                   relay.currentAmp < relay.maxAmp - SystemConstants::Relay::OVERCURRENT_HYSTERESIS_AMP) {
            relay.overCurrent = false;
            LOG_INFO(TAG, "%s current back to %.1fA", relay.name, relay.currentAmp);
        }

        relay.lastCheckMs = now;

        health_[ch] = {relay.relayId, relay.channel, relay.status, relay.fuseStatus,
                       relay.currentAmp, relay.overCurrent};
    }

    return health_;
}

Result<void> RelayBank::updateConfig(uint8_t channel, const RelayConfigUpdate& update) {
    if (!RelayIndex::isValid(channel)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "relay channel out of range");
    }

    Relay merged = relays_[channel];
    update.isSplitSystem.applyTo(merged.isSplitSystem);

    if (update.maxAmp.present) {
        merged.maxAmp = update.maxAmp.value;
    } else if (update.isSplitSystem.present) {
        merged.maxAmp = merged.isSplitSystem ? NitrousConfig::Defaults::RELAY_MAX_AMP_SPLIT
                                             : NitrousConfig::Defaults::RELAY_MAX_AMP_SINGLE;
    }

    if (merged.maxAmp <= 0.0f || merged.maxAmp > NitrousConfig::Limits::RELAY_MAX_AMP_LIMIT) {
        return Result<void>(SystemError::CONFIG_INVALID, "max_amp out of range");
    }

    relays_[channel] = merged;
    LOG_INFO(TAG, "%s: max %.1fA, %s", merged.name, merged.maxAmp,
             merged.isSplitSystem ? "split" : "single");
    return Result<void>();
}

bool RelayBank::allOff() {
    bool ok = true;
    for (uint8_t ch = 0; ch < RelayIndex::MAX_RELAYS; ch++) {
        if (relays_[ch].energized && !write(ch, false)) {
            ok = false;
        }
    }
    return ok;
}

bool RelayBank::isEnergized(uint8_t channel) const {
    return RelayIndex::isValid(channel) && relays_[channel].energized;
}
