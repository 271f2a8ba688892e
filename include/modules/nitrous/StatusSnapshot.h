// include/modules/nitrous/StatusSnapshot.h
#pragma once

#include <array>
#include <cstdint>
#include "config/NitrousLimits.h"
#include "config/RelayIndices.h"
#include "modules/nitrous/NitrousTypes.h"

struct StageStatus {
    uint8_t stageNumber;
    char name[NITROUS_NAME_LEN];
    bool enabled;
    StageMode mode;
    TimerBehavior timerBehavior;
    StartTrigger startTrigger;
    uint8_t relayChannel;
    uint16_t shotSizeHp;
    bool holdOnPedal;
    bool active;
    bool pending;
    uint32_t elapsedMs;      // Since activation, 0 when inactive
    uint32_t remainingMs;    // Timed stages only
};

struct TimerStatus {
    uint8_t timerId;
    char name[NITROUS_NAME_LEN];
    bool enabled;
    bool active;
    uint32_t durationMs;
    uint32_t elapsedMs;
    uint32_t remainingMs;
};

struct PurgeStatus {
    uint8_t purgeId;
    char name[NITROUS_NAME_LEN];
    bool enabled;
    uint8_t relayChannel;
    RelayStatus fuseStatus;
    bool active;
    uint32_t durationMs;
    uint32_t elapsedMs;      // Lets the caller schedule deactivatePurge()
};

/**
 * @brief Immutable copy of the controller state, built under the lock
 *
 * Plain value type: observers receive it after the lock has been released
 * and may keep a copy.
 */
struct StatusSnapshot {
    uint32_t timestampMs = 0;

    uint8_t numStages = 0;
    uint8_t activeStageCount = 0;
    uint8_t activeStages[NitrousConfig::Limits::MAX_STAGES] = {0};
    StageStatus stages[NitrousConfig::Limits::MAX_STAGES] = {};

    uint8_t numTimers = 0;
    uint8_t activeTimerCount = 0;
    uint8_t activeTimers[NitrousConfig::Limits::MAX_TIMERS] = {0};
    TimerStatus timers[NitrousConfig::Limits::MAX_TIMERS] = {};

    std::array<Relay, RelayIndex::MAX_RELAYS> relays = {};
    PurgeStatus purges[NitrousConfig::Limits::MAX_PURGES] = {};

    InputState inputs;

    uint32_t tickCount = 0;
    uint32_t tickFailures = 0;

    bool isStageActive(uint8_t stageNumber) const {
        for (uint8_t i = 0; i < activeStageCount; i++) {
            if (activeStages[i] == stageNumber) {
                return true;
            }
        }
        return false;
    }

    bool isTimerActive(uint8_t timerId) const {
        for (uint8_t i = 0; i < activeTimerCount; i++) {
            if (activeTimers[i] == timerId) {
                return true;
            }
        }
        return false;
    }
};
