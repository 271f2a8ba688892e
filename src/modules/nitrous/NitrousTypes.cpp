// src/modules/nitrous/NitrousTypes.cpp
#include "modules/nitrous/NitrousTypes.h"

// Lower-case names are the values UI collaborators expect in the status document

const char* stageModeToString(StageMode mode) {
    switch (mode) {
        case StageMode::OFF: return "off";
        case StageMode::TIMED: return "timed";
        case StageMode::INSTANT: return "instant";
        default: return "unknown";
    }
}

const char* timerBehaviorToString(TimerBehavior behavior) {
    switch (behavior) {
        case TimerBehavior::START_OVER: return "start_over";
        case TimerBehavior::HOLD: return "hold";
        default: return "unknown";
    }
}

const char* relayStatusToString(RelayStatus status) {
    switch (status) {
        case RelayStatus::OK: return "ok";
        case RelayStatus::BLOWN_FUSE: return "blown_fuse";
        case RelayStatus::FAILED: return "failed";
        case RelayStatus::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

const char* triggerTypeToString(StartTrigger::Type type) {
    switch (type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE: return "trans_brake_release";
        case StartTrigger::Type::SHIFTER_INPUT: return "shifter_input";
        case StartTrigger::Type::STAGE_PREVIOUS: return "stage_previous";
        case StartTrigger::Type::MANUAL: return "manual";
        default: return "unknown";
    }
}
