// src/modules/nitrous/StageEvaluator.cpp
#include "modules/nitrous/StageEvaluator.h"
#include "utils/Utils.h"

StageEvaluator::Action StageEvaluator::evaluate(const StageConfig& config,
                                                const StageRuntime& runtime,
                                                const InputState& input,
                                                const TriggerEvents& events,
                                                const PreviousStage& previous,
                                                uint32_t now) {
    if (!config.enabled || config.mode == StageMode::OFF) {
        if (runtime.active) {
            return Action::DEACTIVATE;
        }
        return runtime.pending ? Action::DISARM : Action::NONE;
    }

    if (runtime.active) {
        if (config.mode == StageMode::TIMED) {
            if (Utils::hasTimedOut(now, runtime.startMs, config.activationTimeMs)) {
                return Action::DEACTIVATE;
            }
        } else if (!triggerHolds(config, input, previous)) {
            return Action::DEACTIVATE;
        }
        return Action::NONE;
    }

    if (runtime.pending) {
        // Cascaded and Instant stages need their condition to last through the delay
        bool needsHold = config.mode == StageMode::INSTANT ||
                         config.startTrigger.type == StartTrigger::Type::STAGE_PREVIOUS;
        if (needsHold && !triggerHolds(config, input, previous)) {
            return Action::DISARM;
        }
        if (Utils::hasTimedOut(now, runtime.triggeredMs, config.startDelayMs)) {
            return Action::ACTIVATE;
        }
        return Action::NONE;
    }

    if (triggerFires(config, runtime, input, events, previous)) {
        return config.startDelayMs > 0 ? Action::ARM : Action::ACTIVATE;
    }
    return Action::NONE;
}

bool StageEvaluator::triggerFires(const StageConfig& config,
                                  const StageRuntime& runtime,
                                  const InputState& input,
                                  const TriggerEvents& events,
                                  const PreviousStage& previous) {
    const StartTrigger& trigger = config.startTrigger;

    switch (trigger.type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE:
            return events.transBrakeReleased;

        case StartTrigger::Type::SHIFTER_INPUT:
            return events.gearSelected &&
                   input.shifterGear != GEAR_NONE &&
                   input.shifterGear == trigger.gear;

        case StartTrigger::Type::STAGE_PREVIOUS:
            // Once per activation of the previous stage
            return config.stageNumber > 1 &&
                   previous.exists &&
                   previous.active &&
                   previous.activationSeq != runtime.consumedPrevSeq;

        case StartTrigger::Type::MANUAL:
            return false;
    }
    return false;
}

bool StageEvaluator::triggerHolds(const StageConfig& config,
                                  const InputState& input,
                                  const PreviousStage& previous) {
    const StartTrigger& trigger = config.startTrigger;

    switch (trigger.type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE:
            return !input.transBrakeActive;

        case StartTrigger::Type::SHIFTER_INPUT:
            return input.shifterGear != GEAR_NONE && input.shifterGear == trigger.gear;

        case StartTrigger::Type::STAGE_PREVIOUS:
            return previous.exists && previous.active;

        case StartTrigger::Type::MANUAL:
            // Released by deactivateStage() or by disabling the stage
            return true;
    }
    return false;
}
