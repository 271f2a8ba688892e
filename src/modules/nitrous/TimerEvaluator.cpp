// src/modules/nitrous/TimerEvaluator.cpp
#include "modules/nitrous/TimerEvaluator.h"
#include "utils/Utils.h"

TimerEvaluator::Action TimerEvaluator::evaluate(const TimerConfig& config,
                                                const TimerRuntime& runtime,
                                                const TriggerEvents& events,
                                                const InputState& input,
                                                uint32_t now) {
    if (!config.enabled) {
        return runtime.active ? Action::STOP : Action::NONE;
    }

    if (runtime.active) {
        return Utils::hasTimedOut(now, runtime.startMs, config.durationMs) ? Action::STOP
                                                                           : Action::NONE;
    }

    return triggerFires(config, events, input) ? Action::START : Action::NONE;
}

bool TimerEvaluator::triggerFires(const TimerConfig& config,
                                  const TriggerEvents& events,
                                  const InputState& input) {
    const StartTrigger& trigger = config.startTrigger;

    switch (trigger.type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE:
            return events.transBrakeReleased;

        case StartTrigger::Type::SHIFTER_INPUT:
            if (!events.gearSelected || input.shifterGear == GEAR_NONE) {
                return false;
            }
            return trigger.gear == GEAR_NONE || trigger.gear == input.shifterGear;

        case StartTrigger::Type::STAGE_PREVIOUS:
        case StartTrigger::Type::MANUAL:
            return false;
    }
    return false;
}
