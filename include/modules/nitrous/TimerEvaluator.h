// include/modules/nitrous/TimerEvaluator.h
#pragma once

#include <cstdint>
#include "modules/nitrous/NitrousTypes.h"

/**
 * @brief Pure per-timer decision function
 *
 * Timers share the stage trigger vocabulary (minus cascade) but own no relay.
 */
class TimerEvaluator {
public:
    enum class Action {
        NONE = 0,
        START,
        STOP
    };

    static Action evaluate(const TimerConfig& config,
                           const TimerRuntime& runtime,
                           const TriggerEvents& events,
                           const InputState& input,
                           uint32_t now);

    /**
     * @brief True when the timer's start trigger is newly satisfied
     *
     * A shifter trigger with gear == GEAR_NONE matches any selected gear.
     */
    static bool triggerFires(const TimerConfig& config,
                             const TriggerEvents& events,
                             const InputState& input);
};
