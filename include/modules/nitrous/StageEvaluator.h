// include/modules/nitrous/StageEvaluator.h
#pragma once

#include <cstdint>
#include "modules/nitrous/NitrousTypes.h"

/**
 * @brief Pure per-stage decision function
 *
 * Holds no state and touches no hardware. NitrousEngine feeds it one stage at
 * a time, in stage order, and applies the returned action to the Relay Bank
 * and the Active Set.
 */
class StageEvaluator {
public:
    enum class Action {
        NONE = 0,
        ACTIVATE,      // Energize now
        DEACTIVATE,    // Release now
        ARM,           // Trigger fired, wait for startDelayMs
        DISARM         // Drop a pending activation
    };

    /**
     * @brief Activation state of the stage numbered one below
     *
     * activationSeq changes on every activation, which lets a cascaded stage
     * fire once per activation of its predecessor.
     */
    struct PreviousStage {
        bool exists;
        bool active;
        uint32_t activationSeq;
    };

    /**
     * @brief Decide what the stage does at this evaluation
     * @param config Stage configuration
     * @param runtime Active Set entry for the stage
     * @param input Current Input State
     * @param events Edges seen since the last evaluation pass
     * @param previous State of stage (stageNumber - 1)
     * @param now Current time in ms
     */
    static Action evaluate(const StageConfig& config,
                           const StageRuntime& runtime,
                           const InputState& input,
                           const TriggerEvents& events,
                           const PreviousStage& previous,
                           uint32_t now);

    /**
     * @brief True when the start trigger is newly satisfied
     */
    static bool triggerFires(const StageConfig& config,
                             const StageRuntime& runtime,
                             const InputState& input,
                             const TriggerEvents& events,
                             const PreviousStage& previous);

    /**
     * @brief True while an Instant stage's trigger condition still holds
     */
    static bool triggerHolds(const StageConfig& config,
                             const InputState& input,
                             const PreviousStage& previous);
};
