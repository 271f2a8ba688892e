// include/modules/nitrous/NitrousEngine.h
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include "config/NitrousLimits.h"
#include "hal/HardwareAbstractionLayer.h"
#include "modules/nitrous/NitrousTypes.h"
#include "modules/nitrous/PurgeSystem.h"
#include "modules/nitrous/RelayBank.h"
#include "modules/nitrous/StageEvaluator.h"
#include "modules/nitrous/StatusSnapshot.h"
#include "utils/ErrorHandler.h"

/**
 * @brief All nitrous control state in one aggregate
 *
 * Owns the stage and timer tables, the Active Set, the Input State, the
 * Relay Bank and the purges. Performs no locking and never reads the clock:
 * every call that depends on time takes `now`. NitrousController serializes
 * access with its mutex and supplies millis().
 *
 * Stage and timer counts are fixed at construction.
 */
class NitrousEngine {
public:
    /**
     * @brief Build an engine with default stage/timer/purge tables
     * @param config Layout (2-6 stages, 2-10 timers)
     * @param relayDriver Relay output driver, nullptr for simulation. Not owned.
     * @return nullptr if the layout is invalid
     */
    static std::unique_ptr<NitrousEngine> create(const ControllerConfig& config,
                                                 HAL::IRelay* relayDriver);

    static Result<void> validateLayout(const ControllerConfig& config);

    NitrousEngine(const NitrousEngine&) = delete;
    NitrousEngine& operator=(const NitrousEngine&) = delete;

    // ---- Configuration ------------------------------------------------

    /**
     * @brief Replace the supplied fields of one stage
     *
     * The merged result is validated before anything is written, so a
     * rejected update leaves the stage untouched. A stage that becomes
     * disabled or Off is released immediately.
     */
    Result<void> updateStageConfig(uint8_t stageNumber, const StageConfigUpdate& update);

    /**
     * @brief Replace the supplied fields of one timer
     *
     * A timer that becomes disabled is removed at the next evaluation.
     */
    Result<void> updateTimerConfig(uint8_t timerId, const TimerConfigUpdate& update);
    Result<void> updatePurgeConfig(uint8_t purgeId, const PurgeConfigUpdate& update);
    Result<void> updateRelayConfig(uint8_t channel, const RelayConfigUpdate& update);

    bool getStageConfig(uint8_t stageNumber, StageConfig& out) const;
    bool getTimerConfig(uint8_t timerId, TimerConfig& out) const;
    bool getPurgeConfig(uint8_t purgeId, PurgeChannel& out) const;

    // ---- Input State (immediate trigger path) -------------------------

    /**
     * @brief Record the trans-brake signal
     *
     * A release (true -> false) fires TRANS_BRAKE_RELEASE stages and timers
     * within this call. With the staging interrupt disabled the release is
     * latched and applied by the next tick() instead.
     */
    void setTransBrakeState(bool active, uint32_t now);

    void setClutchState(bool active);

    /**
     * @brief Record the selected gear, GEAR_NONE for neutral
     *
     * Selecting a new gear fires matching SHIFTER_INPUT stages and timers
     * within this call.
     * @return false for a gear outside GEAR_NONE / 1..10 (ignored)
     */
    bool setShifterGear(int8_t gear, uint32_t now);

    /**
     * @brief Record throttle pedaling
     *
     * When pedaling starts, active START_OVER stages restart their window
     * from now. HOLD stages keep counting.
     */
    void setThrottlePedaling(bool pedaling, uint32_t now);

    void setStagingInterruptEnabled(bool enabled);

    // ---- Manual operations --------------------------------------------

    Result<void> activateStage(uint8_t stageNumber, uint32_t now);
    Result<void> deactivateStage(uint8_t stageNumber);
    Result<void> activateTimer(uint8_t timerId, uint32_t now);
    Result<void> deactivateTimer(uint8_t timerId);
    bool activatePurge(uint8_t purgeId, uint32_t now);
    bool deactivatePurge(uint8_t purgeId);

    /**
     * @brief Release every stage, timer and purge and de-energize all relays
     * @return false if a relay write was rejected
     */
    bool emergencyStop();

    // ---- Periodic work --------------------------------------------------

    /**
     * @brief One control loop pass: relay health, then stage/timer evaluation
     * @return RELAY_OPERATION_FAILED when a relay write was rejected this pass
     */
    Result<void> tick(uint32_t now);

    void buildSnapshot(uint32_t now, StatusSnapshot& out) const;

    // ---- Queries --------------------------------------------------------

    bool isStageActive(uint8_t stageNumber) const;
    bool isStagePending(uint8_t stageNumber) const;
    bool isTimerActive(uint8_t timerId) const;
    bool isRelayEnergized(uint8_t channel) const { return relayBank_.isEnergized(channel); }

    uint8_t getStageCount() const { return numStages_; }
    uint8_t getTimerCount() const { return numTimers_; }
    uint32_t getTickCount() const { return tickCount_; }
    const InputState& getInputs() const { return input_; }
    const RelayBank& getRelayBank() const { return relayBank_; }
    const PurgeSystem& getPurgeSystem() const { return purges_; }
    const RelayHealthList& getLastHealth() const { return relayBank_.lastHealth(); }

private:
    NitrousEngine(const ControllerConfig& config, HAL::IRelay* relayDriver);

    StageConfig* findStage(uint8_t stageNumber);
    const StageConfig* findStage(uint8_t stageNumber) const;
    TimerConfig* findTimer(uint8_t timerId);
    const TimerConfig* findTimer(uint8_t timerId) const;

    Result<void> validateStage(const StageConfig& merged) const;
    static Result<void> validateTimer(const TimerConfig& merged);
    bool channelUsedByOtherStage(uint8_t channel, uint8_t stageNumber) const;

    // Run every stage (in order) and every timer through its evaluator
    void evaluateAll(const TriggerEvents& events, uint32_t now);
    void evaluateStages(const TriggerEvents& events, uint32_t now);
    void evaluateTimers(const TriggerEvents& events, uint32_t now);
    StageEvaluator::PreviousStage previousOf(uint8_t index) const;

    void startStage(uint8_t index, uint32_t now);
    void stopStage(uint8_t index, const char* reason);
    void armStage(uint8_t index, uint32_t now);
    void startTimer(uint8_t index, uint32_t now);
    void stopTimer(uint8_t index, const char* reason);

    uint8_t numStages_;
    uint8_t numTimers_;

    std::array<StageConfig, NitrousConfig::Limits::MAX_STAGES> stages_;
    std::array<StageRuntime, NitrousConfig::Limits::MAX_STAGES> stageRuntime_;
    std::array<TimerConfig, NitrousConfig::Limits::MAX_TIMERS> timers_;
    std::array<TimerRuntime, NitrousConfig::Limits::MAX_TIMERS> timerRuntime_;

    InputState input_;
    RelayBank relayBank_;
    PurgeSystem purges_;

    // Source of StageRuntime::activationSeq, never 0 once a stage has fired
    uint32_t activationCounter_;
    uint32_t tickCount_;

    static const char* TAG;
};
