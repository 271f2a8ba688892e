// src/modules/nitrous/NitrousEngine.cpp
#include "modules/nitrous/NitrousEngine.h"
#include "modules/nitrous/TimerEvaluator.h"
#include "config/RelayIndices.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"
#include <cstdio>
#include <cstring>

const char* NitrousEngine::TAG = "NitrousEngine";

namespace {
    bool isValidGear(int8_t gear) {
        return gear >= NitrousConfig::Limits::MIN_GEAR && gear <= NitrousConfig::Limits::MAX_GEAR;
    }
}

std::unique_ptr<NitrousEngine> NitrousEngine::create(const ControllerConfig& config,
                                                     HAL::IRelay* relayDriver) {
    Result<void> layout = validateLayout(config);
    if (layout.isError()) {
        LOG_ERROR(TAG, "Invalid layout (%u stages, %u timers): %s",
                  config.numStages, config.numTimers, layout.message().c_str());
        return nullptr;
    }
    return std::unique_ptr<NitrousEngine>(new NitrousEngine(config, relayDriver));
}

Result<void> NitrousEngine::validateLayout(const ControllerConfig& config) {
    if (config.numStages < NitrousConfig::Limits::MIN_STAGES ||
        config.numStages > NitrousConfig::Limits::MAX_STAGES) {
        return Result<void>(SystemError::CONFIG_INVALID, "stage count must be 2-6");
    }
    if (config.numTimers < NitrousConfig::Limits::MIN_TIMERS ||
        config.numTimers > NitrousConfig::Limits::MAX_TIMERS) {
        return Result<void>(SystemError::CONFIG_INVALID, "timer count must be 2-10");
    }
    return Result<void>();
}

NitrousEngine::NitrousEngine(const ControllerConfig& config, HAL::IRelay* relayDriver)
    : numStages_(config.numStages),
      numTimers_(config.numTimers),
      stages_{},
      stageRuntime_{},
      timers_{},
      timerRuntime_{},
      input_(),
      relayBank_(relayDriver),
      purges_(relayBank_),
      activationCounter_(0),
      tickCount_(0) {

    for (uint8_t i = 0; i < numStages_; i++) {
        StageConfig& stage = stages_[i];
        stage.stageNumber = i + 1;
        snprintf(stage.name, sizeof(stage.name), "Stage %u", stage.stageNumber);
        stage.relayChannel = RelayIndex::forStage(stage.stageNumber);
    }

    for (uint8_t i = 0; i < numTimers_; i++) {
        TimerConfig& timer = timers_[i];
        timer.timerId = i + 1;
        snprintf(timer.name, sizeof(timer.name), "Timer %u", timer.timerId);
    }

    input_.stagingInterruptEnabled = config.stagingInterruptEnabled;

    LOG_INFO(TAG, "Created: %u stages, %u timers, %u purges, staging interrupt %s",
             numStages_, numTimers_, purges_.getCount(),
             input_.stagingInterruptEnabled ? "enabled" : "disabled");
}

// ============================================================================
// Configuration
// ============================================================================

Result<void> NitrousEngine::updateStageConfig(uint8_t stageNumber, const StageConfigUpdate& update) {
    StageConfig* stage = findStage(stageNumber);
    if (stage == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown stage number");
    }

    StageConfig merged = *stage;
    update.enabled.applyTo(merged.enabled);
    update.mode.applyTo(merged.mode);
    update.activationTimeMs.applyTo(merged.activationTimeMs);
    update.timerBehavior.applyTo(merged.timerBehavior);
    update.startTrigger.applyTo(merged.startTrigger);
    update.startDelayMs.applyTo(merged.startDelayMs);
    update.relayChannel.applyTo(merged.relayChannel);
    update.shotSizeHp.applyTo(merged.shotSizeHp);
    update.holdOnPedal.applyTo(merged.holdOnPedal);

    uint8_t index = stageNumber - 1;
    if (stageRuntime_[index].active && merged.relayChannel != stage->relayChannel) {
        return Result<void>(SystemError::INVALID_STATE, "cannot rebind the relay of an active stage");
    }

    Result<void> valid = validateStage(merged);
    if (valid.isError()) {
        LOG_WARN(TAG, "Stage %u update rejected: %s", stageNumber, valid.message().c_str());
        return valid;
    }

    *stage = merged;

    LOG_INFO(TAG, "%s: %s %s, %lums, trigger %s, relay %u, %uhp", stage->name,
             stage->enabled ? "enabled" : "disabled",
             stageModeToString(stage->mode),
             (unsigned long)stage->activationTimeMs,
             triggerTypeToString(stage->startTrigger.type),
             stage->relayChannel, stage->shotSizeHp);

    if (!stage->enabled || stage->mode == StageMode::OFF) {
        if (stageRuntime_[index].active) {
            stopStage(index, "disabled");
        }
        stageRuntime_[index].pending = false;
    }
    return Result<void>();
}

Result<void> NitrousEngine::updateTimerConfig(uint8_t timerId, const TimerConfigUpdate& update) {
    TimerConfig* timer = findTimer(timerId);
    if (timer == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown timer id");
    }

    TimerConfig merged = *timer;
    update.enabled.applyTo(merged.enabled);
    update.durationMs.applyTo(merged.durationMs);
    update.startTrigger.applyTo(merged.startTrigger);

    Result<void> valid = validateTimer(merged);
    if (valid.isError()) {
        LOG_WARN(TAG, "Timer %u update rejected: %s", timerId, valid.message().c_str());
        return valid;
    }

    *timer = merged;
    LOG_INFO(TAG, "%s: %s, %lums, trigger %s", timer->name,
             timer->enabled ? "enabled" : "disabled",
             (unsigned long)timer->durationMs,
             triggerTypeToString(timer->startTrigger.type));
    return Result<void>();
}

Result<void> NitrousEngine::updatePurgeConfig(uint8_t purgeId, const PurgeConfigUpdate& update) {
    if (purges_.find(purgeId) == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown purge id");
    }
    if (update.relayChannel.present &&
        channelUsedByOtherStage(update.relayChannel.value, 0)) {
        return Result<void>(SystemError::CONFIG_CONFLICT, "relay channel bound to a stage");
    }

    Result<void> result = purges_.updateConfig(purgeId, update);
    if (result.isError()) {
        LOG_WARN(TAG, "Purge %u update rejected: %s", purgeId, result.message().c_str());
    }
    return result;
}

Result<void> NitrousEngine::updateRelayConfig(uint8_t channel, const RelayConfigUpdate& update) {
    return ErrorHandler::logIfError(TAG, relayBank_.updateConfig(channel, update), "updateRelayConfig");
}

Result<void> NitrousEngine::validateStage(const StageConfig& merged) const {
    using namespace NitrousConfig::Limits;

    if (merged.mode != StageMode::OFF && merged.mode != StageMode::TIMED &&
        merged.mode != StageMode::INSTANT) {
        return Result<void>(SystemError::CONFIG_INVALID, "unknown stage mode");
    }
    if (merged.timerBehavior != TimerBehavior::START_OVER &&
        merged.timerBehavior != TimerBehavior::HOLD) {
        return Result<void>(SystemError::CONFIG_INVALID, "unknown timer behavior");
    }
    if (!RelayIndex::isValid(merged.relayChannel)) {
        return Result<void>(SystemError::CONFIG_INVALID, "relay channel out of range");
    }
    if (channelUsedByOtherStage(merged.relayChannel, merged.stageNumber)) {
        return Result<void>(SystemError::CONFIG_CONFLICT, "relay channel bound to another stage");
    }
    if (purges_.usesChannel(merged.relayChannel)) {
        return Result<void>(SystemError::CONFIG_CONFLICT, "relay channel bound to a purge");
    }
    if (merged.mode == StageMode::TIMED &&
        (merged.activationTimeMs < STAGE_ACTIVATION_MIN_MS ||
         merged.activationTimeMs > STAGE_ACTIVATION_MAX_MS)) {
        return Result<void>(SystemError::CONFIG_INVALID, "activation time out of range");
    }
    if (merged.startDelayMs > STAGE_START_DELAY_MAX_MS) {
        return Result<void>(SystemError::CONFIG_INVALID, "start delay out of range");
    }
    if (merged.shotSizeHp > SHOT_SIZE_MAX_HP) {
        return Result<void>(SystemError::CONFIG_INVALID, "shot size out of range");
    }

    switch (merged.startTrigger.type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE:
        case StartTrigger::Type::MANUAL:
            break;
        case StartTrigger::Type::SHIFTER_INPUT:
            if (!isValidGear(merged.startTrigger.gear)) {
                return Result<void>(SystemError::CONFIG_INVALID, "shifter trigger needs a gear 1-10");
            }
            break;
        case StartTrigger::Type::STAGE_PREVIOUS:
            if (merged.stageNumber <= 1) {
                return Result<void>(SystemError::CONFIG_INVALID, "stage 1 has no previous stage");
            }
            break;
        default:
            return Result<void>(SystemError::CONFIG_INVALID, "unknown trigger type");
    }
    return Result<void>();
}

Result<void> NitrousEngine::validateTimer(const TimerConfig& merged) {
    using namespace NitrousConfig::Limits;

    if (merged.durationMs < TIMER_DURATION_MIN_MS || merged.durationMs > TIMER_DURATION_MAX_MS) {
        return Result<void>(SystemError::CONFIG_INVALID, "timer duration out of range");
    }

    switch (merged.startTrigger.type) {
        case StartTrigger::Type::TRANS_BRAKE_RELEASE:
        case StartTrigger::Type::MANUAL:
            break;
        case StartTrigger::Type::SHIFTER_INPUT:
            if (merged.startTrigger.gear != GEAR_NONE && !isValidGear(merged.startTrigger.gear)) {
                return Result<void>(SystemError::CONFIG_INVALID, "gear filter must be 1-10 or none");
            }
            break;
        case StartTrigger::Type::STAGE_PREVIOUS:
            return Result<void>(SystemError::CONFIG_INVALID, "timers cannot cascade");
        default:
            return Result<void>(SystemError::CONFIG_INVALID, "unknown trigger type");
    }
    return Result<void>();
}

bool NitrousEngine::channelUsedByOtherStage(uint8_t channel, uint8_t stageNumber) const {
    for (uint8_t i = 0; i < numStages_; i++) {
        if (stages_[i].stageNumber != stageNumber && stages_[i].relayChannel == channel) {
            return true;
        }
    }
    return false;
}

bool NitrousEngine::getStageConfig(uint8_t stageNumber, StageConfig& out) const {
    const StageConfig* stage = findStage(stageNumber);
    if (stage == nullptr) {
        return false;
    }
    out = *stage;
    return true;
}

bool NitrousEngine::getTimerConfig(uint8_t timerId, TimerConfig& out) const {
    const TimerConfig* timer = findTimer(timerId);
    if (timer == nullptr) {
        return false;
    }
    out = *timer;
    return true;
}

bool NitrousEngine::getPurgeConfig(uint8_t purgeId, PurgeChannel& out) const {
    const PurgeChannel* purge = purges_.find(purgeId);
    if (purge == nullptr) {
        return false;
    }
    out = *purge;
    return true;
}

// ============================================================================
// Input State
// ============================================================================

void NitrousEngine::setTransBrakeState(bool active, uint32_t now) {
    if (input_.transBrakeActive == active) {
        return;
    }

    bool released = input_.transBrakeActive && !active;
    input_.transBrakeActive = active;
    input_.lastInterruptMs = now;
    input_.interruptCount++;

    LOG_DEBUG(TAG, "Trans brake %s (interrupt #%lu)", active ? "applied" : "released",
              (unsigned long)input_.interruptCount);

    if (!released) {
        // A release the control loop has not consumed yet is void once the
        // brake is back on
        input_.releaseLatched = false;
        // Instant stages on brake release end when the brake goes back on
        evaluateAll(TriggerEvents(), now);
        return;
    }

    if (!input_.stagingInterruptEnabled) {
        input_.releaseLatched = true;
        LOG_DEBUG(TAG, "Staging interrupt disabled - release deferred to control loop");
        return;
    }

    TriggerEvents events;
    events.transBrakeReleased = true;
    evaluateAll(events, now);
}

void NitrousEngine::setClutchState(bool active) {
    input_.clutchActive = active;
}

bool NitrousEngine::setShifterGear(int8_t gear, uint32_t now) {
    if (gear != GEAR_NONE && !isValidGear(gear)) {
        LOG_WARN(TAG, "Ignoring invalid gear %d", gear);
        return false;
    }
    if (gear == input_.shifterGear) {
        return true;
    }

    input_.shifterGear = gear;
    LOG_DEBUG(TAG, "Gear %d", gear);

    TriggerEvents events;
    events.gearSelected = (gear != GEAR_NONE);
    evaluateAll(events, now);
    return true;
}

void NitrousEngine::setThrottlePedaling(bool pedaling, uint32_t now) {
    input_.throttlePedaling = pedaling;

    // Every pedaling report restarts StartOver windows, repeated ones included
    if (!pedaling) {
        return;
    }

    for (uint8_t i = 0; i < numStages_; i++) {
        if (stageRuntime_[i].active && stages_[i].timerBehavior == TimerBehavior::START_OVER) {
            stageRuntime_[i].startMs = now;
            LOG_DEBUG(TAG, "%s window restarted on pedal", stages_[i].name);
        }
    }
}

void NitrousEngine::setStagingInterruptEnabled(bool enabled) {
    if (input_.stagingInterruptEnabled == enabled) {
        return;
    }
    input_.stagingInterruptEnabled = enabled;
    LOG_INFO(TAG, "Staging interrupt %s", enabled ? "enabled" : "disabled");
}

// ============================================================================
// Manual operations
// ============================================================================

Result<void> NitrousEngine::activateStage(uint8_t stageNumber, uint32_t now) {
    StageConfig* stage = findStage(stageNumber);
    if (stage == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown stage number");
    }
    if (!stage->enabled || stage->mode == StageMode::OFF) {
        return Result<void>(SystemError::INVALID_STATE, "stage is disabled");
    }

    uint8_t index = stageNumber - 1;
    if (!stageRuntime_[index].active) {
        startStage(index, now);
        // Let stage_previous dependents follow without waiting for the loop
        evaluateStages(TriggerEvents(), now);
    }
    return Result<void>();
}

Result<void> NitrousEngine::deactivateStage(uint8_t stageNumber) {
    if (findStage(stageNumber) == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown stage number");
    }

    uint8_t index = stageNumber - 1;
    stageRuntime_[index].pending = false;
    if (stageRuntime_[index].active) {
        stopStage(index, "manual");
    }
    return Result<void>();
}

Result<void> NitrousEngine::activateTimer(uint8_t timerId, uint32_t now) {
    TimerConfig* timer = findTimer(timerId);
    if (timer == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown timer id");
    }
    if (!timer->enabled) {
        return Result<void>(SystemError::INVALID_STATE, "timer is disabled");
    }

    uint8_t index = timerId - 1;
    if (!timerRuntime_[index].active) {
        startTimer(index, now);
    }
    return Result<void>();
}

Result<void> NitrousEngine::deactivateTimer(uint8_t timerId) {
    if (findTimer(timerId) == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "unknown timer id");
    }

    uint8_t index = timerId - 1;
    if (timerRuntime_[index].active) {
        stopTimer(index, "manual");
    }
    return Result<void>();
}

bool NitrousEngine::activatePurge(uint8_t purgeId, uint32_t now) {
    return purges_.activate(purgeId, now);
}

bool NitrousEngine::deactivatePurge(uint8_t purgeId) {
    return purges_.deactivate(purgeId);
}

bool NitrousEngine::emergencyStop() {
    LOG_WARN(TAG, "EMERGENCY STOP - releasing all stages, timers and purges");

    for (uint8_t i = 0; i < numStages_; i++) {
        stageRuntime_[i].pending = false;
        if (stageRuntime_[i].active) {
            stopStage(i, "emergency stop");
        }
    }
    for (uint8_t i = 0; i < numTimers_; i++) {
        if (timerRuntime_[i].active) {
            stopTimer(i, "emergency stop");
        }
    }
    input_.releaseLatched = false;

    bool ok = purges_.allOff();
    // Catch anything energized outside the stage/purge tables
    if (!relayBank_.allOff()) {
        ok = false;
    }
    if (!ok) {
        ErrorHandler::logError(TAG, SystemError::RELAY_OPERATION_FAILED, "emergency stop");
    }
    return ok;
}

// ============================================================================
// Periodic work
// ============================================================================

Result<void> NitrousEngine::tick(uint32_t now) {
    uint32_t failuresBefore = relayBank_.getWriteFailures();

    relayBank_.checkHealth(now);
    purges_.syncFuseStatus();

    TriggerEvents events;
    events.transBrakeReleased = input_.releaseLatched;
    input_.releaseLatched = false;

    evaluateAll(events, now);
    tickCount_++;

    if (relayBank_.getWriteFailures() != failuresBefore) {
        return Result<void>(SystemError::RELAY_OPERATION_FAILED, "relay write rejected");
    }
    return Result<void>();
}

void NitrousEngine::evaluateAll(const TriggerEvents& events, uint32_t now) {
    evaluateStages(events, now);
    evaluateTimers(events, now);
}

void NitrousEngine::evaluateStages(const TriggerEvents& events, uint32_t now) {
    // Stage order matters: a stage activated here is visible to the
    // stage_previous dependent evaluated right after it
    for (uint8_t i = 0; i < numStages_; i++) {
        StageEvaluator::Action action = StageEvaluator::evaluate(
            stages_[i], stageRuntime_[i], input_, events, previousOf(i), now);

        switch (action) {
            case StageEvaluator::Action::ACTIVATE:
                startStage(i, now);
                break;
            case StageEvaluator::Action::DEACTIVATE:
                if (!stages_[i].enabled || stages_[i].mode == StageMode::OFF) {
                    stopStage(i, "disabled");
                } else if (stages_[i].mode == StageMode::TIMED) {
                    stopStage(i, "window elapsed");
                } else {
                    stopStage(i, "trigger cleared");
                }
                break;
            case StageEvaluator::Action::ARM:
                armStage(i, now);
                break;
            case StageEvaluator::Action::DISARM:
                stageRuntime_[i].pending = false;
                LOG_DEBUG(TAG, "%s pending activation dropped", stages_[i].name);
                break;
            case StageEvaluator::Action::NONE:
                break;
        }
    }
}

void NitrousEngine::evaluateTimers(const TriggerEvents& events, uint32_t now) {
    for (uint8_t i = 0; i < numTimers_; i++) {
        TimerEvaluator::Action action = TimerEvaluator::evaluate(
            timers_[i], timerRuntime_[i], events, input_, now);

        if (action == TimerEvaluator::Action::START) {
            startTimer(i, now);
        } else if (action == TimerEvaluator::Action::STOP) {
            stopTimer(i, timers_[i].enabled ? "expired" : "disabled");
        }
    }
}

StageEvaluator::PreviousStage NitrousEngine::previousOf(uint8_t index) const {
    StageEvaluator::PreviousStage previous = {false, false, 0};
    if (index > 0) {
        previous.exists = true;
        previous.active = stageRuntime_[index - 1].active;
        previous.activationSeq = stageRuntime_[index - 1].activationSeq;
    }
    return previous;
}

void NitrousEngine::startStage(uint8_t index, uint32_t now) {
    StageConfig& stage = stages_[index];
    StageRuntime& runtime = stageRuntime_[index];

    if (stage.startTrigger.type == StartTrigger::Type::STAGE_PREVIOUS) {
        StageEvaluator::PreviousStage previous = previousOf(index);
        if (previous.active) {
            runtime.consumedPrevSeq = previous.activationSeq;
        }
    }

    runtime.active = true;
    runtime.pending = false;
    runtime.startMs = now;
    runtime.activationSeq = ++activationCounter_;

    if (!relayBank_.activate(stage.relayChannel)) {
        LOG_ERROR(TAG, "%s active but relay %u did not accept ON", stage.name, stage.relayChannel);
    }

    LOG_TRANSITION(TAG, "Stage", stage.stageNumber, "inactive", "active");
    LOG_INFO(TAG, "%s ON (%s, relay %u, %uhp)", stage.name, stageModeToString(stage.mode),
             stage.relayChannel, stage.shotSizeHp);
}

void NitrousEngine::stopStage(uint8_t index, const char* reason) {
    StageConfig& stage = stages_[index];
    StageRuntime& runtime = stageRuntime_[index];

    runtime.active = false;
    runtime.pending = false;

    if (!relayBank_.deactivate(stage.relayChannel)) {
        LOG_ERROR(TAG, "%s released but relay %u did not accept OFF", stage.name, stage.relayChannel);
    }

    LOG_TRANSITION(TAG, "Stage", stage.stageNumber, "active", "inactive");
    LOG_INFO(TAG, "%s OFF (%s)", stage.name, reason);
}

void NitrousEngine::armStage(uint8_t index, uint32_t now) {
    StageConfig& stage = stages_[index];
    StageRuntime& runtime = stageRuntime_[index];

    if (stage.startTrigger.type == StartTrigger::Type::STAGE_PREVIOUS) {
        StageEvaluator::PreviousStage previous = previousOf(index);
        if (previous.active) {
            runtime.consumedPrevSeq = previous.activationSeq;
        }
    }

    runtime.pending = true;
    runtime.triggeredMs = now;
    LOG_TRANSITION(TAG, "Stage", stage.stageNumber, "inactive", "pending");
    LOG_DEBUG(TAG, "%s fires in %lums", stage.name, (unsigned long)stage.startDelayMs);
}

void NitrousEngine::startTimer(uint8_t index, uint32_t now) {
    timerRuntime_[index].active = true;
    timerRuntime_[index].startMs = now;
    LOG_TRANSITION(TAG, "Timer", timers_[index].timerId, "idle", "running");
}

void NitrousEngine::stopTimer(uint8_t index, const char* reason) {
    timerRuntime_[index].active = false;
    LOG_TRANSITION(TAG, "Timer", timers_[index].timerId, "running", "idle");
    LOG_DEBUG(TAG, "%s stopped (%s)", timers_[index].name, reason);
}

// ============================================================================
// Status
// ============================================================================

void NitrousEngine::buildSnapshot(uint32_t now, StatusSnapshot& out) const {
    out.timestampMs = now;

    out.numStages = numStages_;
    out.activeStageCount = 0;
    for (uint8_t i = 0; i < numStages_; i++) {
        const StageConfig& stage = stages_[i];
        const StageRuntime& runtime = stageRuntime_[i];
        StageStatus& status = out.stages[i];

        status.stageNumber = stage.stageNumber;
        memcpy(status.name, stage.name, sizeof(status.name));
        status.enabled = stage.enabled;
        status.mode = stage.mode;
        status.timerBehavior = stage.timerBehavior;
        status.startTrigger = stage.startTrigger;
        status.relayChannel = stage.relayChannel;
        status.shotSizeHp = stage.shotSizeHp;
        status.holdOnPedal = stage.holdOnPedal;
        status.active = runtime.active;
        status.pending = runtime.pending;
        status.elapsedMs = runtime.active ? Utils::elapsedMs(now, runtime.startMs) : 0;
        status.remainingMs = (runtime.active && stage.mode == StageMode::TIMED)
                                 ? Utils::remainingMs(now, runtime.startMs, stage.activationTimeMs)
                                 : 0;

        if (runtime.active) {
            out.activeStages[out.activeStageCount++] = stage.stageNumber;
        }
    }

    out.numTimers = numTimers_;
    out.activeTimerCount = 0;
    for (uint8_t i = 0; i < numTimers_; i++) {
        const TimerConfig& timer = timers_[i];
        const TimerRuntime& runtime = timerRuntime_[i];
        TimerStatus& status = out.timers[i];

        status.timerId = timer.timerId;
        memcpy(status.name, timer.name, sizeof(status.name));
        status.enabled = timer.enabled;
        status.active = runtime.active;
        status.durationMs = timer.durationMs;
        status.elapsedMs = runtime.active ? Utils::elapsedMs(now, runtime.startMs) : 0;
        status.remainingMs = runtime.active
                                 ? Utils::remainingMs(now, runtime.startMs, timer.durationMs)
                                 : 0;

        if (runtime.active) {
            out.activeTimers[out.activeTimerCount++] = timer.timerId;
        }
    }

    out.relays = relayBank_.relays();

    const auto& purges = purges_.purges();
    for (size_t i = 0; i < purges.size(); i++) {
        const PurgeChannel& purge = purges[i];
        PurgeStatus& status = out.purges[i];

        status.purgeId = purge.purgeId;
        memcpy(status.name, purge.name, sizeof(status.name));
        status.enabled = purge.enabled;
        status.relayChannel = purge.relayChannel;
        status.fuseStatus = purge.fuseStatus;
        status.active = purge.active;
        status.durationMs = purge.durationMs;
        status.elapsedMs = purge.active ? Utils::elapsedMs(now, purge.activatedMs) : 0;
    }

    out.inputs = input_;
    out.tickCount = tickCount_;
}

// ============================================================================
// Queries
// ============================================================================

bool NitrousEngine::isStageActive(uint8_t stageNumber) const {
    return findStage(stageNumber) != nullptr && stageRuntime_[stageNumber - 1].active;
}

bool NitrousEngine::isStagePending(uint8_t stageNumber) const {
    return findStage(stageNumber) != nullptr && stageRuntime_[stageNumber - 1].pending;
}

bool NitrousEngine::isTimerActive(uint8_t timerId) const {
    return findTimer(timerId) != nullptr && timerRuntime_[timerId - 1].active;
}

StageConfig* NitrousEngine::findStage(uint8_t stageNumber) {
    if (stageNumber < 1 || stageNumber > numStages_) {
        return nullptr;
    }
    return &stages_[stageNumber - 1];
}

const StageConfig* NitrousEngine::findStage(uint8_t stageNumber) const {
    if (stageNumber < 1 || stageNumber > numStages_) {
        return nullptr;
    }
    return &stages_[stageNumber - 1];
}

TimerConfig* NitrousEngine::findTimer(uint8_t timerId) {
    if (timerId < 1 || timerId > numTimers_) {
        return nullptr;
    }
    return &timers_[timerId - 1];
}

const TimerConfig* NitrousEngine::findTimer(uint8_t timerId) const {
    if (timerId < 1 || timerId > numTimers_) {
        return nullptr;
    }
    return &timers_[timerId - 1];
}
