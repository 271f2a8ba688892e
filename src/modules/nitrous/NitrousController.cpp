// src/modules/nitrous/NitrousController.cpp
#include "modules/nitrous/NitrousController.h"
#include "modules/nitrous/StatusJson.h"
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "LoggingMacros.h"
#include <Arduino.h>
#include <MutexGuard.h>

const char* NitrousController::TAG = "NitrousCtrl";

namespace {
    constexpr TickType_t TICK_LOCK_TIMEOUT =
        pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_SHORT_TIMEOUT_MS);
    constexpr TickType_t CALL_LOCK_TIMEOUT =
        pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_DEFAULT_TIMEOUT_MS);
    constexpr TickType_t LONG_LOCK_TIMEOUT =
        pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_LONG_TIMEOUT_MS);

    Result<void> lockTimeout(const char* operation) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, operation);
    }
}

std::unique_ptr<NitrousController> NitrousController::create(const ControllerConfig& config,
                                                             HAL::IRelay* relayDriver) {
    std::unique_ptr<NitrousEngine> engine = NitrousEngine::create(config, relayDriver);
    if (!engine) {
        return nullptr;
    }

    SemaphoreHandle_t mutex = xSemaphoreCreateMutex();
    if (mutex == nullptr) {
        ErrorHandler::logError(TAG, SystemError::MUTEX_CREATE_FAILED, "controller lock");
        return nullptr;
    }

    SemaphoreHandle_t exitSignal = xSemaphoreCreateBinary();
    if (exitSignal == nullptr) {
        ErrorHandler::logError(TAG, SystemError::MUTEX_CREATE_FAILED, "task exit signal");
        vSemaphoreDelete(mutex);
        return nullptr;
    }

    std::unique_ptr<NitrousController> controller(
        new NitrousController(std::move(engine), mutex, exitSignal));
    if (!controller->publisher_.initialize()) {
        return nullptr;
    }
    return controller;
}

NitrousController::NitrousController(std::unique_ptr<NitrousEngine> engine,
                                     SemaphoreHandle_t mutex,
                                     SemaphoreHandle_t exitSignal)
    : engine_(std::move(engine)),
      publisher_(),
      mutex_(mutex),
      exitSignal_(exitSignal),
      taskHandle_(nullptr),
      running_(false),
      stopRequested_(false),
      exitPending_(false),
      tickFailures_(0),
      tickSnapshot_() {
}

NitrousController::~NitrousController() {
    stop();

    if (exitPending_.load() && taskHandle_ != nullptr) {
        // The task still references this object; it must not outlive it
        LOG_ERROR(TAG, "Control task unresponsive - deleting it");
        vTaskDelete(taskHandle_);
        taskHandle_ = nullptr;
    }

    if (exitSignal_ != nullptr) {
        vSemaphoreDelete(exitSignal_);
        exitSignal_ = nullptr;
    }
    if (mutex_ != nullptr) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> NitrousController::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        LOG_WARN(TAG, "Already running");
        return Result<void>();
    }

    if (exitPending_.load()) {
        // A previous stop() gave up waiting; the old task must be gone first
        if (xSemaphoreTake(exitSignal_, 0) != pdTRUE) {
            running_.store(false);
            return Result<void>(SystemError::INVALID_STATE, "previous control task still running");
        }
        exitPending_.store(false);
        taskHandle_ = nullptr;
    }

    stopRequested_.store(false);

    BaseType_t created = xTaskCreatePinnedToCore(
        taskFunction,
        "NitrousCtrl",
        STACK_SIZE_NITROUS_CONTROL_TASK,
        this,
        PRIORITY_NITROUS_CONTROL_TASK,
        &taskHandle_,
        CORE_NITROUS_CONTROL_TASK);

    if (created != pdPASS) {
        taskHandle_ = nullptr;
        running_.store(false);
        ErrorHandler::logError(TAG, SystemError::TASK_CREATE_FAILED, "control task");
        return Result<void>(SystemError::TASK_CREATE_FAILED, "control task");
    }

    LOG_INFO(TAG, "Control loop started (%lums period, core %d)",
             (unsigned long)SystemConstants::Timing::CONTROL_LOOP_PERIOD_MS,
             CORE_NITROUS_CONTROL_TASK);
    return Result<void>();
}

void NitrousController::stop() {
    if (!running_.load()) {
        return;
    }

    // Only one caller waits for the exit signal; the others return at once
    bool expected = false;
    if (!stopRequested_.compare_exchange_strong(expected, true)) {
        return;
    }

    if (xSemaphoreTake(exitSignal_,
                       pdMS_TO_TICKS(SystemConstants::Timing::CONTROL_TASK_STOP_TIMEOUT_MS)) == pdTRUE) {
        taskHandle_ = nullptr;
        LOG_INFO(TAG, "Control loop stopped after %lu ticks", (unsigned long)getTickCount());
    } else {
        exitPending_.store(true);
        ErrorHandler::logError(TAG, SystemError::TASK_STOP_TIMEOUT, "control task did not exit");
    }

    running_.store(false);
}

void NitrousController::taskFunction(void* pvParameters) {
    NitrousController* self = static_cast<NitrousController*>(pvParameters);
    self->runLoop();
    vTaskDelete(nullptr);
}

void NitrousController::runLoop() {
    LOG_INFO(TAG, "Control task running on core %d", xPortGetCoreID());

    const TickType_t period = pdMS_TO_TICKS(SystemConstants::Timing::CONTROL_LOOP_PERIOD_MS);
    TickType_t lastWake = xTaskGetTickCount();

    while (!stopRequested_.load()) {
        Result<void> result = tick();

        if (result.isError()) {
            uint32_t failures = ++tickFailures_;
            if (failures == 1 ||
                failures % SystemConstants::Status::TICK_FAILURE_LOG_INTERVAL == 0) {
                LOG_ERROR(TAG, "Tick failed: %s (%s) - failure #%lu",
                          ErrorHandler::errorToString(result.error()),
                          result.message().c_str(), (unsigned long)failures);
            }
            vTaskDelay(pdMS_TO_TICKS(SystemConstants::Timing::CONTROL_LOOP_ERROR_BACKOFF_MS));
            lastWake = xTaskGetTickCount();
            continue;
        }

        vTaskDelayUntil(&lastWake, period);
    }

    // Last access to this object from the task
    xSemaphoreGive(exitSignal_);
}

Result<void> NitrousController::tick() {
    Result<void> result;
    {
        MutexGuard guard(mutex_, TICK_LOCK_TIMEOUT);
        if (!guard.hasLock()) {
            return lockTimeout("control tick");
        }

        uint32_t now = millis();
        result = engine_->tick(now);
        engine_->buildSnapshot(now, tickSnapshot_);
    }

    tickSnapshot_.tickFailures = tickFailures_.load();
    publisher_.publish(tickSnapshot_);
    return result;
}

// ============================================================================
// Configuration
// ============================================================================

Result<void> NitrousController::updateStageConfig(uint8_t stageNumber, const StageConfigUpdate& update) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "updateStageConfig: mutex timeout");
        return lockTimeout("updateStageConfig");
    }
    return engine_->updateStageConfig(stageNumber, update);
}

Result<void> NitrousController::updateTimerConfig(uint8_t timerId, const TimerConfigUpdate& update) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "updateTimerConfig: mutex timeout");
        return lockTimeout("updateTimerConfig");
    }
    return engine_->updateTimerConfig(timerId, update);
}

Result<void> NitrousController::updatePurgeConfig(uint8_t purgeId, const PurgeConfigUpdate& update) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "updatePurgeConfig: mutex timeout");
        return lockTimeout("updatePurgeConfig");
    }
    return engine_->updatePurgeConfig(purgeId, update);
}

Result<void> NitrousController::updateRelayConfig(uint8_t channel, const RelayConfigUpdate& update) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "updateRelayConfig: mutex timeout");
        return lockTimeout("updateRelayConfig");
    }
    return engine_->updateRelayConfig(channel, update);
}

bool NitrousController::getStageConfig(uint8_t stageNumber, StageConfig& out) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->getStageConfig(stageNumber, out);
}

bool NitrousController::getTimerConfig(uint8_t timerId, TimerConfig& out) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->getTimerConfig(timerId, out);
}

bool NitrousController::getPurgeConfig(uint8_t purgeId, PurgeChannel& out) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->getPurgeConfig(purgeId, out);
}

// ============================================================================
// Vehicle signals
// ============================================================================

bool NitrousController::setTransBrakeState(bool active) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "setTransBrakeState: mutex timeout");
        return false;
    }
    engine_->setTransBrakeState(active, millis());
    return true;
}

bool NitrousController::setClutchState(bool active) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "setClutchState: mutex timeout");
        return false;
    }
    engine_->setClutchState(active);
    return true;
}

bool NitrousController::setShifterGear(int8_t gear) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "setShifterGear: mutex timeout");
        return false;
    }
    return engine_->setShifterGear(gear, millis());
}

bool NitrousController::setThrottlePedaling(bool pedaling) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "setThrottlePedaling: mutex timeout");
        return false;
    }
    engine_->setThrottlePedaling(pedaling, millis());
    return true;
}

bool NitrousController::setStagingInterruptEnabled(bool enabled) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "setStagingInterruptEnabled: mutex timeout");
        return false;
    }
    engine_->setStagingInterruptEnabled(enabled);
    return true;
}

// ============================================================================
// Manual operations
// ============================================================================

Result<void> NitrousController::activateStage(uint8_t stageNumber) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "activateStage: mutex timeout");
        return lockTimeout("activateStage");
    }
    return engine_->activateStage(stageNumber, millis());
}

Result<void> NitrousController::deactivateStage(uint8_t stageNumber) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "deactivateStage: mutex timeout");
        return lockTimeout("deactivateStage");
    }
    return engine_->deactivateStage(stageNumber);
}

Result<void> NitrousController::activateTimer(uint8_t timerId) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "activateTimer: mutex timeout");
        return lockTimeout("activateTimer");
    }
    return engine_->activateTimer(timerId, millis());
}

Result<void> NitrousController::deactivateTimer(uint8_t timerId) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "deactivateTimer: mutex timeout");
        return lockTimeout("deactivateTimer");
    }
    return engine_->deactivateTimer(timerId);
}

bool NitrousController::activatePurge(uint8_t purgeId) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "activatePurge: mutex timeout");
        return false;
    }
    return engine_->activatePurge(purgeId, millis());
}

bool NitrousController::deactivatePurge(uint8_t purgeId) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "deactivatePurge: mutex timeout");
        return false;
    }
    return engine_->deactivatePurge(purgeId);
}

bool NitrousController::emergencyStop() {
    MutexGuard guard(mutex_, LONG_LOCK_TIMEOUT);
    if (!guard.hasLock()) {
        ErrorHandler::logError(TAG, SystemError::MUTEX_TIMEOUT, "emergencyStop");
        return false;
    }
    return engine_->emergencyStop();
}

// ============================================================================
// Status
// ============================================================================

bool NitrousController::getStatus(StatusSnapshot& out) {
    {
        MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
        if (!guard.hasLock()) {
            LOG_WARN(TAG, "getStatus: mutex timeout");
            return false;
        }
        engine_->buildSnapshot(millis(), out);
    }
    out.tickFailures = tickFailures_.load();
    return true;
}

bool NitrousController::getStatusJson(JsonDocument& doc) {
    std::unique_ptr<StatusSnapshot> snapshot(new StatusSnapshot());
    if (!getStatus(*snapshot)) {
        return false;
    }
    StatusJson::toJson(*snapshot, doc);
    return true;
}

Result<void> NitrousController::registerObserver(IStatusObserver* observer) {
    return publisher_.registerObserver(observer);
}

bool NitrousController::unregisterObserver(IStatusObserver* observer) {
    return publisher_.unregisterObserver(observer);
}

bool NitrousController::isStageActive(uint8_t stageNumber) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->isStageActive(stageNumber);
}

bool NitrousController::isTimerActive(uint8_t timerId) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->isTimerActive(timerId);
}

bool NitrousController::isRelayEnergized(uint8_t channel) {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() && engine_->isRelayEnergized(channel);
}

uint32_t NitrousController::getTickCount() {
    MutexGuard guard(mutex_, CALL_LOCK_TIMEOUT);
    return guard.hasLock() ? engine_->getTickCount() : 0;
}
