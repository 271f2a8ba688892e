// include/modules/nitrous/NitrousController.h
#pragma once

#include <ArduinoJson.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include "hal/HardwareAbstractionLayer.h"
#include "modules/nitrous/NitrousEngine.h"
#include "modules/nitrous/StatusPublisher.h"
#include "modules/nitrous/StatusSnapshot.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Thread-safe front end of the nitrous control core
 *
 * Wraps one NitrousEngine behind a single FreeRTOS mutex and runs the
 * periodic control loop as a pinned FreeRTOS task:
 *
 *   lock -> relay health -> stage/timer evaluation -> snapshot -> unlock -> publish
 *
 * Signal setters run the immediate trigger path under the same lock, so a
 * brake release energizes its stages inside the setter call without waiting
 * for the next tick. Every public call uses a bounded mutex timeout and
 * reports MUTEX_TIMEOUT / false instead of blocking.
 */
class NitrousController {
public:
    /**
     * @brief Build a stopped controller
     * @param config Layout (2-6 stages, 2-10 timers)
     * @param relayDriver Relay output driver, nullptr for simulation. Not owned,
     *        must outlive the controller.
     * @return nullptr on an invalid layout or when FreeRTOS objects cannot be created
     */
    static std::unique_ptr<NitrousController> create(const ControllerConfig& config,
                                                     HAL::IRelay* relayDriver);

    ~NitrousController();

    NitrousController(const NitrousController&) = delete;
    NitrousController& operator=(const NitrousController&) = delete;

    // ---- Lifecycle ----------------------------------------------------

    /**
     * @brief Spawn the control task (Idle -> Running)
     */
    Result<void> start();

    /**
     * @brief Ask the control task to exit and wait up to
     *        CONTROL_TASK_STOP_TIMEOUT_MS for it. Safe to call repeatedly.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    // ---- Configuration ------------------------------------------------

    Result<void> updateStageConfig(uint8_t stageNumber, const StageConfigUpdate& update);
    Result<void> updateTimerConfig(uint8_t timerId, const TimerConfigUpdate& update);
    Result<void> updatePurgeConfig(uint8_t purgeId, const PurgeConfigUpdate& update);
    Result<void> updateRelayConfig(uint8_t channel, const RelayConfigUpdate& update);

    bool getStageConfig(uint8_t stageNumber, StageConfig& out);
    bool getTimerConfig(uint8_t timerId, TimerConfig& out);
    bool getPurgeConfig(uint8_t purgeId, PurgeChannel& out);

    // ---- Vehicle signals (false on lock timeout) -----------------------

    bool setTransBrakeState(bool active);
    bool setClutchState(bool active);
    bool setShifterGear(int8_t gear);
    bool setThrottlePedaling(bool pedaling);
    bool setStagingInterruptEnabled(bool enabled);

    // ---- Manual operations --------------------------------------------

    Result<void> activateStage(uint8_t stageNumber);
    Result<void> deactivateStage(uint8_t stageNumber);
    Result<void> activateTimer(uint8_t timerId);
    Result<void> deactivateTimer(uint8_t timerId);

    /**
     * @brief Open a purge. The caller closes it after its configured duration.
     */
    bool activatePurge(uint8_t purgeId);
    bool deactivatePurge(uint8_t purgeId);

    /**
     * @brief Release everything and de-energize all relays
     *
     * Waits up to MUTEX_LONG_TIMEOUT_MS for the lock before giving up.
     */
    bool emergencyStop();

    // ---- Status -------------------------------------------------------

    bool getStatus(StatusSnapshot& out);
    bool getStatusJson(JsonDocument& doc);

    Result<void> registerObserver(IStatusObserver* observer);
    bool unregisterObserver(IStatusObserver* observer);

    bool isStageActive(uint8_t stageNumber);
    bool isTimerActive(uint8_t timerId);
    bool isRelayEnergized(uint8_t channel);

    uint32_t getTickCount();
    uint32_t getTickFailures() const { return tickFailures_.load(); }
    uint32_t getObserverFailures() const { return publisher_.getFailureCount(); }

private:
    NitrousController(std::unique_ptr<NitrousEngine> engine,
                      SemaphoreHandle_t mutex,
                      SemaphoreHandle_t exitSignal);

    static void taskFunction(void* pvParameters);
    void runLoop();
    Result<void> tick();

    std::unique_ptr<NitrousEngine> engine_;
    StatusPublisher publisher_;

    SemaphoreHandle_t mutex_;        // Guards engine_
    SemaphoreHandle_t exitSignal_;   // Given by the task right before it exits
    TaskHandle_t taskHandle_;

    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
    std::atomic<bool> exitPending_;  // stop() timed out, task has not acknowledged
    std::atomic<uint32_t> tickFailures_;

    // Only touched by the control task
    StatusSnapshot tickSnapshot_;

    static const char* TAG;
};
