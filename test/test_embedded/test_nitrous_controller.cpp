/**
 * @file test_nitrous_controller.cpp
 * @brief On-target tests for the threaded nitrous controller
 *
 * These tests run on actual ESP32 hardware: the control task, the controller
 * mutex and the observer list are the real FreeRTOS objects.
 */

#include <unity.h>
#include <Arduino.h>

#ifdef ESP32_TEST

#include <atomic>
#include <memory>
#include "modules/nitrous/NitrousController.h"

// Relay driver that records commands from any task
class RecordingRelay : public HAL::IRelay {
public:
    std::atomic<bool> states[8];
    std::atomic<uint32_t> writes;

    RecordingRelay() : writes(0) {
        for (auto& s : states) s.store(false);
    }

    bool initialize() override { return true; }

    bool setState(uint8_t channel, State state) override {
        if (channel >= 8) return false;
        states[channel].store(state == State::ON);
        writes++;
        return true;
    }

    State getState(uint8_t channel) const override {
        if (channel >= 8) return State::UNKNOWN;
        return states[channel].load() ? State::ON : State::OFF;
    }

    bool readHealth(uint8_t, HealthReading&) override { return false; }
    uint8_t getChannelCount() const override { return 8; }
    const char* getName() const override { return "Recording"; }
};

class CountingObserver : public IStatusObserver {
public:
    explicit CountingObserver(bool accept) : accept_(accept), calls(0) {}

    bool onStatus(const StatusSnapshot&) override {
        calls++;
        return accept_;
    }

    const char* getName() const override { return accept_ ? "counting" : "failing"; }

private:
    bool accept_;

public:
    std::atomic<uint32_t> calls;
};

static RecordingRelay* relay = nullptr;
static std::unique_ptr<NitrousController> controller;

void setUp(void) {
    relay = new RecordingRelay();
    ControllerConfig config;
    controller = NitrousController::create(config, relay);
}

void tearDown(void) {
    controller.reset();
    delete relay;
    relay = nullptr;
}

void test_controller_start_stop_idempotent() {
    TEST_ASSERT_NOT_NULL(controller.get());
    TEST_ASSERT_FALSE(controller->isRunning());

    TEST_ASSERT_TRUE(controller->start().isSuccess());
    TEST_ASSERT_TRUE(controller->isRunning());
    TEST_ASSERT_TRUE(controller->start().isSuccess());

    delay(100);
    TEST_ASSERT_TRUE(controller->getTickCount() > 0);

    controller->stop();
    TEST_ASSERT_FALSE(controller->isRunning());
    controller->stop();

    uint32_t ticks = controller->getTickCount();
    delay(100);
    TEST_ASSERT_EQUAL_UINT32(ticks, controller->getTickCount());

    // Restart after a clean stop
    TEST_ASSERT_TRUE(controller->start().isSuccess());
    controller->stop();
}

void test_controller_rejects_bad_layout() {
    ControllerConfig config;
    config.numStages = 7;
    TEST_ASSERT_NULL(NitrousController::create(config, relay).get());
}

void test_controller_brake_release_in_setter() {
    TEST_ASSERT_TRUE(controller->start().isSuccess());

    TEST_ASSERT_TRUE(controller->setTransBrakeState(true));
    TEST_ASSERT_TRUE(controller->setTransBrakeState(false));

    // Energized inside the setter, before any loop tick could run
    TEST_ASSERT_TRUE(controller->isStageActive(1));
    TEST_ASSERT_TRUE(relay->states[0].load());

    delay(2100);
    TEST_ASSERT_FALSE(controller->isStageActive(1));
    TEST_ASSERT_FALSE(relay->states[0].load());

    controller->stop();
}

struct ShifterTaskArgs {
    NitrousController* controller;
    int8_t firstGear;
    SemaphoreHandle_t done;
};

static void shifterTask(void* param) {
    ShifterTaskArgs* args = static_cast<ShifterTaskArgs*>(param);
    for (int i = 0; i < 200; i++) {
        int8_t gear = args->firstGear + (i % 4);
        args->controller->setShifterGear(gear);
        vTaskDelay(1);
    }
    xSemaphoreGive(args->done);
    vTaskDelete(nullptr);
}

void test_controller_concurrent_gear_changes() {
    StageConfigUpdate instant;
    instant.mode.set(StageMode::INSTANT);
    for (uint8_t n = 1; n <= 3; n++) {
        instant.startTrigger.set(StartTrigger::shifter(n));
        TEST_ASSERT_TRUE(controller->updateStageConfig(n, instant).isSuccess());
    }
    TEST_ASSERT_TRUE(controller->start().isSuccess());

    SemaphoreHandle_t done = xSemaphoreCreateCounting(2, 0);
    ShifterTaskArgs a = {controller.get(), 1, done};
    ShifterTaskArgs b = {controller.get(), 2, done};
    xTaskCreatePinnedToCore(shifterTask, "shiftA", 4096, &a, 2, nullptr, 0);
    xTaskCreatePinnedToCore(shifterTask, "shiftB", 4096, &b, 2, nullptr, 1);

    TEST_ASSERT_TRUE(xSemaphoreTake(done, pdMS_TO_TICKS(10000)) == pdTRUE);
    TEST_ASSERT_TRUE(xSemaphoreTake(done, pdMS_TO_TICKS(10000)) == pdTRUE);
    vSemaphoreDelete(done);

    controller->stop();

    // Each Instant stage follows one gear, so at most one can be on
    StatusSnapshot* status = new StatusSnapshot();
    TEST_ASSERT_TRUE(controller->getStatus(*status));
    TEST_ASSERT_TRUE(status->activeStageCount <= 1);
    for (uint8_t n = 1; n <= 3; n++) {
        bool active = status->isStageActive(n);
        TEST_ASSERT_EQUAL(active, status->relays[n - 1].energized);
        TEST_ASSERT_EQUAL(active, relay->states[n - 1].load());
    }
    delete status;
}

struct StopTaskArgs {
    NitrousController* controller;
    SemaphoreHandle_t done;
};

static void stopTask(void* param) {
    StopTaskArgs* args = static_cast<StopTaskArgs*>(param);
    args->controller->stop();
    xSemaphoreGive(args->done);
    vTaskDelete(nullptr);
}

void test_controller_concurrent_stop_then_restart() {
    TEST_ASSERT_TRUE(controller->start().isSuccess());
    delay(50);

    SemaphoreHandle_t done = xSemaphoreCreateCounting(2, 0);
    StopTaskArgs args = {controller.get(), done};
    xTaskCreatePinnedToCore(stopTask, "stopA", 4096, &args, 2, nullptr, 0);
    xTaskCreatePinnedToCore(stopTask, "stopB", 4096, &args, 2, nullptr, 1);

    TEST_ASSERT_TRUE(xSemaphoreTake(done, pdMS_TO_TICKS(5000)) == pdTRUE);
    TEST_ASSERT_TRUE(xSemaphoreTake(done, pdMS_TO_TICKS(5000)) == pdTRUE);
    vSemaphoreDelete(done);

    for (int i = 0; i < 100 && controller->isRunning(); i++) {
        delay(10);
    }
    TEST_ASSERT_FALSE(controller->isRunning());

    // The exit signal was consumed once, so a fresh task can start
    uint32_t ticks = controller->getTickCount();
    TEST_ASSERT_TRUE(controller->start().isSuccess());
    delay(100);
    TEST_ASSERT_TRUE(controller->getTickCount() > ticks);
    controller->stop();
    TEST_ASSERT_FALSE(controller->isRunning());
}

void test_controller_observer_isolation() {
    CountingObserver failing(false);
    CountingObserver counting(true);

    TEST_ASSERT_TRUE(controller->registerObserver(&failing).isSuccess());
    TEST_ASSERT_TRUE(controller->registerObserver(&counting).isSuccess());
    TEST_ASSERT_TRUE(controller->start().isSuccess());

    delay(200);
    controller->stop();

    TEST_ASSERT_TRUE(counting.calls.load() > 0);
    TEST_ASSERT_EQUAL_UINT32(failing.calls.load(), counting.calls.load());
    TEST_ASSERT_EQUAL_UINT32(failing.calls.load(), controller->getObserverFailures());

    TEST_ASSERT_TRUE(controller->unregisterObserver(&failing));
    TEST_ASSERT_TRUE(controller->unregisterObserver(&counting));
}

void test_controller_duplicate_observer_rejected() {
    CountingObserver observer(true);

    TEST_ASSERT_TRUE(controller->registerObserver(&observer).isSuccess());
    Result<void> again = controller->registerObserver(&observer);
    TEST_ASSERT_EQUAL(SystemError::CONFIG_CONFLICT, again.error());
    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER, controller->registerObserver(nullptr).error());

    TEST_ASSERT_TRUE(controller->unregisterObserver(&observer));
    TEST_ASSERT_FALSE(controller->unregisterObserver(&observer));
}

void test_controller_emergency_stop() {
    TEST_ASSERT_TRUE(controller->start().isSuccess());
    TEST_ASSERT_TRUE(controller->setTransBrakeState(true));
    TEST_ASSERT_TRUE(controller->setTransBrakeState(false));
    TEST_ASSERT_TRUE(controller->activatePurge(1));

    TEST_ASSERT_TRUE(controller->emergencyStop());

    for (uint8_t ch = 0; ch < 8; ch++) {
        TEST_ASSERT_FALSE(controller->isRelayEnergized(ch));
        TEST_ASSERT_FALSE(relay->states[ch].load());
    }
    controller->stop();
}

void test_controller_status_json() {
    TEST_ASSERT_TRUE(controller->start().isSuccess());
    delay(50);

    JsonDocument doc;
    TEST_ASSERT_TRUE(controller->getStatusJson(doc));
    TEST_ASSERT_EQUAL(3, doc["stages"]["total"].as<int>());
    TEST_ASSERT_EQUAL(8, doc["relays"].size());
    TEST_ASSERT_TRUE(doc["loop"]["ticks"].as<uint32_t>() > 0);

    controller->stop();
}

void setup() {
    // Initialize serial for test output
    Serial.begin(921600);
    while (!Serial) {
        delay(10);
    }

    // Wait a bit for stability
    delay(2000);

    UNITY_BEGIN();

    RUN_TEST(test_controller_start_stop_idempotent);
    RUN_TEST(test_controller_rejects_bad_layout);
    RUN_TEST(test_controller_brake_release_in_setter);
    RUN_TEST(test_controller_concurrent_gear_changes);
    RUN_TEST(test_controller_concurrent_stop_then_restart);
    RUN_TEST(test_controller_observer_isolation);
    RUN_TEST(test_controller_duplicate_observer_rejected);
    RUN_TEST(test_controller_emergency_stop);
    RUN_TEST(test_controller_status_json);

    UNITY_END();
}

void loop() {
    // Nothing to do here
}

#endif // ESP32_TEST
