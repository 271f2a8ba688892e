/**
 * @file test_status_json.cpp
 * @brief Status snapshot and JSON document tests
 */

#include <unity.h>
#include <ArduinoJson.h>
#include <memory>
#include "modules/nitrous/NitrousEngine.h"
#include "modules/nitrous/StatusJson.h"
#include "mocks/MockRelayModule.h"
#include "mocks/MockTime.h"

#ifdef NATIVE_TEST

static MockRelayModule* mockRelay = nullptr;
static std::unique_ptr<NitrousEngine> engine;
static StatusSnapshot snapshot;

static void setupStatus() {
    setMockMillis(1000);
    mockRelay = new MockRelayModule();
    ControllerConfig config;
    engine = NitrousEngine::create(config, mockRelay);
    snapshot = StatusSnapshot();
}

static void tearDownStatus() {
    engine.reset();
    delete mockRelay;
    mockRelay = nullptr;
}

void test_snapshot_reports_active_set() {
    setupStatus();

    StageConfigUpdate manual;
    manual.startTrigger.set(StartTrigger::manual());
    TEST_ASSERT_TRUE(engine->updateStageConfig(2, manual).isSuccess());
    TEST_ASSERT_TRUE(engine->updateStageConfig(3, manual).isSuccess());

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(engine->activatePurge(1, millis()));

    advanceWithTicks(*engine, 500);
    engine->buildSnapshot(millis(), snapshot);

    TEST_ASSERT_EQUAL_UINT32(1500, snapshot.timestampMs);
    TEST_ASSERT_EQUAL_UINT8(3, snapshot.numStages);
    TEST_ASSERT_EQUAL_UINT8(1, snapshot.activeStageCount);
    TEST_ASSERT_TRUE(snapshot.isStageActive(1));
    TEST_ASSERT_FALSE(snapshot.isStageActive(2));
    TEST_ASSERT_EQUAL_UINT32(500, snapshot.stages[0].elapsedMs);
    TEST_ASSERT_EQUAL_UINT32(1500, snapshot.stages[0].remainingMs);

    TEST_ASSERT_EQUAL_UINT8(5, snapshot.activeTimerCount);
    TEST_ASSERT_TRUE(snapshot.isTimerActive(5));
    TEST_ASSERT_EQUAL_UINT32(1500, snapshot.timers[0].remainingMs);

    TEST_ASSERT_TRUE(snapshot.relays[0].energized);
    TEST_ASSERT_TRUE(snapshot.relays[6].energized);
    TEST_ASSERT_TRUE(snapshot.purges[0].active);
    TEST_ASSERT_EQUAL_UINT32(500, snapshot.purges[0].elapsedMs);
    TEST_ASSERT_EQUAL_UINT32(50, snapshot.tickCount);

    tearDownStatus();
}

void test_status_json_layout() {
    setupStatus();

    StageConfigUpdate shifter;
    shifter.startTrigger.set(StartTrigger::shifter(4));
    TEST_ASSERT_TRUE(engine->updateStageConfig(3, shifter).isSuccess());

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    engine->tick(millis());
    engine->buildSnapshot(millis(), snapshot);

    JsonDocument doc;
    StatusJson::toJson(snapshot, doc);

    TEST_ASSERT_EQUAL(3, doc["stages"]["total"].as<int>());
    TEST_ASSERT_EQUAL(2, doc["stages"]["active"].size());
    TEST_ASSERT_EQUAL(1, doc["stages"]["active"][0].as<int>());
    TEST_ASSERT_EQUAL_STRING("timed", doc["stages"]["config"][0]["mode"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("start_over", doc["stages"]["config"][0]["timer_behavior"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("trans_brake_release", doc["stages"]["config"][0]["start_trigger"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("shifter_input", doc["stages"]["config"][2]["start_trigger"].as<const char*>());
    TEST_ASSERT_EQUAL(4, doc["stages"]["config"][2]["shifter_gear"].as<int>());
    TEST_ASSERT_TRUE(doc["stages"]["config"][0]["shifter_gear"].isNull());

    TEST_ASSERT_EQUAL(5, doc["timers"]["total"].as<int>());
    TEST_ASSERT_EQUAL(5, doc["timers"]["active"].size());

    TEST_ASSERT_EQUAL(8, doc["relays"].size());
    TEST_ASSERT_EQUAL(1, doc["relays"][0]["id"].as<int>());
    TEST_ASSERT_EQUAL_STRING("ok", doc["relays"][0]["status"].as<const char*>());
    TEST_ASSERT_TRUE(doc["relays"][0]["energized"].as<bool>());

    TEST_ASSERT_EQUAL(3, doc["purges"].size());
    TEST_ASSERT_EQUAL_STRING("Motor Purge", doc["purges"][0]["name"].as<const char*>());

    TEST_ASSERT_FALSE(doc["inputs"]["trans_brake"].as<bool>());
    TEST_ASSERT_TRUE(doc["inputs"]["shifter_gear"].isNull());
    TEST_ASSERT_TRUE(doc["staging_interrupt"]["enabled"].as<bool>());
    TEST_ASSERT_EQUAL(2, doc["staging_interrupt"]["count"].as<int>());
    TEST_ASSERT_EQUAL(1, doc["loop"]["ticks"].as<int>());

    tearDownStatus();
}

void test_status_json_buffer_too_small() {
    setupStatus();
    engine->buildSnapshot(millis(), snapshot);

    char tiny[64];
    TEST_ASSERT_EQUAL(0, StatusJson::serialize(snapshot, tiny, sizeof(tiny)));

    static char buffer[6144];
    size_t written = StatusJson::serialize(snapshot, buffer, sizeof(buffer));
    TEST_ASSERT_TRUE(written > 0);

    JsonDocument parsed;
    TEST_ASSERT_FALSE(deserializeJson(parsed, buffer));
    TEST_ASSERT_EQUAL(3, parsed["stages"]["total"].as<int>());

    tearDownStatus();
}

#endif // NATIVE_TEST
