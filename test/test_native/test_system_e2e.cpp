/**
 * @file test_system_e2e.cpp
 * @brief End-to-end runs of the control core against a recording relay board
 */

#include <unity.h>
#include <memory>
#include "modules/nitrous/NitrousEngine.h"
#include "mocks/MockRelayModule.h"
#include "mocks/MockTime.h"

#ifdef NATIVE_TEST

static MockRelayModule* mockRelay = nullptr;
static std::unique_ptr<NitrousEngine> engine;

static void setupSystem() {
    setMockMillis(1000);
    mockRelay = new MockRelayModule();
    ControllerConfig config;
    config.numStages = 3;
    config.numTimers = 5;
    engine = NitrousEngine::create(config, mockRelay);
}

static void tearDownSystem() {
    engine.reset();
    delete mockRelay;
    mockRelay = nullptr;
}

// Active Set and Relay Bank agree for every stage
static void assertStagesMatchRelays() {
    for (uint8_t n = 1; n <= engine->getStageCount(); n++) {
        StageConfig stage;
        engine->getStageConfig(n, stage);
        TEST_ASSERT_EQUAL(engine->isStageActive(n), engine->isRelayEnergized(stage.relayChannel));
        TEST_ASSERT_EQUAL(engine->isStageActive(n), mockRelay->isOn(stage.relayChannel));
    }
}

void test_e2e_two_stage_cascade() {
    setupSystem();

    // Stage 1 on brake release (relay 0), stage 2 follows it (relay 1)
    StageConfigUpdate cascade;
    cascade.startTrigger.set(StartTrigger::stagePrevious());
    cascade.activationTimeMs.set(3000);
    TEST_ASSERT_TRUE(engine->updateStageConfig(2, cascade).isSuccess());

    StageConfigUpdate manual;
    manual.startTrigger.set(StartTrigger::manual());
    TEST_ASSERT_TRUE(engine->updateStageConfig(3, manual).isSuccess());

    engine->setTransBrakeState(true, millis());
    TEST_ASSERT_FALSE(engine->isStageActive(1));
    TEST_ASSERT_FALSE(engine->isStageActive(2));
    TEST_ASSERT_FALSE(engine->isRelayEnergized(0));

    advanceWithTicks(*engine, 500);
    engine->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(engine->isStageActive(1));
    TEST_ASSERT_TRUE(engine->isRelayEnergized(0));
    TEST_ASSERT_TRUE(engine->isStageActive(2));
    TEST_ASSERT_TRUE(engine->isRelayEnergized(1));
    assertStagesMatchRelays();

    // Stage 1's 2s window elapses, stage 2 keeps its own 3s window
    advanceWithTicks(*engine, 2000);
    TEST_ASSERT_FALSE(engine->isStageActive(1));
    TEST_ASSERT_FALSE(engine->isRelayEnergized(0));
    TEST_ASSERT_TRUE(engine->isStageActive(2));
    TEST_ASSERT_TRUE(engine->isRelayEnergized(1));
    assertStagesMatchRelays();

    advanceWithTicks(*engine, 1000);
    TEST_ASSERT_FALSE(engine->isStageActive(2));
    TEST_ASSERT_FALSE(engine->isRelayEnergized(1));
    assertStagesMatchRelays();

    TEST_ASSERT_EQUAL_UINT32(1, mockRelay->onCalls[0]);
    TEST_ASSERT_EQUAL_UINT32(1, mockRelay->offCalls[0]);
    TEST_ASSERT_EQUAL_UINT32(1, mockRelay->onCalls[1]);
    TEST_ASSERT_EQUAL_UINT32(1, mockRelay->offCalls[1]);
    TEST_ASSERT_EQUAL_UINT32(0, mockRelay->onCalls[2]);

    tearDownSystem();
}

void test_e2e_second_run_after_rearm() {
    setupSystem();

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    advanceWithTicks(*engine, 2500);
    TEST_ASSERT_FALSE(engine->isStageActive(1));

    // Re-staging the car and leaving again fires every brake stage again
    engine->setTransBrakeState(true, millis());
    advanceWithTicks(*engine, 100);
    engine->setTransBrakeState(false, millis());

    for (uint8_t n = 1; n <= 3; n++) {
        TEST_ASSERT_TRUE(engine->isStageActive(n));
        TEST_ASSERT_EQUAL_UINT32(2, mockRelay->onCalls[n - 1]);
    }

    tearDownSystem();
}

void test_emergency_stop_releases_everything() {
    setupSystem();

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(engine->activatePurge(1, millis()));
    TEST_ASSERT_TRUE(engine->activatePurge(2, millis()));

    TEST_ASSERT_TRUE(engine->emergencyStop());

    for (uint8_t n = 1; n <= 3; n++) {
        TEST_ASSERT_FALSE(engine->isStageActive(n));
    }
    for (uint8_t id = 1; id <= 5; id++) {
        TEST_ASSERT_FALSE(engine->isTimerActive(id));
    }
    for (uint8_t ch = 0; ch < 8; ch++) {
        TEST_ASSERT_FALSE(engine->isRelayEnergized(ch));
        TEST_ASSERT_FALSE(mockRelay->isOn(ch));
    }
    PurgeChannel purge;
    engine->getPurgeConfig(1, purge);
    TEST_ASSERT_FALSE(purge.active);

    // Brake is still released: nothing comes back on by itself
    advanceWithTicks(*engine, 200);
    TEST_ASSERT_FALSE(engine->isStageActive(1));

    tearDownSystem();
}

void test_emergency_stop_drops_pending_and_latch() {
    setupSystem();

    StageConfigUpdate delayed;
    delayed.startDelayMs.set(1000);
    TEST_ASSERT_TRUE(engine->updateStageConfig(1, delayed).isSuccess());

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(engine->isStagePending(1));

    engine->setStagingInterruptEnabled(false);
    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(engine->getInputs().releaseLatched);

    TEST_ASSERT_TRUE(engine->emergencyStop());
    TEST_ASSERT_FALSE(engine->isStagePending(1));
    TEST_ASSERT_FALSE(engine->getInputs().releaseLatched);

    advanceWithTicks(*engine, 1500);
    TEST_ASSERT_FALSE(engine->isStageActive(1));

    tearDownSystem();
}

void test_tick_runs_health_check() {
    setupSystem();
    mockRelay->healthAvailable = true;
    mockRelay->health[6].fuseBlown = true;

    TEST_ASSERT_TRUE(engine->tick(millis()).isSuccess());

    TEST_ASSERT_EQUAL_UINT32(1, engine->getTickCount());
    TEST_ASSERT_EQUAL(8, engine->getLastHealth().size());
    TEST_ASSERT_EQUAL(RelayStatus::BLOWN_FUSE, engine->getRelayBank().relay(6).fuseStatus);

    PurgeChannel purge;
    engine->getPurgeConfig(1, purge);
    TEST_ASSERT_EQUAL(RelayStatus::BLOWN_FUSE, purge.fuseStatus);

    tearDownSystem();
}

void test_tick_reports_rejected_relay_write() {
    setupSystem();
    mockRelay->rejectWrites[0] = true;

    engine->setTransBrakeState(true, millis());
    engine->setTransBrakeState(false, millis());

    // Stage 1 is recorded active and its relay commanded on
    TEST_ASSERT_TRUE(engine->isStageActive(1));
    TEST_ASSERT_TRUE(engine->isRelayEnergized(0));
    TEST_ASSERT_EQUAL(RelayStatus::FAILED, engine->getRelayBank().relay(0).status);

    // The rejected OFF at window end fails that tick
    setMockMillis(3000);
    Result<void> result = engine->tick(millis());
    TEST_ASSERT_EQUAL(SystemError::RELAY_OPERATION_FAILED, result.error());
    TEST_ASSERT_FALSE(engine->isStageActive(1));

    advanceMockMillis(10);
    TEST_ASSERT_TRUE(engine->tick(millis()).isSuccess());

    tearDownSystem();
}

void test_simulation_mode_runs_without_driver() {
    setMockMillis(1000);
    ControllerConfig config;
    std::unique_ptr<NitrousEngine> simulated = NitrousEngine::create(config, nullptr);
    TEST_ASSERT_NOT_NULL(simulated.get());
    TEST_ASSERT_TRUE(simulated->getRelayBank().isSimulated());

    simulated->setTransBrakeState(true, millis());
    simulated->setTransBrakeState(false, millis());
    TEST_ASSERT_TRUE(simulated->isStageActive(1));
    TEST_ASSERT_TRUE(simulated->isRelayEnergized(0));

    TEST_ASSERT_TRUE(simulated->tick(millis()).isSuccess());
    TEST_ASSERT_EQUAL(RelayStatus::OK, simulated->getRelayBank().relay(0).status);
}

#endif // NATIVE_TEST
