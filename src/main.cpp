// src/main.cpp - N2O stage controller firmware entry point
#include <Arduino.h>
#include <array>
#include <memory>
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "hal/GpioRelayModule.h"
#include "modules/nitrous/NitrousController.h"
#include "modules/nitrous/StatusJson.h"
#include "utils/ErrorHandler.h"
#include "LoggingMacros.h"
#ifndef LOG_NO_CUSTOM_LOGGER
#include <Logger.h>
#include <LogInterfaceImpl.cpp>  // Include implementation once
#endif

static const char* TAG = "Main";

// Override weak function to reduce loopTask stack size
size_t getArduinoLoopTaskStackSize() {
    return STACK_SIZE_LOOP_TASK;
}

/**
 * @brief Prints the status document on the console once per interval
 */
class SerialStatusObserver : public IStatusObserver {
public:
    bool onStatus(const StatusSnapshot& snapshot) override {
        if (snapshot.timestampMs - lastReportMs_ < SystemConstants::Timing::SERIAL_STATUS_INTERVAL_MS) {
            return true;
        }
        lastReportMs_ = snapshot.timestampMs;

        size_t written = StatusJson::serialize(snapshot, buffer_, sizeof(buffer_));
        if (written == 0) {
            return false;
        }
        Serial.println(buffer_);
        return true;
    }

    const char* getName() const override { return "serial"; }

private:
    uint32_t lastReportMs_ = 0;
    // Static storage: onStatus() runs on the control task stack
    static char buffer_[SystemConstants::System::STATUS_JSON_BUFFER_SIZE];
};

char SerialStatusObserver::buffer_[SystemConstants::System::STATUS_JSON_BUFFER_SIZE];

static const std::array<uint8_t, RelayIndex::MAX_RELAYS> RELAY_PINS = {
    RELAY_PIN_CH0, RELAY_PIN_CH1, RELAY_PIN_CH2, RELAY_PIN_CH3,
    RELAY_PIN_CH4, RELAY_PIN_CH5, RELAY_PIN_CH6, RELAY_PIN_CH7
};

#ifdef RELAY_ACTIVE_LOW
static HAL::GpioRelayModule gRelayBoard(RELAY_PINS, true);
#else
static HAL::GpioRelayModule gRelayBoard(RELAY_PINS, false);
#endif

static std::unique_ptr<NitrousController> gController;
static SerialStatusObserver gSerialObserver;

static void haltWithBlink(const char* reason) {
    Serial.printf("FATAL: %s\n", reason);
    pinMode(LED_BUILTIN, OUTPUT);
    while (true) {
        digitalWrite(LED_BUILTIN, !digitalRead(LED_BUILTIN));
        delay(SystemConstants::Timing::FAILSAFE_LED_BLINK_MS);
    }
}

void closeExpiredPurges();
void reportMemory();

void setup() {
    Serial.begin(SERIAL_BAUD_RATE);
    delay(100);

    #ifndef LOG_NO_CUSTOM_LOGGER
    Logger& logger = Logger::getInstance();
    logger.init(1024);
    #ifdef LOG_MODE_RELEASE
        logger.setLogLevel(ESP_LOG_WARN);  // Only warnings and errors in release
    #else
        logger.setLogLevel(ESP_LOG_INFO);
    #endif
    logger.setMaxLogsPerSecond(0);  // 0 = unlimited
    logger.enableESPLogRedirection();
    logger.flush();
    #endif

    LOG_INFO(TAG, "==== %s v%s ====", PROJECT_NAME, FIRMWARE_VERSION);

    // Relay outputs go to a known OFF state before anything can energize them
    if (!gRelayBoard.initialize()) {
        haltWithBlink("relay board init failed");
    }

    ControllerConfig config;
    config.numStages = NITROUS_STAGE_COUNT;
    config.numTimers = NITROUS_TIMER_COUNT;
    config.stagingInterruptEnabled = true;

    gController = NitrousController::create(config, &gRelayBoard);
    if (!gController) {
        haltWithBlink("nitrous controller creation failed");
    }

    Result<void> registered = gController->registerObserver(&gSerialObserver);
    if (registered.isError()) {
        LOG_WARN(TAG, "Serial status disabled: %s", registered.message().c_str());
    }

    Result<void> started = gController->start();
    if (started.isError()) {
        ErrorHandler::logError(TAG, started.error(), "control loop start");
        haltWithBlink("control loop start failed");
    }

    LOG_INFO(TAG, "Ready: %u stages, %u timers", NITROUS_STAGE_COUNT, NITROUS_TIMER_COUNT);
}

void loop() {
    closeExpiredPurges();
    reportMemory();
    delay(SystemConstants::Timing::MAIN_LOOP_PERIOD_MS);
}

/**
 * @brief Close purges whose configured duration has elapsed
 *
 * The control core never self-schedules purge deactivation.
 */
void closeExpiredPurges() {
    static StatusSnapshot snapshot;
    if (!gController->getStatus(snapshot)) {
        return;
    }

    for (const PurgeStatus& purge : snapshot.purges) {
        if (purge.active && purge.elapsedMs >= purge.durationMs) {
            if (!gController->deactivatePurge(purge.purgeId)) {
                LOG_WARN(TAG, "Failed to close %s", purge.name);
            }
        }
    }
}

void reportMemory() {
    static uint32_t lastReport = 0;
    uint32_t now = millis();
    if (now - lastReport < SystemConstants::Timing::MEMORY_REPORT_INTERVAL_MS) {
        return;
    }
    lastReport = now;

    size_t freeHeap = ESP.getFreeHeap();
    if (freeHeap < SystemConstants::System::MIN_FREE_HEAP_WARNING) {
        LOG_WARN(TAG, "LOW MEMORY WARNING: Free: %u, Min: %u bytes",
                 (unsigned)freeHeap, (unsigned)ESP.getMinFreeHeap());
    } else {
        LOG_DEBUG(TAG, "Memory status: Free: %u, Min: %u bytes",
                  (unsigned)freeHeap, (unsigned)ESP.getMinFreeHeap());
    }
}
