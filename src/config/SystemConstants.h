// src/config/SystemConstants.h
#ifndef SYSTEM_CONSTANTS_H
#define SYSTEM_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace SystemConstants {

    // ===========================
    // Timing Constants
    // ===========================
    namespace Timing {
        // Control loop: 100 Hz best effort, not a hard real-time guarantee
        constexpr uint32_t CONTROL_LOOP_PERIOD_MS = 10;
        // Pause after a failed tick before the loop resumes
        constexpr uint32_t CONTROL_LOOP_ERROR_BACKOFF_MS = 100;
        // Bounded wait for the control task to exit on stop()
        constexpr uint32_t CONTROL_TASK_STOP_TIMEOUT_MS = 2000;

        // Mutex timeouts - IMPORTANT: Never use portMAX_DELAY to prevent deadlocks
        // - SHORT (5ms): control loop tick, must not stall the 10ms period
        // - DEFAULT (50ms): setters, configuration updates, status queries
        // - LONG (500ms): lifecycle operations
        constexpr uint32_t MUTEX_SHORT_TIMEOUT_MS = 5;
        constexpr uint32_t MUTEX_DEFAULT_TIMEOUT_MS = 50;
        constexpr uint32_t MUTEX_LONG_TIMEOUT_MS = 500;

        constexpr uint32_t FAILSAFE_LED_BLINK_MS = 500;        // LED blink rate when boot fails
        constexpr uint32_t MAIN_LOOP_PERIOD_MS = 20;           // Arduino loop(): purge scheduling
        constexpr uint32_t SERIAL_STATUS_INTERVAL_MS = 1000;   // Status JSON on the console
        constexpr uint32_t MEMORY_REPORT_INTERVAL_MS = 300000; // 5 minutes
    }

    // ===========================
    // System
    // ===========================
    namespace System {
        constexpr size_t MIN_FREE_HEAP_WARNING = 20000;
        constexpr size_t STATUS_JSON_BUFFER_SIZE = 6144;
    }

    // ===========================
    // Status Publishing
    // ===========================
    namespace Status {
        constexpr uint8_t MAX_OBSERVERS = 8;
        // Observer failures are logged on the first occurrence and then every Nth
        constexpr uint32_t OBSERVER_FAILURE_LOG_INTERVAL = 100;
        // Tick failures are logged on the first occurrence and then every Nth
        constexpr uint32_t TICK_FAILURE_LOG_INTERVAL = 50;
    }

    // ===========================
    // Relay Health
    // ===========================
    namespace Relay {
        // Current above max_amp is reported, never acted upon
        constexpr float OVERCURRENT_HYSTERESIS_AMP = 1.0f;
    }
}

#endif // SYSTEM_CONSTANTS_H
