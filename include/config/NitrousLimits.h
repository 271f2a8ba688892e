#pragma once
#include <cstdint>

/**
 * @brief Stage, timer, relay and purge parameter defaults and valid ranges
 *
 * Every sparse configuration update is validated against Limits before it is
 * applied. Defaults are used when the controller builds its fixed tables.
 */
namespace NitrousConfig {
    namespace Defaults {
        constexpr uint32_t STAGE_ACTIVATION_TIME_MS = 2000;   // 2s window per stage
        constexpr uint32_t STAGE_START_DELAY_MS = 0;          // fire on trigger
        constexpr uint16_t STAGE_SHOT_SIZE_HP = 100;
        constexpr uint32_t TIMER_DURATION_MS = 2000;          // 2s
        constexpr uint32_t PURGE_DURATION_MS = 3000;          // 3s
        constexpr float RELAY_MAX_AMP_SINGLE = 70.0f;         // 70A single-feed relay
        constexpr float RELAY_MAX_AMP_SPLIT = 35.0f;          // 35A per side on split systems
    }

    namespace Limits {
        constexpr uint8_t MIN_STAGES = 2;
        constexpr uint8_t MAX_STAGES = 6;
        constexpr uint8_t MIN_TIMERS = 2;
        constexpr uint8_t MAX_TIMERS = 10;
        constexpr uint8_t MAX_PURGES = 3;

        constexpr uint32_t STAGE_ACTIVATION_MIN_MS = 1;
        constexpr uint32_t STAGE_ACTIVATION_MAX_MS = 60000;   // 60s
        constexpr uint32_t STAGE_START_DELAY_MAX_MS = 10000;  // 10s
        constexpr uint16_t SHOT_SIZE_MAX_HP = 1500;

        constexpr uint32_t TIMER_DURATION_MIN_MS = 1;
        constexpr uint32_t TIMER_DURATION_MAX_MS = 60000;     // 60s

        constexpr uint32_t PURGE_DURATION_MIN_MS = 100;
        constexpr uint32_t PURGE_DURATION_MAX_MS = 30000;     // 30s

        constexpr float RELAY_MAX_AMP_LIMIT = 100.0f;

        // Gears are 1-based; GEAR_NONE (see NitrousTypes.h) means "no gear"
        constexpr int8_t MIN_GEAR = 1;
        constexpr int8_t MAX_GEAR = 10;
    }
}
