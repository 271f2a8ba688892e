#pragma once
#include <cstdint>

namespace RelayIndex {
    // =========================================================
    // SINGLE SOURCE OF TRUTH FOR DEFAULT RELAY ASSIGNMENTS
    //
    // Stages bind to channels 0..5 in stage order (stage N -> channel N-1).
    // Channels 6 and 7 are reserved for the purge solenoids.
    // Runtime rebinding goes through NitrousController::updateStageConfig().
    // =========================================================

    constexpr uint8_t FIRST_STAGE    = 0;  // Physical Relays 1-6, one per stage
    constexpr uint8_t MOTOR_PURGE    = 6;  // Physical Relay 7
    constexpr uint8_t LINE_PURGE     = 7;  // Physical Relay 8 - shared by both line purges

    constexpr uint8_t MAX_RELAYS = 8;

    // Default channel for a 1-based stage number
    constexpr uint8_t forStage(uint8_t stageNumber) { return FIRST_STAGE + stageNumber - 1; }

    // Convert array index to physical relay number (1-8)
    constexpr uint8_t toPhysical(uint8_t index) { return index + 1; }

    constexpr bool isValid(uint8_t channel) { return channel < MAX_RELAYS; }
}
