// include/modules/nitrous/NitrousTypes.h
#pragma once

#include <cstdint>
#include "config/NitrousLimits.h"

/**
 * @brief Configuration and runtime types shared by the nitrous control core
 *
 * Configuration structs (StageConfig, TimerConfig, PurgeChannel, Relay) are
 * built once by NitrousEngine with fixed counts and changed only through the
 * sparse *Update structs. Runtime structs form the Active Set.
 */

// Absent shifter gear (neutral / no gear selected)
constexpr int8_t GEAR_NONE = -1;

constexpr uint8_t NITROUS_NAME_LEN = 16;

/**
 * @brief Stage activation mode
 */
enum class StageMode : uint8_t {
    OFF = 0,
    TIMED = 1,     // Active for activationTimeMs, then released
    INSTANT = 2    // Active while the start trigger condition holds
};

/**
 * @brief What an active stage does with its window when the driver pedals
 */
enum class TimerBehavior : uint8_t {
    START_OVER = 0,   // Restart the activation window from now
    HOLD = 1          // Leave the window alone, elapsed time keeps counting
};

/**
 * @brief Relay / fuse condition
 */
enum class RelayStatus : uint8_t {
    OK = 0,
    BLOWN_FUSE = 1,
    FAILED = 2,
    UNKNOWN = 3
};

/**
 * @brief Start trigger, a closed set of conditions
 *
 * gear is only meaningful for SHIFTER_INPUT: the expected gear for stages,
 * an optional filter (GEAR_NONE = any gear) for timers.
 */
struct StartTrigger {
    enum class Type : uint8_t {
        TRANS_BRAKE_RELEASE = 0,
        SHIFTER_INPUT = 1,
        STAGE_PREVIOUS = 2,
        MANUAL = 3
    };

    Type type;
    int8_t gear;

    static StartTrigger transBrakeRelease() { return {Type::TRANS_BRAKE_RELEASE, GEAR_NONE}; }
    static StartTrigger shifter(int8_t gear) { return {Type::SHIFTER_INPUT, gear}; }
    static StartTrigger stagePrevious() { return {Type::STAGE_PREVIOUS, GEAR_NONE}; }
    static StartTrigger manual() { return {Type::MANUAL, GEAR_NONE}; }

    bool operator==(const StartTrigger& other) const {
        return type == other.type && (type != Type::SHIFTER_INPUT || gear == other.gear);
    }
    bool operator!=(const StartTrigger& other) const { return !(*this == other); }
};

struct StageConfig {
    uint8_t stageNumber = 0;                 // 1..N
    char name[NITROUS_NAME_LEN] = {0};
    bool enabled = true;
    StageMode mode = StageMode::TIMED;
    uint32_t activationTimeMs = NitrousConfig::Defaults::STAGE_ACTIVATION_TIME_MS;
    TimerBehavior timerBehavior = TimerBehavior::START_OVER;
    StartTrigger startTrigger = StartTrigger::transBrakeRelease();
    uint32_t startDelayMs = NitrousConfig::Defaults::STAGE_START_DELAY_MS;
    uint8_t relayChannel = 0;                // 0..7
    uint16_t shotSizeHp = NitrousConfig::Defaults::STAGE_SHOT_SIZE_HP;
    bool holdOnPedal = true;
};

struct TimerConfig {
    uint8_t timerId = 0;                     // 1..M
    char name[NITROUS_NAME_LEN] = {0};
    uint32_t durationMs = NitrousConfig::Defaults::TIMER_DURATION_MS;
    bool enabled = true;
    StartTrigger startTrigger = StartTrigger::transBrakeRelease();
};

struct Relay {
    uint8_t relayId = 0;                     // 1..8
    char name[NITROUS_NAME_LEN] = {0};
    uint8_t channel = 0;                     // 0..7
    RelayStatus status = RelayStatus::UNKNOWN;
    RelayStatus fuseStatus = RelayStatus::UNKNOWN;
    float currentAmp = 0.0f;
    float maxAmp = NitrousConfig::Defaults::RELAY_MAX_AMP_SINGLE;
    bool isSplitSystem = false;
    uint32_t lastCheckMs = 0;
    bool energized = false;                  // Last commanded state
    bool overCurrent = false;                // Informational only
};

struct PurgeChannel {
    uint8_t purgeId = 0;
    char name[NITROUS_NAME_LEN] = {0};
    uint8_t relayChannel = 0;
    bool enabled = true;
    uint32_t durationMs = NitrousConfig::Defaults::PURGE_DURATION_MS;
    RelayStatus fuseStatus = RelayStatus::UNKNOWN;
    bool active = false;
    uint32_t activatedMs = 0;
};

/**
 * @brief Live vehicle signals plus staging-interrupt bookkeeping
 */
struct InputState {
    bool transBrakeActive = false;
    bool clutchActive = false;
    int8_t shifterGear = GEAR_NONE;
    bool throttlePedaling = false;

    bool stagingInterruptEnabled = true;
    uint32_t lastInterruptMs = 0;
    uint32_t interruptCount = 0;
    // Release edge seen while the staging interrupt was disabled,
    // consumed by the next control loop tick
    bool releaseLatched = false;
};

/**
 * @brief Edge events visible to one evaluation pass
 */
struct TriggerEvents {
    bool transBrakeReleased = false;
    bool gearSelected = false;
};

/**
 * @brief Active Set entry for one stage
 */
struct StageRuntime {
    bool active = false;
    uint32_t startMs = 0;
    bool pending = false;            // Triggered, waiting for startDelayMs
    uint32_t triggeredMs = 0;
    uint32_t activationSeq = 0;      // Incremented on every activation
    uint32_t consumedPrevSeq = 0;    // Previous stage activation already cascaded from
};

/**
 * @brief Active Set entry for one timer
 */
struct TimerRuntime {
    bool active = false;
    uint32_t startMs = 0;
};

/**
 * @brief One optional field of a sparse configuration update
 */
template<typename T>
struct ConfigField {
    bool present = false;
    T value{};

    void set(const T& v) {
        value = v;
        present = true;
    }

    void applyTo(T& target) const {
        if (present) {
            target = value;
        }
    }
};

// Omitted fields keep their previous value
struct StageConfigUpdate {
    ConfigField<bool> enabled;
    ConfigField<StageMode> mode;
    ConfigField<uint32_t> activationTimeMs;
    ConfigField<TimerBehavior> timerBehavior;
    ConfigField<StartTrigger> startTrigger;
    ConfigField<uint32_t> startDelayMs;
    ConfigField<uint8_t> relayChannel;
    ConfigField<uint16_t> shotSizeHp;
    ConfigField<bool> holdOnPedal;
};

struct TimerConfigUpdate {
    ConfigField<bool> enabled;
    ConfigField<uint32_t> durationMs;
    ConfigField<StartTrigger> startTrigger;
};

struct PurgeConfigUpdate {
    ConfigField<bool> enabled;
    ConfigField<uint32_t> durationMs;
    ConfigField<uint8_t> relayChannel;
};

struct RelayConfigUpdate {
    ConfigField<float> maxAmp;
    ConfigField<bool> isSplitSystem;
};

/**
 * @brief Fixed layout chosen at construction
 */
struct ControllerConfig {
    uint8_t numStages = 3;    // 2..6
    uint8_t numTimers = 5;    // 2..10
    bool stagingInterruptEnabled = true;
};

const char* stageModeToString(StageMode mode);
const char* timerBehaviorToString(TimerBehavior behavior);
const char* relayStatusToString(RelayStatus status);
const char* triggerTypeToString(StartTrigger::Type type);
