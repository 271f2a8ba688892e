// src/modules/nitrous/StatusJson.cpp
#include "modules/nitrous/StatusJson.h"
#include "LoggingMacros.h"

static const char* TAG = "StatusJson";

void StatusJson::toJson(const StatusSnapshot& snapshot, JsonDocument& doc) {
    doc["timestamp"] = snapshot.timestampMs;

    // Stages
    JsonObject stages = doc["stages"].to<JsonObject>();
    stages["total"] = snapshot.numStages;
    JsonArray activeStages = stages["active"].to<JsonArray>();
    for (uint8_t i = 0; i < snapshot.activeStageCount; i++) {
        activeStages.add(snapshot.activeStages[i]);
    }
    JsonArray stageConfig = stages["config"].to<JsonArray>();
    for (uint8_t i = 0; i < snapshot.numStages; i++) {
        const StageStatus& s = snapshot.stages[i];
        JsonObject obj = stageConfig.add<JsonObject>();
        obj["stage"] = s.stageNumber;
        obj["name"] = s.name;
        obj["enabled"] = s.enabled;
        obj["mode"] = stageModeToString(s.mode);
        obj["active"] = s.active;
        obj["pending"] = s.pending;
        obj["timer_behavior"] = timerBehaviorToString(s.timerBehavior);
        obj["start_trigger"] = triggerTypeToString(s.startTrigger.type);
        if (s.startTrigger.type == StartTrigger::Type::SHIFTER_INPUT) {
            obj["shifter_gear"] = s.startTrigger.gear;
        }
        obj["relay_channel"] = s.relayChannel;
        obj["shot_size_hp"] = s.shotSizeHp;
        obj["hold_on_pedal"] = s.holdOnPedal;
        obj["elapsed_ms"] = s.elapsedMs;
        obj["remaining_ms"] = s.remainingMs;
    }

    // Timers
    JsonObject timers = doc["timers"].to<JsonObject>();
    timers["total"] = snapshot.numTimers;
    JsonArray activeTimers = timers["active"].to<JsonArray>();
    for (uint8_t i = 0; i < snapshot.activeTimerCount; i++) {
        activeTimers.add(snapshot.activeTimers[i]);
    }
    JsonArray timerConfig = timers["config"].to<JsonArray>();
    for (uint8_t i = 0; i < snapshot.numTimers; i++) {
        const TimerStatus& t = snapshot.timers[i];
        JsonObject obj = timerConfig.add<JsonObject>();
        obj["timer"] = t.timerId;
        obj["name"] = t.name;
        obj["enabled"] = t.enabled;
        obj["active"] = t.active;
        obj["duration_ms"] = t.durationMs;
        obj["remaining_ms"] = t.remainingMs;
    }

    JsonArray relays = doc["relays"].to<JsonArray>();
    for (const Relay& r : snapshot.relays) {
        JsonObject obj = relays.add<JsonObject>();
        obj["id"] = r.relayId;
        obj["name"] = r.name;
        obj["channel"] = r.channel;
        obj["status"] = relayStatusToString(r.status);
        obj["fuse_status"] = relayStatusToString(r.fuseStatus);
        obj["current_amp"] = r.currentAmp;
        obj["max_amp"] = r.maxAmp;
        obj["split"] = r.isSplitSystem;
        obj["energized"] = r.energized;
        obj["over_current"] = r.overCurrent;
    }

    JsonArray purges = doc["purges"].to<JsonArray>();
    for (const PurgeStatus& p : snapshot.purges) {
        JsonObject obj = purges.add<JsonObject>();
        obj["id"] = p.purgeId;
        obj["name"] = p.name;
        obj["enabled"] = p.enabled;
        obj["relay_channel"] = p.relayChannel;
        obj["fuse_status"] = relayStatusToString(p.fuseStatus);
        obj["active"] = p.active;
        obj["duration_ms"] = p.durationMs;
        obj["elapsed_ms"] = p.elapsedMs;
    }

    JsonObject inputs = doc["inputs"].to<JsonObject>();
    inputs["trans_brake"] = snapshot.inputs.transBrakeActive;
    inputs["clutch"] = snapshot.inputs.clutchActive;
    if (snapshot.inputs.shifterGear == GEAR_NONE) {
        inputs["shifter_gear"] = nullptr;
    } else {
        inputs["shifter_gear"] = snapshot.inputs.shifterGear;
    }
    inputs["throttle_pedaling"] = snapshot.inputs.throttlePedaling;

    JsonObject interrupt = doc["staging_interrupt"].to<JsonObject>();
    interrupt["enabled"] = snapshot.inputs.stagingInterruptEnabled;
    interrupt["last_interrupt"] = snapshot.inputs.lastInterruptMs;
    interrupt["count"] = snapshot.inputs.interruptCount;

    JsonObject loop = doc["loop"].to<JsonObject>();
    loop["ticks"] = snapshot.tickCount;
    loop["failures"] = snapshot.tickFailures;
}

size_t StatusJson::serialize(const StatusSnapshot& snapshot, char* buffer, size_t size) {
    JsonDocument doc;  // ArduinoJson v7
    toJson(snapshot, doc);

    if (measureJson(doc) >= size) {
        LOG_WARN(TAG, "Status document needs %u bytes, buffer has %u",
                 (unsigned)measureJson(doc), (unsigned)size);
        return 0;
    }
    return serializeJson(doc, buffer, size);
}
