// src/modules/nitrous/StatusJson.h
#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include "modules/nitrous/StatusSnapshot.h"

/**
 * @brief Renders a StatusSnapshot as the status document read by UI collaborators
 *
 * Top-level keys: stages, timers, relays, purges, inputs, staging_interrupt, loop.
 */
class StatusJson {
public:
    static void toJson(const StatusSnapshot& snapshot, JsonDocument& doc);

    /**
     * @brief Serialize straight into a caller buffer
     * @return Bytes written, 0 if the buffer was too small
     */
    static size_t serialize(const StatusSnapshot& snapshot, char* buffer, size_t size);
};
