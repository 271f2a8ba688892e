/**
 * @file MockTime.h
 * @brief Host-side clock for native tests
 *
 * The control core never reads a clock itself. Tests keep one shared
 * millisecond counter and pass millis() into every time-dependent call.
 */

#ifndef MOCK_TIME_H
#define MOCK_TIME_H

#include <cstdint>

extern uint32_t g_mockMillis;

inline uint32_t millis() {
    return g_mockMillis;
}

inline void setMockMillis(uint32_t time) {
    g_mockMillis = time;
}

inline void advanceMockMillis(uint32_t delta) {
    g_mockMillis += delta;
}

/**
 * @brief Advance the clock in control-loop steps, ticking the engine each step
 * @param engine Anything with tick(uint32_t)
 * @param durationMs Total time to advance
 * @param periodMs Step size (the control loop period)
 */
template<typename Engine>
void advanceWithTicks(Engine& engine, uint32_t durationMs, uint32_t periodMs = 10) {
    uint32_t advanced = 0;
    while (advanced < durationMs) {
        uint32_t step = (durationMs - advanced < periodMs) ? durationMs - advanced : periodMs;
        advanceMockMillis(step);
        advanced += step;
        engine.tick(millis());
    }
}

#endif // MOCK_TIME_H
