#ifndef UTILS_H
#define UTILS_H

#include <cstdint>

// Namespace for utility functions
namespace Utils {

    /**
     * @brief Calculate elapsed time between two millis() samples
     *
     * millis() overflows after ~49.7 days (2^32 milliseconds).
     * Unsigned subtraction (now - start) handles the wrap correctly.
     *
     * @param now Current time captured from millis()
     * @param startTime The start time captured from millis()
     * @return Elapsed time in milliseconds
     */
    inline uint32_t elapsedMs(uint32_t now, uint32_t startTime) {
        return now - startTime;
    }

    /**
     * @brief Check if a timeout has elapsed since start time (wrap-safe)
     */
    inline bool hasTimedOut(uint32_t now, uint32_t startTime, uint32_t timeoutMs) {
        return elapsedMs(now, startTime) >= timeoutMs;
    }

    /**
     * @brief Time left until a window closes, 0 once it has elapsed
     */
    inline uint32_t remainingMs(uint32_t now, uint32_t startTime, uint32_t windowMs) {
        uint32_t elapsed = elapsedMs(now, startTime);
        return elapsed >= windowMs ? 0 : windowMs - elapsed;
    }

}

#endif // UTILS_H
