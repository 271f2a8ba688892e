// include/LoggingMacros.h
#ifndef LOGGING_MACROS_H
#define LOGGING_MACROS_H

#define LOGGING_MACROS_INCLUDED 1

// Logger library front-end: LOG_ERROR/WARN/INFO/DEBUG/VERBOSE(tag, fmt, ...)
#include <LogInterface.h>

#ifdef LOG_NO_CUSTOM_LOGGER
    #ifdef USE_CUSTOM_LOGGER
        #undef USE_CUSTOM_LOGGER
    #endif
#endif

// Release builds keep ERROR/WARN/INFO only. The control loop runs at 100 Hz,
// so per-tick DEBUG output must never reach a release image.
#ifdef LOG_MODE_RELEASE
    #undef LOG_DEBUG
    #undef LOG_VERBOSE
    #define LOG_DEBUG(tag, fmt, ...) ((void)0)
    #define LOG_VERBOSE(tag, fmt, ...) ((void)0)
#endif

#ifdef LOG_MODE_DEBUG_SELECTIVE
    #undef LOG_VERBOSE
    #define LOG_VERBOSE(tag, fmt, ...) ((void)0)
#endif

// Stage/timer/relay transitions share one format so logs can be grepped by entity
#define LOG_TRANSITION(tag, entity, id, from, to) \
    LOG_DEBUG(tag, "%s %u: %s -> %s", entity, static_cast<unsigned>(id), from, to)

#endif // LOGGING_MACROS_H
