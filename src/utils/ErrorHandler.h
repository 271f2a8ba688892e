// src/utils/ErrorHandler.h
#ifndef ERROR_HANDLER_H
#define ERROR_HANDLER_H

#include <cstdint>
#include <string>

/**
 * @brief Error Return Type Conventions
 *
 * Use Result<void> for:
 * - Request/response calls exposed to collaborators (configuration updates,
 *   manual stage/timer activation, controller lifecycle)
 * - Operations that need to communicate WHY they failed
 *
 * Use bool for:
 * - Predicates and checks (isStageActive, isRunning, ...)
 * - Signal setters and purge calls where the reason is logged internally
 *
 * No call terminates the firmware: periodic work logs and continues,
 * request/response calls return an error.
 */

/**
 * @brief Unified error codes for the system
 */
enum class SystemError : uint32_t {
    SUCCESS = 0,

    // General errors (1-99)
    UNKNOWN_ERROR = 1,
    INVALID_PARAMETER = 2,      // unknown stage/timer/purge id or relay channel
    INVALID_STATE = 7,          // operation not allowed in the current state

    // Mutex/Thread errors (100-199)
    MUTEX_CREATE_FAILED = 100,
    MUTEX_TIMEOUT = 101,
    TASK_CREATE_FAILED = 110,
    TASK_STOP_TIMEOUT = 111,

    // Relay errors (600-699)
    RELAY_OPERATION_FAILED = 600,
    RELAY_FAULT = 603,
    RELAY_BLOWN_FUSE = 605,

    // Configuration errors (800-899)
    CONFIG_INVALID = 800,
    CONFIG_CONFLICT = 803       // e.g. relay channel already bound elsewhere
};

/**
 * @brief Application Result type for error handling
 */
template<typename T>
class Result {
private:
    bool success_;
    T value_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    explicit Result(const T& value)
        : success_(true), value_(value), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), value_{}, error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    const T& value() const { return value_; }
    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

// Specialization for void
template<>
class Result<void> {
private:
    bool success_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    Result() : success_(true), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

/**
 * @brief Error handler utility class
 */
class ErrorHandler {
public:
    /**
     * @brief Convert error code to string
     */
    static const char* errorToString(SystemError error) {
        switch (error) {
            case SystemError::SUCCESS: return "Success";
            case SystemError::UNKNOWN_ERROR: return "Unknown error";
            case SystemError::INVALID_PARAMETER: return "Invalid parameter";
            case SystemError::INVALID_STATE: return "Invalid state";

            case SystemError::MUTEX_CREATE_FAILED: return "Mutex creation failed";
            case SystemError::MUTEX_TIMEOUT: return "Mutex timeout";
            case SystemError::TASK_CREATE_FAILED: return "Task creation failed";
            case SystemError::TASK_STOP_TIMEOUT: return "Task stop timeout";

            case SystemError::RELAY_OPERATION_FAILED: return "Relay operation failed";
            case SystemError::RELAY_FAULT: return "Relay fault";
            case SystemError::RELAY_BLOWN_FUSE: return "Relay fuse blown";

            case SystemError::CONFIG_INVALID: return "Config invalid";
            case SystemError::CONFIG_CONFLICT: return "Config conflict";

            default: return "Unknown error code";
        }
    }

    /**
     * @brief Log error with context
     */
    static void logError(const char* tag, SystemError error, const char* context = nullptr);

    /**
     * @brief Log a failed Result<void> and pass it through
     */
    static const Result<void>& logIfError(const char* tag, const Result<void>& result,
                                          const char* context = nullptr);
};

#endif // ERROR_HANDLER_H
