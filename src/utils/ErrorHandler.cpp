// src/utils/ErrorHandler.cpp
#include "ErrorHandler.h"
#include "LoggingMacros.h"

void ErrorHandler::logError(const char* tag, SystemError error, const char* context) {
    if (context) {
        LOG_ERROR(tag, "%s: %s (code: %lu)", context, errorToString(error),
                  static_cast<unsigned long>(error));
    } else {
        LOG_ERROR(tag, "Error: %s (code: %lu)", errorToString(error),
                  static_cast<unsigned long>(error));
    }
}

const Result<void>& ErrorHandler::logIfError(const char* tag, const Result<void>& result,
                                             const char* context) {
    if (result.isError()) {
        if (result.message().empty()) {
            logError(tag, result.error(), context);
        } else if (context) {
            LOG_WARN(tag, "%s: %s - %s", context, errorToString(result.error()),
                     result.message().c_str());
        } else {
            LOG_WARN(tag, "%s - %s", errorToString(result.error()), result.message().c_str());
        }
    }
    return result;
}
