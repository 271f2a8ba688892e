// src/modules/nitrous/StatusPublisher.cpp
#include "modules/nitrous/StatusPublisher.h"
#include "LoggingMacros.h"
#include <MutexGuard.h>

const char* StatusPublisher::TAG = "StatusPub";

StatusPublisher::StatusPublisher()
    : mutex_(nullptr),
      observers_{},
      observerCount_(0),
      failureCount_(0) {
}

StatusPublisher::~StatusPublisher() {
    if (mutex_ != nullptr) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

bool StatusPublisher::initialize() {
    if (mutex_ != nullptr) {
        return true;
    }
    mutex_ = xSemaphoreCreateMutex();
    if (mutex_ == nullptr) {
        ErrorHandler::logError(TAG, SystemError::MUTEX_CREATE_FAILED, "observer list");
        return false;
    }
    return true;
}

Result<void> StatusPublisher::registerObserver(IStatusObserver* observer) {
    if (observer == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "null observer");
    }

    MutexGuard guard(mutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_DEFAULT_TIMEOUT_MS));
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "registerObserver: mutex timeout");
        return Result<void>(SystemError::MUTEX_TIMEOUT, "observer list busy");
    }

    for (uint8_t i = 0; i < observerCount_; i++) {
        if (observers_[i] == observer) {
            return Result<void>(SystemError::CONFIG_CONFLICT, "observer already registered");
        }
    }
    if (observerCount_ >= observers_.size()) {
        LOG_WARN(TAG, "Observer list full (%u)", observerCount_);
        return Result<void>(SystemError::INVALID_STATE, "observer list full");
    }

    observers_[observerCount_++] = observer;
    LOG_INFO(TAG, "Registered %s (%u/%u)", observer->getName(), observerCount_,
             SystemConstants::Status::MAX_OBSERVERS);
    return Result<void>();
}

bool StatusPublisher::unregisterObserver(IStatusObserver* observer) {
    MutexGuard guard(mutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_DEFAULT_TIMEOUT_MS));
    if (!guard.hasLock()) {
        LOG_WARN(TAG, "unregisterObserver: mutex timeout");
        return false;
    }

    for (uint8_t i = 0; i < observerCount_; i++) {
        if (observers_[i] == observer) {
            // Keep registration order for the remaining observers
            for (uint8_t j = i + 1; j < observerCount_; j++) {
                observers_[j - 1] = observers_[j];
            }
            observers_[--observerCount_] = nullptr;
            LOG_INFO(TAG, "Unregistered %s", observer->getName());
            return true;
        }
    }
    return false;
}

uint8_t StatusPublisher::publish(const StatusSnapshot& snapshot) {
    std::array<IStatusObserver*, SystemConstants::Status::MAX_OBSERVERS> targets = {};
    uint8_t count = 0;

    {
        MutexGuard guard(mutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_SHORT_TIMEOUT_MS));
        if (!guard.hasLock()) {
            LOG_DEBUG(TAG, "publish: observer list busy, skipping this tick");
            return 0;
        }
        targets = observers_;
        count = observerCount_;
    }

    uint8_t delivered = 0;
    for (uint8_t i = 0; i < count; i++) {
        if (targets[i]->onStatus(snapshot)) {
            delivered++;
            continue;
        }

        uint32_t failures = ++failureCount_;
        if (failures == 1 ||
            failures % SystemConstants::Status::OBSERVER_FAILURE_LOG_INTERVAL == 0) {
            LOG_WARN(TAG, "%s rejected status (failure #%lu)", targets[i]->getName(),
                     (unsigned long)failures);
        }
    }
    return delivered;
}

uint8_t StatusPublisher::getObserverCount() const {
    MutexGuard guard(mutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_SHORT_TIMEOUT_MS));
    if (!guard.hasLock()) {
        return 0;
    }
    return observerCount_;
}
