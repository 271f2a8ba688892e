// include/modules/nitrous/StatusPublisher.h
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include "config/SystemConstants.h"
#include "modules/nitrous/StatusSnapshot.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Receiver of the per-tick status snapshot
 *
 * Called from the control task after the controller lock has been released.
 * Implementations must return quickly; the next tick waits for them.
 */
class IStatusObserver {
public:
    virtual ~IStatusObserver() = default;

    /**
     * @brief Deliver one snapshot
     * @return false if the observer could not handle it (counted and logged)
     */
    virtual bool onStatus(const StatusSnapshot& snapshot) = 0;

    virtual const char* getName() const { return "observer"; }
};

/**
 * @brief Bounded observer list with failure isolation
 *
 * The list has its own mutex so registration never contends with the
 * controller lock. publish() copies the list and delivers outside the mutex.
 * An observer must stay alive until it is unregistered and the control task
 * has been stopped.
 */
class StatusPublisher {
public:
    StatusPublisher();
    ~StatusPublisher();

    StatusPublisher(const StatusPublisher&) = delete;
    StatusPublisher& operator=(const StatusPublisher&) = delete;

    bool initialize();

    /**
     * @brief Add an observer
     * @return INVALID_PARAMETER for nullptr, CONFIG_CONFLICT if already
     *         registered, INVALID_STATE when the list is full
     */
    Result<void> registerObserver(IStatusObserver* observer);

    /**
     * @return false if the observer was not registered
     */
    bool unregisterObserver(IStatusObserver* observer);

    /**
     * @brief Deliver a snapshot to every registered observer
     * @return Number of observers that accepted it
     */
    uint8_t publish(const StatusSnapshot& snapshot);

    uint8_t getObserverCount() const;
    uint32_t getFailureCount() const { return failureCount_.load(); }

private:
    SemaphoreHandle_t mutex_;
    std::array<IStatusObserver*, SystemConstants::Status::MAX_OBSERVERS> observers_;
    uint8_t observerCount_;

    std::atomic<uint32_t> failureCount_;

    static const char* TAG;
};
