#pragma once

#include <persist/core/caller_info.h>
#include <persist/core/types.h>

#include <chrono>
#include <string>

namespace persist::resilience {

/**
 * @brief One retry-related event, delivered to an IRetryObserver
 */
struct RetryEvent {
    int attempt = 0;     ///< Attempt that just finished (1-based)
    int maxAttempts = 0; ///< Total attempts the policy allows
    std::chrono::milliseconds delay{0};   ///< Wait before the next attempt; zero when none follows
    std::chrono::milliseconds elapsed{0}; ///< Time since the first attempt started
    Error error;                          ///< Failure of this attempt; Success when it recovered
    std::string reason;                   ///< Classifier description
    CallerInfo caller;
};

/**
 * @brief Observability side channel of the retry policy
 *
 * Notifications are posted to the executor and never awaited; an observer
 * cannot influence whether or when an operation is retried. Implementations
 * must be thread-safe.
 */
class IRetryObserver {
public:
    virtual ~IRetryObserver() = default;

    /// A transient failure will be retried after event.delay
    virtual void onRetry(const RetryEvent& event) = 0;

    /// The operation succeeded after at least one retry
    virtual void onRecovered(const RetryEvent& event) = 0;

    /// The last allowed attempt failed transiently; event.error is surfaced to the caller
    virtual void onExhausted(const RetryEvent& event) = 0;

    /// A non-transient failure ended the operation without retrying
    virtual void onNonTransient(const RetryEvent& event) = 0;
};

/**
 * @brief Default observer: writes each event through spdlog
 */
class LoggingRetryObserver final : public IRetryObserver {
public:
    void onRetry(const RetryEvent& event) override;
    void onRecovered(const RetryEvent& event) override;
    void onExhausted(const RetryEvent& event) override;
    void onNonTransient(const RetryEvent& event) override;
};

} // namespace persist::resilience
