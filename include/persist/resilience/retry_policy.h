#pragma once

#include <persist/config/retry_config.h>
#include <persist/core/caller_info.h>
#include <persist/core/types.h>
#include <persist/resilience/retry_observer.h>
#include <persist/resilience/transient_error_detector.h>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <type_traits>

namespace persist::resilience {

namespace detail {
template <typename T> struct AwaitableValue;

template <typename T, typename Executor>
struct AwaitableValue<boost::asio::awaitable<T, Executor>> {
    using type = T;
};
} // namespace detail

/// Result<R> produced by an operation returning awaitable<Result<R>>
template <typename Func>
using OperationResult = typename detail::AwaitableValue<std::invoke_result_t<Func&>>::type;

/**
 * @brief Retries transient storage failures with exponential backoff
 *
 * Built only from a validated RetryConfiguration. An operation runs at most
 * maxAttempts times; when retries are disabled or maxAttempts is 0 it runs once.
 * The wait before attempt n (n >= 2) is min(maxDelay, initialDelay * multiplier^(n-2)),
 * so the first retry waits initialDelay. Waits are asynchronous timers on the
 * caller's executor. After the last attempt the original error is returned as-is.
 *
 * Cancellation through the stop token is checked before every attempt and aborts
 * a pending wait; it yields ErrorCode::OperationCancelled.
 */
class RetryPolicy {
public:
    /**
     * @brief Validate config and build a policy
     *
     * A null observer installs LoggingRetryObserver.
     */
    static Result<RetryPolicy> create(config::RetryConfiguration config,
                                      std::shared_ptr<IRetryObserver> observer = nullptr);

    [[nodiscard]] const config::RetryConfiguration& configuration() const { return config_; }

    /// Number of attempts execute() will make for a persistently transient fault
    [[nodiscard]] int attemptLimit() const {
        return (config_.enabled && config_.maxAttempts > 0) ? config_.maxAttempts : 1;
    }

    /// Wait before attempt (1-based); zero for the first attempt
    [[nodiscard]] std::chrono::milliseconds computeDelay(int attempt) const;

    /**
     * @brief Run operation until it succeeds, fails non-transiently or runs out of attempts
     *
     * operation is invoked once per attempt and must return awaitable<Result<R>>.
     */
    template <typename Func>
    boost::asio::awaitable<OperationResult<Func>>
    execute(Func operation, std::stop_token token = {}, CallerInfo caller = {}) const {
        auto executor = co_await boost::asio::this_coro::executor;
        const int limit = attemptLimit();
        const auto started = std::chrono::steady_clock::now();

        for (int attempt = 1;; ++attempt) {
            if (token.stop_requested()) {
                co_return Error{ErrorCode::OperationCancelled,
                                "Operation cancelled before attempt " + std::to_string(attempt)};
            }

            auto result = co_await operation();
            if (result.has_value()) {
                if (attempt > 1) {
                    notify(executor, &IRetryObserver::onRecovered,
                           makeEvent(attempt, started, Error{}, "recovered", caller));
                }
                co_return std::move(result);
            }

            auto verdict = TransientErrorDetector::classify(result.error());
            if (!verdict.transient) {
                notify(executor, &IRetryObserver::onNonTransient,
                       makeEvent(attempt, started, result.error(), std::move(verdict.description),
                                 caller));
                co_return std::move(result);
            }
            if (attempt >= limit) {
                if (limit > 1) {
                    notify(executor, &IRetryObserver::onExhausted,
                           makeEvent(attempt, started, result.error(),
                                     std::move(verdict.description), caller));
                }
                co_return std::move(result);
            }

            auto event = makeEvent(attempt, started, result.error(),
                                   std::move(verdict.description), caller);
            event.delay = computeDelay(attempt + 1);
            const auto delay = event.delay;
            notify(executor, &IRetryObserver::onRetry, std::move(event));

            if (!co_await sleep(delay, token)) {
                co_return Error{ErrorCode::OperationCancelled,
                                "Operation cancelled while waiting to retry"};
            }
        }
    }

private:
    using Notification = void (IRetryObserver::*)(const RetryEvent&);

    RetryPolicy(config::RetryConfiguration config, std::shared_ptr<IRetryObserver> observer);

    RetryEvent makeEvent(int attempt, std::chrono::steady_clock::time_point started, Error error,
                         std::string reason, const CallerInfo& caller) const;

    /// Post to the observer without waiting for it
    void notify(const boost::asio::any_io_executor& executor, Notification notification,
                RetryEvent event) const;

    /// false when the token fired before the delay elapsed
    static boost::asio::awaitable<bool> sleep(std::chrono::milliseconds delay,
                                              std::stop_token token);

    config::RetryConfiguration config_;
    std::shared_ptr<IRetryObserver> observer_;
};

} // namespace persist::resilience
