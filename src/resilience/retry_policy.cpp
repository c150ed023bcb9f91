#include <persist/resilience/retry_policy.h>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace persist::resilience {

Result<RetryPolicy> RetryPolicy::create(config::RetryConfiguration config,
                                        std::shared_ptr<IRetryObserver> observer) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    if (!observer)
        observer = std::make_shared<LoggingRetryObserver>();
    return RetryPolicy(std::move(config), std::move(observer));
}

RetryPolicy::RetryPolicy(config::RetryConfiguration config,
                         std::shared_ptr<IRetryObserver> observer)
    : config_(std::move(config)), observer_(std::move(observer)) {}

std::chrono::milliseconds RetryPolicy::computeDelay(int attempt) const {
    if (attempt <= 1)
        return std::chrono::milliseconds(0);
    const double base = static_cast<double>(config_.initialDelay.count());
    const double scaled = base * std::pow(config_.backoffMultiplier, attempt - 2);
    const double capped = std::min(scaled, static_cast<double>(config_.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

RetryEvent RetryPolicy::makeEvent(int attempt, std::chrono::steady_clock::time_point started,
                                  Error error, std::string reason,
                                  const CallerInfo& caller) const {
    RetryEvent event;
    event.attempt = attempt;
    event.maxAttempts = attemptLimit();
    event.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    event.error = std::move(error);
    event.reason = std::move(reason);
    event.caller = caller;
    return event;
}

void RetryPolicy::notify(const boost::asio::any_io_executor& executor, Notification notification,
                         RetryEvent event) const {
    boost::asio::post(executor, [observer = observer_, notification, event = std::move(event)] {
        try {
            ((*observer).*notification)(event);
        } catch (const std::exception& e) {
            spdlog::warn("[RetryPolicy] retry observer threw: {}", e.what());
        }
    });
}

boost::asio::awaitable<bool> RetryPolicy::sleep(std::chrono::milliseconds delay,
                                                std::stop_token token) {
    auto executor = co_await boost::asio::this_coro::executor;
    auto timer = std::make_shared<boost::asio::steady_timer>(executor, delay);

    // Timers are not thread-safe; cancel from the timer's own executor
    std::stop_callback onStop(token, [timer] {
        boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
    });

    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return !token.stop_requested();
}

} // namespace persist::resilience
