#include <persist/resilience/retry_observer.h>

#include <spdlog/spdlog.h>

namespace persist::resilience {

void LoggingRetryObserver::onRetry(const RetryEvent& event) {
    spdlog::warn("[RetryPolicy] attempt {}/{} failed ({}: {}); retrying in {}ms [{}] at {}",
                 event.attempt, event.maxAttempts, event.error.code, event.error.message,
                 event.delay.count(), event.reason, event.caller);
}

void LoggingRetryObserver::onRecovered(const RetryEvent& event) {
    spdlog::info("[RetryPolicy] succeeded on attempt {} after {}ms at {}", event.attempt,
                 event.elapsed.count(), event.caller);
}

void LoggingRetryObserver::onExhausted(const RetryEvent& event) {
    spdlog::error("[RetryPolicy] giving up after {} attempts in {}ms: {} ({}) [{}] at {}",
                  event.attempt, event.elapsed.count(), event.error.message, event.error.code,
                  event.reason, event.caller);
}

void LoggingRetryObserver::onNonTransient(const RetryEvent& event) {
    spdlog::debug("[RetryPolicy] non-transient failure on attempt {}: {} ({}) [{}] at {}",
                  event.attempt, event.error.message, event.error.code, event.reason,
                  event.caller);
}

} // namespace persist::resilience
