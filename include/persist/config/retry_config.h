#pragma once

#include <persist/core/types.h>

#include <chrono>

namespace persist::config {

/**
 * @brief Retry settings for transient storage failures
 *
 * Defaults: enabled, 3 attempts, 100ms initial delay, 5000ms cap, multiplier 2.0.
 */
struct RetryConfiguration {
    bool enabled = true;
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{100};
    std::chrono::milliseconds maxDelay{5000};
    double backoffMultiplier = 2.0;

    /**
     * @brief Check the invariants; returns ValidationError naming the first bad field
     */
    [[nodiscard]] Result<void> validate() const;

    static RetryConfiguration defaults() { return {}; }

    static RetryConfiguration noRetry() {
        RetryConfiguration c;
        c.enabled = false;
        c.maxAttempts = 0;
        return c;
    }

    /// Longer waits for database files on network shares
    static RetryConfiguration forNetworkStorage() {
        RetryConfiguration c;
        c.maxAttempts = 5;
        c.initialDelay = std::chrono::milliseconds(500);
        c.maxDelay = std::chrono::milliseconds(10000);
        c.backoffMultiplier = 2.0;
        return c;
    }

    /// Many short retries for heavily contended local databases
    static RetryConfiguration forHighContention() {
        RetryConfiguration c;
        c.maxAttempts = 10;
        c.initialDelay = std::chrono::milliseconds(50);
        c.maxDelay = std::chrono::milliseconds(2000);
        c.backoffMultiplier = 1.5;
        return c;
    }

    bool operator==(const RetryConfiguration&) const = default;
};

} // namespace persist::config
