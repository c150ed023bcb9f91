#pragma once

#include <persist/core/types.h>

#include <string>
#include <string_view>

namespace persist::resilience {

/**
 * @brief Outcome of classifying one failure
 */
struct Classification {
    bool transient = false;
    std::string description; ///< Human-readable reason, used in retry logs
};

/**
 * @brief Decides which storage failures are worth retrying
 *
 * Transient: busy/locked contention, I/O errors, files that cannot be opened right
 * now, lock protocol errors, command timeouts and pool exhaustion, plus messages
 * naming a lock, sharing violation, timeout or network condition. Constraint,
 * syntax and type mismatch failures are not, and neither is any error that
 * already carries a domain meaning (conflicts, not-found, mapping, cancellation).
 */
class TransientErrorDetector {
public:
    static Classification classify(const Error& error);

    static bool isTransient(const Error& error) { return classify(error).transient; }

    /// Extended or primary SQLite result code alone
    static bool isTransientResultCode(int extendedCode);

    /// Case-insensitive scan of the message for known transient phrases
    static bool hasTransientMessage(std::string_view message);
};

} // namespace persist::resilience
