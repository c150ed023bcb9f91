#include <persist/resilience/transient_error_detector.h>

#include <sqlite3.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace persist::resilience {

namespace {

constexpr std::string_view kTransientPhrases[] = {
    "database is locked",
    "database table is locked",
    "database is temporarily locked",
    "unable to open database",
    "cannot open database file",
    "disk i/o error",
    "unable to acquire",
    "deadlock",
    "connection was closed",
    "connection reset",
    "network error",
    "network path",
    "network name",
    "network unreachable",
    "no more connections",
    "timeout expired",
    "timed out",
    "semaphore timeout",
    "being used by another process",
    "sharing violation",
    "lock violation",
    "temporarily unavailable",
    "insufficient system resources",
    "broken pipe",
    "pipe is being closed",
    "pipe has been ended",
    "bad file descriptor",
    "interrupted system call",
    "cannot operate on a closed",
};

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* describeResultCode(int extendedCode) {
    switch (extendedCode) {
        case SQLITE_BUSY_RECOVERY: return "another connection is recovering the WAL";
        case SQLITE_BUSY_SNAPSHOT: return "read snapshot is stale";
        case SQLITE_BUSY_TIMEOUT: return "busy timeout exceeded";
        case SQLITE_LOCKED_SHAREDCACHE: return "shared cache lock conflict";
        default: break;
    }
    switch (extendedCode & 0xFF) {
        case SQLITE_BUSY: return "database is busy";
        case SQLITE_LOCKED: return "table is locked";
        case SQLITE_IOERR: return "I/O error";
        case SQLITE_CANTOPEN: return "database file temporarily inaccessible";
        case SQLITE_PROTOCOL: return "lock protocol error";
        default: return nullptr;
    }
}

// Errors that already carry a domain outcome are never retried at transport level
bool isDomainOutcome(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConstraintViolation:
        case ErrorCode::ConcurrencyConflict:
        case ErrorCode::EntityNotFound:
        case ErrorCode::EntityAlreadyExists:
        case ErrorCode::NotFound:
        case ErrorCode::MappingError:
        case ErrorCode::UnsupportedExpression:
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidState:
        case ErrorCode::NotSupported:
        case ErrorCode::SerializationError:
        case ErrorCode::OperationCancelled:
            return true;
        default:
            return false;
    }
}

} // namespace

bool TransientErrorDetector::isTransientResultCode(int extendedCode) {
    return describeResultCode(extendedCode) != nullptr;
}

bool TransientErrorDetector::hasTransientMessage(std::string_view message) {
    const auto text = lower(message);
    return std::any_of(std::begin(kTransientPhrases), std::end(kTransientPhrases),
                       [&](std::string_view phrase) {
                           return text.find(phrase) != std::string::npos;
                       });
}

Classification TransientErrorDetector::classify(const Error& error) {
    if (error.code == ErrorCode::Success)
        return {false, "no error"};
    if (isDomainOutcome(error.code)) {
        return {false, fmt::format("{}: not a transport failure", error.code)};
    }
    if (error.code == ErrorCode::Timeout)
        return {true, "command timed out"};
    if (error.code == ErrorCode::ResourceExhausted)
        return {true, "no pooled connection available"};

    if (error.nativeCode != 0) {
        if (const char* reason = describeResultCode(error.nativeCode)) {
            return {true, fmt::format("SQLite {} ({})", error.nativeCode, reason)};
        }
        if ((error.nativeCode & 0xFF) == SQLITE_CORRUPT) {
            const auto text = lower(error.message);
            if (text.find("malformed") != std::string::npos ||
                text.find("network") != std::string::npos) {
                return {true, "corruption reported over a network share"};
            }
            return {false, "database corruption"};
        }
    }

    if (hasTransientMessage(error.message))
        return {true, "transient error pattern in message"};
    return {false, error.nativeCode != 0 ? fmt::format("SQLite {}", error.nativeCode)
                                         : std::string("not a known transient failure")};
}

} // namespace persist::resilience
