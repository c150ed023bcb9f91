#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace persist {

// Type aliases
using ByteVector = std::vector<std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidState,
    DatabaseError,
    ConstraintViolation,
    NotFound,
    NotSupported,
    Timeout,
    OperationCancelled,
    ResourceExhausted,
    ValidationError,
    MappingError,
    UnsupportedExpression,
    ConcurrencyConflict,
    EntityNotFound,
    EntityAlreadyExists,
    SerializationError,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::ConstraintViolation: return "Constraint violation";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::MappingError: return "Mapping error";
        case ErrorCode::UnsupportedExpression: return "Unsupported expression";
        case ErrorCode::ConcurrencyConflict: return "Concurrency conflict";
        case ErrorCode::EntityNotFound: return "Entity not found";
        case ErrorCode::EntityAlreadyExists: return "Entity already exists";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Version mismatch details attached to a ConcurrencyConflict error
 *
 * currentVersion is empty when the row disappeared before it could be re-read.
 */
struct ConflictDetail {
    std::string entityKey;
    std::optional<int64_t> currentVersion;
    int64_t expectedVersion = 0;
};

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    int nativeCode = 0; ///< Extended SQLite result code, 0 when not a storage error
    std::string entityKey;
    std::optional<ConflictDetail> conflict;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
    Error(ErrorCode c, std::string msg, int native)
        : code(c), message(std::move(msg)), nativeCode(native) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

Error makeConcurrencyConflict(std::string entityKey, std::optional<int64_t> currentVersion,
                              int64_t expectedVersion);
Error makeEntityNotFound(std::string entityKey);
Error makeEntityAlreadyExists(std::string entityKey);
Error makeMappingError(std::string message);
Error makeUnsupportedExpression(std::string nodeKind, std::string detail = {});

// Simple Result type for operations that can fail (compatible with pre-C++23)
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace persist

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<persist::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(persist::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", persist::errorToString(error));
    }
};
