#pragma once

#include <persist/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace persist {

/**
 * @brief A single SQL value as it crosses the storage boundary
 *
 * Booleans travel as 0/1 integers and timestamps as ISO-8601 text.
 */
using Value = std::variant<std::nullptr_t, int64_t, double, std::string, ByteVector>;

/**
 * @brief Format a time point as UTC ISO-8601 text with millisecond precision
 *
 * The output ("2025-01-31T08:15:00.250Z") is accepted by SQLite's datetime().
 */
std::string formatTimestamp(TimePoint tp);

/**
 * @brief Parse the text produced by formatTimestamp or by SQLite's datetime()
 */
Result<TimePoint> parseTimestamp(const std::string& text);

/**
 * @brief Render a value for logs and entity keys (strings unquoted, null as "NULL")
 */
std::string toDisplayString(const Value& value);

inline bool isNull(const Value& value) {
    return std::holds_alternative<std::nullptr_t>(value);
}

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
template <typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

/**
 * @brief Conversion between member types and Value
 *
 * Specialized for every member type a mapped entity may declare.
 */
template <typename T> struct ValueTraits;

template <> struct ValueTraits<int64_t> {
    static Value toValue(int64_t v) { return v; }
    static Result<int64_t> fromValue(const Value& v) {
        if (auto* i = std::get_if<int64_t>(&v))
            return *i;
        if (auto* d = std::get_if<double>(&v))
            return static_cast<int64_t>(*d);
        return Error{ErrorCode::SerializationError, "Expected integer value"};
    }
};

template <> struct ValueTraits<int> {
    static Value toValue(int v) { return static_cast<int64_t>(v); }
    static Result<int> fromValue(const Value& v) {
        auto r = ValueTraits<int64_t>::fromValue(v);
        if (!r)
            return r.error();
        return static_cast<int>(r.value());
    }
};

template <> struct ValueTraits<bool> {
    static Value toValue(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    static Result<bool> fromValue(const Value& v) {
        auto r = ValueTraits<int64_t>::fromValue(v);
        if (!r)
            return Error{ErrorCode::SerializationError, "Expected boolean (0/1) value"};
        return r.value() != 0;
    }
};

template <> struct ValueTraits<double> {
    static Value toValue(double v) { return v; }
    static Result<double> fromValue(const Value& v) {
        if (auto* d = std::get_if<double>(&v))
            return *d;
        if (auto* i = std::get_if<int64_t>(&v))
            return static_cast<double>(*i);
        return Error{ErrorCode::SerializationError, "Expected real value"};
    }
};

template <> struct ValueTraits<std::string> {
    static Value toValue(const std::string& v) { return v; }
    static Result<std::string> fromValue(const Value& v) {
        if (auto* s = std::get_if<std::string>(&v))
            return *s;
        if (auto* i = std::get_if<int64_t>(&v))
            return std::to_string(*i);
        if (auto* d = std::get_if<double>(&v))
            return std::to_string(*d);
        return Error{ErrorCode::SerializationError, "Expected text value"};
    }
};

template <> struct ValueTraits<TimePoint> {
    static Value toValue(TimePoint v) { return formatTimestamp(v); }
    static Result<TimePoint> fromValue(const Value& v) {
        if (auto* s = std::get_if<std::string>(&v))
            return parseTimestamp(*s);
        return Error{ErrorCode::SerializationError, "Expected ISO-8601 timestamp text"};
    }
};

template <> struct ValueTraits<ByteVector> {
    static Value toValue(const ByteVector& v) { return v; }
    static Result<ByteVector> fromValue(const Value& v) {
        if (auto* b = std::get_if<ByteVector>(&v))
            return *b;
        if (isNull(v))
            return ByteVector{};
        return Error{ErrorCode::SerializationError, "Expected blob value"};
    }
};

template <typename T> struct ValueTraits<std::optional<T>> {
    static Value toValue(const std::optional<T>& v) {
        if (!v)
            return nullptr;
        return ValueTraits<T>::toValue(*v);
    }
    static Result<std::optional<T>> fromValue(const Value& v) {
        if (isNull(v))
            return std::optional<T>{};
        auto r = ValueTraits<T>::fromValue(v);
        if (!r)
            return r.error();
        return std::optional<T>{std::move(r).value()};
    }
};

/**
 * @brief Convert a literal written by a caller into a Value
 */
template <typename T> Value toValue(const T& v) {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, Value>) {
        return v;
    } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
        return nullptr;
    } else if constexpr (std::is_constructible_v<std::string, const U&> &&
                         !std::is_arithmetic_v<U>) {
        return std::string(v);
    } else if constexpr (std::is_same_v<U, bool>) {
        return ValueTraits<bool>::toValue(v);
    } else if constexpr (std::is_integral_v<U>) {
        return static_cast<int64_t>(v);
    } else if constexpr (std::is_floating_point_v<U>) {
        return static_cast<double>(v);
    } else {
        return ValueTraits<U>::toValue(v);
    }
}

} // namespace persist
