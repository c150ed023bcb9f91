#include <persist/core/value.h>

#include <fmt/format.h>

#include <cstdio>
#include <ctime>

namespace persist {

std::string formatTimestamp(TimePoint tp) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms / 1000);
    auto millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

Result<TimePoint> parseTimestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep,
                        &hour, &minute, &second, &consumed);
    if (n != 7 || (sep != 'T' && sep != ' ')) {
        return Error{ErrorCode::SerializationError, "Invalid timestamp: '" + text + "'"};
    }

    int millis = 0;
    if (consumed < static_cast<int>(text.size()) && text[consumed] == '.') {
        int digits = 0;
        for (size_t i = consumed + 1; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
            if (digits < 3) {
                millis = millis * 10 + (text[i] - '0');
            }
            ++digits;
        }
        for (int d = digits; d < 3; ++d) {
            millis *= 10;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t secs = timegm(&tm);
    return TimePoint{std::chrono::seconds{secs} + std::chrono::milliseconds{millis}};
}

std::string toDisplayString(const Value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::nullptr_t>) {
                return "NULL";
            } else if constexpr (std::is_same_v<V, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<V, double>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<V, std::string>) {
                return v;
            } else {
                return fmt::format("<blob {} bytes>", v.size());
            }
        },
        value);
}

} // namespace persist
