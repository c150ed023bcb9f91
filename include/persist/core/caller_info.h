#pragma once

#include <source_location>
#include <string>

namespace persist {

/**
 * @brief Call site of a repository operation, recorded in logs and audit rows
 *
 * Build it with CallerInfo::current() at the call site; a default-constructed
 * value means "unknown".
 */
struct CallerInfo {
    std::string file;
    std::string member;
    int line = 0;
    std::string userId; ///< Optional; copied into audit records

    static CallerInfo current(std::source_location loc = std::source_location::current()) {
        return CallerInfo{loc.file_name(), loc.function_name(), static_cast<int>(loc.line()), {}};
    }

    [[nodiscard]] bool empty() const { return file.empty() && member.empty() && line == 0; }
};

} // namespace persist

#include <fmt/format.h>
template <> struct fmt::formatter<persist::CallerInfo> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const persist::CallerInfo& caller, FormatContext& ctx) const {
        if (caller.empty())
            return fmt::format_to(ctx.out(), "<unknown>");
        return fmt::format_to(ctx.out(), "{}:{} ({})", caller.file, caller.line, caller.member);
    }
};
