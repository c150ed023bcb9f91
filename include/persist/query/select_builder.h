#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace persist::query {

/**
 * @brief Pieces of a SELECT, assembled in fixed clause order
 *
 * WHERE conditions are joined with AND in the order given.
 */
struct QuerySpec {
    std::string table;
    std::vector<std::string> columns; // empty => "*"
    std::vector<std::string> conditions;
    std::optional<std::string> orderBy; // without the ORDER BY keyword
    std::optional<int64_t> limit;  // LIMIT 0 is emitted as given
    std::optional<int64_t> offset; // omitted when 0
};

std::string buildSelect(const QuerySpec& spec);

/// SELECT COUNT(*) over the same FROM and WHERE; ordering and paging are ignored
std::string buildCount(const QuerySpec& spec);

} // namespace persist::query
