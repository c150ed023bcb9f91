#include <persist/query/select_builder.h>

#include <numeric>
#include <string_view>

namespace persist::query {

namespace {

std::string joinWithSeparator(const std::vector<std::string>& items, std::string_view separator) {
    if (items.empty()) {
        return {};
    }

    const auto totalChars =
        std::accumulate(items.begin(), items.end(), static_cast<std::size_t>(0),
                        [](std::size_t sum, const std::string& part) { return sum + part.size(); });

    std::string joined;
    joined.reserve(totalChars + separator.size() * (items.size() - 1));
    joined.append(items.front());
    for (std::size_t idx = 1; idx < items.size(); ++idx) {
        joined.append(separator);
        joined.append(items[idx]);
    }
    return joined;
}

void appendWhere(std::string& sql, const std::vector<std::string>& conditions) {
    std::vector<std::string> nonEmpty;
    for (const auto& c : conditions) {
        if (!c.empty())
            nonEmpty.push_back(c);
    }
    if (!nonEmpty.empty()) {
        sql += " WHERE ";
        sql += joinWithSeparator(nonEmpty, " AND ");
    }
}

void appendLimitOffset(std::string& sql, const std::optional<int64_t>& limit,
                       const std::optional<int64_t>& offset) {
    const bool hasOffset = offset && *offset > 0;
    if (limit) {
        sql += " LIMIT ";
        sql += std::to_string(*limit);
    } else if (hasOffset) {
        // SQLite only accepts OFFSET after a LIMIT
        sql += " LIMIT -1";
    }
    if (hasOffset) {
        sql += " OFFSET ";
        sql += std::to_string(*offset);
    }
}

} // namespace

std::string buildSelect(const QuerySpec& spec) {
    const std::string cols =
        spec.columns.empty() ? std::string{"*"} : joinWithSeparator(spec.columns, ", ");
    std::string sql;
    sql.reserve(64 + cols.size() + spec.table.size());
    sql += "SELECT ";
    sql += cols;
    sql += " FROM ";
    sql += spec.table;

    appendWhere(sql, spec.conditions);
    if (spec.orderBy && !spec.orderBy->empty()) {
        sql += " ORDER BY ";
        sql += *spec.orderBy;
    }
    appendLimitOffset(sql, spec.limit, spec.offset);
    return sql;
}

std::string buildCount(const QuerySpec& spec) {
    std::string sql = "SELECT COUNT(*) FROM " + spec.table;
    appendWhere(sql, spec.conditions);
    return sql;
}

} // namespace persist::query
