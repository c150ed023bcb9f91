#include <persist/mapping/sql_dialect.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

namespace persist::mapping {

namespace {

// SQLite keywords that cannot be used as bare identifiers, upper-case and sorted
constexpr std::string_view kReservedWords[] = {
    "ABORT", "ACTION", "ADD", "AFTER", "ALL", "ALTER", "ANALYZE", "AND", "AS", "ASC", "ATTACH",
    "AUTOINCREMENT", "BEFORE", "BEGIN", "BETWEEN", "BY", "CASCADE", "CASE", "CAST", "CHECK",
    "COLLATE", "COLUMN", "COMMIT", "CONFLICT", "CONSTRAINT", "CREATE", "CROSS", "CURRENT",
    "DATABASE", "DEFAULT", "DEFERRABLE", "DEFERRED", "DELETE", "DESC", "DETACH", "DISTINCT", "DO",
    "DROP", "EACH", "ELSE", "END", "ESCAPE", "EXCEPT", "EXCLUSIVE", "EXISTS", "EXPLAIN", "FAIL",
    "FOR", "FOREIGN", "FROM", "FULL", "GLOB", "GROUP", "HAVING", "IF", "IGNORE", "IMMEDIATE", "IN",
    "INDEX", "INITIALLY", "INNER", "INSERT", "INSTEAD", "INTERSECT", "INTO", "IS", "ISNULL", "JOIN",
    "KEY", "LEFT", "LIKE", "LIMIT", "MATCH", "NATURAL", "NO", "NOT", "NOTNULL", "NULL", "OF",
    "OFFSET", "ON", "OR", "ORDER", "OUTER", "PLAN", "PRAGMA", "PRIMARY", "QUERY", "RAISE",
    "RECURSIVE", "REFERENCES", "REGEXP", "REINDEX", "RELEASE", "RENAME", "REPLACE", "RESTRICT",
    "RIGHT", "ROLLBACK", "ROW", "SAVEPOINT", "SELECT", "SET", "TABLE", "TEMP", "TEMPORARY", "THEN",
    "TO", "TRANSACTION", "TRIGGER", "UNION", "UNIQUE", "UPDATE", "USING", "VACUUM", "VALUES",
    "VIEW", "VIRTUAL", "WHEN", "WHERE", "WINDOW", "WITH", "WITHOUT",
};

bool isPlainIdentifier(std::string_view name) {
    if (name.empty())
        return false;
    const auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_')
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

} // namespace

bool SqliteDialect::isReservedWord(std::string_view word) {
    std::string upper(word);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return std::binary_search(std::begin(kReservedWords), std::end(kReservedWords),
                              std::string_view(upper));
}

std::string SqliteDialect::quoteIdentifier(std::string_view name) const {
    if (isPlainIdentifier(name) && !isReservedWord(name))
        return std::string(name);

    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string SqliteDialect::typeName(const ColumnDescriptor& column) const {
    switch (column.type) {
        case ColumnType::Integer:
        case ColumnType::Boolean:
            return "INTEGER";
        case ColumnType::Real:
            return "REAL";
        case ColumnType::Blob:
            return "BLOB";
        case ColumnType::Numeric:
            if (column.precision)
                return fmt::format("NUMERIC({},{})", *column.precision, column.scale.value_or(0));
            return "NUMERIC";
        case ColumnType::Text:
        case ColumnType::DateTime:
            return "TEXT";
    }
    return "TEXT";
}

std::string SqliteDialect::comparableColumn(const ColumnDescriptor& column) const {
    auto name = quoteIdentifier(column.columnName);
    if (column.type == ColumnType::DateTime)
        return "datetime(" + name + ")";
    return name;
}

std::string SqliteDialect::comparableParameter(std::string_view placeholder,
                                               ColumnType type) const {
    if (type == ColumnType::DateTime)
        return fmt::format("datetime({})", placeholder);
    return std::string(placeholder);
}

std::string SqliteDialect::autoIncrementKey(const ColumnDescriptor& column) const {
    return quoteIdentifier(column.columnName) + " INTEGER PRIMARY KEY AUTOINCREMENT";
}

const SqlDialect& sqliteDialect() {
    static const SqliteDialect dialect;
    return dialect;
}

} // namespace persist::mapping
