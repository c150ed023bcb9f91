#pragma once

#include <persist/mapping/column.h>

#include <string>
#include <string_view>

namespace persist::mapping {

/**
 * @brief Storage-specific pieces of generated SQL
 */
class SqlDialect {
public:
    virtual ~SqlDialect() = default;

    /// Identifier as it must appear in SQL (quoted when reserved or not a plain name)
    [[nodiscard]] virtual std::string quoteIdentifier(std::string_view name) const = 0;

    [[nodiscard]] virtual std::string typeName(const ColumnDescriptor& column) const = 0;

    /// Column reference inside a comparison; DateTime columns may need conversion
    [[nodiscard]] virtual std::string comparableColumn(const ColumnDescriptor& column) const = 0;

    /// Placeholder reference inside a comparison against a column of the given type
    [[nodiscard]] virtual std::string comparableParameter(std::string_view placeholder,
                                                          ColumnType type) const = 0;

    [[nodiscard]] virtual std::string currentTimestamp() const = 0;

    [[nodiscard]] virtual std::string autoIncrementKey(const ColumnDescriptor& column) const = 0;
};

/**
 * @brief SQLite rules: double-quoted identifiers, ISO-8601 text compared via datetime()
 */
class SqliteDialect final : public SqlDialect {
public:
    std::string quoteIdentifier(std::string_view name) const override;
    std::string typeName(const ColumnDescriptor& column) const override;
    std::string comparableColumn(const ColumnDescriptor& column) const override;
    std::string comparableParameter(std::string_view placeholder, ColumnType type) const override;
    std::string currentTimestamp() const override { return "datetime('now')"; }
    std::string autoIncrementKey(const ColumnDescriptor& column) const override;

    static bool isReservedWord(std::string_view word);
};

const SqlDialect& sqliteDialect();

} // namespace persist::mapping
