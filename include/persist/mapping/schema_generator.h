#pragma once

#include <persist/mapping/mapping_descriptor.h>
#include <persist/mapping/sql_dialect.h>

#include <string>
#include <vector>

namespace persist::mapping {

/// Placeholder bound to the version the caller read before writing
inline constexpr const char* kExpectedVersionParam = "@expectedVersion";

/**
 * @brief Parameterized statement texts for one mapped type
 *
 * Placeholders are named after columns ("@Name"); see parameterName().
 * Every WHERE clause starts with the primary key.
 */
struct DmlTemplates {
    std::string insert;      ///< Auto-increment keys excluded
    std::string update;      ///< Non-key columns, Version = Version + 1, version check
    std::string deleteByKey; ///< Physical delete with version check
    std::string softDelete;  ///< IsDeleted = 1 with version check; empty without soft delete
    std::string revive;      ///< Rewrites a soft-deleted row in place; empty without soft delete
    std::string selectByKey; ///< All columns, no lifecycle filters
    std::string versionByKey;
    std::string count; ///< SELECT COUNT(*) FROM table
    std::string selectColumns;
};

std::string parameterName(const ColumnDescriptor& column);

/// "key1 = @key1 AND key2 = @key2"
std::string keyPredicate(const MappingDescriptor& descriptor,
                         const SqlDialect& dialect = sqliteDialect());

/// "IsDeleted = 0"; empty when the type has no soft-delete column
std::string softDeleteFilter(const MappingDescriptor& descriptor,
                             const SqlDialect& dialect = sqliteDialect());

/// Rows without expiration or expiring in the future; empty without expiry
std::string expiryFilter(const MappingDescriptor& descriptor,
                         const SqlDialect& dialect = sqliteDialect());

std::string generateCreateTableSql(const MappingDescriptor& descriptor,
                                   const SqlDialect& dialect = sqliteDialect());

std::vector<std::string> generateCreateIndexSql(const MappingDescriptor& descriptor,
                                                const SqlDialect& dialect = sqliteDialect());

DmlTemplates generateDmlTemplates(const MappingDescriptor& descriptor,
                                  const SqlDialect& dialect = sqliteDialect());

} // namespace persist::mapping
