#pragma once

#include <persist/core/value.h>

#include <optional>
#include <string>
#include <vector>

namespace persist::mapping {

/**
 * @brief Logical column type, independent of the storage dialect
 */
enum class ColumnType {
    Integer,
    Real,
    Text,
    Blob,
    Numeric,
    Boolean, ///< Stored as 1/0
    DateTime ///< Stored as ISO-8601 text
};

const char* toString(ColumnType type);

/**
 * @brief Special meaning a column carries for the write path
 */
enum class ColumnRole {
    None,
    Version,       ///< Optimistic concurrency counter
    CreatedTime,   ///< Set once on create
    LastWriteTime, ///< Refreshed on every write
    SoftDelete,    ///< IsDeleted flag
    Expiration     ///< AbsoluteExpiration timestamp
};

enum class ForeignKeyAction { NoAction, Cascade, SetNull, SetDefault, Restrict };

const char* toString(ForeignKeyAction action);

struct ColumnDescriptor {
    std::string fieldName;  ///< Name used in predicates and registration
    std::string columnName; ///< Physical column name
    ColumnType type = ColumnType::Text;
    bool nullable = false;
    std::optional<int> size;
    std::optional<int> precision;
    std::optional<int> scale;
    std::optional<std::string> defaultValue; ///< SQL expression, emitted verbatim
    bool autoIncrement = false;
    bool unique = false;
    int keyOrder = -1; ///< Position inside the primary key, -1 when not a key column
    ColumnRole role = ColumnRole::None;
    bool backed = true; ///< False for flag columns with no entity member

    [[nodiscard]] bool isKey() const { return keyOrder >= 0; }
};

struct IndexColumn {
    std::string fieldName;
    bool descending = false;
};

struct IndexDescriptor {
    std::string name;
    std::vector<IndexColumn> columns; ///< Declared order
    bool unique = false;
    std::optional<std::string> where; ///< Partial-index predicate, emitted verbatim
};

struct ForeignKeyDescriptor {
    std::string name;
    std::vector<std::string> columns; ///< Physical columns in this table
    std::string referencedTable;
    std::vector<std::string> referencedColumns;
    ForeignKeyAction onDelete = ForeignKeyAction::NoAction;
    ForeignKeyAction onUpdate = ForeignKeyAction::NoAction;
};

struct CheckConstraint {
    std::string name;
    std::string expression;
};

} // namespace persist::mapping
