#include <persist/mapping/schema_generator.h>

#include <fmt/format.h>

#include <cctype>
#include <sstream>

namespace persist::mapping {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string columnDefinition(const ColumnDescriptor& col, bool inlineKey,
                             const SqlDialect& dialect) {
    if (inlineKey)
        return dialect.autoIncrementKey(col);

    std::string sql = dialect.quoteIdentifier(col.columnName) + " " + dialect.typeName(col);
    if (!col.nullable)
        sql += " NOT NULL";
    if (col.unique && !col.isKey())
        sql += " UNIQUE";
    if (col.defaultValue)
        sql += " DEFAULT " + *col.defaultValue;
    return sql;
}

std::vector<std::string> quotedColumns(const std::vector<std::string>& names,
                                       const SqlDialect& dialect) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& name : names)
        out.push_back(dialect.quoteIdentifier(name));
    return out;
}

std::string assignment(const ColumnDescriptor& col, const SqlDialect& dialect) {
    return dialect.quoteIdentifier(col.columnName) + " = " + parameterName(col);
}

std::string versionClause(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    const auto* version = descriptor.roleColumn(ColumnRole::Version);
    if (!version)
        return {};
    return fmt::format(" AND {} = {}", dialect.quoteIdentifier(version->columnName),
                       kExpectedVersionParam);
}

std::string versionIncrement(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    const auto* version = descriptor.roleColumn(ColumnRole::Version);
    if (!version)
        return {};
    auto name = dialect.quoteIdentifier(version->columnName);
    return name + " = " + name + " + 1";
}

} // namespace

std::string parameterName(const ColumnDescriptor& column) {
    std::string name = "@";
    for (char c : column.columnName) {
        const auto uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '_') ? c : '_';
    }
    return name;
}

std::string keyPredicate(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    std::vector<std::string> parts;
    for (size_t index : descriptor.keyIndices())
        parts.push_back(assignment(descriptor.columns()[index], dialect));
    return join(parts, " AND ");
}

std::string softDeleteFilter(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    const auto* col = descriptor.roleColumn(ColumnRole::SoftDelete);
    if (!col)
        return {};
    return dialect.quoteIdentifier(col->columnName) + " = 0";
}

std::string expiryFilter(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    const auto* col = descriptor.roleColumn(ColumnRole::Expiration);
    if (!col)
        return {};
    return fmt::format("({} IS NULL OR {} > {})", dialect.quoteIdentifier(col->columnName),
                       dialect.comparableColumn(*col), dialect.currentTimestamp());
}

std::string generateCreateTableSql(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    const bool inlineKey = descriptor.hasAutoIncrementKey();

    std::vector<std::string> definitions;
    for (const auto& col : descriptor.columns())
        definitions.push_back(columnDefinition(col, inlineKey && col.isKey(), dialect));

    if (!inlineKey) {
        std::vector<std::string> keys;
        for (size_t index : descriptor.keyIndices())
            keys.push_back(dialect.quoteIdentifier(descriptor.columns()[index].columnName));
        definitions.push_back("PRIMARY KEY (" + join(keys, ", ") + ")");
    }

    for (const auto& check : descriptor.checks()) {
        definitions.push_back(fmt::format("CONSTRAINT {} CHECK ({})",
                                          dialect.quoteIdentifier(check.name), check.expression));
    }

    for (const auto& fk : descriptor.foreignKeys()) {
        std::string sql = fmt::format(
            "CONSTRAINT {} FOREIGN KEY ({}) REFERENCES {} ({})", dialect.quoteIdentifier(fk.name),
            join(quotedColumns(fk.columns, dialect), ", "),
            dialect.quoteIdentifier(fk.referencedTable),
            join(quotedColumns(fk.referencedColumns, dialect), ", "));
        if (fk.onDelete != ForeignKeyAction::NoAction)
            sql += std::string(" ON DELETE ") + toString(fk.onDelete);
        if (fk.onUpdate != ForeignKeyAction::NoAction)
            sql += std::string(" ON UPDATE ") + toString(fk.onUpdate);
        definitions.push_back(std::move(sql));
    }

    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << dialect.quoteIdentifier(descriptor.tableName())
        << " (\n";
    for (size_t i = 0; i < definitions.size(); ++i) {
        sql << "    " << definitions[i];
        if (i + 1 < definitions.size())
            sql << ",";
        sql << "\n";
    }
    sql << ");";
    return sql.str();
}

std::vector<std::string> generateCreateIndexSql(const MappingDescriptor& descriptor,
                                                const SqlDialect& dialect) {
    std::vector<std::string> statements;
    for (const auto& index : descriptor.indexes()) {
        std::vector<std::string> columns;
        for (const auto& ic : index.columns) {
            const auto* col = descriptor.findByField(ic.fieldName);
            std::string name = dialect.quoteIdentifier(col ? col->columnName : ic.fieldName);
            if (ic.descending)
                name += " DESC";
            columns.push_back(std::move(name));
        }
        std::string sql = fmt::format("CREATE {}INDEX IF NOT EXISTS {} ON {} ({})",
                                      index.unique ? "UNIQUE " : "",
                                      dialect.quoteIdentifier(index.name),
                                      dialect.quoteIdentifier(descriptor.tableName()),
                                      join(columns, ", "));
        if (index.where)
            sql += " WHERE " + *index.where;
        sql += ";";
        statements.push_back(std::move(sql));
    }
    return statements;
}

DmlTemplates generateDmlTemplates(const MappingDescriptor& descriptor, const SqlDialect& dialect) {
    DmlTemplates t;
    const auto table = dialect.quoteIdentifier(descriptor.tableName());
    const auto key = keyPredicate(descriptor, dialect);
    const auto notDeleted = softDeleteFilter(descriptor, dialect);
    const auto liveOnly = notDeleted.empty() ? std::string{} : " AND " + notDeleted;

    std::vector<std::string> all;
    std::vector<std::string> insertColumns;
    std::vector<std::string> insertParams;
    std::vector<std::string> updateSet;
    std::vector<std::string> reviveSet;
    for (const auto& col : descriptor.columns()) {
        all.push_back(dialect.quoteIdentifier(col.columnName));
        if (!(col.isKey() && col.autoIncrement)) {
            insertColumns.push_back(dialect.quoteIdentifier(col.columnName));
            insertParams.push_back(parameterName(col));
        }
        if (col.isKey() || col.role == ColumnRole::Version)
            continue;
        if (col.role == ColumnRole::SoftDelete) {
            reviveSet.push_back(dialect.quoteIdentifier(col.columnName) + " = 0");
            continue;
        }
        reviveSet.push_back(assignment(col, dialect));
        if (col.role != ColumnRole::CreatedTime)
            updateSet.push_back(assignment(col, dialect));
    }
    if (auto inc = versionIncrement(descriptor, dialect); !inc.empty()) {
        updateSet.push_back(inc);
        reviveSet.push_back(inc);
    }

    t.selectColumns = join(all, ", ");
    t.insert = fmt::format("INSERT INTO {} ({}) VALUES ({})", table, join(insertColumns, ", "),
                           join(insertParams, ", "));
    t.update = fmt::format("UPDATE {} SET {} WHERE {}{}{}", table, join(updateSet, ", "), key,
                           versionClause(descriptor, dialect), liveOnly);
    t.deleteByKey =
        fmt::format("DELETE FROM {} WHERE {}{}", table, key, versionClause(descriptor, dialect));

    if (const auto* deleted = descriptor.roleColumn(ColumnRole::SoftDelete)) {
        std::vector<std::string> set{dialect.quoteIdentifier(deleted->columnName) + " = 1"};
        if (auto inc = versionIncrement(descriptor, dialect); !inc.empty())
            set.push_back(inc);
        if (const auto* lw = descriptor.roleColumn(ColumnRole::LastWriteTime))
            set.push_back(assignment(*lw, dialect));
        t.softDelete = fmt::format("UPDATE {} SET {} WHERE {}{}{}", table, join(set, ", "), key,
                                   versionClause(descriptor, dialect), liveOnly);
        t.revive = fmt::format("UPDATE {} SET {} WHERE {} AND {} = 1", table,
                               join(reviveSet, ", "), key,
                               dialect.quoteIdentifier(deleted->columnName));
    }

    t.selectByKey = fmt::format("SELECT {} FROM {} WHERE {}", t.selectColumns, table, key);

    const auto* version = descriptor.roleColumn(ColumnRole::Version);
    const auto* deleted = descriptor.roleColumn(ColumnRole::SoftDelete);
    t.versionByKey = fmt::format(
        "SELECT {}, {} FROM {} WHERE {}",
        version ? dialect.quoteIdentifier(version->columnName) : std::string("NULL"),
        deleted ? dialect.quoteIdentifier(deleted->columnName) : std::string("0"), table, key);

    t.count = "SELECT COUNT(*) FROM " + table;
    return t;
}

} // namespace persist::mapping
