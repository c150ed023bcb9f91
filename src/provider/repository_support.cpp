#include <persist/core/result_helpers.hpp>
#include <persist/mapping/schema_generator.h>
#include <persist/mapping/sql_dialect.h>
#include <persist/provider/repository_support.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <string_view>

namespace persist::provider {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

const char* toString(ImportStrategy strategy) {
    switch (strategy) {
        case ImportStrategy::Upsert: return "Upsert";
        case ImportStrategy::Skip: return "Skip";
        case ImportStrategy::Fail: return "Fail";
    }
    return "Unknown";
}

const char* toString(TransactionState state) {
    switch (state) {
        case TransactionState::Active: return "Active";
        case TransactionState::Committing: return "Committing";
        case TransactionState::Committed: return "Committed";
        case TransactionState::RollingBack: return "RollingBack";
        case TransactionState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string nextTransactionId() {
    static std::atomic<uint64_t> counter{0};
    return fmt::format("tx-{}", ++counter);
}

Result<query::Predicate> keyEquals(const mapping::MappingDescriptor& descriptor,
                                   const mapping::KeyValues& key) {
    const auto& indices = descriptor.keyIndices();
    if (key.size() != indices.size()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("'{}' key has {} columns, got {} values",
                                 descriptor.entityName(), indices.size(), key.size())};
    }
    query::Predicate predicate;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (isNull(key[i])) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("'{}' key value {} is null", descriptor.entityName(), i)};
        }
        predicate =
            predicate && (query::field(descriptor.columns()[indices[i]].fieldName) == key[i]);
    }
    return predicate;
}

bool isUnassignedKey(const mapping::MappingDescriptor& descriptor, const mapping::KeyValues& key) {
    if (!descriptor.hasAutoIncrementKey() || key.size() != 1)
        return false;
    if (isNull(key.front()))
        return true;
    const auto* id = std::get_if<int64_t>(&key.front());
    return id && *id == 0;
}

bool isDuplicateKey(const Error& error) {
    return error.code == ErrorCode::ConstraintViolation &&
           (error.nativeCode == SQLITE_CONSTRAINT_PRIMARYKEY ||
            error.nativeCode == SQLITE_CONSTRAINT_UNIQUE);
}

Result<void> createSchema(storage::Database& db, const mapping::MappingDescriptor& descriptor) {
    PERSIST_TRY_UNWRAP(existed, db.tableExists(descriptor.tableName()));
    PERSIST_TRY(db.execute(mapping::generateCreateTableSql(descriptor)));
    for (const auto& sql : mapping::generateCreateIndexSql(descriptor)) {
        PERSIST_TRY(db.execute(sql));
    }
    spdlog::debug("[Repository] schema ready for table '{}' ({})", descriptor.tableName(),
                  existed ? "existing" : "created");
    return {};
}

Result<void> applyDatabasePragmas(storage::Database& db,
                                  const config::SqliteConfiguration& config) {
    for (const auto& [name, value] : config.databasePragmas()) {
        PERSIST_TRY(db.pragma(name, value));
    }
    // In-memory and some VFS databases silently keep another journal mode
    PERSIST_TRY_UNWRAP(journal, db.pragmaValue("journal_mode"));
    const std::string requested = config::toString(config.journalMode);
    if (!equalsIgnoreCase(journal, requested)) {
        spdlog::warn("[Repository] journal_mode {} requested for '{}', database uses {}",
                     requested, config.dbFile, journal);
    }
    return {};
}

Result<std::optional<command::CommandContext>>
buildPurgeCommand(const mapping::MappingDescriptor& descriptor, const PurgeOptions& options,
                  std::chrono::milliseconds timeout) {
    const auto& dialect = mapping::sqliteDialect();
    if (options.batchSize == 0) {
        return Error{ErrorCode::InvalidArgument, "Purge batch size must be positive"};
    }

    std::vector<std::string> reasons;
    if (options.purgeDeleted) {
        if (const auto* deleted = descriptor.roleColumn(mapping::ColumnRole::SoftDelete))
            reasons.push_back(dialect.quoteIdentifier(deleted->columnName) + " = 1");
    }
    if (options.purgeExpired) {
        if (const auto* expiry = descriptor.roleColumn(mapping::ColumnRole::Expiration)) {
            reasons.push_back(fmt::format("({} IS NOT NULL AND {} <= {})",
                                          dialect.quoteIdentifier(expiry->columnName),
                                          dialect.comparableColumn(*expiry),
                                          dialect.currentTimestamp()));
        }
    }
    if (reasons.empty())
        return std::optional<command::CommandContext>{};

    std::string where = "(" + reasons.front();
    for (size_t i = 1; i < reasons.size(); ++i)
        where += " OR " + reasons[i];
    where += ")";

    query::Parameters params;
    if (options.olderThan) {
        const auto* lastWrite = descriptor.roleColumn(mapping::ColumnRole::LastWriteTime);
        if (!lastWrite) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("'{}' has no LastWriteTime column; cannot purge by age",
                                     descriptor.entityName())};
        }
        where += fmt::format(" AND {} < {}", dialect.comparableColumn(*lastWrite),
                             dialect.comparableParameter("@olderThan", lastWrite->type));
        params.emplace_back("@olderThan", formatTimestamp(*options.olderThan));
    }

    const auto table = dialect.quoteIdentifier(descriptor.tableName());
    auto sql =
        fmt::format("DELETE FROM {} WHERE rowid IN (SELECT rowid FROM {} WHERE {} LIMIT {})",
                    table, table, where, options.batchSize);
    return std::optional<command::CommandContext>(
        command::CommandContext(command::CommandKind::Delete, std::move(sql), std::move(params),
                                {}, std::nullopt, timeout));
}

} // namespace persist::provider
