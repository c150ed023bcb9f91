#pragma once

#include <persist/command/command_builder.h>
#include <persist/command/command_executor.h>
#include <persist/config/sqlite_config.h>
#include <persist/core/caller_info.h>
#include <persist/core/result_helpers.hpp>
#include <persist/mapping/descriptor_cache.h>
#include <persist/mapping/mapping_builder.h>
#include <persist/provider/audit_record.h>
#include <persist/provider/entry_list.h>
#include <persist/provider/export_files.h>
#include <persist/provider/operation_types.h>
#include <persist/provider/repository_support.h>
#include <persist/query/order_by.h>
#include <persist/query/predicate.h>
#include <persist/resilience/retry_policy.h>
#include <persist/storage/connection_pool.h>

#include <boost/asio/awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <vector>

namespace persist::provider {

template <mapping::MappedEntity T> class TransactionScope;

/**
 * @brief Typed persistence operations for one mapped entity type
 *
 * Every operation is a coroutine that takes its own pooled connection per attempt
 * and runs inside the retry policy; the command timeout bounds each attempt.
 * Writes run in IMMEDIATE transactions. Arguments are taken by value so callers
 * need not keep them alive across suspension.
 *
 * @code
 * auto repo = Repository<Order>::open(config).value();
 * co_await repo->initialize();
 * auto created = co_await repo->create(order, CallerInfo::current());
 * @endcode
 */
template <mapping::MappedEntity T> class Repository {
public:
    template <typename R> using Task = boost::asio::awaitable<Result<R>>;

    static Result<std::unique_ptr<Repository>>
    open(config::SqliteConfiguration config,
         std::shared_ptr<resilience::IRetryObserver> observer = nullptr) {
        PERSIST_TRY(config.validate());
        PERSIST_TRY_UNWRAP(mapping, mapping::mappingFor<T>());
        PERSIST_TRY_UNWRAP(retry,
                           resilience::RetryPolicy::create(config.retry, std::move(observer)));

        std::optional<AuditTrail> audit;
        if (mapping->descriptor().auditTrail()) {
            PERSIST_TRY_UNWRAP(trail, AuditTrail::create(commandTimeout(config)));
            audit.emplace(std::move(trail));
        }

        std::optional<EntryListStore> list;
        if (mapping->descriptor().syncWithList()) {
            PERSIST_TRY_UNWRAP(store, EntryListStore::create(commandTimeout(config)));
            list.emplace(std::move(store));
        }

        storage::ConnectionPoolConfig poolConfig;
        poolConfig.maxConnections = config.maxConnections;
        poolConfig.busyTimeout = config.busyTimeout;
        poolConfig.commandTimeout = commandTimeout(config);
        poolConfig.connectionPragmas = config.connectionPragmas();
        auto pool = std::make_shared<storage::ConnectionPool>(config.dbFile, std::move(poolConfig));

        spdlog::debug("[Repository] opened '{}' for table '{}'", config.dbFile,
                      mapping->descriptor().tableName());
        return std::unique_ptr<Repository>(new Repository(std::move(config), std::move(mapping),
                                                          std::move(retry), std::move(pool),
                                                          std::move(audit), std::move(list)));
    }

    ~Repository() { pool_->shutdown(); }

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    [[nodiscard]] const mapping::MappingDescriptor& descriptor() const {
        return mapping_->descriptor();
    }
    [[nodiscard]] const config::SqliteConfiguration& configuration() const { return config_; }
    [[nodiscard]] const resilience::RetryPolicy& retryPolicy() const { return retry_; }
    [[nodiscard]] storage::ConnectionPool::Stats poolStats() const { return pool_->getStats(); }

    /**
     * @brief Apply database PRAGMAs and create the table with its indexes
     *
     * Also creates the Audit table for types with an audit trail and the
     * EntryListMapping table for types that sync with lists.
     */
    Task<void> initialize(std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [this](storage::Database& db) -> Result<void> {
                PERSIST_TRY(applyDatabasePragmas(db, config_));
                return db.transaction([&]() -> Result<void> {
                    PERSIST_TRY(createSchema(db, descriptor()));
                    if (audit_)
                        PERSIST_TRY(audit_->ensureSchema(db));
                    if (list_)
                        PERSIST_TRY(list_->ensureSchema(db));
                    return {};
                });
            },
            token, {});
        logOutcome("initialize", "", started, result);
        co_return result;
    }

    /**
     * @brief Insert entity and return the stored row
     *
     * A live row with the same key fails with EntityAlreadyExists; a soft-deleted
     * one is revived in place with its version advanced.
     */
    Task<T> create(T entity, CallerInfo caller = {}, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        const auto key = mapping::formatKey(mapping_->key(entity));
        auto result = co_await run(
            [this, &entity, &caller](storage::Database& db) -> Result<T> {
                const auto now = std::chrono::system_clock::now();
                PERSIST_TRY_UNWRAP(written,
                                   db.transaction([&] { return createRow(db, entity, now); }));
                writeAudit(db, AuditOperation::Create, written, caller);
                return std::move(written.entity);
            },
            token, caller);
        logOutcome("create", key, started, result);
        co_return result;
    }

    /// Live row with key; nullopt when absent, soft-deleted or expired
    Task<std::optional<T>> get(mapping::KeyValues key, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        auto predicate = keyEquals(descriptor(), key);
        if (!predicate)
            co_return predicate.error();

        auto result = co_await run(
            [this, &predicate](storage::Database& db) -> Result<std::optional<T>> {
                query::SelectOptions options;
                options.limit = 1;
                PERSIST_TRY_UNWRAP(rows, selectRows(db, predicate.value(), options));
                if (rows.empty())
                    return std::optional<T>{};
                return std::optional<T>{std::move(rows.front())};
            },
            token, {});
        logOutcome("get", mapping::formatKey(key), started, result);
        co_return result;
    }

    /// Row with key, optionally even when soft-deleted or expired
    Task<std::optional<T>> getByKey(mapping::KeyValues key, bool includeDeleted = false,
                                    bool includeExpired = false, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        auto predicate = keyEquals(descriptor(), key);
        if (!predicate)
            co_return predicate.error();

        query::SelectOptions options;
        options.limit = 1;
        options.includeDeleted = includeDeleted;
        options.includeExpired = includeExpired;
        auto result = co_await run(
            [this, &predicate, &options](storage::Database& db) -> Result<std::optional<T>> {
                PERSIST_TRY_UNWRAP(rows, selectRows(db, predicate.value(), options));
                if (rows.empty())
                    return std::optional<T>{};
                return std::optional<T>{std::move(rows.front())};
            },
            token, {});
        logOutcome("getByKey", mapping::formatKey(key), started, result);
        co_return result;
    }

    /**
     * @brief Write entity if its version field still matches the stored row
     *
     * Returns the stored row with the version advanced by one. A stale version
     * fails with ConcurrencyConflict, a missing row with EntityNotFound.
     */
    Task<T> update(T entity, CallerInfo caller = {}, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        const auto key = mapping::formatKey(mapping_->key(entity));
        auto result = co_await run(
            [this, &entity, &caller](storage::Database& db) -> Result<T> {
                PERSIST_TRY_UNWRAP(written, db.transaction([&] { return updateRow(db, entity); }));
                writeAudit(db, AuditOperation::Update, written, caller);
                return std::move(written.entity);
            },
            token, caller);
        logOutcome("update", key, started, result);
        co_return result;
    }

    /// Delete (or soft delete) the row with key at expectedVersion
    Task<void> remove(mapping::KeyValues key, int64_t expectedVersion, CallerInfo caller = {},
                      std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [this, &key, expectedVersion, &caller](storage::Database& db) -> Result<void> {
                PERSIST_TRY_UNWRAP(removed, db.transaction([&] {
                    return removeRow(db, key, expectedVersion);
                }));
                writeAudit(db, AuditOperation::Delete, removed, caller);
                return {};
            },
            token, caller);
        logOutcome("remove", mapping::formatKey(key), started, result);
        co_return result;
    }

    /// Matching live rows; skip/take page through the ordered result
    Task<std::vector<T>> query(query::Predicate predicate,
                               std::optional<query::OrderSpec> order = std::nullopt,
                               std::optional<int64_t> skip = std::nullopt,
                               std::optional<int64_t> take = std::nullopt,
                               std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        query::SelectOptions options;
        options.orderBy = std::move(order);
        options.offset = skip;
        options.limit = take;
        auto result = co_await run(
            [this, &predicate, &options](storage::Database& db) {
                return selectRows(db, predicate, options);
            },
            token, {});
        logOutcome("query", "", started, result);
        co_return result;
    }

    /**
     * @brief One page of matching rows plus the total match count
     *
     * pageSize and pageNumber must be positive; pages are 1-based. Count and page
     * are read in one transaction.
     */
    Task<PagedResult<T>> queryPaged(query::Predicate predicate,
                                    std::optional<query::OrderSpec> order, int64_t pageSize,
                                    int64_t pageNumber, std::stop_token token = {}) {
        if (pageSize <= 0 || pageNumber <= 0 ||
            pageNumber - 1 > std::numeric_limits<int64_t>::max() / pageSize) {
            co_return Error{ErrorCode::InvalidArgument,
                            fmt::format("Invalid page (size {}, number {})", pageSize,
                                        pageNumber)};
        }
        const auto started = std::chrono::steady_clock::now();
        query::SelectOptions options;
        options.orderBy = std::move(order);
        options.limit = pageSize;
        options.offset = (pageNumber - 1) * pageSize;

        auto result = co_await run(
            [&](storage::Database& db) -> Result<PagedResult<T>> {
                return db.transaction(
                    [&]() -> Result<PagedResult<T>> {
                        PagedResult<T> page;
                        page.pageNumber = pageNumber;
                        page.pageSize = pageSize;
                        PERSIST_TRY_ASSIGN(page.totalCount, countRows(db, predicate));
                        PERSIST_TRY_ASSIGN(page.items, selectRows(db, predicate, options));
                        return page;
                    },
                    storage::TransactionMode::Deferred);
            },
            token, {});
        logOutcome("queryPaged", "", started, result);
        co_return result;
    }

    Task<int64_t> count(query::Predicate predicate = {}, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [this, &predicate](storage::Database& db) { return countRows(db, predicate); }, token,
            {});
        logOutcome("count", "", started, result);
        co_return result;
    }

    Task<bool> exists(query::Predicate predicate, std::stop_token token = {}) {
        auto result = co_await run(
            [this, &predicate](storage::Database& db) -> Result<bool> {
                query::SelectOptions options;
                options.limit = 1;
                PERSIST_TRY_UNWRAP(rows, selectRows(db, predicate, options));
                return !rows.empty();
            },
            token, {});
        co_return result;
    }

    Task<std::vector<T>> getAll(bool includeDeleted = false, bool includeExpired = false,
                                std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        query::SelectOptions options;
        options.includeDeleted = includeDeleted;
        options.includeExpired = includeExpired;
        auto result = co_await run(
            [this, &options](storage::Database& db) {
                return selectRows(db, query::Predicate{}, options);
            },
            token, {});
        logOutcome("getAll", "", started, result);
        co_return result;
    }

    /**
     * @brief Create entities, batchSize per transaction (0: one transaction)
     *
     * A failing batch is rolled back and its error returned; earlier batches stay
     * committed.
     */
    Task<BatchResult> createBatch(std::vector<T> entities, size_t batchSize = 0,
                                  CallerInfo caller = {}, std::stop_token token = {}) {
        co_return co_await runBatches(
            "createBatch", entities.size(), batchSize, token, caller,
            [this, &entities](storage::Database& db, size_t begin, size_t end,
                              TimePoint now) -> Result<std::vector<Written>> {
                std::vector<Written> written;
                for (size_t i = begin; i < end; ++i) {
                    PERSIST_TRY_UNWRAP(row, createRow(db, entities[i], now));
                    written.push_back(std::move(row));
                }
                return written;
            },
            AuditOperation::Create);
    }

    /// Update entities with their own expected versions, batchSize per transaction
    Task<BatchResult> updateBatch(std::vector<T> entities, size_t batchSize = 0,
                                  CallerInfo caller = {}, std::stop_token token = {}) {
        co_return co_await runBatches(
            "updateBatch", entities.size(), batchSize, token, caller,
            [this, &entities](storage::Database& db, size_t begin, size_t end,
                              TimePoint) -> Result<std::vector<Written>> {
                std::vector<Written> written;
                for (size_t i = begin; i < end; ++i) {
                    PERSIST_TRY_UNWRAP(row, updateRow(db, entities[i]));
                    written.push_back(std::move(row));
                }
                return written;
            },
            AuditOperation::Update);
    }

    /**
     * @brief Remove rows by key at their current version
     *
     * Keys that are absent or already soft-deleted are skipped; processed counts
     * the rows actually removed.
     */
    Task<BatchResult> removeBatch(std::vector<mapping::KeyValues> keys, size_t batchSize = 0,
                                  CallerInfo caller = {}, std::stop_token token = {}) {
        co_return co_await runBatches(
            "removeBatch", keys.size(), batchSize, token, caller,
            [this, &keys](storage::Database& db, size_t begin, size_t end,
                          TimePoint) -> Result<std::vector<Written>> {
                std::vector<Written> removed;
                for (size_t i = begin; i < end; ++i) {
                    PERSIST_TRY_UNWRAP(state, currentState(db, keys[i]));
                    if (!state || state->deleted)
                        continue;
                    PERSIST_TRY_UNWRAP(row, removeRow(db, keys[i], state->version.value_or(0)));
                    removed.push_back(std::move(row));
                }
                return removed;
            },
            AuditOperation::Delete);
    }

    /**
     * @brief Import entities, resolving existing keys by options.strategy
     *
     * Absent and soft-deleted keys are created. A batch whose transaction fails
     * is rolled back, counted as failed and reported in errors; later batches
     * still run. Cancellation stops the import with OperationCancelled.
     */
    Task<BulkImportResult> bulkImport(std::vector<T> entities, BulkImportOptions options = {},
                                      CallerInfo caller = {}, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        const size_t step = options.batchSize == 0 ? std::max<size_t>(entities.size(), 1)
                                                   : options.batchSize;
        BulkImportResult total;

        for (size_t begin = 0; begin < entities.size(); begin += step) {
            const size_t end = std::min(entities.size(), begin + step);
            auto tally = co_await run(
                [&](storage::Database& db) -> Result<ImportTally> {
                    const auto now = std::chrono::system_clock::now();
                    PERSIST_TRY_UNWRAP(batch, db.transaction([&] {
                        return importRange(db, entities, begin, end, options.strategy, now);
                    }));
                    for (const auto& [operation, written] : batch.audit)
                        writeAudit(db, operation, written, caller);
                    return batch;
                },
                token, caller);

            if (!tally) {
                if (tally.error().code == ErrorCode::OperationCancelled)
                    co_return tally.error();
                total.failed += end - begin;
                total.errors.push_back(fmt::format("Batch {}-{}: {}", begin, end - 1,
                                                   tally.error().message));
                spdlog::warn("[Repository] bulkImport {} batch {}-{} rolled back: {}",
                             descriptor().tableName(), begin, end - 1, tally.error().message);
                continue;
            }
            total.created += tally.value().created;
            total.updated += tally.value().updated;
            total.skipped += tally.value().skipped;
            total.failed += tally.value().failed;
            for (auto& error : tally.value().errors)
                total.errors.push_back(std::move(error));
        }

        spdlog::debug("[Repository] bulkImport {} ({}): {} created, {} updated, {} skipped, "
                      "{} failed in {}ms",
                      descriptor().tableName(), toString(options.strategy), total.created,
                      total.updated, total.skipped, total.failed, elapsedMs(started));
        co_return total;
    }

    /**
     * @brief Physically delete soft-deleted and/or expired rows, batchSize per transaction
     */
    Task<PurgeResult> purge(PurgeOptions options = {}, std::stop_token token = {}) {
        const auto started = std::chrono::steady_clock::now();
        PurgeResult total;
        while (true) {
            auto removed = co_await run(
                [this, &options](storage::Database& db) -> Result<int64_t> {
                    PERSIST_TRY_UNWRAP(purgeCommand,
                                       buildPurgeCommand(descriptor(), options, timeout()));
                    if (!purgeCommand)
                        return int64_t{0};
                    return db.transaction([&]() -> Result<int64_t> {
                        PERSIST_TRY_UNWRAP(stmt, command::prepareCommand(db, *purgeCommand));
                        PERSIST_TRY(stmt.execute());
                        return static_cast<int64_t>(db.changes());
                    });
                },
                token, {});
            if (!removed) {
                logOutcome("purge", "", started, Result<PurgeResult>(removed.error()));
                co_return removed.error();
            }
            if (removed.value() == 0)
                break;
            total.entitiesPurged += removed.value();
            ++total.batches;
        }
        spdlog::debug("[Repository] purge {}: {} rows in {} batches, {}ms",
                      descriptor().tableName(), total.entitiesPurged, total.batches,
                      elapsedMs(started));
        co_return total;
    }

    /**
     * @brief Audit rows for entityType (default: this type), newest first
     *
     * NotSupported when the type does not keep an audit trail.
     */
    Task<std::vector<AuditRecord>> auditRecords(std::string entityType = {},
                                                std::vector<AuditOperation> operations = {},
                                                std::stop_token token = {}) {
        if (!audit_) {
            co_return Error{ErrorCode::NotSupported,
                            descriptor().entityName() + " does not keep an audit trail"};
        }
        if (entityType.empty())
            entityType = descriptor().entityName();
        co_return co_await run(
            [this, &entityType, &operations](storage::Database& db) {
                return audit_->read(db, entityType, operations);
            },
            token, {});
    }

    /**
     * @brief Create entities and record them as the list listKey
     *
     * Runs in one transaction: an existing list fails with EntityAlreadyExists and
     * any failing entity rolls back the whole list. Each entry records the version
     * it was created at.
     */
    Task<std::vector<T>> createList(std::string listKey, std::vector<T> entities,
                                    CallerInfo caller = {}, std::stop_token token = {}) {
        PERSIST_CO_TRY(requireList(listKey));
        if (entities.empty())
            co_return std::vector<T>{};

        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [&](storage::Database& db) -> Result<std::vector<T>> {
                const auto now = std::chrono::system_clock::now();
                PERSIST_TRY_UNWRAP(written, db.transaction([&]() -> Result<std::vector<Written>> {
                    PERSIST_TRY_UNWRAP(taken, list_->exists(db, listKey));
                    if (taken) {
                        auto error = makeEntityAlreadyExists(listKey);
                        error.message = fmt::format("List '{}' already exists", listKey);
                        return error;
                    }
                    std::vector<Written> rows;
                    rows.reserve(entities.size());
                    for (const auto& entity : entities) {
                        PERSIST_TRY_UNWRAP(row, createRow(db, entity, now));
                        PERSIST_TRY(list_->add(db, makeListEntry(listKey, row.key,
                                                                 row.newVersion.value_or(1),
                                                                 caller)));
                        rows.push_back(std::move(row));
                    }
                    return rows;
                }));
                std::vector<T> out;
                out.reserve(written.size());
                for (auto& row : written) {
                    writeAudit(db, AuditOperation::CreateList, row, caller);
                    out.push_back(std::move(row.entity));
                }
                return out;
            },
            token, caller);
        logOutcome("createList", listKey, started, result);
        co_return result;
    }

    /**
     * @brief Entities of the list listKey, ordered by entry key
     *
     * A member that is gone or soft-deleted fails with EntityNotFound. A member
     * updated since it was listed moves the entry to the stored version; one
     * whose stored version is older than its entry fails with ConcurrencyConflict.
     * An unknown list is empty.
     */
    Task<std::vector<T>> getList(std::string listKey, CallerInfo caller = {},
                                 std::stop_token token = {}) {
        PERSIST_CO_TRY(requireList(listKey));
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [&](storage::Database& db) -> Result<std::vector<T>> {
                PERSIST_TRY_UNWRAP(entities, db.transaction(
                    [&]() -> Result<std::vector<T>> { return readList(db, listKey); },
                    storage::TransactionMode::Immediate));
                if (!entities.empty()) {
                    Written marker;
                    marker.key = listKey;
                    writeAudit(db, AuditOperation::ReadList, marker, caller);
                }
                return entities;
            },
            token, caller);
        logOutcome("getList", listKey, started, result);
        co_return result;
    }

    /**
     * @brief Replace the membership of listKey with entities
     *
     * Absent or soft-deleted entities are created; live ones whose data differs
     * are updated at their stored version; unchanged ones are listed as stored.
     * Entities dropped from the list are left in place. An empty vector clears
     * the list.
     */
    Task<std::vector<T>> updateList(std::string listKey, std::vector<T> entities,
                                    CallerInfo caller = {}, std::stop_token token = {}) {
        PERSIST_CO_TRY(requireList(listKey));
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [&](storage::Database& db) -> Result<std::vector<T>> {
                const auto now = std::chrono::system_clock::now();
                PERSIST_TRY_UNWRAP(members, db.transaction([&]() -> Result<std::vector<ListMember>> {
                    PERSIST_TRY(list_->removeList(db, listKey));
                    std::vector<ListMember> rows;
                    rows.reserve(entities.size());
                    for (const auto& entity : entities) {
                        PERSIST_TRY_UNWRAP(member, syncMember(db, entity, now));
                        PERSIST_TRY(list_->add(db, makeListEntry(listKey, member.row.key,
                                                                 member.row.newVersion.value_or(1),
                                                                 caller)));
                        rows.push_back(std::move(member));
                    }
                    return rows;
                }));
                std::vector<T> out;
                out.reserve(members.size());
                for (auto& member : members) {
                    if (member.written)
                        writeAudit(db, AuditOperation::UpdateList, member.row, caller);
                    out.push_back(std::move(member.row.entity));
                }
                return out;
            },
            token, caller);
        logOutcome("updateList", listKey, started, result);
        co_return result;
    }

    /// Drop the list listKey and return how many entries it had; its entities stay
    Task<int64_t> deleteList(std::string listKey, CallerInfo caller = {},
                             std::stop_token token = {}) {
        PERSIST_CO_TRY(requireList(listKey));
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [&](storage::Database& db) -> Result<int64_t> {
                return db.transaction([&] { return list_->removeList(db, listKey); });
            },
            token, caller);
        logOutcome("deleteList", listKey, started, result);
        co_return result;
    }

    /**
     * @brief Write matching rows to JSON data files plus a manifest
     *
     * Pages are read in key order inside one read transaction. The manifest is
     * written last.
     */
    Task<BulkExportResult> bulkExport(query::Predicate predicate = {},
                                      BulkExportOptions options = {},
                                      std::stop_token token = {}) {
        if (options.exportFolder.empty() || options.batchSize == 0) {
            co_return Error{ErrorCode::InvalidArgument,
                            "bulkExport needs an export folder and a positive batch size"};
        }
        const auto started = std::chrono::steady_clock::now();
        const auto stamp = std::chrono::system_clock::now();
        const auto epochMs =
            std::chrono::duration_cast<std::chrono::milliseconds>(stamp.time_since_epoch())
                .count();
        const auto folder = std::filesystem::path(options.exportFolder) /
                            fmt::format("{}_{}", descriptor().tableName(), epochMs);
        std::error_code ec;
        std::filesystem::create_directories(folder, ec);
        if (ec) {
            co_return Error{ErrorCode::InvalidArgument,
                            fmt::format("Cannot create {}: {}", folder.string(), ec.message())};
        }

        query::SelectOptions select;
        select.orderBy = keyOrder();
        select.limit = static_cast<int64_t>(options.batchSize);
        select.includeDeleted = options.includeDeleted;
        select.includeExpired = options.includeExpired;

        auto manifest = co_await run(
            [&](storage::Database& db) -> Result<ExportManifest> {
                return db.transaction(
                    [&]() -> Result<ExportManifest> {
                        ExportManifest m;
                        m.exportTimestamp = formatTimestamp(stamp);
                        m.entityType = descriptor().entityName();
                        m.tableName = descriptor().tableName();
                        m.softDeleteEnabled = descriptor().supportsSoftDelete();
                        for (const auto& column : descriptor().columns())
                            m.columns.push_back(column.columnName);

                        for (int64_t offset = 0;; offset += *select.limit) {
                            auto page = select;
                            page.offset = offset;
                            PERSIST_TRY_UNWRAP(entities, selectRows(db, predicate, page));
                            if (entities.empty())
                                break;
                            std::vector<std::vector<Value>> rows;
                            rows.reserve(entities.size());
                            for (const auto& entity : entities)
                                rows.push_back(mapping_->row(entity));
                            const auto name = fmt::format("data_{:04}.json", m.dataFiles.size() + 1);
                            PERSIST_TRY(writeDataFile(folder / name, descriptor(), rows));
                            m.dataFiles.push_back({name, static_cast<int64_t>(rows.size())});
                            m.entityCount += static_cast<int64_t>(rows.size());
                            if (entities.size() < options.batchSize)
                                break;
                        }
                        return m;
                    },
                    storage::TransactionMode::Deferred);
            },
            token, {});
        if (!manifest) {
            logOutcome("bulkExport", "", started, manifest);
            co_return manifest.error();
        }

        const auto manifestPath = folder / "manifest.json";
        PERSIST_CO_TRY(writeExportManifest(manifestPath, manifest.value()));

        BulkExportResult result;
        result.exportedCount = manifest.value().entityCount;
        for (const auto& file : manifest.value().dataFiles)
            result.exportedFiles.push_back((folder / file.path).string());
        result.manifestPath = manifestPath.string();
        result.durationMs = elapsedMs(started);
        spdlog::info("[Repository] exported {} {} rows to {} in {}ms", result.exportedCount,
                     descriptor().tableName(), folder.string(), result.durationMs);
        co_return result;
    }

    /**
     * @brief bulkImport every data file named by a manifest written by bulkExport
     *
     * The manifest must describe this entity type. Files are imported in order and
     * their results summed; an unreadable file stops the import.
     */
    Task<BulkImportResult> bulkImportFromFile(std::filesystem::path manifestPath,
                                              BulkImportOptions options = {},
                                              CallerInfo caller = {},
                                              std::stop_token token = {}) {
        PERSIST_CO_TRY_UNWRAP(manifest, readExportManifest(manifestPath));
        if (manifest.entityType != descriptor().entityName()) {
            co_return Error{ErrorCode::InvalidArgument,
                            fmt::format("Export holds {} rows, not {}", manifest.entityType,
                                        descriptor().entityName())};
        }

        BulkImportResult total;
        const auto folder = manifestPath.parent_path();
        for (const auto& file : manifest.dataFiles) {
            PERSIST_CO_TRY_UNWRAP(rows, readDataFile(folder / file.path, descriptor()));
            std::vector<T> entities;
            entities.reserve(rows.size());
            for (const auto& row : rows) {
                auto entity = mapping_->fromRow(row);
                if (!entity) {
                    co_return Error{ErrorCode::SerializationError,
                                    fmt::format("{}: {}", file.path, entity.error().message)};
                }
                entities.push_back(std::move(entity).value());
            }

            PERSIST_CO_TRY_UNWRAP(imported,
                                  co_await bulkImport(std::move(entities), options, caller, token));
            total.created += imported.created;
            total.updated += imported.updated;
            total.skipped += imported.skipped;
            total.failed += imported.failed;
            for (auto& error : imported.errors)
                total.errors.push_back(std::move(error));
        }
        co_return total;
    }

private:
    friend class TransactionScope<T>;

    /// A committed write: the stored row (when re-read) and its version transition
    struct Written {
        T entity{};
        std::string key;
        std::optional<int64_t> oldVersion;
        std::optional<int64_t> newVersion;
        std::optional<int64_t> size;
    };

    struct RowState {
        std::optional<int64_t> version;
        bool deleted = false;
    };

    struct ImportTally {
        size_t created = 0;
        size_t updated = 0;
        size_t skipped = 0;
        size_t failed = 0;
        std::vector<std::string> errors;
        std::vector<std::pair<AuditOperation, Written>> audit;
    };

    template <typename Fn> using WorkResult = std::invoke_result_t<Fn&, storage::Database&>;

    Repository(config::SqliteConfiguration config,
               std::shared_ptr<const mapping::EntityMapping<T>> mapping,
               resilience::RetryPolicy retry, std::shared_ptr<storage::ConnectionPool> pool,
               std::optional<AuditTrail> audit, std::optional<EntryListStore> list)
        : config_(std::move(config)),
          mapping_(std::move(mapping)),
          builder_(mapping_, commandTimeout(config_)),
          retry_(std::move(retry)),
          pool_(std::move(pool)),
          audit_(std::move(audit)),
          list_(std::move(list)) {}

    static std::chrono::milliseconds commandTimeout(const config::SqliteConfiguration& config) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(config.commandTimeout);
    }

    std::chrono::milliseconds timeout() const { return commandTimeout(config_); }

    static int64_t elapsedMs(std::chrono::steady_clock::time_point started) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
            .count();
    }

    /**
     * @brief Run work on a pooled connection inside the retry policy
     *
     * The command deadline is armed once per attempt, so every statement of the
     * attempt shares one timeout budget.
     */
    template <typename Fn>
    boost::asio::awaitable<WorkResult<Fn>> run(Fn work, std::stop_token token,
                                               CallerInfo caller) {
        co_return co_await retry_.execute(
            [this, &work]() -> boost::asio::awaitable<WorkResult<Fn>> {
                co_return attempt(work);
            },
            token, std::move(caller));
    }

    template <typename Fn> WorkResult<Fn> attempt(Fn& work) {
        PERSIST_TRY_UNWRAP(connection, pool_->acquire(timeout()));
        auto& db = **connection;
        db.setCommandTimeout(timeout());
        db.armCommandDeadline();
        auto disarm = scope_exit([&db] { db.disarmCommandDeadline(); });

        auto result = work(db);
        if (db.inTransaction()) {
            if (auto rolledBack = db.rollback(); !rolledBack) {
                spdlog::warn("[Repository] dropping connection after failed rollback: {}",
                             rolledBack.error().message);
                disarm.dismiss();
                db.disarmCommandDeadline();
                connection->discard();
            }
        }
        return result;
    }

    Result<std::vector<T>> selectRows(storage::Database& db, const query::Predicate& predicate,
                                      const query::SelectOptions& options) const {
        PERSIST_TRY_UNWRAP(select, builder_.forSelect(predicate, options));
        PERSIST_TRY_UNWRAP(rows, command::queryRows(db, std::move(select)));
        std::vector<T> entities;
        entities.reserve(rows.size());
        for (const auto& row : rows) {
            PERSIST_TRY_UNWRAP(entity, mapping_->fromRow(row));
            entities.push_back(std::move(entity));
        }
        return entities;
    }

    Result<int64_t> countRows(storage::Database& db, const query::Predicate& predicate) const {
        PERSIST_TRY_UNWRAP(select, builder_.forCount(predicate, query::SelectOptions{}));
        PERSIST_TRY_UNWRAP(value, command::queryScalar(db, std::move(select)));
        if (const auto* n = std::get_if<int64_t>(&value))
            return *n;
        return Error{ErrorCode::InternalError, "COUNT(*) did not return an integer"};
    }

    /// Row with key regardless of lifecycle state
    Result<std::optional<T>> readRow(storage::Database& db, const mapping::KeyValues& key) const {
        PERSIST_TRY_UNWRAP(select, builder_.forSelectByKey(key));
        PERSIST_TRY_UNWRAP(rows, command::queryRows(db, std::move(select)));
        if (rows.empty())
            return std::optional<T>{};
        PERSIST_TRY_UNWRAP(entity, mapping_->fromRow(rows.front()));
        return std::optional<T>{std::move(entity)};
    }

    /// Version and delete flag of the row with key; nullopt when there is no row
    Result<std::optional<RowState>> currentState(storage::Database& db,
                                                 const mapping::KeyValues& key) const {
        PERSIST_TRY_UNWRAP(check, builder_.forVersionCheck(key));
        PERSIST_TRY_UNWRAP(rows, command::queryRows(db, std::move(check)));
        if (rows.empty())
            return std::optional<RowState>{};
        const auto& row = rows.front();
        RowState state;
        if (const auto* v = std::get_if<int64_t>(&row[0]))
            state.version = *v;
        if (const auto* d = std::get_if<int64_t>(&row[1]))
            state.deleted = *d != 0;
        return std::optional<RowState>{state};
    }

    Result<Written> storedRow(storage::Database& db, const mapping::KeyValues& key,
                              std::optional<int64_t> oldVersion) const {
        PERSIST_TRY_UNWRAP(stored, readRow(db, key));
        if (!stored) {
            return Error{ErrorCode::InternalError,
                         "Row '" + mapping::formatKey(key) + "' vanished inside its transaction"};
        }
        Written written;
        written.key = mapping::formatKey(key);
        written.oldVersion = oldVersion;
        if (descriptor().hasVersion())
            written.newVersion = mapping_->version(*stored);
        written.size = estimateRowSize(mapping_->row(*stored));
        written.entity = std::move(*stored);
        return written;
    }

    Result<Written> createRow(storage::Database& db, const T& entity, TimePoint now) const {
        auto key = mapping_->key(entity);
        const bool generated = isUnassignedKey(descriptor(), key);

        std::optional<RowState> existing;
        if (!generated) {
            PERSIST_TRY_ASSIGN(existing, currentState(db, key));
        }
        if (existing && !existing->deleted) {
            return makeEntityAlreadyExists(mapping::formatKey(key));
        }

        if (existing) {
            PERSIST_TRY_UNWRAP(revive, builder_.forRevive(entity, now));
            command::WriteCommand write(std::move(revive));
            PERSIST_TRY(write.execute(db));
            return storedRow(db, key, existing->version);
        }

        command::WriteCommand write(builder_.forInsert(entity, now));
        auto inserted = write.execute(db);
        if (!inserted) {
            if (isDuplicateKey(inserted.error()) && !generated)
                return makeEntityAlreadyExists(mapping::formatKey(key));
            return inserted.error();
        }
        if (generated)
            key = {Value{db.lastInsertRowId()}};
        return storedRow(db, key, std::nullopt);
    }

    Result<Written> updateRow(storage::Database& db, const T& entity) const {
        const auto key = mapping_->key(entity);
        const int64_t expected = mapping_->version(entity);
        PERSIST_TRY_UNWRAP(update, builder_.forUpdate(entity, expected));
        PERSIST_TRY_UNWRAP(check, builder_.forVersionCheck(key));
        command::WriteCommand write(std::move(update), std::move(check));
        PERSIST_TRY(write.execute(db));
        return storedRow(db, key, expected);
    }

    Result<Written> removeRow(storage::Database& db, const mapping::KeyValues& key,
                              int64_t expectedVersion) const {
        PERSIST_TRY_UNWRAP(remove, builder_.forDelete(key, expectedVersion));
        PERSIST_TRY_UNWRAP(check, builder_.forVersionCheck(key));
        command::WriteCommand write(std::move(remove), std::move(check));
        PERSIST_TRY(write.execute(db));

        Written written;
        written.key = mapping::formatKey(key);
        written.oldVersion = expectedVersion;
        if (descriptor().supportsSoftDelete())
            written.newVersion = expectedVersion + 1;
        return written;
    }

    Result<ImportTally> importRange(storage::Database& db, const std::vector<T>& entities,
                                    size_t begin, size_t end, ImportStrategy strategy,
                                    TimePoint now) const {
        ImportTally tally;
        for (size_t i = begin; i < end; ++i) {
            const auto& entity = entities[i];
            const auto key = mapping_->key(entity);
            std::optional<RowState> existing;
            if (!isUnassignedKey(descriptor(), key)) {
                PERSIST_TRY_ASSIGN(existing, currentState(db, key));
            }

            if (!existing || existing->deleted) {
                PERSIST_TRY_UNWRAP(created, createRow(db, entity, now));
                tally.audit.emplace_back(AuditOperation::Create, std::move(created));
                ++tally.created;
                continue;
            }

            switch (strategy) {
                case ImportStrategy::Skip:
                    ++tally.skipped;
                    break;
                case ImportStrategy::Fail:
                    ++tally.failed;
                    tally.errors.push_back(
                        makeEntityAlreadyExists(mapping::formatKey(key)).message);
                    break;
                case ImportStrategy::Upsert: {
                    T incoming = entity;
                    PERSIST_TRY(mapping_->setRole(incoming, mapping::ColumnRole::Version,
                                                  existing->version.value_or(0)));
                    PERSIST_TRY_UNWRAP(updated, updateRow(db, incoming));
                    tally.audit.emplace_back(AuditOperation::Update, std::move(updated));
                    ++tally.updated;
                    break;
                }
            }
        }
        return tally;
    }

    struct ListMember {
        Written row;
        bool written = false;
    };

    Result<void> requireList(const std::string& listKey) const {
        if (!list_) {
            return Error{ErrorCode::NotSupported,
                         descriptor().entityName() + " does not sync with lists"};
        }
        if (listKey.empty())
            return Error{ErrorCode::InvalidArgument, "List key must not be empty"};
        return {};
    }

    query::OrderSpec keyOrder() const {
        const auto& columns = descriptor().columns();
        const auto& keys = descriptor().keyIndices();
        auto order = query::orderBy(columns[keys.front()].fieldName);
        for (size_t i = 1; i < keys.size(); ++i)
            order.thenBy(columns[keys[i]].fieldName);
        return order;
    }

    Result<std::vector<T>> readList(storage::Database& db, const std::string& listKey) const {
        PERSIST_TRY_UNWRAP(entries, list_->entries(db, listKey));
        std::vector<T> out;
        out.reserve(entries.size());
        for (const auto& entry : entries) {
            PERSIST_TRY_UNWRAP(key, mapping::parseKey(descriptor(), entry.entryCacheKey));
            PERSIST_TRY_UNWRAP(state, currentState(db, key));
            if (!state || state->deleted) {
                auto error = makeEntityNotFound(entry.entryCacheKey);
                error.message = fmt::format("'{}' of list '{}' no longer exists",
                                            entry.entryCacheKey, listKey);
                return error;
            }
            const int64_t stored = state->version.value_or(0);
            if (stored < entry.version)
                return makeConcurrencyConflict(entry.entryCacheKey, stored, entry.version);
            if (stored > entry.version)
                PERSIST_TRY(list_->setVersion(db, listKey, entry.entryCacheKey, stored));

            PERSIST_TRY_UNWRAP(entity, readRow(db, key));
            if (!entity)
                return makeEntityNotFound(entry.entryCacheKey);
            out.push_back(std::move(*entity));
        }
        return out;
    }

    /// True when the user columns of a and b hold the same values
    bool samePayload(const T& a, const T& b) const {
        const auto& columns = descriptor().columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (columns[i].role != mapping::ColumnRole::None)
                continue;
            if (mapping_->read(a, i) != mapping_->read(b, i))
                return false;
        }
        return true;
    }

    Result<ListMember> syncMember(storage::Database& db, const T& entity, TimePoint now) const {
        const auto key = mapping_->key(entity);
        std::optional<RowState> state;
        if (!isUnassignedKey(descriptor(), key)) {
            PERSIST_TRY_ASSIGN(state, currentState(db, key));
        }

        ListMember member;
        if (!state || state->deleted) {
            PERSIST_TRY_ASSIGN(member.row, createRow(db, entity, now));
            member.written = true;
            return member;
        }

        PERSIST_TRY_UNWRAP(stored, storedRow(db, key, state->version));
        if (samePayload(stored.entity, entity)) {
            member.row = std::move(stored);
            return member;
        }
        T incoming = entity;
        PERSIST_TRY(mapping_->setRole(incoming, mapping::ColumnRole::Version,
                                      state->version.value_or(0)));
        PERSIST_TRY_ASSIGN(member.row, updateRow(db, incoming));
        member.written = true;
        return member;
    }

    /**
     * @brief Apply queued operations in order inside one IMMEDIATE transaction
     *
     * Outputs align with operations; removes yield nullopt. Cancellation is
     * checked before each operation and rolls the whole set back.
     */
    Task<std::vector<std::optional<T>>>
    commitOperations(const std::vector<TransactionalOperation<T>>& operations, CallerInfo caller,
                     std::stop_token token) {
        const auto started = std::chrono::steady_clock::now();
        auto result = co_await run(
            [&](storage::Database& db) -> Result<std::vector<std::optional<T>>> {
                const auto now = std::chrono::system_clock::now();
                std::vector<std::pair<AuditOperation, Written>> audit;
                PERSIST_TRY_UNWRAP(outputs, db.transaction(
                    [&]() -> Result<std::vector<std::optional<T>>> {
                        std::vector<std::optional<T>> out;
                        out.reserve(operations.size());
                        for (const auto& op : operations) {
                            if (token.stop_requested())
                                return Error{ErrorCode::OperationCancelled,
                                             "Transaction cancelled"};
                            switch (op.kind) {
                                case OperationKind::Create: {
                                    PERSIST_TRY_UNWRAP(row, createRow(db, op.entity, now));
                                    out.emplace_back(row.entity);
                                    audit.emplace_back(AuditOperation::Create, std::move(row));
                                    break;
                                }
                                case OperationKind::Update: {
                                    PERSIST_TRY_UNWRAP(row, updateRow(db, op.entity));
                                    out.emplace_back(row.entity);
                                    audit.emplace_back(AuditOperation::Update, std::move(row));
                                    break;
                                }
                                case OperationKind::Remove: {
                                    PERSIST_TRY_UNWRAP(row,
                                                       removeRow(db, op.key, op.expectedVersion));
                                    out.emplace_back(std::nullopt);
                                    audit.emplace_back(AuditOperation::Delete, std::move(row));
                                    break;
                                }
                            }
                        }
                        return out;
                    },
                    storage::TransactionMode::Immediate));
                for (const auto& [operation, written] : audit)
                    writeAudit(db, operation, written, caller);
                return outputs;
            },
            token, caller);
        logOutcome("commit", "", started, result);
        co_return result;
    }

    /// Audit failures are logged; the write they describe is already committed
    void writeAudit(storage::Database& db, AuditOperation operation, const Written& written,
                    const CallerInfo& caller) const {
        if (!audit_)
            return;
        auto record = makeAuditRecord(descriptor().entityName(), written.key, operation,
                                      written.oldVersion, written.newVersion, written.size, caller);
        if (auto appended = audit_->append(db, record); !appended) {
            spdlog::warn("[Repository] audit {} of {} '{}' failed: {}", toString(operation),
                         descriptor().entityName(), written.key, appended.error().message);
        }
    }

    template <typename Fn>
    Task<BatchResult> runBatches(const char* operation, size_t itemCount, size_t batchSize,
                                 std::stop_token token, CallerInfo caller, Fn perBatch,
                                 AuditOperation auditOperation) {
        const auto started = std::chrono::steady_clock::now();
        const size_t step = batchSize == 0 ? std::max<size_t>(itemCount, 1) : batchSize;
        BatchResult total;

        for (size_t begin = 0; begin < itemCount; begin += step) {
            const size_t end = std::min(itemCount, begin + step);
            auto processed = co_await run(
                [&](storage::Database& db) -> Result<size_t> {
                    const auto now = std::chrono::system_clock::now();
                    PERSIST_TRY_UNWRAP(written, db.transaction([&] {
                        return perBatch(db, begin, end, now);
                    }));
                    for (const auto& row : written)
                        writeAudit(db, auditOperation, row, caller);
                    return written.size();
                },
                token, caller);
            if (!processed) {
                spdlog::warn("[Repository] {} {} stopped at items {}-{} after {} committed: {}",
                             operation, descriptor().tableName(), begin, end - 1,
                             total.processed, processed.error().message);
                co_return processed.error();
            }
            total.processed += processed.value();
            ++total.batches;
        }

        spdlog::debug("[Repository] {} {}: {} items in {} batches, {}ms", operation,
                      descriptor().tableName(), total.processed, total.batches,
                      elapsedMs(started));
        co_return total;
    }

    template <typename R>
    void logOutcome(const char* operation, const std::string& key,
                    std::chrono::steady_clock::time_point started, const Result<R>& result) const {
        const auto elapsed = elapsedMs(started);
        if (result) {
            spdlog::debug("[Repository] {} {} '{}' done in {}ms", operation,
                          descriptor().tableName(), key, elapsed);
            return;
        }
        const auto& error = result.error();
        switch (error.code) {
            case ErrorCode::ConcurrencyConflict:
            case ErrorCode::EntityNotFound:
            case ErrorCode::EntityAlreadyExists:
            case ErrorCode::OperationCancelled:
                spdlog::debug("[Repository] {} {} '{}': {} ({}ms)", operation,
                              descriptor().tableName(), key, error.message, elapsed);
                break;
            default:
                spdlog::error("[Repository] {} {} '{}' failed after {}ms: {} ({})", operation,
                              descriptor().tableName(), key, elapsed, error.message, error.code);
                break;
        }
    }

    config::SqliteConfiguration config_;
    std::shared_ptr<const mapping::EntityMapping<T>> mapping_;
    command::CommandBuilder<T> builder_;
    resilience::RetryPolicy retry_;
    std::shared_ptr<storage::ConnectionPool> pool_;
    std::optional<AuditTrail> audit_;
    std::optional<EntryListStore> list_;
};

} // namespace persist::provider
