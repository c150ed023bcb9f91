#pragma once

#include <persist/core/types.h>
#include <persist/mapping/entity_mapping.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace persist::provider {

/**
 * @brief One page of query results
 */
template <typename T> struct PagedResult {
    std::vector<T> items;
    int64_t pageNumber = 1; ///< 1-based
    int64_t pageSize = 0;
    int64_t totalCount = 0;

    [[nodiscard]] int64_t totalPages() const {
        return pageSize > 0 ? totalCount / pageSize + (totalCount % pageSize != 0 ? 1 : 0) : 0;
    }
    [[nodiscard]] bool hasNextPage() const { return pageNumber < totalPages(); }
    [[nodiscard]] bool hasPreviousPage() const { return pageNumber > 1; }
};

/**
 * @brief Outcome of createBatch/updateBatch/removeBatch
 */
struct BatchResult {
    size_t processed = 0; ///< Items written (removeBatch: rows actually removed)
    size_t batches = 0;   ///< Committed transactions
};

enum class ImportStrategy {
    Upsert, ///< Update existing rows with the imported values
    Skip,   ///< Leave existing rows untouched
    Fail    ///< Record existing rows as failures
};

const char* toString(ImportStrategy strategy);

struct BulkImportOptions {
    ImportStrategy strategy = ImportStrategy::Upsert;
    size_t batchSize = 1000;
};

struct BulkImportResult {
    size_t created = 0;
    size_t updated = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<std::string> errors;

    [[nodiscard]] size_t total() const { return created + updated + skipped + failed; }
};

/**
 * @brief Physical removal of soft-deleted and/or expired rows
 *
 * olderThan, when set, limits the purge to rows last written before it and
 * requires a LastWriteTime column.
 */
struct PurgeOptions {
    std::optional<TimePoint> olderThan;
    bool purgeDeleted = true;
    bool purgeExpired = true;
    size_t batchSize = 1000;
};

struct PurgeResult {
    int64_t entitiesPurged = 0;
    size_t batches = 0;
};

/**
 * @brief Export of matching rows to exportFolder/<Table>_<epoch ms>/
 *
 * The folder receives data_0001.json, data_0002.json, ... of at most batchSize
 * rows each, then manifest.json.
 */
struct BulkExportOptions {
    std::string exportFolder;
    size_t batchSize = 1000;
    bool includeDeleted = false;
    bool includeExpired = false;
};

struct BulkExportResult {
    int64_t exportedCount = 0;
    std::vector<std::string> exportedFiles; ///< Data files, in write order
    std::string manifestPath;
    int64_t durationMs = 0;
};

enum class TransactionState { Active, Committing, Committed, RollingBack, Failed };

const char* toString(TransactionState state);

enum class OperationKind { Create, Update, Remove };

/// One queued write of a TransactionScope
template <typename T> struct TransactionalOperation {
    OperationKind kind = OperationKind::Create;
    T entity{};                ///< Create and Update
    mapping::KeyValues key;    ///< Remove
    int64_t expectedVersion = 0;
};

} // namespace persist::provider
