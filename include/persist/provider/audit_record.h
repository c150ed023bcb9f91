#pragma once

#include <persist/command/command_builder.h>
#include <persist/core/caller_info.h>
#include <persist/core/types.h>
#include <persist/mapping/entity_mapping.h>
#include <persist/storage/database.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace persist::provider {

enum class AuditOperation { Create, Update, Delete, CreateList, UpdateList, ReadList };

const char* toString(AuditOperation operation);

/**
 * @brief One row of the Audit table
 *
 * Written after a create, update or delete of an entity whose mapping enables
 * the audit trail, and by the list operations. Audit rows carry no version.
 */
struct AuditRecord {
    int64_t id = 0;
    std::string entityType;
    std::string entityId;
    std::string operation;
    std::optional<int64_t> oldVersion;
    std::optional<int64_t> newVersion;
    std::string callerFile;
    std::string callerMember;
    int callerLineNumber = 0;
    std::optional<int64_t> size;
    std::string userId;
    TimePoint createdTime{};
    TimePoint lastWriteTime{};
};

AuditRecord makeAuditRecord(const std::string& entityType, const std::string& entityId,
                            AuditOperation operation, std::optional<int64_t> oldVersion,
                            std::optional<int64_t> newVersion, std::optional<int64_t> size,
                            const CallerInfo& caller);

/// Rough storage footprint of a row: text and blob lengths, 8 bytes per number
int64_t estimateRowSize(const std::vector<Value>& row);

} // namespace persist::provider

namespace persist::mapping {

template <> struct EntityTraits<provider::AuditRecord> {
    static void describe(MappingBuilder<provider::AuditRecord>& b);
};

} // namespace persist::mapping

namespace persist::provider {

/**
 * @brief Reads and writes the shared Audit table
 */
class AuditTrail {
public:
    static Result<AuditTrail> create(std::chrono::milliseconds commandTimeout);

    /// CREATE TABLE / CREATE INDEX for Audit; idempotent
    Result<void> ensureSchema(storage::Database& db) const;

    /// Insert record; returns the assigned Id
    Result<int64_t> append(storage::Database& db, const AuditRecord& record) const;

    /**
     * @brief Records for entityType, newest first
     *
     * An empty operations list returns every operation.
     */
    Result<std::vector<AuditRecord>> read(storage::Database& db, const std::string& entityType,
                                          const std::vector<AuditOperation>& operations = {}) const;

private:
    explicit AuditTrail(command::CommandBuilder<AuditRecord> builder)
        : builder_(std::move(builder)) {}

    command::CommandBuilder<AuditRecord> builder_;
};

} // namespace persist::provider
