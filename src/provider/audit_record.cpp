#include <persist/command/command_executor.h>
#include <persist/core/result_helpers.hpp>
#include <persist/mapping/descriptor_cache.h>
#include <persist/mapping/mapping_builder.h>
#include <persist/mapping/schema_generator.h>
#include <persist/provider/audit_record.h>
#include <persist/query/predicate.h>

#include <spdlog/spdlog.h>

namespace persist::mapping {

void EntityTraits<provider::AuditRecord>::describe(MappingBuilder<provider::AuditRecord>& b) {
    using provider::AuditRecord;
    b.table("Audit").entityName("AuditRecord");
    b.key(&AuditRecord::id, "Id").autoIncrement();
    b.column(&AuditRecord::entityType, "EntityType");
    b.column(&AuditRecord::entityId, "EntityId");
    b.column(&AuditRecord::operation, "Operation");
    b.column(&AuditRecord::oldVersion, "OldVersion");
    b.column(&AuditRecord::newVersion, "NewVersion");
    b.column(&AuditRecord::callerFile, "CallerFile").nullable();
    b.column(&AuditRecord::callerMember, "CallerMember").nullable();
    b.column(&AuditRecord::callerLineNumber, "CallerLineNumber").defaultValue("0");
    b.column(&AuditRecord::size, "Size");
    b.column(&AuditRecord::userId, "UserId").nullable();
    b.createdTime(&AuditRecord::createdTime);
    b.lastWriteTime(&AuditRecord::lastWriteTime);
    b.index("IX_Audit_EntityType_EntityId", {ascending("EntityType"), ascending("EntityId")});
    b.index("IX_Audit_Operation", {ascending("Operation")});
}

} // namespace persist::mapping

namespace persist::provider {

const char* toString(AuditOperation operation) {
    switch (operation) {
        case AuditOperation::Create: return "CREATE";
        case AuditOperation::Update: return "UPDATE";
        case AuditOperation::Delete: return "DELETE";
        case AuditOperation::CreateList: return "CREATE_LIST";
        case AuditOperation::UpdateList: return "UPDATE_LIST";
        case AuditOperation::ReadList: return "READ_LIST";
    }
    return "UNKNOWN";
}

AuditRecord makeAuditRecord(const std::string& entityType, const std::string& entityId,
                            AuditOperation operation, std::optional<int64_t> oldVersion,
                            std::optional<int64_t> newVersion, std::optional<int64_t> size,
                            const CallerInfo& caller) {
    AuditRecord record;
    record.entityType = entityType;
    record.entityId = entityId;
    record.operation = toString(operation);
    record.oldVersion = oldVersion;
    record.newVersion = newVersion;
    record.size = size;
    record.callerFile = caller.file;
    record.callerMember = caller.member;
    record.callerLineNumber = caller.line;
    record.userId = caller.userId;
    return record;
}

int64_t estimateRowSize(const std::vector<Value>& row) {
    int64_t total = 0;
    for (const auto& value : row) {
        if (const auto* text = std::get_if<std::string>(&value))
            total += static_cast<int64_t>(text->size());
        else if (const auto* blob = std::get_if<ByteVector>(&value))
            total += static_cast<int64_t>(blob->size());
        else if (!isNull(value))
            total += 8;
    }
    return total;
}

Result<AuditTrail> AuditTrail::create(std::chrono::milliseconds commandTimeout) {
    PERSIST_TRY_UNWRAP(mapping, mapping::mappingFor<AuditRecord>());
    return AuditTrail(command::CommandBuilder<AuditRecord>(std::move(mapping), commandTimeout));
}

Result<void> AuditTrail::ensureSchema(storage::Database& db) const {
    const auto& descriptor = builder_.mapping().descriptor();
    PERSIST_TRY(db.execute(mapping::generateCreateTableSql(descriptor)));
    for (const auto& sql : mapping::generateCreateIndexSql(descriptor)) {
        PERSIST_TRY(db.execute(sql));
    }
    return {};
}

Result<int64_t> AuditTrail::append(storage::Database& db, const AuditRecord& record) const {
    command::WriteCommand insert(builder_.forInsert(record));
    PERSIST_TRY(insert.execute(db));
    return db.lastInsertRowId();
}

Result<std::vector<AuditRecord>>
AuditTrail::read(storage::Database& db, const std::string& entityType,
                 const std::vector<AuditOperation>& operations) const {
    auto predicate = query::field("EntityType") == entityType;
    if (!operations.empty()) {
        std::vector<Value> names;
        for (auto op : operations)
            names.emplace_back(std::string(toString(op)));
        predicate = predicate && query::field("Operation").in(std::move(names));
    }

    query::SelectOptions options;
    options.orderBy = query::orderByDescending("Id");
    PERSIST_TRY_UNWRAP(select, builder_.forSelect(predicate, options));
    PERSIST_TRY_UNWRAP(rows, command::queryRows(db, std::move(select)));

    std::vector<AuditRecord> records;
    records.reserve(rows.size());
    for (const auto& row : rows) {
        PERSIST_TRY_UNWRAP(record, builder_.mapping().fromRow(row));
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace persist::provider
