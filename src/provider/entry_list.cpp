#include <persist/command/command_executor.h>
#include <persist/core/result_helpers.hpp>
#include <persist/mapping/descriptor_cache.h>
#include <persist/mapping/mapping_builder.h>
#include <persist/mapping/sql_dialect.h>
#include <persist/provider/entry_list.h>
#include <persist/provider/repository_support.h>
#include <persist/query/order_by.h>
#include <persist/query/predicate.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace persist::mapping {

void EntityTraits<provider::ListEntry>::describe(MappingBuilder<provider::ListEntry>& b) {
    using provider::ListEntry;
    b.table("EntryListMapping").entityName("EntryListMapping");
    b.key(&ListEntry::listCacheKey, "ListCacheKey").keyOrder(0);
    b.key(&ListEntry::entryCacheKey, "EntryCacheKey").keyOrder(1);
    b.column(&ListEntry::version, "Version");
    b.column(&ListEntry::callerFile, "CallerFile").nullable();
    b.column(&ListEntry::callerMember, "CallerMember").nullable();
    b.column(&ListEntry::callerLineNumber, "CallerLineNumber").defaultValue("0");
    b.createdTime(&ListEntry::createdTime);
    b.lastWriteTime(&ListEntry::lastWriteTime);
    b.index("IX_EntryListMapping_EntryCacheKey", {ascending("EntryCacheKey")});
}

} // namespace persist::mapping

namespace persist::provider {

ListEntry makeListEntry(const std::string& listKey, const std::string& entryKey, int64_t version,
                        const CallerInfo& caller) {
    ListEntry entry;
    entry.listCacheKey = listKey;
    entry.entryCacheKey = entryKey;
    entry.version = version;
    entry.callerFile = caller.file;
    entry.callerMember = caller.member;
    entry.callerLineNumber = caller.line;
    return entry;
}

Result<EntryListStore> EntryListStore::create(std::chrono::milliseconds commandTimeout) {
    PERSIST_TRY_UNWRAP(mapping, mapping::mappingFor<ListEntry>());
    return EntryListStore(command::CommandBuilder<ListEntry>(std::move(mapping), commandTimeout),
                          commandTimeout);
}

Result<void> EntryListStore::ensureSchema(storage::Database& db) const {
    return createSchema(db, builder_.mapping().descriptor());
}

Result<bool> EntryListStore::exists(storage::Database& db, const std::string& listKey) const {
    PERSIST_TRY_UNWRAP(count,
                       builder_.forCount(query::field("ListCacheKey") == listKey, {}));
    PERSIST_TRY_UNWRAP(value, command::queryScalar(db, std::move(count)));
    const auto* n = std::get_if<int64_t>(&value);
    return n && *n > 0;
}

Result<std::vector<ListEntry>> EntryListStore::entries(storage::Database& db,
                                                       const std::string& listKey) const {
    query::SelectOptions options;
    options.orderBy = query::orderBy("EntryCacheKey");
    PERSIST_TRY_UNWRAP(select,
                       builder_.forSelect(query::field("ListCacheKey") == listKey, options));
    PERSIST_TRY_UNWRAP(rows, command::queryRows(db, std::move(select)));

    std::vector<ListEntry> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        PERSIST_TRY_UNWRAP(entry, builder_.mapping().fromRow(row));
        out.push_back(std::move(entry));
    }
    return out;
}

Result<void> EntryListStore::add(storage::Database& db, const ListEntry& entry) const {
    command::WriteCommand insert(builder_.forInsert(entry));
    auto inserted = insert.execute(db);
    if (!inserted) {
        if (isDuplicateKey(inserted.error())) {
            Error error{ErrorCode::InvalidArgument,
                        fmt::format("'{}' appears twice in list '{}'", entry.entryCacheKey,
                                    entry.listCacheKey)};
            error.entityKey = entry.entryCacheKey;
            return error;
        }
        return inserted.error();
    }
    return {};
}

Result<void> EntryListStore::setVersion(storage::Database& db, const std::string& listKey,
                                        const std::string& entryKey, int64_t version) const {
    const auto& dialect = mapping::sqliteDialect();
    const auto& descriptor = builder_.mapping().descriptor();
    auto sql = fmt::format("UPDATE {} SET {} = @version, {} = @lastWriteTime WHERE {} = @list "
                           "AND {} = @entry",
                           dialect.quoteIdentifier(descriptor.tableName()),
                           dialect.quoteIdentifier("Version"),
                           dialect.quoteIdentifier("LastWriteTime"),
                           dialect.quoteIdentifier("ListCacheKey"),
                           dialect.quoteIdentifier("EntryCacheKey"));
    query::Parameters params;
    params.emplace_back("@version", version);
    params.emplace_back("@lastWriteTime", formatTimestamp(std::chrono::system_clock::now()));
    params.emplace_back("@list", listKey);
    params.emplace_back("@entry", entryKey);

    command::WriteCommand update(command::CommandContext(
        command::CommandKind::Update, std::move(sql), std::move(params),
        {Value{listKey}, Value{entryKey}}, std::nullopt, timeout_));
    PERSIST_TRY(update.execute(db));
    return {};
}

Result<int64_t> EntryListStore::removeList(storage::Database& db,
                                           const std::string& listKey) const {
    const auto& dialect = mapping::sqliteDialect();
    auto sql = fmt::format("DELETE FROM {} WHERE {} = @list",
                           dialect.quoteIdentifier(builder_.mapping().descriptor().tableName()),
                           dialect.quoteIdentifier("ListCacheKey"));
    query::Parameters params;
    params.emplace_back("@list", listKey);
    command::CommandContext remove(command::CommandKind::Delete, std::move(sql),
                                   std::move(params), {}, std::nullopt, timeout_);
    PERSIST_TRY_UNWRAP(stmt, command::prepareCommand(db, remove));
    PERSIST_TRY(stmt.execute());
    const auto removed = static_cast<int64_t>(db.changes());
    spdlog::debug("[EntryList] removed list '{}' ({} entries)", listKey, removed);
    return removed;
}

} // namespace persist::provider
