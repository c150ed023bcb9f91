#pragma once

#include <persist/command/command_builder.h>
#include <persist/core/caller_info.h>
#include <persist/core/types.h>
#include <persist/mapping/entity_mapping.h>
#include <persist/storage/database.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace persist::provider {

/**
 * @brief Membership of one entity in a named list, with the version it was listed at
 *
 * Rows live in the shared EntryListMapping table. Removing a list removes these
 * rows only; the entities stay.
 */
struct ListEntry {
    std::string listCacheKey;
    std::string entryCacheKey;
    int64_t version = 0;
    std::string callerFile;
    std::string callerMember;
    int callerLineNumber = 0;
    TimePoint createdTime{};
    TimePoint lastWriteTime{};
};

ListEntry makeListEntry(const std::string& listKey, const std::string& entryKey, int64_t version,
                        const CallerInfo& caller);

} // namespace persist::provider

namespace persist::mapping {

template <> struct EntityTraits<provider::ListEntry> {
    static void describe(MappingBuilder<provider::ListEntry>& b);
};

} // namespace persist::mapping

namespace persist::provider {

class EntryListStore {
public:
    static Result<EntryListStore> create(std::chrono::milliseconds commandTimeout);

    Result<void> ensureSchema(storage::Database& db) const;

    [[nodiscard]] Result<bool> exists(storage::Database& db, const std::string& listKey) const;

    /// Entries of listKey ordered by entry key; empty when the list is unknown
    Result<std::vector<ListEntry>> entries(storage::Database& db,
                                           const std::string& listKey) const;

    Result<void> add(storage::Database& db, const ListEntry& entry) const;

    /// EntityNotFound when the entry is not in the list
    Result<void> setVersion(storage::Database& db, const std::string& listKey,
                            const std::string& entryKey, int64_t version) const;

    /// Number of entries removed
    Result<int64_t> removeList(storage::Database& db, const std::string& listKey) const;

private:
    EntryListStore(command::CommandBuilder<ListEntry> builder, std::chrono::milliseconds timeout)
        : builder_(std::move(builder)), timeout_(timeout) {}

    command::CommandBuilder<ListEntry> builder_;
    std::chrono::milliseconds timeout_;
};

} // namespace persist::provider
