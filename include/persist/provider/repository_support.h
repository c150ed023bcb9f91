#pragma once

#include <persist/command/command_context.h>
#include <persist/config/sqlite_config.h>
#include <persist/mapping/entity_mapping.h>
#include <persist/mapping/mapping_descriptor.h>
#include <persist/provider/operation_types.h>
#include <persist/query/predicate.h>
#include <persist/storage/database.h>

#include <chrono>
#include <optional>
#include <string>

namespace persist::provider {

/// Equality on every key field, in key order
Result<query::Predicate> keyEquals(const mapping::MappingDescriptor& descriptor,
                                   const mapping::KeyValues& key);

/// True for an auto-increment key the database has not assigned yet (null or 0)
bool isUnassignedKey(const mapping::MappingDescriptor& descriptor, const mapping::KeyValues& key);

/// Process-unique id for a TransactionScope
std::string nextTransactionId();

/// Primary-key or unique violation raised by an INSERT
bool isDuplicateKey(const Error& error);

/// Table, then indexes, each IF NOT EXISTS
Result<void> createSchema(storage::Database& db, const mapping::MappingDescriptor& descriptor);

/// page_size and journal_mode; must run outside a transaction
Result<void> applyDatabasePragmas(storage::Database& db,
                                  const config::SqliteConfiguration& config);

/**
 * @brief DELETE of at most options.batchSize purgeable rows
 *
 * Returns nullopt when nothing can qualify: the type supports neither soft delete
 * nor expiry, or options disable both.
 */
Result<std::optional<command::CommandContext>>
buildPurgeCommand(const mapping::MappingDescriptor& descriptor, const PurgeOptions& options,
                  std::chrono::milliseconds timeout);

} // namespace persist::provider
