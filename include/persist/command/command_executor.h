#pragma once

#include <persist/command/command_context.h>
#include <persist/storage/database.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace persist::command {

using Row = std::vector<Value>;

/**
 * @brief Prepare ctx.sql() on db and bind every named parameter
 */
Result<storage::Statement> prepareCommand(storage::Database& db, const CommandContext& ctx);

/// Run a SELECT and collect every row
Result<std::vector<Row>> queryRows(storage::Database& db, CommandContext ctx);

/// First column of the first row; NotFound when the query returns nothing
Result<Value> queryScalar(storage::Database& db, CommandContext ctx);

/**
 * @brief Lifecycle of a single write command
 *
 * Building -> Executing -> {Committed | ConflictDetected | NotFound | Faulted}.
 * Terminal states are final; a retry needs a new command.
 */
enum class WriteState { Building, Executing, Committed, ConflictDetected, NotFound, Faulted };

const char* toString(WriteState state);

/**
 * @brief Executes one write and classifies a zero-row outcome
 *
 * When an update or delete touches no row, the version-check command (primary
 * key lookup of version and delete flag) is run on the same connection. No row,
 * or a soft-deleted row, yields EntityNotFound. A row at another version yields
 * ConcurrencyConflict carrying the current version. If the check itself fails the
 * conflict is reported with an unknown current version. Run both inside one
 * IMMEDIATE transaction so the check sees the state the write saw.
 */
class WriteCommand {
public:
    explicit WriteCommand(CommandContext write,
                          std::optional<CommandContext> versionCheck = std::nullopt);

    WriteCommand(WriteCommand&&) noexcept = default;
    WriteCommand& operator=(WriteCommand&&) noexcept = default;
    WriteCommand(const WriteCommand&) = delete;
    WriteCommand& operator=(const WriteCommand&) = delete;

    /// Affected row count on success
    Result<int> execute(storage::Database& db);

    [[nodiscard]] WriteState state() const { return state_; }
    [[nodiscard]] const CommandContext& context() const { return write_; }

private:
    Result<int> classifyZeroRows(storage::Database& db);

    CommandContext write_;
    std::optional<CommandContext> versionCheck_;
    WriteState state_ = WriteState::Building;
};

} // namespace persist::command
