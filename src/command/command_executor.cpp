#include <persist/command/command_executor.h>
#include <persist/core/result_helpers.hpp>

#include <spdlog/spdlog.h>

namespace persist::command {

const char* toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::Insert: return "INSERT";
        case CommandKind::Update: return "UPDATE";
        case CommandKind::Delete: return "DELETE";
        case CommandKind::SoftDelete: return "SOFT DELETE";
        case CommandKind::Revive: return "REVIVE";
        case CommandKind::Select: return "SELECT";
        case CommandKind::Count: return "COUNT";
    }
    return "UNKNOWN";
}

const char* toString(WriteState state) {
    switch (state) {
        case WriteState::Building: return "Building";
        case WriteState::Executing: return "Executing";
        case WriteState::Committed: return "Committed";
        case WriteState::ConflictDetected: return "ConflictDetected";
        case WriteState::NotFound: return "NotFound";
        case WriteState::Faulted: return "Faulted";
    }
    return "Unknown";
}

namespace {

// Arms the per-command deadline unless the caller already armed one for the attempt
class DeadlineScope {
public:
    DeadlineScope(storage::Database& db, std::chrono::milliseconds timeout) : db_(db) {
        if (!db_.commandDeadlineArmed()) {
            db_.setCommandTimeout(timeout);
            db_.armCommandDeadline();
            owned_ = true;
        }
    }
    ~DeadlineScope() {
        if (owned_)
            db_.disarmCommandDeadline();
    }
    DeadlineScope(const DeadlineScope&) = delete;
    DeadlineScope& operator=(const DeadlineScope&) = delete;

private:
    storage::Database& db_;
    bool owned_ = false;
};

} // namespace

Result<storage::Statement> prepareCommand(storage::Database& db, const CommandContext& ctx) {
    PERSIST_TRY_UNWRAP(stmt, db.prepare(ctx.sql()));
    for (const auto& [name, value] : ctx.parameters()) {
        PERSIST_TRY(stmt.bind(name, value));
    }
    return stmt;
}

Result<std::vector<Row>> queryRows(storage::Database& db, CommandContext ctx) {
    DeadlineScope deadline(db, ctx.timeout());
    PERSIST_TRY_UNWRAP(stmt, prepareCommand(db, ctx));

    std::vector<Row> rows;
    while (true) {
        PERSIST_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        Row row;
        row.reserve(static_cast<size_t>(stmt.columnCount()));
        for (int i = 0; i < stmt.columnCount(); ++i)
            row.push_back(stmt.getValue(i));
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<Value> queryScalar(storage::Database& db, CommandContext ctx) {
    DeadlineScope deadline(db, ctx.timeout());
    PERSIST_TRY_UNWRAP(stmt, prepareCommand(db, ctx));
    PERSIST_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow) {
        return Error{ErrorCode::NotFound, "Query returned no rows"};
    }
    return stmt.getValue(0);
}

WriteCommand::WriteCommand(CommandContext write, std::optional<CommandContext> versionCheck)
    : write_(std::move(write)), versionCheck_(std::move(versionCheck)) {}

Result<int> WriteCommand::execute(storage::Database& db) {
    if (state_ != WriteState::Building) {
        return Error{ErrorCode::InvalidState,
                     std::string("Write command already ran (state ") + toString(state_) + ")"};
    }
    if (!isWrite(write_.kind())) {
        state_ = WriteState::Faulted;
        return Error{ErrorCode::InvalidArgument,
                     std::string(toString(write_.kind())) + " is not a write command"};
    }
    state_ = WriteState::Executing;

    int affected = 0;
    {
        DeadlineScope deadline(db, write_.timeout());
        auto stmt = prepareCommand(db, write_);
        if (!stmt) {
            state_ = WriteState::Faulted;
            return stmt.error();
        }
        auto executed = stmt.value().execute();
        if (!executed) {
            state_ = WriteState::Faulted;
            return executed.error();
        }
        affected = db.changes();
    }

    if (affected > 0) {
        state_ = WriteState::Committed;
        return affected;
    }
    return classifyZeroRows(db);
}

Result<int> WriteCommand::classifyZeroRows(storage::Database& db) {
    const auto key = write_.entityKey();
    if (write_.kind() == CommandKind::Insert) {
        state_ = WriteState::Faulted;
        return Error{ErrorCode::InternalError, "Insert affected no rows for '" + key + "'"};
    }
    if (!versionCheck_) {
        state_ = WriteState::NotFound;
        return makeEntityNotFound(key);
    }

    const int64_t expected = write_.expectedVersion().value_or(0);
    auto rows = queryRows(db, std::move(*versionCheck_));
    versionCheck_.reset();
    if (!rows) {
        spdlog::warn("[Command] version check for '{}' failed: {}", key, rows.error().message);
        state_ = WriteState::Faulted;
        auto error = rows.error();
        if (error.entityKey.empty())
            error.entityKey = key;
        return error;
    }
    if (rows.value().empty()) {
        state_ = WriteState::NotFound;
        return makeEntityNotFound(key);
    }

    const auto& row = rows.value().front();
    const auto* deleted = row.size() > 1 ? std::get_if<int64_t>(&row[1]) : nullptr;
    if (deleted && *deleted != 0) {
        state_ = WriteState::NotFound;
        return makeEntityNotFound(key);
    }

    std::optional<int64_t> current;
    if (const auto* v = std::get_if<int64_t>(&row[0]))
        current = *v;
    state_ = WriteState::ConflictDetected;
    spdlog::debug("[Command] {} on '{}' lost: expected version {}, current {}",
                  toString(write_.kind()), key, expected,
                  current ? std::to_string(*current) : std::string("unknown"));
    return makeConcurrencyConflict(key, current, expected);
}

} // namespace persist::command
