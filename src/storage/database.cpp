#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <type_traits>
#include <persist/storage/database.h>

namespace persist::storage {

Error makeStorageError(sqlite3* db, int rc, std::string_view context) {
    int extended = db ? sqlite3_extended_errcode(db) : rc;
    if ((extended & 0xff) != (rc & 0xff)) {
        extended = rc;
    }
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    std::string message = std::string(context) + ": " + detail;

    ErrorCode code = ErrorCode::DatabaseError;
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            code = ErrorCode::ConstraintViolation;
            break;
        case SQLITE_INTERRUPT:
            code = ErrorCode::Timeout;
            break;
        default:
            break;
    }
    return Error{code, std::move(message), extended};
}

// Statement implementation
Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::checkBind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return makeStorageError(sqlite3_db_handle(stmt_), rc,
                                std::string("Failed to bind ") + what);
    }
    return {};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return checkBind(sqlite3_bind_null(stmt_, index), "null");
}

Result<void> Statement::bind(int index, int value) {
    return checkBind(sqlite3_bind_int(stmt_, index, value), "int");
}

Result<void> Statement::bind(int index, int64_t value) {
    return checkBind(sqlite3_bind_int64(stmt_, index, value), "int64");
}

Result<void> Statement::bind(int index, double value) {
    return checkBind(sqlite3_bind_double(stmt_, index, value), "double");
}

Result<void> Statement::bind(int index, const std::string& value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.c_str(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT),
                     "string");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return checkBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT),
                     "string_view");
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    return checkBind(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                       SQLITE_TRANSIENT),
                     "blob");
}

Result<void> Statement::bind(int index, const Value& value) {
    return std::visit(
        [&](const auto& v) -> Result<void> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, ByteVector>) {
                return bind(index, std::span<const std::byte>(v.data(), v.size()));
            } else {
                return bind(index, v);
            }
        },
        value);
}

Result<void> Statement::bind(const std::string& name, const Value& value) {
    int index = sqlite3_bind_parameter_index(stmt_, name.c_str());
    if (index == 0) {
        return Error{ErrorCode::InvalidArgument, "Unknown SQL parameter: " + name};
    }
    return bind(index, value);
}

Result<void> Statement::execute() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return {};
    }
    // Include SQL snippet for constraint failures to aid debugging
    std::string context = "Failed to execute statement";
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        const char* sql = sqlite3_sql(stmt_);
        if (sql) {
            std::string sqlSnippet(sql, std::min(strlen(sql), size_t{100}));
            context += " [SQL: " + sqlSnippet + (strlen(sql) > 100 ? "..." : "") + "]";
        }
    }
    auto error = makeStorageError(sqlite3_db_handle(stmt_), rc, context);
    sqlite3_reset(stmt_);
    return error;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    } else if (rc == SQLITE_DONE) {
        return false;
    }
    auto error = makeStorageError(sqlite3_db_handle(stmt_), rc, "Failed to step statement");
    sqlite3_reset(stmt_);
    return error;
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(size);
    std::memcpy(result.data(), blob, size);
    return result;
}

Value Statement::getValue(int column) const {
    switch (sqlite3_column_type(stmt_, column)) {
        case SQLITE_INTEGER:
            return getInt64(column);
        case SQLITE_FLOAT:
            return getDouble(column);
        case SQLITE_TEXT:
            return getString(column);
        case SQLITE_BLOB:
            return getBlob(column);
        default:
            return nullptr;
    }
}

int Statement::columnCount() const {
    return sqlite3_column_count(stmt_);
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_),
      commandTimeout_(other.commandTimeout_), deadline_(other.deadline_),
      deadlineArmed_(other.deadlineArmed_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
    // The progress handler carries `this`; point it at the new owner
    installProgressHandler();
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        commandTimeout_ = other.commandTimeout_;
        deadline_ = other.deadline_;
        deadlineArmed_ = other.deadlineArmed_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
        installProgressHandler();
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = 0;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            flags = SQLITE_OPEN_READONLY;
            break;
        case ConnectionMode::ReadWrite:
            flags = SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }
    flags |= SQLITE_OPEN_NOMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto error = makeStorageError(db_, rc, "Failed to open database '" + path + "'");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return error;
    }

    sqlite3_extended_result_codes(db_, 1);
    installProgressHandler();

    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        spdlog::debug("[Database] closed '{}'", path_);
    }
    path_.clear();
    inTransaction_ = false;
    deadlineArmed_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        spdlog::error("[Database] prepare failed ({}): {}", sqlite3_errmsg(db_), sql);
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return makeStorageError(db_, rc, "Failed to prepare statement");
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        spdlog::error("[Database] SQL exec failed ({}): {}", error, sql);
        return makeStorageError(db_, rc, "Failed to execute SQL");
    }
    return {};
}

Result<void> Database::beginTransaction(TransactionMode mode) {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }

    auto result = execute(mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false; // Always clear flag, even on error
    return result;
}

void Database::rollbackQuietly() {
    if (auto rolledBack = rollback(); !rolledBack)
        spdlog::warn("[Database] rollback failed: {}", rolledBack.error().message);
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master "
                              "WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stepResult.value() && stmt.getInt64(0) > 0;
}

} // namespace persist::storage
