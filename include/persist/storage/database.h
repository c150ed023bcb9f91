#pragma once

#include <persist/core/types.h>
#include <persist/core/value.h>
#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace persist::storage {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief Transaction locking behaviour
 */
enum class TransactionMode {
    Deferred, ///< BEGIN: locks are taken lazily
    Immediate ///< BEGIN IMMEDIATE: reserve the write lock up front
};

/**
 * @brief Build an Error from a SQLite result code
 *
 * Constraint failures map to ConstraintViolation, interrupted statements to Timeout,
 * everything else to DatabaseError. The extended result code is kept in nativeCode.
 */
Error makeStorageError(sqlite3* db, int rc, std::string_view context);

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement (1-based index)
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const Value& value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind a named parameter such as "@p0" or "@Name"
     *
     * Names absent from the statement text are an InvalidArgument error.
     */
    Result<void> bind(const std::string& name, const Value& value);

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    /**
     * @brief Get column values
     */
    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    Value getValue(int column) const;

    int columnCount() const;


private:
    sqlite3_stmt* stmt_ = nullptr;

    Result<void> checkBind(int rc, const char* what);
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);

    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries)
     */
    Result<void> execute(const std::string& sql);

    Result<void> beginTransaction(TransactionMode mode = TransactionMode::Deferred);
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     *
     * func returns Result<T>; a failed result or an exception rolls back.
     */
    template <typename Func>
    auto transaction(Func&& func, TransactionMode mode = TransactionMode::Immediate)
        -> decltype(func()) {
        auto beginResult = beginTransaction(mode);
        if (!beginResult)
            return beginResult.error();

        try {
            auto result = func();
            if (!result) {
                rollbackQuietly();
                return result;
            }
            auto commitResult = commit();
            if (!commitResult) {
                rollbackQuietly();
                return commitResult.error();
            }
            return result;
        } catch (...) {
            rollbackQuietly();
            throw;
        }
    }

    int64_t lastInsertRowId() const;

    /**
     * @brief Get number of rows affected by last query
     */
    int changes() const;

    Result<bool> tableExists(const std::string& table);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Set the per-command timeout; zero disables it
     *
     * The deadline starts at armCommandDeadline(). Statements still running past
     * it are interrupted and fail with ErrorCode::Timeout.
     */
    void setCommandTimeout(std::chrono::milliseconds timeout);
    void armCommandDeadline();
    void disarmCommandDeadline();
    [[nodiscard]] bool commandDeadlineArmed() const { return deadlineArmed_; }

    /**
     * @brief Run "PRAGMA name = value"
     */
    Result<void> pragma(std::string_view name, std::string_view value);

    /**
     * @brief Read a single-valued pragma such as journal_mode
     */
    Result<std::string> pragmaValue(std::string_view name);


private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
    std::chrono::milliseconds commandTimeout_{0};
    std::chrono::steady_clock::time_point deadline_{};
    bool deadlineArmed_ = false;

    static int progressHandler(void* self);
    void installProgressHandler();
    void rollbackQuietly();
};

} // namespace persist::storage
