#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <utility>
#include <vector>
#include <persist/storage/database.h>

namespace persist::storage {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t maxConnections = 8;                 ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{5000}; ///< SQLite busy timeout
    std::chrono::milliseconds commandTimeout{30000}; ///< Per-attempt statement timeout
    std::chrono::seconds idleTimeout{300};     ///< Idle connection timeout
    /// PRAGMAs applied to every new connection, in order
    std::vector<std::pair<std::string, std::string>> connectionPragmas;
};

/**
 * @brief Database connection handed out exclusively to one operation
 *
 * Returned to the pool when destroyed.
 */
class PooledConnection {
public:
    PooledConnection(std::unique_ptr<Database> db,
                     std::function<void(std::unique_ptr<Database>)> returnFunc);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept = default;
    PooledConnection& operator=(PooledConnection&& other) noexcept = delete;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    const Database* operator->() const { return db_.get(); }
    Database& operator*() { return *db_; }
    const Database& operator*() const { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

    /**
     * @brief Drop the connection instead of returning it (e.g. after a broken transaction)
     */
    void discard();

private:
    std::unique_ptr<Database> db_;
    std::function<void(std::unique_ptr<Database>)> returnFunc_;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    explicit ConnectionPool(std::string dbPath, ConnectionPoolConfig config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    void shutdown();

    /**
     * @brief Acquire a connection, waiting up to timeout when the pool is exhausted
     */
    Result<std::unique_ptr<PooledConnection>>
    acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t totalAcquired;
        size_t failedAcquisitions;
    };

    [[nodiscard]] Stats getStats() const;

    [[nodiscard]] const std::string& path() const { return dbPath_; }

    [[nodiscard]] const ConnectionPoolConfig& config() const { return config_; }

private:
    struct Idle {
        std::unique_ptr<Database> db;
        std::chrono::steady_clock::time_point since;
    };

    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<Idle> available_;
    size_t totalConnections_ = 0;
    size_t activeConnections_ = 0;
    std::atomic<size_t> totalAcquired_{0};
    std::atomic<size_t> failedAcquisitions_{0};
    bool shutdown_ = false;

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(std::unique_ptr<Database> db);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace persist::storage
