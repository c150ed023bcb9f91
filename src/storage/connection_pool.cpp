#include <spdlog/spdlog.h>
#include <persist/storage/connection_pool.h>

namespace persist::storage {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(std::unique_ptr<Database>)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_) {
        returnFunc_(std::move(db_));
    }
}

void PooledConnection::discard() {
    db_.reset();
    if (returnFunc_) {
        // Releases the slot; a null connection is closed instead of pooled
        returnFunc_(nullptr);
        returnFunc_ = nullptr;
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(std::string dbPath, ConnectionPoolConfig config)
    : dbPath_(std::move(dbPath)), config_(std::move(config)) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return;
    }
    shutdown_ = true;
    while (!available_.empty()) {
        available_.pop();
    }
    totalConnections_ = activeConnections_;
    cv_.notify_all();
    spdlog::debug("[ConnectionPool] shut down ({})", dbPath_);
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    std::weak_ptr<ConnectionPool> weak = weak_from_this();
    ConnectionPool* raw = weak.expired() ? this : nullptr;
    return std::make_unique<PooledConnection>(
        std::move(db), [weak, raw](std::unique_ptr<Database> returned) {
            if (auto pool = weak.lock()) {
                pool->returnConnection(std::move(returned));
            } else if (raw) {
                // Pool not owned by a shared_ptr; the caller guarantees it outlives connections
                raw->returnConnection(std::move(returned));
            }
        });
}

Result<std::unique_ptr<PooledConnection>>
ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (shutdown_) {
            failedAcquisitions_++;
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }

        // Reuse an idle connection unless it sat too long
        while (!available_.empty()) {
            Idle idle = std::move(available_.front());
            available_.pop();
            if (std::chrono::steady_clock::now() - idle.since >= config_.idleTimeout) {
                totalConnections_--;
                spdlog::debug("[ConnectionPool] pruned idle connection");
                continue;
            }
            activeConnections_++;
            totalAcquired_++;
            lock.unlock();
            return wrap(std::move(idle.db));
        }

        // Can we create a new connection?
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            activeConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            if (!connResult) {
                lock.lock();
                totalConnections_--;
                activeConnections_--;
                failedAcquisitions_++;
                return connResult.error();
            }
            totalAcquired_++;
            return wrap(std::move(connResult).value());
        }

        // A returned connection and a released slot (discard, failed open) both unblock
        const bool ready = cv_.wait_until(lock, deadline, [this] {
            return shutdown_ || !available_.empty() ||
                   totalConnections_ < config_.maxConnections;
        });
        if (!ready) {
            failedAcquisitions_++;
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }
    }
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {totalConnections_, available_.size(), activeConnections_, totalAcquired_.load(),
            failedAcquisitions_.load()};
}

void ConnectionPool::returnConnection(std::unique_ptr<Database> db) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeConnections_ > 0) {
        activeConnections_--;
    }
    if (shutdown_ || !db || !db->isOpen()) {
        if (totalConnections_ > 0) {
            totalConnections_--;
        }
        cv_.notify_one();
        return;
    }
    if (db->inTransaction()) {
        // A caller left a transaction open; never hand that state to someone else
        spdlog::warn("[ConnectionPool] connection returned inside a transaction, rolling back");
        auto rb = db->rollback();
        if (!rb) {
            spdlog::warn("[ConnectionPool] rollback failed: {}", rb.error().message);
            totalConnections_--;
            cv_.notify_one();
            return;
        }
    }
    db->disarmCommandDeadline();
    available_.push(Idle{std::move(db), std::chrono::steady_clock::now()});
    cv_.notify_one();
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult;
    }
    db.setCommandTimeout(config_.commandTimeout);

    for (const auto& [name, value] : config_.connectionPragmas) {
        auto pragmaResult = db.pragma(name, value);
        if (!pragmaResult) {
            spdlog::warn("[ConnectionPool] PRAGMA {} = {} failed: {}", name, value,
                         pragmaResult.error().message);
            return pragmaResult;
        }
    }
    return {};
}

} // namespace persist::storage
