#pragma once

#include <persist/core/caller_info.h>
#include <persist/core/result_helpers.hpp>
#include <persist/provider/operation_types.h>
#include <persist/provider/repository.h>
#include <persist/provider/repository_support.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace persist::provider {

/**
 * @brief Queue of creates, updates and removes applied atomically on commit
 *
 * Operations are collected while Active and run in order inside one IMMEDIATE
 * transaction by commit(); any failure rolls all of them back and leaves the
 * scope Failed. A scope destroyed with queued operations discards them. The
 * scope must outlive the awaited commit().
 *
 * @code
 * TransactionScope<Order> tx(*repo);
 * tx.addCreate(order);
 * tx.addRemove({Value{oldId}}, oldVersion);
 * auto written = co_await tx.commit(CallerInfo::current());
 * @endcode
 */
template <mapping::MappedEntity T> class TransactionScope {
public:
    template <typename R> using Task = boost::asio::awaitable<Result<R>>;

    explicit TransactionScope(Repository<T>& repository)
        : repository_(repository),
          id_(nextTransactionId()),
          startTime_(std::chrono::system_clock::now()) {
        spdlog::debug("[Transaction] {} started for {}", id_,
                      repository_.descriptor().entityName());
    }

    ~TransactionScope() {
        std::lock_guard lock(mutex_);
        if (state_ == TransactionState::Active && !operations_.empty()) {
            spdlog::warn("[Transaction] {} dropped with {} uncommitted operations", id_,
                         operations_.size());
        }
    }

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] TimePoint startTime() const { return startTime_; }

    [[nodiscard]] TransactionState state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    [[nodiscard]] size_t pendingCount() const {
        std::lock_guard lock(mutex_);
        return operations_.size();
    }

    Result<void> addCreate(T entity) {
        TransactionalOperation<T> op;
        op.kind = OperationKind::Create;
        op.entity = std::move(entity);
        return enqueue(std::move(op));
    }

    /// Checked against the version carried by entity
    Result<void> addUpdate(T entity) {
        TransactionalOperation<T> op;
        op.kind = OperationKind::Update;
        op.entity = std::move(entity);
        return enqueue(std::move(op));
    }

    Result<void> addRemove(mapping::KeyValues key, int64_t expectedVersion) {
        TransactionalOperation<T> op;
        op.kind = OperationKind::Remove;
        op.key = std::move(key);
        op.expectedVersion = expectedVersion;
        return enqueue(std::move(op));
    }

    /**
     * @brief Run the queued operations; outputs align with the add calls
     *
     * Creates and updates yield the stored row, removes yield nullopt.
     */
    Task<std::vector<std::optional<T>>> commit(CallerInfo caller = {},
                                               std::stop_token token = {}) {
        std::vector<TransactionalOperation<T>> operations;
        {
            std::lock_guard lock(mutex_);
            if (state_ != TransactionState::Active) {
                co_return Error{ErrorCode::InvalidState,
                                fmt::format("Transaction {} is {}", id_, toString(state_))};
            }
            state_ = TransactionState::Committing;
            operations.swap(operations_);
        }

        auto failed = scope_exit([this] { setState(TransactionState::Failed); });
        if (operations.empty()) {
            failed.dismiss();
            setState(TransactionState::Committed);
            co_return std::vector<std::optional<T>>{};
        }

        auto outputs = co_await repository_.commitOperations(operations, std::move(caller), token);
        if (!outputs) {
            setState(TransactionState::RollingBack);
            spdlog::warn("[Transaction] {} rolled back {} operations: {}", id_,
                         operations.size(), outputs.error().message);
            co_return outputs.error();
        }

        failed.dismiss();
        setState(TransactionState::Committed);
        spdlog::debug("[Transaction] {} committed {} operations", id_, operations.size());
        co_return outputs;
    }

    /// Discard the queued operations; the scope cannot be used afterwards
    Result<void> rollback() {
        std::lock_guard lock(mutex_);
        if (state_ != TransactionState::Active) {
            return Error{ErrorCode::InvalidState,
                         fmt::format("Transaction {} is {}", id_, toString(state_))};
        }
        spdlog::debug("[Transaction] {} discarded {} operations", id_, operations_.size());
        operations_.clear();
        state_ = TransactionState::Failed;
        return {};
    }

private:
    Result<void> enqueue(TransactionalOperation<T> op) {
        std::lock_guard lock(mutex_);
        if (state_ != TransactionState::Active) {
            return Error{ErrorCode::InvalidState,
                         fmt::format("Transaction {} is {}; no more operations accepted", id_,
                                     toString(state_))};
        }
        operations_.push_back(std::move(op));
        return {};
    }

    void setState(TransactionState state) {
        std::lock_guard lock(mutex_);
        state_ = state;
    }

    Repository<T>& repository_;
    std::string id_;
    TimePoint startTime_;
    mutable std::mutex mutex_;
    TransactionState state_ = TransactionState::Active;
    std::vector<TransactionalOperation<T>> operations_;
};

} // namespace persist::provider
