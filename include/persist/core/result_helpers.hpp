// Copyright (c) 2025 Persist Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file result_helpers.hpp
 * @brief Error handling macros and utilities for Result<T>
 *
 * Provides TRY macros to reduce boilerplate in error handling code.
 * These macros implement early return on error, similar to Rust's ? operator.
 * The CO_ variants do the same from inside boost::asio::awaitable coroutines.
 */

#include <persist/core/types.h>

#include <utility>

namespace persist {

// ============================================================================
// TRY Macros - Early return on error
// ============================================================================

/**
 * @def PERSIST_TRY(expr)
 * @brief Evaluate expression and return early if it's an error
 *
 * Example:
 * @code
 * Result<void> doWork() {
 *     PERSIST_TRY(step1());  // Returns if step1() fails
 *     PERSIST_TRY(step2());  // Returns if step2() fails
 *     return {};
 * }
 * @endcode
 */
#define PERSIST_TRY(expr)                                                                          \
    do {                                                                                           \
        auto _persist_try_result = (expr);                                                         \
        if (!_persist_try_result.has_value()) {                                                    \
            return _persist_try_result.error();                                                    \
        }                                                                                          \
    } while (0)

/**
 * @def PERSIST_TRY_UNWRAP(var, expr)
 * @brief Declare and initialize variable from Result, returning error if failed
 *
 * Example:
 * @code
 * Result<int64_t> compute(storage::Database& db) {
 *     PERSIST_TRY_UNWRAP(stmt, db.prepare(sql));  // stmt is Statement
 *     PERSIST_TRY_UNWRAP(hasRow, stmt.step());     // hasRow is bool
 *     return hasRow ? stmt.getInt64(0) : 0;
 * }
 * @endcode
 */
#define PERSIST_TRY_UNWRAP(var, expr)                                                              \
    auto _persist_res_##var = (expr);                                                              \
    if (!_persist_res_##var.has_value()) {                                                         \
        return _persist_res_##var.error();                                                         \
    }                                                                                              \
    auto var = std::move(_persist_res_##var).value()

/**
 * @def PERSIST_TRY_ASSIGN(lhs, expr)
 * @brief Assign the value of a Result to an existing variable, returning error if failed
 */
#define PERSIST_TRY_ASSIGN(lhs, expr)                                                              \
    do {                                                                                           \
        auto _persist_assign_result = (expr);                                                      \
        if (!_persist_assign_result.has_value()) {                                                 \
            return _persist_assign_result.error();                                                 \
        }                                                                                          \
        lhs = std::move(_persist_assign_result).value();                                           \
    } while (0)

/**
 * @def PERSIST_CO_TRY(expr)
 * @brief PERSIST_TRY for coroutines returning awaitable<Result<T>>
 */
#define PERSIST_CO_TRY(expr)                                                                       \
    do {                                                                                           \
        auto _persist_try_result = (expr);                                                         \
        if (!_persist_try_result.has_value()) {                                                    \
            co_return _persist_try_result.error();                                                 \
        }                                                                                          \
    } while (0)

/**
 * @def PERSIST_CO_TRY_UNWRAP(var, expr)
 * @brief PERSIST_TRY_UNWRAP for coroutines; expr may itself be a co_await expression
 */
#define PERSIST_CO_TRY_UNWRAP(var, expr)                                                           \
    auto _persist_res_##var = (expr);                                                              \
    if (!_persist_res_##var.has_value()) {                                                         \
        co_return _persist_res_##var.error();                                                      \
    }                                                                                              \
    auto var = std::move(_persist_res_##var).value()

// ============================================================================
// Scope Guard for RAII-style cleanup
// ============================================================================

/**
 * @brief Execute cleanup code on scope exit
 *
 * Example:
 * @code
 * Result<void> doWork(storage::Database& db) {
 *     PERSIST_TRY(db.beginTransaction());
 *     auto rollback = scope_exit([&] { (void)db.rollback(); });
 *     PERSIST_TRY(step1());
 *     PERSIST_TRY(db.commit());
 *     rollback.dismiss();
 *     return {};
 * }
 * @endcode
 */
template <typename Func> class ScopeGuard {
public:
    explicit ScopeGuard(Func func) : func_(std::move(func)) {}

    ~ScopeGuard() {
        if (active_) {
            func_();
        }
    }

    // Move-only
    ScopeGuard(ScopeGuard&& other) noexcept
        : func_(std::move(other.func_)), active_(other.active_) {
        other.active_ = false;
    }
    ScopeGuard& operator=(ScopeGuard&&) = delete;
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    void dismiss() noexcept { active_ = false; }

private:
    Func func_;
    bool active_ = true;
};

template <typename Func> ScopeGuard<Func> scope_exit(Func func) {
    return ScopeGuard<Func>(std::move(func));
}

} // namespace persist
