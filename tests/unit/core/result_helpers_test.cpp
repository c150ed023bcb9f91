// Copyright (c) 2025 Persist Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file result_helpers_test.cpp
 * @brief Unit tests for Result<T>, the PERSIST_TRY family and scope_exit
 */

#include <gtest/gtest.h>

#include <persist/core/result_helpers.hpp>
#include <persist/core/types.h>

#include <fmt/format.h>

#include <string>

using namespace persist;

namespace {

Result<int> parsePositive(int value) {
    if (value <= 0)
        return Error{ErrorCode::InvalidArgument, "not positive"};
    return value;
}

Result<int> doubled(int value) {
    PERSIST_TRY_UNWRAP(parsed, parsePositive(value));
    return parsed * 2;
}

Result<void> checkAll(int a, int b) {
    PERSIST_TRY(parsePositive(a));
    PERSIST_TRY(parsePositive(b));
    return {};
}

Result<int> sumInto(int a, int b) {
    int total = 0;
    PERSIST_TRY_ASSIGN(total, parsePositive(a));
    int second = 0;
    PERSIST_TRY_ASSIGN(second, parsePositive(b));
    return total + second;
}

} // namespace

// ============================================================================
// Result<T>
// ============================================================================

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    Result<int> r = Error{ErrorCode::NotFound, "missing"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "missing");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidDefaultsToSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = ErrorCode::Timeout;
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "Operation timed out");
}

// ============================================================================
// TRY macros
// ============================================================================

TEST(ResultHelpersTest, TryUnwrapPropagatesError) {
    auto r = doubled(-1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(ResultHelpersTest, TryUnwrapYieldsValue) {
    auto r = doubled(21);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultHelpersTest, TryStopsAtFirstFailure) {
    EXPECT_TRUE(checkAll(1, 2).has_value());
    auto r = checkAll(1, 0);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().message, "not positive");
}

TEST(ResultHelpersTest, TryAssignWritesExistingVariable) {
    auto r = sumInto(2, 3);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 5);
    EXPECT_FALSE(sumInto(2, -3).has_value());
}

// ============================================================================
// scope_exit
// ============================================================================

TEST(ScopeExitTest, RunsOnScopeExit) {
    int calls = 0;
    {
        auto guard = scope_exit([&] { ++calls; });
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeExitTest, DismissSkipsCleanup) {
    int calls = 0;
    {
        auto guard = scope_exit([&] { ++calls; });
        guard.dismiss();
    }
    EXPECT_EQ(calls, 0);
}

// ============================================================================
// Typed errors
// ============================================================================

TEST(ErrorFactoryTest, ConcurrencyConflictCarriesVersions) {
    auto error = makeConcurrencyConflict("7", 3, 2);
    EXPECT_EQ(error.code, ErrorCode::ConcurrencyConflict);
    EXPECT_EQ(error.entityKey, "7");
    ASSERT_TRUE(error.conflict.has_value());
    EXPECT_EQ(error.conflict->currentVersion, 3);
    EXPECT_EQ(error.conflict->expectedVersion, 2);
}

TEST(ErrorFactoryTest, ConflictWithUnknownCurrentVersion) {
    auto error = makeConcurrencyConflict("7", std::nullopt, 2);
    ASSERT_TRUE(error.conflict.has_value());
    EXPECT_FALSE(error.conflict->currentVersion.has_value());
}

TEST(ErrorFactoryTest, KeyLevelOutcomesNameTheKey) {
    EXPECT_EQ(makeEntityNotFound("42").code, ErrorCode::EntityNotFound);
    EXPECT_EQ(makeEntityNotFound("42").entityKey, "42");
    EXPECT_EQ(makeEntityAlreadyExists("a|1").code, ErrorCode::EntityAlreadyExists);
    EXPECT_EQ(makeEntityAlreadyExists("a|1").entityKey, "a|1");
}

TEST(ErrorFactoryTest, ErrorCodeFormatsThroughFmt) {
    EXPECT_EQ(fmt::format("{}", ErrorCode::ConcurrencyConflict), "Concurrency conflict");
    EXPECT_EQ(fmt::format("{}", ErrorCode::UnsupportedExpression), "Unsupported expression");
}
