#include <gtest/gtest.h>
#include <persist/core/result_helpers.hpp>
#include <persist/storage/database.h>

#include "../../common/test_entities.h"

#include <sqlite3.h>
#include <chrono>
#include <filesystem>

using namespace persist;
using namespace persist::storage;

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override { dbPath_ = test::tempDatabasePath("persist_database_test"); }

    void TearDown() override { test::removeDatabaseFiles(dbPath_); }

    Database openDatabase() {
        Database db;
        auto result = db.open(dbPath_.string(), ConnectionMode::Create);
        EXPECT_TRUE(result.has_value());
        return db;
    }

    std::filesystem::path dbPath_;
};

TEST_F(DatabaseTest, OpenClose) {
    Database db;
    ASSERT_FALSE(db.isOpen());

    auto result = db.open(dbPath_.string(), ConnectionMode::Create);
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(db.isOpen());

    db.close();
    ASSERT_FALSE(db.isOpen());
}

TEST_F(DatabaseTest, CreateTable) {
    auto db = openDatabase();

    auto result = db.execute(R"(
        CREATE TABLE test_table (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            value REAL
        )
    )");
    ASSERT_TRUE(result.has_value());

    auto exists = db.tableExists("test_table");
    ASSERT_TRUE(exists.has_value());
    EXPECT_TRUE(exists.value());

    auto missing = db.tableExists("other_table");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing.value());
}

TEST_F(DatabaseTest, PreparedStatements) {
    auto db = openDatabase();
    ASSERT_TRUE(db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT, value INTEGER)"));

    auto insertStmtResult = db.prepare("INSERT INTO test (name, value) VALUES (?, ?)");
    ASSERT_TRUE(insertStmtResult.has_value());
    Statement insertStmt = std::move(insertStmtResult).value();

    ASSERT_TRUE(insertStmt.bind(1, "Test1").has_value());
    ASSERT_TRUE(insertStmt.bind(2, 42).has_value());
    ASSERT_TRUE(insertStmt.execute().has_value());
    EXPECT_EQ(db.changes(), 1);
    EXPECT_EQ(db.lastInsertRowId(), 1);

    auto selectStmtResult = db.prepare("SELECT name, value FROM test WHERE id = ?");
    ASSERT_TRUE(selectStmtResult.has_value());
    Statement selectStmt = std::move(selectStmtResult).value();
    ASSERT_TRUE(selectStmt.bind(1, int64_t{1}).has_value());

    auto stepResult = selectStmt.step();
    ASSERT_TRUE(stepResult.has_value());
    ASSERT_TRUE(stepResult.value());
    EXPECT_EQ(selectStmt.getString(0), "Test1");
    EXPECT_EQ(selectStmt.getInt64(1), 42);
}

TEST_F(DatabaseTest, NamedParametersBindValues) {
    auto db = openDatabase();
    ASSERT_TRUE(db.execute("CREATE TABLE items (Name TEXT, Qty INTEGER, Note TEXT)"));

    auto insert = db.prepare("INSERT INTO items (Name, Qty, Note) VALUES (@Name, @p0, @Note)");
    ASSERT_TRUE(insert);
    auto stmt = std::move(insert).value();
    ASSERT_TRUE(stmt.bind("@Name", Value{std::string("bolt")}));
    ASSERT_TRUE(stmt.bind("@p0", Value{int64_t{12}}));
    ASSERT_TRUE(stmt.bind("@Note", Value{nullptr}));
    ASSERT_TRUE(stmt.execute());

    auto select = db.prepare("SELECT Name, Qty, Note FROM items");
    ASSERT_TRUE(select);
    auto row = std::move(select).value();
    ASSERT_TRUE(row.step().value());
    EXPECT_EQ(row.getValue(0), Value{std::string("bolt")});
    EXPECT_EQ(row.getValue(1), Value{int64_t{12}});
    EXPECT_EQ(row.getValue(2), Value{nullptr});
}

TEST_F(DatabaseTest, UnknownNamedParameterIsRejected) {
    auto db = openDatabase();
    ASSERT_TRUE(db.execute("CREATE TABLE items (Name TEXT)"));
    auto stmt = db.prepare("SELECT Name FROM items WHERE Name = @p0");
    ASSERT_TRUE(stmt);

    auto bound = stmt.value().bind("@p1", Value{std::string("x")});
    ASSERT_FALSE(bound);
    EXPECT_EQ(bound.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DatabaseTest, Transactions) {
    auto db = openDatabase();
    db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY, value INTEGER)");

    // Successful transaction
    {
        auto result = db.transaction([&]() -> Result<void> {
            PERSIST_TRY(db.execute("INSERT INTO test (value) VALUES (1)"));
            return db.execute("INSERT INTO test (value) VALUES (2)");
        });
        ASSERT_TRUE(result.has_value());
        EXPECT_FALSE(db.inTransaction());
    }

    // Failed transaction rolls back
    {
        auto result = db.transaction([&]() -> Result<void> {
            PERSIST_TRY(db.execute("INSERT INTO test (value) VALUES (3)"));
            return Error{ErrorCode::InvalidState, "abort"};
        });
        ASSERT_FALSE(result.has_value());
        EXPECT_FALSE(db.inTransaction());
    }

    auto count = db.prepare("SELECT COUNT(*) FROM test");
    ASSERT_TRUE(count);
    auto stmt = std::move(count).value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getInt64(0), 2);
}

TEST_F(DatabaseTest, NestedBeginIsInvalidState) {
    auto db = openDatabase();
    ASSERT_TRUE(db.beginTransaction(TransactionMode::Immediate));
    auto nested = db.beginTransaction();
    ASSERT_FALSE(nested);
    EXPECT_EQ(nested.error().code, ErrorCode::InvalidState);
    ASSERT_TRUE(db.rollback());
}

TEST_F(DatabaseTest, ConstraintFailureKeepsExtendedCode) {
    auto db = openDatabase();
    ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT UNIQUE)"));
    ASSERT_TRUE(db.execute("INSERT INTO t (name) VALUES ('a')"));

    auto duplicate = db.execute("INSERT INTO t (name) VALUES ('a')");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ConstraintViolation);
    EXPECT_EQ(duplicate.error().nativeCode, SQLITE_CONSTRAINT_UNIQUE);
}

TEST_F(DatabaseTest, SecondWriterSeesBusy) {
    auto first = openDatabase();
    auto second = openDatabase();
    ASSERT_TRUE(first.execute("CREATE TABLE t (id INTEGER PRIMARY KEY)"));
    ASSERT_TRUE(second.setBusyTimeout(std::chrono::milliseconds(0)));

    ASSERT_TRUE(first.beginTransaction(TransactionMode::Immediate));
    auto blocked = second.beginTransaction(TransactionMode::Immediate);
    ASSERT_FALSE(blocked);
    EXPECT_EQ(blocked.error().nativeCode & 0xFF, SQLITE_BUSY);
    ASSERT_TRUE(first.rollback());
}

TEST_F(DatabaseTest, CommandDeadlineInterruptsLongQuery) {
    auto db = openDatabase();
    db.setCommandTimeout(std::chrono::milliseconds(50));
    db.armCommandDeadline();
    EXPECT_TRUE(db.commandDeadlineArmed());

    auto stmt = db.prepare("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) "
                           "SELECT COUNT(*) FROM c");
    ASSERT_TRUE(stmt);
    auto stepped = stmt.value().step();
    db.disarmCommandDeadline();

    ASSERT_FALSE(stepped);
    EXPECT_EQ(stepped.error().code, ErrorCode::Timeout);
    EXPECT_FALSE(db.commandDeadlineArmed());
}

TEST_F(DatabaseTest, PragmaRoundTrip) {
    auto db = openDatabase();
    ASSERT_TRUE(db.pragma("journal_mode", "WAL"));
    auto mode = db.pragmaValue("journal_mode");
    ASSERT_TRUE(mode);
    EXPECT_EQ(mode.value(), "wal");
}
