#include <gtest/gtest.h>
#include <persist/storage/connection_pool.h>

#include "../../common/test_entities.h"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

using namespace persist;
using namespace persist::storage;
using namespace std::chrono_literals;

class ConnectionPoolTest : public ::testing::Test {
protected:
    void SetUp() override { dbPath_ = test::tempDatabasePath("persist_pool_test"); }

    void TearDown() override { test::removeDatabaseFiles(dbPath_); }

    std::shared_ptr<ConnectionPool> makePool(size_t maxConnections) {
        ConnectionPoolConfig config;
        config.maxConnections = maxConnections;
        config.connectionPragmas = {{"foreign_keys", "ON"}, {"synchronous", "NORMAL"}};
        return std::make_shared<ConnectionPool>(dbPath_.string(), config);
    }

    std::filesystem::path dbPath_;
};

TEST_F(ConnectionPoolTest, AcquireAndReturn) {
    auto pool = makePool(2);
    {
        auto conn = pool->acquire(1000ms);
        ASSERT_TRUE(conn.has_value());
        EXPECT_TRUE(conn.value()->isValid());
        EXPECT_TRUE((*conn.value())->isOpen());
        EXPECT_EQ(pool->getStats().activeConnections, 1u);
    }
    auto stats = pool->getStats();
    EXPECT_EQ(stats.activeConnections, 0u);
    EXPECT_EQ(stats.availableConnections, 1u);
    EXPECT_EQ(stats.totalAcquired, 1u);
}

TEST_F(ConnectionPoolTest, AppliesConnectionPragmas) {
    auto pool = makePool(1);
    auto conn = pool->acquire(1000ms);
    ASSERT_TRUE(conn);
    auto fk = (*conn.value())->pragmaValue("foreign_keys");
    ASSERT_TRUE(fk);
    EXPECT_EQ(fk.value(), "1");
}

TEST_F(ConnectionPoolTest, ExhaustedPoolTimesOut) {
    auto pool = makePool(1);
    auto held = pool->acquire(1000ms);
    ASSERT_TRUE(held);

    auto second = pool->acquire(50ms);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::Timeout);
    EXPECT_EQ(pool->getStats().failedAcquisitions, 1u);
}

TEST_F(ConnectionPoolTest, WaiterGetsReturnedConnection) {
    auto pool = makePool(1);
    auto acquired = pool->acquire(1000ms);
    ASSERT_TRUE(acquired);
    auto held = std::move(acquired).value();

    std::thread releaser([&] {
        std::this_thread::sleep_for(30ms);
        held.reset();
    });
    auto waited = pool->acquire(2000ms);
    releaser.join();
    ASSERT_TRUE(waited);
    EXPECT_EQ(pool->getStats().totalConnections, 1u);
}

TEST_F(ConnectionPoolTest, DiscardReleasesTheSlot) {
    auto pool = makePool(1);
    {
        auto conn = pool->acquire(1000ms);
        ASSERT_TRUE(conn);
        conn.value()->discard();
        EXPECT_FALSE(conn.value()->isValid());
    }
    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 0u);
    EXPECT_EQ(stats.activeConnections, 0u);

    auto again = pool->acquire(50ms);
    EXPECT_TRUE(again.has_value());
}

TEST_F(ConnectionPoolTest, WaiterGetsDiscardedSlot) {
    auto pool = makePool(1);
    auto acquired = pool->acquire(1000ms);
    ASSERT_TRUE(acquired);
    auto held = std::move(acquired).value();

    std::thread discarder([&] {
        std::this_thread::sleep_for(30ms);
        held->discard();
    });
    auto waited = pool->acquire(2000ms);
    discarder.join();
    ASSERT_TRUE(waited) << waited.error().message;
    EXPECT_TRUE((*waited.value())->isOpen());

    auto stats = pool->getStats();
    EXPECT_EQ(stats.totalConnections, 1u);
    EXPECT_EQ(stats.activeConnections, 1u);
    EXPECT_EQ(stats.failedAcquisitions, 0u);
}

TEST_F(ConnectionPoolTest, OpenTransactionIsRolledBackOnReturn) {
    auto pool = makePool(1);
    {
        auto conn = pool->acquire(1000ms);
        ASSERT_TRUE(conn);
        auto& db = **conn.value();
        ASSERT_TRUE(db.execute("CREATE TABLE t (id INTEGER)"));
        ASSERT_TRUE(db.beginTransaction());
        ASSERT_TRUE(db.execute("INSERT INTO t VALUES (1)"));
    }
    auto conn = pool->acquire(1000ms);
    ASSERT_TRUE(conn);
    auto& db = **conn.value();
    EXPECT_FALSE(db.inTransaction());
    auto stmt = db.prepare("SELECT COUNT(*) FROM t");
    ASSERT_TRUE(stmt);
    ASSERT_TRUE(stmt.value().step().value());
    EXPECT_EQ(stmt.value().getInt64(0), 0);
}

TEST_F(ConnectionPoolTest, ShutdownRejectsAcquire) {
    auto pool = makePool(2);
    pool->shutdown();
    auto conn = pool->acquire(10ms);
    ASSERT_FALSE(conn);
    EXPECT_EQ(conn.error().code, ErrorCode::InvalidState);
}
