#include <gtest/gtest.h>

#include <persist/mapping/schema_generator.h>

#include "../../common/test_entities.h"

using namespace persist;
using namespace persist::mapping;

namespace {

template <typename T> const MappingDescriptor& descriptorOf() {
    auto mapping = mappingFor<T>();
    EXPECT_TRUE(mapping) << mapping.error().message;
    return mapping.value()->descriptor();
}

} // namespace

TEST(SchemaGeneratorTest, CreateTableForProducts) {
    EXPECT_EQ(generateCreateTableSql(descriptorOf<test::Product>()),
              "CREATE TABLE IF NOT EXISTS Products (\n"
              "    Id INTEGER NOT NULL,\n"
              "    Name TEXT NOT NULL,\n"
              "    Value REAL NOT NULL,\n"
              "    Category TEXT,\n"
              "    Version INTEGER NOT NULL DEFAULT 1,\n"
              "    CreatedTime TEXT NOT NULL,\n"
              "    LastWriteTime TEXT NOT NULL,\n"
              "    IsDeleted INTEGER NOT NULL DEFAULT 0,\n"
              "    PRIMARY KEY (Id)\n"
              ");");
}

TEST(SchemaGeneratorTest, AutoIncrementKeyIsInline) {
    EXPECT_EQ(generateCreateTableSql(descriptorOf<test::LogEntry>()),
              "CREATE TABLE IF NOT EXISTS LogEntries (\n"
              "    Id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
              "    Message TEXT NOT NULL,\n"
              "    Level INTEGER NOT NULL DEFAULT 0\n"
              ");");
}

TEST(SchemaGeneratorTest, CompositeKeyUsesKeyOrder) {
    auto sql = generateCreateTableSql(descriptorOf<test::OrderLine>());
    EXPECT_NE(sql.find("    PRIMARY KEY (OrderId, LineNo)\n"), std::string::npos) << sql;
    // Columns stay in registration order
    EXPECT_LT(sql.find("LineNo INTEGER"), sql.find("OrderId TEXT"));
}

TEST(SchemaGeneratorTest, ReservedWordsAreQuoted) {
    const auto& d = descriptorOf<test::CacheEntry>();
    auto sql = generateCreateTableSql(d);
    EXPECT_NE(sql.find("    \"Key\" TEXT NOT NULL,\n"), std::string::npos) << sql;
    EXPECT_NE(sql.find("    AbsoluteExpiration TEXT,\n"), std::string::npos) << sql;
    EXPECT_NE(sql.find("PRIMARY KEY (\"Key\")"), std::string::npos) << sql;
    EXPECT_EQ(keyPredicate(d), "\"Key\" = @Key");
}

TEST(SchemaGeneratorTest, IndexStatements) {
    auto products = generateCreateIndexSql(descriptorOf<test::Product>());
    ASSERT_EQ(products.size(), 1u);
    EXPECT_EQ(products[0], "CREATE INDEX IF NOT EXISTS IX_Products_Name ON Products (Name);");

    auto lines = generateCreateIndexSql(descriptorOf<test::OrderLine>());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "CREATE INDEX IF NOT EXISTS IX_OrderLines_Quantity ON OrderLines "
                        "(Quantity DESC) WHERE Quantity > 0;");

    EXPECT_TRUE(generateCreateIndexSql(descriptorOf<test::LogEntry>()).empty());
}

TEST(SchemaGeneratorTest, LifecycleFilters) {
    EXPECT_EQ(softDeleteFilter(descriptorOf<test::Product>()), "IsDeleted = 0");
    EXPECT_EQ(expiryFilter(descriptorOf<test::Product>()), "");
    EXPECT_EQ(expiryFilter(descriptorOf<test::CacheEntry>()),
              "(AbsoluteExpiration IS NULL OR datetime(AbsoluteExpiration) > datetime('now'))");
    EXPECT_EQ(softDeleteFilter(descriptorOf<test::LogEntry>()), "");
}

TEST(SchemaGeneratorTest, ProductDmlTemplates) {
    auto t = generateDmlTemplates(descriptorOf<test::Product>());
    EXPECT_EQ(t.insert, "INSERT INTO Products (Id, Name, Value, Category, Version, CreatedTime, "
                        "LastWriteTime, IsDeleted) VALUES (@Id, @Name, @Value, @Category, "
                        "@Version, @CreatedTime, @LastWriteTime, @IsDeleted)");
    EXPECT_EQ(t.update, "UPDATE Products SET Name = @Name, Value = @Value, Category = @Category, "
                        "LastWriteTime = @LastWriteTime, Version = Version + 1 "
                        "WHERE Id = @Id AND Version = @expectedVersion AND IsDeleted = 0");
    EXPECT_EQ(t.softDelete, "UPDATE Products SET IsDeleted = 1, Version = Version + 1, "
                            "LastWriteTime = @LastWriteTime "
                            "WHERE Id = @Id AND Version = @expectedVersion AND IsDeleted = 0");
    EXPECT_EQ(t.deleteByKey, "DELETE FROM Products WHERE Id = @Id AND Version = @expectedVersion");
    EXPECT_EQ(t.versionByKey, "SELECT Version, IsDeleted FROM Products WHERE Id = @Id");
    EXPECT_EQ(t.count, "SELECT COUNT(*) FROM Products");
    EXPECT_NE(t.revive.find("IsDeleted = 0"), std::string::npos);
    EXPECT_NE(t.revive.find("CreatedTime = @CreatedTime"), std::string::npos);
    EXPECT_NE(t.revive.find("WHERE Id = @Id AND IsDeleted = 1"), std::string::npos);
}

TEST(SchemaGeneratorTest, UnversionedAutoIncrementTemplates) {
    auto t = generateDmlTemplates(descriptorOf<test::LogEntry>());
    EXPECT_EQ(t.insert, "INSERT INTO LogEntries (Message, Level) VALUES (@Message, @Level)");
    EXPECT_EQ(t.update, "UPDATE LogEntries SET Message = @Message, Level = @Level WHERE Id = @Id");
    EXPECT_EQ(t.deleteByKey, "DELETE FROM LogEntries WHERE Id = @Id");
    EXPECT_TRUE(t.softDelete.empty());
    EXPECT_TRUE(t.revive.empty());
    EXPECT_EQ(t.versionByKey, "SELECT NULL, 0 FROM LogEntries WHERE Id = @Id");
}

TEST(SqliteDialectTest, QuotingRules) {
    const auto& dialect = sqliteDialect();
    EXPECT_EQ(dialect.quoteIdentifier("Name"), "Name");
    EXPECT_EQ(dialect.quoteIdentifier("order"), "\"order\"");
    EXPECT_EQ(dialect.quoteIdentifier("Unit Price"), "\"Unit Price\"");
    EXPECT_EQ(dialect.quoteIdentifier("a\"b"), "\"a\"\"b\"");
    EXPECT_TRUE(SqliteDialect::isReservedWord("Select"));
    EXPECT_FALSE(SqliteDialect::isReservedWord("Value"));
}

TEST(SqliteDialectTest, NumericPrecision) {
    ColumnDescriptor price;
    price.columnName = "Price";
    price.type = ColumnType::Numeric;
    price.precision = 10;
    price.scale = 2;
    EXPECT_EQ(sqliteDialect().typeName(price), "NUMERIC(10,2)");

    ColumnDescriptor when;
    when.columnName = "When";
    when.type = ColumnType::DateTime;
    EXPECT_EQ(sqliteDialect().comparableColumn(when), "datetime(\"When\")");
    EXPECT_EQ(sqliteDialect().comparableParameter("@p0", ColumnType::DateTime), "datetime(@p0)");
}
