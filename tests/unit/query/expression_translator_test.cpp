#include <gtest/gtest.h>

#include <persist/query/expression_translator.h>

#include "../../common/test_entities.h"

using namespace persist;
using namespace persist::query;

class ExpressionTranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto mapping = mapping::mappingFor<test::Product>();
        ASSERT_TRUE(mapping) << mapping.error().message;
        mapping_ = mapping.value();
        translator_.emplace(mapping_->descriptor());
    }

    std::shared_ptr<const mapping::EntityMapping<test::Product>> mapping_;
    std::optional<ExpressionTranslator> translator_;
};

TEST_F(ExpressionTranslatorTest, EqualityBecomesPlaceholder) {
    auto result = translator_->translatePredicate(field("Name") == "John Doe");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().sql, "(Name = @p0)");
    ASSERT_EQ(result.value().parameters.size(), 1u);
    EXPECT_EQ(result.value().parameters[0].first, "@p0");
    EXPECT_EQ(result.value().parameters[0].second, Value{std::string("John Doe")});
}

TEST_F(ExpressionTranslatorTest, ContainsBecomesLikePattern) {
    auto result = translator_->translatePredicate(field("Name").contains("Smith"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql, "(Name LIKE @p0)");
    EXPECT_EQ(result.value().parameters[0].second, Value{std::string("%Smith%")});

    auto starts = translator_->translatePredicate(field("Name").startsWith("Sm"));
    ASSERT_TRUE(starts);
    EXPECT_EQ(starts.value().parameters[0].second, Value{std::string("Sm%")});

    auto ends = translator_->translatePredicate(field("Name").endsWith("th"));
    ASSERT_TRUE(ends);
    EXPECT_EQ(ends.value().parameters[0].second, Value{std::string("%th")});
}

TEST_F(ExpressionTranslatorTest, OrderingKeysInDeclarationOrder) {
    auto result = translator_->translateOrderBy(orderBy("Name").thenByDescending("Value"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), "ORDER BY Name ASC, Value DESC");

    auto none = translator_->translateOrderBy(std::nullopt);
    ASSERT_TRUE(none);
    EXPECT_EQ(none.value(), "");
}

TEST_F(ExpressionTranslatorTest, OnePlaceholderPerLiteralInTreeOrder) {
    auto p = (field("Value") > 10 && field("Value") < 10) || field("Name") != "x";
    auto result = translator_->translatePredicate(p);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql,
              "(((Value > @p0) AND (Value < @p1)) OR (Name <> @p2))");
    ASSERT_EQ(result.value().parameters.size(), 3u);
    EXPECT_EQ(result.value().parameters[0].second, Value{int64_t{10}});
    EXPECT_EQ(result.value().parameters[1].second, Value{int64_t{10}});
    EXPECT_EQ(result.value().parameters[2].second, Value{std::string("x")});
}

TEST_F(ExpressionTranslatorTest, TranslationIsDeterministic) {
    auto p = field("Name").in({"a", "b"}) && !field("Category").isNull();
    auto first = translator_->translatePredicate(p);
    auto second = translator_->translatePredicate(p);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().sql, second.value().sql);
    EXPECT_EQ(first.value().parameters, second.value().parameters);
    EXPECT_EQ(first.value().sql, "((Name IN (@p0, @p1)) AND (NOT (Category IS NULL)))");
}

TEST_F(ExpressionTranslatorTest, NullChecks) {
    auto isNull = translator_->translatePredicate(field("Category").isNull());
    ASSERT_TRUE(isNull);
    EXPECT_EQ(isNull.value().sql, "(Category IS NULL)");
    EXPECT_TRUE(isNull.value().parameters.empty());

    auto notNull = translator_->translatePredicate(field("Category").isNotNull());
    ASSERT_TRUE(notNull);
    EXPECT_EQ(notNull.value().sql, "(Category IS NOT NULL)");
}

TEST_F(ExpressionTranslatorTest, DateTimeComparedThroughDatetime) {
    const TimePoint cutoff = std::chrono::sys_days{std::chrono::year{2025} / 1 / 1};
    auto result = translator_->translatePredicate(field("CreatedTime") >= formatTimestamp(cutoff));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql, "(datetime(CreatedTime) >= datetime(@p0))");
}

TEST_F(ExpressionTranslatorTest, FieldToFieldComparison) {
    auto result = translator_->translatePredicate(field("Version") > field("Value"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql, "(Version > Value)");
    EXPECT_TRUE(result.value().parameters.empty());
}

TEST_F(ExpressionTranslatorTest, NullLiteralIsUnsupported) {
    auto result = translator_->translatePredicate(field("Category") == nullptr);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedExpression);
}

TEST_F(ExpressionTranslatorTest, UnknownFieldIsMappingError) {
    auto result = translator_->translatePredicate(field("Colour") == "red");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MappingError);
    EXPECT_NE(result.error().message.find("Colour"), std::string::npos);

    auto order = translator_->translateOrderBy(orderBy("Colour"));
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().code, ErrorCode::MappingError);
}

TEST_F(ExpressionTranslatorTest, UnsupportedShapes) {
    auto emptyIn = translator_->translatePredicate(field("Name").in(std::vector<Value>{}));
    ASSERT_FALSE(emptyIn);
    EXPECT_EQ(emptyIn.error().code, ErrorCode::UnsupportedExpression);

    auto likeOnNumber = translator_->translatePredicate(field("Value").contains("1"));
    ASSERT_FALSE(likeOnNumber);
    EXPECT_EQ(likeOnNumber.error().code, ErrorCode::UnsupportedExpression);

    auto negatedEmpty = translator_->translatePredicate(makePredicate(Not{Predicate{}}));
    ASSERT_FALSE(negatedEmpty);
    EXPECT_EQ(negatedEmpty.error().code, ErrorCode::UnsupportedExpression);
}

TEST_F(ExpressionTranslatorTest, EmptyPredicateMeansNoFilter) {
    auto result = translator_->translatePredicate(Predicate{});
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().empty());

    // && and || with an empty side keep the other side
    auto combined = translator_->translatePredicate(Predicate{} && field("Name") == "a");
    ASSERT_TRUE(combined);
    EXPECT_EQ(combined.value().sql, "(Name = @p0)");
}

TEST_F(ExpressionTranslatorTest, SelectAppendsLifecycleFilters) {
    SelectOptions options;
    options.orderBy = orderBy("Name").thenByDescending("Value");
    options.limit = 10;
    options.offset = 20;

    auto result = translator_->translateSelect(field("Name") == "John Doe", options);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().sql,
              "SELECT Id, Name, Value, Category, Version, CreatedTime, LastWriteTime, IsDeleted "
              "FROM Products WHERE (Name = @p0) AND IsDeleted = 0 "
              "ORDER BY Name ASC, Value DESC LIMIT 10 OFFSET 20");
    ASSERT_EQ(result.value().parameters.size(), 1u);
}

TEST_F(ExpressionTranslatorTest, SelectCanIncludeDeletedRows) {
    SelectOptions options;
    options.includeDeleted = true;
    options.offset = 5;
    auto result = translator_->translateSelect(Predicate{}, options);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql,
              "SELECT Id, Name, Value, Category, Version, CreatedTime, LastWriteTime, IsDeleted "
              "FROM Products LIMIT -1 OFFSET 5");
}

TEST_F(ExpressionTranslatorTest, SelectTakeZeroAndNegativePaging) {
    SelectOptions none;
    none.limit = 0;
    auto empty = translator_->translateSelect(Predicate{}, none);
    ASSERT_TRUE(empty);
    EXPECT_NE(empty.value().sql.find("IsDeleted = 0 LIMIT 0"), std::string::npos);

    SelectOptions negativeTake;
    negativeTake.limit = -1;
    auto badTake = translator_->translateSelect(Predicate{}, negativeTake);
    ASSERT_FALSE(badTake);
    EXPECT_EQ(badTake.error().code, ErrorCode::InvalidArgument);

    SelectOptions negativeSkip;
    negativeSkip.offset = -2;
    auto badSkip = translator_->translateSelect(Predicate{}, negativeSkip);
    ASSERT_FALSE(badSkip);
    EXPECT_EQ(badSkip.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ExpressionTranslatorTest, CountUsesSameWhere) {
    auto result = translator_->translateCount(field("Value") >= 2.5, {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql,
              "SELECT COUNT(*) FROM Products WHERE (Value >= @p0) AND IsDeleted = 0");
    EXPECT_EQ(result.value().parameters[0].second, Value{2.5});
}

TEST(ExpressionTranslatorExpiryTest, ExpiredRowsFilteredByDefault) {
    auto mapping = mapping::mappingFor<test::CacheEntry>();
    ASSERT_TRUE(mapping);
    ExpressionTranslator translator(mapping.value()->descriptor());

    auto result = translator.translateCount(field("Payload") == "x", {});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().sql,
              "SELECT COUNT(*) FROM CacheEntries WHERE (Payload = @p0) AND IsDeleted = 0 AND "
              "(AbsoluteExpiration IS NULL OR datetime(AbsoluteExpiration) > datetime('now'))");

    SelectOptions all;
    all.includeExpired = true;
    all.includeDeleted = true;
    auto unfiltered = translator.translateCount(Predicate{}, all);
    ASSERT_TRUE(unfiltered);
    EXPECT_EQ(unfiltered.value().sql, "SELECT COUNT(*) FROM CacheEntries");
}
