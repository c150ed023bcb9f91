#include <gtest/gtest.h>
#include <persist/query/select_builder.h>

using namespace persist::query;

TEST(SqlBuildSelectTest, BasicSelectWithConditionsAndOrder) {
    QuerySpec spec;
    spec.table = "Products";
    spec.columns = {"Id", "Name"};
    spec.conditions = {"(Name = @p0)", "IsDeleted = 0"};
    spec.orderBy = std::optional<std::string>{"Name ASC"};
    spec.limit = 10;
    spec.offset = 5;

    auto sql = buildSelect(spec);
    EXPECT_EQ(sql, "SELECT Id, Name FROM Products WHERE (Name = @p0) AND IsDeleted = 0 "
                   "ORDER BY Name ASC LIMIT 10 OFFSET 5");
}

TEST(SqlBuildSelectTest, StarWhenNoColumns) {
    QuerySpec spec;
    spec.table = "Products";
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM Products");
}

TEST(SqlBuildSelectTest, OffsetWithoutLimit) {
    QuerySpec spec;
    spec.table = "Products";
    spec.offset = 40;
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM Products LIMIT -1 OFFSET 40");

    spec.offset = 0;
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM Products");
}

TEST(SqlBuildSelectTest, ZeroLimitIsKept) {
    QuerySpec spec;
    spec.table = "T";
    spec.limit = 0;
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM T LIMIT 0");

    spec.offset = 3;
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM T LIMIT 0 OFFSET 3");
}

TEST(SqlBuildSelectTest, EmptyConditionsAreSkipped) {
    QuerySpec spec;
    spec.table = "Products";
    spec.conditions = {"", "IsDeleted = 0", ""};
    EXPECT_EQ(buildSelect(spec), "SELECT * FROM Products WHERE IsDeleted = 0");
}

TEST(SqlBuildSelectTest, CountIgnoresOrderingAndPaging) {
    QuerySpec spec;
    spec.table = "Products";
    spec.columns = {"Id"};
    spec.conditions = {"(Value > @p0)"};
    spec.orderBy = std::optional<std::string>{"Value DESC"};
    spec.limit = 5;
    EXPECT_EQ(buildCount(spec), "SELECT COUNT(*) FROM Products WHERE (Value > @p0)");
}
