#include <gtest/gtest.h>

#include <persist/mapping/descriptor_cache.h>
#include <persist/mapping/mapping_builder.h>

#include "../../common/test_entities.h"

using namespace persist;
using namespace persist::mapping;

namespace {

struct Widget {
    int64_t id = 0;
    std::string name;
    std::string code;
    int64_t productId = 0;
    int64_t revision = 0;
    std::string label;
};

struct Part {
    int64_t id = 0;
    std::string name;
};

struct SparePart {
    int64_t id = 0;
    std::string name;
};

} // namespace

namespace persist::mapping {

template <> struct EntityTraits<Part> {
    static void describe(MappingBuilder<Part>& b) {
        b.table("Parts");
        b.key(&Part::id, "Id");
        b.column(&Part::name, "Name");
    }
};

template <> struct EntityTraits<SparePart> {
    static void describe(MappingBuilder<SparePart>& b) {
        b.table("parts");
        b.key(&SparePart::id, "Id");
        b.column(&SparePart::name, "Name");
    }
};

} // namespace persist::mapping

TEST(MappingBuilderTest, ProductDescriptor) {
    auto mapping = mappingFor<test::Product>();
    ASSERT_TRUE(mapping) << mapping.error().message;
    const auto& d = mapping.value()->descriptor();

    EXPECT_EQ(d.tableName(), "Products");
    EXPECT_EQ(d.entityName(), "Product");
    ASSERT_EQ(d.columns().size(), 8u);
    ASSERT_EQ(d.keyIndices().size(), 1u);
    EXPECT_EQ(d.columns()[d.keyIndices()[0]].columnName, "Id");
    EXPECT_TRUE(d.hasVersion());
    EXPECT_TRUE(d.supportsSoftDelete());
    EXPECT_FALSE(d.supportsExpiry());
    EXPECT_TRUE(d.auditTrail());

    const auto* category = d.findByField("Category");
    ASSERT_NE(category, nullptr);
    EXPECT_TRUE(category->nullable);
    EXPECT_EQ(category->size, 50);

    const auto* created = d.roleColumn(ColumnRole::CreatedTime);
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->type, ColumnType::DateTime);
    EXPECT_EQ(d.findByColumn("isdeleted"), d.roleColumn(ColumnRole::SoftDelete));
}

TEST(MappingBuilderTest, CompositeKeyFollowsKeyOrder) {
    auto mapping = mappingFor<test::OrderLine>();
    ASSERT_TRUE(mapping);
    const auto& d = mapping.value()->descriptor();
    ASSERT_EQ(d.keyIndices().size(), 2u);
    EXPECT_EQ(d.columns()[d.keyIndices()[0]].columnName, "OrderId");
    EXPECT_EQ(d.columns()[d.keyIndices()[1]].columnName, "LineNo");

    test::OrderLine line{"SO-1", 3, 10, 1};
    auto key = mapping.value()->key(line);
    ASSERT_EQ(key.size(), 2u);
    EXPECT_EQ(key[0], Value{std::string("SO-1")});
    EXPECT_EQ(key[1], Value{int64_t{3}});
    EXPECT_EQ(formatKey(key), "SO-1|3");
}

TEST(MappingBuilderTest, FlagOnlyColumnsHaveNoAccessor) {
    auto mapping = mappingFor<test::CacheEntry>();
    ASSERT_TRUE(mapping);
    const auto& m = *mapping.value();
    auto deleted = m.descriptor().roleIndex(ColumnRole::SoftDelete);
    ASSERT_TRUE(deleted);
    EXPECT_FALSE(m.descriptor().columns()[*deleted].backed);

    test::CacheEntry entry;
    EXPECT_EQ(m.read(entry, *deleted), Value{int64_t{0}});
    EXPECT_TRUE(m.write(entry, *deleted, Value{int64_t{1}}));
    ASSERT_TRUE(m.descriptor().expirySpan());
    EXPECT_EQ(*m.descriptor().expirySpan(), std::chrono::hours(1));
}

TEST(MappingBuilderTest, RowRoundTripThroughAccessors) {
    auto mapping = mappingFor<test::Product>();
    ASSERT_TRUE(mapping);
    test::Product p;
    p.id = 7;
    p.name = "Widget";
    p.value = 2.5;
    p.version = 4;

    auto back = mapping.value()->fromRow(mapping.value()->row(p));
    ASSERT_TRUE(back) << back.error().message;
    EXPECT_EQ(back.value().id, 7);
    EXPECT_EQ(back.value().name, "Widget");
    EXPECT_FALSE(back.value().category.has_value());
    EXPECT_EQ(mapping.value()->version(back.value()), 4);

    auto shortRow = mapping.value()->fromRow({Value{int64_t{1}}});
    ASSERT_FALSE(shortRow);
    EXPECT_EQ(shortRow.error().code, ErrorCode::InternalError);
}

TEST(MappingBuilderTest, WrongValueTypeNamesTheColumn) {
    auto mapping = mappingFor<test::Product>();
    ASSERT_TRUE(mapping);
    test::Product p;
    auto written = mapping.value()->write(p, 0, Value{std::string("not a number")});
    ASSERT_FALSE(written);
    EXPECT_NE(written.error().message.find("'Id'"), std::string::npos);
}

TEST(MappingBuilderTest, MissingKeyIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.column(&Widget::name, "Name");
    auto built = b.build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::MappingError);
}

TEST(MappingBuilderTest, MissingTableIsRejected) {
    MappingBuilder<Widget> b;
    b.key(&Widget::id, "Id");
    EXPECT_FALSE(b.build());
}

TEST(MappingBuilderTest, DuplicateColumnNameIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.column(&Widget::name, "Name");
    b.column(&Widget::code, "Code").name("NAME");
    auto built = b.build();
    ASSERT_FALSE(built);
    EXPECT_NE(built.error().message.find("duplicate column"), std::string::npos);
}

TEST(MappingBuilderTest, NonIntegerVersionIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.version(&Widget::label, "Stamp");
    EXPECT_FALSE(b.build());
}

TEST(MappingBuilderTest, AutoIncrementNeedsSingleIntegerKey) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id").autoIncrement();
    b.key(&Widget::code, "Code");
    auto built = b.build();
    ASSERT_FALSE(built);
    EXPECT_NE(built.error().message.find("auto-increment"), std::string::npos);
}

TEST(MappingBuilderTest, ListSyncNeedsVersionAndSingleKey) {
    MappingBuilder<Widget> unversioned;
    unversioned.table("Widgets");
    unversioned.key(&Widget::id, "Id");
    unversioned.syncWithList();
    auto built = unversioned.build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::MappingError);

    MappingBuilder<Widget> composite;
    composite.table("Widgets");
    composite.key(&Widget::id, "Id").keyOrder(0);
    composite.key(&Widget::code, "Code").keyOrder(1);
    composite.version(&Widget::revision);
    composite.syncWithList();
    EXPECT_FALSE(composite.build());

    MappingBuilder<Widget> good;
    good.table("Widgets");
    good.key(&Widget::id, "Id");
    good.version(&Widget::revision);
    good.syncWithList();
    auto ok = good.build();
    ASSERT_TRUE(ok) << ok.error().message;
    EXPECT_TRUE(ok.value()->descriptor().syncWithList());
}

TEST(MappingBuilderTest, ParseKeyFollowsKeyColumnType) {
    auto products = mappingFor<test::Product>();
    ASSERT_TRUE(products);
    auto id = parseKey(products.value()->descriptor(), "42");
    ASSERT_TRUE(id);
    EXPECT_TRUE(id.value() == KeyValues{Value{int64_t{42}}});
    EXPECT_FALSE(parseKey(products.value()->descriptor(), "42x"));
    EXPECT_FALSE(parseKey(products.value()->descriptor(), ""));

    auto entries = mappingFor<test::CacheEntry>();
    ASSERT_TRUE(entries);
    auto key = parseKey(entries.value()->descriptor(), "session:7");
    ASSERT_TRUE(key);
    EXPECT_TRUE(key.value() == KeyValues{Value{std::string("session:7")}});

    auto lines = mappingFor<test::OrderLine>();
    ASSERT_TRUE(lines);
    auto composite = parseKey(lines.value()->descriptor(), "A-1");
    ASSERT_FALSE(composite);
    EXPECT_EQ(composite.error().code, ErrorCode::InvalidArgument);
}

TEST(MappingBuilderTest, PartialKeyOrderIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id").keyOrder(1);
    b.key(&Widget::code, "Code");
    EXPECT_FALSE(b.build());
}

TEST(MappingBuilderTest, IndexOnUnmappedFieldIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.index("IX_Widgets_Missing", {ascending("Missing")});
    auto built = b.build();
    ASSERT_FALSE(built);
    EXPECT_NE(built.error().message.find("Missing"), std::string::npos);
}

TEST(MappingBuilderTest, NotMappedDropsField) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.column(&Widget::name, "Name");
    b.column(&Widget::label, "Label");
    b.notMapped("Label");
    auto built = b.build();
    ASSERT_TRUE(built);
    EXPECT_EQ(built.value()->descriptor().columns().size(), 2u);
    EXPECT_EQ(built.value()->descriptor().findByField("Label"), nullptr);
}

TEST(MappingBuilderTest, ForeignKeyByTableName) {
    ASSERT_TRUE(mappingFor<test::Product>());

    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.column(&Widget::productId, "ProductId");
    b.foreignKey("Products", {"ProductId"}).onDelete(ForeignKeyAction::Cascade);
    auto built = b.build();
    ASSERT_TRUE(built) << built.error().message;

    const auto& fks = built.value()->descriptor().foreignKeys();
    ASSERT_EQ(fks.size(), 1u);
    EXPECT_EQ(fks[0].name, "FK_Widgets_Products");
    EXPECT_EQ(fks[0].referencedTable, "Products");
    EXPECT_EQ(fks[0].referencedColumns, std::vector<std::string>{"Id"});
    EXPECT_EQ(fks[0].onDelete, ForeignKeyAction::Cascade);
}

TEST(MappingBuilderTest, ForeignKeyToUnknownTableIsRejected) {
    MappingBuilder<Widget> b;
    b.table("Widgets");
    b.key(&Widget::id, "Id");
    b.column(&Widget::productId, "ProductId");
    b.foreignKey("NoSuchTable", {"ProductId"});
    auto built = b.build();
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, ErrorCode::MappingError);
}

TEST(DescriptorCacheTest, ReturnsSameInstance) {
    auto first = mappingFor<test::Product>();
    auto second = DescriptorCache::instance().get<test::Product>();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value().get(), second.value().get());

    auto byTable = DescriptorCache::instance().findByTable("products");
    ASSERT_NE(byTable, nullptr);
    EXPECT_EQ(byTable.get(), &first.value()->descriptor());
    EXPECT_EQ(DescriptorCache::instance().findByTable("Unknown"), nullptr);
}

TEST(DescriptorCacheTest, SecondTypeForSameTableIsRejected) {
    auto first = mappingFor<Part>();
    ASSERT_TRUE(first) << first.error().message;

    auto second = mappingFor<SparePart>();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::MappingError);
    EXPECT_NE(second.error().message.find("Parts"), std::string::npos);

    // The first registration is untouched and the rejected type stays unregistered
    auto owner = DescriptorCache::instance().findByTable("PARTS");
    ASSERT_NE(owner, nullptr);
    EXPECT_EQ(owner.get(), &first.value()->descriptor());
    EXPECT_FALSE(mappingFor<SparePart>());
}
