#include <gtest/gtest.h>

#include <persist/provider/export_files.h>
#include <persist/provider/repository.h>

#include "../../common/test_entities.h"

using namespace persist;
using namespace persist::provider;
using test::runAwait;

class BulkOperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = test::tempDatabasePath("persist_bulk_test");
        config::SqliteConfiguration config;
        config.dbFile = dbPath_.string();
        config.retry = config::RetryConfiguration::noRetry();
        auto repo = Repository<test::Product>::open(config);
        ASSERT_TRUE(repo) << repo.error().message;
        repo_ = std::move(repo).value();
        auto ready = runAwait(repo_->initialize());
        ASSERT_TRUE(ready) << ready.error().message;
    }

    void TearDown() override {
        repo_.reset();
        test::removeDatabaseFiles(dbPath_);
        std::error_code ec;
        std::filesystem::remove_all(exportRoot_, ec);
    }

    static std::vector<test::Product> products(int64_t first, int64_t last, double value = 1.0) {
        std::vector<test::Product> out;
        for (int64_t id = first; id <= last; ++id) {
            test::Product p;
            p.id = id;
            p.name = "Item " + std::to_string(id);
            p.value = value;
            out.push_back(std::move(p));
        }
        return out;
    }

    int64_t liveCount() {
        auto n = runAwait(repo_->count());
        EXPECT_TRUE(n);
        return n ? n.value() : -1;
    }

    BulkExportOptions exportOptions(size_t batchSize) const {
        BulkExportOptions options;
        options.exportFolder = exportRoot_.string();
        options.batchSize = batchSize;
        return options;
    }

    std::filesystem::path dbPath_;
    std::filesystem::path exportRoot_ = test::tempDatabasePath("persist_export").replace_extension();
    std::unique_ptr<Repository<test::Product>> repo_;
};

TEST_F(BulkOperationsTest, CreateBatchSplitsIntoTransactions) {
    auto result = runAwait(repo_->createBatch(products(1, 5), 2));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().processed, 5u);
    EXPECT_EQ(result.value().batches, 3u);
    EXPECT_EQ(liveCount(), 5);

    auto single = runAwait(repo_->createBatch(products(6, 8)));
    ASSERT_TRUE(single);
    EXPECT_EQ(single.value().batches, 1u);
}

TEST_F(BulkOperationsTest, EmptyBatchDoesNothing) {
    auto result = runAwait(repo_->createBatch({}, 10));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().processed, 0u);
    EXPECT_EQ(result.value().batches, 0u);
}

TEST_F(BulkOperationsTest, FailingBatchKeepsEarlierBatches) {
    ASSERT_TRUE(runAwait(repo_->create(products(4, 4).front())));

    // Items 1-2 commit; the batch holding 3-4 hits the existing key and rolls back
    auto result = runAwait(repo_->createBatch(products(1, 6), 2));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::EntityAlreadyExists);

    EXPECT_EQ(liveCount(), 3);
    auto three = runAwait(repo_->get({Value{int64_t{3}}}));
    ASSERT_TRUE(three);
    EXPECT_FALSE(three.value().has_value());
}

TEST_F(BulkOperationsTest, UpdateBatchAdvancesVersions) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 3))));
    auto stored = runAwait(repo_->getAll());
    ASSERT_TRUE(stored);
    auto items = stored.value();
    for (auto& p : items)
        p.value = 9.5;

    auto result = runAwait(repo_->updateBatch(items, 2));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().processed, 3u);
    EXPECT_EQ(result.value().batches, 2u);

    auto after = runAwait(repo_->query(query::field("Value") == 9.5));
    ASSERT_TRUE(after);
    ASSERT_EQ(after.value().size(), 3u);
    for (const auto& p : after.value())
        EXPECT_EQ(p.version, 2);

    // Versions in items are now stale
    auto stale = runAwait(repo_->updateBatch(items));
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, ErrorCode::ConcurrencyConflict);
}

TEST_F(BulkOperationsTest, RemoveBatchSkipsMissingKeys) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 3))));
    ASSERT_TRUE(runAwait(repo_->remove({Value{int64_t{2}}}, 1)));

    std::vector<mapping::KeyValues> keys{
        {Value{int64_t{1}}}, {Value{int64_t{2}}}, {Value{int64_t{3}}}, {Value{int64_t{42}}}};
    auto result = runAwait(repo_->removeBatch(keys, 3));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().processed, 2u);
    EXPECT_EQ(result.value().batches, 2u);
    EXPECT_EQ(liveCount(), 0);

    auto audit = runAwait(repo_->auditRecords({}, {AuditOperation::Delete}));
    ASSERT_TRUE(audit);
    EXPECT_EQ(audit.value().size(), 3u);
}

TEST_F(BulkOperationsTest, ImportSkipLeavesExistingRows) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 2, 1.0))));

    BulkImportOptions options;
    options.strategy = ImportStrategy::Skip;
    options.batchSize = 2;
    auto result = runAwait(repo_->bulkImport(products(1, 4, 2.0), options));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().created, 2u);
    EXPECT_EQ(result.value().skipped, 2u);
    EXPECT_EQ(result.value().updated, 0u);
    EXPECT_EQ(result.value().total(), 4u);

    auto first = runAwait(repo_->get({Value{int64_t{1}}}));
    ASSERT_TRUE(first);
    ASSERT_TRUE(first.value());
    EXPECT_DOUBLE_EQ(first.value()->value, 1.0);
    EXPECT_EQ(first.value()->version, 1);
}

TEST_F(BulkOperationsTest, ImportUpsertOverwritesExistingRows) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 2, 1.0))));
    ASSERT_TRUE(runAwait(repo_->remove({Value{int64_t{2}}}, 1)));

    // Incoming versions are ignored; the stored version is used
    auto incoming = products(1, 3, 7.0);
    for (auto& p : incoming)
        p.version = 99;

    auto result = runAwait(repo_->bulkImport(incoming));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().updated, 1u);
    EXPECT_EQ(result.value().created, 2u);
    EXPECT_TRUE(result.value().errors.empty());

    auto all = runAwait(repo_->query(query::Predicate{}, query::orderBy("Id")));
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_DOUBLE_EQ(all.value()[0].value, 7.0);
    EXPECT_EQ(all.value()[0].version, 2);
    // Revived from soft delete
    EXPECT_EQ(all.value()[1].version, 3);
    EXPECT_EQ(all.value()[2].version, 1);
}

TEST_F(BulkOperationsTest, ImportFailReportsExistingKeys) {
    ASSERT_TRUE(runAwait(repo_->create(products(2, 2).front())));

    BulkImportOptions options;
    options.strategy = ImportStrategy::Fail;
    auto result = runAwait(repo_->bulkImport(products(1, 3), options));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().created, 2u);
    EXPECT_EQ(result.value().failed, 1u);
    ASSERT_EQ(result.value().errors.size(), 1u);
    EXPECT_NE(result.value().errors.front().find("2"), std::string::npos);
    EXPECT_EQ(liveCount(), 3);
}

TEST_F(BulkOperationsTest, CancelledImportStops) {
    std::stop_source source;
    source.request_stop();
    auto result = runAwait(repo_->bulkImport(products(1, 3), {}, {}, source.get_token()));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
    EXPECT_EQ(liveCount(), 0);
}

TEST_F(BulkOperationsTest, ExportWritesPagedFilesAndManifest) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 5))));

    auto exported = runAwait(repo_->bulkExport({}, exportOptions(2)));
    ASSERT_TRUE(exported) << exported.error().message;
    EXPECT_EQ(exported.value().exportedCount, 5);
    ASSERT_EQ(exported.value().exportedFiles.size(), 3u);
    EXPECT_EQ(std::filesystem::path(exported.value().exportedFiles[0]).filename().string(),
              "data_0001.json");
    ASSERT_TRUE(std::filesystem::exists(exported.value().manifestPath));

    auto manifest = readExportManifest(exported.value().manifestPath);
    ASSERT_TRUE(manifest) << manifest.error().message;
    EXPECT_EQ(manifest.value().schemaVersion, 1);
    EXPECT_EQ(manifest.value().entityType, "Product");
    EXPECT_EQ(manifest.value().tableName, "Products");
    EXPECT_EQ(manifest.value().entityCount, 5);
    EXPECT_TRUE(manifest.value().softDeleteEnabled);
    ASSERT_EQ(manifest.value().dataFiles.size(), 3u);
    EXPECT_EQ(manifest.value().dataFiles[2].count, 1);
}

TEST_F(BulkOperationsTest, ExportHonoursPredicateAndDeletedFlag) {
    ASSERT_TRUE(runAwait(repo_->createBatch(products(1, 4))));
    ASSERT_TRUE(runAwait(repo_->remove({Value{int64_t{4}}}, 1)));

    auto live = runAwait(repo_->bulkExport({}, exportOptions(10)));
    ASSERT_TRUE(live);
    EXPECT_EQ(live.value().exportedCount, 3);

    auto options = exportOptions(10);
    options.includeDeleted = true;
    auto everything = runAwait(repo_->bulkExport({}, options));
    ASSERT_TRUE(everything);
    EXPECT_EQ(everything.value().exportedCount, 4);

    auto filtered = runAwait(repo_->bulkExport(query::field("Id") > int64_t{2}, exportOptions(10)));
    ASSERT_TRUE(filtered);
    EXPECT_EQ(filtered.value().exportedCount, 1);
}

TEST_F(BulkOperationsTest, EmptyExportStillWritesManifest) {
    auto exported = runAwait(repo_->bulkExport({}, exportOptions(10)));
    ASSERT_TRUE(exported) << exported.error().message;
    EXPECT_EQ(exported.value().exportedCount, 0);
    EXPECT_TRUE(exported.value().exportedFiles.empty());
    EXPECT_TRUE(std::filesystem::exists(exported.value().manifestPath));
}

TEST_F(BulkOperationsTest, ExportNeedsFolderAndBatchSize) {
    auto noFolder = runAwait(repo_->bulkExport({}, BulkExportOptions{}));
    ASSERT_FALSE(noFolder);
    EXPECT_EQ(noFolder.error().code, ErrorCode::InvalidArgument);

    auto noBatch = runAwait(repo_->bulkExport({}, exportOptions(0)));
    ASSERT_FALSE(noBatch);
    EXPECT_EQ(noBatch.error().code, ErrorCode::InvalidArgument);
}

TEST_F(BulkOperationsTest, ImportFromExportRestoresRows) {
    auto source = products(1, 5, 2.5);
    source[1].category = "fasteners";
    ASSERT_TRUE(runAwait(repo_->createBatch(source)));
    auto exported = runAwait(repo_->bulkExport({}, exportOptions(2)));
    ASSERT_TRUE(exported);

    const auto otherPath = test::tempDatabasePath("persist_import_target");
    {
        config::SqliteConfiguration config;
        config.dbFile = otherPath.string();
        auto target = Repository<test::Product>::open(config);
        ASSERT_TRUE(target);
        ASSERT_TRUE(runAwait(target.value()->initialize()));

        BulkImportOptions options;
        options.batchSize = 2;
        auto imported = runAwait(
            target.value()->bulkImportFromFile(exported.value().manifestPath, options));
        ASSERT_TRUE(imported) << imported.error().message;
        EXPECT_EQ(imported.value().created, 5u);
        EXPECT_TRUE(imported.value().errors.empty());

        auto two = runAwait(target.value()->get({Value{int64_t{2}}}));
        ASSERT_TRUE(two);
        ASSERT_TRUE(two.value().has_value());
        EXPECT_EQ(two.value()->name, "Item 2");
        EXPECT_DOUBLE_EQ(two.value()->value, 2.5);
        EXPECT_EQ(two.value()->category, std::optional<std::string>{"fasteners"});

        // A second pass finds every key and updates in place
        auto again = runAwait(target.value()->bulkImportFromFile(exported.value().manifestPath));
        ASSERT_TRUE(again);
        EXPECT_EQ(again.value().updated, 5u);
    }
    test::removeDatabaseFiles(otherPath);
}

TEST_F(BulkOperationsTest, ImportFromFileChecksTheManifest) {
    std::filesystem::create_directories(exportRoot_);
    ExportManifest manifest;
    manifest.entityType = "Invoice";
    const auto foreign = exportRoot_ / "foreign.json";
    ASSERT_TRUE(writeExportManifest(foreign, manifest));

    auto wrongType = runAwait(repo_->bulkImportFromFile(foreign));
    ASSERT_FALSE(wrongType);
    EXPECT_EQ(wrongType.error().code, ErrorCode::InvalidArgument);

    manifest.entityType = "Product";
    manifest.schemaVersion = 2;
    const auto future = exportRoot_ / "future.json";
    ASSERT_TRUE(writeExportManifest(future, manifest));
    auto unsupported = runAwait(repo_->bulkImportFromFile(future));
    ASSERT_FALSE(unsupported);
    EXPECT_EQ(unsupported.error().code, ErrorCode::NotSupported);

    auto missing = runAwait(repo_->bulkImportFromFile(exportRoot_ / "absent.json"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);
}
