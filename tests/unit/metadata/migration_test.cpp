#include <gtest/gtest.h>
#include <mediacat/metadata/migration.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::metadata;

class MigrationTest : public test::MediacatTest {
protected:
    void SetUp() override {
        MediacatTest::SetUp();
        ASSERT_TRUE(db_.open((testDir / "migrate.db").string(), ConnectionMode::Create));
    }

    void TearDown() override {
        db_.close();
        MediacatTest::TearDown();
    }

    Database db_;
};

TEST_F(MigrationTest, CatalogSchemaIsCreated) {
    ASSERT_TRUE(migrateCatalog(db_));

    for (const char* table : {"watched_roots", "tags", "root_tags", "contents", "content_tags",
                              "locations", "location_fts", "migration_history"}) {
        auto exists = db_.tableExists(table);
        ASSERT_TRUE(exists) << table;
        EXPECT_TRUE(exists.value()) << table;
    }
}

TEST_F(MigrationTest, MigrationIsIdempotent) {
    ASSERT_TRUE(migrateCatalog(db_));
    ASSERT_TRUE(migrateCatalog(db_));

    MigrationManager manager(db_);
    ASSERT_TRUE(manager.initialize());
    manager.registerMigrations(CatalogMigrations::getAllMigrations());

    auto version = manager.getCurrentVersion();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), manager.getLatestVersion());

    auto needs = manager.needsMigration();
    ASSERT_TRUE(needs);
    EXPECT_FALSE(needs.value());
}

TEST_F(MigrationTest, HistoryRecordsEachVersion) {
    ASSERT_TRUE(migrateCatalog(db_));

    MigrationManager manager(db_);
    ASSERT_TRUE(manager.initialize());
    auto history = manager.getHistory();
    ASSERT_TRUE(history);
    ASSERT_EQ(history.value().size(), CatalogMigrations::getAllMigrations().size());
    for (const auto& entry : history.value()) {
        EXPECT_TRUE(entry.success) << entry.name;
    }
}

TEST_F(MigrationTest, FailedMigrationRollsBack) {
    MigrationManager manager(db_);
    ASSERT_TRUE(manager.initialize());

    Migration good;
    good.version = 1;
    good.name = "good";
    good.upSQL = "CREATE TABLE a (x INTEGER);";

    Migration bad;
    bad.version = 2;
    bad.name = "bad";
    bad.upSQL = "CREATE TABLE b (x INTEGER); THIS IS NOT SQL;";

    manager.registerMigrations({good, bad});
    auto result = manager.migrate();
    ASSERT_FALSE(result);

    auto version = manager.getCurrentVersion();
    ASSERT_TRUE(version);
    EXPECT_EQ(version.value(), 1);

    auto b = db_.tableExists("b");
    ASSERT_TRUE(b);
    EXPECT_FALSE(b.value());
}

TEST_F(MigrationTest, LocationPathFilenameIsUnique) {
    ASSERT_TRUE(migrateCatalog(db_));
    ASSERT_TRUE(db_.execute("INSERT INTO contents (content_hash, date_indexed) VALUES ('h', 0)"));
    ASSERT_TRUE(db_.execute("INSERT INTO locations (content_hash, path, filename, date_scanned) "
                            "VALUES ('h', '/a', 'x.jpg', 0)"));

    auto duplicate = db_.execute("INSERT INTO locations (content_hash, path, filename, "
                                 "date_scanned) VALUES ('h', '/a', 'x.jpg', 0)");
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ConstraintViolation);
}
