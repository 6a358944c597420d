#include <gtest/gtest.h>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>
#include <mediacat/catalog/watched_roots.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::catalog;

class LocationIndexTest : public test::CatalogTest {
protected:
    void SetUp() override {
        CatalogTest::SetUp();
        for (const char* checksum : {"aa11", "bb22"}) {
            ContentRecord record;
            record.checksum = checksum;
            record.dateIndexed = 1;
            ASSERT_TRUE(contents.insert(db(), record));
        }
    }

    LocationId add(const std::string& checksum, const std::string& dir, const std::string& file) {
        auto id = index.insert(db(), checksum, dir, file, 1000);
        EXPECT_TRUE(id) << dir << "/" << file;
        return id ? id.value() : 0;
    }

    ContentStore contents;
    LocationIndex index;
};

TEST_F(LocationIndexTest, InsertFindGet) {
    auto id = add("aa11", "/photos", "a.jpg");

    auto found = index.find(db(), "/photos", "a.jpg");
    ASSERT_TRUE(found);
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->id, id);
    EXPECT_EQ(found.value()->checksum, "aa11");
    EXPECT_EQ(found.value()->dateScanned, 1000);
    EXPECT_FALSE(found.value()->deleted);
    EXPECT_EQ(found.value()->fullPath(), std::filesystem::path("/photos/a.jpg"));

    auto byId = index.get(db(), id);
    ASSERT_TRUE(byId);
    EXPECT_EQ(byId.value()->filename, "a.jpg");

    auto missing = index.find(db(), "/photos", "b.jpg");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(LocationIndexTest, DuplicatePathIsConstraintViolation) {
    add("aa11", "/photos", "a.jpg");
    auto duplicate = index.insert(db(), "bb22", "/photos", "a.jpg", 1);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ConstraintViolation);
}

TEST_F(LocationIndexTest, SameContentManyLocations) {
    add("aa11", "/photos", "a.jpg");
    add("aa11", "/photos/copy", "a.jpg");
    add("bb22", "/photos", "b.jpg");

    auto count = index.countForContent(db(), "aa11");
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 2);

    auto rows = index.forContent(db(), "aa11");
    ASSERT_TRUE(rows);
    EXPECT_EQ(rows.value().size(), 2u);

    auto inDir = index.inDirectory(db(), "/photos");
    ASSERT_TRUE(inDir);
    EXPECT_EQ(inDir.value().size(), 2u);
}

TEST_F(LocationIndexTest, MoveKeepsChecksum) {
    auto id = add("aa11", "/photos", "a.jpg");
    ASSERT_TRUE(index.move(db(), id, "/archive", "renamed.jpg"));

    auto moved = index.get(db(), id);
    ASSERT_TRUE(moved);
    EXPECT_EQ(moved.value()->directory, "/archive");
    EXPECT_EQ(moved.value()->filename, "renamed.jpg");
    EXPECT_EQ(moved.value()->checksum, "aa11");

    auto old = index.find(db(), "/photos", "a.jpg");
    ASSERT_TRUE(old);
    EXPECT_FALSE(old.value().has_value());
}

TEST_F(LocationIndexTest, MoveOntoTakenPathFails) {
    auto id = add("aa11", "/photos", "a.jpg");
    add("bb22", "/photos", "b.jpg");

    auto result = index.move(db(), id, "/photos", "b.jpg");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ConstraintViolation);
}

TEST_F(LocationIndexTest, MoveUnknownIdIsNotFound) {
    auto result = index.move(db(), 999, "/x", "y.jpg");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(LocationIndexTest, SoftDelete) {
    auto id = add("aa11", "/photos", "a.jpg");
    ASSERT_TRUE(index.setDeleted(db(), id, true));

    auto trashed = index.countDeleted(db());
    ASSERT_TRUE(trashed);
    EXPECT_EQ(trashed.value(), 1);

    ASSERT_TRUE(index.setDeleted(db(), id, false));
    trashed = index.countDeleted(db());
    ASSERT_TRUE(trashed);
    EXPECT_EQ(trashed.value(), 0);

    auto missing = index.setDeleted(db(), 12345, true);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(LocationIndexTest, OrphansAreLocationsOutsideRegisteredDirectories) {
    WatchedRoots roots;
    ASSERT_TRUE(roots.ensure(db(), "/photos", VisibilityTier::Public));

    add("aa11", "/photos", "a.jpg");
    auto orphanId = add("bb22", "/gone", "b.jpg");
    // Beneath a root but not itself registered
    auto nestedId = add("bb22", "/photos/nested", "b.jpg");

    auto orphans = index.orphans(db());
    ASSERT_TRUE(orphans);
    ASSERT_EQ(orphans.value().size(), 2u);
    EXPECT_EQ(orphans.value()[0].id, orphanId);
    EXPECT_EQ(orphans.value()[1].id, nestedId);
}

TEST_F(LocationIndexTest, ChecksumsUnderMatchesSubtreeOnly) {
    add("aa11", "/photos/2024", "a.jpg");
    add("bb22", "/photos_old", "b.jpg");

    auto under = index.checksumsUnder(db(), "/photos");
    ASSERT_TRUE(under);
    EXPECT_EQ(under.value(), (std::vector<Checksum>{"aa11"}));

    auto exact = index.checksumsUnder(db(), "/photos_old");
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact.value(), (std::vector<Checksum>{"bb22"}));
}

TEST_F(LocationIndexTest, ChecksumsUnderComparesPrefixBytes) {
    add("aa11", "/caf\u00e9/2024", "n.jpg");
    add("bb22", "/caf\u00e9-old", "o.jpg");

    auto under = index.checksumsUnder(db(), "/caf\u00e9");
    ASSERT_TRUE(under);
    EXPECT_EQ(under.value(), (std::vector<Checksum>{"aa11"}));
}
