#include <gtest/gtest.h>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>

#include <algorithm>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::catalog;

namespace {

ContentRecord makeContent(const std::string& checksum, bool video = false) {
    ContentRecord record;
    record.checksum = checksum;
    record.isVideo = video;
    record.metadataJson = R"({"mime_type":"image/png"})";
    record.width = 640;
    record.height = 480;
    record.dateCreated = 100;
    record.dateModified = 200;
    record.dateIndexed = 300;
    return record;
}

} // namespace

class ContentStoreTest : public test::CatalogTest {
protected:
    ContentStore store;
};

TEST_F(ContentStoreTest, InsertAndGet) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));

    auto exists = store.exists(db(), "aa11");
    ASSERT_TRUE(exists);
    EXPECT_TRUE(exists.value());

    auto record = store.get(db(), "aa11");
    ASSERT_TRUE(record);
    ASSERT_TRUE(record.value().has_value());
    EXPECT_EQ(record.value()->width, 640);
    EXPECT_EQ(record.value()->height, 480);
    EXPECT_EQ(record.value()->dateCreated, 100);
    EXPECT_EQ(record.value()->dateModified, 200);
    EXPECT_FALSE(record.value()->isVideo);
    EXPECT_EQ(record.value()->metadataJson, R"({"mime_type":"image/png"})");
}

TEST_F(ContentStoreTest, MissingContent) {
    auto exists = store.exists(db(), "nope");
    ASSERT_TRUE(exists);
    EXPECT_FALSE(exists.value());

    auto record = store.get(db(), "nope");
    ASSERT_TRUE(record);
    EXPECT_FALSE(record.value().has_value());
}

TEST_F(ContentStoreTest, DuplicateInsertIsConstraintViolation) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));
    auto second = store.insert(db(), makeContent("aa11"));
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::ConstraintViolation);

    auto count = store.count(db());
    ASSERT_TRUE(count);
    EXPECT_EQ(count.value(), 1);
}

TEST_F(ContentStoreTest, NullDimensionsRoundTrip) {
    auto record = makeContent("bb22", true);
    record.width.reset();
    record.height.reset();
    ASSERT_TRUE(store.insert(db(), record));

    auto loaded = store.get(db(), "bb22");
    ASSERT_TRUE(loaded);
    EXPECT_FALSE(loaded.value()->width.has_value());
    EXPECT_FALSE(loaded.value()->height.has_value());
    EXPECT_TRUE(loaded.value()->isVideo);
}

TEST_F(ContentStoreTest, UpdateMetadata) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));
    ASSERT_TRUE(store.updateMetadata(db(), "aa11", R"({"mime_type":"image/png","x":1})", 10, 20));

    auto loaded = store.get(db(), "aa11");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value()->metadataJson, R"({"mime_type":"image/png","x":1})");
    EXPECT_EQ(loaded.value()->width, 10);
    EXPECT_EQ(loaded.value()->height, 20);
}

TEST_F(ContentStoreTest, TagsAreDeduplicatedAndSorted) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));

    auto first = store.addTag(db(), "aa11", "sunset");
    ASSERT_TRUE(first);
    EXPECT_TRUE(first.value());
    auto again = store.addTag(db(), "aa11", "sunset");
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value());
    ASSERT_TRUE(store.addTag(db(), "aa11", "beach"));

    auto tags = store.tagsFor(db(), "aa11");
    ASSERT_TRUE(tags);
    EXPECT_EQ(tags.value(), (std::vector<std::string>{"beach", "sunset"}));

    auto id1 = ContentStore::ensureTag(db(), "beach");
    auto id2 = ContentStore::ensureTag(db(), "beach");
    ASSERT_TRUE(id1);
    ASSERT_TRUE(id2);
    EXPECT_EQ(id1.value(), id2.value());
}

TEST_F(ContentStoreTest, RemoveDropsTagLinks) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));
    ASSERT_TRUE(store.addTag(db(), "aa11", "x"));
    ASSERT_TRUE(store.remove(db(), "aa11"));

    auto exists = store.exists(db(), "aa11");
    ASSERT_TRUE(exists);
    EXPECT_FALSE(exists.value());

    auto tags = store.tagsFor(db(), "aa11");
    ASSERT_TRUE(tags);
    EXPECT_TRUE(tags.value().empty());
}

TEST_F(ContentStoreTest, AllChecksums) {
    ASSERT_TRUE(store.insert(db(), makeContent("aa11")));
    ASSERT_TRUE(store.insert(db(), makeContent("bb22")));

    auto all = store.allChecksums(db());
    ASSERT_TRUE(all);
    auto checksums = all.value();
    std::sort(checksums.begin(), checksums.end());
    EXPECT_EQ(checksums, (std::vector<Checksum>{"aa11", "bb22"}));
}
