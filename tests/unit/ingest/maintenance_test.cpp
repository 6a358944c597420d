#include <gtest/gtest.h>
#include <mediacat/ingest/ingest_service.h>
#include <mediacat/ingest/maintenance.h>

#include <algorithm>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::ingest;
using catalog::VisibilityTier;
using ::testing::Contains;

class CatalogMaintenanceTest : public test::CatalogTest {
protected:
    void SetUp() override {
        CatalogTest::SetUp();
        extraction::MetadataExtractorConfig config;
        config.ffprobePath = "/nonexistent/ffprobe";
        extractor = std::make_unique<extraction::MetadataExtractor>(config);
        service = std::make_unique<IngestService>(*pool, known, detector, *extractor);
        maintenance = std::make_unique<CatalogMaintenance>(detector, *extractor);

        photos = makeDir("photos");
        ASSERT_TRUE(roots.ensure(db(), photos.string(), VisibilityTier::Public));
    }

    void TearDown() override {
        maintenance.reset();
        service.reset();
        CatalogTest::TearDown();
    }

    IngestResult ingestJpeg(const std::filesystem::path& path, int w = 16, int h = 16,
                            int seed = 0) {
        test::writeTestJpeg(path, w, h, seed);
        return service->ingest(db(), path);
    }

    KnownChecksums known;
    detection::MediaTypeDetector detector;
    std::unique_ptr<extraction::MetadataExtractor> extractor;
    std::unique_ptr<IngestService> service;
    std::unique_ptr<CatalogMaintenance> maintenance;

    catalog::ContentStore contents;
    catalog::LocationIndex locations;
    catalog::SearchIndex search;
    catalog::WatchedRoots roots;
    std::filesystem::path photos;
};

TEST_F(CatalogMaintenanceTest, CleanupRemovesLocationsOutsideRegisteredRoots) {
    auto kept = ingestJpeg(photos / "kept.jpg", 8, 8, 1);
    auto loose = ingestJpeg(testDir / "loose" / "orphan.jpg", 8, 8, 2);
    ASSERT_TRUE(kept.added());
    ASSERT_TRUE(loose.added());

    auto removed = maintenance->cleanupOrphans(db());
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 1u);

    EXPECT_EQ(locations.count(db()).value(), 1);
    EXPECT_TRUE(locations.get(db(), kept.locationId).value().has_value());
    EXPECT_FALSE(locations.get(db(), loose.locationId).value().has_value());
    // Content survives; only the location was orphaned
    EXPECT_TRUE(contents.exists(db(), loose.checksum).value());
    EXPECT_EQ(search.count(db()).value(), 1);

    auto again = maintenance->cleanupOrphans(db());
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(CatalogMaintenanceTest, RootTagsReachContentInSubdirectories) {
    ASSERT_TRUE(roots.addTag(db(), photos.string(), "vacation"));
    auto top = ingestJpeg(photos / "top.jpg", 8, 8, 1);
    auto nested = ingestJpeg(photos / "2024" / "beach.jpg", 8, 8, 2);
    auto outside = ingestJpeg(testDir / "photos-other" / "x.jpg", 8, 8, 3);

    auto added = maintenance->reconcileRootTags(db());
    ASSERT_TRUE(added);
    EXPECT_EQ(added.value(), 2u);

    EXPECT_THAT(contents.tagsFor(db(), top.checksum).value(), Contains("vacation"));
    EXPECT_THAT(contents.tagsFor(db(), nested.checksum).value(), Contains("vacation"));
    EXPECT_TRUE(contents.tagsFor(db(), outside.checksum).value().empty());

    auto hits = search.match(db(), "tags:vacation");
    ASSERT_TRUE(hits);
    EXPECT_EQ(hits.value().size(), 2u);

    auto again = maintenance->reconcileRootTags(db());
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(CatalogMaintenanceTest, RootTagsReachContentUnderNonAsciiRoot) {
    auto cafe = makeDir("caf\u00e9");
    ASSERT_TRUE(roots.ensure(db(), cafe.string(), VisibilityTier::Public));
    ASSERT_TRUE(roots.addTag(db(), cafe.string(), "paris"));
    auto nested = ingestJpeg(cafe / "2024" / "n.jpg", 8, 8, 7);
    ASSERT_TRUE(nested.added());

    auto added = maintenance->reconcileRootTags(db());
    ASSERT_TRUE(added);
    EXPECT_EQ(added.value(), 1u);
    EXPECT_THAT(contents.tagsFor(db(), nested.checksum).value(), Contains("paris"));
}

TEST_F(CatalogMaintenanceTest, ReprocessPicksUpChangedFile) {
    auto path = photos / "resized.jpg";
    auto ingested = ingestJpeg(path, 20, 10);
    ASSERT_TRUE(ingested.added());

    // Same location, new pixels on disk
    test::writeTestJpeg(path, 40, 30);
    auto stats = maintenance->reprocessMetadata(db(), ingested.locationId);
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().processed, 1u);
    EXPECT_EQ(stats.value().updated, 1u);

    auto content = contents.get(db(), ingested.checksum).value();
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->width, 40);
    EXPECT_EQ(content->height, 30);
    EXPECT_NE(content->metadataJson.find("image/jpeg"), std::string::npos);
}

TEST_F(CatalogMaintenanceTest, ReprocessKeepsMetadataWhenNothingIsRecovered) {
    auto path = photos / "broken.jpg";
    auto ingested = ingestJpeg(path, 12, 12);
    ASSERT_TRUE(ingested.added());
    const auto before = contents.get(db(), ingested.checksum).value()->metadataJson;

    writeFile("photos/broken.jpg", "definitely not a jpeg");
    auto stats = maintenance->reprocessMetadata(db(), std::string(photos.string()));
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().kept, 1u);
    EXPECT_EQ(stats.value().updated, 0u);

    auto content = contents.get(db(), ingested.checksum).value();
    EXPECT_EQ(content->metadataJson, before);
    EXPECT_EQ(content->width, 12);
}

TEST_F(CatalogMaintenanceTest, ReprocessSkipsMissingFilesAndSharedContent) {
    auto a = ingestJpeg(photos / "a.jpg", 8, 8, 4);
    auto copy = photos / "a-copy.jpg";
    std::filesystem::copy_file(photos / "a.jpg", copy);
    ASSERT_EQ(service->ingest(db(), copy).outcome, IngestOutcome::Duplicate);
    auto gone = ingestJpeg(photos / "gone.jpg", 8, 8, 5);
    std::filesystem::remove(photos / "gone.jpg");

    auto stats = maintenance->reprocessMetadata(db(), AllLocations{});
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().missing, 1u);
    // Two locations, one content: processed once
    EXPECT_EQ(stats.value().processed, 1u);
    EXPECT_TRUE(contents.exists(db(), gone.checksum).value());
}

TEST_F(CatalogMaintenanceTest, ReprocessUnknownLocationIsNotFound) {
    auto stats = maintenance->reprocessMetadata(db(), LocationId{424242});
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogMaintenanceTest, TagContentIsIndexed) {
    auto ingested = ingestJpeg(photos / "t.jpg");
    ASSERT_TRUE(maintenance->tagContent(db(), ingested.checksum, "favorite"));
    ASSERT_TRUE(maintenance->tagContent(db(), ingested.checksum, "favorite"));

    EXPECT_EQ(contents.tagsFor(db(), ingested.checksum).value(),
              std::vector<std::string>{"favorite"});
    auto hits = search.match(db(), "tags:favorite");
    ASSERT_TRUE(hits);
    EXPECT_EQ(hits.value(), std::vector<LocationId>{ingested.locationId});

    auto missing = maintenance->tagContent(db(), std::string(64, 'a'), "favorite");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogMaintenanceTest, TrashIsReversible) {
    auto a = ingestJpeg(photos / "a.jpg", 8, 8, 1);
    auto b = ingestJpeg(photos / "b.jpg", 8, 8, 2);

    ASSERT_TRUE(maintenance->setTrashed(db(), a.locationId, true));
    ASSERT_TRUE(maintenance->setTrashed(db(), b.locationId, true));
    EXPECT_EQ(maintenance->countTrashed(db()).value(), 2);

    ASSERT_TRUE(maintenance->setTrashed(db(), a.locationId, false));
    EXPECT_EQ(maintenance->countTrashed(db()).value(), 1);
    // Trashing never touches the file
    EXPECT_TRUE(std::filesystem::exists(photos / "b.jpg"));
}

TEST_F(CatalogMaintenanceTest, PermanentDeleteDropsContentWithLastLocation) {
    auto first = ingestJpeg(photos / "one.jpg", 8, 8, 9);
    auto copy = photos / "two.jpg";
    std::filesystem::copy_file(photos / "one.jpg", copy);
    auto second = service->ingest(db(), copy);
    ASSERT_EQ(second.outcome, IngestOutcome::Duplicate);
    ASSERT_TRUE(maintenance->tagContent(db(), first.checksum, "keep"));

    auto deleted = maintenance->permanentDelete(db(), first.locationId);
    ASSERT_TRUE(deleted) << deleted.error().message;
    EXPECT_FALSE(deleted.value().contentRemoved);
    EXPECT_EQ(deleted.value().checksum, first.checksum);
    EXPECT_EQ(deleted.value().directory, photos.string());
    EXPECT_FALSE(std::filesystem::exists(photos / "one.jpg"));
    EXPECT_TRUE(contents.exists(db(), first.checksum).value());

    auto last = maintenance->permanentDelete(db(), second.locationId);
    ASSERT_TRUE(last);
    EXPECT_TRUE(last.value().contentRemoved);
    EXPECT_FALSE(contents.exists(db(), first.checksum).value());
    EXPECT_EQ(locations.count(db()).value(), 0);
    EXPECT_EQ(search.count(db()).value(), 0);

    auto unknown = maintenance->permanentDelete(db(), second.locationId);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogMaintenanceTest, PermanentDeleteToleratesFileAlreadyGone) {
    auto ingested = ingestJpeg(photos / "vanished.jpg");
    std::filesystem::remove(photos / "vanished.jpg");

    auto deleted = maintenance->permanentDelete(db(), ingested.locationId);
    ASSERT_TRUE(deleted);
    EXPECT_TRUE(deleted.value().contentRemoved);
}

TEST_F(CatalogMaintenanceTest, RebuildAndVacuum) {
    ingestJpeg(photos / "a.jpg", 8, 8, 1);
    ingestJpeg(photos / "b.jpg", 8, 8, 2);

    auto rebuilt = maintenance->rebuildSearchIndex(db());
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(rebuilt.value(), 2u);
    EXPECT_EQ(search.count(db()).value(), 2);

    EXPECT_TRUE(maintenance->vacuum(db()));
    EXPECT_EQ(locations.count(db()).value(), 2);
}
