#include <gtest/gtest.h>
#include <mediacat/app/catalog_service.h>

#include <atomic>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::app;
using catalog::VisibilityTier;
using ::testing::Contains;

class CatalogServiceTest : public test::MediacatTest {
protected:
    void SetUp() override {
        MediacatTest::SetUp();
        photos = makeDir("photos");
        restricted = makeDir("private");

        config.core.dataDir = testDir / "data";
        config.core.cacheDir = testDir / "cache";
        config.assets.ffmpeg = "/nonexistent/ffmpeg";
        config.assets.ffprobe = "/nonexistent/ffprobe";
        config.assets.workers = 2;
        config.notify.debounce = std::chrono::milliseconds(20);
        config.database.maxConnections = 4;
        config.roots.push_back({photos.string(), VisibilityTier::Public});
        config.roots.push_back({restricted.string(), VisibilityTier::Restricted});

        service = std::make_unique<CatalogService>(config);
        ASSERT_TRUE(service->initialize());
    }

    void TearDown() override {
        service.reset();
        MediacatTest::TearDown();
    }

    config::MediacatConfig config;
    std::unique_ptr<CatalogService> service;
    std::filesystem::path photos;
    std::filesystem::path restricted;
};

TEST_F(CatalogServiceTest, InitializeSeedsConfiguredRoots) {
    EXPECT_TRUE(std::filesystem::exists(config.databasePath()));
    auto roots = service->listRoots();
    ASSERT_TRUE(roots);
    ASSERT_EQ(roots.value().size(), 2u);
    for (const auto& root : roots.value()) {
        EXPECT_TRUE(root.basepath);
        EXPECT_EQ(root.tier, root.path == photos.string() ? VisibilityTier::Public
                                                          : VisibilityTier::Restricted);
    }
}

TEST_F(CatalogServiceTest, ScanThenBuildThumbnail) {
    test::writeTestJpeg(photos / "a.jpg", 800, 400, 1);
    test::writeTestJpeg(photos / "album" / "b.jpg", 64, 64, 2);

    auto scanned = service->scanAll();
    ASSERT_TRUE(scanned) << scanned.error().message;
    EXPECT_EQ(scanned.value().newContent, 2u);

    auto stats = service->stats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().contents, 2);
    EXPECT_EQ(stats.value().locations, 2);
    EXPECT_EQ(stats.value().indexedRows, 2);
    EXPECT_EQ(stats.value().roots, 3u);
    EXPECT_EQ(stats.value().knownChecksums, 2u);

    auto ingested = service->ingest(photos / "a.jpg");
    ASSERT_EQ(ingested.outcome, ingest::IngestOutcome::AlreadyPresent);

    assets::AssetStatus status;
    ASSERT_TRUE(test::waitFor([&] {
        auto r = service->getOrBuildAsset(ingested.checksum, assets::AssetKind::Thumbnail, 200);
        if (!r)
            return false;
        status = r.value();
        return status.ready();
    }));
    auto decoded = assets::decodeJpeg(status.path, 10000);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().width, 200);
    EXPECT_EQ(decoded.value().height, 100);

    auto purged = service->purgeAssets(assets::AssetKind::Thumbnail);
    ASSERT_TRUE(purged);
    EXPECT_EQ(purged.value(), 1u);
}

TEST_F(CatalogServiceTest, UnknownContentHasNoAssets) {
    auto r = service->getOrBuildAsset(std::string(64, 'e'), assets::AssetKind::Preview);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogServiceTest, ChangesReachListenersByTier) {
    std::atomic<int> publicSignals{0};
    std::atomic<int> restrictedSignals{0};
    service->onCatalogChange(VisibilityTier::Public,
                             [&](VisibilityTier) { publicSignals.fetch_add(1); });
    service->onCatalogChange(VisibilityTier::Restricted, [&](VisibilityTier tier) {
        if (tier == VisibilityTier::Restricted)
            restrictedSignals.fetch_add(1);
    });

    test::writeTestJpeg(restricted / "secret.jpg", 8, 8, 3);
    ASSERT_TRUE(service->ingest(restricted / "secret.jpg").added());
    ASSERT_TRUE(test::waitFor([&] { return restrictedSignals.load() == 1; }));
    EXPECT_EQ(publicSignals.load(), 0);

    test::writeTestJpeg(photos / "shared.jpg", 8, 8, 4);
    ASSERT_TRUE(service->ingest(photos / "shared.jpg").added());
    EXPECT_TRUE(test::waitFor([&] { return publicSignals.load() == 1; }));
}

TEST_F(CatalogServiceTest, PermanentDeleteForgetsContent) {
    auto path = test::writeTestJpeg(photos / "doomed.jpg", 32, 32, 5);
    auto ingested = service->ingest(path);
    ASSERT_TRUE(ingested.added());

    ASSERT_TRUE(test::waitFor([&] {
        auto r = service->getOrBuildAsset(ingested.checksum, assets::AssetKind::Thumbnail);
        return r && r.value().ready();
    }));
    const auto thumb = service->assetCache().pathFor(ingested.checksum,
                                                     assets::AssetKind::Thumbnail);
    ASSERT_TRUE(std::filesystem::exists(thumb));

    auto deleted = service->permanentDelete(ingested.locationId);
    ASSERT_TRUE(deleted) << deleted.error().message;
    EXPECT_TRUE(deleted.value().contentRemoved);
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(thumb));
    EXPECT_EQ(service->stats().value().knownChecksums, 0u);

    // Same bytes again are new content
    test::writeTestJpeg(path, 32, 32, 5);
    EXPECT_EQ(service->ingest(path).outcome, ingest::IngestOutcome::New);
}

TEST_F(CatalogServiceTest, RootAdministration) {
    auto extra = makeDir("extra");
    ASSERT_TRUE(service->addRoot(extra.string() + "/", VisibilityTier::Public));
    ASSERT_TRUE(service->tagRoot(extra.string(), "extra-tag"));
    ASSERT_TRUE(service->setRootTier(extra.string(), VisibilityTier::Restricted));

    auto ingested = service->ingest(test::writeTestJpeg(extra / "x.jpg", 8, 8, 6));
    ASSERT_TRUE(ingested.added());
    // Root tags are reconciled at the start of a scan
    ASSERT_TRUE(service->scanAll());
    EXPECT_THAT(service->tagsFor(ingested.checksum).value(), Contains("extra-tag"));

    auto relative = service->addRoot("relative/dir", VisibilityTier::Public);
    EXPECT_FALSE(relative);
    auto missing = service->addRoot((testDir / "nope").string(), VisibilityTier::Public);
    EXPECT_FALSE(missing);

    ASSERT_TRUE(service->setRootIgnored(extra.string(), true));
    ASSERT_TRUE(service->removeRoot(extra.string()));
    auto gone = service->removeRoot(extra.string());
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogServiceTest, TrashAndTags) {
    auto ingested = service->ingest(test::writeTestJpeg(photos / "t.jpg", 8, 8, 7));
    ASSERT_TRUE(ingested.added());

    ASSERT_TRUE(service->tagContent(ingested.checksum, "starred"));
    EXPECT_EQ(service->tagsFor(ingested.checksum).value(), std::vector<std::string>{"starred"});

    ASSERT_TRUE(service->setTrashed(ingested.locationId, true));
    EXPECT_EQ(service->countTrashed().value(), 1);
    ASSERT_TRUE(service->setTrashed(ingested.locationId, false));
    EXPECT_EQ(service->countTrashed().value(), 0);

    auto unknown = service->setTrashed(987654, true);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(CatalogServiceTest, MaintenanceOperations) {
    auto ingested = service->ingest(test::writeTestJpeg(photos / "m.jpg", 30, 20, 8));
    ASSERT_TRUE(ingested.added());

    auto reprocessed = service->reprocessMetadata(ingest::AllLocations{});
    ASSERT_TRUE(reprocessed);
    EXPECT_EQ(reprocessed.value().updated, 1u);

    auto rebuilt = service->rebuildSearchIndex();
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(rebuilt.value(), 1u);
    EXPECT_TRUE(service->vacuum());
}

TEST_F(CatalogServiceTest, WatchingNeedsRoots) {
    ASSERT_TRUE(service->startWatching());
    EXPECT_TRUE(service->watching());
    service->stopWatching();
    EXPECT_FALSE(service->watching());

    ASSERT_TRUE(service->setRootIgnored(photos.string(), true));
    ASSERT_TRUE(service->setRootIgnored(restricted.string(), true));
    auto r = service->startWatching();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
}
