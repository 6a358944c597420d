#include <gtest/gtest.h>
#include <mediacat/ingest/watcher.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::ingest;
using catalog::VisibilityTier;

TEST(WatcherRootsTest, NestedRootsCollapseToOutermost) {
    auto collapsed = Watcher::collapseRoots({"/media/photos/2024", "/media/photos",
                                             "/media/photos-raw", "/media/photos/",
                                             "/archive/a/b", "/archive/a/b/c"});
    EXPECT_EQ(collapsed, (std::vector<std::string>{"/archive/a/b", "/media/photos",
                                                    "/media/photos-raw"}));
}

TEST(WatcherRootsTest, EmptyInput) {
    EXPECT_TRUE(Watcher::collapseRoots({}).empty());
}

class WatcherTest : public test::CatalogTest {
protected:
    void SetUp() override {
        CatalogTest::SetUp();
        extraction::MetadataExtractorConfig config;
        config.ffprobePath = "/nonexistent/ffprobe";
        extractor = std::make_unique<extraction::MetadataExtractor>(config);
        service = std::make_unique<IngestService>(*pool, known, detector, *extractor);
        watcher = std::make_unique<Watcher>(*service);

        photos = makeDir("photos");
        ASSERT_TRUE(roots.ensure(db(), photos.string(), VisibilityTier::Public));
    }

    void TearDown() override {
        watcher.reset();
        service.reset();
        CatalogTest::TearDown();
    }

    bool hasLocation(const std::filesystem::path& path) {
        auto found = locations.find(db(), path.parent_path().string(), path.filename().string());
        return found && found.value().has_value();
    }

    KnownChecksums known;
    detection::MediaTypeDetector detector;
    std::unique_ptr<extraction::MetadataExtractor> extractor;
    std::unique_ptr<IngestService> service;
    std::unique_ptr<Watcher> watcher;

    catalog::LocationIndex locations;
    catalog::WatchedRoots roots;
    std::filesystem::path photos;
};

TEST_F(WatcherTest, CreateInTrackedDirectoryIngests) {
    auto path = test::writeTestJpeg(photos / "new.jpg", 8, 8);
    watcher->handleCreate(path);
    EXPECT_TRUE(hasLocation(path));
}

TEST_F(WatcherTest, CreateInUntrackedDirectoryIsDropped) {
    auto path = test::writeTestJpeg(photos / "unregistered" / "new.jpg", 8, 8);
    watcher->handleCreate(path);
    EXPECT_FALSE(hasLocation(path));
}

TEST_F(WatcherTest, CreateInIgnoredRootIsDropped) {
    ASSERT_TRUE(roots.setIgnored(db(), photos.string(), true));
    auto path = test::writeTestJpeg(photos / "new.jpg", 8, 8);
    watcher->handleCreate(path);
    EXPECT_FALSE(hasLocation(path));
}

TEST_F(WatcherTest, DeleteRemovesLocation) {
    auto path = test::writeTestJpeg(photos / "gone.jpg", 8, 8);
    watcher->handleCreate(path);
    ASSERT_TRUE(hasLocation(path));

    std::filesystem::remove(path);
    watcher->handleDelete(path);
    EXPECT_FALSE(hasLocation(path));

    // Unknown file is a no-op
    watcher->handleDelete(photos / "never-seen.jpg");
}

TEST_F(WatcherTest, MoveWithinTrackedRoots) {
    auto album = makeDir("photos/album");
    catalog::WatchedRoot root;
    root.path = album.string();
    root.shortName = "album";
    root.parent = photos.string();
    ASSERT_TRUE(roots.add(db(), root));

    auto from = test::writeTestJpeg(photos / "m.jpg", 8, 8);
    watcher->handleCreate(from);
    auto before = locations.find(db(), photos.string(), "m.jpg").value();
    ASSERT_TRUE(before.has_value());

    auto to = album / "m.jpg";
    std::filesystem::rename(from, to);
    watcher->handleMove(from, to);

    EXPECT_FALSE(hasLocation(from));
    auto after = locations.find(db(), album.string(), "m.jpg").value();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->id, before->id);
    EXPECT_EQ(after->checksum, before->checksum);
}

TEST_F(WatcherTest, MoveOutOfTrackedRootsRemoves) {
    auto from = test::writeTestJpeg(photos / "leaving.jpg", 8, 8);
    watcher->handleCreate(from);
    ASSERT_TRUE(hasLocation(from));

    auto outside = makeDir("elsewhere") / "leaving.jpg";
    std::filesystem::rename(from, outside);
    watcher->handleMove(from, outside);

    EXPECT_FALSE(hasLocation(from));
    EXPECT_FALSE(hasLocation(outside));
}

TEST_F(WatcherTest, StartTwiceIsRejected) {
    ASSERT_TRUE(watcher->start({photos.string()}));
    EXPECT_TRUE(watcher->running());
    EXPECT_GE(watcher->watchCount(), 1u);

    auto again = watcher->start({photos.string()});
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

    watcher->stop();
    EXPECT_FALSE(watcher->running());
    EXPECT_EQ(watcher->watchCount(), 0u);
}

TEST_F(WatcherTest, LiveEventsReachTheCatalog) {
    ASSERT_TRUE(watcher->start({photos.string()}));

    auto path = test::writeTestJpeg(photos / "live.jpg", 8, 8, 4);
    ASSERT_TRUE(test::waitFor([&] { return hasLocation(path); }));

    auto renamed = photos / "renamed.jpg";
    std::filesystem::rename(path, renamed);
    ASSERT_TRUE(test::waitFor([&] { return hasLocation(renamed) && !hasLocation(path); }));

    std::filesystem::remove(renamed);
    EXPECT_TRUE(test::waitFor([&] { return !hasLocation(renamed); }));

    watcher->stop();
}
