#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <mediacat/assets/derived_asset_cache.h>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>
#include <mediacat/catalog/search_index.h>
#include <mediacat/catalog/watched_roots.h>
#include <mediacat/config/config.h>
#include <mediacat/detection/media_type_detector.h>
#include <mediacat/extraction/metadata_extractor.h>
#include <mediacat/ingest/ingest_service.h>
#include <mediacat/ingest/maintenance.h>
#include <mediacat/ingest/scanner.h>
#include <mediacat/ingest/watcher.h>
#include <mediacat/metadata/connection_pool.h>
#include <mediacat/notify/change_notifier.h>

namespace mediacat::app {

struct CatalogStats {
    int64_t contents = 0;
    int64_t locations = 0;
    int64_t trashed = 0;
    int64_t indexedRows = 0;
    size_t roots = 0;
    size_t knownChecksums = 0;
};

/**
 * @brief Owns one catalog: its database, ingest pipeline, asset cache and change signals
 *
 * This is the surface the CLI (or any host) talks to. initialize() must succeed before any
 * other call.
 */
class CatalogService {
public:
    explicit CatalogService(config::MediacatConfig config,
                            std::shared_ptr<assets::IAssetRenderer> renderer = nullptr);
    ~CatalogService();

    CatalogService(const CatalogService&) = delete;
    CatalogService& operator=(const CatalogService&) = delete;

    /**
     * @brief Create directories, open and migrate the database, seed configured roots and load
     * the known-checksum set
     */
    Result<void> initialize();
    void shutdown();

    ingest::IngestResult ingest(const std::filesystem::path& path);
    Result<ingest::ScanStats> scanAll();

    // Watch every non-ignored root until stopWatching()
    Result<void> startWatching();
    void stopWatching();
    [[nodiscard]] bool watching() const { return watcher_.running(); }

    /**
     * @brief Path of a cached rendition, or Pending while it is being built
     *
     * Unknown checksums fail with NotFound.
     */
    Result<assets::AssetStatus> getOrBuildAsset(const Checksum& checksum, assets::AssetKind kind,
                                                std::optional<int> size = std::nullopt);
    Result<size_t> purgeAssets(assets::AssetKind kind);

    notify::ChangeNotifier::SubscriptionId onCatalogChange(catalog::VisibilityTier audience,
                                                           notify::ChangeNotifier::Listener listener);
    void unsubscribe(notify::ChangeNotifier::SubscriptionId id);

    Result<std::vector<catalog::WatchedRoot>> listRoots();
    Result<void> addRoot(const std::string& path, catalog::VisibilityTier tier);
    Result<void> removeRoot(const std::string& path);
    Result<void> setRootIgnored(const std::string& path, bool ignored);
    Result<void> setRootTier(const std::string& path, catalog::VisibilityTier tier);
    Result<void> tagRoot(const std::string& path, const std::string& tag);

    Result<void> tagContent(const Checksum& checksum, const std::string& tag);
    Result<std::vector<std::string>> tagsFor(const Checksum& checksum);

    Result<void> setTrashed(LocationId id, bool trashed);
    Result<int64_t> countTrashed();
    Result<ingest::PermanentDeleteResult> permanentDelete(LocationId id);

    Result<ingest::ReprocessStats> reprocessMetadata(const ingest::ReprocessScope& scope);
    Result<size_t> rebuildSearchIndex();
    Result<void> vacuum();
    Result<CatalogStats> stats();

    [[nodiscard]] const config::MediacatConfig& config() const { return config_; }
    notify::ChangeNotifier& notifier() { return *notifier_; }
    assets::DerivedAssetCache& assetCache() { return *assets_; }

private:
    Result<std::unique_ptr<metadata::PooledConnection>> connection();
    Result<assets::AssetSource> resolveSource(const Checksum& checksum);
    void notifyDirectory(metadata::Database& db, const std::string& directory);
    static std::string normalizeRoot(const std::string& path);

    config::MediacatConfig config_;
    bool initialized_ = false;

    std::unique_ptr<metadata::ConnectionPool> pool_;
    ingest::KnownChecksums known_;
    detection::MediaTypeDetector detector_;
    extraction::MetadataExtractor extractor_;
    std::unique_ptr<notify::ChangeNotifier> notifier_;

    ingest::IngestService ingest_;
    ingest::CatalogMaintenance maintenance_;
    ingest::Scanner scanner_;
    ingest::Watcher watcher_;

    catalog::WatchedRoots roots_;
    catalog::ContentStore contents_;
    catalog::LocationIndex locations_;
    catalog::SearchIndex search_;

    std::unique_ptr<assets::DerivedAssetCache> assets_;
};

} // namespace mediacat::app
