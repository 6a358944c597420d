#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <mediacat/app/catalog_service.h>
#include <mediacat/metadata/migration.h>

namespace mediacat::app {

namespace fs = std::filesystem;
using catalog::VisibilityTier;

namespace {

metadata::ConnectionPoolConfig poolConfig(const config::MediacatConfig& config) {
    metadata::ConnectionPoolConfig pc;
    pc.minConnections = 1;
    pc.maxConnections = static_cast<size_t>(config.database.maxConnections);
    pc.busyTimeout = config.database.busyTimeout;
    return pc;
}

extraction::MetadataExtractorConfig extractorConfig(const config::MediacatConfig& config) {
    extraction::MetadataExtractorConfig ec;
    ec.ffprobePath = config.assets.ffprobe;
    return ec;
}

} // namespace

CatalogService::CatalogService(config::MediacatConfig config,
                               std::shared_ptr<assets::IAssetRenderer> renderer)
    : config_(std::move(config)),
      pool_(std::make_unique<metadata::ConnectionPool>(config_.databasePath().string(),
                                                       poolConfig(config_))),
      extractor_(extractorConfig(config_)),
      notifier_(std::make_unique<notify::ChangeNotifier>(config_.notify.debounce)),
      ingest_(*pool_, known_, detector_, extractor_, notifier_.get()),
      maintenance_(detector_, extractor_), scanner_(ingest_, maintenance_), watcher_(ingest_) {
    if (!renderer) {
        assets::JpegRendererConfig rc;
        rc.ffmpegPath = config_.assets.ffmpeg;
        rc.quality = config_.assets.jpegQuality;
        renderer = std::make_shared<assets::JpegAssetRenderer>(rc);
    }

    assets::AssetCacheConfig ac;
    ac.cacheDir = config_.core.cacheDir;
    ac.thumbnailSize = config_.assets.thumbnailSize;
    ac.previewSize = config_.assets.previewSize;
    ac.workers = static_cast<size_t>(config_.assets.workers);
    assets_ = std::make_unique<assets::DerivedAssetCache>(
        ac, std::move(renderer),
        [this](const Checksum& checksum) { return resolveSource(checksum); }, notifier_.get());
}

CatalogService::~CatalogService() {
    shutdown();
}

Result<void> CatalogService::initialize() {
    if (initialized_)
        return {};

    std::error_code ec;
    for (const auto& dir : {config_.core.dataDir, config_.core.cacheDir}) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Cannot create directory " + dir.string() + ": " + ec.message()};
        }
    }

    auto poolInit = pool_->initialize();
    if (!poolInit)
        return poolInit.error();

    auto conn = connection();
    if (!conn)
        return conn.error();
    auto handle = std::move(conn).value();
    metadata::Database& db = **handle;

    auto migrated = metadata::migrateCatalog(db);
    if (!migrated) {
        spdlog::error("Catalog migration failed for {}: {}", pool_->path(),
                      migrated.error().message);
        return migrated.error();
    }

    for (const auto& root : config_.roots) {
        auto ensured = roots_.ensure(db, root.path, root.tier);
        if (!ensured) {
            spdlog::error("Failed to register configured root {}: {}", root.path,
                          ensured.error().message);
            return ensured.error();
        }
    }

    auto checksums = contents_.allChecksums(db);
    if (!checksums)
        return checksums.error();
    known_.merge(checksums.value());

    initialized_ = true;
    spdlog::info("Catalog ready at {} ({} contents, {} configured roots)", pool_->path(),
                 known_.size(), config_.roots.size());
    return {};
}

void CatalogService::shutdown() {
    scanner_.requestStop();
    watcher_.stop();
    if (assets_)
        assets_->shutdown();
    if (notifier_)
        notifier_->stop();
    if (pool_)
        pool_->shutdown();
    initialized_ = false;
}

Result<std::unique_ptr<metadata::PooledConnection>> CatalogService::connection() {
    auto conn = pool_->acquire();
    if (!conn) {
        return Error{ErrorCode::ResourceExhausted,
                     "Failed to acquire database connection: " + conn.error().message};
    }
    return conn;
}

ingest::IngestResult CatalogService::ingest(const fs::path& path) {
    return ingest_.ingest(path);
}

Result<ingest::ScanStats> CatalogService::scanAll() {
    return scanner_.scanAll();
}

Result<void> CatalogService::startWatching() {
    auto roots = listRoots();
    if (!roots)
        return roots.error();

    std::vector<std::string> paths;
    for (const auto& root : roots.value()) {
        if (!root.ignored)
            paths.push_back(root.path);
    }
    if (paths.empty())
        return Error{ErrorCode::InvalidState, "No watched roots to watch"};
    return watcher_.start(paths);
}

void CatalogService::stopWatching() {
    watcher_.stop();
}

Result<assets::AssetStatus> CatalogService::getOrBuildAsset(const Checksum& checksum,
                                                            assets::AssetKind kind,
                                                            std::optional<int> size) {
    auto exists = pool_->withConnection(
        [&](metadata::Database& db) { return contents_.exists(db, checksum); });
    if (!exists)
        return exists.error();
    if (!exists.value())
        return Error{ErrorCode::NotFound, "Unknown content: " + checksum};

    return assets_->get(checksum, kind, size);
}

Result<size_t> CatalogService::purgeAssets(assets::AssetKind kind) {
    return assets_->purge(kind);
}

notify::ChangeNotifier::SubscriptionId
CatalogService::onCatalogChange(VisibilityTier audience, notify::ChangeNotifier::Listener listener) {
    return notifier_->onCatalogChange(audience, std::move(listener));
}

void CatalogService::unsubscribe(notify::ChangeNotifier::SubscriptionId id) {
    notifier_->unsubscribe(id);
}

// Prefer a live, non-trashed location; the root's tier decides who hears about the build
Result<assets::AssetSource> CatalogService::resolveSource(const Checksum& checksum) {
    return pool_->withConnection([&](metadata::Database& db) -> Result<assets::AssetSource> {
        auto content = contents_.get(db, checksum);
        if (!content)
            return content.error();
        if (!content.value())
            return Error{ErrorCode::NotFound, "Unknown content: " + checksum};

        auto locations = locations_.forContent(db, checksum);
        if (!locations)
            return locations.error();

        std::optional<catalog::LocationRecord> chosen;
        std::error_code ec;
        for (const auto& loc : locations.value()) {
            if (!fs::exists(loc.fullPath(), ec))
                continue;
            if (!chosen || (chosen->deleted && !loc.deleted))
                chosen = loc;
            if (!chosen->deleted)
                break;
        }
        if (!chosen) {
            return Error{ErrorCode::FileNotFound,
                         "No location of " + checksum + " exists on disk"};
        }

        assets::AssetSource source;
        source.path = chosen->fullPath();
        source.isVideo = content.value()->isVideo;

        auto metadata = nlohmann::json::parse(content.value()->metadataJson, nullptr, false);
        if (metadata.is_object() && metadata.contains("mime_type") &&
            metadata["mime_type"].is_string()) {
            source.mimeType = metadata["mime_type"].get<std::string>();
        } else {
            auto detected = detector_.detect(source.path);
            if (!detected)
                return detected.error();
            source.mimeType = detected.value().mimeType;
        }

        source.tier = ingest_.tierForDirectory(db, chosen->directory);
        return source;
    });
}

void CatalogService::notifyDirectory(metadata::Database& db, const std::string& directory) {
    notifier_->schedule(ingest_.tierForDirectory(db, directory));
}

std::string CatalogService::normalizeRoot(const std::string& path) {
    std::string normalized = fs::path(path).lexically_normal().string();
    if (normalized.size() > 1 && normalized.back() == '/')
        normalized.pop_back();
    return normalized;
}

Result<std::vector<catalog::WatchedRoot>> CatalogService::listRoots() {
    return pool_->withConnection([&](metadata::Database& db) { return roots_.list(db); });
}

Result<void> CatalogService::addRoot(const std::string& path, VisibilityTier tier) {
    const fs::path rootPath(path);
    if (!rootPath.is_absolute())
        return Error{ErrorCode::InvalidArgument, "Watched root must be absolute: " + path};

    std::error_code ec;
    if (!fs::is_directory(rootPath, ec))
        return Error{ErrorCode::FileNotFound, "Not a directory: " + path};

    return pool_->withConnection([&](metadata::Database& db) -> Result<void> {
        auto id = roots_.ensure(db, normalizeRoot(path), tier);
        if (!id)
            return id.error();
        spdlog::info("Watched root {} registered as {}", path, catalog::tierToString(tier));
        return {};
    });
}

Result<void> CatalogService::removeRoot(const std::string& path) {
    return pool_->withConnection([&](metadata::Database& db) -> Result<void> {
        const std::string normalized = normalizeRoot(path);
        auto tier = roots_.tierFor(db, normalized);
        if (!tier)
            return tier.error();
        if (!tier.value())
            return Error{ErrorCode::NotFound, "Not a watched root: " + path};

        auto removed = roots_.remove(db, normalized);
        if (!removed)
            return removed.error();
        // Its locations become orphans and are dropped on the next scan
        notifier_->schedule(*tier.value());
        return {};
    });
}

Result<void> CatalogService::setRootIgnored(const std::string& path, bool ignored) {
    return pool_->withConnection([&](metadata::Database& db) {
        return roots_.setIgnored(db, normalizeRoot(path), ignored);
    });
}

Result<void> CatalogService::setRootTier(const std::string& path, VisibilityTier tier) {
    return pool_->withConnection([&](metadata::Database& db) -> Result<void> {
        auto updated = roots_.setTier(db, normalizeRoot(path), tier);
        if (!updated)
            return updated.error();
        // Content under the root just became visible to (or hidden from) public listeners
        notifier_->schedule(VisibilityTier::Public);
        return {};
    });
}

Result<void> CatalogService::tagRoot(const std::string& path, const std::string& tag) {
    return pool_->withConnection([&](metadata::Database& db) {
        return roots_.addTag(db, normalizeRoot(path), tag);
    });
}

Result<void> CatalogService::tagContent(const Checksum& checksum, const std::string& tag) {
    return pool_->withConnection([&](metadata::Database& db) -> Result<void> {
        auto tagged = maintenance_.tagContent(db, checksum, tag);
        if (!tagged)
            return tagged.error();

        auto locations = locations_.forContent(db, checksum);
        if (!locations)
            return locations.error();
        auto tier = VisibilityTier::Restricted;
        for (const auto& loc : locations.value())
            tier = catalog::moreVisible(tier, ingest_.tierForDirectory(db, loc.directory));
        notifier_->schedule(tier);
        return {};
    });
}

Result<std::vector<std::string>> CatalogService::tagsFor(const Checksum& checksum) {
    return pool_->withConnection(
        [&](metadata::Database& db) { return contents_.tagsFor(db, checksum); });
}

Result<void> CatalogService::setTrashed(LocationId id, bool trashed) {
    return pool_->withConnection([&](metadata::Database& db) -> Result<void> {
        auto location = locations_.get(db, id);
        if (!location)
            return location.error();
        if (!location.value())
            return Error{ErrorCode::NotFound, "No location with id " + std::to_string(id)};

        auto updated = maintenance_.setTrashed(db, id, trashed);
        if (!updated)
            return updated.error();
        notifyDirectory(db, location.value()->directory);
        return {};
    });
}

Result<int64_t> CatalogService::countTrashed() {
    return pool_->withConnection(
        [&](metadata::Database& db) { return maintenance_.countTrashed(db); });
}

Result<ingest::PermanentDeleteResult> CatalogService::permanentDelete(LocationId id) {
    return pool_->withConnection(
        [&](metadata::Database& db) -> Result<ingest::PermanentDeleteResult> {
            auto deleted = maintenance_.permanentDelete(db, id);
            if (!deleted)
                return deleted.error();

            const auto& result = deleted.value();
            if (result.contentRemoved) {
                known_.erase(result.checksum);
                size_t evicted = assets_->evict(result.checksum);
                spdlog::debug("Evicted {} cached renditions of {}", evicted, result.checksum);
            }
            notifyDirectory(db, result.directory);
            return deleted;
        });
}

Result<ingest::ReprocessStats>
CatalogService::reprocessMetadata(const ingest::ReprocessScope& scope) {
    return pool_->withConnection(
        [&](metadata::Database& db) -> Result<ingest::ReprocessStats> {
            auto stats = maintenance_.reprocessMetadata(db, scope);
            if (stats && stats.value().updated > 0)
                notifier_->schedule(VisibilityTier::Public);
            return stats;
        });
}

Result<size_t> CatalogService::rebuildSearchIndex() {
    return pool_->withConnection(
        [&](metadata::Database& db) { return maintenance_.rebuildSearchIndex(db); });
}

Result<void> CatalogService::vacuum() {
    return pool_->withConnection([&](metadata::Database& db) { return maintenance_.vacuum(db); });
}

Result<CatalogStats> CatalogService::stats() {
    return pool_->withConnection([&](metadata::Database& db) -> Result<CatalogStats> {
        CatalogStats stats;

        auto contents = contents_.count(db);
        if (!contents)
            return contents.error();
        stats.contents = contents.value();

        auto locations = locations_.count(db);
        if (!locations)
            return locations.error();
        stats.locations = locations.value();

        auto trashed = locations_.countDeleted(db);
        if (!trashed)
            return trashed.error();
        stats.trashed = trashed.value();

        auto indexed = search_.count(db);
        if (!indexed)
            return indexed.error();
        stats.indexedRows = indexed.value();

        auto roots = roots_.list(db);
        if (!roots)
            return roots.error();
        stats.roots = roots.value().size();

        stats.knownChecksums = known_.size();
        return stats;
    });
}

} // namespace mediacat::app
