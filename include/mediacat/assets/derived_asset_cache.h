#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <mediacat/assets/asset_renderer.h>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/core/worker_pool.h>

namespace mediacat::notify {
class ChangeNotifier;
}

namespace mediacat::assets {

struct AssetCacheConfig {
    std::filesystem::path cacheDir;
    int thumbnailSize = 400;
    int previewSize = 1024;
    size_t workers = 4;
};

/**
 * @brief Where a build reads its pixels from, resolved on the worker thread
 */
struct AssetSource {
    std::filesystem::path path;
    std::string mimeType;
    bool isVideo = false;
    catalog::VisibilityTier tier = catalog::VisibilityTier::Restricted;
};

using SourceResolver = std::function<Result<AssetSource>(const Checksum&)>;

struct AssetStatus {
    enum class State { Ready, Pending };
    State state = State::Pending;
    std::filesystem::path path; ///< set when Ready

    [[nodiscard]] bool ready() const { return state == State::Ready; }
};

/**
 * @brief On-disk cache of thumbnails and previews keyed by (checksum, kind, size)
 *
 * A hit is answered from the filesystem without locking: published files never change. A miss
 * registers the key in the in-flight set and queues one build on the worker pool; concurrent
 * misses for the same key get Pending without queueing more work. Builds write
 * `<final>.tmp` and rename it into place. A failed build only clears its in-flight marker, so
 * the next get() retries.
 *
 * Layout: `<cacheDir>/thumbnails/{checksum}_thumb.jpg`, `<cacheDir>/previews/{checksum}_preview.jpg`,
 * with non-default sizes in a `<size>/` subdirectory of the kind directory.
 */
class DerivedAssetCache {
public:
    DerivedAssetCache(AssetCacheConfig config, std::shared_ptr<IAssetRenderer> renderer,
                      SourceResolver resolver, notify::ChangeNotifier* notifier = nullptr);
    ~DerivedAssetCache();

    DerivedAssetCache(const DerivedAssetCache&) = delete;
    DerivedAssetCache& operator=(const DerivedAssetCache&) = delete;

    Result<AssetStatus> get(const Checksum& checksum, AssetKind kind,
                            std::optional<int> size = std::nullopt);

    [[nodiscard]] std::filesystem::path pathFor(const Checksum& checksum, AssetKind kind,
                                                std::optional<int> size = std::nullopt) const;
    [[nodiscard]] std::filesystem::path kindDirectory(AssetKind kind) const;
    [[nodiscard]] int defaultSize(AssetKind kind) const;

    /**
     * @brief Delete every cached file of this kind
     * @return number of files removed
     */
    Result<size_t> purge(AssetKind kind);

    // Remove all renditions of one content; returns files removed
    size_t evict(const Checksum& checksum);

    [[nodiscard]] bool building(const Checksum& checksum, AssetKind kind,
                                std::optional<int> size = std::nullopt) const;
    [[nodiscard]] size_t inFlightCount() const;

    // Stop accepting builds and wait for running ones
    void shutdown();

private:
    static std::string makeKey(const Checksum& checksum, AssetKind kind, int size);
    void build(const Checksum& checksum, AssetKind kind, int size, std::string key);

    AssetCacheConfig config_;
    std::shared_ptr<IAssetRenderer> renderer_;
    SourceResolver resolver_;
    notify::ChangeNotifier* notifier_;

    mutable std::mutex inFlightMutex_;
    std::unordered_set<std::string> inFlight_;

    WorkerPool workers_;
};

} // namespace mediacat::assets
