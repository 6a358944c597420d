#include <spdlog/spdlog.h>
#include <mediacat/assets/derived_asset_cache.h>
#include <mediacat/notify/change_notifier.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace mediacat::assets {

namespace fs = std::filesystem;

namespace {

// Checksums become file names; only lowercase hex is accepted
bool isValidChecksum(const Checksum& checksum) {
    return !checksum.empty() && std::all_of(checksum.begin(), checksum.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f');
    });
}

} // namespace

DerivedAssetCache::DerivedAssetCache(AssetCacheConfig config,
                                     std::shared_ptr<IAssetRenderer> renderer,
                                     SourceResolver resolver, notify::ChangeNotifier* notifier)
    : config_(std::move(config)),
      renderer_(std::move(renderer)),
      resolver_(std::move(resolver)),
      notifier_(notifier),
      workers_(config_.workers, "AssetWorkers") {}

DerivedAssetCache::~DerivedAssetCache() {
    shutdown();
}

void DerivedAssetCache::shutdown() {
    workers_.stop();
}

int DerivedAssetCache::defaultSize(AssetKind kind) const {
    return kind == AssetKind::Thumbnail ? config_.thumbnailSize : config_.previewSize;
}

fs::path DerivedAssetCache::kindDirectory(AssetKind kind) const {
    return config_.cacheDir / (kind == AssetKind::Thumbnail ? "thumbnails" : "previews");
}

fs::path DerivedAssetCache::pathFor(const Checksum& checksum, AssetKind kind,
                                    std::optional<int> size) const {
    const int effective = size.value_or(defaultSize(kind));
    fs::path dir = kindDirectory(kind);
    if (effective != defaultSize(kind))
        dir /= std::to_string(effective);
    return dir / (checksum + "_" + kindToString(kind) + ".jpg");
}

std::string DerivedAssetCache::makeKey(const Checksum& checksum, AssetKind kind, int size) {
    return checksum + "|" + kindToString(kind) + "|" + std::to_string(size);
}

Result<AssetStatus> DerivedAssetCache::get(const Checksum& checksum, AssetKind kind,
                                           std::optional<int> size) {
    if (!isValidChecksum(checksum))
        return Error{ErrorCode::InvalidArgument, "Invalid checksum: " + checksum};
    const int effective = size.value_or(defaultSize(kind));
    if (effective <= 0)
        return Error{ErrorCode::InvalidArgument, "Invalid asset size: " + std::to_string(effective)};

    const fs::path finalPath = pathFor(checksum, kind, effective);
    std::error_code ec;
    if (fs::exists(finalPath, ec))
        return AssetStatus{AssetStatus::State::Ready, finalPath};

    std::string key = makeKey(checksum, kind, effective);
    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        if (!inFlight_.insert(key).second)
            return AssetStatus{AssetStatus::State::Pending, {}};
        // A build may have published between the check above and taking the lock
        if (fs::exists(finalPath, ec)) {
            inFlight_.erase(key);
            return AssetStatus{AssetStatus::State::Ready, finalPath};
        }
    }

    spdlog::debug("Queueing {} build for {} at {}px", kindToString(kind), checksum, effective);
    workers_.post([this, checksum, kind, effective, key = std::move(key)]() mutable {
        build(checksum, kind, effective, std::move(key));
    });
    return AssetStatus{AssetStatus::State::Pending, {}};
}

void DerivedAssetCache::build(const Checksum& checksum, AssetKind kind, int size,
                              std::string key) {
    const fs::path finalPath = pathFor(checksum, kind, size);
    const fs::path tempPath = finalPath.string() + ".tmp";
    std::optional<catalog::VisibilityTier> publishedTier;

    auto source = resolver_(checksum);
    if (!source) {
        spdlog::warn("{} build for {} skipped: {}", kindToString(kind), checksum,
                     source.error().message);
    } else {
        std::error_code ec;
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", finalPath.parent_path().string(), ec.message());
        } else {
            RenderRequest request;
            request.source = source.value().path;
            request.mimeType = source.value().mimeType;
            request.isVideo = source.value().isVideo;
            request.boundingSize = size;
            request.output = tempPath;

            Result<void> rendered = Error{ErrorCode::InternalError, "renderer threw"};
            try {
                rendered = renderer_->render(request);
            } catch (const std::exception& e) {
                rendered = Error{ErrorCode::InternalError, e.what()};
            }

            if (!rendered) {
                spdlog::warn("Failed to build {} for {} ({}): {}", kindToString(kind), checksum,
                             request.source.string(), rendered.error().message);
                fs::remove(tempPath, ec);
            } else {
                fs::rename(tempPath, finalPath, ec);
                if (ec) {
                    spdlog::error("Failed to publish {}: {}", finalPath.string(), ec.message());
                    std::error_code removeEc;
                    fs::remove(tempPath, removeEc);
                } else {
                    spdlog::debug("Published {}", finalPath.string());
                    publishedTier = source.value().tier;
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(inFlightMutex_);
        inFlight_.erase(key);
    }
    if (publishedTier && notifier_)
        notifier_->schedule(*publishedTier);
}

Result<size_t> DerivedAssetCache::purge(AssetKind kind) {
    const fs::path dir = kindDirectory(kind);
    std::error_code ec;
    if (!fs::exists(dir, ec))
        return size_t{0};

    size_t removed = 0;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec)
        return Error{ErrorCode::IOError, "Cannot list " + dir.string() + ": " + ec.message()};

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            return Error{ErrorCode::IOError, "Error walking " + dir.string() + ": " + ec.message()};
        std::error_code typeEc;
        if (it->is_regular_file(typeEc))
            files.push_back(it->path());
    }

    for (const auto& file : files) {
        std::error_code removeEc;
        if (fs::remove(file, removeEc)) {
            ++removed;
        } else if (removeEc) {
            spdlog::warn("Could not delete {}: {}", file.string(), removeEc.message());
        }
    }
    spdlog::info("Purged {} {} files", removed, kindToString(kind));
    return removed;
}

size_t DerivedAssetCache::evict(const Checksum& checksum) {
    if (!isValidChecksum(checksum))
        return 0;

    size_t removed = 0;
    for (AssetKind kind : {AssetKind::Thumbnail, AssetKind::Preview}) {
        const fs::path dir = kindDirectory(kind);
        const std::string prefix = checksum + "_" + kindToString(kind);
        std::error_code ec;
        if (!fs::exists(dir, ec))
            continue;

        std::vector<fs::path> matches;
        fs::recursive_directory_iterator it(dir, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            if (it->path().filename().string().rfind(prefix, 0) == 0)
                matches.push_back(it->path());
        }
        for (const auto& file : matches) {
            std::error_code removeEc;
            if (fs::remove(file, removeEc))
                ++removed;
        }
    }
    if (removed > 0)
        spdlog::debug("Evicted {} cached renditions of {}", removed, checksum);
    return removed;
}

bool DerivedAssetCache::building(const Checksum& checksum, AssetKind kind,
                                 std::optional<int> size) const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlight_.count(makeKey(checksum, kind, size.value_or(defaultSize(kind)))) > 0;
}

size_t DerivedAssetCache::inFlightCount() const {
    std::lock_guard<std::mutex> lock(inFlightMutex_);
    return inFlight_.size();
}

} // namespace mediacat::assets
