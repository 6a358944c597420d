#include <spdlog/spdlog.h>
#include <mediacat/crypto/hasher.h>
#include <mediacat/ingest/ingest_service.h>
#include <mediacat/notify/change_notifier.h>

#include <sys/stat.h>

namespace mediacat::ingest {

namespace fs = std::filesystem;
using catalog::VisibilityTier;
using metadata::Database;

namespace {

struct FileTimes {
    int64_t created = 0;
    int64_t modified = 0;
};

// st_ctime is the inode change time on Linux, the closest thing to a creation time
FileTimes statTimes(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        return {};
    return {static_cast<int64_t>(st.st_ctime), static_cast<int64_t>(st.st_mtime)};
}

fs::path normalizedAbsolute(const fs::path& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return (ec ? path : abs).lexically_normal();
}

IngestResult makeResult(IngestOutcome outcome, std::string message = {}) {
    IngestResult result;
    result.outcome = outcome;
    result.message = std::move(message);
    return result;
}

} // namespace

bool KnownChecksums::contains(const Checksum& checksum) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checksums_.count(checksum) > 0;
}

void KnownChecksums::insert(const Checksum& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    checksums_.insert(checksum);
}

void KnownChecksums::erase(const Checksum& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    checksums_.erase(checksum);
}

void KnownChecksums::merge(const std::vector<Checksum>& checksums) {
    std::lock_guard<std::mutex> lock(mutex_);
    checksums_.insert(checksums.begin(), checksums.end());
}

size_t KnownChecksums::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checksums_.size();
}

IngestService::IngestService(metadata::ConnectionPool& pool, KnownChecksums& known,
                             const detection::MediaTypeDetector& detector,
                             const extraction::MetadataExtractor& extractor,
                             notify::ChangeNotifier* notifier)
    : pool_(pool), known_(known), detector_(detector), extractor_(extractor), notifier_(notifier) {}

IngestResult IngestService::ingest(const fs::path& path) {
    auto conn = pool_.acquire();
    if (!conn) {
        spdlog::error("ingest {}: no database connection: {}", path.string(),
                      conn.error().message);
        return makeResult(IngestOutcome::Error, conn.error().message);
    }
    auto connection = std::move(conn).value();
    return ingest(**connection, path);
}

IngestResult IngestService::ingest(Database& db, const fs::path& rawPath) {
    const fs::path path = normalizedAbsolute(rawPath);
    const auto split = catalog::splitPath(path);
    const std::string& directory = split.first;
    const std::string& filename = split.second;

    auto existing = locations_.find(db, directory, filename);
    if (!existing) {
        spdlog::error("ingest {}: location lookup failed: {}", path.string(),
                      existing.error().message);
        return makeResult(IngestOutcome::Error, existing.error().message);
    }
    if (existing.value()) {
        IngestResult result = makeResult(IngestOutcome::AlreadyPresent);
        result.checksum = existing.value()->checksum;
        result.locationId = existing.value()->id;
        return result;
    }

    auto type = detector_.detect(path);
    if (!type) {
        spdlog::warn("ingest {}: type detection failed: {}", path.string(), type.error().message);
        return makeResult(IngestOutcome::Error, type.error().message);
    }
    if (!type.value().supported) {
        spdlog::debug("ingest {}: unsupported type {}", path.string(), type.value().mimeType);
        return makeResult(IngestOutcome::SkippedUnsupported, type.value().mimeType);
    }

    auto hasher = crypto::createSHA256Hasher();
    auto checksumResult = hasher->hashFile(path);
    if (!checksumResult) {
        spdlog::warn("ingest {}: checksum unavailable, will retry on next scan: {}", path.string(),
                     checksumResult.error().message);
        return makeResult(IngestOutcome::Error, checksumResult.error().message);
    }
    const Checksum checksum = checksumResult.value();

    bool contentKnown = known_.contains(checksum);
    if (!contentKnown) {
        auto exists = contents_.exists(db, checksum);
        if (!exists) {
            spdlog::error("ingest {} ({}): content lookup failed: {}", path.string(), checksum,
                          exists.error().message);
            return makeResult(IngestOutcome::Error, exists.error().message);
        }
        contentKnown = exists.value();
    }

    std::optional<catalog::ContentRecord> newContent;
    if (!contentKnown) {
        auto extracted = extractor_.extract(path, type.value());
        const FileTimes times = statTimes(path);

        catalog::ContentRecord record;
        record.checksum = checksum;
        record.isVideo = type.value().isVideo;
        record.metadataJson = extracted.toJson();
        record.width = extracted.width;
        record.height = extracted.height;
        record.dateCreated = times.created;
        record.dateModified = times.modified;
        record.dateIndexed = catalog::nowSeconds();
        newContent = std::move(record);
    }

    LocationId locationId = 0;
    auto insertRows = [&]() {
        return db.transaction([&]() -> Result<void> {
            if (newContent) {
                if (auto r = contents_.insert(db, *newContent); !r)
                    return r;
            }

            auto inserted =
                locations_.insert(db, checksum, directory, filename, catalog::nowSeconds());
            if (!inserted)
                return inserted.error();
            locationId = inserted.value();

            return search_.refresh(db, locationId);
        });
    };

    auto txResult = insertRows();
    if (!txResult && txResult.error().code == ErrorCode::ConstraintViolation) {
        // Either another writer registered this same path, or it inserted the same content
        // from a different path first. Only the former means this path is already present.
        auto raced = locations_.find(db, directory, filename);
        if (!raced) {
            spdlog::error("ingest {} ({}): location lookup failed: {}", path.string(), checksum,
                          raced.error().message);
            return makeResult(IngestOutcome::Error, raced.error().message);
        }
        if (raced.value()) {
            spdlog::debug("ingest {} ({}): lost insert race, already present", path.string(),
                          checksum);
            IngestResult result = makeResult(IngestOutcome::AlreadyPresent);
            result.checksum = raced.value()->checksum;
            result.locationId = raced.value()->id;
            return result;
        }
        if (newContent) {
            spdlog::debug("ingest {} ({}): content inserted concurrently, adding location only",
                          path.string(), checksum);
            newContent.reset();
            txResult = insertRows();
        }
    }

    if (!txResult) {
        spdlog::error("ingest {} ({}): transaction failed: {}", path.string(), checksum,
                      txResult.error().message);
        return makeResult(IngestOutcome::Error, txResult.error().message);
    }

    known_.insert(checksum);

    IngestResult result = makeResult(newContent ? IngestOutcome::New : IngestOutcome::Duplicate);
    result.checksum = checksum;
    result.locationId = locationId;
    if (newContent) {
        spdlog::info("Found new media file: {} ({})", path.string(), checksum);
    } else {
        spdlog::debug("New location for existing content: {} ({})", path.string(), checksum);
    }

    notify(tierForDirectory(db, directory));
    return result;
}

Result<RemoveOutcome> IngestService::removeFile(Database& db, const fs::path& rawPath) {
    const fs::path path = normalizedAbsolute(rawPath);
    const auto split = catalog::splitPath(path);
    const std::string& directory = split.first;
    const std::string& filename = split.second;

    auto existing = locations_.find(db, directory, filename);
    if (!existing)
        return existing.error();
    if (!existing.value()) {
        spdlog::debug("remove {}: no location, nothing to do", path.string());
        return RemoveOutcome::NotPresent;
    }

    const LocationId id = existing.value()->id;
    auto txResult = db.transaction([&]() -> Result<void> {
        if (auto r = search_.remove(db, id); !r)
            return r;
        return locations_.remove(db, id);
    });
    if (!txResult) {
        spdlog::error("remove {}: {}", path.string(), txResult.error().message);
        return txResult.error();
    }

    spdlog::info("Removed location {} ({})", path.string(), existing.value()->checksum);
    notify(tierForDirectory(db, directory));
    return RemoveOutcome::Removed;
}

Result<MoveOutcome> IngestService::moveFile(Database& db, const fs::path& rawFrom,
                                            const fs::path& rawTo) {
    const fs::path from = normalizedAbsolute(rawFrom);
    const fs::path to = normalizedAbsolute(rawTo);
    const auto fromSplit = catalog::splitPath(from);
    const auto toSplit = catalog::splitPath(to);
    const std::string& fromDir = fromSplit.first;
    const std::string& fromName = fromSplit.second;
    const std::string& toDir = toSplit.first;
    const std::string& toName = toSplit.second;

    if (from == to)
        return MoveOutcome::Unchanged;

    auto source = locations_.find(db, fromDir, fromName);
    if (!source)
        return source.error();

    if (!source.value()) {
        auto result = ingest(db, to);
        if (result.outcome == IngestOutcome::Error)
            return Error{ErrorCode::IOError, result.message};
        return result.added() ? MoveOutcome::Ingested : MoveOutcome::Unchanged;
    }

    if (!detection::MediaTypeDetector::fromExtension(to).supported) {
        auto detected = detector_.detect(to);
        if (!detected || !detected.value().supported) {
            spdlog::info("Moved {} to unsupported {}, dropping location", from.string(),
                         to.string());
            auto removed = removeFile(db, from);
            if (!removed)
                return removed.error();
            return MoveOutcome::Removed;
        }
    }

    const LocationId id = source.value()->id;
    auto txResult = db.transaction([&]() -> Result<void> {
        // A file overwritten by the rename no longer exists under its own identity
        auto displaced = locations_.find(db, toDir, toName);
        if (!displaced)
            return displaced.error();
        if (displaced.value()) {
            if (auto r = search_.remove(db, displaced.value()->id); !r)
                return r;
            if (auto r = locations_.remove(db, displaced.value()->id); !r)
                return r;
        }
        if (auto r = locations_.move(db, id, toDir, toName); !r)
            return r;
        return search_.refresh(db, id);
    });
    if (!txResult) {
        spdlog::error("move {} -> {}: {}", from.string(), to.string(), txResult.error().message);
        return txResult.error();
    }

    spdlog::info("Moved {} -> {}", from.string(), to.string());
    notify(catalog::moreVisible(tierForDirectory(db, fromDir), tierForDirectory(db, toDir)));
    return MoveOutcome::Moved;
}

VisibilityTier IngestService::tierForDirectory(Database& db, const std::string& directory) const {
    auto tier = roots_.tierFor(db, directory);
    if (!tier) {
        spdlog::warn("tier lookup for {} failed: {}", directory, tier.error().message);
        return VisibilityTier::Restricted;
    }
    return tier.value().value_or(VisibilityTier::Restricted);
}

void IngestService::notify(VisibilityTier tier) {
    if (notifier_)
        notifier_->schedule(tier);
}

} // namespace mediacat::ingest
