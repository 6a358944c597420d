#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>
#include <mediacat/catalog/search_index.h>
#include <mediacat/catalog/watched_roots.h>
#include <mediacat/detection/media_type_detector.h>
#include <mediacat/extraction/metadata_extractor.h>
#include <mediacat/metadata/connection_pool.h>

namespace mediacat::notify {
class ChangeNotifier;
}

namespace mediacat::ingest {

enum class IngestOutcome {
    New,                ///< new Content and Location
    Duplicate,          ///< new Location for already-cataloged Content
    AlreadyPresent,     ///< Location existed, or another writer won the insert race
    SkippedUnsupported, ///< not a supported media type
    Error               ///< unreadable file or store failure; retried on the next pass
};

constexpr const char* outcomeToString(IngestOutcome outcome) {
    switch (outcome) {
        case IngestOutcome::New: return "new";
        case IngestOutcome::Duplicate: return "duplicate";
        case IngestOutcome::AlreadyPresent: return "already-present";
        case IngestOutcome::SkippedUnsupported: return "skipped-unsupported";
        case IngestOutcome::Error: return "error";
    }
    return "error";
}

struct IngestResult {
    IngestOutcome outcome = IngestOutcome::Error;
    Checksum checksum;
    LocationId locationId = 0;
    std::string message;

    [[nodiscard]] bool added() const {
        return outcome == IngestOutcome::New || outcome == IngestOutcome::Duplicate;
    }
};

/**
 * @brief Mutex-guarded working set of checksums known to be in the store
 *
 * Shared by the scanner and watcher so re-seen content skips a store lookup.
 */
class KnownChecksums {
public:
    bool contains(const Checksum& checksum) const;
    void insert(const Checksum& checksum);
    void erase(const Checksum& checksum);
    void merge(const std::vector<Checksum>& checksums);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<Checksum> checksums_;
};

enum class RemoveOutcome { Removed, NotPresent };

enum class MoveOutcome {
    Moved,     ///< location re-pointed at the destination
    Ingested,  ///< no source row; destination ingested as a new file
    Removed,   ///< destination is not a supported type; source row dropped
    Unchanged
};

/**
 * @brief The shared ingest path used by the scanner and the watcher
 *
 * Content, Location and search-index rows for one file commit together. Every public entry
 * point either takes the caller's connection or checks one out of the pool, so each thread
 * works on its own connection.
 */
class IngestService {
public:
    IngestService(metadata::ConnectionPool& pool, KnownChecksums& known,
                  const detection::MediaTypeDetector& detector,
                  const extraction::MetadataExtractor& extractor,
                  notify::ChangeNotifier* notifier = nullptr);

    /**
     * @brief Catalog one file
     *
     * On New/Duplicate the change is scheduled on the notifier with the tier of the file's
     * directory root (restricted when the directory is not registered).
     */
    IngestResult ingest(const std::filesystem::path& path);
    IngestResult ingest(metadata::Database& db, const std::filesystem::path& path);

    /**
     * @brief Drop the Location for a file that disappeared from disk
     *
     * The Content row is kept. A missing Location is a benign no-op and is not notified.
     */
    Result<RemoveOutcome> removeFile(metadata::Database& db, const std::filesystem::path& path);

    /**
     * @brief Apply a rename; the checksum is kept
     *
     * Notifies with the more visible of the source and destination tiers.
     */
    Result<MoveOutcome> moveFile(metadata::Database& db, const std::filesystem::path& from,
                                 const std::filesystem::path& to);

    // Tier used to notify changes in `directory`; unregistered directories are restricted
    catalog::VisibilityTier tierForDirectory(metadata::Database& db,
                                             const std::string& directory) const;

    metadata::ConnectionPool& pool() { return pool_; }
    KnownChecksums& knownChecksums() { return known_; }

private:
    void notify(catalog::VisibilityTier tier);

    metadata::ConnectionPool& pool_;
    KnownChecksums& known_;
    const detection::MediaTypeDetector& detector_;
    const extraction::MetadataExtractor& extractor_;
    notify::ChangeNotifier* notifier_;

    catalog::ContentStore contents_;
    catalog::LocationIndex locations_;
    catalog::SearchIndex search_;
    catalog::WatchedRoots roots_;
};

} // namespace mediacat::ingest
