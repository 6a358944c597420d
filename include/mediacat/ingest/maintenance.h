#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>
#include <mediacat/catalog/search_index.h>
#include <mediacat/catalog/watched_roots.h>
#include <mediacat/detection/media_type_detector.h>
#include <mediacat/extraction/metadata_extractor.h>
#include <mediacat/metadata/database.h>

namespace mediacat::ingest {

struct AllLocations {};

// One location, every location in one directory, or everything
using ReprocessScope = std::variant<LocationId, std::string, AllLocations>;

struct ReprocessStats {
    size_t processed = 0;
    size_t updated = 0;
    size_t missing = 0; ///< file no longer on disk
    size_t kept = 0;    ///< extraction came back empty; stale metadata retained
};

struct PermanentDeleteResult {
    Checksum checksum;
    bool contentRemoved = false; ///< the deleted location was the last reference
    std::string directory;
};

/**
 * @brief Consistency passes and administrative mutations over the catalog
 */
class CatalogMaintenance {
public:
    CatalogMaintenance(const detection::MediaTypeDetector& detector,
                       const extraction::MetadataExtractor& extractor);

    /**
     * @brief Delete every location whose directory is not a registered watched root
     * @return number of locations removed
     */
    Result<size_t> cleanupOrphans(metadata::Database& db) const;

    /**
     * @brief Give every content reachable under a tagged root that root's tags
     *
     * Only adds associations. A location is under a root when its directory equals the root
     * path or lies beneath it.
     * @return number of associations added
     */
    Result<size_t> reconcileRootTags(metadata::Database& db) const;

    Result<ReprocessStats> reprocessMetadata(metadata::Database& db,
                                             const ReprocessScope& scope) const;

    Result<void> tagContent(metadata::Database& db, const Checksum& checksum,
                            const std::string& tag) const;

    Result<void> setTrashed(metadata::Database& db, LocationId id, bool trashed) const;
    Result<int64_t> countTrashed(metadata::Database& db) const;

    /**
     * @brief Remove a location's file from disk and its rows from the catalog
     *
     * The content and its tag links go too when no other location references it. Derived
     * assets are left to the caller.
     */
    Result<PermanentDeleteResult> permanentDelete(metadata::Database& db, LocationId id) const;

    Result<void> vacuum(metadata::Database& db) const;
    Result<size_t> rebuildSearchIndex(metadata::Database& db) const;

private:
    const detection::MediaTypeDetector& detector_;
    const extraction::MetadataExtractor& extractor_;

    catalog::ContentStore contents_;
    catalog::LocationIndex locations_;
    catalog::SearchIndex search_;
    catalog::WatchedRoots roots_;
};

} // namespace mediacat::ingest
