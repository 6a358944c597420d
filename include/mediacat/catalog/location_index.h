#pragma once

#include <optional>
#include <string>
#include <vector>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/metadata/database.h>

namespace mediacat::catalog {

/**
 * @brief Catalog of filesystem instances, one row per (directory, filename)
 *
 * Each Location points at one Content by checksum. Rows are physically removed when the file
 * is gone; the soft-delete flag only backs the trash.
 */
class LocationIndex {
public:
    Result<std::optional<LocationRecord>> find(metadata::Database& db, const std::string& directory,
                                               const std::string& filename) const;
    Result<std::optional<LocationRecord>> get(metadata::Database& db, LocationId id) const;

    /**
     * @brief Insert a new location and return its id
     *
     * Returns ErrorCode::ConstraintViolation when (directory, filename) already exists.
     */
    Result<LocationId> insert(metadata::Database& db, const Checksum& checksum,
                              const std::string& directory, const std::string& filename,
                              int64_t dateScanned) const;

    Result<void> remove(metadata::Database& db, LocationId id) const;

    /**
     * @brief Point an existing location at a new (directory, filename)
     *
     * The checksum is untouched. Returns ErrorCode::ConstraintViolation when the destination
     * pair is already taken; callers clear it first.
     */
    Result<void> move(metadata::Database& db, LocationId id, const std::string& newDirectory,
                      const std::string& newFilename) const;

    Result<void> setDeleted(metadata::Database& db, LocationId id, bool deleted) const;
    Result<int64_t> countDeleted(metadata::Database& db) const;

    Result<int64_t> count(metadata::Database& db) const;
    Result<int64_t> countForContent(metadata::Database& db, const Checksum& checksum) const;
    Result<std::vector<LocationRecord>> forContent(metadata::Database& db,
                                                   const Checksum& checksum) const;
    Result<std::vector<LocationRecord>> inDirectory(metadata::Database& db,
                                                    const std::string& directory) const;
    Result<std::vector<LocationRecord>> all(metadata::Database& db) const;

    // Locations whose directory is not a registered WatchedRoot path
    Result<std::vector<LocationRecord>> orphans(metadata::Database& db) const;

    // Distinct checksums referenced by locations at or beneath rootPath
    Result<std::vector<Checksum>> checksumsUnder(metadata::Database& db,
                                                 const std::string& rootPath) const;
};

} // namespace mediacat::catalog
