#pragma once

#include <optional>
#include <string>
#include <vector>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/metadata/database.h>

namespace mediacat::catalog {

/**
 * @brief Registry of directory trees under management
 *
 * Roots come from configuration (basepath) or from the scanner auto-registering a
 * subdirectory (parent set, restricted).
 */
class WatchedRoots {
public:
    // All roots ordered by path, each with its tag names
    Result<std::vector<WatchedRoot>> list(metadata::Database& db) const;
    Result<std::optional<WatchedRoot>> find(metadata::Database& db, const std::string& path) const;

    /**
     * @brief Register a root
     *
     * Returns ErrorCode::ConstraintViolation when the path is already registered.
     */
    Result<int64_t> add(metadata::Database& db, const WatchedRoot& root) const;

    /**
     * @brief Register a configured root, or bring an existing row in line with configuration
     *
     * An existing row keeps its ignored flag and tags; its tier is updated and it is marked as a
     * basepath.
     */
    Result<int64_t> ensure(metadata::Database& db, const std::string& path,
                           VisibilityTier tier) const;

    Result<void> remove(metadata::Database& db, const std::string& path) const;
    Result<void> setIgnored(metadata::Database& db, const std::string& path, bool ignored) const;
    Result<void> setTier(metadata::Database& db, const std::string& path,
                         VisibilityTier tier) const;
    Result<void> addTag(metadata::Database& db, const std::string& path,
                        const std::string& tagName) const;

    // Tier of the registered root at exactly this path; nullopt when unregistered
    Result<std::optional<VisibilityTier>> tierFor(metadata::Database& db,
                                                  const std::string& path) const;
};

} // namespace mediacat::catalog
