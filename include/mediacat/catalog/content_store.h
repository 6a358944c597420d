#pragma once

#include <optional>
#include <string>
#include <vector>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/metadata/database.h>

namespace mediacat::catalog {

/**
 * @brief Catalog of unique content keyed by checksum
 *
 * Owns the contents table and content-tag associations. All operations run on the caller's
 * connection so they can join the caller's transaction.
 */
class ContentStore {
public:
    Result<bool> exists(metadata::Database& db, const Checksum& checksum) const;
    Result<std::optional<ContentRecord>> get(metadata::Database& db,
                                             const Checksum& checksum) const;

    /**
     * @brief Insert a new content row
     *
     * Returns ErrorCode::ConstraintViolation when the checksum is already present.
     */
    Result<void> insert(metadata::Database& db, const ContentRecord& record) const;

    Result<void> updateMetadata(metadata::Database& db, const Checksum& checksum,
                                const std::string& metadataJson, std::optional<int> width,
                                std::optional<int> height) const;

    // Removes the row and its tag links. Callers make sure no location references it.
    Result<void> remove(metadata::Database& db, const Checksum& checksum) const;

    Result<std::vector<Checksum>> allChecksums(metadata::Database& db) const;
    Result<int64_t> count(metadata::Database& db) const;

    /**
     * @brief Look up or create a tag by name
     */
    static Result<int64_t> ensureTag(metadata::Database& db, const std::string& name);

    // Returns true when the association was newly created
    Result<bool> addTag(metadata::Database& db, const Checksum& checksum, int64_t tagId) const;
    Result<bool> addTag(metadata::Database& db, const Checksum& checksum,
                        const std::string& tagName) const;
    Result<std::vector<std::string>> tagsFor(metadata::Database& db,
                                             const Checksum& checksum) const;
};

} // namespace mediacat::catalog
