#pragma once

#include <optional>
#include <string>
#include <vector>
#include <mediacat/catalog/catalog_types.h>
#include <mediacat/metadata/database.h>

namespace mediacat::catalog {

/**
 * @brief One flattened row of the full-text index, keyed by location id
 */
struct SearchRow {
    LocationId locationId = 0;
    std::string path;
    std::string filename;
    std::optional<std::string> prompt;
    std::optional<std::string> negativePrompt;
    std::optional<std::string> model;
    std::optional<std::string> sampler;
    std::optional<std::string> scheduler;
    std::string loras;
    std::optional<std::string> upscaler;
    std::string application;
    std::string tags;
    std::string fullText;
};

/**
 * @brief Keeps the location_fts table in sync with locations and their content
 *
 * Generation parameters embedded by image tools (the PNG "parameters" text chunk carrying a
 * JSON document with "sui_image_params") are lifted into dedicated columns; every other
 * metadata value only lands in full_text.
 */
class SearchIndex {
public:
    static constexpr size_t kRebuildBatchSize = 100;

    static SearchRow flatten(const LocationRecord& location, const std::string& metadataJson,
                             const std::vector<std::string>& tags);

    // Insert or replace the row for this location
    Result<void> upsert(metadata::Database& db, const SearchRow& row) const;

    /**
     * @brief Refresh the row for one location from the current catalog state
     */
    Result<void> refresh(metadata::Database& db, LocationId id) const;

    // Refresh every location pointing at this content
    Result<void> refreshContent(metadata::Database& db, const Checksum& checksum) const;

    Result<void> remove(metadata::Database& db, LocationId id) const;

    /**
     * @brief Drop and recreate the index, then repopulate it in batches
     *
     * Must not be called inside a transaction; each batch commits on its own.
     */
    Result<size_t> rebuild(metadata::Database& db) const;

    // Raw FTS5 MATCH expression; returns matching location ids
    Result<std::vector<LocationId>> match(metadata::Database& db,
                                          const std::string& expression) const;
    Result<int64_t> count(metadata::Database& db) const;
};

} // namespace mediacat::catalog
