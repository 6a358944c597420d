#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <mediacat/ingest/maintenance.h>

#include <chrono>
#include <unordered_set>

namespace mediacat::ingest {

namespace fs = std::filesystem;
using json = nlohmann::json;
using catalog::LocationRecord;
using metadata::Database;

namespace {

std::string storedMimeType(const std::string& metadataJson) {
    json stored = json::parse(metadataJson, nullptr, false);
    if (stored.is_discarded() || !stored.is_object())
        return {};
    auto it = stored.find("mime_type");
    if (it == stored.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace

CatalogMaintenance::CatalogMaintenance(const detection::MediaTypeDetector& detector,
                                       const extraction::MetadataExtractor& extractor)
    : detector_(detector), extractor_(extractor) {}

Result<size_t> CatalogMaintenance::cleanupOrphans(Database& db) const {
    spdlog::debug("Checking for orphaned locations");
    auto orphans = locations_.orphans(db);
    if (!orphans)
        return orphans.error();
    if (orphans.value().empty()) {
        spdlog::debug("No orphaned locations found");
        return size_t{0};
    }

    auto txResult = db.transaction([&]() -> Result<void> {
        for (const auto& location : orphans.value()) {
            if (auto r = search_.remove(db, location.id); !r)
                return r;
            if (auto r = locations_.remove(db, location.id); !r)
                return r;
        }
        return {};
    });
    if (!txResult) {
        spdlog::error("Orphan cleanup failed: {}", txResult.error().message);
        return txResult.error();
    }

    spdlog::info("Deleted {} orphaned locations", orphans.value().size());
    return orphans.value().size();
}

Result<size_t> CatalogMaintenance::reconcileRootTags(Database& db) const {
    auto roots = roots_.list(db);
    if (!roots)
        return roots.error();

    size_t added = 0;
    auto txResult = db.transaction([&]() -> Result<void> {
        for (const auto& root : roots.value()) {
            if (root.tags.empty())
                continue;

            auto checksums = locations_.checksumsUnder(db, root.path);
            if (!checksums)
                return checksums.error();

            for (const auto& tag : root.tags) {
                auto tagId = catalog::ContentStore::ensureTag(db, tag);
                if (!tagId)
                    return tagId.error();

                for (const auto& checksum : checksums.value()) {
                    auto inserted = contents_.addTag(db, checksum, tagId.value());
                    if (!inserted)
                        return inserted.error();
                    if (!inserted.value())
                        continue;
                    ++added;
                    if (auto r = search_.refreshContent(db, checksum); !r)
                        return r;
                }
            }
        }
        return {};
    });
    if (!txResult) {
        spdlog::error("Tag inheritance reconciliation failed: {}", txResult.error().message);
        return txResult.error();
    }

    if (added > 0)
        spdlog::info("Added {} inherited tag associations", added);
    return added;
}

Result<ReprocessStats> CatalogMaintenance::reprocessMetadata(Database& db,
                                                             const ReprocessScope& scope) const {
    std::vector<LocationRecord> targets;
    if (const auto* id = std::get_if<LocationId>(&scope)) {
        auto location = locations_.get(db, *id);
        if (!location)
            return location.error();
        if (!location.value())
            return Error{ErrorCode::NotFound, "Location not found: " + std::to_string(*id)};
        targets.push_back(*location.value());
    } else if (const auto* directory = std::get_if<std::string>(&scope)) {
        auto rows = locations_.inDirectory(db, *directory);
        if (!rows)
            return rows.error();
        targets = std::move(rows).value();
    } else {
        auto rows = locations_.all(db);
        if (!rows)
            return rows.error();
        targets = std::move(rows).value();
    }

    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Reprocessing metadata for {} locations", targets.size());

    ReprocessStats stats;
    std::unordered_set<Checksum> done;
    for (size_t i = 0; i < targets.size(); ++i) {
        const auto& location = targets[i];
        if (done.count(location.checksum))
            continue;

        const fs::path fullPath = location.fullPath();
        std::error_code ec;
        if (!fs::exists(fullPath, ec)) {
            spdlog::info("Skipping {} ({}/{}): file not found", fullPath.string(), i + 1,
                         targets.size());
            ++stats.missing;
            continue;
        }

        auto content = contents_.get(db, location.checksum);
        if (!content)
            return content.error();
        if (!content.value())
            continue;

        ++stats.processed;
        done.insert(location.checksum);

        detection::MediaType type;
        const std::string mime = storedMimeType(content.value()->metadataJson);
        if (detection::MediaTypeDetector::isSupportedMimeType(mime)) {
            type.mimeType = mime;
            type.supported = true;
            type.isVideo = detection::MediaTypeDetector::isVideoMimeType(mime);
        } else {
            auto detected = detector_.detect(fullPath);
            if (!detected) {
                spdlog::warn("Reprocess {}: {}", fullPath.string(), detected.error().message);
                ++stats.kept;
                continue;
            }
            type = detected.value();
        }

        auto extracted = extractor_.extract(fullPath, type);
        if (extracted.empty()) {
            spdlog::warn("Reprocess {} ({}): no metadata recovered, keeping stored metadata",
                         fullPath.string(), location.checksum);
            ++stats.kept;
            continue;
        }
        if (!mime.empty())
            extracted.fields["mime_type"] = mime;

        auto txResult = db.transaction([&]() -> Result<void> {
            if (auto r = contents_.updateMetadata(db, location.checksum, extracted.toJson(),
                                                  extracted.width, extracted.height);
                !r)
                return r;
            return search_.refreshContent(db, location.checksum);
        });
        if (!txResult) {
            spdlog::error("Reprocess {} ({}): {}", fullPath.string(), location.checksum,
                          txResult.error().message);
            return txResult.error();
        }
        ++stats.updated;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Metadata reprocessing finished: {} updated, {} kept, {} missing in {}ms",
                 stats.updated, stats.kept, stats.missing, elapsed.count());
    return stats;
}

Result<void> CatalogMaintenance::tagContent(Database& db, const Checksum& checksum,
                                            const std::string& tag) const {
    return db.transaction([&]() -> Result<void> {
        auto exists = contents_.exists(db, checksum);
        if (!exists)
            return exists.error();
        if (!exists.value())
            return Error{ErrorCode::NotFound, "Content not found: " + checksum};

        auto inserted = contents_.addTag(db, checksum, tag);
        if (!inserted)
            return inserted.error();
        if (!inserted.value())
            return {};
        return search_.refreshContent(db, checksum);
    });
}

Result<void> CatalogMaintenance::setTrashed(Database& db, LocationId id, bool trashed) const {
    return locations_.setDeleted(db, id, trashed);
}

Result<int64_t> CatalogMaintenance::countTrashed(Database& db) const {
    return locations_.countDeleted(db);
}

Result<PermanentDeleteResult> CatalogMaintenance::permanentDelete(Database& db,
                                                                  LocationId id) const {
    auto location = locations_.get(db, id);
    if (!location)
        return location.error();
    if (!location.value())
        return Error{ErrorCode::NotFound, "Location not found: " + std::to_string(id)};

    const LocationRecord record = *location.value();
    const fs::path fullPath = record.fullPath();

    std::error_code ec;
    if (fs::exists(fullPath, ec)) {
        if (!fs::remove(fullPath, ec) && ec) {
            spdlog::error("Permanent delete of {} failed: {}", fullPath.string(), ec.message());
            return Error{ErrorCode::IOError,
                         "Failed to remove " + fullPath.string() + ": " + ec.message()};
        }
    } else {
        spdlog::warn("Permanent delete: {} already gone from disk", fullPath.string());
    }

    PermanentDeleteResult result;
    result.checksum = record.checksum;
    result.directory = record.directory;

    auto txResult = db.transaction([&]() -> Result<void> {
        if (auto r = search_.remove(db, id); !r)
            return r;
        if (auto r = locations_.remove(db, id); !r)
            return r;

        auto remaining = locations_.countForContent(db, record.checksum);
        if (!remaining)
            return remaining.error();
        if (remaining.value() == 0) {
            if (auto r = contents_.remove(db, record.checksum); !r)
                return r;
            result.contentRemoved = true;
        }
        return {};
    });
    if (!txResult) {
        spdlog::error("Permanent delete of location {} failed: {}", id, txResult.error().message);
        return txResult.error();
    }

    spdlog::info("Permanently deleted {} ({}){}", fullPath.string(), record.checksum,
                 result.contentRemoved ? ", content removed" : "");
    return result;
}

Result<void> CatalogMaintenance::vacuum(Database& db) const {
    spdlog::info("Vacuuming catalog database");
    return db.execute("VACUUM");
}

Result<size_t> CatalogMaintenance::rebuildSearchIndex(Database& db) const {
    return search_.rebuild(db);
}

} // namespace mediacat::ingest
