#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <mediacat/ingest/ingest_service.h>
#include <mediacat/ingest/maintenance.h>

namespace mediacat::ingest {

struct ScanStats {
    size_t rootsScanned = 0;
    size_t rootsSkipped = 0;
    size_t filesSeen = 0;
    size_t newFiles = 0;     ///< New plus Duplicate outcomes
    size_t newContent = 0;   ///< New outcomes only
    size_t newDirectories = 0;
    size_t errors = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Full-catalog reconciliation pass over every watched root
 *
 * Runs orphan cleanup and tag reconciliation, then walks each root depth-first. Newly seen
 * subdirectories are registered as restricted roots and every file goes through ingest(); both
 * commit immediately, so an interrupted scan leaves a valid catalog that the next pass resumes.
 * Safe to run alongside the watcher.
 */
class Scanner {
public:
    Scanner(IngestService& ingest, const CatalogMaintenance& maintenance);

    Result<ScanStats> scanAll();

    // Ends a running scan after the current file
    void requestStop() { stopRequested_.store(true); }

private:
    struct WalkState {
        metadata::Database& db;
        std::unordered_set<std::string> tracked;
        ScanStats stats;
    };

    void walkDirectory(WalkState& state, const std::filesystem::path& directory);
    bool registerSubdirectory(WalkState& state, const std::filesystem::path& subdir,
                              const std::filesystem::path& parent);

    IngestService& ingest_;
    const CatalogMaintenance& maintenance_;
    catalog::WatchedRoots roots_;
    catalog::ContentStore contents_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace mediacat::ingest
