#include <spdlog/spdlog.h>
#include <mediacat/ingest/scanner.h>

#include <algorithm>
#include <sys/stat.h>
#include <utility>
#include <vector>

namespace mediacat::ingest {

namespace fs = std::filesystem;

namespace {

int64_t changeTime(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        return 0;
    return static_cast<int64_t>(st.st_ctime);
}

} // namespace

Scanner::Scanner(IngestService& ingest, const CatalogMaintenance& maintenance)
    : ingest_(ingest), maintenance_(maintenance) {}

Result<ScanStats> Scanner::scanAll() {
    stopRequested_.store(false);
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Starting file scan");

    auto conn = ingest_.pool().acquire();
    if (!conn)
        return Error{ErrorCode::ResourceExhausted,
                     "Failed to acquire database connection: " + conn.error().message};
    auto connection = std::move(conn).value();
    metadata::Database& db = **connection;

    if (auto r = maintenance_.cleanupOrphans(db); !r)
        spdlog::warn("Orphan cleanup failed, continuing scan: {}", r.error().message);
    if (auto r = maintenance_.reconcileRootTags(db); !r)
        spdlog::warn("Tag reconciliation failed, continuing scan: {}", r.error().message);

    auto roots = roots_.list(db);
    if (!roots)
        return roots.error();
    auto checksums = contents_.allChecksums(db);
    if (!checksums)
        return checksums.error();
    ingest_.knownChecksums().merge(checksums.value());

    WalkState state{db, {}, {}};
    for (const auto& root : roots.value()) {
        state.tracked.insert(root.path);
    }

    // list() orders by path, so parents precede children
    for (const auto& root : roots.value()) {
        if (stopRequested_.load())
            break;

        std::error_code ec;
        if (!fs::is_directory(root.path, ec)) {
            spdlog::warn("Watched root '{}' does not exist or is not a directory, skipping",
                         root.path);
            ++state.stats.rootsSkipped;
            continue;
        }
        if (root.ignored) {
            spdlog::info("Directory ignored, skipping: {}", root.path);
            ++state.stats.rootsSkipped;
            continue;
        }

        spdlog::info("Scanning directory: {}", root.path);
        const size_t filesBefore = state.stats.filesSeen;
        const auto rootStart = std::chrono::steady_clock::now();
        walkDirectory(state, root.path);
        ++state.stats.rootsScanned;

        const auto rootElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - rootStart);
        spdlog::debug("Scanned {} files under {} in {}ms", state.stats.filesSeen - filesBefore,
                      root.path, rootElapsed.count());
    }

    state.stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Scan finished in {}ms: {} roots, {} files, {} new files, {} new "
                 "subdirectories, {} errors{}",
                 state.stats.duration.count(), state.stats.rootsScanned, state.stats.filesSeen,
                 state.stats.newFiles, state.stats.newDirectories, state.stats.errors,
                 stopRequested_.load() ? " (stopped early)" : "");
    return state.stats;
}

void Scanner::walkDirectory(WalkState& state, const fs::path& directory) {
    std::vector<fs::path> subdirs;
    std::vector<std::pair<int64_t, fs::path>> files;

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", directory.string(), ec.message());
        ++state.stats.errors;
        return;
    }
    for (const auto& entry : it) {
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (!entry.is_symlink(typeEc))
                subdirs.push_back(entry.path());
        } else if (entry.is_regular_file(typeEc)) {
            files.emplace_back(changeTime(entry.path()), entry.path());
        }
    }

    std::sort(subdirs.begin(), subdirs.end());
    // Subdirectories that are their own roots are scanned on their own turn
    subdirs.erase(std::remove_if(subdirs.begin(), subdirs.end(),
                                 [&](const fs::path& p) {
                                     return state.tracked.count(p.string()) > 0;
                                 }),
                  subdirs.end());
    std::vector<fs::path> toWalk;
    for (const auto& subdir : subdirs) {
        if (registerSubdirectory(state, subdir, directory))
            toWalk.push_back(subdir);
    }

    std::stable_sort(files.begin(), files.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [ctime, file] : files) {
        if (stopRequested_.load())
            return;
        ++state.stats.filesSeen;
        auto result = ingest_.ingest(state.db, file);
        switch (result.outcome) {
            case IngestOutcome::New:
                ++state.stats.newContent;
                ++state.stats.newFiles;
                break;
            case IngestOutcome::Duplicate:
                ++state.stats.newFiles;
                break;
            case IngestOutcome::Error:
                ++state.stats.errors;
                break;
            case IngestOutcome::AlreadyPresent:
            case IngestOutcome::SkippedUnsupported:
                break;
        }
    }

    for (const auto& subdir : toWalk) {
        if (stopRequested_.load())
            return;
        walkDirectory(state, subdir);
    }
}

bool Scanner::registerSubdirectory(WalkState& state, const fs::path& subdir,
                                   const fs::path& parent) {
    catalog::WatchedRoot root;
    root.path = subdir.string();
    root.shortName = subdir.filename().string();
    root.description = "Auto-added: " + root.shortName;
    root.parent = parent.string();
    root.tier = catalog::VisibilityTier::Restricted;

    auto added = roots_.add(state.db, root);
    if (!added) {
        if (added.error().code == ErrorCode::ConstraintViolation) {
            // registered concurrently since the snapshot
            state.tracked.insert(root.path);
            return false;
        }
        spdlog::error("Error registering subdirectory {}: {}", root.path,
                      added.error().message);
        ++state.stats.errors;
        return false;
    }

    state.tracked.insert(root.path);
    ++state.stats.newDirectories;
    spdlog::info("Found new subdirectory: {}", root.path);
    return true;
}

} // namespace mediacat::ingest
