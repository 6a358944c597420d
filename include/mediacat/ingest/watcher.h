#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <mediacat/ingest/ingest_service.h>

namespace mediacat::ingest {

/**
 * @brief Live filesystem watcher applying create/delete/move deltas (Linux inotify)
 *
 * Nested roots are collapsed to their outermost ancestor; every directory beneath a collapsed
 * root gets its own watch, added as directories appear. Events for files whose directory is
 * not a registered, non-ignored root are dropped: the scanner owns root registration.
 *
 * Each event checks its own connection out of the pool.
 */
class Watcher {
public:
    static constexpr std::chrono::milliseconds kMovePairWindow{100};

    explicit Watcher(IngestService& ingest);
    ~Watcher();

    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;

    /**
     * @brief Start watching the given roots on a background thread
     */
    Result<void> start(const std::vector<std::string>& roots);
    void stop();
    [[nodiscard]] bool running() const { return running_.load(); }

    // Outermost ancestors of `roots`, sorted and de-duplicated
    static std::vector<std::string> collapseRoots(std::vector<std::string> roots);

    // Event application; also driven directly by tests
    void handleCreate(const std::filesystem::path& path);
    void handleDelete(const std::filesystem::path& path);
    void handleMove(const std::filesystem::path& from, const std::filesystem::path& to);

    size_t watchCount() const;

private:
    struct PendingMove {
        std::filesystem::path from;
        bool isDirectory = false;
        std::chrono::steady_clock::time_point deadline;
    };

    void watchLoop();
    void processBuffer(const char* buffer, size_t length);
    void flushExpiredMoves(bool all);
    bool addWatch(const std::string& directory);
    void addWatchesRecursive(const std::string& directory);
    void renameWatchedTree(const std::string& from, const std::string& to);
    void forgetWatch(int wd);
    bool isTrackedDirectory(metadata::Database& db, const std::string& directory) const;

    IngestService& ingest_;
    catalog::WatchedRoots roots_;

    int inotifyFd_ = -1;
    int pipeFds_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex watchMutex_;
    std::unordered_map<int, std::string> wdToPath_;
    std::unordered_map<std::string, int> pathToWd_;

    // Touched only by the watch thread
    std::unordered_map<uint32_t, PendingMove> pendingMoves_;
};

} // namespace mediacat::ingest
