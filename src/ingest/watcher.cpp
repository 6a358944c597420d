#include <spdlog/spdlog.h>
#include <mediacat/ingest/watcher.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace mediacat::ingest {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_CREATE | IN_DELETE_SELF | IN_ONLYDIR;

constexpr size_t kEventBufferSize = 64 * 1024;

bool isUnder(const std::string& path, const std::string& root) {
    if (path == root)
        return true;
    if (path.size() <= root.size() || path.compare(0, root.size(), root) != 0)
        return false;
    return root.back() == '/' || path[root.size()] == '/';
}

} // namespace

Watcher::Watcher(IngestService& ingest) : ingest_(ingest) {}

Watcher::~Watcher() {
    stop();
}

std::vector<std::string> Watcher::collapseRoots(std::vector<std::string> roots) {
    for (auto& root : roots) {
        root = fs::path(root).lexically_normal().string();
        if (root.size() > 1 && root.back() == '/')
            root.pop_back();
    }
    std::sort(roots.begin(), roots.end());
    roots.erase(std::unique(roots.begin(), roots.end()), roots.end());

    std::vector<std::string> collapsed;
    for (const auto& root : roots) {
        // Sorted order puts an ancestor first, but a sibling such as "photos-raw" can sort
        // between "photos" and "photos/2024", so check every kept root
        const bool nested = std::any_of(collapsed.begin(), collapsed.end(),
                                        [&](const std::string& kept) { return isUnder(root, kept); });
        if (nested)
            continue;
        collapsed.push_back(root);
    }
    return collapsed;
}

Result<void> Watcher::start(const std::vector<std::string>& roots) {
    if (running_.load())
        return Error{ErrorCode::InvalidState, "Watcher already running"};

    inotifyFd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) {
        return Error{ErrorCode::IOError,
                     std::string("inotify_init1 failed: ") + std::strerror(errno)};
    }
    if (pipe2(pipeFds_, O_NONBLOCK | O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close(inotifyFd_);
        inotifyFd_ = -1;
        return Error{ErrorCode::IOError, "pipe2 failed: " + reason};
    }

    for (const auto& root : collapseRoots(roots)) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            spdlog::warn("Not watching missing root {}", root);
            continue;
        }
        addWatchesRecursive(root);
        spdlog::info("Watching {}", root);
    }

    running_.store(true);
    thread_ = std::thread([this]() { watchLoop(); });
    spdlog::info("File watcher started with {} watches", watchCount());
    return {};
}

void Watcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (pipeFds_[1] >= 0) {
        const char c = 'x';
        if (write(pipeFds_[1], &c, 1) < 0)
            spdlog::debug("Watcher wake-up write failed: {}", std::strerror(errno));
    }
    if (thread_.joinable())
        thread_.join();

    {
        std::lock_guard<std::mutex> lock(watchMutex_);
        for (const auto& [wd, path] : wdToPath_) {
            inotify_rm_watch(inotifyFd_, wd);
        }
        wdToPath_.clear();
        pathToWd_.clear();
    }
    for (int& fd : pipeFds_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    if (inotifyFd_ >= 0) {
        close(inotifyFd_);
        inotifyFd_ = -1;
    }
    spdlog::info("File watcher stopped");
}

size_t Watcher::watchCount() const {
    std::lock_guard<std::mutex> lock(watchMutex_);
    return wdToPath_.size();
}

bool Watcher::addWatch(const std::string& directory) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    if (pathToWd_.count(directory))
        return true;

    const int wd = inotify_add_watch(inotifyFd_, directory.c_str(), kWatchMask);
    if (wd < 0) {
        spdlog::warn("inotify_add_watch failed for {}: {}", directory, std::strerror(errno));
        return false;
    }
    wdToPath_[wd] = directory;
    pathToWd_[directory] = wd;
    return true;
}

void Watcher::addWatchesRecursive(const std::string& directory) {
    if (!addWatch(directory))
        return;

    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied,
                                        ec);
    if (ec) {
        spdlog::warn("Cannot walk {}: {}", directory, ec.message());
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error walking {}: {}", directory, ec.message());
            break;
        }
        std::error_code typeEc;
        if (it->is_directory(typeEc) && !it->is_symlink(typeEc))
            addWatch(it->path().string());
    }
}

void Watcher::renameWatchedTree(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    std::vector<std::pair<int, std::string>> renamed;
    for (const auto& [wd, path] : wdToPath_) {
        if (isUnder(path, from))
            renamed.emplace_back(wd, to + path.substr(from.size()));
    }
    for (const auto& [wd, newPath] : renamed) {
        pathToWd_.erase(wdToPath_[wd]);
        wdToPath_[wd] = newPath;
        pathToWd_[newPath] = wd;
    }
}

void Watcher::forgetWatch(int wd) {
    std::lock_guard<std::mutex> lock(watchMutex_);
    auto it = wdToPath_.find(wd);
    if (it == wdToPath_.end())
        return;
    pathToWd_.erase(it->second);
    wdToPath_.erase(it);
}

void Watcher::watchLoop() {
    alignas(struct inotify_event) char buffer[kEventBufferSize];

    while (running_.load()) {
        pollfd fds[2];
        fds[0] = {inotifyFd_, POLLIN, 0};
        fds[1] = {pipeFds_[0], POLLIN, 0};

        int timeout = -1;
        if (!pendingMoves_.empty())
            timeout = static_cast<int>(kMovePairWindow.count());

        const int ready = poll(fds, 2, timeout);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            spdlog::error("Watcher poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN)
            break;

        if (ready > 0 && (fds[0].revents & POLLIN)) {
            while (true) {
                const ssize_t length = read(inotifyFd_, buffer, sizeof(buffer));
                if (length <= 0) {
                    if (length < 0 && errno != EAGAIN && errno != EINTR)
                        spdlog::warn("inotify read failed: {}", std::strerror(errno));
                    break;
                }
                processBuffer(buffer, static_cast<size_t>(length));
            }
        }
        flushExpiredMoves(false);
    }
    flushExpiredMoves(true);
}

void Watcher::processBuffer(const char* buffer, size_t length) {
    size_t offset = 0;
    while (offset + sizeof(inotify_event) <= length) {
        const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
        offset += sizeof(inotify_event) + event->len;

        if (event->mask & IN_Q_OVERFLOW) {
            spdlog::warn("inotify queue overflow; changes will be picked up by the next scan");
            continue;
        }
        if (event->mask & (IN_IGNORED | IN_DELETE_SELF)) {
            forgetWatch(event->wd);
            continue;
        }

        std::string directory;
        {
            std::lock_guard<std::mutex> lock(watchMutex_);
            auto it = wdToPath_.find(event->wd);
            if (it == wdToPath_.end())
                continue;
            directory = it->second;
        }
        if (event->len == 0)
            continue;
        const fs::path path = fs::path(directory) / event->name;
        const bool isDir = (event->mask & IN_ISDIR) != 0;

        if (event->mask & IN_MOVED_FROM) {
            pendingMoves_[event->cookie] = {path, isDir,
                                            std::chrono::steady_clock::now() + kMovePairWindow};
        } else if (event->mask & IN_MOVED_TO) {
            auto pending = pendingMoves_.find(event->cookie);
            if (pending != pendingMoves_.end()) {
                const PendingMove move = pending->second;
                pendingMoves_.erase(pending);
                if (isDir) {
                    renameWatchedTree(move.from.string(), path.string());
                } else {
                    handleMove(move.from, path);
                }
            } else if (isDir) {
                addWatchesRecursive(path.string());
            } else {
                handleCreate(path);
            }
        } else if (event->mask & IN_CREATE) {
            // Files wait for IN_CLOSE_WRITE; directories need watches right away
            if (isDir)
                addWatchesRecursive(path.string());
        } else if (event->mask & IN_CLOSE_WRITE) {
            handleCreate(path);
        } else if (event->mask & IN_DELETE) {
            if (!isDir)
                handleDelete(path);
        }
    }
}

void Watcher::flushExpiredMoves(bool all) {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = pendingMoves_.begin(); it != pendingMoves_.end();) {
        if (!all && it->second.deadline > now) {
            ++it;
            continue;
        }
        // Moved out of every watched tree
        if (!it->second.isDirectory) {
            handleDelete(it->second.from);
        } else {
            std::lock_guard<std::mutex> lock(watchMutex_);
            for (auto w = wdToPath_.begin(); w != wdToPath_.end();) {
                if (isUnder(w->second, it->second.from.string())) {
                    inotify_rm_watch(inotifyFd_, w->first);
                    pathToWd_.erase(w->second);
                    w = wdToPath_.erase(w);
                } else {
                    ++w;
                }
            }
        }
        it = pendingMoves_.erase(it);
    }
}

bool Watcher::isTrackedDirectory(metadata::Database& db, const std::string& directory) const {
    auto root = roots_.find(db, directory);
    if (!root) {
        spdlog::warn("Root lookup for {} failed: {}", directory, root.error().message);
        return false;
    }
    return root.value().has_value() && !root.value()->ignored;
}

void Watcher::handleCreate(const fs::path& path) {
    auto conn = ingest_.pool().acquire();
    if (!conn) {
        spdlog::error("create {}: no database connection: {}", path.string(),
                      conn.error().message);
        return;
    }
    auto connection = std::move(conn).value();
    metadata::Database& db = **connection;

    if (!isTrackedDirectory(db, path.parent_path().string())) {
        spdlog::debug("create {}: directory not tracked, leaving it to the next scan",
                      path.string());
        return;
    }
    auto result = ingest_.ingest(db, path);
    spdlog::debug("create {}: {}", path.string(), outcomeToString(result.outcome));
}

void Watcher::handleDelete(const fs::path& path) {
    auto conn = ingest_.pool().acquire();
    if (!conn) {
        spdlog::error("delete {}: no database connection: {}", path.string(),
                      conn.error().message);
        return;
    }
    auto connection = std::move(conn).value();

    auto result = ingest_.removeFile(**connection, path);
    if (!result)
        spdlog::warn("delete {}: {}", path.string(), result.error().message);
}

void Watcher::handleMove(const fs::path& from, const fs::path& to) {
    auto conn = ingest_.pool().acquire();
    if (!conn) {
        spdlog::error("move {} -> {}: no database connection: {}", from.string(), to.string(),
                      conn.error().message);
        return;
    }
    auto connection = std::move(conn).value();
    metadata::Database& db = **connection;

    const bool fromTracked = isTrackedDirectory(db, from.parent_path().string());
    const bool toTracked = isTrackedDirectory(db, to.parent_path().string());

    if (!toTracked) {
        if (fromTracked) {
            auto removed = ingest_.removeFile(db, from);
            if (!removed)
                spdlog::warn("move {} -> untracked {}: {}", from.string(), to.string(),
                             removed.error().message);
        }
        return;
    }

    auto result = ingest_.moveFile(db, from, to);
    if (!result)
        spdlog::warn("move {} -> {}: {}", from.string(), to.string(), result.error().message);
}

} // namespace mediacat::ingest
