#include <spdlog/spdlog.h>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/watched_roots.h>

namespace mediacat::catalog {

using metadata::Database;
using metadata::prepareBound;
using metadata::Statement;

namespace {

constexpr const char* kSelectColumns = R"(
    SELECT id, path, short_name, description, is_ignored, admin_only, basepath, built_in, parent
    FROM watched_roots
)";

WatchedRoot mapRootRow(const Statement& stmt) {
    WatchedRoot root;
    root.id = stmt.getInt64(0);
    root.path = stmt.getString(1);
    root.shortName = stmt.getString(2);
    root.description = stmt.getString(3);
    root.ignored = stmt.getInt(4) != 0;
    root.tier = stmt.getInt(5) != 0 ? VisibilityTier::Restricted : VisibilityTier::Public;
    root.basepath = stmt.getInt(6) != 0;
    root.builtIn = stmt.getInt(7) != 0;
    root.parent = stmt.getString(8);
    return root;
}

Result<std::vector<std::string>> loadTags(Database& db, int64_t rootId) {
    auto stmtResult = prepareBound(db, R"(
        SELECT t.name FROM tags t
        JOIN root_tags rt ON rt.tag_id = t.id
        WHERE rt.root_id = ?
        ORDER BY t.name
    )",
                                   rootId);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<std::string> tags;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        tags.push_back(stmt.getString(0));
    }
    return tags;
}

Result<void> updateByPath(Database& db, const std::string& sql, int value,
                          const std::string& path) {
    auto stmtResult = prepareBound(db, sql, value, path);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r;
    if (db.changes() == 0)
        return Error{ErrorCode::NotFound, "Watched root not registered: " + path};
    return {};
}

} // namespace

Result<std::vector<WatchedRoot>> WatchedRoots::list(Database& db) const {
    auto stmtResult = db.prepare(std::string(kSelectColumns) + " ORDER BY path");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<WatchedRoot> roots;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        roots.push_back(mapRootRow(stmt));
    }

    for (auto& root : roots) {
        auto tags = loadTags(db, root.id);
        if (!tags)
            return tags.error();
        root.tags = std::move(tags).value();
    }
    return roots;
}

Result<std::optional<WatchedRoot>> WatchedRoots::find(Database& db,
                                                      const std::string& path) const {
    auto stmtResult = prepareBound(db, std::string(kSelectColumns) + " WHERE path = ?", path);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<WatchedRoot>{};

    WatchedRoot root = mapRootRow(stmt);
    auto tags = loadTags(db, root.id);
    if (!tags)
        return tags.error();
    root.tags = std::move(tags).value();
    return std::optional<WatchedRoot>{std::move(root)};
}

Result<int64_t> WatchedRoots::add(Database& db, const WatchedRoot& root) const {
    auto stmtResult = db.prepare(R"(
        INSERT INTO watched_roots (path, short_name, description, is_ignored, admin_only,
                                   basepath, built_in, parent)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(root.path, root.shortName, root.description,
                                   root.ignored ? 1 : 0,
                                   root.tier == VisibilityTier::Restricted ? 1 : 0,
                                   root.basepath ? 1 : 0, root.builtIn ? 1 : 0);
    if (!bindResult)
        return bindResult.error();
    auto parentBind = root.parent.empty() ? stmt.bind(8, nullptr) : stmt.bind(8, root.parent);
    if (!parentBind)
        return parentBind.error();
    if (auto r = stmt.execute(); !r)
        return r.error();

    const int64_t id = db.lastInsertRowId();
    for (const auto& tag : root.tags) {
        if (auto r = addTag(db, root.path, tag); !r)
            return r.error();
    }
    return id;
}

Result<int64_t> WatchedRoots::ensure(Database& db, const std::string& path,
                                     VisibilityTier tier) const {
    auto existing = find(db, path);
    if (!existing)
        return existing.error();

    if (existing.value()) {
        auto stmtResult = prepareBound(
            db, "UPDATE watched_roots SET admin_only = ?, basepath = 1 WHERE path = ?",
            tier == VisibilityTier::Restricted ? 1 : 0, path);
        if (!stmtResult)
            return stmtResult.error();
        Statement stmt = std::move(stmtResult).value();
        if (auto r = stmt.execute(); !r)
            return r.error();
        return existing.value()->id;
    }

    WatchedRoot root;
    root.path = path;
    root.shortName = std::filesystem::path(path).filename().string();
    root.tier = tier;
    root.basepath = true;
    spdlog::info("Registering configured root {} ({})", path, tierToString(tier));
    return add(db, root);
}

Result<void> WatchedRoots::remove(Database& db, const std::string& path) const {
    auto stmtResult = prepareBound(db, "DELETE FROM watched_roots WHERE path = ?", path);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r;
    if (db.changes() == 0)
        return Error{ErrorCode::NotFound, "Watched root not registered: " + path};
    return {};
}

Result<void> WatchedRoots::setIgnored(Database& db, const std::string& path, bool ignored) const {
    return updateByPath(db, "UPDATE watched_roots SET is_ignored = ? WHERE path = ?",
                        ignored ? 1 : 0, path);
}

Result<void> WatchedRoots::setTier(Database& db, const std::string& path,
                                   VisibilityTier tier) const {
    return updateByPath(db, "UPDATE watched_roots SET admin_only = ? WHERE path = ?",
                        tier == VisibilityTier::Restricted ? 1 : 0, path);
}

Result<void> WatchedRoots::addTag(Database& db, const std::string& path,
                                  const std::string& tagName) const {
    auto tagId = ContentStore::ensureTag(db, tagName);
    if (!tagId)
        return tagId.error();

    auto stmtResult = prepareBound(db, R"(
        INSERT OR IGNORE INTO root_tags (root_id, tag_id)
        SELECT id, ? FROM watched_roots WHERE path = ?
    )",
                                   tagId.value(), path);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r;

    auto root = find(db, path);
    if (!root)
        return root.error();
    if (!root.value())
        return Error{ErrorCode::NotFound, "Watched root not registered: " + path};
    return {};
}

Result<std::optional<VisibilityTier>> WatchedRoots::tierFor(Database& db,
                                                            const std::string& path) const {
    auto stmtResult = prepareBound(db, "SELECT admin_only FROM watched_roots WHERE path = ?", path);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<VisibilityTier>{};
    return std::optional<VisibilityTier>{stmt.getInt(0) != 0 ? VisibilityTier::Restricted
                                                             : VisibilityTier::Public};
}

} // namespace mediacat::catalog
