#include <mediacat/metadata/migration.h>

#include <spdlog/spdlog.h>

namespace mediacat::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }
    return 0;
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty())
        return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();
    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult)
        return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    if (currentVersion >= targetVersion) {
        spdlog::debug("Catalog schema already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion)
            continue;

        spdlog::info("Applying migration {} '{}'", version, migration.name);
        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (!result) {
            (void)recordMigration(version, migration.name, duration, false,
                                  result.error().message);
            spdlog::error("Migration {} failed: {}", version, result.error().message);
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult)
            return recordResult;
        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    auto stmtResult = db_.prepare("SELECT version, name, applied_at, duration_ms, success, error "
                                  "FROM migration_history ORDER BY id");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<MigrationHistory> history;

    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;

        MigrationHistory entry;
        entry.version = stmt.getInt(0);
        entry.name = stmt.getString(1);
        entry.appliedAt =
            std::chrono::system_clock::time_point(std::chrono::seconds(stmt.getInt64(2)));
        entry.duration = std::chrono::milliseconds(stmt.getInt64(3));
        entry.success = stmt.getInt(4) != 0;
        entry.error = stmt.getString(5);
        history.push_back(std::move(entry));
    }
    return history;
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        }
        return Error{ErrorCode::InvalidData, "Migration has no up function or SQL"};
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration, bool success,
                                               const std::string& error) {
    auto stmtResult = db_.prepare("INSERT INTO migration_history "
                                  "(version, name, applied_at, duration_ms, success, error) "
                                  "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto now = std::chrono::system_clock::now().time_since_epoch();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(now).count();

    auto bindResult = stmt.bindAll(version, name, seconds, static_cast<int64_t>(duration.count()),
                                   success ? 1 : 0, error);
    if (!bindResult)
        return bindResult;

    return stmt.execute();
}

// CatalogMigrations implementation
std::vector<Migration> CatalogMigrations::getAllMigrations() {
    return {createInitialSchema(), createSearchIndex(), createLookupIndexes()};
}

const char* CatalogMigrations::searchIndexDDL() {
    return R"(
        CREATE VIRTUAL TABLE IF NOT EXISTS location_fts USING fts5(
            location_id UNINDEXED,
            path,
            filename,
            prompt,
            negative_prompt,
            model,
            sampler,
            scheduler,
            loras,
            upscaler,
            application,
            tags,
            stub,
            full_text
        )
    )";
}

Migration CatalogMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Create initial catalog schema";
    m.upSQL = R"(
        CREATE TABLE watched_roots (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL UNIQUE,
            short_name TEXT,
            description TEXT,
            is_ignored INTEGER NOT NULL DEFAULT 0,
            admin_only INTEGER NOT NULL DEFAULT 1,
            basepath INTEGER NOT NULL DEFAULT 0,
            built_in INTEGER NOT NULL DEFAULT 0,
            parent TEXT
        );

        CREATE TABLE tags (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            admin_only INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE root_tags (
            root_id INTEGER NOT NULL REFERENCES watched_roots(id) ON DELETE CASCADE,
            tag_id INTEGER NOT NULL REFERENCES tags(id) ON DELETE CASCADE,
            PRIMARY KEY (root_id, tag_id)
        );

        CREATE TABLE contents (
            content_hash TEXT PRIMARY KEY,
            is_video INTEGER NOT NULL DEFAULT 0,
            metadata_json TEXT NOT NULL DEFAULT '{}',
            width INTEGER,
            height INTEGER,
            date_created INTEGER,
            date_modified INTEGER,
            date_indexed INTEGER NOT NULL
        );

        CREATE TABLE content_tags (
            content_hash TEXT NOT NULL REFERENCES contents(content_hash) ON DELETE CASCADE,
            tag_id INTEGER NOT NULL REFERENCES tags(id) ON DELETE CASCADE,
            PRIMARY KEY (content_hash, tag_id)
        );

        CREATE TABLE locations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            content_hash TEXT NOT NULL REFERENCES contents(content_hash),
            path TEXT NOT NULL,
            filename TEXT NOT NULL,
            date_scanned INTEGER NOT NULL,
            deleted INTEGER NOT NULL DEFAULT 0,
            UNIQUE (path, filename)
        );
    )";
    return m;
}

Migration CatalogMigrations::createSearchIndex() {
    Migration m;
    m.version = 2;
    m.name = "Create location full-text index";
    m.upFunc = [](Database& db) -> Result<void> {
        auto fts = db.hasFTS5();
        if (!fts || !fts.value()) {
            return Error{ErrorCode::NotSupported, "SQLite was built without FTS5"};
        }
        return db.execute(searchIndexDDL());
    };
    return m;
}

Migration CatalogMigrations::createLookupIndexes() {
    Migration m;
    m.version = 3;
    m.name = "Create lookup indexes";
    m.upSQL = R"(
        CREATE INDEX IF NOT EXISTS idx_locations_content_hash ON locations(content_hash);
        CREATE INDEX IF NOT EXISTS idx_locations_deleted ON locations(deleted);
        CREATE INDEX IF NOT EXISTS idx_content_tags_tag ON content_tags(tag_id);
        CREATE INDEX IF NOT EXISTS idx_watched_roots_parent ON watched_roots(parent);
    )";
    return m;
}

Result<void> migrateCatalog(Database& db) {
    MigrationManager manager(db);
    auto init = manager.initialize();
    if (!init)
        return init;
    manager.registerMigrations(CatalogMigrations::getAllMigrations());
    return manager.migrate();
}

} // namespace mediacat::metadata
