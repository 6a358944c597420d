#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <mediacat/metadata/database.h>

namespace mediacat::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for migrations that need more than plain SQL)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Database migration manager
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations, each in its own transaction
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

/**
 * @brief Built-in migrations for the media catalog schema
 */
class CatalogMigrations {
public:
    static std::vector<Migration> getAllMigrations();

    /**
     * @brief DDL for the full-text index table, shared with the index rebuild
     */
    static const char* searchIndexDDL();

private:
    // Version 1: roots, tags, contents, locations
    static Migration createInitialSchema();

    // Version 2: FTS5 search index over locations
    static Migration createSearchIndex();

    // Version 3: lookup indexes
    static Migration createLookupIndexes();
};

/**
 * @brief Open (or create) a catalog database and bring its schema up to date
 */
Result<void> migrateCatalog(Database& db);

} // namespace mediacat::metadata
