#include <mediacat/catalog/location_index.h>

namespace mediacat::catalog {

using metadata::Database;
using metadata::prepareBound;
using metadata::Statement;

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, content_hash, path, filename, date_scanned, deleted FROM locations ";

LocationRecord mapLocationRow(const Statement& stmt) {
    LocationRecord record;
    record.id = stmt.getInt64(0);
    record.checksum = stmt.getString(1);
    record.directory = stmt.getString(2);
    record.filename = stmt.getString(3);
    record.dateScanned = stmt.getInt64(4);
    record.deleted = stmt.getInt(5) != 0;
    return record;
}

Result<std::vector<LocationRecord>> collectRows(Result<Statement> stmtResult) {
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<LocationRecord> records;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        records.push_back(mapLocationRow(stmt));
    }
    return records;
}

Result<std::optional<LocationRecord>> firstRow(Result<Statement> stmtResult) {
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<LocationRecord>{};
    return std::optional<LocationRecord>{mapLocationRow(stmt)};
}

Result<int64_t> scalar(Result<Statement> stmtResult) {
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return int64_t{0};
    return stmt.getInt64(0);
}

} // namespace

Result<std::optional<LocationRecord>> LocationIndex::find(Database& db,
                                                          const std::string& directory,
                                                          const std::string& filename) const {
    return firstRow(prepareBound(db, std::string(kSelectColumns) + "WHERE path = ? AND filename = ?",
                                 directory, filename));
}

Result<std::optional<LocationRecord>> LocationIndex::get(Database& db, LocationId id) const {
    return firstRow(prepareBound(db, std::string(kSelectColumns) + "WHERE id = ?", id));
}

Result<LocationId> LocationIndex::insert(Database& db, const Checksum& checksum,
                                         const std::string& directory,
                                         const std::string& filename, int64_t dateScanned) const {
    auto stmtResult = prepareBound(db, R"(
        INSERT INTO locations (content_hash, path, filename, date_scanned, deleted)
        VALUES (?, ?, ?, ?, 0)
    )",
                                   checksum, directory, filename, dateScanned);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db.lastInsertRowId();
}

Result<void> LocationIndex::remove(Database& db, LocationId id) const {
    auto stmtResult = prepareBound(db, "DELETE FROM locations WHERE id = ?", id);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    return stmt.execute();
}

Result<void> LocationIndex::move(Database& db, LocationId id, const std::string& newDirectory,
                                 const std::string& newFilename) const {
    auto stmtResult = prepareBound(db, "UPDATE locations SET path = ?, filename = ? WHERE id = ?",
                                   newDirectory, newFilename, id);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r;
    if (db.changes() == 0)
        return Error{ErrorCode::NotFound, "Location not found: " + std::to_string(id)};
    return {};
}

Result<void> LocationIndex::setDeleted(Database& db, LocationId id, bool deleted) const {
    auto stmtResult =
        prepareBound(db, "UPDATE locations SET deleted = ? WHERE id = ?", deleted ? 1 : 0, id);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r;
    if (db.changes() == 0)
        return Error{ErrorCode::NotFound, "Location not found: " + std::to_string(id)};
    return {};
}

Result<int64_t> LocationIndex::countDeleted(Database& db) const {
    return scalar(db.prepare("SELECT COUNT(*) FROM locations WHERE deleted = 1"));
}

Result<int64_t> LocationIndex::count(Database& db) const {
    return scalar(db.prepare("SELECT COUNT(*) FROM locations"));
}

Result<int64_t> LocationIndex::countForContent(Database& db, const Checksum& checksum) const {
    return scalar(
        prepareBound(db, "SELECT COUNT(*) FROM locations WHERE content_hash = ?", checksum));
}

Result<std::vector<LocationRecord>> LocationIndex::forContent(Database& db,
                                                              const Checksum& checksum) const {
    return collectRows(prepareBound(
        db, std::string(kSelectColumns) + "WHERE content_hash = ? ORDER BY id", checksum));
}

Result<std::vector<LocationRecord>> LocationIndex::inDirectory(Database& db,
                                                               const std::string& directory) const {
    return collectRows(prepareBound(
        db, std::string(kSelectColumns) + "WHERE path = ? ORDER BY filename", directory));
}

Result<std::vector<LocationRecord>> LocationIndex::all(Database& db) const {
    return collectRows(db.prepare(std::string(kSelectColumns) + "ORDER BY id"));
}

Result<std::vector<LocationRecord>> LocationIndex::orphans(Database& db) const {
    return collectRows(db.prepare(std::string(kSelectColumns) +
                                  "WHERE path NOT IN (SELECT path FROM watched_roots) ORDER BY id"));
}

Result<std::vector<Checksum>> LocationIndex::checksumsUnder(Database& db,
                                                            const std::string& rootPath) const {
    // Byte-wise prefix match: substr() on a BLOB counts bytes, which is what prefix.size()
    // is, and unlike LIKE it treats '%' and '_' literally
    std::string prefix = rootPath;
    if (prefix.empty() || prefix.back() != '/')
        prefix += '/';

    auto stmtResult = prepareBound(db, R"(
        SELECT DISTINCT content_hash FROM locations
        WHERE path = ? OR substr(CAST(path AS BLOB), 1, ?) = CAST(? AS BLOB)
    )",
                                   rootPath, static_cast<int64_t>(prefix.size()), prefix);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<Checksum> checksums;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        checksums.push_back(stmt.getString(0));
    }
    return checksums;
}

} // namespace mediacat::catalog
