#include <mediacat/catalog/content_store.h>

namespace mediacat::catalog {

using metadata::Database;
using metadata::prepareBound;
using metadata::Statement;

namespace {

ContentRecord mapContentRow(const Statement& stmt) {
    ContentRecord record;
    record.checksum = stmt.getString(0);
    record.isVideo = stmt.getInt(1) != 0;
    record.metadataJson = stmt.getString(2);
    if (!stmt.isNull(3))
        record.width = stmt.getInt(3);
    if (!stmt.isNull(4))
        record.height = stmt.getInt(4);
    record.dateCreated = stmt.getInt64(5);
    record.dateModified = stmt.getInt64(6);
    record.dateIndexed = stmt.getInt64(7);
    return record;
}

Result<void> bindOptionalInt(Statement& stmt, int index, std::optional<int> value) {
    if (value) {
        return stmt.bind(index, *value);
    }
    return stmt.bind(index, nullptr);
}

} // namespace

Result<bool> ContentStore::exists(Database& db, const Checksum& checksum) const {
    auto stmtResult = prepareBound(db, "SELECT 1 FROM contents WHERE content_hash = ?", checksum);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    return stmt.step();
}

Result<std::optional<ContentRecord>> ContentStore::get(Database& db,
                                                       const Checksum& checksum) const {
    auto stmtResult = prepareBound(db, R"(
        SELECT content_hash, is_video, metadata_json, width, height,
               date_created, date_modified, date_indexed
        FROM contents WHERE content_hash = ?
    )",
                                   checksum);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return std::optional<ContentRecord>{};
    return std::optional<ContentRecord>{mapContentRow(stmt)};
}

Result<void> ContentStore::insert(Database& db, const ContentRecord& record) const {
    auto stmtResult = db.prepare(R"(
        INSERT INTO contents (content_hash, is_video, metadata_json, width, height,
                              date_created, date_modified, date_indexed)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bindAll(record.checksum, record.isVideo ? 1 : 0, record.metadataJson);
    if (!bindResult)
        return bindResult;
    if (auto r = bindOptionalInt(stmt, 4, record.width); !r)
        return r;
    if (auto r = bindOptionalInt(stmt, 5, record.height); !r)
        return r;
    if (auto r = stmt.bind(6, record.dateCreated); !r)
        return r;
    if (auto r = stmt.bind(7, record.dateModified); !r)
        return r;
    if (auto r = stmt.bind(8, record.dateIndexed); !r)
        return r;
    return stmt.execute();
}

Result<void> ContentStore::updateMetadata(Database& db, const Checksum& checksum,
                                          const std::string& metadataJson,
                                          std::optional<int> width,
                                          std::optional<int> height) const {
    auto stmtResult = db.prepare(
        "UPDATE contents SET metadata_json = ?, width = ?, height = ? WHERE content_hash = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.bind(1, metadataJson); !r)
        return r;
    if (auto r = bindOptionalInt(stmt, 2, width); !r)
        return r;
    if (auto r = bindOptionalInt(stmt, 3, height); !r)
        return r;
    if (auto r = stmt.bind(4, checksum); !r)
        return r;
    return stmt.execute();
}

Result<void> ContentStore::remove(Database& db, const Checksum& checksum) const {
    auto tagsResult = prepareBound(db, "DELETE FROM content_tags WHERE content_hash = ?", checksum);
    if (!tagsResult)
        return tagsResult.error();
    Statement deleteTags = std::move(tagsResult).value();
    if (auto r = deleteTags.execute(); !r)
        return r;

    auto stmtResult = prepareBound(db, "DELETE FROM contents WHERE content_hash = ?", checksum);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    return stmt.execute();
}

Result<std::vector<Checksum>> ContentStore::allChecksums(Database& db) const {
    auto stmtResult = db.prepare("SELECT content_hash FROM contents");
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

Result<int64_t> ContentStore::count(Database& db) const {
    auto stmtResult = db.prepare("SELECT COUNT(*) FROM contents");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stmt.getInt64(0);
}

Result<int64_t> ContentStore::ensureTag(Database& db, const std::string& name) {
    auto insertResult = prepareBound(db, "INSERT OR IGNORE INTO tags (name) VALUES (?)", name);
    if (!insertResult)
        return insertResult.error();
    Statement insert = std::move(insertResult).value();
    if (auto r = insert.execute(); !r)
        return r.error();

    auto stmtResult = prepareBound(db, "SELECT id FROM tags WHERE name = ?", name);
    if (!stmtResult)
        return stmtResult.error();
    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value())
        return Error{ErrorCode::NotFound, "Tag vanished after insert: " + name};
    return stmt.getInt64(0);
}

Result<bool> ContentStore::addTag(Database& db, const Checksum& checksum, int64_t tagId) const {
    auto stmtResult =
        prepareBound(db, "INSERT OR IGNORE INTO content_tags (content_hash, tag_id) VALUES (?, ?)",
                     checksum, tagId);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = stmt.execute(); !r)
        return r.error();
    return db.changes() > 0;
}

Result<bool> ContentStore::addTag(Database& db, const Checksum& checksum,
                                  const std::string& tagName) const {
    auto tagId = ensureTag(db, tagName);
    if (!tagId)
        return tagId.error();
    return addTag(db, checksum, tagId.value());
}

Result<std::vector<std::string>> ContentStore::tagsFor(Database& db,
                                                       const Checksum& checksum) const {
    auto stmtResult = prepareBound(db, R"(
        SELECT t.name FROM tags t
        JOIN content_tags ct ON ct.tag_id = t.id
        WHERE ct.content_hash = ?
        ORDER BY t.name
    )",
                                   checksum);
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

} // namespace mediacat::catalog
