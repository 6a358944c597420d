#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <mediacat/catalog/content_store.h>
#include <mediacat/catalog/location_index.h>
#include <mediacat/catalog/search_index.h>
#include <mediacat/metadata/migration.h>

namespace mediacat::catalog {

using json = nlohmann::json;
using metadata::Database;
using metadata::prepareBound;
using metadata::Statement;

namespace {

constexpr const char* kUpsertSql = R"(
    INSERT OR REPLACE INTO location_fts (rowid, location_id, path, filename, prompt,
        negative_prompt, model, sampler, scheduler, loras, upscaler, application, tags, stub,
        full_text)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
)";

std::string scalarText(const json& value) {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_null())
        return {};
    return value.dump();
}

void appendFlattened(const json& value, std::string& out) {
    if (value.is_object() || value.is_array()) {
        for (const auto& item : value) {
            appendFlattened(item, out);
        }
        return;
    }
    auto text = scalarText(value);
    if (text.empty())
        return;
    if (!out.empty())
        out += ' ';
    out += text;
}

std::optional<std::string> optionalField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return std::nullopt;
    return scalarText(*it);
}

json generationParams(const json& metadata) {
    auto it = metadata.find("parameters");
    if (it == metadata.end())
        return json::object();

    json params = it->is_string() ? json::parse(it->get<std::string>(), nullptr, false) : *it;
    if (params.is_discarded() || !params.is_object())
        return json::object();

    auto sui = params.find("sui_image_params");
    if (sui == params.end() || !sui->is_object())
        return json::object();
    return *sui;
}

Result<void> bindOptional(Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value)
        return stmt.bind(index, *value);
    return stmt.bind(index, nullptr);
}

Result<void> bindRow(Statement& stmt, const SearchRow& row) {
    if (auto r = stmt.bindAll(row.locationId, row.locationId, row.path, row.filename); !r)
        return r;
    if (auto r = bindOptional(stmt, 5, row.prompt); !r)
        return r;
    if (auto r = bindOptional(stmt, 6, row.negativePrompt); !r)
        return r;
    if (auto r = bindOptional(stmt, 7, row.model); !r)
        return r;
    if (auto r = bindOptional(stmt, 8, row.sampler); !r)
        return r;
    if (auto r = bindOptional(stmt, 9, row.scheduler); !r)
        return r;
    if (auto r = stmt.bind(10, row.loras); !r)
        return r;
    if (auto r = bindOptional(stmt, 11, row.upscaler); !r)
        return r;
    if (auto r = stmt.bind(12, row.application); !r)
        return r;
    if (auto r = stmt.bind(13, row.tags); !r)
        return r;
    if (auto r = stmt.bind(14, std::string{}); !r)
        return r;
    return stmt.bind(15, row.fullText);
}

std::string joinTags(const std::vector<std::string>& tags) {
    std::string joined;
    for (const auto& tag : tags) {
        if (!joined.empty())
            joined += ' ';
        joined += tag;
    }
    return joined;
}

} // namespace

SearchRow SearchIndex::flatten(const LocationRecord& location, const std::string& metadataJson,
                               const std::vector<std::string>& tags) {
    SearchRow row;
    row.locationId = location.id;
    row.path = location.directory;
    row.filename = location.filename;
    row.tags = joinTags(tags);

    json metadata = json::parse(metadataJson, nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object())
        metadata = json::object();

    const json sui = generationParams(metadata);
    row.prompt = optionalField(sui, "prompt");
    row.negativePrompt = optionalField(sui, "negativeprompt");
    row.model = optionalField(sui, "model");
    row.sampler = optionalField(sui, "sampler");
    row.scheduler = optionalField(sui, "scheduler");
    row.loras = scalarText(sui.value("loras", json("")));
    row.upscaler = optionalField(sui, "upscaler");
    row.application = sui.contains("swarm_version") ? "SwarmUI" : "Unknown";

    appendFlattened(metadata, row.fullText);
    return row;
}

Result<void> SearchIndex::upsert(Database& db, const SearchRow& row) const {
    auto stmtResult = db.prepare(kUpsertSql);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if (auto r = bindRow(stmt, row); !r)
        return r;
    return stmt.execute();
}

Result<void> SearchIndex::refresh(Database& db, LocationId id) const {
    LocationIndex locations;
    auto location = locations.get(db, id);
    if (!location)
        return location.error();
    if (!location.value())
        return remove(db, id);

    ContentStore contents;
    auto content = contents.get(db, location.value()->checksum);
    if (!content)
        return content.error();
    if (!content.value())
        return Error{ErrorCode::NotFound, "Content missing for location " + std::to_string(id)};

    auto tags = contents.tagsFor(db, location.value()->checksum);
    if (!tags)
        return tags.error();

    return upsert(db, flatten(*location.value(), content.value()->metadataJson, tags.value()));
}

Result<void> SearchIndex::refreshContent(Database& db, const Checksum& checksum) const {
    LocationIndex locations;
    auto rows = locations.forContent(db, checksum);
    if (!rows)
        return rows.error();

    for (const auto& location : rows.value()) {
        if (auto r = refresh(db, location.id); !r)
            return r;
    }
    return {};
}

Result<void> SearchIndex::remove(Database& db, LocationId id) const {
    auto stmtResult = prepareBound(db, "DELETE FROM location_fts WHERE rowid = ?", id);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    return stmt.execute();
}

Result<size_t> SearchIndex::rebuild(Database& db) const {
    if (db.inTransaction())
        return Error{ErrorCode::InvalidState, "Search index rebuild cannot run in a transaction"};

    spdlog::info("Rebuilding search index");
    const auto start = std::chrono::steady_clock::now();

    if (auto r = db.execute("DROP TABLE IF EXISTS location_fts"); !r)
        return r.error();
    if (auto r = db.execute(metadata::CatalogMigrations::searchIndexDDL()); !r)
        return r.error();

    std::vector<SearchRow> rows;
    {
        auto stmtResult = db.prepare(R"(
            SELECT l.id, l.content_hash, l.path, l.filename, c.metadata_json,
                   (SELECT group_concat(name, ' ') FROM (
                        SELECT t.name AS name FROM tags t
                        JOIN content_tags ct ON ct.tag_id = t.id
                        WHERE ct.content_hash = l.content_hash
                        ORDER BY t.name))
            FROM locations l
            JOIN contents c ON c.content_hash = l.content_hash
            ORDER BY l.id
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;

            LocationRecord location;
            location.id = stmt.getInt64(0);
            location.checksum = stmt.getString(1);
            location.directory = stmt.getString(2);
            location.filename = stmt.getString(3);
            SearchRow row = flatten(location, stmt.getString(4), {});
            row.tags = stmt.getString(5);
            rows.push_back(std::move(row));
        }
    }

    for (size_t offset = 0; offset < rows.size(); offset += kRebuildBatchSize) {
        const size_t end = std::min(rows.size(), offset + kRebuildBatchSize);
        auto batchResult = db.transaction([&]() -> Result<void> {
            for (size_t i = offset; i < end; ++i) {
                if (auto r = upsert(db, rows[i]); !r)
                    return r;
            }
            return {};
        });
        if (!batchResult) {
            spdlog::error("Search index rebuild failed at batch starting {}: {}", offset,
                          batchResult.error().message);
            return batchResult.error();
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Search index rebuilt: {} rows in {}ms", rows.size(), elapsed.count());
    return rows.size();
}

Result<std::vector<LocationId>> SearchIndex::match(Database& db,
                                                   const std::string& expression) const {
    auto stmtResult = prepareBound(
        db, "SELECT rowid FROM location_fts WHERE location_fts MATCH ? ORDER BY rowid", expression);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    std::vector<LocationId> ids;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        ids.push_back(stmt.getInt64(0));
    }
    return ids;
}

Result<int64_t> SearchIndex::count(Database& db) const {
    auto stmtResult = db.prepare("SELECT COUNT(*) FROM location_fts");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    return stmt.getInt64(0);
}

} // namespace mediacat::catalog
