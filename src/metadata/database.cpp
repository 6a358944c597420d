#include <mediacat/metadata/database.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

namespace mediacat::metadata {

namespace {
constexpr int kMaxRetries = 5;
constexpr auto kInitialBackoff = std::chrono::milliseconds(10);

bool isTransientLock(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}
} // namespace

ErrorCode translateSqliteError(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            return ErrorCode::ConstraintViolation;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorCode::Timeout;
        case SQLITE_NOTFOUND:
            return ErrorCode::NotFound;
        case SQLITE_CORRUPT:
            return ErrorCode::InvalidData;
        default:
            return ErrorCode::DatabaseError;
    }
}

// Statement implementation
Statement::Statement(sqlite3* db, const std::string& sql) {
    const char* tail;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, &tail);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind double"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string_view"};
    }
    return {};
}

Result<void> Statement::execute() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
            return {};
        }
        if (isTransientLock(rc) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }

        std::string errMsg = "Failed to execute statement: " + std::string(sqlite3_errstr(rc));
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            if (const char* sql = sqlite3_sql(stmt_)) {
                std::string sqlSnippet(sql, std::min(std::strlen(sql), size_t{100}));
                errMsg += " [SQL: " + sqlSnippet + (std::strlen(sql) > 100 ? "..." : "") + "]";
            }
        }
        return Error{translateSqliteError(rc), errMsg};
    }
    return Error{ErrorCode::Timeout, "Failed to execute statement: max retries exceeded"};
}

Result<bool> Statement::step() {
    auto backoff = kInitialBackoff;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        } else if (rc == SQLITE_DONE) {
            return false;
        }
        if (isTransientLock(rc) && attempt + 1 < kMaxRetries) {
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
            continue;
        }
        return Error{translateSqliteError(rc),
                     "Failed to step statement: " + std::string(sqlite3_errstr(rc))};
    }
    return Error{ErrorCode::Timeout, "Failed to step statement: max retries exceeded"};
}

int Statement::getInt(int column) const {
    return sqlite3_column_int(stmt_, column);
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Result<void> Statement::reset() {
    if (!stmt_) {
        return Error{ErrorCode::DatabaseError, "Statement is null"};
    }
    if (sqlite3_reset(stmt_) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to reset statement"};
    }
    sqlite3_clear_bindings(stmt_);
    return {};
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    int flags = 0;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            flags = SQLITE_OPEN_READONLY;
            break;
        case ConnectionMode::ReadWrite:
            flags = SQLITE_OPEN_READWRITE;
            break;
        case ConnectionMode::Create:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
        case ConnectionMode::Memory:
            flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_MEMORY;
            break;
    }
    // Each pooled connection is confined to one thread at a time
    flags |= SQLITE_OPEN_NOMUTEX;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database: " + error};
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    path_.clear();
    inTransaction_ = false;
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    try {
        return Statement(db_, sql);
    } catch (const std::exception& e) {
        return Error{ErrorCode::DatabaseError, e.what()};
    }
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        auto code = translateSqliteError(rc);
        if (code != ErrorCode::ConstraintViolation) {
            spdlog::error("SQL exec failed ({}): {}", error, sql);
        }
        return Error{code, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::beginTransaction() {
    if (inTransaction_) {
        return Error{ErrorCode::InvalidState, "Already in transaction"};
    }

    auto result = execute("BEGIN IMMEDIATE");
    if (result) {
        inTransaction_ = true;
    }
    return result;
}

Result<void> Database::commit() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("COMMIT");
    if (result) {
        inTransaction_ = false;
    }
    return result;
}

Result<void> Database::rollback() {
    if (!inTransaction_) {
        return Error{ErrorCode::InvalidState, "Not in transaction"};
    }

    auto result = execute("ROLLBACK");
    inTransaction_ = false; // Always clear flag, even on error
    return result;
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

int Database::changes() const {
    return db_ ? sqlite3_changes(db_) : 0;
}

Result<bool> Database::tableExists(const std::string& table) {
    auto stmtResult = prepare("SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, table);
    if (!bindResult)
        return bindResult.error();

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();

    return stmt.getInt(0) > 0;
}

Result<bool> Database::hasFTS5() {
    return sqlite3_compileoption_used("ENABLE_FTS5") == 1;
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

Result<void> Database::enableWAL() {
    return execute("PRAGMA journal_mode=WAL");
}

} // namespace mediacat::metadata
