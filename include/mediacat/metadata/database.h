#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <mediacat/core/types.h>

namespace mediacat::metadata {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadWrite, ///< Read-write mode (default)
    ReadOnly,  ///< Read-only mode
    Memory,    ///< In-memory database
    Create     ///< Create if not exists
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     *
     * Constraint failures are reported as ErrorCode::ConstraintViolation.
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int getInt(int column) const;
    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

    Result<void> reset();

private:
    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }

    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadWrite);
    void close();

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }

    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries, may hold several statements)
     */
    Result<void> execute(const std::string& sql);

    /**
     * @brief Begin a write transaction
     *
     * Uses BEGIN IMMEDIATE so the write lock is taken up front and a concurrent writer waits
     * on the busy timeout instead of failing on lock upgrade.
     */
    Result<void> beginTransaction();
    Result<void> commit();
    Result<void> rollback();

    [[nodiscard]] bool inTransaction() const { return inTransaction_; }

    /**
     * @brief Execute within transaction
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        auto beginResult = beginTransaction();
        if (!beginResult)
            return beginResult;

        try {
            auto result = func();
            if (!result) {
                (void)rollback();
                return result;
            }
            return commit();
        } catch (...) {
            (void)rollback();
            throw;
        }
    }

    int64_t lastInsertRowId() const;
    int changes() const;

    Result<bool> tableExists(const std::string& table);
    Result<bool> hasFTS5();

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);
    Result<void> enableWAL();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

/**
 * @brief Prepare a statement and bind positional parameters in one step
 */
template <typename... Args>
Result<Statement> prepareBound(Database& db, const std::string& sql, Args&&... args) {
    auto stmtResult = db.prepare(sql);
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    if constexpr (sizeof...(args) > 0) {
        auto bindResult = stmt.bindAll(std::forward<Args>(args)...);
        if (!bindResult)
            return bindResult.error();
    }
    return Result<Statement>(std::move(stmt));
}

/**
 * @brief Map a SQLite result code onto the project error codes
 */
ErrorCode translateSqliteError(int rc);

} // namespace mediacat::metadata
