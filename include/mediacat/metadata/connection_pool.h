#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <type_traits>
#include <mediacat/metadata/database.h>

namespace mediacat::metadata {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 1;                     ///< Minimum connections to maintain
    size_t maxConnections = 8;                     ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{5000};   ///< SQLite busy timeout
    bool enableWAL = true;                         ///< Enable WAL mode
    bool enableForeignKeys = true;                 ///< Enable foreign key constraints
};

/**
 * @brief Database connection checked out of a pool
 *
 * Returned to the pool on destruction. A connection is used by one thread at a time.
 */
class PooledConnection {
public:
    explicit PooledConnection(std::unique_ptr<Database> db,
                              std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    const Database* operator->() const { return db_.get(); }
    Database& operator*() { return *db_; }
    const Database& operator*() const { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    Result<void> initialize();
    void shutdown();

    /**
     * @brief Acquire a connection, waiting up to timeout for one to be returned
     */
    Result<std::unique_ptr<PooledConnection>>
    acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return Error{ErrorCode::ResourceExhausted,
                         "Failed to acquire database connection: " + connResult.error().message};
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    [[nodiscard]] const std::string& path() const { return dbPath_; }

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    std::atomic<size_t> totalConnections_{0};
    std::atomic<bool> shutdown_{false};

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    void returnConnection(PooledConnection* conn);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
};

} // namespace mediacat::metadata
