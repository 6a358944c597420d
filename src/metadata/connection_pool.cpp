#include <mediacat/metadata/connection_pool.h>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace mediacat::metadata {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : db_(std::move(other.db_)), returnFunc_(std::move(other.returnFunc_)),
      returned_(other.returned_) {
    other.returned_ = true; // Prevent double return
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        if (db_ && returnFunc_ && !returned_) {
            returnFunc_(this);
        }
        db_ = std::move(other.db_);
        returnFunc_ = std::move(other.returnFunc_);
        returned_ = other.returned_;
        other.returned_ = true;
    }
    return *this;
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.front()->returned_ = true;
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(wrap(std::move(connResult).value()));
        totalConnections_++;
    }

    spdlog::debug("Connection pool for {} initialized with {} connections", dbPath_,
                  config_.minConnections);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    shutdown_ = true;
    cv_.notify_all();

    while (!available_.empty()) {
        auto conn = std::move(available_.front());
        available_.pop();
        conn->returned_ = true;
    }

    totalConnections_ = 0;
}

Result<std::unique_ptr<PooledConnection>>
ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                return connResult.error();
            }
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            return Error{ErrorCode::Timeout, "Timeout acquiring connection"};
        }

        if (shutdown_) {
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();
    return conn;
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* conn) { returnConnection(conn); });
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // Relaxed durability when running tests
    auto syncResult = std::getenv("MEDIACAT_TEST_TMPDIR") ? db.execute("PRAGMA synchronous = OFF")
                                                          : db.execute("PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        spdlog::debug("Failed to set synchronous pragma: {}", syncResult.error().message);
    }
    return {};
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    // A connection must never go back to the pool with a transaction open
    if (conn->db_->inTransaction()) {
        auto rb = conn->db_->rollback();
        if (!rb) {
            spdlog::warn("Rollback on connection return failed: {}", rb.error().message);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    if (!conn->db_->isOpen()) {
        totalConnections_--;
        spdlog::warn("Returned connection is closed, discarding");
        return;
    }

    available_.push(wrap(std::move(conn->db_)));
    cv_.notify_one();
}

} // namespace mediacat::metadata
