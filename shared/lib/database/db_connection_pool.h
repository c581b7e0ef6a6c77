/**
 * @file db_connection_pool.h
 * @brief PostgreSQL Connection Pool
 *
 * Thread-safe connection pooling for the GTIN store:
 * - Configurable pool size (min/max connections)
 * - Acquire timeout
 * - Health check on acquire and release
 */

#pragma once

#include "db_connection_interface.h"
#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <chrono>
#include <atomic>

namespace common {

class DbConnectionPool;

/**
 * @brief RAII wrapper for a pooled PostgreSQL connection
 *
 * Returns the connection to its pool when destroyed.
 */
class DbConnection {
private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
    bool released_;

public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool), released_(false) {}

    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_), released_(other.released_) {
        other.conn_ = nullptr;
        other.released_ = true;
    }

    DbConnection& operator=(DbConnection&& other) noexcept {
        if (this != &other) {
            if (!released_ && conn_) {
                release();
            }
            conn_ = other.conn_;
            pool_ = other.pool_;
            released_ = other.released_;
            other.conn_ = nullptr;
            other.released_ = true;
        }
        return *this;
    }

    PGconn* get() const { return conn_; }

    bool isValid() const {
        return conn_ != nullptr && !released_;
    }

    /**
     * @brief Return connection to its pool before destruction
     */
    void release();
};

/**
 * @brief PostgreSQL Connection Pool
 */
class DbConnectionPool : public IDbConnectionPool {
private:
    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool shutdown_;

    friend class DbConnection;

public:
    /**
     * @param connString libpq connection string (see DbPoolConfig::buildPostgresConnString)
     * @param minSize Connections opened by initialize()
     * @param maxSize Upper bound on open connections
     * @param acquireTimeoutSec Seconds acquire() waits for a free connection
     * @throws std::invalid_argument if minSize > maxSize or maxSize == 0
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 1,
        size_t maxSize = 4,
        int acquireTimeoutSec = 5
    );

    ~DbConnectionPool() override;

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    bool initialize() override;

    /**
     * @brief Acquire connection from pool
     * @throws PoolExhaustedException on timeout
     * @throws DatabaseException if the pool is shut down or a new connection cannot be opened
     */
    DbConnection acquire();

    Stats getStats() const override;

    void shutdown() override;

    std::string getDatabaseType() const override {
        return "postgres";
    }

private:
    PGconn* createConnection();
    bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);
};

} // namespace common
