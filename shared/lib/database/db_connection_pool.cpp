/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace common {

// =============================================================================
// DbConnection
// =============================================================================

DbConnection::~DbConnection() {
    if (!released_ && conn_) {
        release();
    }
}

void DbConnection::release() {
    if (released_ || !conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    }

    conn_ = nullptr;
    released_ = true;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (maxSize == 0) {
        throw std::invalid_argument("maxSize must be at least 1");
    }
    if (minSize > maxSize) {
        throw std::invalid_argument("minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    spdlog::info("[DbConnectionPool] Opening {} minimum connections", minSize_);

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to create minimum connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("Connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                spdlog::debug("[DbConnectionPool] Acquired connection (available: {})",
                              availableConnections_.size());
                return DbConnection(conn, this);
            }

            spdlog::warn("[DbConnectionPool] Pooled connection is unhealthy, closing and retrying");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            // Reserve the slot before unlocking so concurrent acquirers respect maxSize
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (!conn) {
                totalConnections_--;
                cv_.notify_one();
                throw DatabaseException("Failed to create database connection");
            }

            spdlog::debug("[DbConnectionPool] Created new connection (total: {})", totalConnections_.load());
            return DbConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[DbConnectionPool] Timeout waiting for connection ({}s)", acquireTimeout_.count());
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    return Stats{
        availableConnections_.size(),
        totalConnections_.load(),
        maxSize_
    };
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PGconn* conn = availableConnections_.front();
        availableConnections_.pop();
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_all();

    spdlog::info("[DbConnectionPool] Shutdown complete");
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::error("[DbConnectionPool] Failed to create PostgreSQL connection: {}", error);
        PQfinish(conn);
        return nullptr;
    }

    spdlog::debug("[DbConnectionPool] PostgreSQL connection created (encoding: {})",
                  pg_encoding_to_char(PQclientEncoding(conn)));
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    bool healthy = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) {
        PQclear(res);
    }
    return healthy;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        totalConnections_--;
        return;
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
    } else {
        spdlog::warn("[DbConnectionPool] Released connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace common
