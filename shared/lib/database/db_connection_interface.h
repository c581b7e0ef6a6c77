/**
 * @file db_connection_interface.h
 * @brief Connection pool interface
 *
 * Lets the service container and query executor factory hold a pool without
 * depending on libpq directly.
 */

#pragma once

#include <string>
#include <cstddef>

namespace common {

/**
 * @brief Database connection pool
 */
class IDbConnectionPool {
public:
    virtual ~IDbConnectionPool() = default;

    /**
     * @brief Open the minimum number of connections
     * @return true if all minimum connections were created
     */
    virtual bool initialize() = 0;

    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    virtual Stats getStats() const = 0;

    /**
     * @brief Close all idle connections and reject further acquires
     */
    virtual void shutdown() = 0;

    virtual std::string getDatabaseType() const = 0;

protected:
    IDbConnectionPool() = default;
};

} // namespace common
