/**
 * @file db_connection_pool_factory.h
 * @brief Database Connection Pool Factory
 *
 * Builds the connection pool from DbPoolConfig. Session settings the GTIN
 * store relies on (time zone, client encoding) are part of the config and are
 * applied through the libpq connection string, never by the algorithm code.
 */

#pragma once

#include "db_connection_interface.h"
#include <string>
#include <memory>
#include <vector>

namespace common {

/**
 * @brief Connection pool configuration
 */
struct DbPoolConfig {
    std::string dbType = "postgres";

    size_t minSize = 1;
    size_t maxSize = 4;
    int acquireTimeoutSec = 5;

    std::string pgHost = "localhost";
    int pgPort = 5432;
    std::string pgDatabase = "gtin";
    std::string pgUser = "gtin";
    std::string pgPassword;

    // Session settings (empty = server default)
    std::string timeZone = "+00:00";
    std::string clientEncoding = "UTF8";

    /**
     * @brief Build PostgreSQL connection string
     *
     * Example:
     *   host=localhost port=5432 dbname=gtin user=gtin password=secret
     *   client_encoding=UTF8 options='-c TimeZone=+00:00'
     */
    std::string buildPostgresConnString() const;
};

/**
 * @brief Database Connection Pool Factory
 *
 * @code
 * auto pool = DbConnectionPoolFactory::create(appConfig.toPoolConfig());
 * if (pool && pool->initialize()) {
 *     auto executor = createQueryExecutor(pool.get());
 * }
 * @endcode
 */
class DbConnectionPoolFactory {
public:
    /**
     * @brief Create connection pool based on config
     *
     * Supported database types: "postgres", "postgresql", "pg"
     *
     * @throws std::runtime_error for unsupported database types
     */
    static std::shared_ptr<IDbConnectionPool> create(const DbPoolConfig& config);

    static bool isSupported(const std::string& dbType);

    static std::vector<std::string> getSupportedTypes();

private:
    static std::string normalizeDbType(const std::string& dbType);
};

} // namespace common
