#include "i_query_executor.h"
#include "postgresql_query_executor.h"
#include "db_connection_interface.h"
#include "db_connection_pool.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

/**
 * @file query_executor_factory.cpp
 * @brief Query Executor Factory Implementation
 */

namespace common {

std::unique_ptr<IQueryExecutor> createQueryExecutor(IDbConnectionPool* pool)
{
    if (!pool) {
        throw std::invalid_argument("createQueryExecutor: pool cannot be nullptr");
    }

    std::string dbType = pool->getDatabaseType();
    spdlog::debug("[QueryExecutorFactory] Creating executor for database type: {}", dbType);

    if (dbType == "postgres") {
        auto pgPool = dynamic_cast<DbConnectionPool*>(pool);
        if (!pgPool) {
            throw std::runtime_error("createQueryExecutor: Failed to cast to PostgreSQL pool");
        }
        return std::make_unique<PostgreSQLQueryExecutor>(pgPool);
    }

    throw std::runtime_error("createQueryExecutor: Unsupported database type: " + dbType);
}

} // namespace common
