#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>

/**
 * @file postgresql_query_executor.h
 * @brief PostgreSQL Query Executor - libpq-based implementation
 *
 * Acquires a connection per call, executes with PQexecParams and converts
 * PGresult to Json::Value.
 */

namespace common {

/**
 * @brief PostgreSQL-specific query executor
 */
class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool PostgreSQL connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    /**
     * @return Number of affected rows (from PQcmdTuples)
     */
    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "postgres"; }

    /**
     * @brief Convert a single PostgreSQL text value to JSON by column type OID
     *
     * - INT2, INT4, INT8 -> JSON integer
     * - FLOAT4, FLOAT8 -> JSON number
     * - BOOL -> JSON boolean
     * - Others (CHAR, VARCHAR, TEXT, ...) -> JSON string
     */
    static Json::Value convertValue(const char* value, Oid type);

private:
    struct ResultDeleter { void operator()(PGresult* r) const { PQclear(r); } };
    using UniqueResult = std::unique_ptr<PGresult, ResultDeleter>;

    DbConnectionPool* pool_;

    /**
     * @brief Execute parameterized statement on a pooled connection
     * @throws DuplicateKeyException / DatabaseException on failure
     */
    UniqueResult executeRaw(
        const std::string& query,
        const std::vector<std::string>& params
    );

    Json::Value pgResultToJson(PGresult* res);
};

} // namespace common
