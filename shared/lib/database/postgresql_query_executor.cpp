#include "postgresql_query_executor.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cstdlib>
#include <string>

namespace common {

namespace {

// PostgreSQL type OIDs (pg_type.h)
constexpr Oid BOOLOID = 16;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;

// SQLSTATE unique_violation
constexpr const char* UNIQUE_VIOLATION = "23505";

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
    spdlog::debug("[PostgreSQLQueryExecutor] Initialized");
}

// ============================================================================
// Public Interface Implementation
// ============================================================================

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Query: {} (params: {})", query, params.size());

    UniqueResult res = executeRaw(query, params);
    return pgResultToJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Command: {} (params: {})", query, params.size());

    UniqueResult res = executeRaw(query, params);

    const char* affectedRowsStr = PQcmdTuples(res.get());
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }

    spdlog::debug("[PostgreSQLQueryExecutor] Command executed, affected rows: {}", affectedRows);
    return affectedRows;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    spdlog::debug("[PostgreSQLQueryExecutor] Scalar: {}", query);

    UniqueResult res = executeRaw(query, params);

    if (PQntuples(res.get()) == 0) {
        throw DatabaseException("Scalar query returned no rows");
    }
    if (PQnfields(res.get()) != 1) {
        throw DatabaseException("Scalar query must return exactly one column");
    }
    if (PQgetisnull(res.get(), 0, 0)) {
        return Json::nullValue;
    }

    return convertValue(PQgetvalue(res.get(), 0, 0), PQftype(res.get(), 0));
}

Json::Value PostgreSQLQueryExecutor::convertValue(const char* value, Oid type)
{
    switch (type) {
        case INT2OID:
        case INT4OID:
        case INT8OID:
            return Json::Value(static_cast<Json::Int64>(std::strtoll(value, nullptr, 10)));
        case FLOAT4OID:
        case FLOAT8OID:
            return Json::Value(std::strtod(value, nullptr));
        case BOOLOID:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

// ============================================================================
// Private Implementation
// ============================================================================

PostgreSQLQueryExecutor::UniqueResult PostgreSQLQueryExecutor::executeRaw(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    // Held until the result has been fetched; returned to the pool on scope exit
    auto conn = pool_->acquire();
    if (!conn.isValid()) {
        throw DatabaseException("Failed to acquire connection from pool");
    }

    // Empty strings bind as NULL
    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    UniqueResult res(PQexecParams(
        conn.get(),                        // Connection
        query.c_str(),                     // Query string
        static_cast<int>(params.size()),   // Number of parameters
        nullptr,                           // Parameter types (infer)
        paramValues.data(),                // Parameter values
        nullptr,                           // Parameter lengths (text)
        nullptr,                           // Parameter formats (text)
        0                                  // Result format (text)
    ));

    if (!res) {
        throw DatabaseException(std::string("Query execution failed: ") + PQerrorMessage(conn.get()));
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const char* sqlState = PQresultErrorField(res.get(), PG_DIAG_SQLSTATE);
        std::string error = PQresultErrorMessage(res.get());
        std::string state = sqlState ? sqlState : "";

        spdlog::debug("[PostgreSQLQueryExecutor] Statement failed (SQLSTATE {}): {}", state, error);

        if (state == UNIQUE_VIOLATION) {
            throw DuplicateKeyException(error);
        }
        throw DatabaseException(error, state);
    }

    return res;
}

Json::Value PostgreSQLQueryExecutor::pgResultToJson(PGresult* res)
{
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            row[fieldName] = convertValue(PQgetvalue(res, i, j), PQftype(res, j));
        }
        array.append(row);
    }

    return array;
}

} // namespace common
