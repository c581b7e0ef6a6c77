#pragma once

#include <string>
#include <vector>
#include <memory>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query Executor Interface
 *
 * Repositories execute SQL through this interface instead of calling libpq
 * directly. Results come back as JSON so repository code stays free of
 * PGresult handling and can be tested against a fake executor.
 *
 * Parameter binding: an empty std::string is sent as SQL NULL, not as ''.
 * A predicate such as "WHERE gtin = $1" never matches NULL, so a lookup with
 * an empty key returns no rows instead of failing. Callers that need to tell
 * "empty key" apart from "not found" must check the key themselves.
 */

namespace common {

class IDbConnectionPool;

/**
 * @brief Query Executor Interface
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute SELECT query and return results as JSON array
     *
     * @param query SQL query string with $1, $2 placeholders
     * @param params Query parameters (empty string binds NULL)
     * @return Json::Value Array of result rows, each row an object of column name-value pairs
     *
     * Example result:
     * [
     *   {"gtin": "04210000526", "check_digit": "4", "master_case_code": "10042100005261"}
     * ]
     *
     * @throws DatabaseException on query execution failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE command
     *
     * @return Number of affected rows
     * @throws DuplicateKeyException on unique/primary key violation
     * @throws DatabaseException on any other failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute query and return single scalar value
     *
     * Example: executeScalar("SELECT COUNT(*) FROM gtin") -> 42
     *
     * @throws DatabaseException if query fails, returns no rows or multiple columns
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Get database type (for diagnostic purposes)
     */
    virtual std::string getDatabaseType() const = 0;
};

/**
 * @brief Create the QueryExecutor matching the pool's database type
 *
 * @throws std::invalid_argument if pool is nullptr
 * @throws std::runtime_error if pool type is unsupported
 */
std::unique_ptr<IQueryExecutor> createQueryExecutor(IDbConnectionPool* pool);

} // namespace common
