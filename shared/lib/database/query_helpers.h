#pragma once

#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief SQL helper utilities shared by repositories
 *
 * Usage:
 *   #include "query_helpers.h"
 *   int total = common::db::scalarToInt(executor_->executeScalar("SELECT COUNT(*) FROM gtin"));
 *   query += common::db::paginationClause(limit, offset);
 */

namespace common::db {

/**
 * @brief Convert a scalar JSON value to integer
 *
 * Handles int, uint, string and double values as returned by
 * IQueryExecutor::executeScalar().
 *
 * @param value Scalar JSON value
 * @param defaultValue Default if null or unparseable
 */
int scalarToInt(const Json::Value& value, int defaultValue = 0);

/**
 * @brief Extract a string column from a result row
 * @return Column value, or defaultValue if missing or null
 */
std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue = "");

/**
 * @brief Build pagination clause
 *
 * Negative values are clamped to 0.
 *
 * @return " LIMIT 10 OFFSET 0"
 */
std::string paginationClause(int limit, int offset);

} // namespace common::db
