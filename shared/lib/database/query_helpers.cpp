/**
 * @file query_helpers.cpp
 * @brief SQL helper utilities implementation
 */

#include "query_helpers.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace common::db {

int scalarToInt(const Json::Value& value, int defaultValue) {
    if (value.isNull()) return defaultValue;
    if (value.isInt()) return value.asInt();
    if (value.isUInt()) return static_cast<int>(value.asUInt());
    if (value.isString()) {
        const std::string str = value.asString();
        if (str.empty()) return defaultValue;
        errno = 0;
        char* end = nullptr;
        long parsed = std::strtol(str.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
            return defaultValue;
        }
        return static_cast<int>(parsed);
    }
    if (value.isDouble()) return static_cast<int>(value.asDouble());
    return defaultValue;
}

std::string getString(const Json::Value& row, const std::string& field,
                      const std::string& defaultValue) {
    if (!row.isObject() || !row.isMember(field) || row[field].isNull()) {
        return defaultValue;
    }
    return row[field].asString();
}

std::string paginationClause(int limit, int offset) {
    return " LIMIT " + std::to_string(std::max(limit, 0)) +
           " OFFSET " + std::to_string(std::max(offset, 0));
}

} // namespace common::db
