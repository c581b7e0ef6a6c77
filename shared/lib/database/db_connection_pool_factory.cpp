/**
 * @file db_connection_pool_factory.cpp
 * @brief Database Connection Pool Factory Implementation
 */

#include "db_connection_pool_factory.h"
#include "db_connection_pool.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace common {

namespace {

/// Quote a libpq keyword value ('...' with \' and \\ escaped)
std::string quoteConnValue(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += "'";
    return out;
}

} // anonymous namespace

// --- DbPoolConfig ---

std::string DbPoolConfig::buildPostgresConnString() const {
    std::ostringstream oss;
    oss << "host=" << quoteConnValue(pgHost)
        << " port=" << pgPort
        << " dbname=" << quoteConnValue(pgDatabase)
        << " user=" << quoteConnValue(pgUser)
        << " password=" << quoteConnValue(pgPassword);

    if (!clientEncoding.empty()) {
        oss << " client_encoding=" << quoteConnValue(clientEncoding);
    }
    if (!timeZone.empty()) {
        oss << " options=" << quoteConnValue("-c TimeZone=" + timeZone);
    }
    return oss.str();
}

// --- DbConnectionPoolFactory ---

std::shared_ptr<IDbConnectionPool> DbConnectionPoolFactory::create(const DbPoolConfig& config) {
    std::string normalizedType = normalizeDbType(config.dbType);

    if (normalizedType == "postgres") {
        return std::make_shared<DbConnectionPool>(
            config.buildPostgresConnString(),
            config.minSize,
            config.maxSize,
            config.acquireTimeoutSec
        );
    }

    throw std::runtime_error("Unsupported database type: " + config.dbType);
}

bool DbConnectionPoolFactory::isSupported(const std::string& dbType) {
    return normalizeDbType(dbType) == "postgres";
}

std::vector<std::string> DbConnectionPoolFactory::getSupportedTypes() {
    return {"postgres", "postgresql", "pg"};
}

std::string DbConnectionPoolFactory::normalizeDbType(const std::string& dbType) {
    std::string lower = dbType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "postgres" || lower == "postgresql" || lower == "pg") {
        return "postgres";
    }
    return lower;
}

} // namespace common
