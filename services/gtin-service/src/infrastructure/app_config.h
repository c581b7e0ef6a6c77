#pragma once

/**
 * @file app_config.h
 * @brief GTIN Service application configuration
 *
 * Loaded through common::ConfigManager (environment variables or values set
 * at runtime).
 */

#include <string>
#include <spdlog/spdlog.h>
#include "config_manager.h"
#include "db_connection_pool_factory.h"
#include "exceptions.h"

struct AppConfig {
    std::string dbHost = "localhost";
    int dbPort = 5432;
    std::string dbName = "gtin";
    std::string dbUser = "gtin";
    std::string dbPassword;

    int dbPoolMin = 1;
    int dbPoolMax = 4;
    int dbPoolTimeoutSec = 5;

    // Session settings applied to every pooled connection
    std::string dbTimeZone = "+00:00";
    std::string dbClientEncoding = "UTF8";

    std::string logLevel = "info";
    std::string logFile;

    static AppConfig fromEnvironment() {
        using common::ConfigManager;
        const ConfigManager& cfg = ConfigManager::getInstance();
        AppConfig config;

        config.dbHost = cfg.getString(ConfigManager::DB_HOST, config.dbHost);
        config.dbPort = cfg.getInt(ConfigManager::DB_PORT, config.dbPort);
        config.dbName = cfg.getString(ConfigManager::DB_NAME, config.dbName);
        config.dbUser = cfg.getString(ConfigManager::DB_USER, config.dbUser);
        config.dbPassword = cfg.getString(ConfigManager::DB_PASSWORD);

        config.dbPoolMin = cfg.getInt(ConfigManager::DB_POOL_MIN, config.dbPoolMin);
        config.dbPoolMax = cfg.getInt(ConfigManager::DB_POOL_MAX, config.dbPoolMax);
        config.dbPoolTimeoutSec = cfg.getInt(ConfigManager::DB_POOL_TIMEOUT, config.dbPoolTimeoutSec);

        config.dbTimeZone = cfg.getString(ConfigManager::DB_TIMEZONE, config.dbTimeZone);
        config.dbClientEncoding = cfg.getString(ConfigManager::DB_CLIENT_ENCODING, config.dbClientEncoding);

        config.logLevel = cfg.getString(ConfigManager::LOG_LEVEL, config.logLevel);
        config.logFile = cfg.getString(ConfigManager::LOG_FILE);

        return config;
    }

    /**
     * @throws common::ConfigException if a required credential is missing
     *         or the pool bounds are inconsistent
     */
    void validateRequiredCredentials() const {
        if (dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        if (dbPoolMin < 0 || dbPoolMax < 1 || dbPoolMin > dbPoolMax) {
            throw common::ConfigException("invalid pool bounds DB_POOL_MIN=" + std::to_string(dbPoolMin) +
                                          " DB_POOL_MAX=" + std::to_string(dbPoolMax));
        }
        spdlog::info("All required credentials loaded from environment");
    }

    common::DbPoolConfig toPoolConfig() const {
        common::DbPoolConfig pool;
        pool.dbType = "postgres";
        pool.minSize = static_cast<size_t>(dbPoolMin);
        pool.maxSize = static_cast<size_t>(dbPoolMax);
        pool.acquireTimeoutSec = dbPoolTimeoutSec;
        pool.pgHost = dbHost;
        pool.pgPort = dbPort;
        pool.pgDatabase = dbName;
        pool.pgUser = dbUser;
        pool.pgPassword = dbPassword;
        pool.timeZone = dbTimeZone;
        pool.clientEncoding = dbClientEncoding;
        return pool;
    }
};
