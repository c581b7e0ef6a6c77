/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and runtime overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Lookup order: values set at runtime (or captured from the environment at
 * construction), then the live environment, then the caller's default.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values are logged and replaced by defaultValue.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove a runtime value (environment lookup still applies)
     */
    void remove(const std::string& key);

    /**
     * @brief Capture the predefined keys from the environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    // Database
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_POOL_MIN = "DB_POOL_MIN";
    static constexpr const char* DB_POOL_MAX = "DB_POOL_MAX";
    static constexpr const char* DB_POOL_TIMEOUT = "DB_POOL_TIMEOUT";

    // Database session
    static constexpr const char* DB_TIMEZONE = "DB_TIMEZONE";
    static constexpr const char* DB_CLIENT_ENCODING = "DB_CLIENT_ENCODING";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
