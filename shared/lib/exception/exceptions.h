/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exception types for the persistence and configuration layers.
 * Input errors of the check digit library use gs1::checkdigit::InvalidInputError.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all GS1 GTIN service exceptions
 */
class Gs1Exception : public std::runtime_error {
public:
    explicit Gs1Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public Gs1Exception {
public:
    explicit DatabaseException(const std::string& message, const std::string& sqlState = "")
        : Gs1Exception("Database error: " + message), sqlState_(sqlState) {}

    /**
     * @brief PostgreSQL SQLSTATE code (empty if unavailable)
     */
    const std::string& sqlState() const { return sqlState_; }

private:
    std::string sqlState_;
};

/**
 * @brief Primary key or unique constraint violated (SQLSTATE 23505)
 */
class DuplicateKeyException : public DatabaseException {
public:
    explicit DuplicateKeyException(const std::string& message)
        : DatabaseException(message, "23505") {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public Gs1Exception {
public:
    explicit ConfigException(const std::string& message)
        : Gs1Exception("Configuration error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public Gs1Exception {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : Gs1Exception(poolType + " connection pool exhausted") {}
};

} // namespace common
