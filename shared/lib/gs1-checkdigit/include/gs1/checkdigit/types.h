/**
 * @file types.h
 * @brief Common types for the GS1 check digit library
 *
 * Error type and constants shared by the check digit and case code modules.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace gs1::checkdigit {

/// @brief Prefix concatenated in front of a GTIN to form the master case code
constexpr const char* MASTER_CASE_CODE_PREFIX = "10";

/**
 * @brief Input is empty or contains a character other than '0'..'9'
 *
 * Raised synchronously by every operation in this library. No partial result
 * is ever produced.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace gs1::checkdigit
