/**
 * @file check_digit.h
 * @brief GS1 modulo-10 check digit calculation
 *
 * Works for every GS1 key that uses the standard check digit: GTIN-8 (7 input
 * digits) up to SSCC (17 input digits). Input length is not validated against
 * the GS1 identifier classes; any non-empty digit string is accepted.
 */

#pragma once

#include <string>
#include "types.h"

namespace gs1::checkdigit {

/**
 * @brief Compute the check digit to append to a GS1 identifier
 *
 * Algorithm:
 * 1. Number the digits from the right, starting at position 0
 * 2. Sum digits at even positions (weight 3) and odd positions (weight 1)
 * 3. Check digit = (10 - total % 10) % 10
 *
 * @code
 *   char cd = computeCheckDigit("05042829526");  // '7'
 * @endcode
 *
 * @param base Identifier without check digit (ASCII digits only)
 * @return Check digit character '0'..'9'
 * @throws InvalidInputError if base is empty or contains a non-digit
 */
char computeCheckDigit(const std::string& base);

/**
 * @brief Return base with its check digit appended
 * @throws InvalidInputError if base is empty or contains a non-digit
 */
std::string appendCheckDigit(const std::string& base);

/**
 * @brief Verify the trailing check digit of a complete identifier
 *
 * @param identifier Identifier including its check digit (at least 2 digits)
 * @return true if the last digit matches the digit computed over the rest
 * @throws InvalidInputError if identifier has fewer than 2 characters or a non-digit
 */
bool hasValidCheckDigit(const std::string& identifier);

/// @brief true if value is non-empty and every character is '0'..'9'
bool isDigitString(const std::string& value);

} // namespace gs1::checkdigit
