/**
 * @file case_code.h
 * @brief Master case code (GTIN-14) derivation
 */

#pragma once

#include <string>
#include "types.h"

namespace gs1::checkdigit {

/**
 * @brief Derive the master case code for a GTIN
 *
 * Result is MASTER_CASE_CODE_PREFIX + gtin followed by the check digit computed
 * over that extended string. An 11-digit GTIN yields a 14-digit code:
 *
 * @code
 *   computeMasterCaseCode("04210000526");  // "10042100005261"
 * @endcode
 *
 * The result is always gtin.size() + 3 characters long.
 *
 * @param gtin Raw GTIN without check digit
 * @return Master case code
 * @throws InvalidInputError if gtin is empty or contains a non-digit
 */
std::string computeMasterCaseCode(const std::string& gtin);

} // namespace gs1::checkdigit
