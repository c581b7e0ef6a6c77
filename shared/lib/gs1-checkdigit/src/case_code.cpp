/**
 * @file case_code.cpp
 * @brief Master case code derivation implementation
 */

#include "gs1/checkdigit/case_code.h"
#include "gs1/checkdigit/check_digit.h"

namespace gs1::checkdigit {

std::string computeMasterCaseCode(const std::string& gtin) {
    // Validate the caller's GTIN, not the prefixed string, so the error names the input
    if (!isDigitString(gtin)) {
        throw InvalidInputError("GTIN must be a non-empty string of digits: '" + gtin + "'");
    }

    std::string extended = std::string(MASTER_CASE_CODE_PREFIX) + gtin;
    return extended + computeCheckDigit(extended);
}

} // namespace gs1::checkdigit
