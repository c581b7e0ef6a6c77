#pragma once

/**
 * @file gtin_record.h
 * @brief GtinRecord domain model (one row of the gtin table)
 *
 * checkDigit and masterCaseCode are derived from gtin by the service layer
 * before every write and are never set independently.
 */

#include <string>

namespace domain {
namespace models {

struct GtinRecord {
    std::string gtin;            // Raw identifier without check digit (primary key)
    char checkDigit = '\0';      // computeCheckDigit(gtin)
    std::string masterCaseCode;  // computeMasterCaseCode(gtin), unique

    bool operator==(const GtinRecord& other) const {
        return gtin == other.gtin &&
               checkDigit == other.checkDigit &&
               masterCaseCode == other.masterCaseCode;
    }

    bool operator!=(const GtinRecord& other) const {
        return !(*this == other);
    }
};

} // namespace models
} // namespace domain
