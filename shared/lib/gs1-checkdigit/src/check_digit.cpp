/**
 * @file check_digit.cpp
 * @brief GS1 check digit implementation
 *
 * Formula: https://www.gs1.org/services/how-calculate-check-digit-manually
 */

#include "gs1/checkdigit/check_digit.h"

#include <cstdint>

namespace gs1::checkdigit {

namespace {

void requireDigits(const std::string& value, const char* name) {
    if (value.empty()) {
        throw InvalidInputError(std::string(name) + " is empty");
    }
    for (size_t i = 0; i < value.size(); i++) {
        if (value[i] < '0' || value[i] > '9') {
            throw InvalidInputError(std::string(name) + " contains non-digit character at position " +
                                    std::to_string(i) + ": '" + value + "'");
        }
    }
}

} // anonymous namespace

bool isDigitString(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

char computeCheckDigit(const std::string& base) {
    requireDigits(base, "Check digit base");

    // Position 0 is the rightmost digit
    uint64_t evens = 0;
    uint64_t odds = 0;
    const size_t len = base.size();
    for (size_t pos = 0; pos < len; pos++) {
        int digit = base[len - 1 - pos] - '0';
        if (pos % 2 == 0) {
            evens += digit;
        } else {
            odds += digit;
        }
    }

    uint64_t total = odds + 3 * evens;
    int cd = static_cast<int>(total % 10);
    if (cd != 0) {
        cd = 10 - cd;
    }

    return static_cast<char>('0' + cd);
}

std::string appendCheckDigit(const std::string& base) {
    return base + computeCheckDigit(base);
}

bool hasValidCheckDigit(const std::string& identifier) {
    requireDigits(identifier, "Identifier");
    if (identifier.size() < 2) {
        throw InvalidInputError("Identifier must contain at least one digit plus the check digit");
    }

    std::string base = identifier.substr(0, identifier.size() - 1);
    return computeCheckDigit(base) == identifier.back();
}

} // namespace gs1::checkdigit
