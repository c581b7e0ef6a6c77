/**
 * @file gtin_service.cpp
 * @brief GtinService implementation
 */

#include "gtin_service.h"
#include <gs1/checkdigit/check_digit.h>
#include <gs1/checkdigit/case_code.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace services {

GtinService::GtinService(repositories::GtinRepository* gtinRepo)
    : gtinRepo_(gtinRepo)
{
    if (!gtinRepo_) {
        throw std::invalid_argument("GtinService: gtinRepo cannot be nullptr");
    }
    spdlog::debug("[GtinService] Initialized");
}

// ============================================================================
// Derivation
// ============================================================================

domain::models::GtinRecord GtinService::deriveRecord(const std::string& gtin) const {
    domain::models::GtinRecord record;
    record.gtin = gtin;
    record.checkDigit = gs1::checkdigit::computeCheckDigit(gtin);
    record.masterCaseCode = gs1::checkdigit::computeMasterCaseCode(gtin);
    return record;
}

bool GtinService::isConsistent(const domain::models::GtinRecord& record) const {
    if (!gs1::checkdigit::isDigitString(record.gtin)) {
        return false;
    }
    return deriveRecord(record.gtin) == record;
}

// ============================================================================
// Writes
// ============================================================================

domain::models::GtinRecord GtinService::registerGtin(const std::string& gtin) {
    domain::models::GtinRecord record = deriveRecord(gtin);

    gtinRepo_->insert(record);

    spdlog::info("[GtinService] Registered GTIN {} (check digit {}, master case code {})",
                 record.gtin, record.checkDigit, record.masterCaseCode);
    return record;
}

std::optional<domain::models::GtinRecord> GtinService::changeGtin(
    const std::string& currentGtin,
    const std::string& newGtin)
{
    domain::models::GtinRecord record = deriveRecord(newGtin);

    if (!gtinRepo_->update(currentGtin, record)) {
        spdlog::warn("[GtinService] Cannot change GTIN {}: not found", currentGtin);
        return std::nullopt;
    }

    spdlog::info("[GtinService] Changed GTIN {} -> {}", currentGtin, newGtin);
    return record;
}

std::optional<domain::models::GtinRecord> GtinService::refreshDerivedValues(const std::string& gtin) {
    domain::models::GtinRecord record = deriveRecord(gtin);

    if (!gtinRepo_->update(gtin, record)) {
        spdlog::warn("[GtinService] Cannot refresh GTIN {}: not found", gtin);
        return std::nullopt;
    }

    spdlog::debug("[GtinService] Refreshed derived values for {}", gtin);
    return record;
}

bool GtinService::removeGtin(const std::string& gtin) {
    return gtinRepo_->remove(gtin);
}

// ============================================================================
// Reads
// ============================================================================

std::optional<domain::models::GtinRecord> GtinService::findByGtin(const std::string& gtin) {
    auto record = gtinRepo_->findByGtin(gtin);
    if (record && !isConsistent(*record)) {
        spdlog::warn("[GtinService] Stored derived values for {} do not match recomputed values", gtin);
    }
    return record;
}

std::optional<domain::models::GtinRecord> GtinService::findByMasterCaseCode(
    const std::string& masterCaseCode) {
    return gtinRepo_->findByMasterCaseCode(masterCaseCode);
}

std::vector<domain::models::GtinRecord> GtinService::listGtins(int limit, int offset) {
    if (limit <= 0) {
        throw std::invalid_argument("GtinService: limit must be positive");
    }
    if (offset < 0) {
        throw std::invalid_argument("GtinService: offset cannot be negative");
    }
    return gtinRepo_->findAll(limit, offset);
}

int GtinService::countGtins() {
    return gtinRepo_->countAll();
}

} // namespace services
