#pragma once

#include <string>
#include <vector>
#include <optional>
#include "../domain/models/gtin_record.h"
#include "../repositories/gtin_repository.h"

/**
 * @file gtin_service.h
 * @brief GTIN Service - write path for the gtin table
 *
 * Computes the check digit and master case code before every insert or
 * update, so stored derived columns always match the stored GTIN.
 *
 * Responsibilities:
 * - Derive check digit and master case code (gs1::checkdigit)
 * - Insert new GTINs, re-key existing ones, refresh derived columns
 * - Lookups and listing
 *
 * Invalid identifiers raise gs1::checkdigit::InvalidInputError before any
 * repository call, so a rejected identifier never reaches the database.
 */

namespace services {

class GtinService {
public:
    /**
     * @param gtinRepo GTIN repository (non-owning pointer)
     * @throws std::invalid_argument if gtinRepo is nullptr
     */
    explicit GtinService(repositories::GtinRepository* gtinRepo);

    ~GtinService() = default;

    // ========================================================================
    // Derivation
    // ========================================================================

    /**
     * @brief Build the record to persist for a raw GTIN
     *
     * Both derived fields are computed from the raw GTIN; the master case
     * code does not reuse the GTIN's own check digit.
     *
     * @throws gs1::checkdigit::InvalidInputError
     */
    domain::models::GtinRecord deriveRecord(const std::string& gtin) const;

    /**
     * @brief true if the stored derived fields equal the recomputed ones
     *
     * Returns false for records whose gtin is not a valid digit string.
     */
    bool isConsistent(const domain::models::GtinRecord& record) const;

    // ========================================================================
    // Writes
    // ========================================================================

    /**
     * @brief Derive and insert a new GTIN
     * @return The stored record
     * @throws gs1::checkdigit::InvalidInputError
     * @throws common::DuplicateKeyException if the GTIN or its master case code exists
     */
    domain::models::GtinRecord registerGtin(const std::string& gtin);

    /**
     * @brief Replace currentGtin by newGtin, recomputing both derived fields
     * @return The stored record, or std::nullopt if currentGtin does not exist
     * @throws gs1::checkdigit::InvalidInputError if newGtin is invalid
     */
    std::optional<domain::models::GtinRecord> changeGtin(
        const std::string& currentGtin,
        const std::string& newGtin);

    /**
     * @brief Recompute and rewrite the derived fields of an existing GTIN
     * @return The stored record, or std::nullopt if gtin does not exist
     */
    std::optional<domain::models::GtinRecord> refreshDerivedValues(const std::string& gtin);

    /**
     * @return false if gtin does not exist
     */
    bool removeGtin(const std::string& gtin);

    // ========================================================================
    // Reads
    // ========================================================================

    std::optional<domain::models::GtinRecord> findByGtin(const std::string& gtin);

    std::optional<domain::models::GtinRecord> findByMasterCaseCode(const std::string& masterCaseCode);

    std::vector<domain::models::GtinRecord> listGtins(int limit = 100, int offset = 0);

    int countGtins();

private:
    repositories::GtinRepository* gtinRepo_;
};

} // namespace services
