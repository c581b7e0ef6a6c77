#pragma once

/**
 * @file gtin_repository.h
 * @brief Repository for the gtin table
 *
 * Expected table shape (DDL is owned by the database deployment):
 *   gtin              VARCHAR(11)  PRIMARY KEY
 *   check_digit       CHAR(1)      NOT NULL
 *   master_case_code  VARCHAR(14)  NOT NULL UNIQUE
 *
 * The repository stores what it is given. Derived columns are computed by
 * services::GtinService before insert() or update() is called.
 */

#include <string>
#include <vector>
#include <optional>
#include <json/json.h>
#include "i_query_executor.h"
#include "../domain/models/gtin_record.h"

namespace repositories {

class GtinRepository {
public:
    /**
     * @param executor Query executor (non-owning)
     * @throws std::invalid_argument if executor is nullptr
     */
    explicit GtinRepository(common::IQueryExecutor* executor);
    ~GtinRepository();

    /**
     * @brief Insert a new record
     * @throws common::DuplicateKeyException if gtin or master_case_code already exists
     * @throws common::DatabaseException on any other failure
     */
    void insert(const domain::models::GtinRecord& record);

    /**
     * @brief Rewrite the row identified by currentGtin with all three columns of record
     * @return false if no row matched currentGtin
     * @throws common::DuplicateKeyException if the new key collides with another row
     */
    bool update(const std::string& currentGtin, const domain::models::GtinRecord& record);

    std::optional<domain::models::GtinRecord> findByGtin(const std::string& gtin);

    std::optional<domain::models::GtinRecord> findByMasterCaseCode(const std::string& masterCaseCode);

    /**
     * @brief Page through all records ordered by gtin
     */
    std::vector<domain::models::GtinRecord> findAll(int limit = 100, int offset = 0);

    int countAll();

    /**
     * @return false if no row matched
     */
    bool remove(const std::string& gtin);

private:
    common::IQueryExecutor* executor_;

    std::optional<domain::models::GtinRecord> findOne(const std::string& column, const std::string& value);
    static domain::models::GtinRecord jsonToModel(const Json::Value& row);
};

} // namespace repositories
