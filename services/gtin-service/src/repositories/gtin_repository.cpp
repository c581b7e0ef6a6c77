/** @file gtin_repository.cpp
 *  @brief GtinRepository implementation
 */

#include "gtin_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace repositories {

GtinRepository::GtinRepository(common::IQueryExecutor* executor)
    : executor_(executor)
{
    if (!executor_) {
        throw std::invalid_argument("GtinRepository: executor cannot be nullptr");
    }
    spdlog::debug("[GtinRepository] Initialized (DB type: {})", executor_->getDatabaseType());
}

GtinRepository::~GtinRepository() {}

void GtinRepository::insert(const domain::models::GtinRecord& record) {
    try {
        const char* query =
            "INSERT INTO gtin (gtin, check_digit, master_case_code) "
            "VALUES ($1, $2, $3)";

        std::vector<std::string> params = {
            record.gtin,
            std::string(1, record.checkDigit),
            record.masterCaseCode
        };

        int rowsAffected = executor_->executeCommand(query, params);
        if (rowsAffected == 0) {
            throw std::runtime_error("Insert failed: no rows affected");
        }

        spdlog::info("[GtinRepository] Inserted: gtin={}, check_digit={}, master_case_code={}",
                     record.gtin, record.checkDigit, record.masterCaseCode);

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] Insert failed for {}: {}", record.gtin, e.what());
        throw;
    }
}

bool GtinRepository::update(const std::string& currentGtin, const domain::models::GtinRecord& record) {
    try {
        const char* query =
            "UPDATE gtin SET gtin = $1, check_digit = $2, master_case_code = $3 "
            "WHERE gtin = $4";

        std::vector<std::string> params = {
            record.gtin,
            std::string(1, record.checkDigit),
            record.masterCaseCode,
            currentGtin
        };

        int rowsAffected = executor_->executeCommand(query, params);
        if (rowsAffected == 0) {
            spdlog::debug("[GtinRepository] Update matched no row: {}", currentGtin);
            return false;
        }

        spdlog::info("[GtinRepository] Updated: {} -> gtin={}, check_digit={}, master_case_code={}",
                     currentGtin, record.gtin, record.checkDigit, record.masterCaseCode);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] Update failed for {}: {}", currentGtin, e.what());
        throw;
    }
}

std::optional<domain::models::GtinRecord> GtinRepository::findByGtin(const std::string& gtin) {
    return findOne("gtin", gtin);
}

std::optional<domain::models::GtinRecord> GtinRepository::findByMasterCaseCode(
    const std::string& masterCaseCode) {
    return findOne("master_case_code", masterCaseCode);
}

std::vector<domain::models::GtinRecord> GtinRepository::findAll(int limit, int offset) {
    try {
        std::string query =
            "SELECT gtin, check_digit, master_case_code FROM gtin ORDER BY gtin";
        query += common::db::paginationClause(limit, offset);

        Json::Value result = executor_->executeQuery(query);

        std::vector<domain::models::GtinRecord> records;
        if (result.isArray()) {
            records.reserve(result.size());
            for (const auto& row : result) {
                records.push_back(jsonToModel(row));
            }
        }
        return records;

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] findAll failed: {}", e.what());
        throw;
    }
}

int GtinRepository::countAll() {
    try {
        Json::Value result = executor_->executeScalar("SELECT COUNT(*) FROM gtin");
        return common::db::scalarToInt(result);

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] countAll failed: {}", e.what());
        throw;
    }
}

bool GtinRepository::remove(const std::string& gtin) {
    try {
        std::vector<std::string> params = { gtin };
        int rowsAffected = executor_->executeCommand("DELETE FROM gtin WHERE gtin = $1", params);

        if (rowsAffected > 0) {
            spdlog::info("[GtinRepository] Deleted: {}", gtin);
            return true;
        }
        return false;

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] Delete failed for {}: {}", gtin, e.what());
        throw;
    }
}

// --- Private Helpers ---

std::optional<domain::models::GtinRecord> GtinRepository::findOne(
    const std::string& column, const std::string& value) {
    try {
        std::string query =
            "SELECT gtin, check_digit, master_case_code FROM gtin WHERE " + column + " = $1";

        std::vector<std::string> params = { value };
        Json::Value result = executor_->executeQuery(query, params);

        if (result.isArray() && result.size() > 0) {
            return jsonToModel(result[0]);
        }
        return std::nullopt;

    } catch (const std::exception& e) {
        spdlog::error("[GtinRepository] Lookup by {} failed: {}", column, e.what());
        throw;
    }
}

domain::models::GtinRecord GtinRepository::jsonToModel(const Json::Value& row) {
    domain::models::GtinRecord record;

    record.gtin = common::db::getString(row, "gtin");
    std::string checkDigit = common::db::getString(row, "check_digit");
    record.checkDigit = checkDigit.empty() ? '\0' : checkDigit[0];
    record.masterCaseCode = common::db::getString(row, "master_case_code");

    return record;
}

} // namespace repositories
