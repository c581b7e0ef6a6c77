/**
 * @file gtin_repository_test.cpp
 * @brief Unit tests for GtinRepository
 *
 * Verifies SQL shape, parameter binding and result mapping against a
 * scripted query executor.
 */

#include <gtest/gtest.h>
#include <memory>
#include "repositories/gtin_repository.h"
#include "test_helpers.h"

namespace {

class GtinRepositoryTest : public ::testing::Test {
protected:
    test_helpers::FakeQueryExecutor executor_;
    std::unique_ptr<repositories::GtinRepository> repository_;

    void SetUp() override {
        repository_ = std::make_unique<repositories::GtinRepository>(&executor_);
    }

    static domain::models::GtinRecord createTestRecord() {
        domain::models::GtinRecord record;
        record.gtin = "04210000526";
        record.checkDigit = '4';
        record.masterCaseCode = "10042100005261";
        return record;
    }

    static Json::Value createRow(const std::string& gtin,
                                 const std::string& checkDigit,
                                 const std::string& caseCode) {
        Json::Value row;
        row["gtin"] = gtin;
        row["check_digit"] = checkDigit;
        row["master_case_code"] = caseCode;
        return row;
    }
};

// --- Construction ---

TEST_F(GtinRepositoryTest, NullExecutorThrows) {
    EXPECT_THROW({ repositories::GtinRepository repo(nullptr); }, std::invalid_argument);
}

// --- INSERT Tests ---

TEST_F(GtinRepositoryTest, InsertBindsAllThreeColumns) {
    // Act
    repository_->insert(createTestRecord());

    // Assert
    ASSERT_EQ(executor_.calls.size(), 1u);
    const auto& call = executor_.lastCall();
    EXPECT_EQ(call.kind, "command");
    EXPECT_NE(call.query.find("INSERT INTO gtin (gtin, check_digit, master_case_code)"), std::string::npos);
    ASSERT_EQ(call.params.size(), 3u);
    EXPECT_EQ(call.params[0], "04210000526");
    EXPECT_EQ(call.params[1], "4");
    EXPECT_EQ(call.params[2], "10042100005261");
}

TEST_F(GtinRepositoryTest, InsertWithNoAffectedRowsThrows) {
    executor_.affectedRows = 0;
    EXPECT_THROW(repository_->insert(createTestRecord()), std::runtime_error);
}

TEST_F(GtinRepositoryTest, InsertPropagatesDuplicateKey) {
    executor_.throwDuplicate = true;
    EXPECT_THROW(repository_->insert(createTestRecord()), common::DuplicateKeyException);
}

// --- UPDATE Tests ---

TEST_F(GtinRepositoryTest, UpdateKeysOnCurrentGtin) {
    // Arrange
    domain::models::GtinRecord record;
    record.gtin = "19147056187";
    record.checkDigit = '7';
    record.masterCaseCode = "10191470561874";

    // Act
    bool updated = repository_->update("04210000526", record);

    // Assert
    EXPECT_TRUE(updated);
    const auto& call = executor_.lastCall();
    EXPECT_NE(call.query.find("UPDATE gtin SET gtin = $1, check_digit = $2, master_case_code = $3"),
              std::string::npos);
    EXPECT_NE(call.query.find("WHERE gtin = $4"), std::string::npos);
    ASSERT_EQ(call.params.size(), 4u);
    EXPECT_EQ(call.params[0], "19147056187");
    EXPECT_EQ(call.params[1], "7");
    EXPECT_EQ(call.params[2], "10191470561874");
    EXPECT_EQ(call.params[3], "04210000526");
}

TEST_F(GtinRepositoryTest, UpdateMissingRowReturnsFalse) {
    executor_.affectedRows = 0;
    EXPECT_FALSE(repository_->update("99999999999", createTestRecord()));
}

TEST_F(GtinRepositoryTest, UpdatePropagatesDatabaseError) {
    executor_.throwDatabaseError = true;
    try {
        repository_->update("04210000526", createTestRecord());
        FAIL() << "expected DatabaseException";
    } catch (const common::DatabaseException& e) {
        EXPECT_EQ(e.sqlState(), "08006");
    }
}

// --- FIND Tests ---

TEST_F(GtinRepositoryTest, FindByGtinMapsRow) {
    // Arrange
    executor_.queryResult.append(createRow("04210000526", "4", "10042100005261"));

    // Act
    auto result = repository_->findByGtin("04210000526");

    // Assert
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, createTestRecord());
    EXPECT_NE(executor_.lastCall().query.find("WHERE gtin = $1"), std::string::npos);
    EXPECT_EQ(executor_.lastCall().params, std::vector<std::string>{"04210000526"});
}

TEST_F(GtinRepositoryTest, FindByGtinNotFound) {
    EXPECT_FALSE(repository_->findByGtin("00000000000").has_value());
}

TEST_F(GtinRepositoryTest, FindByEmptyGtinPassesEmptyParameter) {
    // The executor binds the empty string as NULL; no row can match
    auto result = repository_->findByGtin("");

    EXPECT_FALSE(result.has_value());
    ASSERT_EQ(executor_.lastCall().params.size(), 1u);
    EXPECT_TRUE(executor_.lastCall().params[0].empty());
}

TEST_F(GtinRepositoryTest, FindByMasterCaseCodeUsesCaseCodeColumn) {
    executor_.queryResult.append(createRow("04210000526", "4", "10042100005261"));

    auto result = repository_->findByMasterCaseCode("10042100005261");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->gtin, "04210000526");
    EXPECT_NE(executor_.lastCall().query.find("WHERE master_case_code = $1"), std::string::npos);
}

TEST_F(GtinRepositoryTest, NullCheckDigitMapsToNulChar) {
    Json::Value row = createRow("04210000526", "4", "10042100005261");
    row["check_digit"] = Json::Value(Json::nullValue);
    executor_.queryResult.append(row);

    auto result = repository_->findByGtin("04210000526");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->checkDigit, '\0');
}

TEST_F(GtinRepositoryTest, FindAllAppendsPagination) {
    // Arrange
    executor_.queryResult.append(createRow("04210000526", "4", "10042100005261"));
    executor_.queryResult.append(createRow("19147056187", "7", "10191470561874"));

    // Act
    auto records = repository_->findAll(10, 20);

    // Assert
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].gtin, "19147056187");
    const auto& query = executor_.lastCall().query;
    EXPECT_NE(query.find("ORDER BY gtin LIMIT 10 OFFSET 20"), std::string::npos);
}

TEST_F(GtinRepositoryTest, CountAllParsesScalar) {
    executor_.scalarResult = Json::Value("42");
    EXPECT_EQ(repository_->countAll(), 42);
    EXPECT_EQ(executor_.lastCall().kind, "scalar");
}

// --- DELETE Tests ---

TEST_F(GtinRepositoryTest, RemoveReportsAffectedRows) {
    EXPECT_TRUE(repository_->remove("04210000526"));

    executor_.affectedRows = 0;
    EXPECT_FALSE(repository_->remove("04210000526"));

    EXPECT_NE(executor_.lastCall().query.find("DELETE FROM gtin WHERE gtin = $1"), std::string::npos);
}

} // anonymous namespace
