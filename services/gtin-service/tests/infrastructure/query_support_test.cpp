/**
 * @file query_support_test.cpp
 * @brief Unit tests for query helpers and PostgreSQL value conversion
 */

#include <gtest/gtest.h>
#include "query_helpers.h"
#include "postgresql_query_executor.h"
#include "exceptions.h"

namespace {

// --- scalarToInt ---

TEST(QueryHelpersTest, ScalarToIntHandlesEveryJsonKind) {
    EXPECT_EQ(common::db::scalarToInt(Json::Value(7)), 7);
    EXPECT_EQ(common::db::scalarToInt(Json::Value(7u)), 7);
    EXPECT_EQ(common::db::scalarToInt(Json::Value("123")), 123);
    EXPECT_EQ(common::db::scalarToInt(Json::Value(4.0)), 4);
    EXPECT_EQ(common::db::scalarToInt(Json::Value(static_cast<Json::Int64>(42))), 42);
}

TEST(QueryHelpersTest, ScalarToIntFallsBackToDefault) {
    EXPECT_EQ(common::db::scalarToInt(Json::Value(Json::nullValue), -1), -1);
    EXPECT_EQ(common::db::scalarToInt(Json::Value(""), -1), -1);
    EXPECT_EQ(common::db::scalarToInt(Json::Value("12abc"), -1), -1);
    EXPECT_EQ(common::db::scalarToInt(Json::Value("99999999999"), -1), -1);
}

// --- getString ---

TEST(QueryHelpersTest, GetStringMissingOrNullUsesDefault) {
    Json::Value row;
    row["gtin"] = "04210000526";
    row["check_digit"] = Json::Value(Json::nullValue);

    EXPECT_EQ(common::db::getString(row, "gtin"), "04210000526");
    EXPECT_EQ(common::db::getString(row, "check_digit", "?"), "?");
    EXPECT_EQ(common::db::getString(row, "master_case_code", "none"), "none");
    EXPECT_EQ(common::db::getString(Json::Value("scalar"), "gtin", "x"), "x");
}

// --- paginationClause ---

TEST(QueryHelpersTest, PaginationClauseClampsNegatives) {
    EXPECT_EQ(common::db::paginationClause(10, 0), " LIMIT 10 OFFSET 0");
    EXPECT_EQ(common::db::paginationClause(-5, -1), " LIMIT 0 OFFSET 0");
}

// --- PostgreSQLQueryExecutor::convertValue ---

TEST(PostgreSQLValueConversionTest, IntegerTypes) {
    Json::Value count = common::PostgreSQLQueryExecutor::convertValue("42", 20);  // INT8
    ASSERT_TRUE(count.isIntegral());
    EXPECT_EQ(count.asInt64(), 42);

    EXPECT_EQ(common::PostgreSQLQueryExecutor::convertValue("-7", 23).asInt(), -7);  // INT4
}

TEST(PostgreSQLValueConversionTest, FloatAndBool) {
    EXPECT_DOUBLE_EQ(common::PostgreSQLQueryExecutor::convertValue("1.5", 701).asDouble(), 1.5);
    EXPECT_TRUE(common::PostgreSQLQueryExecutor::convertValue("t", 16).asBool());
    EXPECT_FALSE(common::PostgreSQLQueryExecutor::convertValue("f", 16).asBool());
}

TEST(PostgreSQLValueConversionTest, CharColumnsStayStrings) {
    // check_digit is CHAR(1) (bpchar, OID 1042); a leading zero must survive
    Json::Value digit = common::PostgreSQLQueryExecutor::convertValue("0", 1042);
    ASSERT_TRUE(digit.isString());
    EXPECT_EQ(digit.asString(), "0");

    Json::Value gtin = common::PostgreSQLQueryExecutor::convertValue("04210000526", 1043);  // VARCHAR
    EXPECT_EQ(gtin.asString(), "04210000526");
}

// --- createQueryExecutor ---

TEST(QueryExecutorFactoryTest, NullPoolThrows) {
    EXPECT_THROW(common::createQueryExecutor(nullptr), std::invalid_argument);
}

TEST(QueryExecutorFactoryTest, PostgresPoolYieldsPostgresExecutor) {
    // minSize 0: nothing connects until a statement runs
    common::DbConnectionPool pool("host='127.0.0.1' port=1", 0, 1, 1);

    auto executor = common::createQueryExecutor(&pool);

    ASSERT_NE(executor, nullptr);
    EXPECT_EQ(executor->getDatabaseType(), "postgres");
}

TEST(QueryExecutorFactoryTest, UnreachableServerSurfacesDatabaseException) {
    common::DbConnectionPool pool("host='127.0.0.1' port=1", 0, 1, 1);
    auto executor = common::createQueryExecutor(&pool);

    EXPECT_THROW(executor->executeScalar("SELECT COUNT(*) FROM gtin"), common::DatabaseException);
}

} // anonymous namespace
