#include <gtest/gtest.h>
#include "../src/formats/duckdb_utils.hpp"
#include <cmath>
#include <limits>
#include <string>

// Test SQL string escaping
TEST(DuckDbUtilsTest, EscapeSqlString_NoSpecialChars) {
    EXPECT_EQ(DuckDbUtils::escapeSqlString("hello world"), "hello world");
}

TEST(DuckDbUtilsTest, EscapeSqlString_SingleQuotes) {
    EXPECT_EQ(DuckDbUtils::escapeSqlString("it's a test"), "it''s a test");
}

TEST(DuckDbUtilsTest, EscapeSqlString_BackslashesAreLiteral) {
    EXPECT_EQ(DuckDbUtils::escapeSqlString("c:\\temp\\'x'"), "c:\\temp\\''x''");
}

TEST(DuckDbUtilsTest, EscapeSqlString_EmptyString) {
    EXPECT_EQ(DuckDbUtils::escapeSqlString(""), "");
}

TEST(DuckDbUtilsTest, QuoteIdentifier) {
    EXPECT_EQ(DuckDbUtils::quoteIdentifier("id"), "\"id\"");
    EXPECT_EQ(DuckDbUtils::quoteIdentifier("we\"ird"), "\"we\"\"ird\"");
}

TEST(DuckDbUtilsTest, SqlType_Primitives) {
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::null()), "VARCHAR");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::boolean(true)), "BOOLEAN");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::int64(1)), "BIGINT");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::float64(1.5)), "DOUBLE");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::string("x")), "VARCHAR");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::bytes("x")), "BLOB");
}

TEST(DuckDbUtilsTest, SqlType_Nested) {
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::array({SinkValue::null(), SinkValue::int64(1)})), "BIGINT[]");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::array({})), "VARCHAR[]");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::structure({{"a", SinkValue::int64(1)}, {"b", SinkValue::string("x")}})),
              "STRUCT(\"a\" BIGINT, \"b\" VARCHAR)");
    EXPECT_EQ(DuckDbUtils::sqlType(SinkValue::map({{"k", SinkValue::float64(1.0)}})), "MAP(VARCHAR, DOUBLE)");
}

TEST(DuckDbUtilsTest, SqlLiteral_Primitives) {
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::null()), "NULL");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::boolean(false)), "FALSE");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::int64(-42)), "-42");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::float64(0.5)), "0.5::DOUBLE");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::string("it's")), "'it''s'");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::bytes(std::string("\x01\xff", 2))), "from_hex('01ff')");
}

TEST(DuckDbUtilsTest, SqlLiteral_NonFiniteDoubles) {
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::float64(std::numeric_limits<double>::quiet_NaN())), "'nan'::DOUBLE");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::float64(-std::numeric_limits<double>::infinity())), "'-inf'::DOUBLE");
}

TEST(DuckDbUtilsTest, SqlLiteral_Nested) {
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::array({SinkValue::int64(1), SinkValue::null()})), "[1, NULL]");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::structure({{"a", SinkValue::int64(1)}, {"b", SinkValue::string("x")}})),
              "{'a': 1, 'b': 'x'}");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::map({{"k1", SinkValue::int64(1)}, {"k2", SinkValue::int64(2)}})),
              "MAP(['k1', 'k2'], [1, 2])");
    EXPECT_EQ(DuckDbUtils::sqlLiteral(SinkValue::map({})), "MAP([], [])");
}

TEST(DuckDbUtilsTest, ToColumns) {
    auto columns = DuckDbUtils::toColumns(SinkValue::structure({{"a", SinkValue::int64(1)}}));
    ASSERT_EQ(columns.size(), 1u);
    EXPECT_EQ(columns[0].first, "a");

    columns = DuckDbUtils::toColumns(SinkValue::string("x"));
    ASSERT_EQ(columns.size(), 1u);
    EXPECT_EQ(columns[0].first, "value");
    EXPECT_EQ(columns[0].second, SinkValue::string("x"));
}

TEST(DuckDbUtilsTest, BuildInsertSQL) {
    std::string sql = DuckDbUtils::buildInsertSQL({"(1, 'a')", "(2, 'b')"}, "staging_0");
    EXPECT_EQ(sql, "INSERT INTO staging_0 VALUES (1, 'a'), (2, 'b');");
}

TEST(DuckDbUtilsTest, ExecuteReportsErrors) {
    DuckDB db(nullptr);
    Connection conn(db);
    std::string error;

    EXPECT_TRUE(DuckDbUtils::execute(conn, "CREATE TABLE t (id BIGINT);", error));
    EXPECT_FALSE(DuckDbUtils::execute(conn, "INSERT INTO missing VALUES (1);", error));
    EXPECT_FALSE(error.empty());
}

TEST(DuckDbUtilsTest, LiteralsRoundTripThroughDuckDb) {
    DuckDB db(nullptr);
    Connection conn(db);

    SinkValue value = SinkValue::structure({
        {"n", SinkValue::int64(7)},
        {"s", SinkValue::string("it's")},
        {"tags", SinkValue::array({SinkValue::string("a"), SinkValue::string("b")})},
    });
    std::string sql = "SELECT CAST(" + DuckDbUtils::sqlLiteral(value) + " AS " + DuckDbUtils::sqlType(value) + ").s";
    auto result = conn.Query(sql);
    ASSERT_FALSE(result->HasError()) << result->GetError();
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "it's");
}
