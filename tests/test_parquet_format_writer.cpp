#include <gtest/gtest.h>
#include "../src/formats/parquet_format_writer.hpp"
#include "../src/formats/duckdb_utils.hpp"
#include "../src/sink/sink_error.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

class ParquetFormatWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create in-memory DuckDB instance
        db_ = std::make_unique<DuckDB>(nullptr);
        dir_ = fs::temp_directory_path() /
               ("lakesink_parquet_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
    }

    void TearDown() override {
        db_.reset();
        fs::remove_all(dir_);
    }

    static MessageDetail record(int64_t id, const std::string& name) {
        MessageDetail detail;
        detail.value = SinkValue::structure({{"id", SinkValue::int64(id)}, {"name", SinkValue::string(name)}});
        return detail;
    }

    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::unique_ptr<DuckDB> db_;
    fs::path dir_;
};

TEST_F(ParquetFormatWriterTest, WritesReadableParquet) {
    std::string staged = path("nested/a.parquet");
    ParquetFormatWriter writer(staged, *db_, 2);
    writer.write(record(1, "a"));
    writer.write(record(2, "it's"));
    writer.write(record(3, "c"));
    EXPECT_GT(writer.getDataSize(), 0u);
    writer.close();

    ASSERT_TRUE(fs::exists(staged));

    Connection conn(*db_);
    auto result = conn.Query("SELECT id, name FROM read_parquet('" + staged + "') ORDER BY id;");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    ASSERT_EQ(result->RowCount(), 3u);
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "1");
    EXPECT_EQ(result->GetValue(1, 1).ToString(), "it's");
    EXPECT_EQ(result->GetValue(1, 2).ToString(), "c");
}

TEST_F(ParquetFormatWriterTest, PrimitiveValuesUseValueColumn) {
    std::string staged = path("b.parquet");
    ParquetFormatWriter writer(staged, *db_);
    MessageDetail detail;
    detail.value = SinkValue::string("hello");
    writer.write(detail);
    writer.close();

    Connection conn(*db_);
    auto result = conn.Query("SELECT value FROM read_parquet('" + staged + "');");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    ASSERT_EQ(result->RowCount(), 1u);
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "hello");
}

TEST_F(ParquetFormatWriterTest, StagingTableDroppedOnClose) {
    ParquetFormatWriter writer(path("c.parquet"), *db_);
    writer.write(record(1, "a"));
    std::string table = writer.getTableName();
    writer.close();

    Connection conn(*db_);
    auto result = conn.Query("SELECT count(*) FROM duckdb_tables() WHERE table_name = '" + table + "';");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "0");
}

TEST_F(ParquetFormatWriterTest, ColumnMismatch) {
    ParquetFormatWriter writer(path("d.parquet"), *db_);
    writer.write(record(1, "a"));

    MessageDetail other;
    other.value = SinkValue::structure({{"other", SinkValue::int64(1)}, {"name", SinkValue::string("x")}});
    EXPECT_THROW(writer.write(other), FormatError);

    MessageDetail wrong_type;
    wrong_type.value = SinkValue::structure({{"id", SinkValue::string("x")}, {"name", SinkValue::string("x")}});
    EXPECT_THROW(writer.write(wrong_type), FormatError);

    EXPECT_EQ(writer.getRecordCount(), 1u);
}

TEST_F(ParquetFormatWriterTest, NullsAndWideningAccepted) {
    std::string staged = path("e.parquet");
    ParquetFormatWriter writer(staged, *db_);

    MessageDetail first;
    first.value = SinkValue::structure({{"v", SinkValue::float64(0.5)}, {"s", SinkValue::string("a")}});
    MessageDetail second;
    second.value = SinkValue::structure({{"v", SinkValue::int64(2)}, {"s", SinkValue::null()}});
    writer.write(first);
    EXPECT_NO_THROW(writer.write(second));
    writer.close();

    Connection conn(*db_);
    auto result = conn.Query("SELECT count(*) FROM read_parquet('" + staged + "') WHERE s IS NULL;");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "1");
}

TEST_F(ParquetFormatWriterTest, CloseWithoutRecordsWritesNothing) {
    std::string staged = path("f.parquet");
    ParquetFormatWriter writer(staged, *db_);
    writer.close();
    EXPECT_FALSE(fs::exists(staged));
}

TEST_F(ParquetFormatWriterTest, NullColumnTakesFirstNonNullType) {
    std::string staged = path("g.parquet");
    ParquetFormatWriter writer(staged, *db_, 1);

    MessageDetail first;
    first.value = SinkValue::structure({{"id", SinkValue::int64(1)}, {"qty", SinkValue::null()}});
    MessageDetail second;
    second.value = SinkValue::structure({{"id", SinkValue::int64(2)}, {"qty", SinkValue::int64(5)}});
    MessageDetail wrong_type;
    wrong_type.value = SinkValue::structure({{"id", SinkValue::int64(3)}, {"qty", SinkValue::string("x")}});

    writer.write(first);
    EXPECT_NO_THROW(writer.write(second));
    EXPECT_THROW(writer.write(wrong_type), FormatError);
    writer.close();

    Connection conn(*db_);
    auto result = conn.Query("SELECT typeof(qty), qty FROM read_parquet('" + staged + "') ORDER BY id;");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    ASSERT_EQ(result->RowCount(), 2u);
    EXPECT_EQ(result->GetValue(0, 1).ToString(), "BIGINT");
    EXPECT_TRUE(result->GetValue(1, 0).IsNull());
    EXPECT_EQ(result->GetValue(1, 1).ToString(), "5");
}

TEST_F(ParquetFormatWriterTest, WholeNumberColumnWidensToDouble) {
    std::string staged = path("h.parquet");
    ParquetFormatWriter writer(staged, *db_);

    MessageDetail whole;
    whole.value = SinkValue::structure({{"price", SinkValue::int64(10)}});
    MessageDetail fractional;
    fractional.value = SinkValue::structure({{"price", SinkValue::float64(10.5)}});

    writer.write(whole);
    EXPECT_NO_THROW(writer.write(fractional));
    writer.close();

    Connection conn(*db_);
    auto result = conn.Query("SELECT typeof(price), sum(price) FROM read_parquet('" + staged + "') GROUP BY 1;");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    ASSERT_EQ(result->RowCount(), 1u);
    EXPECT_EQ(result->GetValue(0, 0).ToString(), "DOUBLE");
    EXPECT_EQ(result->GetValue(1, 0).ToString(), "20.5");
}
