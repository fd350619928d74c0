#ifndef PARQUET_FORMAT_WRITER_HPP
#define PARQUET_FORMAT_WRITER_HPP

#include "format_writer.hpp"
#include "duckdb.hpp"
#include <string>
#include <vector>

// Parquet output through a DuckDB staging table.
// Rows are inserted in batches; close() copies the table to the staged path
// as Parquet and drops it. The first record fixes the column names; a column
// that has only been null so far takes the type of its first non-null value,
// and BIGINT columns widen to DOUBLE.
class ParquetFormatWriter : public FormatWriter {
public:
    ParquetFormatWriter(const std::string& staged_path, duckdb::DuckDB& db, size_t insert_batch_size = 1000);
    ~ParquetFormatWriter() override;

    size_t getDataSize() const override { return data_size_; }
    const std::string& getStagedPath() const override { return staged_path_; }

    const std::string& getTableName() const { return table_name_; }

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override;

private:
    std::string staged_path_;
    duckdb::Connection conn_;
    std::string table_name_;
    size_t insert_batch_size_;
    bool table_created_;
    std::vector<std::string> column_names_;
    std::vector<std::string> column_types_;
    std::vector<bool> column_typed_;
    std::vector<std::string> pending_rows_;
    size_t data_size_;

    void createTable(const std::vector<SinkValue::Field>& columns);
    void alterColumn(size_t index, const std::string& type);
    void flushRows();
    void dropTable();
};

#endif // PARQUET_FORMAT_WRITER_HPP
