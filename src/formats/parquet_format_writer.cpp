#include "parquet_format_writer.hpp"
#include "duckdb_utils.hpp"
#include "../sink/sink_error.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

static std::atomic<uint64_t> table_counter{0};

// Nested types are compared by kind only, DuckDB casts the rest
static std::string typeFamily(const std::string& type) {
    if (type.size() > 2 && type.compare(type.size() - 2, 2, "[]") == 0) {
        return "LIST";
    }
    if (type.compare(0, 7, "STRUCT(") == 0) {
        return "STRUCT";
    }
    if (type.compare(0, 4, "MAP(") == 0) {
        return "MAP";
    }
    return type;
}

ParquetFormatWriter::ParquetFormatWriter(const std::string& staged_path, duckdb::DuckDB& db, size_t insert_batch_size)
    : staged_path_(staged_path)
    , conn_(db)
    , table_name_("parquet_staging_" + std::to_string(table_counter.fetch_add(1)))
    , insert_batch_size_(insert_batch_size == 0 ? 1 : insert_batch_size)
    , table_created_(false)
    , data_size_(0) {
    fs::path parent = fs::path(staged_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw FormatError("Failed to create staging directory for " + staged_path_, {}, ec.message());
        }
    }
}

ParquetFormatWriter::~ParquetFormatWriter() {
    dropTable();
}

void ParquetFormatWriter::createTable(const std::vector<SinkValue::Field>& columns) {
    std::ostringstream create_sql;
    create_sql << "CREATE TABLE " << table_name_ << " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) create_sql << ", ";
        column_names_.push_back(columns[i].first);
        column_types_.push_back(DuckDbUtils::sqlType(columns[i].second));
        column_typed_.push_back(!columns[i].second.isNull());
        create_sql << DuckDbUtils::quoteIdentifier(columns[i].first) << " " << column_types_.back();
    }
    create_sql << ");";

    std::string error;
    if (!DuckDbUtils::execute(conn_, create_sql.str(), error)) {
        throw FormatError("Error creating Parquet staging table for " + staged_path_, {}, error);
    }
    table_created_ = true;
}

void ParquetFormatWriter::writeRecord(const MessageDetail& detail) {
    auto columns = DuckDbUtils::toColumns(detail.value);
    if (!table_created_) {
        createTable(columns);
    }

    if (columns.size() != column_names_.size()) {
        throw FormatError("Parquet record has " + std::to_string(columns.size()) + " columns, " +
                          staged_path_ + " has " + std::to_string(column_names_.size()));
    }

    // Check every column before touching the table so a mismatch changes nothing
    std::vector<std::string> types = column_types_;
    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& column = columns[i];
        if (column.first != column_names_[i]) {
            throw FormatError("Parquet record column '" + column.first + "' does not match column '" +
                              column_names_[i] + "' of " + staged_path_);
        }
        if (column.second.isNull()) {
            continue;
        }
        std::string type = DuckDbUtils::sqlType(column.second);
        if (!column_typed_[i]) {
            types[i] = type;
        } else if (type == "DOUBLE" && types[i] == "BIGINT") {
            types[i] = type;
        } else if (!(type == "BIGINT" && types[i] == "DOUBLE") && typeFamily(type) != typeFamily(types[i])) {
            throw FormatError("Parquet column '" + column.first + "' of " + staged_path_ + " expects " +
                              types[i] + ", got " + type);
        }
    }

    for (size_t i = 0; i < columns.size(); ++i) {
        if (!columns[i].second.isNull()) {
            if (types[i] != column_types_[i]) {
                alterColumn(i, types[i]);
            }
            column_typed_[i] = true;
        }
    }

    std::string row = "(";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) row += ", ";
        std::string literal = DuckDbUtils::sqlLiteral(columns[i].second);
        row += "CAST(" + literal + " AS " + column_types_[i] + ")";
        data_size_ += literal.size();
    }
    row += ")";

    pending_rows_.push_back(std::move(row));
    if (pending_rows_.size() >= insert_batch_size_) {
        flushRows();
    }
}

void ParquetFormatWriter::alterColumn(size_t index, const std::string& type) {
    // Buffered rows still cast to the old type
    flushRows();
    std::string error;
    std::string sql = "ALTER TABLE " + table_name_ + " ALTER COLUMN " +
                      DuckDbUtils::quoteIdentifier(column_names_[index]) + " TYPE " + type + ";";
    if (!DuckDbUtils::execute(conn_, sql, error)) {
        throw FormatError("Error changing column '" + column_names_[index] + "' of " + staged_path_ +
                          " to " + type, {}, error);
    }
    column_types_[index] = type;
}

void ParquetFormatWriter::flushRows() {
    if (pending_rows_.empty()) {
        return;
    }
    std::string error;
    std::string sql = DuckDbUtils::buildInsertSQL(pending_rows_, table_name_);
    pending_rows_.clear();
    if (!DuckDbUtils::execute(conn_, sql, error)) {
        throw FormatError("Error inserting into Parquet staging table for " + staged_path_, {}, error);
    }
}

void ParquetFormatWriter::closeFile() {
    if (!table_created_) {
        return;
    }
    flushRows();

    std::string error;
    std::string copy_sql = "COPY " + table_name_ + " TO '" + DuckDbUtils::escapeSqlString(staged_path_) +
                           "' (FORMAT PARQUET);";
    if (!DuckDbUtils::execute(conn_, copy_sql, error)) {
        throw FormatError("Error writing Parquet file " + staged_path_, {}, error);
    }
    dropTable();
}

void ParquetFormatWriter::dropTable() {
    if (!table_created_) {
        return;
    }
    table_created_ = false;
    std::string error;
    if (!DuckDbUtils::execute(conn_, "DROP TABLE IF EXISTS " + table_name_ + ";", error)) {
        std::cerr << "Warning: Could not drop staging table " << table_name_ << ": " << error << std::endl;
    }
}
