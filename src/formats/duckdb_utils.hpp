#ifndef DUCKDB_UTILS_HPP
#define DUCKDB_UTILS_HPP

#include "../sink/sink_value.hpp"
#include "duckdb.hpp"
#include <string>
#include <vector>

using duckdb::DuckDB;
using duckdb::Connection;

// SQL building helpers for the DuckDB staging tables behind the Parquet writer
class DuckDbUtils {
public:
    // SQL string escaping (standard SQL strings, only quotes are special)
    static std::string escapeSqlString(const std::string& str);

    // Double-quoted identifier
    static std::string quoteIdentifier(const std::string& name);

    // DuckDB column type for a value, nulls map to VARCHAR
    static std::string sqlType(const SinkValue& value);

    // DuckDB literal for a value
    static std::string sqlLiteral(const SinkValue& value);

    // Column layout of a record value: struct fields, otherwise a single "value" column
    static std::vector<SinkValue::Field> toColumns(const SinkValue& value);

    // Build INSERT statement for pre-rendered rows
    static std::string buildInsertSQL(const std::vector<std::string>& rows, const std::string& table_name);

    // Run a statement, on failure the DuckDB error is stored in `error`
    static bool execute(Connection& conn, const std::string& sql, std::string& error);
};

#endif // DUCKDB_UTILS_HPP
