#include "duckdb_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

std::string DuckDbUtils::escapeSqlString(const std::string& str) {
    std::string result;
    result.reserve(str.size() * 1.2);
    for (char c : str) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }
    return result;
}

std::string DuckDbUtils::quoteIdentifier(const std::string& name) {
    std::string result = "\"";
    for (char c : name) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += "\"";
    return result;
}

static const SinkValue* firstNonNull(const std::vector<SinkValue>& items) {
    for (const auto& item : items) {
        if (!item.isNull()) {
            return &item;
        }
    }
    return nullptr;
}

std::string DuckDbUtils::sqlType(const SinkValue& value) {
    switch (value.type()) {
        case SinkValue::Type::Null:
        case SinkValue::Type::String:
            return "VARCHAR";
        case SinkValue::Type::Boolean:
            return "BOOLEAN";
        case SinkValue::Type::Int64:
            return "BIGINT";
        case SinkValue::Type::Double:
            return "DOUBLE";
        case SinkValue::Type::Bytes:
            return "BLOB";
        case SinkValue::Type::Array: {
            const SinkValue* sample = firstNonNull(value.items());
            return (sample ? sqlType(*sample) : std::string("VARCHAR")) + "[]";
        }
        case SinkValue::Type::Struct: {
            if (value.fields().empty()) {
                return "VARCHAR";
            }
            std::string type = "STRUCT(";
            bool first = true;
            for (const auto& f : value.fields()) {
                if (!first) type += ", ";
                first = false;
                type += quoteIdentifier(f.first) + " " + sqlType(f.second);
            }
            return type + ")";
        }
        case SinkValue::Type::Map: {
            std::string value_type = "VARCHAR";
            for (const auto& kv : value.entries()) {
                if (!kv.second.isNull()) {
                    value_type = sqlType(kv.second);
                    break;
                }
            }
            return "MAP(VARCHAR, " + value_type + ")";
        }
    }
    return "VARCHAR";
}

std::string DuckDbUtils::sqlLiteral(const SinkValue& value) {
    switch (value.type()) {
        case SinkValue::Type::Null:
            return "NULL";
        case SinkValue::Type::Boolean:
            return value.asBool() ? "TRUE" : "FALSE";
        case SinkValue::Type::Int64:
            return std::to_string(value.asInt64());
        case SinkValue::Type::Double: {
            double d = value.asDouble();
            if (std::isnan(d)) return "'nan'::DOUBLE";
            if (std::isinf(d)) return d > 0 ? "'inf'::DOUBLE" : "'-inf'::DOUBLE";
            std::ostringstream oss;
            oss << std::setprecision(17) << d;
            return oss.str() + "::DOUBLE";
        }
        case SinkValue::Type::String:
            return "'" + escapeSqlString(value.asString()) + "'";
        case SinkValue::Type::Bytes:
            // toString() renders bytes as hex
            return "from_hex('" + value.toString() + "')";
        case SinkValue::Type::Array: {
            std::string literal = "[";
            bool first = true;
            for (const auto& item : value.items()) {
                if (!first) literal += ", ";
                first = false;
                literal += sqlLiteral(item);
            }
            return literal + "]";
        }
        case SinkValue::Type::Struct: {
            if (value.fields().empty()) {
                return "NULL";
            }
            std::string literal = "{";
            bool first = true;
            for (const auto& f : value.fields()) {
                if (!first) literal += ", ";
                first = false;
                literal += "'" + escapeSqlString(f.first) + "': " + sqlLiteral(f.second);
            }
            return literal + "}";
        }
        case SinkValue::Type::Map: {
            if (value.entries().empty()) {
                return "MAP([], [])";
            }
            std::string keys = "[";
            std::string values = "[";
            bool first = true;
            for (const auto& kv : value.entries()) {
                if (!first) {
                    keys += ", ";
                    values += ", ";
                }
                first = false;
                keys += "'" + escapeSqlString(kv.first) + "'";
                values += sqlLiteral(kv.second);
            }
            return "MAP(" + keys + "], " + values + "])";
        }
    }
    return "NULL";
}

std::vector<SinkValue::Field> DuckDbUtils::toColumns(const SinkValue& value) {
    if (value.type() == SinkValue::Type::Struct && !value.fields().empty()) {
        return value.fields();
    }
    return {{"value", value}};
}

std::string DuckDbUtils::buildInsertSQL(const std::vector<std::string>& rows, const std::string& table_name) {
    std::ostringstream sql;
    sql << "INSERT INTO " << table_name << " VALUES ";

    bool first = true;
    for (const auto& row : rows) {
        if (!first) {
            sql << ", ";
        }
        first = false;
        sql << row;
    }
    sql << ";";

    return sql.str();
}

bool DuckDbUtils::execute(Connection& conn, const std::string& sql, std::string& error) {
    try {
        auto result = conn.Query(sql);
        if (result->HasError()) {
            error = result->GetError();
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
