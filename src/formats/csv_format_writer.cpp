#include "csv_format_writer.hpp"
#include "../sink/sink_error.hpp"
#include <sstream>

CsvFormatWriter::CsvFormatWriter(const std::string& staged_path, bool with_headers, bool gzip)
    : file_(staged_path, gzip)
    , with_headers_(with_headers)
    , columns_fixed_(false) {
}

std::string CsvFormatWriter::escapeCell(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += "\"";
    return out;
}

std::vector<std::pair<std::string, std::string>> CsvFormatWriter::toCells(const SinkValue& value) {
    std::vector<std::pair<std::string, std::string>> cells;
    if (value.type() == SinkValue::Type::Struct) {
        for (const auto& f : value.fields()) {
            cells.emplace_back(f.first, f.second.toString());
        }
    } else if (value.type() == SinkValue::Type::Map) {
        for (const auto& kv : value.entries()) {
            cells.emplace_back(kv.first, kv.second.toString());
        }
    } else {
        cells.emplace_back("value", value.toString());
    }
    return cells;
}

void CsvFormatWriter::writeRecord(const MessageDetail& detail) {
    auto cells = toCells(detail.value);

    if (!columns_fixed_) {
        for (const auto& cell : cells) {
            columns_.push_back(cell.first);
        }
        columns_fixed_ = true;

        if (with_headers_) {
            std::ostringstream header;
            for (size_t i = 0; i < columns_.size(); ++i) {
                if (i > 0) header << ",";
                header << escapeCell(columns_[i]);
            }
            header << "\n";
            file_.write(header.str());
        }
    } else {
        bool compatible = cells.size() == columns_.size();
        for (size_t i = 0; compatible && i < cells.size(); ++i) {
            compatible = cells[i].first == columns_[i];
        }
        if (!compatible) {
            throw FormatError("CSV record columns do not match the columns of " + file_.path());
        }
    }

    std::ostringstream row;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) row << ",";
        row << escapeCell(cells[i].second);
    }
    row << "\n";
    file_.write(row.str());
}
