#include "format_writer.hpp"
#include "csv_format_writer.hpp"
#include "json_format_writer.hpp"
#include "parquet_format_writer.hpp"
#include "avro_format_writer.hpp"
#include "bytes_format_writer.hpp"
#include "../sink/sink_error.hpp"
#include <stdexcept>

void FormatWriter::write(const MessageDetail& detail) {
    if (closed_) {
        throw std::logic_error("Format writer for " + getStagedPath() + " is already closed");
    }
    writeRecord(detail);
    ++record_count_;
}

void FormatWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    closeFile();
}

FormatWriterFactory makeFormatWriterFactory(const FormatSelection& selection, duckdb::DuckDB* db) {
    if (selection.type == FormatType::Parquet && !db) {
        throw ConfigurationError("PARQUET format requires a DuckDB instance");
    }

    return [selection, db](const std::string& staged_path) -> std::unique_ptr<FormatWriter> {
        switch (selection.type) {
            case FormatType::Csv:
                return std::make_unique<CsvFormatWriter>(staged_path, selection.with_headers, selection.compressed());
            case FormatType::Json:
                return std::make_unique<JsonFormatWriter>(staged_path, selection.compressed());
            case FormatType::Parquet:
                return std::make_unique<ParquetFormatWriter>(staged_path, *db);
            case FormatType::Avro:
                return std::make_unique<AvroFormatWriter>(staged_path);
            case FormatType::Bytes:
                return std::make_unique<BytesFormatWriter>(staged_path, selection.bytes_mode, selection.compressed());
            case FormatType::Text:
                return std::make_unique<TextFormatWriter>(staged_path, selection.compressed());
        }
        throw ConfigurationError("Unsupported format: " + selection.name());
    };
}
