#ifndef FORMAT_WRITER_HPP
#define FORMAT_WRITER_HPP

#include "format_selection.hpp"
#include "../sink/sink_value.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}

// Encodes records of one staged object.
// Each writer owns exactly one staged file. close() seals the file and is a
// no-op the second time; write() after close() throws std::logic_error.
// Encoding failures and schema mismatches throw FormatError.
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    void write(const MessageDetail& detail);
    void close();

    bool isClosed() const { return closed_; }
    size_t getRecordCount() const { return record_count_; }

    // Bytes accumulated so far, used by the size rotation threshold
    virtual size_t getDataSize() const = 0;

    virtual const std::string& getStagedPath() const = 0;

protected:
    virtual void writeRecord(const MessageDetail& detail) = 0;
    virtual void closeFile() = 0;

private:
    bool closed_ = false;
    size_t record_count_ = 0;
};

using FormatWriterFactory = std::function<std::unique_ptr<FormatWriter>(const std::string& staged_path)>;

// Factory for the configured format. `db` is only used for Parquet and must
// outlive every writer it creates.
FormatWriterFactory makeFormatWriterFactory(const FormatSelection& selection, duckdb::DuckDB* db);

#endif // FORMAT_WRITER_HPP
