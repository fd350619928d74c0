#ifndef CSV_FORMAT_WRITER_HPP
#define CSV_FORMAT_WRITER_HPP

#include "format_writer.hpp"
#include "staged_file.hpp"
#include <string>
#include <vector>

// One CSV row per record value. Struct and map values give one column per
// field, primitives a single "value" column. The first record fixes the columns.
class CsvFormatWriter : public FormatWriter {
public:
    CsvFormatWriter(const std::string& staged_path, bool with_headers, bool gzip);

    size_t getDataSize() const override { return file_.bytesWritten(); }
    const std::string& getStagedPath() const override { return file_.path(); }

    // RFC 4180 quoting
    static std::string escapeCell(const std::string& cell);

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override { file_.close(); }

private:
    StagedFile file_;
    bool with_headers_;
    bool columns_fixed_;
    std::vector<std::string> columns_;

    static std::vector<std::pair<std::string, std::string>> toCells(const SinkValue& value);
};

#endif // CSV_FORMAT_WRITER_HPP
