#ifndef BYTES_FORMAT_WRITER_HPP
#define BYTES_FORMAT_WRITER_HPP

#include "format_writer.hpp"
#include "staged_file.hpp"
#include <string>

// Raw record bytes. ValueOnly concatenates values; KeyAndValueWithSizes writes
// [key size: int64 BE][value size: int64 BE][key][value] per record.
class BytesFormatWriter : public FormatWriter {
public:
    BytesFormatWriter(const std::string& staged_path, BytesMode mode, bool gzip);

    size_t getDataSize() const override { return file_.bytesWritten(); }
    const std::string& getStagedPath() const override { return file_.path(); }

    static std::string encodeSize(uint64_t size);

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override { file_.close(); }

private:
    StagedFile file_;
    BytesMode mode_;

    static const std::string& rawBytes(const SinkValue& value, const char* what);
};

// One line per record holding the value as text
class TextFormatWriter : public FormatWriter {
public:
    TextFormatWriter(const std::string& staged_path, bool gzip);

    size_t getDataSize() const override { return file_.bytesWritten(); }
    const std::string& getStagedPath() const override { return file_.path(); }

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override { file_.close(); }

private:
    StagedFile file_;
};

#endif // BYTES_FORMAT_WRITER_HPP
