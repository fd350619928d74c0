#ifndef JSON_FORMAT_WRITER_HPP
#define JSON_FORMAT_WRITER_HPP

#include "format_writer.hpp"
#include "staged_file.hpp"
#include <string>

namespace google {
namespace protobuf {
class Value;
}
}

// JSON lines: one document per record value, rendered by protobuf's JSON printer
class JsonFormatWriter : public FormatWriter {
public:
    JsonFormatWriter(const std::string& staged_path, bool gzip);

    size_t getDataSize() const override { return file_.bytesWritten(); }
    const std::string& getStagedPath() const override { return file_.path(); }

    // Integers beyond 2^53 become strings so they survive the double round trip,
    // bytes become base64 strings.
    static void toProtoValue(const SinkValue& value, google::protobuf::Value* out);

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override { file_.close(); }

private:
    StagedFile file_;
};

#endif // JSON_FORMAT_WRITER_HPP
