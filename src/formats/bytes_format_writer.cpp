#include "bytes_format_writer.hpp"
#include "../sink/sink_error.hpp"

BytesFormatWriter::BytesFormatWriter(const std::string& staged_path, BytesMode mode, bool gzip)
    : file_(staged_path, gzip)
    , mode_(mode) {
}

std::string BytesFormatWriter::encodeSize(uint64_t size) {
    std::string out(8, '\0');
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<char>(size & 0xFF);
        size >>= 8;
    }
    return out;
}

const std::string& BytesFormatWriter::rawBytes(const SinkValue& value, const char* what) {
    static const std::string empty;
    if (value.isNull()) {
        return empty;
    }
    if (value.type() != SinkValue::Type::Bytes && value.type() != SinkValue::Type::String) {
        throw FormatError(std::string("BYTES format requires a bytes ") + what + ", got " +
                          SinkValue::typeName(value.type()));
    }
    return value.asString();
}

void BytesFormatWriter::writeRecord(const MessageDetail& detail) {
    const std::string& value = rawBytes(detail.value, "value");
    if (mode_ == BytesMode::ValueOnly) {
        file_.write(value);
        return;
    }

    static const SinkValue kNoKey;
    const std::string& key = rawBytes(detail.has_key ? detail.key : kNoKey, "key");
    std::string record;
    record.reserve(16 + key.size() + value.size());
    record += encodeSize(key.size());
    record += encodeSize(value.size());
    record += key;
    record += value;
    file_.write(record);
}

TextFormatWriter::TextFormatWriter(const std::string& staged_path, bool gzip)
    : file_(staged_path, gzip) {
}

void TextFormatWriter::writeRecord(const MessageDetail& detail) {
    if (!detail.value.isPrimitive()) {
        throw FormatError(std::string("TEXT format requires a primitive value, got ") +
                          SinkValue::typeName(detail.value.type()));
    }
    std::string line = detail.value.toString();
    if (line.find('\n') != std::string::npos) {
        throw FormatError("TEXT format value contains a line break");
    }
    line += "\n";
    file_.write(line);
}
