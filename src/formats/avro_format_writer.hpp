#ifndef AVRO_FORMAT_WRITER_HPP
#define AVRO_FORMAT_WRITER_HPP

#include "format_writer.hpp"
#include "staged_file.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Avro object container file (null codec).
// The writer schema is derived from the record values of the whole object:
// structs become records with nullable fields, a field that has only been null
// so far takes the type of its first non-null value, and long fields widen to
// double. Records are held until close() because the header carries the final
// schema. Records that do not fit the schema throw FormatError.
class AvroFormatWriter : public FormatWriter {
public:
    explicit AvroFormatWriter(const std::string& staged_path, size_t records_per_block = 1000);

    size_t getDataSize() const override { return file_.bytesWritten() + pending_bytes_; }
    const std::string& getStagedPath() const override { return file_.path(); }

    // Empty until the file has been closed
    const std::string& getSchemaJson() const { return schema_json_; }

    // Zig-zag variable length encoding of Avro int and long
    static std::string encodeLong(int64_t value);

    static const char kMagic[4];

protected:
    void writeRecord(const MessageDetail& detail) override;
    void closeFile() override;

private:
    struct Schema {
        enum class Kind {
            Null,
            Boolean,
            Long,
            Double,
            String,
            Bytes,
            Array,
            Map,
            Record
        };

        Kind kind = Kind::Null;
        bool nullable = false;
        std::string name;                      // Record only
        std::vector<std::string> field_names;  // Record only
        std::vector<Schema> children;          // Record fields, Array items, Map values
    };

    StagedFile file_;
    size_t records_per_block_;
    Schema schema_;
    std::string schema_json_;
    std::string sync_marker_;
    std::vector<SinkValue> pending_;
    size_t pending_bytes_;

    static Schema deriveSchema(const SinkValue& value, const std::string& name, bool nullable);
    void merge(Schema& schema, const SinkValue& value, const std::string& name, const std::string& path) const;
    static std::string toJson(const Schema& schema);
    static std::string sanitizeName(const std::string& name);
    static void encodeBytes(const std::string& bytes, std::string& out);
    void encode(const Schema& schema, const SinkValue& value, const std::string& path, std::string& out) const;

    void writeHeader();
    void writeBlock(size_t begin, size_t end);
};

#endif // AVRO_FORMAT_WRITER_HPP
