#include "avro_format_writer.hpp"
#include "../sink/sink_error.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <random>

const char AvroFormatWriter::kMagic[4] = {'O', 'b', 'j', 1};

AvroFormatWriter::AvroFormatWriter(const std::string& staged_path, size_t records_per_block)
    : file_(staged_path, false)
    , records_per_block_(records_per_block == 0 ? 1 : records_per_block)
    , pending_bytes_(0) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 255);
    sync_marker_.resize(16);
    for (auto& c : sync_marker_) {
        c = static_cast<char>(dist(gen));
    }
}

std::string AvroFormatWriter::encodeLong(int64_t value) {
    uint64_t n = (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
    std::string out;
    while (n & ~0x7FULL) {
        out += static_cast<char>((n & 0x7F) | 0x80);
        n >>= 7;
    }
    out += static_cast<char>(n);
    return out;
}

void AvroFormatWriter::encodeBytes(const std::string& bytes, std::string& out) {
    out += encodeLong(static_cast<int64_t>(bytes.size()));
    out += bytes;
}

std::string AvroFormatWriter::sanitizeName(const std::string& name) {
    std::string out;
    for (char c : name) {
        out += (std::isalnum(static_cast<unsigned char>(c)) || c == '_') ? c : '_';
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out[0]))) {
        out = "_" + out;
    }
    return out;
}

AvroFormatWriter::Schema AvroFormatWriter::deriveSchema(const SinkValue& value,
                                                       const std::string& name,
                                                       bool nullable) {
    Schema schema;
    schema.nullable = nullable;
    switch (value.type()) {
        case SinkValue::Type::Null:
            schema.kind = Schema::Kind::Null;
            schema.nullable = false;
            break;
        case SinkValue::Type::Boolean:
            schema.kind = Schema::Kind::Boolean;
            break;
        case SinkValue::Type::Int64:
            schema.kind = Schema::Kind::Long;
            break;
        case SinkValue::Type::Double:
            schema.kind = Schema::Kind::Double;
            break;
        case SinkValue::Type::String:
            schema.kind = Schema::Kind::String;
            break;
        case SinkValue::Type::Bytes:
            schema.kind = Schema::Kind::Bytes;
            break;
        case SinkValue::Type::Array: {
            schema.kind = Schema::Kind::Array;
            SinkValue sample;
            for (const auto& item : value.items()) {
                if (!item.isNull()) {
                    sample = item;
                    break;
                }
            }
            schema.children.push_back(deriveSchema(sample, name + "_item", true));
            break;
        }
        case SinkValue::Type::Map: {
            schema.kind = Schema::Kind::Map;
            SinkValue sample;
            for (const auto& kv : value.entries()) {
                if (!kv.second.isNull()) {
                    sample = kv.second;
                    break;
                }
            }
            schema.children.push_back(deriveSchema(sample, name + "_value", true));
            break;
        }
        case SinkValue::Type::Struct:
            schema.kind = Schema::Kind::Record;
            schema.name = sanitizeName(name);
            for (const auto& f : value.fields()) {
                schema.field_names.push_back(f.first);
                schema.children.push_back(deriveSchema(f.second, name + "_" + f.first, true));
            }
            break;
    }
    return schema;
}

void AvroFormatWriter::merge(Schema& schema,
                             const SinkValue& value,
                             const std::string& name,
                             const std::string& path) const {
    if (value.isNull()) {
        if (schema.kind != Schema::Kind::Null && !schema.nullable) {
            throw FormatError("Avro record does not match the schema of " + file_.path() +
                              " at '" + path + "': got null");
        }
        return;
    }
    if (schema.kind == Schema::Kind::Null) {
        schema = deriveSchema(value, name, true);
        return;
    }

    auto mismatch = [&]() {
        return FormatError("Avro record does not match the schema of " + file_.path() +
                           " at '" + path + "': got " + SinkValue::typeName(value.type()));
    };

    switch (schema.kind) {
        case Schema::Kind::Null:
            break;
        case Schema::Kind::Boolean:
            if (value.type() != SinkValue::Type::Boolean) throw mismatch();
            break;
        case Schema::Kind::Long:
            if (value.type() == SinkValue::Type::Double) {
                schema.kind = Schema::Kind::Double;
            } else if (value.type() != SinkValue::Type::Int64) {
                throw mismatch();
            }
            break;
        case Schema::Kind::Double:
            if (value.type() != SinkValue::Type::Double && value.type() != SinkValue::Type::Int64) {
                throw mismatch();
            }
            break;
        case Schema::Kind::String:
            if (value.type() != SinkValue::Type::String) throw mismatch();
            break;
        case Schema::Kind::Bytes:
            if (value.type() != SinkValue::Type::Bytes) throw mismatch();
            break;
        case Schema::Kind::Array:
            if (value.type() != SinkValue::Type::Array) throw mismatch();
            for (const auto& item : value.items()) {
                merge(schema.children[0], item, name + "_item", path + "[]");
            }
            break;
        case Schema::Kind::Map:
            if (value.type() != SinkValue::Type::Map) throw mismatch();
            for (const auto& kv : value.entries()) {
                merge(schema.children[0], kv.second, name + "_value", path + "." + kv.first);
            }
            break;
        case Schema::Kind::Record: {
            if (value.type() != SinkValue::Type::Struct) throw mismatch();
            const auto& fields = value.fields();
            if (fields.size() != schema.field_names.size()) {
                throw FormatError("Avro record at '" + path + "' has " + std::to_string(fields.size()) +
                                  " fields, schema of " + file_.path() + " has " +
                                  std::to_string(schema.field_names.size()));
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                if (fields[i].first != schema.field_names[i]) {
                    throw FormatError("Avro record field '" + fields[i].first + "' does not match schema field '" +
                                      schema.field_names[i] + "' of " + file_.path());
                }
                merge(schema.children[i], fields[i].second, name + "_" + fields[i].first,
                      path + "." + fields[i].first);
            }
            break;
        }
    }
}

std::string AvroFormatWriter::toJson(const Schema& schema) {
    std::string type;
    switch (schema.kind) {
        case Schema::Kind::Null: type = "\"null\""; break;
        case Schema::Kind::Boolean: type = "\"boolean\""; break;
        case Schema::Kind::Long: type = "\"long\""; break;
        case Schema::Kind::Double: type = "\"double\""; break;
        case Schema::Kind::String: type = "\"string\""; break;
        case Schema::Kind::Bytes: type = "\"bytes\""; break;
        case Schema::Kind::Array:
            type = "{\"type\":\"array\",\"items\":" + toJson(schema.children[0]) + "}";
            break;
        case Schema::Kind::Map:
            type = "{\"type\":\"map\",\"values\":" + toJson(schema.children[0]) + "}";
            break;
        case Schema::Kind::Record: {
            type = "{\"type\":\"record\",\"name\":\"" + schema.name + "\",\"fields\":[";
            for (size_t i = 0; i < schema.children.size(); ++i) {
                if (i > 0) type += ",";
                type += "{\"name\":\"" + sanitizeName(schema.field_names[i]) +
                        "\",\"type\":" + toJson(schema.children[i]);
                if (schema.children[i].nullable || schema.children[i].kind == Schema::Kind::Null) {
                    type += ",\"default\":null";
                }
                type += "}";
            }
            type += "]}";
            break;
        }
    }
    if (schema.nullable) {
        return "[\"null\"," + type + "]";
    }
    return type;
}

void AvroFormatWriter::encode(const Schema& schema,
                              const SinkValue& value,
                              const std::string& path,
                              std::string& out) const {
    if (schema.nullable) {
        if (value.isNull()) {
            out += encodeLong(0);
            return;
        }
        out += encodeLong(1);
    }

    auto mismatch = [&]() {
        return FormatError("Avro record does not match the schema of " + file_.path() +
                           " at '" + path + "': got " + SinkValue::typeName(value.type()));
    };

    switch (schema.kind) {
        case Schema::Kind::Null:
            if (!value.isNull()) throw mismatch();
            break;
        case Schema::Kind::Boolean:
            if (value.type() != SinkValue::Type::Boolean) throw mismatch();
            out += static_cast<char>(value.asBool() ? 1 : 0);
            break;
        case Schema::Kind::Long:
            if (value.type() != SinkValue::Type::Int64) throw mismatch();
            out += encodeLong(value.asInt64());
            break;
        case Schema::Kind::Double: {
            double d;
            if (value.type() == SinkValue::Type::Double) {
                d = value.asDouble();
            } else if (value.type() == SinkValue::Type::Int64) {
                d = static_cast<double>(value.asInt64());
            } else {
                throw mismatch();
            }
            uint64_t bits;
            std::memcpy(&bits, &d, sizeof(bits));
            for (int i = 0; i < 8; ++i) {
                out += static_cast<char>((bits >> (8 * i)) & 0xFF);
            }
            break;
        }
        case Schema::Kind::String:
            if (value.type() != SinkValue::Type::String) throw mismatch();
            encodeBytes(value.asString(), out);
            break;
        case Schema::Kind::Bytes:
            if (value.type() != SinkValue::Type::Bytes) throw mismatch();
            encodeBytes(value.asString(), out);
            break;
        case Schema::Kind::Array:
            if (value.type() != SinkValue::Type::Array) throw mismatch();
            if (!value.items().empty()) {
                out += encodeLong(static_cast<int64_t>(value.items().size()));
                for (const auto& item : value.items()) {
                    encode(schema.children[0], item, path + "[]", out);
                }
            }
            out += encodeLong(0);
            break;
        case Schema::Kind::Map:
            if (value.type() != SinkValue::Type::Map) throw mismatch();
            if (!value.entries().empty()) {
                out += encodeLong(static_cast<int64_t>(value.entries().size()));
                for (const auto& kv : value.entries()) {
                    encodeBytes(kv.first, out);
                    encode(schema.children[0], kv.second, path + "." + kv.first, out);
                }
            }
            out += encodeLong(0);
            break;
        case Schema::Kind::Record: {
            if (value.type() != SinkValue::Type::Struct) throw mismatch();
            const auto& fields = value.fields();
            if (fields.size() != schema.field_names.size()) {
                throw FormatError("Avro record at '" + path + "' has " + std::to_string(fields.size()) +
                                  " fields, schema of " + file_.path() + " has " +
                                  std::to_string(schema.field_names.size()));
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                if (fields[i].first != schema.field_names[i]) {
                    throw FormatError("Avro record field '" + fields[i].first + "' does not match schema field '" +
                                      schema.field_names[i] + "' of " + file_.path());
                }
                encode(schema.children[i], fields[i].second, path + "." + fields[i].first, out);
            }
            break;
        }
    }
}

void AvroFormatWriter::writeHeader() {
    std::string header(kMagic, sizeof(kMagic));
    header += encodeLong(2);
    encodeBytes("avro.schema", header);
    encodeBytes(schema_json_, header);
    encodeBytes("avro.codec", header);
    encodeBytes("null", header);
    header += encodeLong(0);
    header += sync_marker_;
    file_.write(header);
}

void AvroFormatWriter::writeRecord(const MessageDetail& detail) {
    // Merge into a copy so a mismatch leaves the schema untouched
    Schema merged = schema_;
    merge(merged, detail.value, "Value", "value");

    std::string encoded;
    encode(merged, detail.value, "value", encoded);
    schema_ = std::move(merged);
    pending_.push_back(detail.value);
    pending_bytes_ += encoded.size();
}

void AvroFormatWriter::writeBlock(size_t begin, size_t end) {
    std::string block;
    for (size_t i = begin; i < end; ++i) {
        encode(schema_, pending_[i], "value", block);
    }
    std::string framed = encodeLong(static_cast<int64_t>(end - begin));
    framed += encodeLong(static_cast<int64_t>(block.size()));
    framed += block;
    framed += sync_marker_;
    file_.write(framed);
}

void AvroFormatWriter::closeFile() {
    if (!pending_.empty()) {
        schema_json_ = toJson(schema_);
        writeHeader();
        for (size_t begin = 0; begin < pending_.size(); begin += records_per_block_) {
            writeBlock(begin, std::min(pending_.size(), begin + records_per_block_));
        }
        pending_.clear();
        pending_bytes_ = 0;
    }
    file_.close();
}
