#include "json_format_writer.hpp"
#include "../sink/sink_error.hpp"
#include <absl/strings/escaping.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

static const int64_t kMaxExactDouble = 9007199254740992LL;  // 2^53

JsonFormatWriter::JsonFormatWriter(const std::string& staged_path, bool gzip)
    : file_(staged_path, gzip) {
}

void JsonFormatWriter::toProtoValue(const SinkValue& value, google::protobuf::Value* out) {
    switch (value.type()) {
        case SinkValue::Type::Null:
            out->set_null_value(google::protobuf::NULL_VALUE);
            break;
        case SinkValue::Type::Boolean:
            out->set_bool_value(value.asBool());
            break;
        case SinkValue::Type::Int64:
            if (value.asInt64() > kMaxExactDouble || value.asInt64() < -kMaxExactDouble) {
                out->set_string_value(std::to_string(value.asInt64()));
            } else {
                out->set_number_value(static_cast<double>(value.asInt64()));
            }
            break;
        case SinkValue::Type::Double:
            out->set_number_value(value.asDouble());
            break;
        case SinkValue::Type::String:
            out->set_string_value(value.asString());
            break;
        case SinkValue::Type::Bytes:
            out->set_string_value(absl::Base64Escape(value.asString()));
            break;
        case SinkValue::Type::Array: {
            auto* list = out->mutable_list_value();
            for (const auto& item : value.items()) {
                toProtoValue(item, list->add_values());
            }
            break;
        }
        case SinkValue::Type::Struct: {
            auto* fields = out->mutable_struct_value()->mutable_fields();
            for (const auto& f : value.fields()) {
                toProtoValue(f.second, &(*fields)[f.first]);
            }
            break;
        }
        case SinkValue::Type::Map: {
            auto* fields = out->mutable_struct_value()->mutable_fields();
            for (const auto& kv : value.entries()) {
                toProtoValue(kv.second, &(*fields)[kv.first]);
            }
            break;
        }
    }
}

void JsonFormatWriter::writeRecord(const MessageDetail& detail) {
    google::protobuf::Value proto;
    toProtoValue(detail.value, &proto);

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(proto, &json);
    if (!status.ok()) {
        throw FormatError("Failed to render JSON record: " + status.ToString());
    }
    json += "\n";
    file_.write(json);
}
