#include "value_converter.hpp"
#include "../sink/sink_error.hpp"
#include <google/protobuf/util/json_util.h>
#include <algorithm>
#include <cmath>
#include <vector>

// Largest integer a double holds exactly
static const double kMaxExactInteger = 9007199254740992.0;

ConverterType ValueConverter::typeFromString(const std::string& name) {
    if (name == "json") {
        return ConverterType::Json;
    }
    if (name == "string") {
        return ConverterType::String;
    }
    if (name == "bytes") {
        return ConverterType::Bytes;
    }
    throw ConfigurationError("Unsupported converter: " + name);
}

SinkValue ValueConverter::convert(ConverterType type, const std::string& payload) {
    if (payload.empty()) {
        return SinkValue::null();
    }
    switch (type) {
        case ConverterType::Json:
            return fromJson(payload);
        case ConverterType::String:
            return SinkValue::string(payload);
        case ConverterType::Bytes:
            return SinkValue::bytes(payload);
    }
    return SinkValue::bytes(payload);
}

SinkValue ValueConverter::fromJson(const std::string& json) {
    google::protobuf::Value value;
    auto status = google::protobuf::util::JsonStringToMessage(json, &value);
    if (!status.ok()) {
        throw FormatError("Failed to parse JSON payload: " + status.ToString());
    }
    return fromProtoValue(value);
}

SinkValue ValueConverter::fromProtoValue(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNullValue:
        case google::protobuf::Value::KIND_NOT_SET:
            return SinkValue::null();
        case google::protobuf::Value::kBoolValue:
            return SinkValue::boolean(value.bool_value());
        case google::protobuf::Value::kNumberValue: {
            double number = value.number_value();
            if (std::isfinite(number) && std::floor(number) == number &&
                std::fabs(number) <= kMaxExactInteger) {
                return SinkValue::int64(static_cast<int64_t>(number));
            }
            return SinkValue::float64(number);
        }
        case google::protobuf::Value::kStringValue:
            return SinkValue::string(value.string_value());
        case google::protobuf::Value::kListValue: {
            std::vector<SinkValue> items;
            items.reserve(value.list_value().values_size());
            for (const auto& item : value.list_value().values()) {
                items.push_back(fromProtoValue(item));
            }
            return SinkValue::array(std::move(items));
        }
        case google::protobuf::Value::kStructValue: {
            const auto& fields = value.struct_value().fields();
            std::vector<std::string> names;
            names.reserve(fields.size());
            for (const auto& kv : fields) {
                names.push_back(kv.first);
            }
            std::sort(names.begin(), names.end());

            std::vector<SinkValue::Field> out;
            out.reserve(names.size());
            for (const auto& name : names) {
                out.emplace_back(name, fromProtoValue(fields.at(name)));
            }
            return SinkValue::structure(std::move(out));
        }
    }
    return SinkValue::null();
}
