#ifndef VALUE_CONVERTER_HPP
#define VALUE_CONVERTER_HPP

#include "../sink/sink_value.hpp"
#include <google/protobuf/struct.pb.h>
#include <string>

enum class ConverterType {
    Json,    // JSON document mapped to structured values
    String,  // UTF-8 string
    Bytes    // raw bytes
};

// Turns Kafka key and value payloads into SinkValues.
// An empty payload (tombstone) always becomes Null.
class ValueConverter {
public:
    // Throws ConfigurationError for unknown names
    static ConverterType typeFromString(const std::string& name);

    // Throws FormatError when a JSON payload cannot be parsed
    static SinkValue convert(ConverterType type, const std::string& payload);

    static SinkValue fromJson(const std::string& json);

    // Integral numbers within the exact double range become Int64.
    // Object keys are sorted to give a stable field order.
    static SinkValue fromProtoValue(const google::protobuf::Value& value);
};

#endif // VALUE_CONVERTER_HPP
