#ifndef SINK_VALUE_HPP
#define SINK_VALUE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Canonical structured value handed to the format writers.
// Struct keeps field order (it defines column order), Map does not.
class SinkValue {
public:
    enum class Type {
        Null,
        Boolean,
        Int64,
        Double,
        String,
        Bytes,
        Array,
        Struct,
        Map
    };

    using Field = std::pair<std::string, SinkValue>;

    SinkValue() : type_(Type::Null) {}

    static SinkValue null() { return SinkValue(); }
    static SinkValue boolean(bool value);
    static SinkValue int64(int64_t value);
    static SinkValue float64(double value);
    static SinkValue string(std::string value);
    static SinkValue bytes(std::string value);
    static SinkValue array(std::vector<SinkValue> items);
    static SinkValue structure(std::vector<Field> fields);
    static SinkValue map(std::map<std::string, SinkValue> entries);

    Type type() const { return type_; }
    bool isNull() const { return type_ == Type::Null; }
    bool isPrimitive() const;

    bool asBool() const { return bool_value_; }
    int64_t asInt64() const { return int_value_; }
    double asDouble() const { return double_value_; }
    const std::string& asString() const { return string_value_; }
    const std::vector<SinkValue>& items() const { return items_; }
    const std::vector<Field>& fields() const { return fields_; }
    const std::map<std::string, SinkValue>& entries() const { return entries_; }

    // Field lookup for Struct and Map values, nullptr when absent
    const SinkValue* field(const std::string& name) const;

    // Flat text rendering used for partition paths, CSV cells and text output
    std::string toString() const;

    static const char* typeName(Type type);

    bool operator==(const SinkValue& other) const;
    bool operator!=(const SinkValue& other) const { return !(*this == other); }

private:
    Type type_;
    bool bool_value_ = false;
    int64_t int_value_ = 0;
    double double_value_ = 0.0;
    std::string string_value_;  // String and Bytes
    std::vector<SinkValue> items_;
    std::vector<Field> fields_;
    std::map<std::string, SinkValue> entries_;
};

// A record as seen by the sink: optional key, value, headers and timestamp
struct MessageDetail {
    bool has_key = false;
    SinkValue key;
    SinkValue value;
    std::map<std::string, std::string> headers;
    bool has_timestamp = false;
    std::chrono::system_clock::time_point timestamp;
};

#endif // SINK_VALUE_HPP
