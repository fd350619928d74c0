#include "sink_value.hpp"
#include <sstream>
#include <iomanip>

SinkValue SinkValue::boolean(bool value) {
    SinkValue v;
    v.type_ = Type::Boolean;
    v.bool_value_ = value;
    return v;
}

SinkValue SinkValue::int64(int64_t value) {
    SinkValue v;
    v.type_ = Type::Int64;
    v.int_value_ = value;
    return v;
}

SinkValue SinkValue::float64(double value) {
    SinkValue v;
    v.type_ = Type::Double;
    v.double_value_ = value;
    return v;
}

SinkValue SinkValue::string(std::string value) {
    SinkValue v;
    v.type_ = Type::String;
    v.string_value_ = std::move(value);
    return v;
}

SinkValue SinkValue::bytes(std::string value) {
    SinkValue v;
    v.type_ = Type::Bytes;
    v.string_value_ = std::move(value);
    return v;
}

SinkValue SinkValue::array(std::vector<SinkValue> items) {
    SinkValue v;
    v.type_ = Type::Array;
    v.items_ = std::move(items);
    return v;
}

SinkValue SinkValue::structure(std::vector<Field> fields) {
    SinkValue v;
    v.type_ = Type::Struct;
    v.fields_ = std::move(fields);
    return v;
}

SinkValue SinkValue::map(std::map<std::string, SinkValue> entries) {
    SinkValue v;
    v.type_ = Type::Map;
    v.entries_ = std::move(entries);
    return v;
}

bool SinkValue::isPrimitive() const {
    return type_ != Type::Array && type_ != Type::Struct && type_ != Type::Map;
}

const SinkValue* SinkValue::field(const std::string& name) const {
    if (type_ == Type::Struct) {
        for (const auto& f : fields_) {
            if (f.first == name) {
                return &f.second;
            }
        }
    } else if (type_ == Type::Map) {
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

static std::string bytesToHex(const std::string& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : bytes) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

std::string SinkValue::toString() const {
    switch (type_) {
        case Type::Null:
            return "";
        case Type::Boolean:
            return bool_value_ ? "true" : "false";
        case Type::Int64:
            return std::to_string(int_value_);
        case Type::Double: {
            std::ostringstream oss;
            oss << std::setprecision(17) << double_value_;
            return oss.str();
        }
        case Type::String:
            return string_value_;
        case Type::Bytes:
            return bytesToHex(string_value_);
        case Type::Array: {
            std::ostringstream oss;
            for (size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) oss << ",";
                oss << items_[i].toString();
            }
            return oss.str();
        }
        case Type::Struct: {
            std::ostringstream oss;
            bool first = true;
            for (const auto& f : fields_) {
                if (!first) oss << ",";
                first = false;
                oss << f.first << "=" << f.second.toString();
            }
            return oss.str();
        }
        case Type::Map: {
            std::ostringstream oss;
            bool first = true;
            for (const auto& kv : entries_) {
                if (!first) oss << ",";
                first = false;
                oss << kv.first << "=" << kv.second.toString();
            }
            return oss.str();
        }
    }
    return "";
}

const char* SinkValue::typeName(Type type) {
    switch (type) {
        case Type::Null: return "null";
        case Type::Boolean: return "boolean";
        case Type::Int64: return "int64";
        case Type::Double: return "double";
        case Type::String: return "string";
        case Type::Bytes: return "bytes";
        case Type::Array: return "array";
        case Type::Struct: return "struct";
        case Type::Map: return "map";
    }
    return "unknown";
}

bool SinkValue::operator==(const SinkValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::Null: return true;
        case Type::Boolean: return bool_value_ == other.bool_value_;
        case Type::Int64: return int_value_ == other.int_value_;
        case Type::Double: return double_value_ == other.double_value_;
        case Type::String:
        case Type::Bytes: return string_value_ == other.string_value_;
        case Type::Array: return items_ == other.items_;
        case Type::Struct: return fields_ == other.fields_;
        case Type::Map: return entries_ == other.entries_;
    }
    return false;
}
