#include "partitioner.hpp"
#include "sink_error.hpp"
#include "../config.hpp"
#include <ctime>

const char* Partitioner::kMissingValue = "[missing]";

std::string PartitionField::label() const {
    switch (kind) {
        case Kind::Key: return "key";
        case Kind::Value: return name;
        case Kind::Header: return name;
        case Kind::Topic: return "topic";
        case Kind::Partition: return "partition";
        case Kind::Date: return "date";
    }
    return name;
}

Partitioner::Partitioner(std::vector<PartitionField> fields)
    : fields_(std::move(fields)) {
}

Partitioner Partitioner::fromString(const std::string& partition_by) {
    std::vector<PartitionField> fields;
    for (const auto& item : SinkConfig::splitList(partition_by)) {
        PartitionField field;
        if (item == "_key") {
            field.kind = PartitionField::Kind::Key;
        } else if (item == "_topic") {
            field.kind = PartitionField::Kind::Topic;
        } else if (item == "_partition") {
            field.kind = PartitionField::Kind::Partition;
        } else if (item.compare(0, 8, "_header.") == 0) {
            field.kind = PartitionField::Kind::Header;
            field.name = item.substr(8);
        } else if (item.compare(0, 6, "_date.") == 0) {
            field.kind = PartitionField::Kind::Date;
            field.name = item.substr(6);
        } else if (item.compare(0, 7, "_value.") == 0) {
            field.kind = PartitionField::Kind::Value;
            field.name = item.substr(7);
        } else if (!item.empty() && item[0] == '_') {
            throw ConfigurationError("Unknown partition field: " + item);
        } else {
            field.kind = PartitionField::Kind::Value;
            field.name = item;
        }

        if ((field.kind == PartitionField::Kind::Header ||
             field.kind == PartitionField::Kind::Date ||
             field.kind == PartitionField::Kind::Value) && field.name.empty()) {
            throw ConfigurationError("Partition field needs a name: " + item);
        }
        fields.push_back(field);
    }
    return Partitioner(std::move(fields));
}

std::string Partitioner::bucketPath(const TopicPartition& tp, const MessageDetail& detail) const {
    std::string path;
    for (const auto& field : fields_) {
        if (!path.empty()) {
            path += "/";
        }
        path += sanitize(field.label()) + "=" + sanitize(extract(field, tp, detail));
    }
    return path;
}

std::string Partitioner::extract(const PartitionField& field,
                                 const TopicPartition& tp,
                                 const MessageDetail& detail) const {
    switch (field.kind) {
        case PartitionField::Kind::Topic:
            return tp.topic;
        case PartitionField::Kind::Partition:
            return std::to_string(tp.partition);
        case PartitionField::Kind::Key:
            if (!detail.has_key || detail.key.isNull() || !detail.key.isPrimitive()) {
                return kMissingValue;
            }
            return detail.key.toString();
        case PartitionField::Kind::Header: {
            auto it = detail.headers.find(field.name);
            return it == detail.headers.end() ? kMissingValue : it->second;
        }
        case PartitionField::Kind::Date: {
            if (!detail.has_timestamp) {
                return kMissingValue;
            }
            auto time_t_val = std::chrono::system_clock::to_time_t(detail.timestamp);
            std::tm tm_val;
            gmtime_r(&time_t_val, &tm_val);
            char buf[128];
            size_t n = std::strftime(buf, sizeof(buf), field.name.c_str(), &tm_val);
            return n == 0 ? kMissingValue : std::string(buf, n);
        }
        case PartitionField::Kind::Value: {
            const SinkValue* current = &detail.value;
            size_t start = 0;
            while (current) {
                size_t dot = field.name.find('.', start);
                std::string part = field.name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
                current = current->field(part);
                if (dot == std::string::npos) {
                    break;
                }
                start = dot + 1;
            }
            if (!current || current->isNull() || !current->isPrimitive()) {
                return kMissingValue;
            }
            return current->toString();
        }
    }
    return kMissingValue;
}

std::string Partitioner::sanitize(const std::string& value) {
    std::string out = value;
    for (auto& c : out) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    if (out.empty()) {
        return kMissingValue;
    }
    return out;
}
