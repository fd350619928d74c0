#ifndef PARTITIONER_HPP
#define PARTITIONER_HPP

#include "sink_value.hpp"
#include "topic_partition.hpp"
#include <string>
#include <vector>

// One component of the bucket path of a record
struct PartitionField {
    enum class Kind {
        Key,        // _key
        Value,      // field name of the value, dotted for nested structs
        Header,     // _header.<name>
        Topic,      // _topic
        Partition,  // _partition
        Date        // _date.<strftime pattern>, from the record timestamp in UTC
    };

    Kind kind = Kind::Value;
    std::string name;

    // Left-hand side of the name=value path segment
    std::string label() const;
};

// Derives the bucket path of a WriteKey from record content.
// With no fields every record of a topic-partition shares one WriteKey.
class Partitioner {
public:
    Partitioner() = default;
    explicit Partitioner(std::vector<PartitionField> fields);

    // Parses a comma separated list such as "_header.region,customer.id,_date.%Y-%m-%d"
    static Partitioner fromString(const std::string& partition_by);

    bool fansOut() const { return !fields_.empty(); }
    const std::vector<PartitionField>& fields() const { return fields_; }

    std::string bucketPath(const TopicPartition& tp, const MessageDetail& detail) const;

    static const char* kMissingValue;

private:
    std::vector<PartitionField> fields_;

    std::string extract(const PartitionField& field,
                        const TopicPartition& tp,
                        const MessageDetail& detail) const;

    static std::string sanitize(const std::string& value);
};

#endif // PARTITIONER_HPP
