#ifndef TOPIC_PARTITION_HPP
#define TOPIC_PARTITION_HPP

#include <cstdint>
#include <ostream>
#include <set>
#include <string>
#include <tuple>

// Identity of a Kafka topic-partition, ordered by (topic, partition)
struct TopicPartition {
    std::string topic;
    int32_t partition = 0;

    TopicPartition() = default;
    TopicPartition(std::string t, int32_t p) : topic(std::move(t)), partition(p) {}

    std::string toString() const { return topic + "-" + std::to_string(partition); }

    bool operator<(const TopicPartition& other) const {
        return std::tie(topic, partition) < std::tie(other.topic, other.partition);
    }
    bool operator==(const TopicPartition& other) const {
        return topic == other.topic && partition == other.partition;
    }
    bool operator!=(const TopicPartition& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TopicPartition& tp) {
    return os << tp.toString();
}

using TopicPartitionSet = std::set<TopicPartition>;

// One output stream: a topic-partition fanned out to a bucket path.
// An empty bucket path means the partition is not fanned out.
struct WriteKey {
    TopicPartition topic_partition;
    std::string bucket_path;

    WriteKey() = default;
    WriteKey(TopicPartition tp, std::string path)
        : topic_partition(std::move(tp)), bucket_path(std::move(path)) {}

    std::string toString() const {
        if (bucket_path.empty()) {
            return topic_partition.toString();
        }
        return topic_partition.toString() + "[" + bucket_path + "]";
    }

    bool operator<(const WriteKey& other) const {
        return std::tie(topic_partition, bucket_path) <
               std::tie(other.topic_partition, other.bucket_path);
    }
    bool operator==(const WriteKey& other) const {
        return topic_partition == other.topic_partition && bucket_path == other.bucket_path;
    }
};

#endif // TOPIC_PARTITION_HPP
