#ifndef SINK_ERROR_HPP
#define SINK_ERROR_HPP

#include "topic_partition.hpp"
#include <stdexcept>
#include <string>

// Base error for the write-and-commit pipeline.
// rollBack() == true means the buffered data of topicPartitions() is suspect and
// must be discarded so the consumer redelivers from the last committed offset.
class SinkError : public std::runtime_error {
public:
    SinkError(const std::string& message,
              TopicPartitionSet topic_partitions,
              bool roll_back,
              std::string cause = "")
        : std::runtime_error(message)
        , topic_partitions_(std::move(topic_partitions))
        , roll_back_(roll_back)
        , cause_(std::move(cause)) {}

    const TopicPartitionSet& topicPartitions() const { return topic_partitions_; }
    bool rollBack() const { return roll_back_; }
    const std::string& cause() const { return cause_; }

private:
    TopicPartitionSet topic_partitions_;
    bool roll_back_;
    std::string cause_;
};

// Invalid or incomplete configuration, fatal at startup
class ConfigurationError : public SinkError {
public:
    explicit ConfigurationError(const std::string& message)
        : SinkError(message, {}, false) {}
};

// Transient storage failure; buffers are kept and the batch can be retried
class StorageError : public SinkError {
public:
    StorageError(const std::string& message,
                 TopicPartitionSet topic_partitions = {},
                 std::string cause = "")
        : SinkError(message, std::move(topic_partitions), false, std::move(cause)) {}
};

// Codec failure or schema mismatch; buffered data is suspect
class FormatError : public SinkError {
public:
    FormatError(const std::string& message,
                TopicPartitionSet topic_partitions = {},
                std::string cause = "")
        : SinkError(message, std::move(topic_partitions), true, std::move(cause)) {}
};

// Offset went backwards within a buffered range
class OrderingError : public SinkError {
public:
    OrderingError(const std::string& message, TopicPartitionSet topic_partitions)
        : SinkError(message, std::move(topic_partitions), true) {}
};

#endif // SINK_ERROR_HPP
