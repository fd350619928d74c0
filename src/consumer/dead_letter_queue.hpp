#ifndef DEAD_LETTER_QUEUE_HPP
#define DEAD_LETTER_QUEUE_HPP

#include "../sink/topic_partition.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

// Kafka record that could not be converted
struct DeadLetter {
    TopicPartition topic_partition;
    int64_t offset = -1;
    std::string payload;
};

// Append-only file of records that failed conversion.
// Each entry is a text header line followed by the length-prefixed raw payload
// and a "---" separator. Disabled when the path is empty.
class DeadLetterQueue {
public:
    explicit DeadLetterQueue(const std::string& dlq_path);
    ~DeadLetterQueue();

    // Write a failed record to the DLQ
    bool write(const DeadLetter& letter, const std::string& error_reason);

    // Check if DLQ is enabled
    bool isEnabled() const { return enabled_; }

    uint64_t getWrittenCount() const { return written_; }

private:
    std::string dlq_path_;
    bool enabled_;
    uint64_t written_;
    std::unique_ptr<std::ofstream> dlq_file_;
    std::mutex write_mutex_;

    bool initialize();
};

#endif // DEAD_LETTER_QUEUE_HPP
