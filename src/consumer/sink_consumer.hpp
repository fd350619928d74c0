#ifndef SINK_CONSUMER_HPP
#define SINK_CONSUMER_HPP

#include "../config.hpp"
#include "../sink/sink_task.hpp"
#include "dead_letter_queue.hpp"
#include "sink_stats.hpp"
#include "value_converter.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include <cppkafka/cppkafka.h>

// Kafka side of the sink. Polls batches, hands them to the SinkTask and
// commits only what preCommit reports as sealed.
class SinkConsumer {
public:
    SinkConsumer(const SinkConfig& config, SinkTask& task, WriterManager& manager, SinkStats& stats);
    ~SinkConsumer();

    // Initialize the consumer (must be called before start)
    bool initialize();

    // Runs the poll loop in the current thread until stop()
    void start();

    void stop();

    bool isRunning() const { return running_; }
    bool hasFatalError() const { return fatal_error_; }

    // Asks the poll loop to seal everything on its next iteration
    void requestFlush() { flush_requested_ = true; }

    // Kafka message to SinkRecord. Throws FormatError when the payload cannot be converted.
    static SinkRecord toSinkRecord(const cppkafka::Message& msg, ConverterType key_type, ConverterType value_type);

    // Counts a record that failed conversion and parks it in the DLQ when one
    // is configured. Returns true when the record was written to the DLQ.
    bool deadLetter(const DeadLetter& letter, const std::string& error_reason);

    // Exponential backoff with jitter
    static std::chrono::milliseconds calculateBackoff(int attempt, int base_delay_ms, int max_delay_ms);

private:
    SinkConfig config_;
    SinkTask& task_;
    WriterManager& manager_;
    SinkStats& stats_;
    ConverterType key_type_;
    ConverterType value_type_;
    DeadLetterQueue dlq_;

    std::atomic<bool> running_;
    std::atomic<bool> flush_requested_;
    bool fatal_error_;

    std::unique_ptr<cppkafka::Consumer> consumer_;
    std::unique_ptr<cppkafka::Configuration> kafka_config_;

    // Highest offset handed to the task per partition
    std::map<TopicPartition, int64_t> processed_offsets_;

    // Last sink offset committed to Kafka per partition
    std::map<TopicPartition, int64_t> committed_offsets_;

    // Where to restart a partition after a rollback
    std::map<TopicPartition, int64_t> replay_offsets_;

    std::chrono::steady_clock::time_point last_commit_time_;

    void onPartitionsAssigned(cppkafka::TopicPartitionList& partitions);
    void onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions);

    // Converts and delivers one polled batch, retrying recoverable errors
    void processBatch(const std::vector<cppkafka::Message>& messages);

    // Runs put() with retries of recoverable errors. On failure `rolled_back`
    // holds the partitions whose buffers were discarded.
    bool deliver(const std::vector<SinkRecord>& records, TopicPartitionSet& rolled_back);

    void handleFlushRequest();

    // Commits preCommit offsets of the given partitions (all when empty)
    bool commitOffsets(const TopicPartitionSet& only = {});

    // Seek partitions back to their replay offsets
    void replay(const TopicPartitionSet& partitions);

    bool seekPartition(const TopicPartition& tp, int64_t offset);

    void updateStats();
};

#endif // SINK_CONSUMER_HPP
