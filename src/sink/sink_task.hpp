#ifndef SINK_TASK_HPP
#define SINK_TASK_HPP

#include "sink_error.hpp"
#include "sink_value.hpp"
#include "topic_partition.hpp"
#include "writer_manager.hpp"
#include <cstdint>
#include <map>
#include <vector>

// One record delivered by the consumer
struct SinkRecord {
    TopicPartition topic_partition;
    int64_t offset = 0;
    MessageDetail detail;
};

// Task-level driver of the writer manager.
// put() turns rollback-required errors into cleanUp() of the affected
// partitions and rethrows, so the caller redelivers from the committed offset.
class SinkTask {
public:
    explicit SinkTask(WriterManager& manager);

    std::map<TopicPartition, int64_t> open(const TopicPartitionSet& partitions);

    void put(const std::vector<SinkRecord>& records);

    std::map<TopicPartition, int64_t> preCommit(const std::map<TopicPartition, int64_t>& offsets) const;

    // Seals buffered objects, same error handling as put()
    void flush();
    void flush(const TopicPartitionSet& partitions);

    void close(const TopicPartitionSet& partitions);

    void stop();

    // Discards buffered data of the partitions so they can be redelivered
    void rollBack(const TopicPartitionSet& partitions);

    uint64_t getRecordsWritten() const { return records_written_; }
    uint64_t getRecordsSkipped() const { return records_skipped_; }
    uint64_t getRollbacks() const { return rollbacks_; }

private:
    WriterManager& manager_;
    uint64_t records_written_;
    uint64_t records_skipped_;
    uint64_t rollbacks_;

    void handleError(const SinkError& e);
    static void logBatchBounds(const std::vector<SinkRecord>& records);
};

#endif // SINK_TASK_HPP
