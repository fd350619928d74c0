#ifndef WRITER_MANAGER_HPP
#define WRITER_MANAGER_HPP

#include "object_key.hpp"
#include "partition_writer.hpp"
#include "partitioner.hpp"
#include "rotation_policy.hpp"
#include "topic_partition.hpp"
#include "../formats/format_selection.hpp"
#include "../formats/format_writer.hpp"
#include "../storage/storage_interface.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>

struct WriterManagerOptions {
    std::string prefix;
    std::string staging_dir;
    FormatSelection format;
    RotationPolicy policy;
    int64_t default_offset = -1;  // resume offset when storage holds nothing, -1 = none
};

// Owns every PendingState of the task and the offset ledger.
// Routes records to per-WriteKey writers, decides when to seal, and answers
// preCommit with sealed offsets only. Not thread-safe: one task thread drives it.
class WriterManager {
public:
    WriterManager(StorageInterface& storage,
                  FormatWriterFactory factory,
                  Partitioner partitioner,
                  WriterManagerOptions options,
                  Clock clock = [] { return std::chrono::system_clock::now(); });
    ~WriterManager();

    // Recovers sealed offsets from storage for newly assigned partitions and
    // returns the offset to resume each one from. Partitions without a resume
    // offset are left out and continue from the consumer group position.
    // Read-only against storage; throws StorageError when listing fails.
    std::map<TopicPartition, int64_t> open(const TopicPartitionSet& partitions);

    WriteKey resolveWriteKey(const TopicPartition& tp, const MessageDetail& detail) const;

    WriteOutcome write(const WriteKey& key, int64_t offset, const MessageDetail& detail);

    // Retries failed uploads and seals objects past the age threshold
    void recommitPending();

    // Seals every object whose rotation policy has tripped (idle flush)
    void commitAllWritersIfFlushRequired();

    // Seals every buffered object regardless of thresholds
    void flushAll();
    void flush(const TopicPartitionSet& partitions);

    // min(requested, committed), capped below the first offset still buffered.
    // Partitions with nothing committed are left out.
    std::map<TopicPartition, int64_t> preCommit(const std::map<TopicPartition, int64_t>& requested) const;

    // Drops sealed offsets at or below `offset` once it has been committed to
    // Kafka. Redelivery starts above it, so those entries can no longer skip anything.
    void pruneCommitted(const TopicPartition& tp, int64_t offset);

    // Discards every buffered object of the partition without sealing
    void cleanUp(const TopicPartition& tp);

    // Best-effort seal of the partitions' objects, then forgets them.
    // Errors are logged, never thrown.
    void close(const TopicPartitionSet& partitions);
    void close();

    // -1 when nothing has been sealed for the partition
    int64_t getCommittedOffset(const TopicPartition& tp) const;

    const TopicPartitionSet& getAssignedPartitions() const { return assigned_; }
    size_t getOpenWriterCount() const;
    size_t getWriterCount() const { return writers_.size(); }
    size_t getSealedKeyCount() const { return sealed_offsets_.size(); }
    int64_t getBufferedRecordCount() const;
    uint64_t getSealedObjectCount() const { return sealed_objects_; }

private:
    StorageInterface& storage_;
    FormatWriterFactory factory_;
    Partitioner partitioner_;
    WriterManagerOptions options_;
    PartitionWriter::Options writer_options_;
    Clock clock_;

    TopicPartitionSet assigned_;
    std::map<WriteKey, std::unique_ptr<PartitionWriter>> writers_;

    // Sealed offsets recovered from storage or advanced by seals
    std::map<WriteKey, int64_t> sealed_offsets_;
    std::map<TopicPartition, int64_t> committed_offsets_;
    uint64_t sealed_objects_;

    PartitionWriter& writerFor(const WriteKey& key);

    // Removes writers that are back in Empty
    void dropIdleWriters();

    // Handle an object sealed by a writer
    void onSealed(const ObjectKey& key);

    void forget(const TopicPartition& tp);
};

#endif // WRITER_MANAGER_HPP
