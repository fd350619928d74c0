#ifndef PARTITION_WRITER_HPP
#define PARTITION_WRITER_HPP

#include "object_key.hpp"
#include "rotation_policy.hpp"
#include "sink_value.hpp"
#include "topic_partition.hpp"
#include "../formats/format_writer.hpp"
#include "../storage/storage_interface.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

enum class WriterState {
    Empty,      // no open format writer
    Buffering,  // accepting appends
    Uploading   // staged file closed, storage put still outstanding
};

const char* writerStateName(WriterState state);

// Records buffered in the open staged object of one WriteKey
struct PendingState {
    int64_t first_offset = -1;
    int64_t last_offset = -1;
    int64_t record_count = 0;
    std::chrono::system_clock::time_point created_at;
    std::unique_ptr<FormatWriter> writer;
    std::string staged_path;
};

enum class WriteOutcome {
    Appended,
    Duplicate,  // inside the buffered range, dropped
    Skipped     // at or below the sealed offset, dropped
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Callback for notifying the manager of a sealed object
using SealCallback = std::function<void(const ObjectKey& key)>;

// Writer for a single WriteKey.
// Owns at most one PendingState and moves it through
// Empty -> Buffering -> (seal) -> Empty, with Uploading in between when the
// storage put fails. An Uploading object is retried before the next append.
class PartitionWriter {
public:
    struct Options {
        std::string prefix;
        std::string extension;
        std::string staging_dir;
        RotationPolicy policy;
    };

    PartitionWriter(WriteKey key,
                    StorageInterface& storage,
                    const FormatWriterFactory& factory,
                    const Options& options,
                    Clock clock,
                    int64_t sealed_offset,
                    SealCallback seal_callback);
    ~PartitionWriter();

    PartitionWriter(const PartitionWriter&) = delete;
    PartitionWriter& operator=(const PartitionWriter&) = delete;

    // Appends one record and seals when a rotation threshold trips.
    // Throws OrderingError, FormatError or StorageError tagged with the topic-partition.
    WriteOutcome write(int64_t offset, const MessageDetail& detail);

    // Seals the buffered object if the rotation policy has tripped.
    // Returns true if an object was sealed.
    bool sealIfRequired();

    // Seals the buffered object regardless of thresholds
    bool seal(RotationReason reason);

    // Puts an object left in Uploading again. Returns true when nothing is outstanding.
    bool retryUpload();

    // Drops buffered records and the staged file without sealing
    void discard();

    WriterState getState() const { return state_; }
    const WriteKey& getWriteKey() const { return key_; }

    // First offset not yet durable, -1 when nothing is buffered
    int64_t getFirstPendingOffset() const { return pending_.first_offset; }
    int64_t getBufferedRecordCount() const { return pending_.record_count; }
    std::chrono::milliseconds getPendingAge() const;
    size_t getBufferedBytes() const;

private:
    WriteKey key_;
    StorageInterface& storage_;
    FormatWriterFactory factory_;
    Options options_;
    Clock clock_;
    int64_t sealed_offset_;
    SealCallback seal_callback_;

    WriterState state_;
    PendingState pending_;
    ObjectKey upload_key_;

    void startPending(int64_t offset);
    void upload();
    void reset();
    void releaseLocal();
    std::string stagedPathFor(int64_t offset) const;
    std::string readStagedFile() const;
    TopicPartitionSet affected() const { return {key_.topic_partition}; }
};

#endif // PARTITION_WRITER_HPP
