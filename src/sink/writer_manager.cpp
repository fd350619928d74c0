#include "writer_manager.hpp"
#include "sink_error.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <vector>

WriterManager::WriterManager(StorageInterface& storage,
                             FormatWriterFactory factory,
                             Partitioner partitioner,
                             WriterManagerOptions options,
                             Clock clock)
    : storage_(storage)
    , factory_(std::move(factory))
    , partitioner_(std::move(partitioner))
    , options_(std::move(options))
    , clock_(std::move(clock))
    , sealed_objects_(0) {
    writer_options_.prefix = options_.prefix;
    writer_options_.extension = options_.format.extension();
    writer_options_.staging_dir = options_.staging_dir;
    writer_options_.policy = options_.policy;
}

WriterManager::~WriterManager() {
    // Staged files of writers that were never closed are removed with them
    writers_.clear();
}

std::map<TopicPartition, int64_t> WriterManager::open(const TopicPartitionSet& partitions) {
    std::map<TopicPartition, int64_t> resume_offsets;
    if (partitions.empty()) {
        return resume_offsets;
    }

    std::vector<ObjectMetadata> objects;
    try {
        objects = storage_.listObjects(ObjectKey::listingPrefix(options_.prefix));
    } catch (const StorageError& e) {
        std::cerr << "Failed to list " << storage_.describe() << ": " << e.what() << std::endl;
        throw StorageError("Failed to discover sealed offsets in " + storage_.describe(),
                           partitions, e.what());
    }

    std::map<WriteKey, int64_t> recovered;
    std::map<TopicPartition, int64_t> recovered_committed;
    for (const auto& object : objects) {
        ObjectKey key;
        if (!ObjectKey::parse(object.key, options_.prefix, key)) {
            continue;
        }
        const TopicPartition& tp = key.write_key.topic_partition;
        if (partitions.find(tp) == partitions.end()) {
            continue;
        }
        auto it = recovered.find(key.write_key);
        if (it == recovered.end() || key.end_offset > it->second) {
            recovered[key.write_key] = key.end_offset;
        }
        auto cit = recovered_committed.find(tp);
        if (cit == recovered_committed.end() || key.end_offset > cit->second) {
            recovered_committed[tp] = key.end_offset;
        }
    }

    for (const auto& kv : recovered) {
        auto it = sealed_offsets_.find(kv.first);
        if (it == sealed_offsets_.end() || kv.second > it->second) {
            sealed_offsets_[kv.first] = kv.second;
        }
    }

    for (const auto& tp : partitions) {
        assigned_.insert(tp);

        auto cit = recovered_committed.find(tp);
        if (cit == recovered_committed.end()) {
            if (options_.default_offset >= 0) {
                resume_offsets[tp] = options_.default_offset;
            }
            std::cout << "Partition " << tp << ": No sealed objects found, starting from "
                      << (options_.default_offset >= 0 ? std::to_string(options_.default_offset)
                                                       : std::string("the consumer group position"))
                      << std::endl;
            continue;
        }

        auto committed = committed_offsets_.find(tp);
        if (committed == committed_offsets_.end() || cit->second > committed->second) {
            committed_offsets_[tp] = cit->second;
        }

        if (partitioner_.fansOut()) {
            // Buckets seal independently, so the highest sealed offset is not a
            // safe resume point. Per-bucket sealed offsets skip redelivered records.
            std::cout << "Partition " << tp << ": Recovered sealed offset " << cit->second
                      << ", resuming from the consumer group position" << std::endl;
            continue;
        }

        resume_offsets[tp] = cit->second + 1;
        std::cout << "Partition " << tp << ": Recovered sealed offset " << cit->second
                  << ", resuming from " << cit->second + 1 << std::endl;
    }

    return resume_offsets;
}

WriteKey WriterManager::resolveWriteKey(const TopicPartition& tp, const MessageDetail& detail) const {
    return WriteKey(tp, partitioner_.bucketPath(tp, detail));
}

PartitionWriter& WriterManager::writerFor(const WriteKey& key) {
    auto it = writers_.find(key);
    if (it != writers_.end()) {
        return *it->second;
    }

    if (assigned_.find(key.topic_partition) == assigned_.end()) {
        std::cerr << "Partition " << key.topic_partition
                  << ": Write before open, tracking it now" << std::endl;
        assigned_.insert(key.topic_partition);
    }

    int64_t sealed_offset = -1;
    auto sit = sealed_offsets_.find(key);
    if (sit != sealed_offsets_.end()) {
        sealed_offset = sit->second;
    }

    auto writer = std::make_unique<PartitionWriter>(
        key,
        storage_,
        factory_,
        writer_options_,
        clock_,
        sealed_offset,
        [this](const ObjectKey& sealed) { onSealed(sealed); }
    );
    it = writers_.emplace(key, std::move(writer)).first;
    return *it->second;
}

WriteOutcome WriterManager::write(const WriteKey& key, int64_t offset, const MessageDetail& detail) {
    PartitionWriter& writer = writerFor(key);
    WriteOutcome outcome = writer.write(offset, detail);
    if (writer.getState() == WriterState::Empty) {
        writers_.erase(key);
    }
    return outcome;
}

void WriterManager::recommitPending() {
    std::exception_ptr first_error;
    for (auto& kv : writers_) {
        PartitionWriter& writer = *kv.second;
        try {
            if (writer.getState() == WriterState::Uploading) {
                writer.retryUpload();
            } else if (writer.getState() == WriterState::Buffering &&
                       options_.policy.expired(writer.getPendingAge())) {
                writer.seal(RotationReason::Age);
            }
        } catch (const SinkError&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    dropIdleWriters();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void WriterManager::commitAllWritersIfFlushRequired() {
    std::exception_ptr first_error;
    for (auto& kv : writers_) {
        PartitionWriter& writer = *kv.second;
        try {
            if (writer.getState() == WriterState::Uploading) {
                writer.retryUpload();
            } else {
                writer.sealIfRequired();
            }
        } catch (const SinkError&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    dropIdleWriters();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void WriterManager::flushAll() {
    TopicPartitionSet partitions;
    for (const auto& kv : writers_) {
        partitions.insert(kv.first.topic_partition);
    }
    flush(partitions);
}

void WriterManager::flush(const TopicPartitionSet& partitions) {
    std::exception_ptr first_error;
    for (auto& kv : writers_) {
        if (partitions.find(kv.first.topic_partition) == partitions.end()) {
            continue;
        }
        try {
            kv.second->seal(RotationReason::Requested);
        } catch (const SinkError&) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    dropIdleWriters();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

std::map<TopicPartition, int64_t> WriterManager::preCommit(
    const std::map<TopicPartition, int64_t>& requested) const {
    std::map<TopicPartition, int64_t> result;

    for (const auto& kv : requested) {
        const TopicPartition& tp = kv.first;
        auto committed = committed_offsets_.find(tp);
        if (committed == committed_offsets_.end()) {
            continue;
        }

        int64_t offset = std::min(kv.second, committed->second);

        // Anything still buffered under the partition is not durable yet
        for (auto it = writers_.lower_bound(WriteKey(tp, ""));
             it != writers_.end() && it->first.topic_partition == tp; ++it) {
            int64_t first_pending = it->second->getFirstPendingOffset();
            if (first_pending >= 0 && first_pending - 1 < offset) {
                offset = first_pending - 1;
            }
        }

        if (offset >= 0) {
            result[tp] = offset;
        }
    }

    return result;
}

void WriterManager::cleanUp(const TopicPartition& tp) {
    auto it = writers_.lower_bound(WriteKey(tp, ""));
    size_t discarded = 0;
    while (it != writers_.end() && it->first.topic_partition == tp) {
        it->second->discard();
        it = writers_.erase(it);
        ++discarded;
    }
    std::cout << "Partition " << tp << ": Rolled back " << discarded << " writer(s)" << std::endl;
}

void WriterManager::close(const TopicPartitionSet& partitions) {
    for (const auto& tp : partitions) {
        auto it = writers_.lower_bound(WriteKey(tp, ""));
        while (it != writers_.end() && it->first.topic_partition == tp) {
            PartitionWriter& writer = *it->second;
            if (options_.policy.flush_on_shutdown) {
                try {
                    writer.seal(RotationReason::Requested);
                } catch (const std::exception& e) {
                    std::cerr << "Partition " << it->first.toString()
                              << ": Flush on close failed: " << e.what() << std::endl;
                }
            }
            writer.discard();
            it = writers_.erase(it);
        }
        forget(tp);
        std::cout << "Partition " << tp << ": Closed" << std::endl;
    }
}

void WriterManager::close() {
    TopicPartitionSet partitions = assigned_;
    for (const auto& kv : writers_) {
        partitions.insert(kv.first.topic_partition);
    }
    close(partitions);
}

void WriterManager::forget(const TopicPartition& tp) {
    assigned_.erase(tp);
    committed_offsets_.erase(tp);
    auto it = sealed_offsets_.lower_bound(WriteKey(tp, ""));
    while (it != sealed_offsets_.end() && it->first.topic_partition == tp) {
        it = sealed_offsets_.erase(it);
    }
}

void WriterManager::dropIdleWriters() {
    auto it = writers_.begin();
    while (it != writers_.end()) {
        if (it->second->getState() == WriterState::Empty) {
            it = writers_.erase(it);
        } else {
            ++it;
        }
    }
}

void WriterManager::pruneCommitted(const TopicPartition& tp, int64_t offset) {
    auto it = sealed_offsets_.lower_bound(WriteKey(tp, ""));
    while (it != sealed_offsets_.end() && it->first.topic_partition == tp) {
        if (it->second <= offset) {
            it = sealed_offsets_.erase(it);
        } else {
            ++it;
        }
    }
}

void WriterManager::onSealed(const ObjectKey& key) {
    auto sit = sealed_offsets_.find(key.write_key);
    if (sit == sealed_offsets_.end() || key.end_offset > sit->second) {
        sealed_offsets_[key.write_key] = key.end_offset;
    }

    const TopicPartition& tp = key.write_key.topic_partition;
    auto cit = committed_offsets_.find(tp);
    if (cit == committed_offsets_.end() || key.end_offset > cit->second) {
        committed_offsets_[tp] = key.end_offset;
    }
    ++sealed_objects_;
}

int64_t WriterManager::getCommittedOffset(const TopicPartition& tp) const {
    auto it = committed_offsets_.find(tp);
    return it == committed_offsets_.end() ? -1 : it->second;
}

size_t WriterManager::getOpenWriterCount() const {
    size_t count = 0;
    for (const auto& kv : writers_) {
        if (kv.second->getState() != WriterState::Empty) {
            ++count;
        }
    }
    return count;
}

int64_t WriterManager::getBufferedRecordCount() const {
    int64_t total = 0;
    for (const auto& kv : writers_) {
        total += kv.second->getBufferedRecordCount();
    }
    return total;
}
