#include "sink_task.hpp"
#include "sink_error.hpp"
#include <algorithm>
#include <iostream>

SinkTask::SinkTask(WriterManager& manager)
    : manager_(manager)
    , records_written_(0)
    , records_skipped_(0)
    , rollbacks_(0) {
}

std::map<TopicPartition, int64_t> SinkTask::open(const TopicPartitionSet& partitions) {
    std::cout << "Opening " << partitions.size() << " partition(s): ";
    for (const auto& tp : partitions) {
        std::cout << tp << " ";
    }
    std::cout << std::endl;
    return manager_.open(partitions);
}

void SinkTask::put(const std::vector<SinkRecord>& records) {
    try {
        manager_.recommitPending();

        if (records.empty()) {
            manager_.commitAllWritersIfFlushRequired();
            return;
        }

        logBatchBounds(records);

        for (const auto& record : records) {
            WriteKey key = manager_.resolveWriteKey(record.topic_partition, record.detail);
            WriteOutcome outcome = manager_.write(key, record.offset, record.detail);
            if (outcome == WriteOutcome::Appended) {
                ++records_written_;
            } else {
                ++records_skipped_;
            }
        }
    } catch (const SinkError& e) {
        handleError(e);
        throw;
    }
}

void SinkTask::flush() {
    try {
        manager_.flushAll();
    } catch (const SinkError& e) {
        handleError(e);
        throw;
    }
}

void SinkTask::flush(const TopicPartitionSet& partitions) {
    try {
        manager_.flush(partitions);
    } catch (const SinkError& e) {
        handleError(e);
        throw;
    }
}

void SinkTask::handleError(const SinkError& e) {
    if (e.rollBack()) {
        std::cerr << "Rolling back after error: " << e.what() << std::endl;
        rollBack(e.topicPartitions());
    } else {
        std::cerr << "Recoverable error, buffers kept: " << e.what() << std::endl;
    }
}

std::map<TopicPartition, int64_t> SinkTask::preCommit(const std::map<TopicPartition, int64_t>& offsets) const {
    return manager_.preCommit(offsets);
}

void SinkTask::close(const TopicPartitionSet& partitions) {
    manager_.close(partitions);
}

void SinkTask::stop() {
    std::cout << "Stopping sink task: " << records_written_ << " records written, "
              << records_skipped_ << " skipped, " << rollbacks_ << " rollback(s)" << std::endl;
    manager_.close();
}

void SinkTask::rollBack(const TopicPartitionSet& partitions) {
    ++rollbacks_;
    for (const auto& tp : partitions) {
        manager_.cleanUp(tp);
    }
}

void SinkTask::logBatchBounds(const std::vector<SinkRecord>& records) {
    std::map<TopicPartition, std::pair<int64_t, int64_t>> bounds;
    for (const auto& record : records) {
        auto it = bounds.find(record.topic_partition);
        if (it == bounds.end()) {
            bounds[record.topic_partition] = {record.offset, record.offset};
        } else {
            it->second.first = std::min(it->second.first, record.offset);
            it->second.second = std::max(it->second.second, record.offset);
        }
    }

    std::cout << "Received " << records.size() << " records:";
    for (const auto& kv : bounds) {
        std::cout << " " << kv.first << " [" << kv.second.first << ", " << kv.second.second << "]";
    }
    std::cout << std::endl;
}
