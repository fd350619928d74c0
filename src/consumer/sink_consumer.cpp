#include "sink_consumer.hpp"
#include "../sink/sink_error.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <thread>

SinkConsumer::SinkConsumer(const SinkConfig& config, SinkTask& task, WriterManager& manager, SinkStats& stats)
    : config_(config)
    , task_(task)
    , manager_(manager)
    , stats_(stats)
    , key_type_(ValueConverter::typeFromString(config.key_converter))
    , value_type_(ValueConverter::typeFromString(config.value_converter))
    , dlq_(config.dlq_path)
    , running_(false)
    , flush_requested_(false)
    , fatal_error_(false)
    , last_commit_time_(std::chrono::steady_clock::now()) {
}

SinkConsumer::~SinkConsumer() {
    stop();
}

bool SinkConsumer::initialize() {
    try {
        kafka_config_ = std::make_unique<cppkafka::Configuration>(cppkafka::Configuration{
            {"metadata.broker.list", config_.queue_brokers},
            {"group.id", config_.consumer_group},
            {"enable.auto.commit", "false"},  // Offsets are committed only once sealed
            {"auto.offset.reset", "earliest"},
            {"enable.partition.eof", "false"},
        });

        consumer_ = std::make_unique<cppkafka::Consumer>(*kafka_config_);

        consumer_->set_assignment_callback([this](cppkafka::TopicPartitionList& partitions) {
            onPartitionsAssigned(partitions);
        });

        consumer_->set_revocation_callback([this](const cppkafka::TopicPartitionList& partitions) {
            onPartitionsRevoked(partitions);
        });

        consumer_->subscribe(config_.queue_topics);

        std::cout << "SinkConsumer initialized with brokers: " << config_.queue_brokers
                  << ", topics: " << config_.queue_topics.size()
                  << ", group: " << config_.consumer_group << std::endl;
        stats_.ready = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize SinkConsumer: " << e.what() << std::endl;
        return false;
    }
}

void SinkConsumer::start() {
    if (running_) {
        std::cerr << "Consumer is already running" << std::endl;
        return;
    }

    if (!consumer_) {
        std::cerr << "Consumer not initialized. Call initialize() first." << std::endl;
        return;
    }

    running_ = true;
    std::cout << "Starting sink consumer..." << std::endl;

    try {
        while (running_) {
            std::vector<cppkafka::Message> messages =
                consumer_->poll_batch(static_cast<size_t>(config_.poll_batch_size), std::chrono::milliseconds(1000));

            if (!running_) {
                break;
            }

            processBatch(messages);

            if (flush_requested_.exchange(false)) {
                handleFlushRequest();
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_commit_time_ >= std::chrono::seconds(config_.commit_interval_seconds)) {
                commitOffsets();
            }

            updateStats();
        }
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Kafka error in consumer: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error in consumer: " << e.what() << std::endl;
    }

    running_ = false;

    if (config_.flush_on_shutdown) {
        try {
            task_.flush();
        } catch (const SinkError& e) {
            std::cerr << "Flush on shutdown failed: " << e.what() << std::endl;
        }
    }
    commitOffsets();
    task_.stop();
    updateStats();

    if (fatal_error_) {
        std::cerr << "Sink consumer stopped after a fatal error" << std::endl;
    }
    std::cout << "Sink consumer stopped" << std::endl;
}

void SinkConsumer::stop() {
    running_ = false;
}

SinkRecord SinkConsumer::toSinkRecord(const cppkafka::Message& msg,
                                      ConverterType key_type,
                                      ConverterType value_type) {
    SinkRecord record;
    record.topic_partition = TopicPartition(msg.get_topic(), msg.get_partition());
    record.offset = msg.get_offset();

    const cppkafka::Buffer& key = msg.get_key();
    if (key.get_data() != nullptr) {
        record.detail.has_key = true;
        record.detail.key = ValueConverter::convert(
            key_type, std::string(reinterpret_cast<const char*>(key.get_data()), key.get_size()));
    }

    const cppkafka::Buffer& payload = msg.get_payload();
    std::string value;
    if (payload.get_data() != nullptr) {
        value.assign(reinterpret_cast<const char*>(payload.get_data()), payload.get_size());
    }
    record.detail.value = ValueConverter::convert(value_type, value);

    const auto& headers = msg.get_header_list();
    if (headers) {
        for (const auto& header : headers) {
            const cppkafka::Buffer& header_value = header.get_value();
            std::string text;
            if (header_value.get_data() != nullptr) {
                text.assign(reinterpret_cast<const char*>(header_value.get_data()), header_value.get_size());
            }
            record.detail.headers[header.get_name()] = text;
        }
    }

    auto timestamp = msg.get_timestamp();
    if (timestamp) {
        record.detail.has_timestamp = true;
        record.detail.timestamp = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(timestamp->get_timestamp()));
    }

    return record;
}

void SinkConsumer::processBatch(const std::vector<cppkafka::Message>& messages) {
    std::vector<SinkRecord> records;
    records.reserve(messages.size());

    for (const auto& msg : messages) {
        if (!msg) {
            continue;
        }
        if (msg.get_error()) {
            if (!msg.is_eof()) {
                std::cerr << "Consumer error: " << msg.get_error() << std::endl;
            }
            continue;
        }

        ++stats_.messages_consumed;
        TopicPartition tp(msg.get_topic(), msg.get_partition());
        if (replay_offsets_.find(tp) == replay_offsets_.end()) {
            replay_offsets_[tp] = msg.get_offset();
        }

        try {
            records.push_back(toSinkRecord(msg, key_type_, value_type_));
        } catch (const FormatError& e) {
            DeadLetter letter;
            letter.topic_partition = tp;
            letter.offset = msg.get_offset();
            const cppkafka::Buffer& payload = msg.get_payload();
            if (payload.get_data() != nullptr) {
                letter.payload.assign(reinterpret_cast<const char*>(payload.get_data()), payload.get_size());
            }
            deadLetter(letter, e.what());
        }
    }

    TopicPartitionSet rolled_back;
    if (deliver(records, rolled_back)) {
        for (const auto& record : records) {
            auto it = processed_offsets_.find(record.topic_partition);
            if (it == processed_offsets_.end() || record.offset > it->second) {
                processed_offsets_[record.topic_partition] = record.offset;
            }
        }
        if (!records.empty()) {
            ++stats_.batches;
        }
        return;
    }

    // Records after the failure were never written; replay the whole batch.
    // Rolled back partitions restart from their last committed offset.
    std::map<TopicPartition, int64_t> batch_start;
    for (const auto& record : records) {
        auto it = batch_start.find(record.topic_partition);
        if (it == batch_start.end() || record.offset < it->second) {
            batch_start[record.topic_partition] = record.offset;
        }
    }
    for (const auto& tp : rolled_back) {
        auto it = replay_offsets_.find(tp);
        if (it != replay_offsets_.end()) {
            batch_start[tp] = it->second;
        }
        processed_offsets_.erase(tp);
    }
    for (const auto& kv : batch_start) {
        seekPartition(kv.first, kv.second);
    }
}

bool SinkConsumer::deadLetter(const DeadLetter& letter, const std::string& error_reason) {
    ++stats_.conversion_errors;
    if (dlq_.isEnabled() && dlq_.write(letter, "Conversion failed: " + error_reason)) {
        ++stats_.dead_lettered;
        std::cerr << "Partition " << letter.topic_partition << ": Offset " << letter.offset
                  << " sent to the dead letter queue, conversion failed: " << error_reason << std::endl;
        return true;
    }
    std::cerr << "Partition " << letter.topic_partition << ": Dropping offset " << letter.offset
              << ", conversion failed: " << error_reason << std::endl;
    return false;
}

bool SinkConsumer::deliver(const std::vector<SinkRecord>& records, TopicPartitionSet& rolled_back) {
    for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            auto delay = calculateBackoff(attempt, config_.retry_base_delay_ms, config_.retry_max_delay_ms);
            std::cout << "Retry attempt " << attempt << " after " << delay.count() << "ms" << std::endl;
            ++stats_.retries;
            std::this_thread::sleep_for(delay);
        }

        try {
            task_.put(records);
            return true;
        } catch (const SinkError& e) {
            if (e.rollBack()) {
                ++stats_.rollbacks;
                rolled_back = e.topicPartitions();
                return false;
            }
            std::cerr << "Delivery attempt " << (attempt + 1) << " failed: " << e.what() << std::endl;
        }

        if (!running_) {
            break;
        }
    }

    // Give up on the buffers of the batch, redelivery starts from committed offsets
    std::cerr << "All delivery attempts failed, rolling back" << std::endl;
    for (const auto& record : records) {
        rolled_back.insert(record.topic_partition);
    }
    task_.rollBack(rolled_back);
    ++stats_.rollbacks;
    return false;
}

void SinkConsumer::handleFlushRequest() {
    std::cout << "Processing flush request..." << std::endl;
    try {
        task_.flush();
        commitOffsets();
        std::cout << "Flush completed" << std::endl;
    } catch (const SinkError& e) {
        std::cerr << "Flush failed: " << e.what() << std::endl;
        if (e.rollBack()) {
            ++stats_.rollbacks;
            for (const auto& tp : e.topicPartitions()) {
                processed_offsets_.erase(tp);
                auto it = replay_offsets_.find(tp);
                if (it != replay_offsets_.end()) {
                    seekPartition(tp, it->second);
                }
            }
        }
    }
}

bool SinkConsumer::commitOffsets(const TopicPartitionSet& only) {
    last_commit_time_ = std::chrono::steady_clock::now();
    if (!consumer_) {
        return false;
    }

    std::map<TopicPartition, int64_t> requested;
    for (const auto& kv : processed_offsets_) {
        if (only.empty() || only.find(kv.first) != only.end()) {
            requested[kv.first] = kv.second;
        }
    }

    std::map<TopicPartition, int64_t> safe = task_.preCommit(requested);
    std::vector<cppkafka::TopicPartition> offsets_to_commit;
    for (const auto& kv : safe) {
        auto it = committed_offsets_.find(kv.first);
        if (it != committed_offsets_.end() && kv.second <= it->second) {
            continue;
        }
        // Commit offset + 1, as Kafka commits the NEXT offset to read
        offsets_to_commit.emplace_back(kv.first.topic, kv.first.partition, kv.second + 1);
    }

    if (offsets_to_commit.empty()) {
        return true;
    }

    try {
        consumer_->commit(offsets_to_commit);
        for (const auto& committed : offsets_to_commit) {
            TopicPartition tp(committed.get_topic(), committed.get_partition());
            committed_offsets_[tp] = committed.get_offset() - 1;
            replay_offsets_[tp] = committed.get_offset();
            manager_.pruneCommitted(tp, committed.get_offset() - 1);
        }
        ++stats_.commits;
        std::cout << "Committed offsets for " << offsets_to_commit.size() << " partition(s)" << std::endl;
        return true;
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Error committing offsets: " << e.what() << std::endl;
        return false;
    }
}

bool SinkConsumer::seekPartition(const TopicPartition& tp, int64_t offset) {
    if (!consumer_) {
        return false;
    }

    try {
        auto assignment = consumer_->get_assignment();

        // Other partitions continue after what was already handed to the task
        std::vector<cppkafka::TopicPartition> new_assignment;
        for (const auto& assigned : assignment) {
            TopicPartition current(assigned.get_topic(), assigned.get_partition());
            if (current == tp) {
                new_assignment.emplace_back(tp.topic, tp.partition, offset);
                continue;
            }
            auto it = processed_offsets_.find(current);
            if (it != processed_offsets_.end()) {
                new_assignment.emplace_back(current.topic, current.partition, it->second + 1);
            } else {
                new_assignment.push_back(assigned);
            }
        }

        consumer_->assign(new_assignment);
        std::cout << "Partition " << tp << ": Sought to offset " << offset << std::endl;
        return true;
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Error seeking partition " << tp << ": " << e.what() << std::endl;
        return false;
    }
}

void SinkConsumer::onPartitionsAssigned(cppkafka::TopicPartitionList& partitions) {
    TopicPartitionSet assigned;
    for (const auto& tp : partitions) {
        assigned.insert(TopicPartition(tp.get_topic(), tp.get_partition()));
    }

    std::map<TopicPartition, int64_t> resume_offsets;
    bool opened = false;
    for (int attempt = 0; attempt <= config_.max_retries && !opened; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(
                calculateBackoff(attempt, config_.retry_base_delay_ms, config_.retry_max_delay_ms));
        }
        try {
            resume_offsets = task_.open(assigned);
            opened = true;
        } catch (const SinkError& e) {
            std::cerr << "Failed to open partitions (attempt " << (attempt + 1) << "): " << e.what() << std::endl;
        }
    }

    if (!opened) {
        std::cerr << "Giving up on partition assignment, stopping" << std::endl;
        fatal_error_ = true;
        running_ = false;
        return;
    }

    for (auto& tp : partitions) {
        TopicPartition key(tp.get_topic(), tp.get_partition());
        auto it = resume_offsets.find(key);
        if (it != resume_offsets.end()) {
            tp.set_offset(it->second);
            replay_offsets_[key] = it->second;
            std::cout << "Partition " << key << ": Resuming at offset " << it->second << std::endl;
        }
    }
    updateStats();
}

void SinkConsumer::onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions) {
    TopicPartitionSet revoked;
    for (const auto& tp : partitions) {
        revoked.insert(TopicPartition(tp.get_topic(), tp.get_partition()));
    }

    std::cout << "Partitions revoked: ";
    for (const auto& tp : revoked) {
        std::cout << tp << " ";
    }
    std::cout << std::endl;

    // Seal what can be sealed before losing the partitions
    if (config_.flush_on_shutdown) {
        try {
            task_.flush(revoked);
        } catch (const SinkError& e) {
            std::cerr << "Flush before revocation failed: " << e.what() << std::endl;
        }
    }
    commitOffsets(revoked);
    task_.close(revoked);

    for (const auto& tp : revoked) {
        processed_offsets_.erase(tp);
        committed_offsets_.erase(tp);
        replay_offsets_.erase(tp);
    }
    updateStats();
}

std::chrono::milliseconds SinkConsumer::calculateBackoff(int attempt, int base_delay_ms, int max_delay_ms) {
    // Exponential backoff: base * 2^attempt, capped
    int64_t delay = static_cast<int64_t>(base_delay_ms) << std::min(attempt, 20);
    delay = std::min<int64_t>(delay, max_delay_ms);

    // Add jitter (0-50% of delay)
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, delay / 2);
    delay += dist(gen);

    return std::chrono::milliseconds(delay);
}

void SinkConsumer::updateStats() {
    stats_.buffered_records = manager_.getBufferedRecordCount();
    stats_.open_writers = manager_.getOpenWriterCount();
    stats_.sealed_objects = manager_.getSealedObjectCount();
    stats_.assigned_partitions = manager_.getAssignedPartitions().size();
}
