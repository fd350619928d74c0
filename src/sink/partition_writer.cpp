#include "partition_writer.hpp"
#include "sink_error.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

static std::atomic<uint64_t> staged_file_counter{0};

const char* writerStateName(WriterState state) {
    switch (state) {
        case WriterState::Empty: return "empty";
        case WriterState::Buffering: return "buffering";
        case WriterState::Uploading: return "uploading";
    }
    return "unknown";
}

PartitionWriter::PartitionWriter(WriteKey key,
                                 StorageInterface& storage,
                                 const FormatWriterFactory& factory,
                                 const Options& options,
                                 Clock clock,
                                 int64_t sealed_offset,
                                 SealCallback seal_callback)
    : key_(std::move(key))
    , storage_(storage)
    , factory_(factory)
    , options_(options)
    , clock_(std::move(clock))
    , sealed_offset_(sealed_offset)
    , seal_callback_(std::move(seal_callback))
    , state_(WriterState::Empty) {
}

PartitionWriter::~PartitionWriter() {
    releaseLocal();
}

size_t PartitionWriter::getBufferedBytes() const {
    if (!pending_.writer) {
        return 0;
    }
    return pending_.writer->getDataSize();
}

std::chrono::milliseconds PartitionWriter::getPendingAge() const {
    if (state_ == WriterState::Empty) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - pending_.created_at);
}

WriteOutcome PartitionWriter::write(int64_t offset, const MessageDetail& detail) {
    if (offset <= sealed_offset_) {
        return WriteOutcome::Skipped;
    }

    // An object whose upload failed goes out before anything else is appended
    if (state_ == WriterState::Uploading) {
        upload();
        if (offset <= sealed_offset_) {
            return WriteOutcome::Skipped;
        }
    }

    if (state_ == WriterState::Buffering) {
        if (offset >= pending_.first_offset && offset <= pending_.last_offset) {
            return WriteOutcome::Duplicate;
        }
        if (offset < pending_.first_offset) {
            throw OrderingError("Partition " + key_.toString() + ": offset " + std::to_string(offset) +
                                " is below the buffered range [" + std::to_string(pending_.first_offset) +
                                ", " + std::to_string(pending_.last_offset) + "]",
                                affected());
        }
    }

    if (state_ == WriterState::Empty) {
        startPending(offset);
    }

    try {
        pending_.writer->write(detail);
    } catch (const FormatError& e) {
        throw FormatError("Partition " + key_.toString() + ": failed to encode offset " +
                          std::to_string(offset) + ": " + e.what(),
                          affected(), e.cause());
    } catch (const StorageError& e) {
        throw StorageError("Partition " + key_.toString() + ": failed to stage offset " +
                           std::to_string(offset) + ": " + e.what(),
                           affected(), e.cause());
    }

    pending_.last_offset = offset;
    ++pending_.record_count;

    sealIfRequired();
    return WriteOutcome::Appended;
}

bool PartitionWriter::sealIfRequired() {
    if (state_ != WriterState::Buffering) {
        return false;
    }
    RotationReason reason = options_.policy.evaluate(
        pending_.record_count, static_cast<int64_t>(getBufferedBytes()), getPendingAge());
    if (reason == RotationReason::None) {
        return false;
    }
    return seal(reason);
}

bool PartitionWriter::seal(RotationReason reason) {
    if (state_ == WriterState::Uploading) {
        upload();
        return true;
    }
    if (state_ != WriterState::Buffering || pending_.record_count == 0) {
        return false;
    }

    try {
        pending_.writer->close();
    } catch (const FormatError& e) {
        throw FormatError("Partition " + key_.toString() + ": failed to finish staged file " +
                          pending_.staged_path + ": " + e.what(),
                          affected(), e.cause());
    } catch (const StorageError& e) {
        throw StorageError("Partition " + key_.toString() + ": failed to finish staged file " +
                           pending_.staged_path + ": " + e.what(),
                           affected(), e.cause());
    }

    upload_key_.write_key = key_;
    upload_key_.start_offset = pending_.first_offset;
    upload_key_.end_offset = pending_.last_offset;
    upload_key_.extension = options_.extension;
    state_ = WriterState::Uploading;

    std::cout << "Partition " << key_.toString() << ": Sealing " << pending_.record_count
              << " records [" << pending_.first_offset << ", " << pending_.last_offset << "] ("
              << rotationReasonName(reason) << ")" << std::endl;

    upload();
    return true;
}

bool PartitionWriter::retryUpload() {
    if (state_ != WriterState::Uploading) {
        return true;
    }
    std::cout << "Partition " << key_.toString() << ": Retrying upload of ["
              << upload_key_.start_offset << ", " << upload_key_.end_offset << "]" << std::endl;
    upload();
    return true;
}

void PartitionWriter::upload() {
    std::string object = upload_key_.toString(options_.prefix);
    std::string bytes = readStagedFile();

    try {
        storage_.putObject(object, bytes);
    } catch (const StorageError& e) {
        std::cerr << "Partition " << key_.toString() << ": Upload of " << object
                  << " failed: " << e.what() << std::endl;
        throw StorageError("Partition " + key_.toString() + ": failed to upload " + object,
                           affected(), e.what());
    }

    sealed_offset_ = upload_key_.end_offset;
    std::cout << "Partition " << key_.toString() << ": Sealed " << object << " (" << bytes.size()
              << " bytes), committed offset: " << sealed_offset_ << std::endl;

    ObjectKey sealed = upload_key_;
    releaseLocal();
    reset();

    if (seal_callback_) {
        seal_callback_(sealed);
    }
}

void PartitionWriter::discard() {
    if (state_ == WriterState::Empty) {
        return;
    }

    // The put may have landed even though it reported a failure
    if (state_ == WriterState::Uploading) {
        std::string object = upload_key_.toString(options_.prefix);
        try {
            storage_.deleteObjects({object});
        } catch (const StorageError& e) {
            std::cerr << "Partition " << key_.toString() << ": Warning: could not delete "
                      << object << ": " << e.what() << std::endl;
        }
    }

    std::cout << "Partition " << key_.toString() << ": Discarding " << pending_.record_count
              << " records (" << writerStateName(state_) << ")" << std::endl;
    releaseLocal();
    reset();
}

void PartitionWriter::startPending(int64_t offset) {
    pending_.staged_path = stagedPathFor(offset);
    pending_.writer = factory_(pending_.staged_path);
    pending_.first_offset = offset;
    pending_.last_offset = offset;
    pending_.record_count = 0;
    pending_.created_at = clock_();
    state_ = WriterState::Buffering;
}

void PartitionWriter::reset() {
    pending_ = PendingState();
    state_ = WriterState::Empty;
}

void PartitionWriter::releaseLocal() {
    // Writer first, it may still hold the file open
    pending_.writer.reset();
    if (pending_.staged_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(pending_.staged_path, ec);
    if (ec) {
        std::cerr << "Partition " << key_.toString() << ": Warning: could not remove staged file "
                  << pending_.staged_path << ": " << ec.message() << std::endl;
    }
}

std::string PartitionWriter::stagedPathFor(int64_t offset) const {
    std::ostringstream name;
    name << ObjectKey::padOffset(offset) << "-" << staged_file_counter.fetch_add(1) << "." << options_.extension;
    fs::path path = fs::path(options_.staging_dir) / key_.topic_partition.topic /
                    std::to_string(key_.topic_partition.partition) / name.str();
    return path.string();
}

std::string PartitionWriter::readStagedFile() const {
    std::ifstream in(pending_.staged_path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Partition " + key_.toString() + ": staged file " + pending_.staged_path +
                           " cannot be read", affected());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}
