#include "dead_letter_queue.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

DeadLetterQueue::DeadLetterQueue(const std::string& dlq_path)
    : dlq_path_(dlq_path), enabled_(!dlq_path.empty()), written_(0) {
    if (enabled_) {
        initialize();
    }
}

DeadLetterQueue::~DeadLetterQueue() {
    if (dlq_file_ && dlq_file_->is_open()) {
        dlq_file_->close();
    }
}

bool DeadLetterQueue::initialize() {
    fs::path parent = fs::path(dlq_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Failed to create dead letter queue directory " << parent.string()
                      << ": " << ec.message() << std::endl;
        }
    }

    dlq_file_ = std::make_unique<std::ofstream>(dlq_path_, std::ios::app | std::ios::binary);
    if (!dlq_file_->is_open()) {
        std::cerr << "Failed to open dead letter queue file: " << dlq_path_ << std::endl;
        enabled_ = false;
        return false;
    }
    std::cout << "Dead letter queue initialized: " << dlq_path_ << std::endl;
    return true;
}

bool DeadLetterQueue::write(const DeadLetter& letter, const std::string& error_reason) {
    if (!enabled_ || !dlq_file_ || !dlq_file_->is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    auto now = std::time(nullptr);
    std::tm timeinfo{};
    gmtime_r(&now, &timeinfo);
    *dlq_file_ << "[" << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << "] "
               << "topic=" << letter.topic_partition.topic
               << " partition=" << letter.topic_partition.partition
               << " offset=" << letter.offset
               << " ERROR: " << error_reason << "\n";

    // Length prefix, little endian
    uint32_t length = static_cast<uint32_t>(letter.payload.size());
    char prefix[4];
    for (int i = 0; i < 4; ++i) {
        prefix[i] = static_cast<char>((length >> (8 * i)) & 0xFF);
    }
    dlq_file_->write(prefix, sizeof(prefix));
    dlq_file_->write(letter.payload.data(), static_cast<std::streamsize>(letter.payload.size()));
    *dlq_file_ << "\n---\n";
    dlq_file_->flush();

    if (!*dlq_file_) {
        std::cerr << "Error writing to dead letter queue " << dlq_path_ << std::endl;
        return false;
    }
    ++written_;
    return true;
}
