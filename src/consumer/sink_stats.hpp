#ifndef SINK_STATS_HPP
#define SINK_STATS_HPP

#include <atomic>
#include <cstdint>

// Counters shared with the admin server
struct SinkStats {
    std::atomic<bool> ready{false};
    std::atomic<uint64_t> messages_consumed{0};
    std::atomic<uint64_t> conversion_errors{0};
    std::atomic<uint64_t> dead_lettered{0};
    std::atomic<uint64_t> batches{0};
    std::atomic<uint64_t> commits{0};
    std::atomic<uint64_t> rollbacks{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> sealed_objects{0};
    std::atomic<int64_t> buffered_records{0};
    std::atomic<uint64_t> open_writers{0};
    std::atomic<uint64_t> assigned_partitions{0};
};

#endif // SINK_STATS_HPP
