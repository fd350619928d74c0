#ifndef ROTATION_POLICY_HPP
#define ROTATION_POLICY_HPP

#include "../config.hpp"
#include <chrono>
#include <cstdint>

enum class RotationReason {
    None,
    RecordCount,
    Size,
    Age,
    Requested
};

const char* rotationReasonName(RotationReason reason);

// Thresholds that seal a staged object. A non-positive threshold is disabled.
struct RotationPolicy {
    int64_t max_records = 0;
    int64_t max_bytes = 0;
    std::chrono::seconds max_age{0};
    bool flush_on_shutdown = true;

    static RotationPolicy fromConfig(const SinkConfig& config);

    // Evaluated after every append. Count wins over size, size over age.
    RotationReason evaluate(int64_t records, int64_t bytes, std::chrono::milliseconds age) const;

    // Age check alone, used for buffers that received no new appends
    bool expired(std::chrono::milliseconds age) const;
};

#endif // ROTATION_POLICY_HPP
