#include "rotation_policy.hpp"

const char* rotationReasonName(RotationReason reason) {
    switch (reason) {
        case RotationReason::None: return "none";
        case RotationReason::RecordCount: return "count";
        case RotationReason::Size: return "size";
        case RotationReason::Age: return "age";
        case RotationReason::Requested: return "requested";
    }
    return "unknown";
}

RotationPolicy RotationPolicy::fromConfig(const SinkConfig& config) {
    RotationPolicy policy;
    policy.max_records = config.flush_count;
    policy.max_bytes = config.flush_size_bytes;
    policy.max_age = std::chrono::seconds(config.flush_interval_seconds);
    policy.flush_on_shutdown = config.flush_on_shutdown;
    return policy;
}

RotationReason RotationPolicy::evaluate(int64_t records,
                                        int64_t bytes,
                                        std::chrono::milliseconds age) const {
    if (records <= 0) {
        return RotationReason::None;
    }
    if (max_records > 0 && records >= max_records) {
        return RotationReason::RecordCount;
    }
    if (max_bytes > 0 && bytes >= max_bytes) {
        return RotationReason::Size;
    }
    if (expired(age)) {
        return RotationReason::Age;
    }
    return RotationReason::None;
}

bool RotationPolicy::expired(std::chrono::milliseconds age) const {
    return max_age.count() > 0 && age >= max_age;
}
