#include <gtest/gtest.h>
#include "../src/sink/rotation_policy.hpp"
#include <chrono>

using std::chrono::milliseconds;
using std::chrono::seconds;

static RotationPolicy makePolicy(int64_t records, int64_t bytes, int age_seconds) {
    RotationPolicy policy;
    policy.max_records = records;
    policy.max_bytes = bytes;
    policy.max_age = seconds(age_seconds);
    return policy;
}

TEST(RotationPolicyTest, CountThreshold) {
    RotationPolicy policy = makePolicy(2, 0, 0);

    EXPECT_EQ(policy.evaluate(1, 100, milliseconds(0)), RotationReason::None);
    EXPECT_EQ(policy.evaluate(2, 100, milliseconds(0)), RotationReason::RecordCount);
}

TEST(RotationPolicyTest, SizeThreshold) {
    RotationPolicy policy = makePolicy(0, 1024, 0);

    EXPECT_EQ(policy.evaluate(10, 1023, milliseconds(0)), RotationReason::None);
    EXPECT_EQ(policy.evaluate(10, 1024, milliseconds(0)), RotationReason::Size);
}

TEST(RotationPolicyTest, AgeThreshold) {
    RotationPolicy policy = makePolicy(0, 0, 60);

    EXPECT_EQ(policy.evaluate(1, 10, milliseconds(59999)), RotationReason::None);
    EXPECT_EQ(policy.evaluate(1, 10, milliseconds(60000)), RotationReason::Age);
    EXPECT_TRUE(policy.expired(milliseconds(60000)));
    EXPECT_FALSE(policy.expired(milliseconds(1000)));
}

TEST(RotationPolicyTest, CountWinsOverSizeAndAge) {
    RotationPolicy policy = makePolicy(5, 100, 1);

    EXPECT_EQ(policy.evaluate(5, 500, milliseconds(5000)), RotationReason::RecordCount);
    EXPECT_EQ(policy.evaluate(4, 500, milliseconds(5000)), RotationReason::Size);
    EXPECT_EQ(policy.evaluate(4, 50, milliseconds(5000)), RotationReason::Age);
}

TEST(RotationPolicyTest, NothingBufferedNeverRotates) {
    RotationPolicy policy = makePolicy(1, 1, 1);

    EXPECT_EQ(policy.evaluate(0, 0, milliseconds(100000)), RotationReason::None);
}

TEST(RotationPolicyTest, DisabledThresholds) {
    RotationPolicy policy = makePolicy(0, -1, 0);

    EXPECT_EQ(policy.evaluate(1000000, 1LL << 40, milliseconds(1LL << 40)), RotationReason::None);
    EXPECT_FALSE(policy.expired(milliseconds(1LL << 40)));
}

TEST(RotationPolicyTest, FromConfig) {
    SinkConfig config;
    config.flush_count = 10;
    config.flush_size_bytes = 2048;
    config.flush_interval_seconds = 30;
    config.flush_on_shutdown = false;

    RotationPolicy policy = RotationPolicy::fromConfig(config);
    EXPECT_EQ(policy.max_records, 10);
    EXPECT_EQ(policy.max_bytes, 2048);
    EXPECT_EQ(policy.max_age, seconds(30));
    EXPECT_FALSE(policy.flush_on_shutdown);
}

TEST(RotationPolicyTest, ReasonNames) {
    EXPECT_STREQ(rotationReasonName(RotationReason::RecordCount), "count");
    EXPECT_STREQ(rotationReasonName(RotationReason::Age), "age");
    EXPECT_STREQ(rotationReasonName(RotationReason::Requested), "requested");
}
