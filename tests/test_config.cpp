#include <gtest/gtest.h>
#include "../src/config.hpp"

static SinkConfig validConfig() {
    SinkConfig config;
    config.queue_brokers = "localhost:9092";
    config.queue_topics = {"orders"};
    config.storage_type = "local";
    config.local_root = "/tmp/lakesink";
    return config;
}

TEST(ConfigTest, SplitList) {
    auto items = SinkConfig::splitList("orders, payments ,,refunds");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "orders");
    EXPECT_EQ(items[1], "payments");
    EXPECT_EQ(items[2], "refunds");

    EXPECT_TRUE(SinkConfig::splitList("").empty());
    EXPECT_TRUE(SinkConfig::splitList(" , ").empty());
}

TEST(ConfigTest, ParseBool) {
    EXPECT_TRUE(SinkConfig::parseBool("1"));
    EXPECT_TRUE(SinkConfig::parseBool("true"));
    EXPECT_TRUE(SinkConfig::parseBool("yes"));
    EXPECT_FALSE(SinkConfig::parseBool("0"));
    EXPECT_FALSE(SinkConfig::parseBool("false"));
    EXPECT_FALSE(SinkConfig::parseBool(""));
}

TEST(ConfigTest, ValidConfigPasses) {
    EXPECT_NO_THROW(validConfig().validate());
}

TEST(ConfigTest, RejectsUnknownStorage) {
    SinkConfig config = validConfig();
    config.storage_type = "gcs";
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ConfigTest, RequiresARotationThreshold) {
    SinkConfig config = validConfig();
    config.flush_count = 0;
    config.flush_size_bytes = 0;
    config.flush_interval_seconds = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config.flush_interval_seconds = 60;
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, RejectsUnknownConverter) {
    SinkConfig config = validConfig();
    config.value_converter = "avro";
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ConfigTest, RejectsEmptyPrefixSegment) {
    SinkConfig config = validConfig();
    config.prefix = "data//sink";
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ConfigTest, RejectsEmptyTopics) {
    SinkConfig config = validConfig();
    config.queue_topics.clear();
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(ConfigTest, FromEnvRequiresBrokers) {
    unsetenv("KAFKA_BROKERS");
    EXPECT_THROW(SinkConfig::fromEnv(), std::runtime_error);
}

TEST(ConfigTest, FromEnvLocalStorage) {
    setenv("KAFKA_BROKERS", "broker:9092", 1);
    setenv("KAFKA_TOPICS", "orders,payments", 1);
    setenv("SINK_STORAGE", "local", 1);
    setenv("LOCAL_ROOT", "/data/lake", 1);
    setenv("SINK_FORMAT", "PARQUET", 1);
    setenv("FLUSH_COUNT", "100", 1);
    setenv("DLQ_PATH", "/var/lib/lakesink/dlq.log", 1);

    SinkConfig config = SinkConfig::fromEnv();
    EXPECT_EQ(config.queue_brokers, "broker:9092");
    ASSERT_EQ(config.queue_topics.size(), 2u);
    EXPECT_EQ(config.queue_topics[1], "payments");
    EXPECT_EQ(config.storage_type, "local");
    EXPECT_EQ(config.local_root, "/data/lake");
    EXPECT_EQ(config.format, "PARQUET");
    EXPECT_EQ(config.flush_count, 100);
    EXPECT_EQ(config.dlq_path, "/var/lib/lakesink/dlq.log");

    unsetenv("DLQ_PATH");
    unsetenv("KAFKA_BROKERS");
    unsetenv("KAFKA_TOPICS");
    unsetenv("SINK_STORAGE");
    unsetenv("LOCAL_ROOT");
    unsetenv("SINK_FORMAT");
    unsetenv("FLUSH_COUNT");
}
