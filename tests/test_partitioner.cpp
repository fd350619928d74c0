#include <gtest/gtest.h>
#include "../src/sink/partitioner.hpp"
#include "../src/sink/sink_error.hpp"
#include <ctime>

static MessageDetail makeDetail() {
    MessageDetail detail;
    detail.has_key = true;
    detail.key = SinkValue::string("user-7");
    detail.value = SinkValue::structure({
        {"region", SinkValue::string("eu")},
        {"customer", SinkValue::structure({{"id", SinkValue::int64(42)}})},
        {"tags", SinkValue::array({SinkValue::string("a")})},
    });
    detail.headers["source"] = "web";
    return detail;
}

TEST(PartitionerTest, NoFieldsDoesNotFanOut) {
    Partitioner partitioner = Partitioner::fromString("");
    EXPECT_FALSE(partitioner.fansOut());
    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), makeDetail()), "");
}

TEST(PartitionerTest, ValueFields) {
    Partitioner partitioner = Partitioner::fromString("region, customer.id");
    ASSERT_TRUE(partitioner.fansOut());
    ASSERT_EQ(partitioner.fields().size(), 2u);

    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), makeDetail()),
              "region=eu/customer.id=42");
}

TEST(PartitionerTest, ExplicitValuePrefix) {
    Partitioner partitioner = Partitioner::fromString("_value.region");
    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), makeDetail()), "region=eu");
}

TEST(PartitionerTest, KeyTopicPartitionAndHeader) {
    Partitioner partitioner = Partitioner::fromString("_key,_topic,_partition,_header.source");
    EXPECT_EQ(partitioner.bucketPath(TopicPartition("orders", 5), makeDetail()),
              "key=user-7/topic=orders/partition=5/source=web");
}

TEST(PartitionerTest, MissingValuesUsePlaceholder) {
    Partitioner partitioner = Partitioner::fromString("country,_header.trace,tags");
    MessageDetail detail = makeDetail();

    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail),
              "country=[missing]/trace=[missing]/tags=[missing]");
}

TEST(PartitionerTest, MissingKey) {
    Partitioner partitioner = Partitioner::fromString("_key");
    MessageDetail detail = makeDetail();
    detail.has_key = false;

    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail), "key=[missing]");
}

TEST(PartitionerTest, DateFromTimestampInUtc) {
    std::tm tm = {};
    tm.tm_year = 124;
    tm.tm_mon = 0;
    tm.tm_mday = 15;
    tm.tm_hour = 23;
    tm.tm_min = 59;

    MessageDetail detail = makeDetail();
    detail.has_timestamp = true;
    detail.timestamp = std::chrono::system_clock::from_time_t(timegm(&tm));

    Partitioner partitioner = Partitioner::fromString("_date.%Y-%m-%d");
    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail), "date=2024-01-15");

    detail.has_timestamp = false;
    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail), "date=[missing]");
}

TEST(PartitionerTest, SlashesAreReplaced) {
    Partitioner partitioner = Partitioner::fromString("region");
    MessageDetail detail;
    detail.value = SinkValue::structure({{"region", SinkValue::string("eu/west\\1")}});

    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail), "region=eu_west_1");
}

TEST(PartitionerTest, MapValues) {
    Partitioner partitioner = Partitioner::fromString("region");
    MessageDetail detail;
    detail.value = SinkValue::map({{"region", SinkValue::string("us")}});

    EXPECT_EQ(partitioner.bucketPath(TopicPartition("t", 0), detail), "region=us");
}

TEST(PartitionerTest, RejectsUnknownFields) {
    EXPECT_THROW(Partitioner::fromString("_offset"), ConfigurationError);
    EXPECT_THROW(Partitioner::fromString("_header."), ConfigurationError);
    EXPECT_THROW(Partitioner::fromString("_date."), ConfigurationError);
}
