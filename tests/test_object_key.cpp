#include <gtest/gtest.h>
#include "../src/sink/object_key.hpp"

TEST(ObjectKeyTest, PadOffset) {
    EXPECT_EQ(ObjectKey::padOffset(0), "00000000000000000000");
    EXPECT_EQ(ObjectKey::padOffset(42), "00000000000000000042");
    EXPECT_EQ(ObjectKey::padOffset(9223372036854775807LL), "09223372036854775807");
}

TEST(ObjectKeyTest, ToStringWithoutBucket) {
    ObjectKey key;
    key.write_key = WriteKey(TopicPartition("orders", 3), "");
    key.start_offset = 10;
    key.end_offset = 19;
    key.extension = "json";

    EXPECT_EQ(key.toString("sink"),
              "sink/orders/3/00000000000000000010_00000000000000000019.json");
}

TEST(ObjectKeyTest, ToStringWithBucket) {
    ObjectKey key;
    key.write_key = WriteKey(TopicPartition("orders", 0), "region=eu/date=2024-01-15");
    key.start_offset = 0;
    key.end_offset = 1;
    key.extension = "csv.gz";

    EXPECT_EQ(key.toString("data/sink"),
              "data/sink/region=eu/date=2024-01-15/orders/0/"
              "00000000000000000000_00000000000000000001.csv.gz");
}

TEST(ObjectKeyTest, ParseWrittenKey) {
    ObjectKey key;
    key.write_key = WriteKey(TopicPartition("orders.v1", 12), "region=eu");
    key.start_offset = 100;
    key.end_offset = 250;
    key.extension = "parquet";

    ObjectKey parsed;
    ASSERT_TRUE(ObjectKey::parse(key.toString("sink"), "sink", parsed));
    EXPECT_EQ(parsed.write_key, key.write_key);
    EXPECT_EQ(parsed.start_offset, 100);
    EXPECT_EQ(parsed.end_offset, 250);
    EXPECT_EQ(parsed.extension, "parquet");
}

TEST(ObjectKeyTest, ParseWithEmptyPrefix) {
    ObjectKey parsed;
    ASSERT_TRUE(ObjectKey::parse("t/0/00000000000000000005_00000000000000000007.avro", "", parsed));
    EXPECT_EQ(parsed.write_key.topic_partition, TopicPartition("t", 0));
    EXPECT_TRUE(parsed.write_key.bucket_path.empty());
    EXPECT_EQ(parsed.end_offset, 7);
}

TEST(ObjectKeyTest, RejectsForeignKeys) {
    ObjectKey parsed;
    EXPECT_FALSE(ObjectKey::parse("other/t/0/00000000000000000000_00000000000000000001.json", "sink", parsed));
    EXPECT_FALSE(ObjectKey::parse("sink/t/0/readme.txt", "sink", parsed));
    EXPECT_FALSE(ObjectKey::parse("sink/t/x/00000000000000000000_00000000000000000001.json", "sink", parsed));
    EXPECT_FALSE(ObjectKey::parse("sink/0/00000000000000000000_00000000000000000001.json", "sink", parsed));
    EXPECT_FALSE(ObjectKey::parse("sink/t/0/0000000000000000000a_00000000000000000001.json", "sink", parsed));
    EXPECT_FALSE(ObjectKey::parse("sink/t/0/00000000000000000000-00000000000000000001.json", "sink", parsed));
}

TEST(ObjectKeyTest, RejectsInvertedRange) {
    ObjectKey parsed;
    EXPECT_FALSE(ObjectKey::parse("sink/t/0/00000000000000000009_00000000000000000001.json", "sink", parsed));
}

TEST(ObjectKeyTest, RejectsOverflowingOffset) {
    ObjectKey parsed;
    EXPECT_FALSE(ObjectKey::parse("sink/t/0/99999999999999999999_99999999999999999999.json", "sink", parsed));
}

TEST(ObjectKeyTest, KeysSortByOffset) {
    ObjectKey a;
    a.write_key = WriteKey(TopicPartition("t", 0), "");
    a.start_offset = 9;
    a.end_offset = 9;
    a.extension = "json";
    ObjectKey b = a;
    b.start_offset = 10;
    b.end_offset = 10;

    EXPECT_LT(a.toString("p"), b.toString("p"));
}
