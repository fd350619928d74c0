#include <gtest/gtest.h>
#include "fake_storage.hpp"
#include "../src/sink/sink_task.hpp"
#include "../src/sink/sink_error.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

class SinkTaskTest : public ::testing::Test {
protected:
    void SetUp() override {
        staging_dir_ = fs::temp_directory_path() /
                       ("lakesink_task_" + std::to_string(::getpid()) + "_" +
                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(staging_dir_);
        now_ = std::chrono::system_clock::now();
    }

    void TearDown() override {
        task_.reset();
        manager_.reset();
        fs::remove_all(staging_dir_);
    }

    SinkTask& makeTask(const std::string& format, int64_t max_records) {
        WriterManagerOptions options;
        options.prefix = "sink";
        options.staging_dir = staging_dir_.string();
        options.format = FormatSelection::fromString(format);
        options.policy.max_records = max_records;
        options.policy.max_age = std::chrono::seconds(30);
        manager_ = std::make_unique<WriterManager>(
            storage_,
            makeFormatWriterFactory(options.format, nullptr),
            Partitioner(),
            options,
            [this] { return now_; });
        task_ = std::make_unique<SinkTask>(*manager_);
        task_->open({tp_});
        return *task_;
    }

    SinkRecord record(int64_t offset, SinkValue value) const {
        SinkRecord r;
        r.topic_partition = tp_;
        r.offset = offset;
        r.detail.value = std::move(value);
        return r;
    }

    size_t stagedFileCount() const {
        size_t count = 0;
        std::error_code ec;
        if (!fs::exists(staging_dir_, ec)) {
            return 0;
        }
        for (const auto& entry : fs::recursive_directory_iterator(staging_dir_)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }

    SinkRecord record(int64_t offset) const {
        return record(offset, SinkValue::structure({{"n", SinkValue::int64(offset)}}));
    }

    FakeStorage storage_;
    fs::path staging_dir_;
    std::chrono::system_clock::time_point now_;
    std::unique_ptr<WriterManager> manager_;
    std::unique_ptr<SinkTask> task_;
    TopicPartition tp_{"orders", 0};
};

TEST_F(SinkTaskTest, PutWritesRecords) {
    SinkTask& task = makeTask("JSON", 2);
    task.put({record(0), record(1), record(2)});

    EXPECT_EQ(task.getRecordsWritten(), 3u);
    EXPECT_EQ(task.getRecordsSkipped(), 0u);
    EXPECT_EQ(storage_.objects.size(), 1u);

    auto offsets = task.preCommit({{tp_, 3}});
    EXPECT_EQ(offsets[tp_], 1);
}

TEST_F(SinkTaskTest, RedeliveredRecordsAreSkipped) {
    SinkTask& task = makeTask("JSON", 2);
    task.put({record(0), record(1)});
    task.put({record(0), record(1), record(2)});

    EXPECT_EQ(task.getRecordsWritten(), 3u);
    EXPECT_EQ(task.getRecordsSkipped(), 2u);
    EXPECT_EQ(storage_.objects.size(), 1u);
}

TEST_F(SinkTaskTest, FormatErrorRollsBack) {
    SinkTask& task = makeTask("CSV", 100);

    SinkRecord good = record(0);
    SinkRecord bad = record(1, SinkValue::structure({{"other", SinkValue::string("x")}}));
    try {
        task.put({good, bad});
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_TRUE(e.rollBack());
        EXPECT_EQ(e.topicPartitions().count(tp_), 1u);
    }

    EXPECT_EQ(task.getRollbacks(), 1u);
    EXPECT_EQ(manager_->getBufferedRecordCount(), 0);
    EXPECT_EQ(manager_->getOpenWriterCount(), 0u);
    EXPECT_EQ(stagedFileCount(), 0u);
    EXPECT_TRUE(storage_.objects.empty());

    // Redelivery from the committed position starts a fresh object
    task.put({record(0), record(1)});
    task.flush();
    EXPECT_EQ(storage_.objects.size(), 1u);
}

TEST_F(SinkTaskTest, TextRejectsStructuredValues) {
    SinkTask& task = makeTask("TEXT", 100);
    task.put({record(0, SinkValue::string("line"))});

    EXPECT_THROW(task.put({record(1)}), FormatError);
    EXPECT_EQ(task.getRollbacks(), 1u);
    EXPECT_EQ(manager_->getBufferedRecordCount(), 0);
}

TEST_F(SinkTaskTest, OrderingErrorRollsBack) {
    SinkTask& task = makeTask("JSON", 100);
    task.put({record(5), record(6)});

    EXPECT_THROW(task.put({record(3)}), OrderingError);
    EXPECT_EQ(task.getRollbacks(), 1u);
    EXPECT_EQ(manager_->getBufferedRecordCount(), 0);
}

TEST_F(SinkTaskTest, StorageErrorKeepsBuffers) {
    SinkTask& task = makeTask("JSON", 2);
    storage_.fail_puts = true;

    EXPECT_THROW(task.put({record(0), record(1)}), StorageError);
    EXPECT_EQ(task.getRollbacks(), 0u);
    EXPECT_EQ(manager_->getBufferedRecordCount(), 2);

    // An empty put retries the outstanding upload
    storage_.fail_puts = false;
    task.put({});
    EXPECT_EQ(storage_.objects.size(), 1u);
    EXPECT_EQ(manager_->getCommittedOffset(tp_), 1);
}

TEST_F(SinkTaskTest, RollBackAfterFailedUploadDeletesObject) {
    SinkTask& task = makeTask("JSON", 2);
    storage_.fail_puts = true;

    EXPECT_THROW(task.put({record(0), record(1)}), StorageError);
    EXPECT_EQ(stagedFileCount(), 1u);

    // Retries exhausted: the partition is rolled back
    task.rollBack({tp_});

    ObjectKey key;
    key.write_key = WriteKey(tp_, "");
    key.start_offset = 0;
    key.end_offset = 1;
    key.extension = "json";
    ASSERT_EQ(storage_.deleted.size(), 1u);
    EXPECT_EQ(storage_.deleted[0], key.toString("sink"));
    EXPECT_EQ(manager_->getBufferedRecordCount(), 0);
    EXPECT_EQ(stagedFileCount(), 0u);

    // Redelivery writes the same object again
    storage_.fail_puts = false;
    task.put({record(0), record(1)});
    EXPECT_EQ(storage_.objects.count(key.toString("sink")), 1u);
}

TEST_F(SinkTaskTest, EmptyPutSealsIdleBuffers) {
    SinkTask& task = makeTask("JSON", 100);
    task.put({record(0)});

    task.put({});
    EXPECT_TRUE(storage_.objects.empty());

    now_ += std::chrono::seconds(31);
    task.put({});
    EXPECT_EQ(storage_.objects.size(), 1u);
}

TEST_F(SinkTaskTest, ExplicitRollBack) {
    SinkTask& task = makeTask("JSON", 100);
    task.put({record(0), record(1)});

    task.rollBack({tp_});
    EXPECT_EQ(task.getRollbacks(), 1u);
    EXPECT_EQ(manager_->getBufferedRecordCount(), 0);
}

TEST_F(SinkTaskTest, StopSealsBufferedRecords) {
    SinkTask& task = makeTask("JSON", 100);
    task.put({record(0), record(1)});

    task.stop();
    EXPECT_EQ(storage_.objects.size(), 1u);
    EXPECT_TRUE(manager_->getAssignedPartitions().empty());
}
