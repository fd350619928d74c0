#include "admin_server.hpp"
#include "config.hpp"
#include "consumer/sink_consumer.hpp"
#include "formats/format_selection.hpp"
#include "formats/format_writer.hpp"
#include "sink/partitioner.hpp"
#include "sink/rotation_policy.hpp"
#include "sink/sink_task.hpp"
#include "sink/writer_manager.hpp"
#include "storage/local_storage.hpp"
#include "storage/s3_storage.hpp"
#include "duckdb.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

std::atomic<SinkConsumer*> g_consumer(nullptr);

void signalHandler(int signal) {
    SinkConsumer* consumer = g_consumer.load();
    if (!consumer) {
        return;
    }
    if (signal == SIGUSR1) {
        consumer->requestFlush();
    } else {
        consumer->stop();
    }
}

static std::unique_ptr<StorageInterface> createStorage(const SinkConfig& config) {
    if (config.storage_type == "local") {
        return std::make_unique<LocalStorage>(config.local_root);
    }

    auto storage = std::make_unique<S3Storage>(config.s3_endpoint,
                                               config.s3_access_key,
                                               config.s3_secret_key,
                                               config.s3_bucket,
                                               config.s3_batch_delete);
    if (!storage->bucketExists()) {
        throw ConfigurationError("S3 bucket does not exist: " + config.s3_bucket);
    }
    return storage;
}

int main() {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGUSR1, signalHandler);  // Force flush signal

        SinkConfig config = SinkConfig::fromEnv();
        config.validate();

        FormatSelection format = FormatSelection::fromString(config.format);
        format.compression = FormatSelection::compressionFromString(config.compression);
        Partitioner partitioner = Partitioner::fromString(config.partition_by);

        auto storage = createStorage(config);

        // In-memory DuckDB behind the Parquet writers
        std::unique_ptr<duckdb::DuckDB> db;
        if (format.type == FormatType::Parquet) {
            db = std::make_unique<duckdb::DuckDB>(nullptr);
        }

        WriterManagerOptions options;
        options.prefix = config.prefix;
        options.staging_dir = config.staging_dir;
        options.format = format;
        options.policy = RotationPolicy::fromConfig(config);
        options.default_offset = config.default_offset;

        WriterManager manager(*storage,
                              makeFormatWriterFactory(format, db.get()),
                              partitioner,
                              options);
        SinkTask task(manager);
        SinkStats stats;

        SinkConsumer consumer(config, task, manager, stats);
        if (!consumer.initialize()) {
            std::cerr << "Failed to initialize sink consumer" << std::endl;
            return 1;
        }
        g_consumer = &consumer;

        AdminServer admin(stats, [&consumer]() { consumer.requestFlush(); });
        std::thread admin_thread(&AdminServer::start, &admin, config.health_port);
        admin_thread.detach();

        std::cout << "lakesink started: " << format.name() << " objects to " << storage->describe()
                  << "/" << config.prefix << std::endl;
        std::cout << "Rotation: " << config.flush_count << " records, " << config.flush_size_bytes
                  << " bytes or " << config.flush_interval_seconds << " seconds" << std::endl;
        std::cout << "Send SIGUSR1 to force flush (kill -USR1 <pid>)" << std::endl;

        consumer.start();
        g_consumer = nullptr;

        if (consumer.hasFatalError()) {
            std::cerr << "lakesink stopped after a fatal error" << std::endl;
            return 1;
        }
        std::cout << "lakesink stopped" << std::endl;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Please set required environment variables:" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
        std::cerr << "  KAFKA_TOPICS - Comma-separated list of topics" << std::endl;
        std::cerr << "  SINK_STORAGE - s3 (default) or local" << std::endl;
        std::cerr << "  S3_ENDPOINT, S3_ACCESS_KEY, S3_SECRET_KEY, S3_BUCKET - for s3 storage" << std::endl;
        std::cerr << "  LOCAL_ROOT - for local storage" << std::endl;
        std::cerr << "Optional:" << std::endl;
        std::cerr << "  SINK_FORMAT - CSV, CSV_WITHHEADERS, JSON, PARQUET, AVRO, BYTES, TEXT (default: JSON)" << std::endl;
        std::cerr << "  SINK_PARTITION_BY - Comma-separated partition fields" << std::endl;
        std::cerr << "  FLUSH_COUNT, FLUSH_SIZE_BYTES, FLUSH_INTERVAL_SECONDS - Rotation thresholds" << std::endl;
        std::cerr << "  HEALTH_PORT - Admin endpoint port (default: 8080)" << std::endl;
        std::cerr << "  DLQ_PATH - File for records that fail conversion (default: drop)" << std::endl;
        return 1;
    }

    return 0;
}
