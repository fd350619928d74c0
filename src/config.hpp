#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include "sink/sink_error.hpp"

struct SinkConfig {
    // Kafka
    std::string queue_brokers;
    std::vector<std::string> queue_topics;
    std::string consumer_group = "lakesink";
    int poll_batch_size = 500;
    int commit_interval_seconds = 10;
    std::string key_converter = "string";    // json | string | bytes
    std::string value_converter = "json";    // json | string | bytes

    // Storage
    std::string storage_type = "s3";  // s3 | local
    std::string s3_endpoint;
    std::string s3_access_key;
    std::string s3_secret_key;
    std::string s3_bucket;
    bool s3_batch_delete = true;
    std::string local_root;
    std::string prefix = "lakesink";
    std::string staging_dir = "/tmp/lakesink-staging";

    // Output
    std::string format = "JSON";
    std::string compression = "none";
    std::string partition_by;  // comma separated partition fields

    // Rotation
    int64_t flush_count = 50000;
    int64_t flush_size_bytes = 500LL * 1024 * 1024;
    int flush_interval_seconds = 3600;
    bool flush_on_shutdown = true;

    // Resume offset when storage holds nothing for a partition, -1 = let Kafka decide
    int64_t default_offset = -1;

    // Retry of recoverable errors
    int max_retries = 5;
    int retry_base_delay_ms = 500;
    int retry_max_delay_ms = 30000;

    int health_port = 8080;

    // Payloads that fail conversion are appended here, empty = log and drop
    std::string dlq_path;

    static SinkConfig fromEnv() {
        SinkConfig config;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (!brokers || strlen(brokers) == 0) {
            throw std::runtime_error("KAFKA_BROKERS environment variable is required");
        }
        config.queue_brokers = brokers;

        const char* topics = std::getenv("KAFKA_TOPICS");
        if (!topics || strlen(topics) == 0) {
            throw std::runtime_error("KAFKA_TOPICS environment variable is required");
        }
        config.queue_topics = splitList(topics);

        const char* consumer_group = std::getenv("KAFKA_CONSUMER_GROUP");
        if (consumer_group) {
            config.consumer_group = consumer_group;
        }

        const char* storage = std::getenv("SINK_STORAGE");
        if (storage && strlen(storage) > 0) {
            config.storage_type = storage;
        }

        if (config.storage_type == "s3") {
            const char* s3_endpoint = std::getenv("S3_ENDPOINT");
            if (!s3_endpoint || strlen(s3_endpoint) == 0) {
                throw std::runtime_error("S3_ENDPOINT environment variable is required");
            }
            config.s3_endpoint = s3_endpoint;

            const char* s3_access_key = std::getenv("S3_ACCESS_KEY");
            if (!s3_access_key || strlen(s3_access_key) == 0) {
                throw std::runtime_error("S3_ACCESS_KEY environment variable is required");
            }
            config.s3_access_key = s3_access_key;

            const char* s3_secret_key = std::getenv("S3_SECRET_KEY");
            if (!s3_secret_key || strlen(s3_secret_key) == 0) {
                throw std::runtime_error("S3_SECRET_KEY environment variable is required");
            }
            config.s3_secret_key = s3_secret_key;

            const char* s3_bucket = std::getenv("S3_BUCKET");
            if (!s3_bucket || strlen(s3_bucket) == 0) {
                throw std::runtime_error("S3_BUCKET environment variable is required");
            }
            config.s3_bucket = s3_bucket;

            const char* batch_delete = std::getenv("S3_BATCH_DELETE");
            if (batch_delete) {
                config.s3_batch_delete = parseBool(batch_delete);
            }
        } else {
            const char* local_root = std::getenv("LOCAL_ROOT");
            if (!local_root || strlen(local_root) == 0) {
                throw std::runtime_error("LOCAL_ROOT environment variable is required for local storage");
            }
            config.local_root = local_root;
        }

        const char* prefix = std::getenv("SINK_PREFIX");
        if (prefix) {
            config.prefix = prefix;
        }

        const char* staging_dir = std::getenv("SINK_STAGING_DIR");
        if (staging_dir && strlen(staging_dir) > 0) {
            config.staging_dir = staging_dir;
        }

        const char* format = std::getenv("SINK_FORMAT");
        if (format && strlen(format) > 0) {
            config.format = format;
        }

        const char* compression = std::getenv("SINK_COMPRESSION");
        if (compression && strlen(compression) > 0) {
            config.compression = compression;
        }

        const char* partition_by = std::getenv("SINK_PARTITION_BY");
        if (partition_by) {
            config.partition_by = partition_by;
        }

        const char* flush_count = std::getenv("FLUSH_COUNT");
        if (flush_count) {
            config.flush_count = std::atoll(flush_count);
        }

        const char* flush_size = std::getenv("FLUSH_SIZE_BYTES");
        if (flush_size) {
            config.flush_size_bytes = std::atoll(flush_size);
        }

        const char* flush_interval = std::getenv("FLUSH_INTERVAL_SECONDS");
        if (flush_interval) {
            config.flush_interval_seconds = std::atoi(flush_interval);
        }

        const char* flush_on_shutdown = std::getenv("FLUSH_ON_SHUTDOWN");
        if (flush_on_shutdown) {
            config.flush_on_shutdown = parseBool(flush_on_shutdown);
        }

        const char* default_offset = std::getenv("SINK_DEFAULT_OFFSET");
        if (default_offset) {
            config.default_offset = std::atoll(default_offset);
        }

        const char* key_converter = std::getenv("KEY_CONVERTER");
        if (key_converter && strlen(key_converter) > 0) {
            config.key_converter = key_converter;
        }

        const char* value_converter = std::getenv("VALUE_CONVERTER");
        if (value_converter && strlen(value_converter) > 0) {
            config.value_converter = value_converter;
        }

        const char* batch_size = std::getenv("POLL_BATCH_SIZE");
        if (batch_size) {
            config.poll_batch_size = std::atoi(batch_size);
        }

        const char* commit_interval = std::getenv("COMMIT_INTERVAL_SECONDS");
        if (commit_interval) {
            config.commit_interval_seconds = std::atoi(commit_interval);
        }

        const char* max_retries = std::getenv("MAX_RETRIES");
        if (max_retries) {
            config.max_retries = std::atoi(max_retries);
        }

        const char* base_delay = std::getenv("RETRY_BASE_DELAY_MS");
        if (base_delay) {
            config.retry_base_delay_ms = std::atoi(base_delay);
        }

        const char* max_delay = std::getenv("RETRY_MAX_DELAY_MS");
        if (max_delay) {
            config.retry_max_delay_ms = std::atoi(max_delay);
        }

        const char* dlq_path = std::getenv("DLQ_PATH");
        if (dlq_path) {
            config.dlq_path = dlq_path;
        }

        const char* health_port = std::getenv("HEALTH_PORT");
        if (health_port) {
            config.health_port = std::atoi(health_port);
        }

        return config;
    }

    // Cross-field checks that fromEnv() cannot express
    void validate() const {
        if (queue_topics.empty()) {
            throw ConfigurationError("At least one topic must be configured");
        }
        if (storage_type != "s3" && storage_type != "local") {
            throw ConfigurationError("Unsupported storage type: " + storage_type);
        }
        if (flush_count <= 0 && flush_size_bytes <= 0 && flush_interval_seconds <= 0) {
            throw ConfigurationError("At least one of FLUSH_COUNT, FLUSH_SIZE_BYTES or "
                                     "FLUSH_INTERVAL_SECONDS must be positive");
        }
        for (const auto* converter : {&key_converter, &value_converter}) {
            if (*converter != "json" && *converter != "string" && *converter != "bytes") {
                throw ConfigurationError("Unsupported converter: " + *converter);
            }
        }
        if (prefix.find("//") != std::string::npos) {
            throw ConfigurationError("SINK_PREFIX must not contain empty path segments");
        }
        if (poll_batch_size <= 0) {
            throw ConfigurationError("POLL_BATCH_SIZE must be positive");
        }
    }

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> out;
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(',', start);
            if (end == std::string::npos) {
                end = value.size();
            }
            std::string item = value.substr(start, end - start);
            size_t first = item.find_first_not_of(' ');
            size_t last = item.find_last_not_of(' ');
            if (first != std::string::npos) {
                out.push_back(item.substr(first, last - first + 1));
            }
            start = end + 1;
        }
        return out;
    }

    static bool parseBool(const std::string& value) {
        return value == "1" || value == "true" || value == "TRUE" || value == "yes";
    }
};

#endif // CONFIG_HPP
