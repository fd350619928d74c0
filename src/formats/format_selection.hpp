#ifndef FORMAT_SELECTION_HPP
#define FORMAT_SELECTION_HPP

#include <string>

enum class FormatType {
    Csv,
    Json,
    Parquet,
    Avro,
    Bytes,
    Text
};

enum class BytesMode {
    ValueOnly,
    KeyAndValueWithSizes
};

enum class CompressionCodec {
    None,
    Gzip
};

// Output format chosen by configuration
struct FormatSelection {
    FormatType type = FormatType::Json;
    bool with_headers = false;                  // CSV only
    BytesMode bytes_mode = BytesMode::ValueOnly;  // BYTES only
    CompressionCodec compression = CompressionCodec::None;

    // Accepts CSV, CSV_WITHHEADERS, JSON, PARQUET, AVRO, BYTES,
    // BYTES_KEY_AND_VALUE_WITH_SIZES and TEXT, case-insensitive, optionally in backticks.
    // Throws ConfigurationError for anything else.
    static FormatSelection fromString(const std::string& name);

    static CompressionCodec compressionFromString(const std::string& name);

    // File extension of sealed objects, e.g. "csv" or "json.gz"
    std::string extension() const;

    std::string name() const;

    // Whether the staged file goes through the gzip stream
    bool compressed() const;

    bool operator==(const FormatSelection& other) const {
        return type == other.type && with_headers == other.with_headers &&
               bytes_mode == other.bytes_mode && compression == other.compression;
    }
};

#endif // FORMAT_SELECTION_HPP
