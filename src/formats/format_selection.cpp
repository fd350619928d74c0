#include "format_selection.hpp"
#include "../sink/sink_error.hpp"
#include <algorithm>
#include <cctype>

static std::string normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '`' || c == ' ') {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

FormatSelection FormatSelection::fromString(const std::string& name) {
    std::string n = normalize(name);
    FormatSelection selection;
    if (n == "CSV") {
        selection.type = FormatType::Csv;
    } else if (n == "CSV_WITHHEADERS") {
        selection.type = FormatType::Csv;
        selection.with_headers = true;
    } else if (n == "JSON") {
        selection.type = FormatType::Json;
    } else if (n == "PARQUET") {
        selection.type = FormatType::Parquet;
    } else if (n == "AVRO") {
        selection.type = FormatType::Avro;
    } else if (n == "BYTES" || n == "BYTES_VALUEONLY") {
        selection.type = FormatType::Bytes;
    } else if (n == "BYTES_KEY_AND_VALUE_WITH_SIZES") {
        selection.type = FormatType::Bytes;
        selection.bytes_mode = BytesMode::KeyAndValueWithSizes;
    } else if (n == "TEXT") {
        selection.type = FormatType::Text;
    } else {
        throw ConfigurationError("Unsupported format: " + name);
    }
    return selection;
}

CompressionCodec FormatSelection::compressionFromString(const std::string& name) {
    std::string n = normalize(name);
    if (n.empty() || n == "NONE" || n == "UNCOMPRESSED") {
        return CompressionCodec::None;
    }
    if (n == "GZIP") {
        return CompressionCodec::Gzip;
    }
    throw ConfigurationError("Unsupported compression codec: " + name);
}

bool FormatSelection::compressed() const {
    // Parquet and Avro are containers with their own layout
    return compression == CompressionCodec::Gzip &&
           type != FormatType::Parquet && type != FormatType::Avro;
}

std::string FormatSelection::extension() const {
    std::string ext;
    switch (type) {
        case FormatType::Csv: ext = "csv"; break;
        case FormatType::Json: ext = "json"; break;
        case FormatType::Parquet: ext = "parquet"; break;
        case FormatType::Avro: ext = "avro"; break;
        case FormatType::Bytes: ext = "bytes"; break;
        case FormatType::Text: ext = "text"; break;
    }
    if (compressed()) {
        ext += ".gz";
    }
    return ext;
}

std::string FormatSelection::name() const {
    switch (type) {
        case FormatType::Csv: return with_headers ? "CSV_WITHHEADERS" : "CSV";
        case FormatType::Json: return "JSON";
        case FormatType::Parquet: return "PARQUET";
        case FormatType::Avro: return "AVRO";
        case FormatType::Bytes:
            return bytes_mode == BytesMode::KeyAndValueWithSizes ? "BYTES_KEY_AND_VALUE_WITH_SIZES" : "BYTES";
        case FormatType::Text: return "TEXT";
    }
    return "UNKNOWN";
}
