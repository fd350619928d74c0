#include "object_key.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include <vector>

static const size_t kOffsetWidth = 20;

static bool allDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string ObjectKey::padOffset(int64_t offset) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(kOffsetWidth) << offset;
    return oss.str();
}

std::string ObjectKey::listingPrefix(const std::string& prefix) {
    if (prefix.empty()) {
        return "";
    }
    return prefix + "/";
}

std::string ObjectKey::toString(const std::string& prefix) const {
    std::ostringstream key;
    key << listingPrefix(prefix);
    if (!write_key.bucket_path.empty()) {
        key << write_key.bucket_path << "/";
    }
    key << write_key.topic_partition.topic << "/"
        << write_key.topic_partition.partition << "/"
        << padOffset(start_offset) << "_" << padOffset(end_offset)
        << "." << extension;
    return key.str();
}

bool ObjectKey::parse(const std::string& key, const std::string& prefix, ObjectKey& out) {
    std::string head = listingPrefix(prefix);
    if (key.compare(0, head.size(), head) != 0) {
        return false;
    }

    std::vector<std::string> segments;
    std::string rest = key.substr(head.size());
    size_t start = 0;
    while (true) {
        size_t slash = rest.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(rest.substr(start));
            break;
        }
        segments.push_back(rest.substr(start, slash - start));
        start = slash + 1;
    }
    if (segments.size() < 3) {
        return false;
    }

    const std::string& file_name = segments[segments.size() - 1];
    const std::string& partition = segments[segments.size() - 2];
    const std::string& topic = segments[segments.size() - 3];
    if (topic.empty() || !allDigits(partition) || partition.size() > 9) {
        return false;
    }

    // <start>_<end>.<extension>
    if (file_name.size() < 2 * kOffsetWidth + 2 || file_name[kOffsetWidth] != '_' ||
        file_name[2 * kOffsetWidth + 1] != '.') {
        return false;
    }
    std::string start_str = file_name.substr(0, kOffsetWidth);
    std::string end_str = file_name.substr(kOffsetWidth + 1, kOffsetWidth);
    if (!allDigits(start_str) || !allDigits(end_str)) {
        return false;
    }

    ObjectKey parsed;
    try {
        parsed.start_offset = std::stoll(start_str);
        parsed.end_offset = std::stoll(end_str);
    } catch (const std::out_of_range&) {
        return false;
    }
    if (parsed.end_offset < parsed.start_offset) {
        return false;
    }
    parsed.extension = file_name.substr(2 * kOffsetWidth + 2);

    std::string bucket_path;
    for (size_t i = 0; i + 3 < segments.size(); ++i) {
        if (segments[i].empty()) {
            return false;
        }
        if (!bucket_path.empty()) {
            bucket_path += "/";
        }
        bucket_path += segments[i];
    }

    parsed.write_key = WriteKey(TopicPartition(topic, std::stoi(partition)), bucket_path);
    out = parsed;
    return true;
}
