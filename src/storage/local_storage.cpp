#include "local_storage.hpp"
#include "../sink/sink_error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

const char* LocalStorage::kTempSuffix = ".lakesink-tmp";

LocalStorage::LocalStorage(const std::string& root)
    : root_(root) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("Failed to create storage root " + root_, {}, ec.message());
    }
}

std::string LocalStorage::pathFor(const std::string& key) const {
    return (fs::path(root_) / key).string();
}

void LocalStorage::putObject(const std::string& key, const std::string& bytes) {
    if (key.empty()) {
        throw StorageError("Object key must not be empty");
    }

    fs::path target(pathFor(key));
    fs::path temp = target;
    temp += kTempSuffix;

    try {
        fs::create_directories(target.parent_path());

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw StorageError("Failed to open " + temp.string() + " for writing");
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                throw StorageError("Failed to write object " + key);
            }
        }

        fs::rename(temp, target);
    } catch (const fs::filesystem_error& e) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw StorageError("Failed to put object " + key, {}, e.what());
    } catch (const StorageError&) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw;
    }
}

std::vector<ObjectMetadata> LocalStorage::listObjects(const std::string& prefix) {
    std::vector<ObjectMetadata> objects;

    // Walk the deepest directory fully covered by the prefix
    fs::path base(root_);
    size_t slash = prefix.rfind('/');
    if (slash != std::string::npos) {
        base /= prefix.substr(0, slash);
    }

    std::error_code ec;
    if (!fs::exists(base, ec)) {
        return objects;
    }

    try {
        for (const auto& entry : fs::recursive_directory_iterator(base)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string key = fs::relative(entry.path(), root_).generic_string();
            if (key.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            const std::string suffix(kTempSuffix);
            if (key.size() >= suffix.size() &&
                key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
                continue;
            }
            ObjectMetadata meta;
            meta.key = key;
            meta.size = static_cast<size_t>(entry.file_size());
            objects.push_back(meta);
        }
    } catch (const fs::filesystem_error& e) {
        throw StorageError("Failed to list objects under " + prefix, {}, e.what());
    }

    std::sort(objects.begin(), objects.end(),
              [](const ObjectMetadata& a, const ObjectMetadata& b) { return a.key < b.key; });
    return objects;
}

void LocalStorage::deleteObjects(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        std::error_code ec;
        fs::remove(pathFor(key), ec);
        if (ec) {
            throw StorageError("Failed to delete object " + key, {}, ec.message());
        }
    }
    if (!keys.empty()) {
        std::cout << "Deleted " << keys.size() << " object(s) from " << describe() << std::endl;
    }
}
