#include "s3_storage.hpp"
#include "../sink/sink_error.hpp"
#include <miniocpp/client.h>
#include <miniocpp/utils.h>
#include <iostream>
#include <list>

S3Storage::S3Storage(const std::string& endpoint,
                     const std::string& access_key,
                     const std::string& secret_key,
                     const std::string& bucket,
                     bool batch_delete)
    : bucket_(bucket)
    , batch_delete_(batch_delete) {
    minio::s3::BaseUrl url(endpoint);
    url.https = endpoint.compare(0, 5, "https") == 0;

    provider_ = std::make_unique<minio::creds::StaticProvider>(access_key, secret_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    std::cout << "S3Storage initialized with endpoint: " << endpoint
              << ", bucket: " << bucket_ << std::endl;
}

S3Storage::~S3Storage() = default;

bool S3Storage::bucketExists() {
    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_;

    auto response = client_->BucketExists(args);
    if (!response) {
        std::cerr << "Error checking bucket " << bucket_ << ": "
                  << response.Error().String() << std::endl;
        return false;
    }
    return response.exist;
}

void S3Storage::putObject(const std::string& key, const std::string& bytes) {
    minio::utils::CharBuffer buffer(const_cast<char*>(bytes.data()), bytes.size());
    std::istream stream(&buffer);

    minio::s3::PutObjectArgs args(stream, static_cast<long>(bytes.size()), 0);
    args.bucket = bucket_;
    args.object = key;

    auto response = client_->PutObject(args);
    if (!response) {
        throw StorageError("Failed to put object " + key + " in bucket " + bucket_,
                           {}, response.Error().String());
    }
}

std::vector<ObjectMetadata> S3Storage::listObjects(const std::string& prefix) {
    std::vector<ObjectMetadata> objects;

    minio::s3::ListObjectsArgs args;
    args.bucket = bucket_;
    args.prefix = prefix;
    args.recursive = true;

    minio::s3::ListObjectsResult result = client_->ListObjects(args);
    for (; result; result++) {
        minio::s3::Item item = *result;
        if (!item) {
            throw StorageError("Failed to list objects under " + prefix + " in bucket " + bucket_,
                               {}, item.Error().String());
        }
        if (item.is_prefix) {
            continue;
        }
        ObjectMetadata meta;
        meta.key = item.name;
        meta.size = item.size;
        objects.push_back(meta);
    }
    return objects;
}

void S3Storage::deleteObjects(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return;
    }
    if (batch_delete_) {
        deleteBatch(keys);
    } else {
        deleteOneByOne(keys);
    }
    std::cout << "Deleted " << keys.size() << " object(s) from " << describe() << std::endl;
}

void S3Storage::deleteBatch(const std::vector<std::string>& keys) {
    std::list<minio::s3::DeleteObject> objects;
    for (const auto& key : keys) {
        minio::s3::DeleteObject object;
        object.name = key;
        objects.push_back(object);
    }

    minio::s3::RemoveObjectsArgs args;
    args.bucket = bucket_;

    auto it = objects.begin();
    args.func = [&objects, &it](minio::s3::DeleteObject& obj) -> bool {
        if (it == objects.end()) {
            return false;
        }
        obj = *it;
        ++it;
        return true;
    };

    minio::s3::RemoveObjectsResult result = client_->RemoveObjects(args);
    for (; result; result++) {
        minio::s3::DeleteError err = *result;
        if (!err) {
            throw StorageError("Failed to delete object " + err.object_name + " from bucket " + bucket_,
                               {}, err.message);
        }
    }
}

void S3Storage::deleteOneByOne(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        minio::s3::RemoveObjectArgs args;
        args.bucket = bucket_;
        args.object = key;

        auto response = client_->RemoveObject(args);
        if (!response) {
            throw StorageError("Failed to delete object " + key + " from bucket " + bucket_,
                               {}, response.Error().String());
        }
    }
}
