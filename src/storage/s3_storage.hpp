#ifndef S3_STORAGE_HPP
#define S3_STORAGE_HPP

#include "storage_interface.hpp"
#include <memory>
#include <string>

namespace minio {
namespace s3 {
class Client;
}
namespace creds {
class StaticProvider;
}
}

// S3-compatible object store through minio-cpp.
// Timeouts and transport retries are left to the client.
class S3Storage : public StorageInterface {
public:
    S3Storage(const std::string& endpoint,
              const std::string& access_key,
              const std::string& secret_key,
              const std::string& bucket,
              bool batch_delete);
    ~S3Storage() override;

    void putObject(const std::string& key, const std::string& bytes) override;
    std::vector<ObjectMetadata> listObjects(const std::string& prefix) override;
    void deleteObjects(const std::vector<std::string>& keys) override;
    std::string describe() const override { return "s3://" + bucket_; }

    bool bucketExists();

private:
    std::string bucket_;
    bool batch_delete_;

    std::unique_ptr<minio::creds::StaticProvider> provider_;
    std::unique_ptr<minio::s3::Client> client_;

    void deleteBatch(const std::vector<std::string>& keys);
    void deleteOneByOne(const std::vector<std::string>& keys);
};

#endif // S3_STORAGE_HPP
