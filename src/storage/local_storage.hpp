#ifndef LOCAL_STORAGE_HPP
#define LOCAL_STORAGE_HPP

#include "storage_interface.hpp"
#include <string>

// Object store backed by a directory tree. Keys map to relative paths.
// Objects are written to a temporary name and renamed, so a reader never
// sees a partial object.
class LocalStorage : public StorageInterface {
public:
    explicit LocalStorage(const std::string& root);

    void putObject(const std::string& key, const std::string& bytes) override;
    std::vector<ObjectMetadata> listObjects(const std::string& prefix) override;
    void deleteObjects(const std::vector<std::string>& keys) override;
    std::string describe() const override { return "file://" + root_; }

    const std::string& root() const { return root_; }

private:
    std::string root_;

    std::string pathFor(const std::string& key) const;

    static const char* kTempSuffix;
};

#endif // LOCAL_STORAGE_HPP
