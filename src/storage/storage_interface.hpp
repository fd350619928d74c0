#ifndef STORAGE_INTERFACE_HPP
#define STORAGE_INTERFACE_HPP

#include <cstddef>
#include <string>
#include <vector>

struct ObjectMetadata {
    std::string key;
    size_t size = 0;
};

// Whole-object blob store. There is no append: an object is written once, at seal time.
// Listings may lag behind writes; a missing object means "no object", never corruption.
// Failures are reported as StorageError.
class StorageInterface {
public:
    virtual ~StorageInterface() = default;

    virtual void putObject(const std::string& key, const std::string& bytes) = 0;

    // Keys starting with `prefix`, in lexical order
    virtual std::vector<ObjectMetadata> listObjects(const std::string& prefix) = 0;

    // Missing keys are ignored
    virtual void deleteObjects(const std::vector<std::string>& keys) = 0;

    // Human readable location for logs
    virtual std::string describe() const = 0;
};

#endif // STORAGE_INTERFACE_HPP
