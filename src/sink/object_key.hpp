#ifndef OBJECT_KEY_HPP
#define OBJECT_KEY_HPP

#include "topic_partition.hpp"
#include <cstdint>
#include <string>

// Name of a sealed object in storage:
//   <prefix>/[<bucket path>/]<topic>/<partition>/<start>_<end>.<extension>
// Offsets are zero padded to 20 digits so keys sort by offset.
// Offset recovery relies on this layout alone, object bodies are never read.
struct ObjectKey {
    WriteKey write_key;
    int64_t start_offset = 0;
    int64_t end_offset = 0;
    std::string extension;

    std::string toString(const std::string& prefix) const;

    // Listing prefix that covers every object written under `prefix`
    static std::string listingPrefix(const std::string& prefix);

    // Returns false for keys that do not follow the layout
    static bool parse(const std::string& key, const std::string& prefix, ObjectKey& out);

    static std::string padOffset(int64_t offset);
};

#endif // OBJECT_KEY_HPP
