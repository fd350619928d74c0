#ifndef STAGED_FILE_HPP
#define STAGED_FILE_HPP

#include <fstream>
#include <string>
#include <zlib.h>

// Local file an in-progress object is written to before it is sealed.
// With gzip enabled bytes go through a zlib deflate stream in gzip framing.
class StagedFile {
public:
    StagedFile(const std::string& path, bool gzip);
    ~StagedFile();

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    void write(const char* data, size_t size);
    void write(const std::string& data) { write(data.data(), data.size()); }

    // Finishes the gzip stream and closes the file. Safe to call twice.
    void close();

    const std::string& path() const { return path_; }

    // Uncompressed bytes accepted so far
    size_t bytesWritten() const { return bytes_written_; }

private:
    std::string path_;
    bool gzip_;
    bool closed_;
    size_t bytes_written_;
    std::ofstream out_;
    z_stream strm_;

    void deflateInto(int flush);
};

#endif // STAGED_FILE_HPP
