#include "staged_file.hpp"
#include "../sink/sink_error.hpp"
#include <filesystem>
#include <iostream>

StagedFile::StagedFile(const std::string& path, bool gzip)
    : path_(path)
    , gzip_(gzip)
    , closed_(false)
    , bytes_written_(0)
    , strm_{} {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path_).parent_path(), ec);
    if (ec) {
        throw FormatError("Failed to create staging directory for " + path_, {}, ec.message());
    }

    out_.open(path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw FormatError("Failed to open staged file " + path_);
    }

    // 16 + MAX_WBITS selects gzip framing
    if (gzip_ && deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        out_.close();
        throw FormatError("Failed to initialize gzip stream for " + path_);
    }
}

StagedFile::~StagedFile() {
    if (!closed_) {
        if (gzip_) {
            deflateEnd(&strm_);
        }
        out_.close();
    }
}

void StagedFile::write(const char* data, size_t size) {
    if (closed_) {
        throw std::logic_error("Write to closed staged file " + path_);
    }
    if (size == 0) {
        return;
    }

    if (gzip_) {
        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        strm_.avail_in = static_cast<uInt>(size);
        deflateInto(Z_NO_FLUSH);
    } else {
        out_.write(data, static_cast<std::streamsize>(size));
    }

    if (!out_) {
        throw FormatError("Failed to write staged file " + path_);
    }
    bytes_written_ += size;
}

void StagedFile::deflateInto(int flush) {
    char buf[16384];
    int ret;
    do {
        strm_.next_out = reinterpret_cast<Bytef*>(buf);
        strm_.avail_out = sizeof(buf);
        ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            throw FormatError("gzip deflate failed for " + path_);
        }
        size_t have = sizeof(buf) - strm_.avail_out;
        out_.write(buf, static_cast<std::streamsize>(have));
    } while (strm_.avail_out == 0);
}

void StagedFile::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (gzip_) {
        strm_.next_in = nullptr;
        strm_.avail_in = 0;
        try {
            deflateInto(Z_FINISH);
        } catch (...) {
            deflateEnd(&strm_);
            out_.close();
            throw;
        }
        deflateEnd(&strm_);
    }

    out_.flush();
    bool ok = static_cast<bool>(out_);
    out_.close();
    if (!ok) {
        throw FormatError("Failed to flush staged file " + path_);
    }
}
