#pragma once

#include "status.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ua {

// Read-only view of the local file being uploaded. Reads use pread() and
// never move a shared file offset, so workers may read disjoint ranges
// concurrently without locking.
class SourceFile {
public:
    SourceFile() = default;
    ~SourceFile();

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    Status open(const std::string& path);
    bool isOpen() const { return fd_ >= 0; }

    // Fills data with exactly length bytes starting at offset
    Status readRange(int64_t offset, int64_t length, std::vector<uint8_t>* data) const;

    const std::string& path() const { return path_; }
    int64_t size() const { return size_; }
    int64_t modifiedTime() const { return mtime_; }

private:
    int fd_ = -1;
    std::string path_;
    int64_t size_ = 0;
    int64_t mtime_ = 0;
};

} // namespace ua
