#include "chunk_planner.h"
#include "utils.h"

#include <algorithm>

namespace ua {

ChunkPlanner::ChunkPlanner(int64_t chunk_size, bool allow_empty_file)
    : chunk_size_(chunk_size), allow_empty_file_(allow_empty_file) {
}

Status ChunkPlanner::plan(int64_t file_size, const std::string& file_id,
                          std::vector<Chunk>* chunks) const {
    chunks->clear();

    if (chunk_size_ <= 0) {
        return Status(ErrorCode::ConfigurationError, "chunk size must be > 0");
    }
    if (chunk_size_ > MAX_CHUNK_SIZE) {
        return Status(ErrorCode::ConfigurationError,
                      "chunk size " + Utils::formatFileSize(chunk_size_) +
                      " exceeds the service maximum of " + Utils::formatFileSize(MAX_CHUNK_SIZE));
    }
    if (file_size < 0) {
        return Status(ErrorCode::ConfigurationError, "negative file size");
    }
    if (file_size == 0 && !allow_empty_file_) {
        return Status(ErrorCode::ConfigurationError, "empty files are not allowed");
    }

    int64_t count = (file_size + chunk_size_ - 1) / chunk_size_;
    if (count > MAX_CHUNK_COUNT) {
        return Status(ErrorCode::ConfigurationError,
                      std::to_string(count) + " chunks exceeds the service limit of " +
                      std::to_string(MAX_CHUNK_COUNT));
    }

    chunks->reserve(static_cast<size_t>(count));
    for (int64_t offset = 0; offset < file_size; offset += chunk_size_) {
        Chunk chunk;
        chunk.index = static_cast<int>(chunks->size());
        chunk.offset = offset;
        chunk.length = std::min(chunk_size_, file_size - offset);
        chunk.file_id = file_id;
        chunks->push_back(chunk);
    }
    return Status::OK();
}

} // namespace ua
