#pragma once

#include "status.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ua {

// One fixed byte range of the source file, uploaded as a unit
struct Chunk {
    int index = 0;        // 0-based, contiguous
    int64_t offset = 0;
    int64_t length = 0;
    std::string file_id;  // remote object the chunk belongs to
};

class ChunkPlanner {
public:
    ChunkPlanner(int64_t chunk_size, bool allow_empty_file = true);

    // Partitions [0, file_size) into ceil(file_size / chunk_size) chunks.
    // The same inputs always give the same list; resume depends on it.
    Status plan(int64_t file_size, const std::string& file_id, std::vector<Chunk>* chunks) const;

    int64_t chunkSize() const { return chunk_size_; }

private:
    int64_t chunk_size_;
    bool allow_empty_file_;
};

} // namespace ua
