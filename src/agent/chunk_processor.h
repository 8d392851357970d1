#pragma once

#include "chunk_planner.h"
#include "source_file.h"
#include "status.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ua {

// Bytes ready for the wire, plus what the service must be told about them.
// compressed is false whenever the raw form was sent, including when
// compression was enabled but did not shrink the chunk.
struct ChunkPayload {
    std::vector<uint8_t> bytes;
    bool compressed = false;
    std::string md5;          // over bytes, exactly as transmitted
    int64_t raw_length = 0;   // chunk length before compression
};

class ChunkProcessor {
public:
    // Hex digest of the payload; throws std::runtime_error when the digest
    // cannot be computed
    using DigestFunction = std::function<std::string(const std::vector<uint8_t>&)>;

    ChunkProcessor(const SourceFile& source, bool compress, int compression_level);

    // Reads the chunk's byte range, compresses it when that helps, and
    // checksums the result. Deterministic for a given chunk and settings.
    // A checksum failure is reported as IoError.
    Status process(const Chunk& chunk, ChunkPayload* payload) const;

    // Test hook
    void setDigestFunction(DigestFunction digest) { digest_ = std::move(digest); }

private:
    const SourceFile& source_;
    bool compress_;
    int compression_level_;
    DigestFunction digest_;
};

} // namespace ua
