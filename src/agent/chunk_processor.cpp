#include "chunk_processor.h"
#include "checksum.h"
#include "compression.h"
#include "utils.h"

#include <stdexcept>

namespace ua {

ChunkProcessor::ChunkProcessor(const SourceFile& source, bool compress, int compression_level)
    : source_(source),
      compress_(compress),
      compression_level_(compression_level),
      digest_([](const std::vector<uint8_t>& bytes) { return Checksum::md5Hex(bytes); }) {
}

Status ChunkProcessor::process(const Chunk& chunk, ChunkPayload* payload) const {
    std::vector<uint8_t> raw;
    Status status = source_.readRange(chunk.offset, chunk.length, &raw);
    if (!status.ok()) {
        return status;
    }

    payload->raw_length = chunk.length;
    payload->compressed = false;

    if (compress_ && !raw.empty()) {
        try {
            std::vector<uint8_t> packed = Compression::gzip(raw, compression_level_);
            if (packed.size() < raw.size()) {
                payload->bytes = std::move(packed);
                payload->compressed = true;
            }
        } catch (const std::runtime_error& e) {
            // Fall back to the raw bytes; the upload itself is still valid
            Utils::logWarning("Compression of chunk " + std::to_string(chunk.index) +
                              " failed, sending uncompressed: " + e.what());
        }
    }
    if (!payload->compressed) {
        payload->bytes = std::move(raw);
    }

    try {
        payload->md5 = digest_(payload->bytes);
    } catch (const std::runtime_error& e) {
        return Status(ErrorCode::IoError,
                      "cannot checksum chunk " + std::to_string(chunk.index) + ": " + e.what());
    }
    Utils::logDebug("Chunk " + std::to_string(chunk.index) + ": " +
                    std::to_string(chunk.length) + " bytes -> " +
                    std::to_string(payload->bytes.size()) + " on the wire" +
                    (payload->compressed ? " (gzip)" : ""));
    return Status::OK();
}

} // namespace ua
