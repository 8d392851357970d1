#pragma once

#include <cstdint>
#include <vector>

namespace ua {

// gzip (RFC 1952) compression of whole chunks via zlib
class Compression {
public:
    // Compresses data into a complete gzip member. Throws std::runtime_error
    // if zlib reports an error. Level is clamped to 1..9.
    static std::vector<uint8_t> gzip(const std::vector<uint8_t>& data, int level);

    // Inverse of gzip(); throws std::runtime_error on malformed input
    static std::vector<uint8_t> gunzip(const std::vector<uint8_t>& data);
};

} // namespace ua
