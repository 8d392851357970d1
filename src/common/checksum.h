#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ua {

// Content checksums sent alongside every chunk. The object store verifies
// payloads by MD5, so that is the digest used on the wire.
class Checksum {
public:
    static std::string md5Hex(const std::vector<uint8_t>& data);
    static std::string md5Hex(const std::string& data);
    static std::string md5Hex(const uint8_t* data, size_t size);

    // True for a 32 character lowercase/uppercase hex string
    static bool looksLikeMd5(const std::string& value);

    // Hex digest -> base64 of the raw digest bytes (Content-MD5 header form).
    // Returns an empty string for malformed hex.
    static std::string hexToBase64(const std::string& hex);
};

} // namespace ua
