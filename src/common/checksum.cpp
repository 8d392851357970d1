#include "checksum.h"

#include <openssl/evp.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ua {

namespace {

std::string toHex(const unsigned char* digest, unsigned int length) {
    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace

std::string Checksum::md5Hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest, &length, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    return toHex(digest, length);
}

std::string Checksum::md5Hex(const std::vector<uint8_t>& data) {
    return md5Hex(data.data(), data.size());
}

std::string Checksum::md5Hex(const std::string& data) {
    return md5Hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool Checksum::looksLikeMd5(const std::string& value) {
    if (value.size() != 32) return false;
    for (unsigned char c : value) {
        if (!std::isxdigit(c)) return false;
    }
    return true;
}

std::string Checksum::hexToBase64(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return "";
    }
    std::vector<unsigned char> raw;
    raw.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return "";
        }
        raw.push_back(static_cast<unsigned char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }

    std::string encoded(4 * ((raw.size() + 2) / 3), '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), raw.data(),
                                 static_cast<int>(raw.size()));
    encoded.resize(length < 0 ? 0 : static_cast<size_t>(length));
    return encoded;
}

} // namespace ua
