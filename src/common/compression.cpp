#include "compression.h"

#include <zlib.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ua {

namespace {

// windowBits + 16 selects the gzip wrapper instead of raw zlib
constexpr int GZIP_WINDOW_BITS = MAX_WBITS + 16;

constexpr size_t MAX_SLICE = 1u << 30;

} // namespace

std::vector<uint8_t> Compression::gzip(const std::vector<uint8_t>& data, int level) {
    z_stream zs{};
    if (deflateInit2(&zs, std::clamp(level, 1, Z_BEST_COMPRESSION), Z_DEFLATED,
                     GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    // deflateBound() covers zlib framing only; add room for the gzip header/trailer
    std::vector<uint8_t> output(deflateBound(&zs, static_cast<uLong>(data.size())) + 18);
    size_t consumed = 0;
    size_t produced = 0;
    int result = Z_OK;
    while (result != Z_STREAM_END) {
        // avail_in/avail_out are 32-bit, so chunks above 4GB are fed in slices
        size_t in_slice = std::min(data.size() - consumed, MAX_SLICE);
        size_t out_slice = std::min(output.size() - produced, MAX_SLICE);
        zs.next_in = const_cast<Bytef*>(data.data() + consumed);
        zs.avail_in = static_cast<uInt>(in_slice);
        zs.next_out = output.data() + produced;
        zs.avail_out = static_cast<uInt>(out_slice);

        bool last = consumed + in_slice == data.size();
        result = deflate(&zs, last ? Z_FINISH : Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END && result != Z_BUF_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("deflate failed with code " + std::to_string(result));
        }
        consumed += in_slice - zs.avail_in;
        produced += out_slice - zs.avail_out;
        if (result == Z_BUF_ERROR && produced == output.size()) {
            deflateEnd(&zs);
            throw std::runtime_error("deflate ran out of output space");
        }
    }
    output.resize(produced);
    deflateEnd(&zs);
    return output;
}

std::vector<uint8_t> Compression::gunzip(const std::vector<uint8_t>& data) {
    if (data.size() > MAX_SLICE) {
        throw std::runtime_error("gzip input too large to inflate in one pass");
    }
    z_stream zs{};
    if (inflateInit2(&zs, GZIP_WINDOW_BITS) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }

    std::vector<uint8_t> output;
    std::vector<uint8_t> buffer(64 * 1024);
    zs.next_in = const_cast<Bytef*>(data.data());
    zs.avail_in = static_cast<uInt>(data.size());

    int result = Z_OK;
    while (result != Z_STREAM_END) {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        result = inflate(&zs, Z_NO_FLUSH);
        if (result != Z_OK && result != Z_STREAM_END) {
            inflateEnd(&zs);
            throw std::runtime_error("inflate failed with code " + std::to_string(result));
        }
        output.insert(output.end(), buffer.data(), buffer.data() + (buffer.size() - zs.avail_out));
        if (result == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            inflateEnd(&zs);
            throw std::runtime_error("truncated gzip stream");
        }
    }
    inflateEnd(&zs);
    return output;
}

} // namespace ua
