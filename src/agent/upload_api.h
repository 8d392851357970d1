#pragma once

#include "status.h"

#include <cstdint>
#include <map>
#include <string>

namespace ua {

struct SlotRequest {
    std::string file_id;
    int chunk_index = 0;   // 0-based; adapters translate to the wire numbering
    int64_t size = 0;      // payload bytes, after compression
    std::string md5;       // over the payload bytes
    bool compressed = false;
};

// Short-lived upload destination for a single chunk attempt. Never reused
// across attempts.
struct UploadSlot {
    std::string url;
    std::map<std::string, std::string> headers;
    int64_t expires_at_ms = 0;  // 0 = no expiry given

    bool expired(int64_t now_ms) const { return expires_at_ms != 0 && now_ms >= expires_at_ms; }
};

// Control-plane calls the engine depends on. Implementations report
// transient problems as TransientTransportError and permanent refusals as
// RemoteRejectedChunk; retrying is the caller's business.
class UploadApi {
public:
    virtual ~UploadApi() = default;

    virtual Status requestSlot(const SlotRequest& request, UploadSlot* slot) = 0;
    virtual Status closeFile(const std::string& file_id) = 0;
};

} // namespace ua
