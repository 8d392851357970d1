#pragma once

#include "cancellation.h"
#include "chunk_processor.h"
#include "host_resolver.h"
#include "status.h"
#include "upload_api.h"

#include <boost/asio/ssl/context.hpp>

#include <map>
#include <optional>
#include <string>

namespace ua {

struct HttpUrl {
    std::string scheme;  // "http" or "https"
    std::string host;
    std::string port;
    std::string target;  // path + query, at least "/"

    static std::optional<HttpUrl> parse(const std::string& url);
};

// Moves one chunk payload to its upload slot
class ChunkTransport {
public:
    virtual ~ChunkTransport() = default;

    // OK only when the service accepted and acknowledged exactly the payload.
    // Implementations give up early (TransientTransportError) if cancel fires.
    virtual Status put(const UploadSlot& slot, const ChunkPayload& payload,
                       const CancellationToken& cancel) = 0;
};

// Checks a 2xx response against what was sent: a reported length must equal
// the payload size and an MD5-shaped ETag must equal the payload checksum.
// headers must have lower-case names.
Status checkAcknowledgment(const std::map<std::string, std::string>& headers,
                           const ChunkPayload& payload);

// HTTP/1.1 PUT over Boost.Beast, TLS through OpenSSL for https URLs.
// Connection addresses come from the shared HostResolver.
class BeastHttpTransport : public ChunkTransport {
public:
    BeastHttpTransport(HostResolver& resolver, int timeout_ms, int slot_expired_status);

    Status put(const UploadSlot& slot, const ChunkPayload& payload,
               const CancellationToken& cancel) override;

private:
    HostResolver& resolver_;
    int timeout_ms_;
    int slot_expired_status_;
    boost::asio::ssl::context ssl_context_;
};

} // namespace ua
