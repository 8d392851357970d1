#include "http_transport.h"
#include "checksum.h"
#include "retry_policy.h"
#include "utils.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <cstdlib>

namespace beast = boost::beast;       // from <boost/beast.hpp>
namespace http = beast::http;         // from <boost/beast/http.hpp>
namespace asio = boost::asio;         // from <boost/asio.hpp>
namespace ssl = boost::asio::ssl;     // from <boost/asio/ssl.hpp>
using tcp = asio::ip::tcp;

namespace ua {

namespace {

using PutRequest = http::request<http::vector_body<uint8_t>>;
using PutResponse = http::response<http::string_body>;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

// Runs one asynchronous operation to completion on ioc, cancelling the
// stream if the job is cancelled meanwhile. Async operations are used so
// that tcp_stream's expiry (the per-call timeout) applies.
template <typename Op, typename Stop>
beast::error_code runOperation(asio::io_context& ioc, const CancellationToken& cancel,
                               Op start, Stop stop) {
    beast::error_code result = asio::error::would_block;
    start([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    bool stopped = false;
    while (!ioc.stopped()) {
        ioc.run_for(POLL_INTERVAL);
        if (!stopped && !ioc.stopped() && cancel.isCancelled()) {
            stop();
            stopped = true;
        }
    }
    return result;
}

std::string describe(const beast::error_code& ec) {
    return ec == beast::error::timeout ? std::string("timed out") : ec.message();
}

template <typename Stream>
Status exchange(asio::io_context& ioc, Stream& stream, PutRequest& request, PutResponse* response,
                const CancellationToken& cancel, std::chrono::milliseconds timeout,
                const std::string& host) {
    auto& socket = beast::get_lowest_layer(stream);
    auto stop = [&socket]() { socket.cancel(); };

    socket.expires_after(timeout);
    beast::error_code ec = runOperation(ioc, cancel, [&](auto handler) {
        http::async_write(stream, request, std::move(handler));
    }, stop);
    if (ec) {
        return Status(ErrorCode::TransientTransportError, "sending to " + host + " failed: " + describe(ec));
    }

    beast::flat_buffer buffer;
    socket.expires_after(timeout);
    ec = runOperation(ioc, cancel, [&](auto handler) {
        http::async_read(stream, buffer, *response, std::move(handler));
    }, stop);
    if (ec) {
        return Status(ErrorCode::TransientTransportError, "reading reply from " + host + " failed: " + describe(ec));
    }
    return Status::OK();
}

} // namespace

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    HttpUrl result;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = Utils::toLower(url.substr(0, scheme_end));
    if (result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    result.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (!result.target.empty() && result.target[0] == '?') {
        result.target = "/" + result.target;
    }

    if (!authority.empty() && authority[0] == '[') {
        // IPv6 literal
        auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            result.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        return std::nullopt;
    }
    if (result.port.empty()) {
        result.port = result.scheme == "https" ? "443" : "80";
    }
    if (result.port.size() > 5 ||
        result.port.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    unsigned long port = std::strtoul(result.port.c_str(), nullptr, 10);
    if (port < 1 || port > 65535) {
        return std::nullopt;
    }
    result.port = std::to_string(port);
    return result;
}

Status checkAcknowledgment(const std::map<std::string, std::string>& headers,
                           const ChunkPayload& payload) {
    auto length_it = headers.find("x-received-length");
    if (length_it != headers.end()) {
        std::string expected = std::to_string(payload.bytes.size());
        if (Utils::trim(length_it->second) != expected) {
            return Status(ErrorCode::TransientTransportError,
                          "service received " + length_it->second + " bytes, sent " + expected);
        }
    }

    auto etag_it = headers.find("etag");
    if (etag_it != headers.end()) {
        std::string etag = Utils::trim(etag_it->second);
        if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
            etag = etag.substr(1, etag.size() - 2);
        }
        if (Checksum::looksLikeMd5(etag) && Utils::toLower(etag) != Utils::toLower(payload.md5)) {
            return Status(ErrorCode::TransientTransportError,
                          "checksum mismatch: service has " + etag + ", sent " + payload.md5);
        }
    }
    return Status::OK();
}

BeastHttpTransport::BeastHttpTransport(HostResolver& resolver, int timeout_ms, int slot_expired_status)
    : resolver_(resolver),
      timeout_ms_(timeout_ms),
      slot_expired_status_(slot_expired_status),
      ssl_context_(ssl::context::tls_client) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
}

Status BeastHttpTransport::put(const UploadSlot& slot, const ChunkPayload& payload,
                               const CancellationToken& cancel) {
    auto url = HttpUrl::parse(slot.url);
    if (!url) {
        return Status(ErrorCode::RemoteRejectedChunk, "malformed upload URL: " + slot.url);
    }
    const std::chrono::milliseconds timeout(timeout_ms_);

    PutRequest request{http::verb::put, url->target, 11};
    bool has_md5_header = false;
    for (const auto& header : slot.headers) {
        std::string name = Utils::toLower(header.first);
        // The transport owns framing; the slot's content-length is not trusted
        if (name == "content-length") continue;
        if (name == "content-md5") has_md5_header = true;
        request.set(header.first, header.second);
    }
    if (!has_md5_header) {
        request.set("Content-MD5", Checksum::hexToBase64(payload.md5));
    }
    bool default_port = (url->scheme == "https" && url->port == "443") ||
                        (url->scheme == "http" && url->port == "80");
    request.set(http::field::host, default_port ? url->host : url->host + ":" + url->port);
    request.set(http::field::user_agent, "ua-upload-agent " BOOST_BEAST_VERSION_STRING);
    request.body() = payload.bytes;
    request.prepare_payload();

    asio::io_context ioc;
    beast::tcp_stream socket(ioc);
    auto stop = [&socket]() { socket.cancel(); };

    beast::error_code ec;
    auto address = resolver_.next(url->host, url->port);
    if (address) {
        auto ip = asio::ip::make_address(*address, ec);
        if (ec) {
            return Status(ErrorCode::TransientTransportError, "bad resolved address " + *address);
        }
        tcp::endpoint endpoint(ip, static_cast<unsigned short>(std::stoi(url->port)));
        socket.expires_after(timeout);
        ec = runOperation(ioc, cancel, [&](auto handler) {
            socket.async_connect(endpoint, std::move(handler));
        }, stop);
        if (ec) {
            resolver_.markFailure(url->host, *address);
            return Status(ErrorCode::TransientTransportError,
                          "connect to " + url->host + " (" + *address + ") failed: " + describe(ec));
        }
        resolver_.markSuccess(url->host, *address);
    } else {
        // Nothing usable in the rotation: let the system resolver pick
        resolver_.invalidate(url->host);
        tcp::resolver dns(ioc);
        auto results = dns.resolve(url->host, url->port, ec);
        if (ec) {
            return Status(ErrorCode::TransientTransportError,
                          "cannot resolve " + url->host + ": " + ec.message());
        }
        socket.expires_after(timeout);
        ec = runOperation(ioc, cancel, [&](auto handler) {
            socket.async_connect(results, std::move(handler));
        }, stop);
        if (ec) {
            return Status(ErrorCode::TransientTransportError,
                          "connect to " + url->host + " failed: " + describe(ec));
        }
    }

    PutResponse response;
    Status status;
    if (url->scheme == "https") {
        beast::ssl_stream<beast::tcp_stream> stream(std::move(socket), ssl_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
            return Status(ErrorCode::TransientTransportError, "cannot set SNI host name " + url->host);
        }
        stream.set_verify_callback(ssl::host_name_verification(url->host));

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        ec = runOperation(ioc, cancel, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        }, [&lowest]() { lowest.cancel(); });
        if (ec) {
            return Status(ErrorCode::TransientTransportError,
                          "TLS handshake with " + url->host + " failed: " + describe(ec));
        }
        status = exchange(ioc, stream, request, &response, cancel, timeout, url->host);
    } else {
        status = exchange(ioc, socket, request, &response, cancel, timeout, url->host);
    }
    if (!status.ok()) {
        return status;
    }

    int code = response.result_int();
    ErrorCode error = classifyHttpStatus(code, slot_expired_status_);
    if (error != ErrorCode::Ok) {
        std::string body = response.body().substr(0, 256);
        return Status(error, "HTTP " + std::to_string(code) + " from " + url->host +
                             (body.empty() ? "" : ": " + body));
    }

    std::map<std::string, std::string> headers;
    for (const auto& field : response) {
        headers[Utils::toLower(std::string(field.name_string()))] = std::string(field.value());
    }
    return checkAcknowledgment(headers, payload);
}

} // namespace ua
