#include "test_framework.h"
#include "../src/agent/http_transport.h"
#include "../src/common/checksum.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <thread>

namespace ua {
namespace test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

// Minimal HTTP/1.1 server on 127.0.0.1 answering one scripted reply per
// connection
class LocalHttpServer {
public:
    struct Reply {
        int status = 200;
        std::map<std::string, std::string> headers;
        std::string body;
        bool hang = false;  // read the request, never answer
    };

    struct Seen {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    LocalHttpServer() : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

    ~LocalHttpServer() {
        stop_ = true;
        if (thread_.joinable()) {
            // Unblock a pending accept()
            beast::error_code ec;
            tcp::socket poke(ioc_);
            poke.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port()), ec);
            thread_.join();
        }
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port()) + target;
    }

    void start(std::vector<Reply> replies) {
        thread_ = std::thread([this, replies]() {
            for (const Reply& reply : replies) {
                beast::error_code ec;
                tcp::socket socket(ioc_);
                acceptor_.accept(socket, ec);
                if (ec || stop_) return;
                serve(socket, reply);
            }
        });
    }

    std::vector<Seen> seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

private:
    void serve(tcp::socket& socket, const Reply& reply) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        http::read(socket, buffer, request, ec);
        if (ec) return;

        Seen seen;
        seen.method = std::string(request.method_string());
        seen.target = std::string(request.target());
        for (const auto& field : request) {
            seen.headers[Utils::toLower(std::string(field.name_string()))] = std::string(field.value());
        }
        seen.body = request.body();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(seen);
        }

        if (reply.hang) {
            while (!stop_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return;
        }

        http::response<http::string_body> response{static_cast<http::status>(reply.status), 11};
        for (const auto& header : reply.headers) {
            response.set(header.first, header.second);
        }
        response.body() = reply.body;
        response.prepare_payload();
        http::write(socket, response, ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    mutable std::mutex mutex_;
    std::vector<Seen> seen_;
};

class HttpTransportTest : public UATestBase {
protected:
    void SetUp() override {
        UATestBase::SetUp();
        resolver_ = std::make_unique<HostResolver>(HostResolver::Options());
        payload_.bytes = generateRandomBytes(4096);
        payload_.md5 = Checksum::md5Hex(payload_.bytes);
        payload_.raw_length = 4096;
    }

    UploadSlot slotFor(const std::string& url) {
        UploadSlot slot;
        slot.url = url;
        slot.headers = {{"content-length", "999999"}, {"x-amz-meta-part", "3"}};
        return slot;
    }

    std::unique_ptr<HostResolver> resolver_;
    ChunkPayload payload_;
    CancellationToken cancel_;
};

TEST_F(HttpTransportTest, ParseUrl) {
    auto url = HttpUrl::parse("https://upload.example.com/bucket/part?x=1&y=2");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "https");
    EXPECT_EQ(url->host, "upload.example.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/bucket/part?x=1&y=2");

    url = HttpUrl::parse("HTTP://10.1.2.3:8080");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->target, "/");

    url = HttpUrl::parse("http://[::1]:9000/p");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "9000");

    url = HttpUrl::parse("http://example.com?sig=abc");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->target, "/?sig=abc");

    EXPECT_FALSE(HttpUrl::parse("ftp://example.com/x").has_value());
    EXPECT_FALSE(HttpUrl::parse("example.com/x").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://:80/x").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://host:port/x").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://[::1/x").has_value());
}

TEST_F(HttpTransportTest, ParseUrlRejectsPortsOutOfRange) {
    EXPECT_FALSE(HttpUrl::parse("http://upload.test:99999999999/part/1").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://upload.test:70000/part/1").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://upload.test:65536/part/1").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://upload.test:0/part/1").has_value());

    auto url = HttpUrl::parse("http://upload.test:65535/part/1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, "65535");
    url = HttpUrl::parse("http://upload.test:0080/part/1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, "80");
}

TEST_F(HttpTransportTest, OutOfRangePortIsRejectedNotThrown) {
    BeastHttpTransport transport(*resolver_, 1000, 410);
    Status status = transport.put(slotFor("http://upload.test:99999999999/part/1"), payload_, cancel_);
    EXPECT_EQ(status.code(), ErrorCode::RemoteRejectedChunk);
    EXPECT_NE(status.message().find("malformed upload URL"), std::string::npos);
}

TEST_F(HttpTransportTest, AcknowledgmentCheck) {
    std::map<std::string, std::string> headers;
    ASSERT_UA_OK(checkAcknowledgment(headers, payload_));

    headers["x-received-length"] = "4096";
    headers["etag"] = "\"" + payload_.md5 + "\"";
    ASSERT_UA_OK(checkAcknowledgment(headers, payload_));

    headers["x-received-length"] = "4000";
    EXPECT_UA_CODE(checkAcknowledgment(headers, payload_), ErrorCode::TransientTransportError);

    headers["x-received-length"] = "4096";
    headers["etag"] = "\"00000000000000000000000000000000\"";
    EXPECT_UA_CODE(checkAcknowledgment(headers, payload_), ErrorCode::TransientTransportError);

    // Multipart-style ETags are not MD5s of the body and are not compared
    headers["etag"] = "\"3858f62230ac3c915f300c664312c63f-2\"";
    ASSERT_UA_OK(checkAcknowledgment(headers, payload_));
}

TEST_F(HttpTransportTest, PutDeliversPayload) {
    LocalHttpServer server;
    LocalHttpServer::Reply reply;
    reply.headers = {{"ETag", "\"" + payload_.md5 + "\""}, {"X-Received-Length", "4096"}};
    server.start({reply});

    BeastHttpTransport transport(*resolver_, 5000, 410);
    ASSERT_UA_OK(transport.put(slotFor(server.url("/file-1/part/3?sig=abc")), payload_, cancel_));

    auto seen = server.seen();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "PUT");
    EXPECT_EQ(seen[0].target, "/file-1/part/3?sig=abc");
    EXPECT_EQ(seen[0].headers["content-length"], "4096");
    EXPECT_EQ(seen[0].headers["content-md5"], Checksum::hexToBase64(payload_.md5));
    EXPECT_EQ(seen[0].headers["x-amz-meta-part"], "3");
    EXPECT_EQ(seen[0].body, std::string(payload_.bytes.begin(), payload_.bytes.end()));
}

TEST_F(HttpTransportTest, SlotSuppliedChecksumHeaderWins) {
    LocalHttpServer server;
    server.start({LocalHttpServer::Reply()});

    UploadSlot slot = slotFor(server.url("/p"));
    slot.headers["Content-MD5"] = "from-the-slot";
    BeastHttpTransport transport(*resolver_, 5000, 410);
    ASSERT_UA_OK(transport.put(slot, payload_, cancel_));
    EXPECT_EQ(server.seen().at(0).headers["content-md5"], "from-the-slot");
}

TEST_F(HttpTransportTest, StatusCodesAreClassified) {
    LocalHttpServer server;
    LocalHttpServer::Reply unavailable, expired, forbidden, mismatch;
    unavailable.status = 503;
    unavailable.body = "try later";
    expired.status = 410;
    forbidden.status = 403;
    mismatch.headers = {{"X-Received-Length", "17"}};
    server.start({unavailable, expired, forbidden, mismatch});

    BeastHttpTransport transport(*resolver_, 5000, 410);
    UploadSlot slot = slotFor(server.url("/p"));

    Status status = transport.put(slot, payload_, cancel_);
    EXPECT_EQ(status.code(), ErrorCode::TransientTransportError);
    EXPECT_NE(status.message().find("503"), std::string::npos);
    EXPECT_NE(status.message().find("try later"), std::string::npos);

    EXPECT_UA_CODE(transport.put(slot, payload_, cancel_), ErrorCode::SlotExpiredError);
    EXPECT_UA_CODE(transport.put(slot, payload_, cancel_), ErrorCode::RemoteRejectedChunk);
    EXPECT_UA_CODE(transport.put(slot, payload_, cancel_), ErrorCode::TransientTransportError);
}

TEST_F(HttpTransportTest, ConnectionRefused) {
    unsigned short port;
    {
        asio::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }
    BeastHttpTransport transport(*resolver_, 2000, 410);
    UploadSlot slot = slotFor("http://127.0.0.1:" + std::to_string(port) + "/p");
    EXPECT_UA_CODE(transport.put(slot, payload_, cancel_), ErrorCode::TransientTransportError);
}

TEST_F(HttpTransportTest, ResponseTimeout) {
    LocalHttpServer server;
    LocalHttpServer::Reply silent;
    silent.hang = true;
    server.start({silent});

    BeastHttpTransport transport(*resolver_, 300, 410);
    PerformanceTimer timer;
    timer.start();
    Status status = transport.put(slotFor(server.url("/p")), payload_, cancel_);
    timer.stop();

    EXPECT_EQ(status.code(), ErrorCode::TransientTransportError);
    EXPECT_NE(status.message().find("timed out"), std::string::npos) << status.toString();
    EXPECT_LT(timer.getElapsedMilliseconds(), 5000);
}

TEST_F(HttpTransportTest, CancellationAbandonsTransfer) {
    LocalHttpServer server;
    LocalHttpServer::Reply silent;
    silent.hang = true;
    server.start({silent});

    BeastHttpTransport transport(*resolver_, 60000, 410);
    std::thread canceller([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        cancel_.cancel();
    });

    PerformanceTimer timer;
    timer.start();
    Status status = transport.put(slotFor(server.url("/p")), payload_, cancel_);
    timer.stop();
    canceller.join();

    EXPECT_EQ(status.code(), ErrorCode::TransientTransportError);
    EXPECT_LT(timer.getElapsedMilliseconds(), 5000);
}

TEST_F(HttpTransportTest, MalformedSlotUrl) {
    BeastHttpTransport transport(*resolver_, 1000, 410);
    EXPECT_UA_CODE(transport.put(slotFor("not a url"), payload_, cancel_), ErrorCode::RemoteRejectedChunk);
}

} // namespace test
} // namespace ua
