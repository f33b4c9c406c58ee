#pragma once

#include "file_error.hpp"
#include "http_protocol.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <variant>

namespace httpfile {

struct TransportConfig {
    long timeout = 300;                     // seconds
    size_t buffer_size = 512 * 1024;        // 512KB default
    bool enable_http2 = true;
    bool enable_tcp_nodelay = true;
    bool enable_tcp_keepalive = true;
    bool follow_redirects = true;
    bool verify_peer = true;
    std::string user_agent = "httpfile/1.0";
};

// One open HTTP response body. Owned by exactly one reader.
class Transport {
public:
    virtual ~Transport() = default;

    virtual const ResponseHead& head() const = 0;

    // Up to buffer.size() bytes; 0 at end of body.
    virtual std::expected<size_t, FileErrorInfo> read(std::span<char> buffer) = 0;

    // Bytes through the next '\n' (inclusive), at most limit bytes.
    virtual std::expected<std::string, FileErrorInfo> read_line(size_t limit) = 0;

    // Whether position() reports bytes delivered from this body.
    // position() may be called from another thread while read() runs.
    virtual bool tracks_position() const { return false; }
    virtual std::uint64_t position() const { return 0; }

    // Idempotent. Safe to call from another thread while read() blocks.
    virtual void close() = 0;
};

using Opener = std::function<std::expected<std::unique_ptr<Transport>, FileErrorInfo>(
    const std::string& url, const Headers& headers)>;

// A URL plus headers that apply to requests made with it.
struct Url {
    std::string value;
    Headers headers;

    Url() = default;
    Url(std::string v) : value(std::move(v)) {}
    Url(const char* v) : value(v) {}
    Url(std::string v, Headers h) : value(std::move(v)), headers(std::move(h)) {}
};

using UrlProducer = std::function<std::expected<Url, FileErrorInfo>()>;

// Fixed URL, or a producer invoked for every open and reconnect.
using Locator = std::variant<Url, UrlProducer>;

Opener curl_opener(TransportConfig config = {});
Opener socket_opener(TransportConfig config = {});
Opener default_opener();

} // namespace httpfile
