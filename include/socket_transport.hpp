#pragma once

#include "socket_wrapper.hpp"
#include "transport.hpp"
#include <atomic>
#include <memory>

namespace httpfile {

// HTTP/1.1 response body read straight off a blocking socket (plain or TLS).
// Handles Content-Length, chunked and close-delimited framing. Does not track position.
class SocketTransport : public Transport {
public:
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    static std::expected<std::unique_ptr<SocketTransport>, FileErrorInfo> open(
        const std::string& url,
        const Headers& headers,
        const TransportConfig& config
    );

    const ResponseHead& head() const override { return head_; }
    std::expected<size_t, FileErrorInfo> read(std::span<char> buffer) override;
    std::expected<std::string, FileErrorInfo> read_line(size_t limit) override;
    void close() override;

private:
    enum class Framing { Length, Chunked, UntilClose };

    explicit SocketTransport(std::unique_ptr<ISocket> socket);

    std::expected<size_t, FileErrorInfo> read_body(std::span<char> buffer);
    std::expected<bool, FileErrorInfo> next_chunk();

    std::unique_ptr<ISocket> socket_;
    ResponseHead head_;
    Framing framing_ = Framing::UntilClose;
    std::uint64_t remaining_ = 0;     // bytes left in the body or the current chunk
    bool first_chunk_ = true;
    bool eof_ = false;
    std::string lookahead_;           // bytes pulled by read_line but not yet returned
    std::atomic<bool> closed_ = false;
};

} // namespace httpfile
