#pragma once

#include "async_transport.hpp"
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <chrono>
#include <memory>

namespace httpfile {

namespace beast = boost::beast;

// Response body pulled from a beast parser straight into the caller's buffer.
class BeastTransport : public AsyncTransport {
public:
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    // Connects, sends the GET and reads the response head, following redirects.
    static asio::awaitable<std::expected<std::unique_ptr<BeastTransport>, FileErrorInfo>> open(
        std::string url,
        Headers headers,
        TransportConfig config
    );

    const ResponseHead& head() const override { return head_; }
    asio::awaitable<std::expected<size_t, FileErrorInfo>> read(std::span<char> buffer) override;
    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit) override;
    asio::awaitable<void> close() override;

private:
    BeastTransport(asio::any_io_executor executor, std::chrono::seconds timeout);

    asio::awaitable<std::expected<size_t, FileErrorInfo>> read_body(std::span<char> buffer);
    void shutdown();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    beast::http::response_parser<beast::http::buffer_body> parser_;
    std::chrono::seconds timeout_;
    ResponseHead head_;
    std::string lookahead_;
    bool closed_ = false;
};

} // namespace httpfile
