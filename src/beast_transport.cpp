#include "beast_transport.hpp"
#include "log.hpp"
#include "url.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <algorithm>
#include <array>

namespace httpfile {

namespace http = beast::http;
using tcp = asio::ip::tcp;

static constexpr int kMaxRedirects = 5;

static FileErrorInfo beast_error(std::string_view what, const beast::error_code& ec) {
    return FileErrorInfo{FileError::Transport, std::string(what) + ": " + ec.message()};
}

BeastTransport::BeastTransport(asio::any_io_executor executor, std::chrono::seconds timeout)
    : stream_(std::move(executor)), timeout_(timeout) {}

BeastTransport::~BeastTransport() {
    shutdown();
}

asio::awaitable<std::expected<std::unique_ptr<BeastTransport>, FileErrorInfo>> BeastTransport::open(
    std::string url,
    Headers headers,
    TransportConfig config
) {
    using Result = std::expected<std::unique_ptr<BeastTransport>, FileErrorInfo>;
    auto executor = co_await asio::this_coro::executor;

    std::string current = std::move(url);
    for (int redirects = 0; ; ++redirects) {
        auto parts = parse_url(current);
        if (!parts) co_return std::unexpected(parts.error());
        if (parts->protocol != "http") {
            co_return std::unexpected(FileErrorInfo{FileError::Transport, "beast transport supports plain http only: " + current});
        }

        std::unique_ptr<BeastTransport> transport(new BeastTransport(executor, std::chrono::seconds(config.timeout)));
        beast::error_code ec;

        tcp::resolver resolver(executor);
        auto endpoints = co_await resolver.async_resolve(
            parts->host, std::to_string(parts->port), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return std::unexpected(beast_error("Failed to resolve " + parts->host, ec));

        transport->stream_.expires_after(transport->timeout_);
        co_await transport->stream_.async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return std::unexpected(beast_error("Failed to connect", ec));
        if (config.enable_tcp_nodelay) transport->stream_.socket().set_option(tcp::no_delay(true), ec);
        if (config.enable_tcp_keepalive) transport->stream_.socket().set_option(asio::socket_base::keep_alive(true), ec);

        http::request<http::empty_body> request{http::verb::get, parts->path, 11};
        std::string host = parts->host;
        if (parts->port != 80) host += ":" + std::to_string(parts->port);
        request.set(http::field::host, host);
        request.set(http::field::user_agent, config.user_agent);
        for (const auto& [key, value] : headers) request.set(key, value);

        log::debug("beast GET " + current);
        co_await http::async_write(transport->stream_, request, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return std::unexpected(beast_error("Failed to send request", ec));

        auto& parser = transport->parser_;
        parser.body_limit(boost::none);
        co_await http::async_read_header(transport->stream_, transport->buffer_, parser,
                                         asio::redirect_error(asio::use_awaitable, ec));
        if (ec) co_return std::unexpected(beast_error("Failed to read response head", ec));

        const auto& message = parser.get();
        auto& head = transport->head_;
        head.status_code = static_cast<int>(message.result_int());
        head.status_message = std::string(message.reason());
        head.url = current;
        for (const auto& field : message) {
            std::string name(field.name_string());
            std::string value(field.value());
            if (auto it = head.headers.find(name); it != head.headers.end()) {
                it->second += ", " + value;
            } else {
                head.headers.emplace(std::move(name), std::move(value));
            }
        }

        if (config.follow_redirects && head.status_code >= 300 && head.status_code < 400) {
            auto location = HttpProtocol::get_header(head, "location");
            if (location && redirects < kMaxRedirects) {
                if (location->starts_with("/")) {
                    current = parts->protocol + "://" + host + *location;
                } else {
                    current = *location;
                }
                continue;
            }
        }

        if (head.status_code < 200 || head.status_code >= 300) {
            co_return std::unexpected(FileErrorInfo{FileError::Transport,
                "HTTP error: " + std::to_string(head.status_code), head.status_code});
        }
        co_return Result(std::move(transport));
    }
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> BeastTransport::read_body(std::span<char> buffer) {
    using Result = std::expected<size_t, FileErrorInfo>;
    if (closed_) co_return std::unexpected(FileErrorInfo{FileError::Transport, "Transport closed"});

    // A read can consume only framing (chunk headers) and deliver nothing; go again.
    while (!parser_.is_done()) {
        auto& body = parser_.get().body();
        body.data = buffer.data();
        body.size = buffer.size();
        body.more = true;

        beast::error_code ec;
        stream_.expires_after(timeout_);
        co_await http::async_read_some(stream_, buffer_, parser_, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::need_buffer) ec = {};
        if (closed_) co_return std::unexpected(FileErrorInfo{FileError::Transport, "Transport closed"});
        if (ec) co_return std::unexpected(beast_error("Failed to read body", ec));

        size_t n = buffer.size() - body.size;
        if (n > 0) co_return Result(n);
    }
    co_return Result(0);
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> BeastTransport::read(std::span<char> buffer) {
    using Result = std::expected<size_t, FileErrorInfo>;
    if (buffer.empty()) co_return Result(0);
    if (!lookahead_.empty()) {
        size_t n = std::min(buffer.size(), lookahead_.size());
        std::copy_n(lookahead_.begin(), n, buffer.data());
        lookahead_.erase(0, n);
        co_return Result(n);
    }
    co_return co_await read_body(buffer);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> BeastTransport::read_line(size_t limit) {
    using Result = std::expected<std::string, FileErrorInfo>;
    std::array<char, 4096> temp{};
    size_t scanned = 0;
    while (true) {
        auto nl = lookahead_.find('\n', scanned);
        if (nl != std::string::npos || lookahead_.size() >= limit) {
            size_t n = std::min(nl != std::string::npos ? nl + 1 : lookahead_.size(), limit);
            std::string line = lookahead_.substr(0, n);
            lookahead_.erase(0, n);
            co_return Result(std::move(line));
        }
        scanned = lookahead_.size();

        auto got = co_await read_body(std::span{temp});
        if (!got) co_return std::unexpected(got.error());
        if (*got == 0) {
            std::string line = std::move(lookahead_);
            lookahead_.clear();
            co_return Result(std::move(line));
        }
        lookahead_.append(temp.data(), *got);
    }
}

void BeastTransport::shutdown() {
    if (closed_) return;
    closed_ = true;
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.close();
}

asio::awaitable<void> BeastTransport::close() {
    shutdown();
    co_return;
}

AsyncOpener beast_opener(TransportConfig config) {
    return [config](std::string url, Headers headers)
        -> asio::awaitable<std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>> {
        using Result = std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>;
        auto settings = config;
        auto transport = co_await BeastTransport::open(std::move(url), std::move(headers), std::move(settings));
        if (!transport) co_return std::unexpected(transport.error());
        co_return Result(std::unique_ptr<AsyncTransport>(std::move(*transport)));
    };
}

} // namespace httpfile
