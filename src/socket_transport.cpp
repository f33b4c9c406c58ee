#include "socket_transport.hpp"
#include "tls_socket.hpp"
#include "url.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>

namespace httpfile {

static constexpr int kMaxRedirects = 5;

static FileErrorInfo socket_error(const SocketErrorInfo& err) {
    return FileErrorInfo{FileError::Transport, err.message};
}

SocketTransport::SocketTransport(std::unique_ptr<ISocket> socket) : socket_(std::move(socket)) {}

SocketTransport::~SocketTransport() {
    if (socket_) socket_->close();
}

std::expected<std::unique_ptr<SocketTransport>, FileErrorInfo> SocketTransport::open(
    const std::string& url,
    const Headers& headers,
    const TransportConfig& config
) {
    std::string current = url;
    for (int redirects = 0; ; ++redirects) {
        auto parts = parse_url(current);
        if (!parts) return std::unexpected(parts.error());

        std::unique_ptr<ISocket> socket;
        if (parts->protocol == "https") {
            socket = std::make_unique<TlsSocket>(config.verify_peer);
        } else {
            socket = std::make_unique<Socket>();
        }
        socket->set_timeout(static_cast<int>(config.timeout));

        if (auto conn = socket->connect(parts->host, parts->port); !conn) {
            return std::unexpected(socket_error(conn.error()));
        }

        HttpRequest request{.method = "GET", .path = parts->path, .host = parts->host, .headers = headers};
        bool default_port = (parts->protocol == "https" && parts->port == 443) || (parts->protocol == "http" && parts->port == 80);
        if (!default_port) request.host += ":" + std::to_string(parts->port);

        auto request_str = HttpProtocol::build_request(request, config.user_agent);
        log::debug("socket GET " + current);
        if (auto sent = socket->write_all(std::span{request_str.data(), request_str.size()}); !sent) {
            return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to send request: " + sent.error().message});
        }

        auto response = HttpProtocol::parse_response(*socket);
        if (!response) return std::unexpected(response.error());
        response->url = current;

        if (config.follow_redirects && response->status_code >= 300 && response->status_code < 400) {
            auto location = HttpProtocol::get_header(*response, "location");
            if (location && redirects < kMaxRedirects) {
                if (location->starts_with("/")) {
                    current = parts->protocol + "://" + parts->host + ":" + std::to_string(parts->port) + *location;
                } else {
                    current = *location;
                }
                continue;
            }
        }

        // A 3xx lands here when redirects are off, exhausted or missing a Location.
        if (response->status_code < 200 || response->status_code >= 300) {
            return std::unexpected(FileErrorInfo{FileError::Transport,
                "HTTP error: " + std::to_string(response->status_code), response->status_code});
        }

        std::unique_ptr<SocketTransport> transport(new SocketTransport(std::move(socket)));
        transport->head_ = std::move(*response);
        if (HttpProtocol::is_chunked(transport->head_)) {
            transport->framing_ = Framing::Chunked;
        } else if (auto length = HttpProtocol::content_length(transport->head_)) {
            transport->framing_ = Framing::Length;
            transport->remaining_ = *length;
        } else {
            transport->framing_ = Framing::UntilClose;
        }
        if (transport->head_.status_code == 204) transport->eof_ = true;
        return transport;
    }
}

std::expected<bool, FileErrorInfo> SocketTransport::next_chunk() {
    if (!first_chunk_) {
        // CRLF that terminates the previous chunk's data
        if (auto crlf = socket_->read_until("\r\n"); !crlf) return std::unexpected(socket_error(crlf.error()));
    }
    first_chunk_ = false;

    auto size = HttpProtocol::read_chunk_size(*socket_);
    if (!size) return std::unexpected(size.error());
    if (*size == 0) {
        if (auto trailer = HttpProtocol::skip_chunk_trailer(*socket_); !trailer) return std::unexpected(trailer.error());
        return false;
    }
    remaining_ = *size;
    return true;
}

std::expected<size_t, FileErrorInfo> SocketTransport::read_body(std::span<char> buffer) {
    if (closed_) return std::unexpected(FileErrorInfo{FileError::Transport, "Transport closed"});
    if (eof_ || buffer.empty()) return 0;

    if (framing_ == Framing::Chunked && remaining_ == 0) {
        auto more = next_chunk();
        if (!more) return std::unexpected(more.error());
        if (!*more) {
            eof_ = true;
            return 0;
        }
    }

    if (framing_ == Framing::Length && remaining_ == 0) {
        eof_ = true;
        return 0;
    }

    size_t want = buffer.size();
    if (framing_ != Framing::UntilClose) want = static_cast<size_t>(std::min<std::uint64_t>(want, remaining_));

    auto n = socket_->read(buffer.first(want));
    if (!n) {
        if (closed_) return std::unexpected(FileErrorInfo{FileError::Transport, "Transport closed"});
        return std::unexpected(socket_error(n.error()));
    }
    if (*n == 0) {
        if (framing_ == Framing::UntilClose) {
            eof_ = true;
            return 0;
        }
        return std::unexpected(FileErrorInfo{FileError::Transport, "Connection closed before end of body"});
    }
    if (framing_ != Framing::UntilClose) remaining_ -= *n;
    return *n;
}

std::expected<size_t, FileErrorInfo> SocketTransport::read(std::span<char> buffer) {
    if (!lookahead_.empty()) {
        size_t n = std::min(buffer.size(), lookahead_.size());
        std::copy_n(lookahead_.begin(), n, buffer.data());
        lookahead_.erase(0, n);
        return n;
    }
    return read_body(buffer);
}

std::expected<std::string, FileErrorInfo> SocketTransport::read_line(size_t limit) {
    std::array<char, 4096> temp{};
    size_t scanned = 0;
    while (true) {
        auto nl = lookahead_.find('\n', scanned);
        if (nl != std::string::npos || lookahead_.size() >= limit) {
            size_t n = std::min(nl != std::string::npos ? nl + 1 : lookahead_.size(), limit);
            std::string line = lookahead_.substr(0, n);
            lookahead_.erase(0, n);
            return line;
        }
        scanned = lookahead_.size();

        auto got = read_body(std::span{temp});
        if (!got) return std::unexpected(got.error());
        if (*got == 0) {
            std::string line = std::move(lookahead_);
            lookahead_.clear();
            return line;
        }
        lookahead_.append(temp.data(), *got);
    }
}

void SocketTransport::close() {
    if (closed_.exchange(true)) return;
    socket_->interrupt();
}

Opener socket_opener(TransportConfig config) {
    return [config](const std::string& url, const Headers& headers)
        -> std::expected<std::unique_ptr<Transport>, FileErrorInfo> {
        auto transport = SocketTransport::open(url, headers, config);
        if (!transport) return std::unexpected(transport.error());
        return std::unique_ptr<Transport>(std::move(*transport));
    };
}

} // namespace httpfile
