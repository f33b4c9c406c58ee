#include "tls_socket.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <algorithm>
#include <array>
#include <mutex>

namespace httpfile {

static std::string last_ssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    return buf.data();
}

class TlsSocket::Impl {
public:
    Socket socket;
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;
    std::string read_buffer;

    explicit Impl(bool verify_peer) {
        static std::once_flag init;
        std::call_once(init, [] { OPENSSL_init_ssl(0, nullptr); });
        ctx = SSL_CTX_new(TLS_client_method());
        if (ctx && verify_peer) {
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        }
    }

    ~Impl() {
        if (ssl) SSL_free(ssl);
        if (ctx) SSL_CTX_free(ctx);
    }
};

TlsSocket::TlsSocket(bool verify_peer) : pImpl_(std::make_unique<Impl>(verify_peer)) {}
TlsSocket::~TlsSocket() = default;
TlsSocket::TlsSocket(TlsSocket&&) noexcept = default;
TlsSocket& TlsSocket::operator=(TlsSocket&&) noexcept = default;

void TlsSocket::set_timeout(int seconds) {
    pImpl_->socket.set_timeout(seconds);
}

bool TlsSocket::is_open() const {
    return pImpl_->ssl != nullptr && pImpl_->socket.is_open();
}

void TlsSocket::interrupt() {
    pImpl_->socket.interrupt();
}

void TlsSocket::close() {
    if (pImpl_->ssl) {
        SSL_shutdown(pImpl_->ssl);
        SSL_free(pImpl_->ssl);
        pImpl_->ssl = nullptr;
    }
    pImpl_->socket.close();
}

std::expected<void, SocketErrorInfo> TlsSocket::connect(const std::string& host, uint16_t port) {
    if (!pImpl_->ctx) {
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "Failed to create TLS context: " + last_ssl_error()});
    }

    auto conn = pImpl_->socket.connect(host, port);
    if (!conn) return conn;

    pImpl_->ssl = SSL_new(pImpl_->ctx);
    SSL_set_fd(pImpl_->ssl, pImpl_->socket.fd());
    SSL_set_tlsext_host_name(pImpl_->ssl, host.c_str());
    SSL_set1_host(pImpl_->ssl, host.c_str());

    if (SSL_connect(pImpl_->ssl) <= 0) {
        auto reason = last_ssl_error();
        close();
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "TLS handshake failed: " + reason});
    }

    return {};
}

std::expected<size_t, SocketErrorInfo> TlsSocket::write(std::span<const char> data) {
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "TLS not connected"});
    }

    int sent = SSL_write(pImpl_->ssl, data.data(), static_cast<int>(data.size()));
    if (sent <= 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError,
            "TLS write failed: " + std::to_string(SSL_get_error(pImpl_->ssl, sent))});
    }
    return static_cast<size_t>(sent);
}

std::expected<size_t, SocketErrorInfo> TlsSocket::read_tls(std::span<char> buffer) {
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS not connected"});
    }

    int received = SSL_read(pImpl_->ssl, buffer.data(), static_cast<int>(buffer.size()));
    if (received <= 0) {
        int err = SSL_get_error(pImpl_->ssl, received);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        // Servers often drop the connection without close_notify once the body is sent.
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return 0;
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS read failed: " + std::to_string(err)});
    }
    return static_cast<size_t>(received);
}

std::expected<size_t, SocketErrorInfo> TlsSocket::read(std::span<char> buffer) {
    if (!pImpl_->read_buffer.empty()) {
        size_t to_copy = std::min(buffer.size(), pImpl_->read_buffer.size());
        std::copy_n(pImpl_->read_buffer.begin(), to_copy, buffer.data());
        pImpl_->read_buffer.erase(0, to_copy);
        return to_copy;
    }
    return read_tls(buffer);
}

std::expected<std::string, SocketErrorInfo> TlsSocket::read_until(const std::string& delim) {
    std::array<char, 4096> temp_buf{};

    while (true) {
        if (auto pos = pImpl_->read_buffer.find(delim); pos != std::string::npos) {
            auto result = pImpl_->read_buffer.substr(0, pos + delim.length());
            pImpl_->read_buffer.erase(0, pos + delim.length());
            return result;
        }

        auto read_result = read_tls(std::span{temp_buf});
        if (!read_result) return std::unexpected(read_result.error());
        if (*read_result == 0) return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Connection closed"});
        pImpl_->read_buffer.append(temp_buf.data(), *read_result);
    }
}

} // namespace httpfile
