#include "socket_wrapper.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace httpfile {

std::expected<void, SocketErrorInfo> ISocket::write_all(std::span<const char> data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = write(data.subspan(sent));
        if (!n) return std::unexpected(n.error());
        if (*n == 0) return std::unexpected(SocketErrorInfo{SocketError::WriteError, "Connection closed while writing"});
        sent += *n;
    }
    return {};
}

class Socket::Impl {
public:
    std::atomic<int> fd = -1;
    int timeout_sec = 30;
    std::string read_buffer;

    ~Impl() { if (fd >= 0) ::close(fd); }
};

Socket::Socket() : pImpl_(std::make_unique<Impl>()) {}
Socket::~Socket() = default;
Socket::Socket(Socket&&) noexcept = default;
Socket& Socket::operator=(Socket&&) noexcept = default;

void Socket::set_timeout(int seconds) {
    pImpl_->timeout_sec = seconds;
}

bool Socket::is_open() const {
    return pImpl_->fd >= 0;
}

void Socket::interrupt() {
    int fd = pImpl_->fd;
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void Socket::close() {
    int fd = pImpl_->fd.exchange(-1);
    if (fd >= 0) ::close(fd);
}

int Socket::fd() const {
    return pImpl_->fd;
}

std::expected<void, SocketErrorInfo> Socket::connect(const std::string& host, uint16_t port) {
    addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result) != 0) {
        return std::unexpected(SocketErrorInfo{SocketError::DNSError, "Failed to resolve host: " + host});
    }

    int last_errno = 0;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }

        timeval tv{pImpl_->timeout_sec, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(result);
            pImpl_->fd = fd;
            return {};
        }
        last_errno = errno;
        ::close(fd);
    }

    freeaddrinfo(result);
    return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
        "Connection failed to " + host + ":" + std::to_string(port) + ": " + std::strerror(last_errno)});
}

std::expected<size_t, SocketErrorInfo> Socket::write(std::span<const char> data) {
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "Socket not connected"});
    }

    ssize_t sent = ::send(pImpl_->fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, std::string("Write failed: ") + std::strerror(errno)});
    }
    return static_cast<size_t>(sent);
}

std::expected<size_t, SocketErrorInfo> Socket::recv_raw(std::span<char> buffer) {
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Socket not connected"});
    }

    ssize_t received = ::recv(pImpl_->fd, buffer.data(), buffer.size(), 0);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::unexpected(SocketErrorInfo{SocketError::TimeoutError, "Read timed out"});
        }
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, std::string("Read failed: ") + std::strerror(errno)});
    }
    return static_cast<size_t>(received);
}

std::expected<size_t, SocketErrorInfo> Socket::read(std::span<char> buffer) {
    if (!pImpl_->read_buffer.empty()) {
        size_t to_copy = std::min(buffer.size(), pImpl_->read_buffer.size());
        std::copy_n(pImpl_->read_buffer.begin(), to_copy, buffer.data());
        pImpl_->read_buffer.erase(0, to_copy);
        return to_copy;
    }
    return recv_raw(buffer);
}

std::expected<std::string, SocketErrorInfo> Socket::read_until(const std::string& delim) {
    std::array<char, 4096> temp_buf{};

    while (true) {
        if (auto pos = pImpl_->read_buffer.find(delim); pos != std::string::npos) {
            auto result = pImpl_->read_buffer.substr(0, pos + delim.length());
            pImpl_->read_buffer.erase(0, pos + delim.length());
            return result;
        }

        auto read_result = recv_raw(std::span{temp_buf});
        if (!read_result) return std::unexpected(read_result.error());
        if (*read_result == 0) return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Connection closed"});
        pImpl_->read_buffer.append(temp_buf.data(), *read_result);
    }
}

} // namespace httpfile
