#pragma once

#include "socket_wrapper.hpp"

namespace httpfile {

class TlsSocket : public ISocket {
public:
    explicit TlsSocket(bool verify_peer = true);
    ~TlsSocket() override;

    TlsSocket(TlsSocket&&) noexcept;
    TlsSocket& operator=(TlsSocket&&) noexcept;

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) override;
    std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) override;
    std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) override;
    std::expected<std::string, SocketErrorInfo> read_until(const std::string& delimiter) override;

    void set_timeout(int seconds) override;
    void interrupt() override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;

    std::expected<size_t, SocketErrorInfo> read_tls(std::span<char> buffer);
};

} // namespace httpfile
