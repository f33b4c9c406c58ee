#pragma once

#include "transport.hpp"
#include <memory>

namespace httpfile {

// Pull-style response body on top of the libcurl multi interface.
// The transfer only advances while the owner is waiting for bytes.
class CurlTransport : public Transport {
public:
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    // Sends the request and waits for the response head.
    static std::expected<std::unique_ptr<CurlTransport>, FileErrorInfo> open(
        const std::string& url,
        const Headers& headers,
        const TransportConfig& config
    );

    const ResponseHead& head() const override;
    std::expected<size_t, FileErrorInfo> read(std::span<char> buffer) override;
    std::expected<std::string, FileErrorInfo> read_line(size_t limit) override;
    bool tracks_position() const override { return true; }
    std::uint64_t position() const override;
    void close() override;

private:
    CurlTransport();

    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace httpfile
