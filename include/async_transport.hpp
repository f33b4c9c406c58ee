#pragma once

#include "transport.hpp"
#include <utility>  // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <variant>

namespace httpfile {

namespace asio = boost::asio;

// Coroutine counterpart of Transport. close() may run while a read is suspended
// on the same executor; the suspended read then completes with an error.
class AsyncTransport {
public:
    virtual ~AsyncTransport() = default;

    virtual const ResponseHead& head() const = 0;

    virtual asio::awaitable<std::expected<size_t, FileErrorInfo>> read(std::span<char> buffer) = 0;
    virtual asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit) = 0;

    virtual bool tracks_position() const { return false; }
    virtual std::uint64_t position() const { return 0; }

    virtual asio::awaitable<void> close() = 0;
};

using AsyncOpener = std::function<asio::awaitable<std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>>(
    std::string url, Headers headers)>;

using AsyncUrlProducer = std::function<asio::awaitable<std::expected<Url, FileErrorInfo>>()>;

// Fixed URL, suspending producer, or blocking producer.
using AsyncLocator = std::variant<Url, AsyncUrlProducer, UrlProducer>;

// HTTP/1.1 over Boost.Beast; plain http only.
AsyncOpener beast_opener(TransportConfig config = {});

// Runs a blocking opener, and every read of its handles, on `executor`.
AsyncOpener threaded_opener(Opener opener, asio::any_io_executor executor);

// Beast for http, libcurl on a shared thread pool for https.
AsyncOpener default_async_opener();

} // namespace httpfile
