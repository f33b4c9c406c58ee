#pragma once

#include "async_transport.hpp"
#include "reader.hpp"
#include "reader_core.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace httpfile {

// Coroutine twin of HttpFile: the same state machine, with every network step awaited.
// An instance belongs to one task at a time; close() may come from another task on the same executor.
class AsyncHttpFile {
public:
    static constexpr size_t npos = Reader::npos;

    ~AsyncHttpFile();

    AsyncHttpFile(const AsyncHttpFile&) = delete;
    AsyncHttpFile& operator=(const AsyncHttpFile&) = delete;

    static asio::awaitable<std::expected<std::unique_ptr<AsyncHttpFile>, FileErrorInfo>> open(
        AsyncLocator locator,
        ReaderOptions options = {},
        AsyncOpener opener = default_async_opener()
    );

    // Runs open() on `io` until it finishes, for callers outside a coroutine.
    static std::expected<std::unique_ptr<AsyncHttpFile>, FileErrorInfo> open_blocking(
        asio::io_context& io,
        AsyncLocator locator,
        ReaderOptions options = {},
        AsyncOpener opener = default_async_opener()
    );

    asio::awaitable<std::expected<std::string, FileErrorInfo>> read(size_t size);
    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_all();
    asio::awaitable<std::expected<size_t, FileErrorInfo>> read_into(std::span<char> buffer);
    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit = npos);
    asio::awaitable<std::expected<std::vector<std::string>, FileErrorInfo>> read_lines(size_t hint = 0);

    asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> seek(std::int64_t pos, Whence whence = Whence::Set);
    std::expected<std::uint64_t, FileErrorInfo> tell() const;

    asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> reconnect(std::optional<std::int64_t> start = std::nullopt);

    asio::awaitable<void> close();
    bool closed() const { return core_.closed(); }
    bool seekable() const { return core_.info().seekable; }
    bool readable() const { return true; }
    bool writable() const { return false; }

    std::expected<size_t, FileErrorInfo> write(std::string_view) { return std::unexpected(unsupported_error("write")); }
    std::expected<void, FileErrorInfo> write_lines(const std::vector<std::string>&) { return std::unexpected(unsupported_error("write")); }
    std::expected<std::uint64_t, FileErrorInfo> truncate(std::uint64_t) { return std::unexpected(unsupported_error("truncate")); }

    std::string name() const { return core_.info().name; }
    std::string mode() const { return "rb"; }

    std::uint64_t length() const { return core_.info().length; }
    bool chunked() const { return core_.info().chunked; }
    std::uint64_t seek_threshold() const { return core_.seek_threshold(); }
    const Headers& headers() const { return core_.headers(); }
    size_t reconnects() const { return core_.reconnects(); }

    std::string repr() const;

private:
    AsyncHttpFile(AsyncLocator locator, AsyncOpener opener, Headers headers, std::uint64_t seek_threshold);

    asio::awaitable<std::expected<Url, FileErrorInfo>> resolve();
    asio::awaitable<std::expected<std::shared_ptr<AsyncTransport>, FileErrorInfo>> attached();
    asio::awaitable<std::expected<size_t, FileErrorInfo>> pull(AsyncTransport& handle, std::span<char> buffer);
    asio::awaitable<std::expected<void, FileErrorInfo>> discard(std::uint64_t count);

    AsyncLocator locator_;
    AsyncOpener opener_;
    ReaderCore<AsyncTransport> core_;
};

} // namespace httpfile
