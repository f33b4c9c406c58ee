#pragma once

#include "reader.hpp"
#include "reader_core.hpp"
#include "transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace httpfile {

// Seekable, read-only file over sequential HTTP transfers.
// Forward seeks within the threshold read and drop bytes; anything else reopens with a Range.
class HttpFile : public Reader {
public:
    ~HttpFile() override;

    HttpFile(const HttpFile&) = delete;
    HttpFile& operator=(const HttpFile&) = delete;

    // Performs the first request.
    static std::expected<std::unique_ptr<HttpFile>, FileErrorInfo> open(
        Locator locator,
        ReaderOptions options = {},
        Opener opener = default_opener()
    );

    std::expected<std::string, FileErrorInfo> read(size_t size) override;
    std::expected<size_t, FileErrorInfo> read_into(std::span<char> buffer) override;
    std::expected<std::string, FileErrorInfo> read_line(size_t limit = npos) override;

    std::expected<std::uint64_t, FileErrorInfo> seek(std::int64_t pos, Whence whence = Whence::Set) override;
    std::expected<std::uint64_t, FileErrorInfo> tell() const override;

    // Drops the current connection and opens a new one at `start` (default: the current position).
    // A negative start counts from the end.
    std::expected<std::uint64_t, FileErrorInfo> reconnect(std::optional<std::int64_t> start = std::nullopt);

    void close() override;
    bool closed() const override { return core_.closed(); }
    bool seekable() const override { return core_.info().seekable; }

    std::string name() const override { return core_.info().name; }
    std::string mode() const override { return "rb"; }

    std::uint64_t length() const { return core_.info().length; }
    bool chunked() const { return core_.info().chunked; }
    std::uint64_t seek_threshold() const { return core_.seek_threshold(); }
    const Headers& headers() const { return core_.headers(); }
    size_t reconnects() const { return core_.reconnects(); }

    std::string repr() const;

private:
    HttpFile(Locator locator, Opener opener, Headers headers, std::uint64_t seek_threshold);

    std::expected<Url, FileErrorInfo> resolve();

    // The bound handle, reconnecting first if detached. Null if the position is past the end.
    std::expected<std::shared_ptr<Transport>, FileErrorInfo> attached();

    std::expected<size_t, FileErrorInfo> pull(Transport& handle, std::span<char> buffer);
    std::expected<void, FileErrorInfo> discard(std::uint64_t count);

    Locator locator_;
    Opener opener_;
    ReaderCore<Transport> core_;
};

} // namespace httpfile
