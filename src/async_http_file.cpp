#include "async_http_file.hpp"
#include "log.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <algorithm>
#include <chrono>

namespace httpfile {

AsyncHttpFile::AsyncHttpFile(AsyncLocator locator, AsyncOpener opener, Headers headers, std::uint64_t seek_threshold)
    : locator_(std::move(locator)),
      opener_(std::move(opener)),
      core_(std::move(headers), seek_threshold) {}

AsyncHttpFile::~AsyncHttpFile() {
    // Transports release their connection when the last reference goes.
    core_.close();
}

asio::awaitable<std::expected<std::unique_ptr<AsyncHttpFile>, FileErrorInfo>> AsyncHttpFile::open(
    AsyncLocator locator,
    ReaderOptions options,
    AsyncOpener opener
) {
    using Result = std::expected<std::unique_ptr<AsyncHttpFile>, FileErrorInfo>;
    if (!opener) co_return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "no transport opener"});

    std::unique_ptr<AsyncHttpFile> file(new AsyncHttpFile(
        std::move(locator), std::move(opener), base_headers(options.headers), options.seek_threshold));

    auto url = co_await file->resolve();
    if (!url) co_return std::unexpected(url.error());

    std::optional<std::int64_t> start;
    if (options.start != 0) start = options.start;
    auto headers = request_headers(file->core_.headers(), url->headers, start);

    log::debug("open " + url->value);
    auto transport = co_await file->opener_(url->value, std::move(headers));
    if (!transport) co_return std::unexpected(transport.error());

    std::shared_ptr<AsyncTransport> handle(std::move(*transport));
    auto info = describe(handle->head(), options.start);
    file->core_.establish(std::move(handle), std::move(info));
    co_return Result(std::move(file));
}

std::expected<std::unique_ptr<AsyncHttpFile>, FileErrorInfo> AsyncHttpFile::open_blocking(
    asio::io_context& io,
    AsyncLocator locator,
    ReaderOptions options,
    AsyncOpener opener
) {
    auto future = asio::co_spawn(io,
        open(std::move(locator), std::move(options), std::move(opener)),
        asio::use_future);
    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        if (io.stopped()) io.restart();
        io.run_one();
    }
    return future.get();
}

asio::awaitable<std::expected<Url, FileErrorInfo>> AsyncHttpFile::resolve() {
    using Result = std::expected<Url, FileErrorInfo>;
    if (auto* fixed = std::get_if<Url>(&locator_)) co_return Result(*fixed);
    if (auto* blocking = std::get_if<UrlProducer>(&locator_)) co_return (*blocking)();
    co_return co_await std::get<AsyncUrlProducer>(locator_)();
}

asio::awaitable<std::expected<std::shared_ptr<AsyncTransport>, FileErrorInfo>> AsyncHttpFile::attached() {
    using Result = std::expected<std::shared_ptr<AsyncTransport>, FileErrorInfo>;
    if (auto handle = core_.handle()) co_return Result(std::move(handle));
    if (auto r = co_await reconnect(); !r) co_return std::unexpected(r.error());
    co_return Result(core_.handle());
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> AsyncHttpFile::pull(AsyncTransport& handle, std::span<char> buffer) {
    using Result = std::expected<size_t, FileErrorInfo>;
    auto n = co_await handle.read(buffer);
    if (auto ok = core_.settle(); !ok) co_return std::unexpected(ok.error());
    if (!n) co_return std::unexpected(n.error());
    core_.advance(*n);
    co_return Result(*n);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncHttpFile::read(size_t size) {
    using Result = std::expected<std::string, FileErrorInfo>;
    if (auto ok = core_.check_open(); !ok) co_return std::unexpected(ok.error());
    if (size == 0 || core_.at_eof()) co_return Result(std::string{});

    auto handle = co_await attached();
    if (!handle) co_return std::unexpected(handle.error());
    if (!*handle) co_return Result(std::string{});

    std::string out;
    std::vector<char> chunk(std::min(size, kDiscardChunkSize));
    while (out.size() < size) {
        size_t want = std::min(chunk.size(), size - out.size());
        auto n = co_await pull(**handle, std::span{chunk.data(), want});
        if (!n) co_return std::unexpected(n.error());
        if (*n == 0) break;
        out.append(chunk.data(), *n);
    }
    co_return Result(std::move(out));
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncHttpFile::read_all() {
    co_return co_await read(npos);
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> AsyncHttpFile::read_into(std::span<char> buffer) {
    using Result = std::expected<size_t, FileErrorInfo>;
    if (auto ok = core_.check_open(); !ok) co_return std::unexpected(ok.error());
    if (buffer.empty() || core_.at_eof()) co_return Result(0);

    auto handle = co_await attached();
    if (!handle) co_return std::unexpected(handle.error());
    if (!*handle) co_return Result(0);
    co_return co_await pull(**handle, buffer);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncHttpFile::read_line(size_t limit) {
    using Result = std::expected<std::string, FileErrorInfo>;
    if (auto ok = core_.check_open(); !ok) co_return std::unexpected(ok.error());
    if (limit == 0 || core_.at_eof()) co_return Result(std::string{});

    auto handle = co_await attached();
    if (!handle) co_return std::unexpected(handle.error());
    if (!*handle) co_return Result(std::string{});

    auto line = co_await (*handle)->read_line(limit);
    if (auto ok = core_.settle(); !ok) co_return std::unexpected(ok.error());
    if (!line) co_return std::unexpected(line.error());
    core_.advance(line->size());
    co_return line;
}

asio::awaitable<std::expected<std::vector<std::string>, FileErrorInfo>> AsyncHttpFile::read_lines(size_t hint) {
    using Result = std::expected<std::vector<std::string>, FileErrorInfo>;
    std::vector<std::string> lines;
    size_t total = 0;
    while (true) {
        auto line = co_await read_line();
        if (!line) co_return std::unexpected(line.error());
        if (line->empty()) break;
        total += line->size();
        lines.push_back(std::move(*line));
        if (hint > 0 && total >= hint) break;
    }
    co_return Result(std::move(lines));
}

asio::awaitable<std::expected<void, FileErrorInfo>> AsyncHttpFile::discard(std::uint64_t count) {
    using Result = std::expected<void, FileErrorInfo>;
    auto handle = co_await attached();
    if (!handle) co_return std::unexpected(handle.error());
    if (!*handle) co_return Result();

    std::vector<char> sink(static_cast<size_t>(std::min<std::uint64_t>(count, kDiscardChunkSize)));
    while (count > 0) {
        size_t want = static_cast<size_t>(std::min<std::uint64_t>(count, sink.size()));
        auto n = co_await pull(**handle, std::span{sink.data(), want});
        if (!n) co_return std::unexpected(n.error());
        if (*n == 0) break;
        count -= *n;
    }
    co_return Result();
}

asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> AsyncHttpFile::seek(std::int64_t pos, Whence whence) {
    using Result = std::expected<std::uint64_t, FileErrorInfo>;
    auto plan = core_.plan_seek(pos, whence);
    if (!plan) co_return std::unexpected(plan.error());

    switch (plan->action) {
        case SeekAction::None:
            break;
        case SeekAction::Discard:
            if (auto r = co_await discard(plan->distance); !r) co_return std::unexpected(r.error());
            co_return Result(core_.tell());
        case SeekAction::Reconnect:
            co_return co_await reconnect(static_cast<std::int64_t>(plan->target));
    }
    co_return Result(plan->target);
}

std::expected<std::uint64_t, FileErrorInfo> AsyncHttpFile::tell() const {
    if (auto ok = core_.check_open(); !ok) return std::unexpected(ok.error());
    return core_.tell();
}

asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> AsyncHttpFile::reconnect(std::optional<std::int64_t> start) {
    using Result = std::expected<std::uint64_t, FileErrorInfo>;
    auto plan = core_.plan_reconnect(start);
    if (!plan) co_return std::unexpected(plan.error());

    if (auto old = core_.detach(plan->start)) co_await old->close();
    if (plan->detach) {
        log::debug("detached at " + std::to_string(plan->start) + " of " + std::to_string(length()));
        co_return Result(plan->start);
    }

    auto url = co_await resolve();
    if (!url) co_return std::unexpected(url.error());
    auto headers = core_.headers_for(plan->start, url->headers);

    log::debug("reconnect " + url->value + " at " + std::to_string(plan->start));
    auto transport = co_await opener_(url->value, std::move(headers));
    if (auto ok = core_.settle(); !ok) {
        if (transport) co_await (*transport)->close();
        co_return std::unexpected(ok.error());
    }
    if (!transport) co_return std::unexpected(transport.error());

    std::shared_ptr<AsyncTransport> handle(std::move(*transport));
    if (auto ok = core_.verify_length(handle->head()); !ok) {
        co_await handle->close();
        co_return std::unexpected(ok.error());
    }
    if (auto ok = core_.verify_range(handle->head(), plan->start); !ok) {
        co_await handle->close();
        co_return std::unexpected(ok.error());
    }
    if (!core_.attach(handle, plan->start)) {
        co_await handle->close();
        co_return std::unexpected(closed_error());
    }
    co_return Result(plan->start);
}

asio::awaitable<void> AsyncHttpFile::close() {
    auto [first, handle] = core_.close();
    if (handle) co_await handle->close();
    if (first) log::debug("closed at " + std::to_string(core_.tell()));
}

std::string AsyncHttpFile::repr() const {
    std::string out = "httpfile::AsyncHttpFile(url=";
    if (auto* fixed = std::get_if<Url>(&locator_)) {
        out += "'" + fixed->value + "'";
    } else {
        out += "<producer>";
    }
    out += ", start=" + std::to_string(core_.tell());
    out += ", length=" + std::to_string(length());
    out += ", seek_threshold=" + std::to_string(seek_threshold());
    out += closed() ? ", closed)" : ")";
    return out;
}

} // namespace httpfile
