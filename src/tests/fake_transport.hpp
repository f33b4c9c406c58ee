#pragma once

// In-memory HTTP resource and transports for exercising the readers without a network.

#include "async_transport.hpp"
#include "transport.hpp"
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace httpfile::testing {

// Deterministic bytes covering every octet value.
inline std::string binary_fixture(size_t size) {
    std::string out(size, '\0');
    for (size_t i = 0; i < size; ++i) out[i] = static_cast<char>((i * 31 + 7) % 256);
    return out;
}

inline std::string text_fixture(size_t lines) {
    std::string out;
    for (size_t i = 0; i < lines; ++i) out += "line " + std::to_string(i) + "\n";
    return out;
}

struct FakeResource {
    std::string content;
    bool honor_ranges = true;                     // answer Range with 206 + Content-Range
    bool advertise_ranges = true;                 // Accept-Ranges: bytes on 200 responses
    bool chunked = false;
    bool tracks_position = false;
    size_t max_read = 0;                          // cap per read() call; 0 = no cap
    std::optional<std::uint64_t> reported_length; // total announced in headers
    std::optional<std::string> disposition;       // Content-Disposition value
    std::optional<FileErrorInfo> fail_next_open;
    bool block_reads = false;                     // reads wait until the handle is closed

    std::atomic<int> opens = 0;
    std::atomic<int> closes = 0;
    std::vector<std::string> urls;
    std::vector<Headers> requests;
};

// Parses "bytes=N-" and "bytes=-N" into a first byte.
inline std::optional<std::uint64_t> range_start(const std::string& value, std::uint64_t total) {
    std::string_view v = value;
    if (!v.starts_with("bytes=")) return std::nullopt;
    v.remove_prefix(6);
    bool suffix = v.starts_with("-");
    if (suffix) v.remove_prefix(1);
    if (v.ends_with("-")) v.remove_suffix(1);
    std::uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
    if (ec != std::errc()) return std::nullopt;
    if (suffix) return total > n ? total - n : 0;
    return std::min(n, total);
}

class FakeTransport : public Transport {
public:
    FakeTransport(std::shared_ptr<FakeResource> resource, ResponseHead head, std::string body)
        : resource_(std::move(resource)), head_(std::move(head)), body_(std::move(body)) {}

    ~FakeTransport() override { close(); }

    const ResponseHead& head() const override { return head_; }

    std::expected<size_t, FileErrorInfo> read(std::span<char> buffer) override {
        if (resource_->block_reads) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return closed_.load(); });
        }
        if (closed_) return std::unexpected(FileErrorInfo{FileError::Transport, "fake transport closed"});

        size_t pos = pos_;
        size_t n = std::min(buffer.size(), body_.size() - pos);
        if (resource_->max_read > 0) n = std::min(n, resource_->max_read);
        std::copy_n(body_.data() + pos, n, buffer.data());
        pos_ = pos + n;
        return n;
    }

    std::expected<std::string, FileErrorInfo> read_line(size_t limit) override {
        if (closed_) return std::unexpected(FileErrorInfo{FileError::Transport, "fake transport closed"});
        size_t pos = pos_;
        auto nl = body_.find('\n', pos);
        size_t end = nl == std::string::npos ? body_.size() : nl + 1;
        size_t n = std::min(end - pos, limit);
        std::string line = body_.substr(pos, n);
        pos_ = pos + n;
        return line;
    }

    bool tracks_position() const override { return resource_->tracks_position; }
    std::uint64_t position() const override { return pos_; }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_.exchange(true)) return;
        }
        ++resource_->closes;
        cv_.notify_all();
    }

    bool is_closed() const { return closed_; }

private:
    std::shared_ptr<FakeResource> resource_;
    ResponseHead head_;
    std::string body_;
    std::atomic<size_t> pos_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> closed_ = false;
};

// Serves one GET against the resource, honoring Range the way a typical server does.
inline std::expected<std::unique_ptr<FakeTransport>, FileErrorInfo> serve(
    const std::shared_ptr<FakeResource>& resource,
    const std::string& url,
    const Headers& headers
) {
    ++resource->opens;
    resource->urls.push_back(url);
    resource->requests.push_back(headers);
    if (resource->fail_next_open) {
        auto err = *resource->fail_next_open;
        resource->fail_next_open.reset();
        return std::unexpected(err);
    }

    const auto& content = resource->content;
    std::uint64_t total = content.size();
    std::uint64_t reported = resource->reported_length.value_or(total);

    ResponseHead head;
    head.url = url;
    head.status_code = 200;
    head.status_message = "OK";
    std::string body = content;

    auto range = headers.find("Range");
    std::optional<std::uint64_t> first;
    if (resource->honor_ranges && range != headers.end()) first = range_start(range->second, total);

    if (first) {
        body = content.substr(*first);
        head.status_code = 206;
        head.status_message = "Partial Content";
        std::uint64_t last = total > 0 ? total - 1 : 0;
        head.headers["Content-Range"] = "bytes " + std::to_string(*first) + "-" + std::to_string(last) + "/" + std::to_string(reported);
        if (!resource->chunked) head.headers["Content-Length"] = std::to_string(body.size());
    } else {
        if (!resource->chunked) head.headers["Content-Length"] = std::to_string(reported);
        if (resource->honor_ranges && resource->advertise_ranges) head.headers["Accept-Ranges"] = "bytes";
    }
    if (resource->chunked) head.headers["Transfer-Encoding"] = "chunked";
    if (resource->disposition) head.headers["Content-Disposition"] = *resource->disposition;

    return std::make_unique<FakeTransport>(resource, std::move(head), std::move(body));
}

inline Opener fake_opener(std::shared_ptr<FakeResource> resource) {
    return [resource](const std::string& url, const Headers& headers)
        -> std::expected<std::unique_ptr<Transport>, FileErrorInfo> {
        auto transport = serve(resource, url, headers);
        if (!transport) return std::unexpected(transport.error());
        return std::unique_ptr<Transport>(std::move(*transport));
    };
}

// Suspends on a timer instead of blocking a thread when reads are held back.
class FakeAsyncTransport : public AsyncTransport {
public:
    FakeAsyncTransport(std::shared_ptr<FakeResource> resource, std::unique_ptr<FakeTransport> inner, asio::any_io_executor executor)
        : resource_(std::move(resource)), inner_(std::move(inner)), timer_(std::move(executor)) {}

    const ResponseHead& head() const override { return inner_->head(); }

    asio::awaitable<std::expected<size_t, FileErrorInfo>> read(std::span<char> buffer) override {
        if (resource_->block_reads && !inner_->is_closed()) {
            boost::system::error_code ec;
            timer_.expires_after(std::chrono::hours(1));
            co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }
        if (inner_->is_closed()) {
            co_return std::unexpected(FileErrorInfo{FileError::Transport, "fake transport closed"});
        }
        co_return inner_->read(buffer);
    }

    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit) override {
        co_return inner_->read_line(limit);
    }

    bool tracks_position() const override { return inner_->tracks_position(); }
    std::uint64_t position() const override { return inner_->position(); }

    asio::awaitable<void> close() override {
        inner_->close();
        timer_.cancel();
        co_return;
    }

private:
    std::shared_ptr<FakeResource> resource_;
    std::unique_ptr<FakeTransport> inner_;
    asio::steady_timer timer_;
};

inline AsyncOpener fake_async_opener(std::shared_ptr<FakeResource> resource) {
    return [resource](std::string url, Headers headers)
        -> asio::awaitable<std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>> {
        using Result = std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>;
        auto res = resource;
        auto executor = co_await asio::this_coro::executor;
        auto transport = serve(res, url, headers);
        if (!transport) co_return std::unexpected(transport.error());
        co_return Result(std::make_unique<FakeAsyncTransport>(res, std::move(*transport), executor));
    };
}

} // namespace httpfile::testing
