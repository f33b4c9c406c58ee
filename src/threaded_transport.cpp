#include "threaded_transport.hpp"
#include "beast_transport.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace httpfile {

ThreadedTransport::ThreadedTransport(std::unique_ptr<Transport> inner, asio::any_io_executor executor)
    : inner_(std::move(inner)), executor_(std::move(executor)) {}

ThreadedTransport::~ThreadedTransport() {
    inner_->close();
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> ThreadedTransport::read(std::span<char> buffer) {
    // The worker keeps its own reference: a close() can drop ours mid-read.
    auto inner = inner_;
    co_return co_await asio::co_spawn(executor_,
        [inner, buffer]() -> asio::awaitable<std::expected<size_t, FileErrorInfo>> {
            co_return inner->read(buffer);
        },
        asio::use_awaitable);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> ThreadedTransport::read_line(size_t limit) {
    auto inner = inner_;
    co_return co_await asio::co_spawn(executor_,
        [inner, limit]() -> asio::awaitable<std::expected<std::string, FileErrorInfo>> {
            co_return inner->read_line(limit);
        },
        asio::use_awaitable);
}

asio::awaitable<void> ThreadedTransport::close() {
    // Transport::close() is safe against a read blocked on a worker thread.
    inner_->close();
    co_return;
}

AsyncOpener threaded_opener(Opener opener, asio::any_io_executor executor) {
    return [opener = std::move(opener), executor](std::string url, Headers headers)
        -> asio::awaitable<std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>> {
        using Result = std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>;
        auto blocking = opener;
        auto worker = executor;

        auto transport = co_await asio::co_spawn(worker,
            [blocking, url = std::move(url), headers = std::move(headers)]()
                -> asio::awaitable<std::expected<std::unique_ptr<Transport>, FileErrorInfo>> {
                co_return blocking(url, headers);
            },
            asio::use_awaitable);
        if (!transport) co_return std::unexpected(transport.error());
        co_return Result(std::make_unique<ThreadedTransport>(std::move(*transport), worker));
    };
}

static asio::thread_pool& blocking_pool() {
    static asio::thread_pool pool(4);
    return pool;
}

AsyncOpener default_async_opener() {
    auto plain = beast_opener();
    auto tls = threaded_opener(curl_opener(), blocking_pool().get_executor());
    return [plain, tls](std::string url, Headers headers)
        -> asio::awaitable<std::expected<std::unique_ptr<AsyncTransport>, FileErrorInfo>> {
        auto opener = url.starts_with("https://") ? tls : plain;
        co_return co_await opener(std::move(url), std::move(headers));
    };
}

} // namespace httpfile
