#include "async_http_file.hpp"
#include "curl_transport.hpp"
#include "http_file.hpp"
#include "socket_transport.hpp"
#include "test_server.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace httpfile;
using namespace httpfile::testing;

static std::unique_ptr<HttpFile> open_sync(const Opener& opener, const std::string& url, ReaderOptions options = {}) {
    auto file = HttpFile::open(Url(url), std::move(options), opener);
    if (!file) std::cerr << "open " << url << ": " << file.error().message << "\n";
    assert(file);
    return std::move(*file);
}

void check_sync_opener(const std::string& label, const Opener& opener, const Opener& no_follow, TestServer& server) {
    const auto& bin = server.binary();
    const auto& text = server.text();

    auto file = open_sync(opener, server.url("/data.bin"), ReaderOptions{.seek_threshold = 1000});
    assert(file->length() == bin.size() && file->seekable() && !file->chunked());
    assert(file->name() == "data.bin");
    assert(file->read(100).value() == bin.substr(0, 100));
    assert(file->seek(900).value() == 900);
    assert(file->read(10).value() == bin.substr(900, 10));

    auto before = server.request_count();
    assert(file->seek(50000).value() == 50000);
    assert(server.request_count() == before + 1);
    auto last = server.requests().back();
    assert(last.headers.at("range") == "bytes=50000-");
    assert(last.headers.at("accept-encoding") == "identity");
    assert(file->read(4096).value() == bin.substr(50000, 4096));
    assert(file->tell().value() == 54096);

    assert(file->seek(0, Whence::End).value() == bin.size());
    assert(file->read(1).value().empty());
    file->close();

    auto tail = open_sync(opener, server.url("/data.bin"), ReaderOptions{.start = -500});
    assert(tail->tell().value() == bin.size() - 500);
    assert(tail->read_all().value() == bin.substr(bin.size() - 500));

    auto plain = open_sync(opener, server.url("/plain.bin"), ReaderOptions{.start = 300});
    assert(!plain->seekable() && plain->tell().value() == 0);
    assert(plain->read(64).value() == bin.substr(0, 64));
    assert(plain->seek(1000).error().error == FileError::Unsupported);

    auto chunked = open_sync(opener, server.url("/chunked.txt"));
    assert(chunked->chunked() && chunked->length() == 0);
    assert(chunked->read_line().value() == "line 0\n");
    assert(chunked->read_all().value() == text.substr(7));

    auto missing = HttpFile::open(Url(server.url("/missing")), {}, opener);
    assert(!missing && missing.error().error == FileError::Transport);
    assert(missing.error().status_code == 404);

    auto redirected = open_sync(opener, server.url("/redirect"));
    assert(redirected->read(256).value() == bin.substr(0, 256));

    // A 3xx that is not followed is a failed open, not a body.
    auto looping = HttpFile::open(Url(server.url("/loop")), {}, opener);
    assert(!looping && looping.error().error == FileError::Transport);
    auto unfollowed = HttpFile::open(Url(server.url("/redirect")), {}, no_follow);
    assert(!unfollowed && unfollowed.error().status_code == 302);

    // close() from another thread releases a read blocked on the socket.
    auto slow = open_sync(opener, server.url("/slow"));
    std::expected<std::string, FileErrorInfo> result;
    std::thread reader([&] { result = slow->read(1000); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    slow->close();
    reader.join();
    assert(!result && result.error().error == FileError::Closed);

    std::cout << "✓ " << label << " transport\n";
}

static asio::awaitable<std::unique_ptr<AsyncHttpFile>> open_async(AsyncOpener opener, std::string url, ReaderOptions options = {}) {
    auto file = co_await AsyncHttpFile::open(Url(url), std::move(options), std::move(opener));
    if (!file) std::cerr << "open " << url << ": " << file.error().message << "\n";
    assert(file);
    co_return std::move(*file);
}

static asio::awaitable<void> slow_read(AsyncHttpFile* file, std::expected<std::string, FileErrorInfo>* result, bool* done) {
    *result = co_await file->read(1000);
    *done = true;
}

static asio::awaitable<void> check_async_opener(AsyncOpener opener, AsyncOpener no_follow, TestServer* server) {
    const auto& bin = server->binary();
    const auto& text = server->text();

    auto file = co_await open_async(opener, server->url("/data.bin"), ReaderOptions{.seek_threshold = 1000});
    assert(file->length() == bin.size() && file->seekable());
    assert((co_await file->read(100)).value() == bin.substr(0, 100));
    assert((co_await file->seek(60000)).value() == 60000);
    assert(server->requests().back().headers.at("range") == "bytes=60000-");
    assert((co_await file->read(5000)).value() == bin.substr(60000, 5000));
    assert((co_await file->seek(-10, Whence::End)).value() == bin.size() - 10);
    assert((co_await file->read_all()).value() == bin.substr(bin.size() - 10));
    co_await file->close();

    auto chunked = co_await open_async(opener, server->url("/chunked.txt"));
    assert(chunked->chunked());
    assert((co_await chunked->read_line()).value() == "line 0\n");
    assert((co_await chunked->read_line()).value() == "line 1\n");
    assert((co_await chunked->read_all()).value() == text.substr(14));

    auto missing = co_await AsyncHttpFile::open(Url(server->url("/missing")), {}, opener);
    assert(!missing && missing.error().status_code == 404);

    auto redirected = co_await open_async(opener, server->url("/redirect"));
    assert((co_await redirected->read(300)).value() == bin.substr(0, 300));

    auto looping = co_await AsyncHttpFile::open(Url(server->url("/loop")), {}, opener);
    assert(!looping && looping.error().error == FileError::Transport);
    auto unfollowed = co_await AsyncHttpFile::open(Url(server->url("/redirect")), {}, no_follow);
    assert(!unfollowed && unfollowed.error().status_code == 302);

    auto slow = co_await open_async(opener, server->url("/slow"));
    std::expected<std::string, FileErrorInfo> result;
    bool done = false;
    auto executor = co_await asio::this_coro::executor;
    asio::co_spawn(executor, slow_read(slow.get(), &result, &done), asio::detached);

    asio::steady_timer timer(executor);
    timer.expires_after(std::chrono::milliseconds(100));
    co_await timer.async_wait(asio::use_awaitable);
    co_await slow->close();
    while (!done) {
        timer.expires_after(std::chrono::milliseconds(1));
        co_await timer.async_wait(asio::use_awaitable);
    }
    assert(!result && result.error().error == FileError::Closed);
}

void run_async(const std::string& label, AsyncOpener opener, AsyncOpener no_follow, TestServer& server) {
    asio::io_context io;
    auto done = asio::co_spawn(io, check_async_opener(std::move(opener), std::move(no_follow), &server), asio::use_future);
    io.run();
    done.get();
    std::cout << "✓ " << label << " transport\n";
}

int main() {
    TestServer server(binary_fixture(100000), text_fixture(3000));

    TransportConfig config;
    config.timeout = 10;

    TransportConfig stay = config;
    stay.follow_redirects = false;

    check_sync_opener("curl", curl_opener(config), curl_opener(stay), server);
    check_sync_opener("socket", socket_opener(config), socket_opener(stay), server);

    run_async("beast", beast_opener(config), beast_opener(stay), server);

    asio::thread_pool pool(2);
    run_async("threaded curl", threaded_opener(curl_opener(config), pool.get_executor()),
              threaded_opener(curl_opener(stay), pool.get_executor()), server);
    pool.join();

    auto tls_only = beast_opener(config);
    asio::io_context io;
    auto rejected = asio::co_spawn(io, tls_only("https://127.0.0.1/", Headers{}), asio::use_future);
    io.run();
    auto https = rejected.get();
    assert(!https && https.error().error == FileError::Transport);
    std::cout << "✓ beast refuses https\n";

    std::cout << "All transport tests passed\n";
    return 0;
}
