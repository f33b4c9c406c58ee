#include "async_buffered_reader.hpp"
#include "async_http_file.hpp"
#include "curl_transport.hpp"
#include "http_file.hpp"
#include "log.hpp"
#include "open.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace httpfile;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd, transport = "curl";
    Headers headers;
    std::int64_t start = 0;
    std::optional<std::uint64_t> count;
    std::optional<size_t> max_lines;
    std::uint64_t seek_threshold = kDefaultSeekThreshold;
    long timeout = 300;
    bool verbose = false;
    std::vector<std::string> args;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    std::string result_message;
};

static constexpr size_t kCopyChunk = 64 * 1024;

void print_usage(const char* program_name) {
    std::cerr << "httpcat - random-access reads over HTTP\n\n"
              << "Usage: " << program_name << " <command> <url> [options]\n\n"
              << "Commands:\n"
              << "  info <url>                   Show length, name and range support\n"
              << "  cat <url>                    Write the body (or a slice of it) to stdout\n"
              << "  lines <url>                  Print decoded text lines\n"
              << "  sha256 <url>                 SHA-256 of the body\n\n"
              << "Options:\n"
              << "  --header 'Name: value'       Extra request header (repeatable)\n"
              << "  --transport <curl|socket|async>\n"
              << "  --start <n>                  First byte; negative counts from the end\n"
              << "  --count <n>                  Bytes to write (cat)\n"
              << "  --max <n>                    Lines to print (lines)\n"
              << "  --seek-threshold <n>         Forward seeks up to n bytes read through\n"
              << "  --timeout <seconds>\n"
              << "  --verbose                    Debug logging\n";
}

template<typename T>
static std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

static void report(const FileErrorInfo& err) {
    std::cerr << "Error (" << to_string(err.error) << "): " << err.message;
    if (err.status_code) std::cerr << " [HTTP " << err.status_code << "]";
    std::cerr << "\n";
}

static TransportConfig transport_config(const FSMContext& ctx) {
    TransportConfig config;
    config.timeout = ctx.timeout;
    return config;
}

static ReaderOptions reader_options(const FSMContext& ctx) {
    ReaderOptions options;
    options.headers = ctx.headers;
    options.start = ctx.start;
    options.seek_threshold = ctx.seek_threshold;
    return options;
}

static Opener sync_opener(const FSMContext& ctx) {
    if (ctx.transport == "socket") return socket_opener(transport_config(ctx));
    return curl_opener(transport_config(ctx));
}

static std::string hex(const unsigned char* data, size_t len) {
    std::string out;
    char buf[3];
    for (size_t i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        out += buf;
    }
    return out;
}

// One SHA-256 over everything passed to update().
class Digest {
public:
    Digest() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_) EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);
    }
    ~Digest() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    bool ok() const { return ctx_ != nullptr; }
    void update(std::string_view data) { EVP_DigestUpdate(ctx_, data.data(), data.size()); }
    std::string hexdigest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        EVP_DigestFinal_ex(ctx_, hash, &len);
        return hex(hash, len);
    }

private:
    EVP_MD_CTX* ctx_;
};

static void print_info(const std::string& repr, const std::string& name, std::uint64_t length,
                       bool chunked, bool seekable, std::uint64_t position) {
    std::cout << repr << "\n"
              << "name:     " << name << "\n"
              << "length:   " << length << "\n"
              << "chunked:  " << (chunked ? "yes" : "no") << "\n"
              << "seekable: " << (seekable ? "yes" : "no") << "\n"
              << "position: " << position << "\n";
}

int cmd_info(const FSMContext& ctx, const std::string& url) {
    auto file = HttpFile::open(Url{url, ctx.headers}, reader_options(ctx), sync_opener(ctx));
    if (!file) { report(file.error()); return 1; }
    auto& f = **file;
    print_info(f.repr(), f.name(), f.length(), f.chunked(), f.seekable(), f.tell().value_or(0));
    return 0;
}

int cmd_cat(const FSMContext& ctx, const std::string& url) {
    auto file = HttpFile::open(Url{url, ctx.headers}, reader_options(ctx), sync_opener(ctx));
    if (!file) { report(file.error()); return 1; }

    std::uint64_t left = ctx.count.value_or(UINT64_MAX);
    while (left > 0) {
        auto chunk = (*file)->read(static_cast<size_t>(std::min<std::uint64_t>(left, kCopyChunk)));
        if (!chunk) { report(chunk.error()); return 1; }
        if (chunk->empty()) break;
        std::cout.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
        left -= chunk->size();
    }
    std::cout.flush();
    return 0;
}

int cmd_lines(const FSMContext& ctx, const std::string& url) {
    OpenOptions options;
    options.reader = reader_options(ctx);
    options.opener = sync_opener(ctx);
    options.wrap.text.errors = "replace";
    auto text = httpfile::open(Url{url, ctx.headers}, "r", std::move(options));
    if (!text) { report(text.error()); return 1; }

    size_t printed = 0;
    while (!ctx.max_lines || printed < *ctx.max_lines) {
        auto line = (*text)->read_line();
        if (!line) { report(line.error()); return 1; }
        if (line->empty()) break;
        std::cout << *line;
        ++printed;
    }
    std::cout.flush();
    return 0;
}

int cmd_sha256(const FSMContext& ctx, const std::string& url) {
    auto file = HttpFile::open(Url{url, ctx.headers}, reader_options(ctx), sync_opener(ctx));
    if (!file) { report(file.error()); return 1; }

    Digest digest;
    if (!digest.ok()) { std::cerr << "Error: failed to create digest context\n"; return 1; }
    while (true) {
        auto chunk = (*file)->read(kCopyChunk);
        if (!chunk) { report(chunk.error()); return 1; }
        if (chunk->empty()) break;
        digest.update(*chunk);
    }
    std::cout << digest.hexdigest() << "  " << url << "\n";
    return 0;
}

using AsyncCommand = std::function<asio::awaitable<int>(AsyncBufferedReader&)>;

// Opens `url` with the coroutine reader and runs `body` on a private io_context.
int run_async(const FSMContext& ctx, const std::string& url, AsyncCommand body) {
    asio::io_context io;
    asio::thread_pool pool(2);
    auto plain = beast_opener(transport_config(ctx));
    auto tls = threaded_opener(curl_opener(transport_config(ctx)), pool.get_executor());
    AsyncOpener opener = url.starts_with("https://") ? tls : plain;

    int rc = 1;
    asio::co_spawn(io,
        [&]() -> asio::awaitable<int> {
            auto file = co_await AsyncHttpFile::open(Url{url, ctx.headers}, reader_options(ctx), opener);
            if (!file) {
                report(file.error());
                co_return 1;
            }
            AsyncBufferedReader reader(std::move(*file), kCopyChunk);
            int code = co_await body(reader);
            co_await reader.close();
            co_return code;
        },
        [&](std::exception_ptr e, int code) {
            rc = code;
            if (!e) return;
            rc = 1;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                std::cerr << "Error: " << ex.what() << "\n";
            }
        });
    io.run();
    pool.join();
    return rc;
}

int cmd_async(const FSMContext& ctx, const std::string& url) {
    if (ctx.cmd == "info") {
        return run_async(ctx, url, [](AsyncBufferedReader& reader) -> asio::awaitable<int> {
            auto& f = reader.raw();
            print_info(f.repr(), f.name(), f.length(), f.chunked(), f.seekable(), f.tell().value_or(0));
            co_return 0;
        });
    }
    if (ctx.cmd == "cat") {
        std::uint64_t count = ctx.count.value_or(UINT64_MAX);
        return run_async(ctx, url, [count](AsyncBufferedReader& reader) -> asio::awaitable<int> {
            std::uint64_t left = count;
            while (left > 0) {
                auto chunk = co_await reader.read(static_cast<size_t>(std::min<std::uint64_t>(left, kCopyChunk)));
                if (!chunk) { report(chunk.error()); co_return 1; }
                if (chunk->empty()) break;
                std::cout.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
                left -= chunk->size();
            }
            std::cout.flush();
            co_return 0;
        });
    }
    if (ctx.cmd == "lines") {
        auto max_lines = ctx.max_lines;
        return run_async(ctx, url, [max_lines](AsyncBufferedReader& reader) -> asio::awaitable<int> {
            size_t printed = 0;
            while (!max_lines || printed < *max_lines) {
                auto line = co_await reader.read_line();
                if (!line) { report(line.error()); co_return 1; }
                if (line->empty()) break;
                std::cout << *line;
                ++printed;
            }
            std::cout.flush();
            co_return 0;
        });
    }
    return run_async(ctx, url, [url](AsyncBufferedReader& reader) -> asio::awaitable<int> {
        Digest digest;
        if (!digest.ok()) co_return 1;
        while (true) {
            auto chunk = co_await reader.read(kCopyChunk);
            if (!chunk) { report(chunk.error()); co_return 1; }
            if (chunk->empty()) break;
            digest.update(*chunk);
        }
        std::cout << digest.hexdigest() << "  " << url << "\n";
        co_return 0;
    });
}

static bool parse_header(const std::string& text, Headers& headers) {
    auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    auto value = text.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    headers[text.substr(0, colon)] = value;
    return true;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                state = FSMState::PreCommand;
                for (int i = 2; i < ctx.argc && state == FSMState::PreCommand; ++i) {
                    std::string a = ctx.argv[i];
                    bool has_value = i + 1 < ctx.argc;
                    bool ok = true;
                    if (a == "--verbose") {
                        ctx.verbose = true;
                    } else if (a == "--header" && has_value) {
                        ok = parse_header(ctx.argv[++i], ctx.headers);
                    } else if (a == "--transport" && has_value) {
                        ctx.transport = ctx.argv[++i];
                    } else if (a == "--start" && has_value) {
                        auto v = parse_number<std::int64_t>(ctx.argv[++i]);
                        ok = v.has_value();
                        if (v) ctx.start = *v;
                    } else if (a == "--count" && has_value) {
                        ctx.count = parse_number<std::uint64_t>(ctx.argv[++i]);
                        ok = ctx.count.has_value();
                    } else if (a == "--max" && has_value) {
                        ctx.max_lines = parse_number<size_t>(ctx.argv[++i]);
                        ok = ctx.max_lines.has_value();
                    } else if (a == "--seek-threshold" && has_value) {
                        auto v = parse_number<std::uint64_t>(ctx.argv[++i]);
                        ok = v.has_value();
                        if (v) ctx.seek_threshold = *v;
                    } else if (a == "--timeout" && has_value) {
                        auto v = parse_number<long>(ctx.argv[++i]);
                        ok = v.has_value();
                        if (v) ctx.timeout = *v;
                    } else {
                        ctx.args.push_back(a);
                    }
                    if (!ok) {
                        ctx.exit_code = 1;
                        ctx.error_message = "Invalid value for " + a;
                        state = FSMState::Error;
                    }
                }
                break;
            }
            case FSMState::PreCommand:
                if (ctx.verbose) log::Writer::set_level(log::Level::Debug);
                log::debug("command " + ctx.cmd + " via " + ctx.transport);

                if (ctx.cmd != "info" && ctx.cmd != "cat" && ctx.cmd != "lines" && ctx.cmd != "sha256") {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }
                if (ctx.args.empty()) {
                    ctx.exit_code = 1;
                    ctx.error_message = ctx.cmd + " requires <url> argument.";
                    state = FSMState::Error;
                    break;
                }
                if (ctx.transport != "curl" && ctx.transport != "socket" && ctx.transport != "async") {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown transport: " + ctx.transport;
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::RunCommand;
                break;
            case FSMState::RunCommand:
                if (ctx.transport == "async") {
                    ctx.exit_code = cmd_async(ctx, ctx.args[0]);
                } else if (ctx.cmd == "info") {
                    ctx.exit_code = cmd_info(ctx, ctx.args[0]);
                } else if (ctx.cmd == "cat") {
                    ctx.exit_code = cmd_cat(ctx, ctx.args[0]);
                } else if (ctx.cmd == "lines") {
                    ctx.exit_code = cmd_lines(ctx, ctx.args[0]);
                } else {
                    ctx.exit_code = cmd_sha256(ctx, ctx.args[0]);
                }
                ctx.result_message = ctx.cmd + " finished with code " + std::to_string(ctx.exit_code) + ".";
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    log::debug(ctx.result_message + " Elapsed: " + std::to_string(ms) + " ms");
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
