#include "http_file.hpp"
#include "log.hpp"
#include <algorithm>
#include <vector>

namespace httpfile {

HttpFile::HttpFile(Locator locator, Opener opener, Headers headers, std::uint64_t seek_threshold)
    : locator_(std::move(locator)),
      opener_(std::move(opener)),
      core_(std::move(headers), seek_threshold) {}

HttpFile::~HttpFile() {
    close();
}

std::expected<std::unique_ptr<HttpFile>, FileErrorInfo> HttpFile::open(
    Locator locator,
    ReaderOptions options,
    Opener opener
) {
    if (!opener) return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "no transport opener"});

    std::unique_ptr<HttpFile> file(new HttpFile(
        std::move(locator), std::move(opener), base_headers(options.headers), options.seek_threshold));

    auto url = file->resolve();
    if (!url) return std::unexpected(url.error());

    std::optional<std::int64_t> start;
    if (options.start != 0) start = options.start;
    auto headers = request_headers(file->core_.headers(), url->headers, start);

    log::debug("open " + url->value);
    auto transport = file->opener_(url->value, headers);
    if (!transport) return std::unexpected(transport.error());

    std::shared_ptr<Transport> handle(std::move(*transport));
    auto info = describe(handle->head(), options.start);
    file->core_.establish(std::move(handle), std::move(info));
    return file;
}

std::expected<Url, FileErrorInfo> HttpFile::resolve() {
    if (auto* fixed = std::get_if<Url>(&locator_)) return *fixed;
    return std::get<UrlProducer>(locator_)();
}

std::expected<std::shared_ptr<Transport>, FileErrorInfo> HttpFile::attached() {
    if (auto handle = core_.handle()) return handle;
    if (auto r = reconnect(); !r) return std::unexpected(r.error());
    return core_.handle();
}

std::expected<size_t, FileErrorInfo> HttpFile::pull(Transport& handle, std::span<char> buffer) {
    auto n = handle.read(buffer);
    if (auto ok = core_.settle(); !ok) return std::unexpected(ok.error());
    if (!n) return std::unexpected(n.error());
    core_.advance(*n);
    return *n;
}

std::expected<std::string, FileErrorInfo> HttpFile::read(size_t size) {
    if (auto ok = core_.check_open(); !ok) return std::unexpected(ok.error());
    if (size == 0 || core_.at_eof()) return std::string{};

    auto handle = attached();
    if (!handle) return std::unexpected(handle.error());
    if (!*handle) return std::string{};

    std::string out;
    std::vector<char> chunk(std::min(size, kDiscardChunkSize));
    while (out.size() < size) {
        size_t want = std::min(chunk.size(), size - out.size());
        auto n = pull(**handle, std::span{chunk.data(), want});
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        out.append(chunk.data(), *n);
    }
    return out;
}

std::expected<size_t, FileErrorInfo> HttpFile::read_into(std::span<char> buffer) {
    if (auto ok = core_.check_open(); !ok) return std::unexpected(ok.error());
    if (buffer.empty() || core_.at_eof()) return 0;

    auto handle = attached();
    if (!handle) return std::unexpected(handle.error());
    if (!*handle) return 0;
    return pull(**handle, buffer);
}

std::expected<std::string, FileErrorInfo> HttpFile::read_line(size_t limit) {
    if (auto ok = core_.check_open(); !ok) return std::unexpected(ok.error());
    if (limit == 0 || core_.at_eof()) return std::string{};

    auto handle = attached();
    if (!handle) return std::unexpected(handle.error());
    if (!*handle) return std::string{};

    auto line = (*handle)->read_line(limit);
    if (auto ok = core_.settle(); !ok) return std::unexpected(ok.error());
    if (!line) return std::unexpected(line.error());
    core_.advance(line->size());
    return line;
}

std::expected<void, FileErrorInfo> HttpFile::discard(std::uint64_t count) {
    auto handle = attached();
    if (!handle) return std::unexpected(handle.error());
    if (!*handle) return {};

    std::vector<char> sink(static_cast<size_t>(std::min<std::uint64_t>(count, kDiscardChunkSize)));
    while (count > 0) {
        size_t want = static_cast<size_t>(std::min<std::uint64_t>(count, sink.size()));
        auto n = pull(**handle, std::span{sink.data(), want});
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        count -= *n;
    }
    return {};
}

std::expected<std::uint64_t, FileErrorInfo> HttpFile::seek(std::int64_t pos, Whence whence) {
    auto plan = core_.plan_seek(pos, whence);
    if (!plan) return std::unexpected(plan.error());

    switch (plan->action) {
        case SeekAction::None:
            return plan->target;
        case SeekAction::Discard:
            // A body that ends early leaves the position short of the target.
            if (auto r = discard(plan->distance); !r) return std::unexpected(r.error());
            return core_.tell();
        case SeekAction::Reconnect:
            return reconnect(static_cast<std::int64_t>(plan->target));
    }
    return plan->target;
}

std::expected<std::uint64_t, FileErrorInfo> HttpFile::tell() const {
    if (auto ok = core_.check_open(); !ok) return std::unexpected(ok.error());
    return core_.tell();
}

std::expected<std::uint64_t, FileErrorInfo> HttpFile::reconnect(std::optional<std::int64_t> start) {
    auto plan = core_.plan_reconnect(start);
    if (!plan) return std::unexpected(plan.error());

    if (auto old = core_.detach(plan->start)) old->close();
    if (plan->detach) {
        log::debug("detached at " + std::to_string(plan->start) + " of " + std::to_string(length()));
        return plan->start;
    }

    auto url = resolve();
    if (!url) return std::unexpected(url.error());
    auto headers = core_.headers_for(plan->start, url->headers);

    log::debug("reconnect " + url->value + " at " + std::to_string(plan->start));
    auto transport = opener_(url->value, headers);
    if (auto ok = core_.settle(); !ok) {
        if (transport) (*transport)->close();
        return std::unexpected(ok.error());
    }
    if (!transport) return std::unexpected(transport.error());

    std::shared_ptr<Transport> handle(std::move(*transport));
    if (auto ok = core_.verify_length(handle->head()); !ok) {
        handle->close();
        return std::unexpected(ok.error());
    }
    if (auto ok = core_.verify_range(handle->head(), plan->start); !ok) {
        handle->close();
        return std::unexpected(ok.error());
    }
    if (!core_.attach(handle, plan->start)) {
        handle->close();
        return std::unexpected(closed_error());
    }
    return plan->start;
}

void HttpFile::close() {
    auto [first, handle] = core_.close();
    if (handle) handle->close();
    if (first) log::debug("closed at " + std::to_string(core_.tell()));
}

std::string HttpFile::repr() const {
    std::string out = "httpfile::HttpFile(url=";
    out += std::holds_alternative<UrlProducer>(locator_) ? "<producer>" : "'" + std::get<Url>(locator_).value + "'";
    out += ", start=" + std::to_string(core_.tell());
    out += ", length=" + std::to_string(length());
    out += ", seek_threshold=" + std::to_string(seek_threshold());
    out += closed() ? ", closed)" : ")";
    return out;
}

} // namespace httpfile
