#include "async_buffered_reader.hpp"
#include <algorithm>

namespace httpfile {

AsyncBufferedReader::AsyncBufferedReader(std::unique_ptr<AsyncHttpFile> inner, size_t buffer_size)
    : inner_(std::move(inner)), buffer_size_(buffer_size > 0 ? buffer_size : kDefaultBufferSize) {}

asio::awaitable<std::expected<bool, FileErrorInfo>> AsyncBufferedReader::fill() {
    using Result = std::expected<bool, FileErrorInfo>;
    buffer_.resize(buffer_size_);
    pos_ = 0;
    auto n = co_await inner_->read_into(std::span{buffer_.data(), buffer_.size()});
    if (!n) {
        buffer_.clear();
        co_return std::unexpected(n.error());
    }
    buffer_.resize(*n);
    co_return Result(*n > 0);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncBufferedReader::read(size_t size) {
    using Result = std::expected<std::string, FileErrorInfo>;
    if (closed()) co_return std::unexpected(closed_error());

    std::string out;
    while (out.size() < size) {
        if (available() == 0) {
            size_t want = size - out.size();
            if (want >= buffer_size_) {
                auto direct = co_await inner_->read(want);
                if (!direct) co_return std::unexpected(direct.error());
                out += *direct;
                break;
            }
            auto more = co_await fill();
            if (!more) co_return std::unexpected(more.error());
            if (!*more) break;
        }
        size_t n = std::min(size - out.size(), available());
        out.append(buffer_, pos_, n);
        pos_ += n;
    }
    co_return Result(std::move(out));
}

asio::awaitable<std::expected<size_t, FileErrorInfo>> AsyncBufferedReader::read_into(std::span<char> buffer) {
    using Result = std::expected<size_t, FileErrorInfo>;
    if (closed()) co_return std::unexpected(closed_error());
    if (buffer.empty()) co_return Result(0);

    if (available() == 0) {
        if (buffer.size() >= buffer_size_) co_return co_await inner_->read_into(buffer);
        auto more = co_await fill();
        if (!more) co_return std::unexpected(more.error());
        if (!*more) co_return Result(0);
    }
    size_t n = std::min(buffer.size(), available());
    std::copy_n(buffer_.data() + pos_, n, buffer.data());
    pos_ += n;
    co_return Result(n);
}

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncBufferedReader::read_line(size_t limit) {
    using Result = std::expected<std::string, FileErrorInfo>;
    if (closed()) co_return std::unexpected(closed_error());

    std::string line;
    while (line.size() < limit) {
        if (available() == 0) {
            auto more = co_await fill();
            if (!more) co_return std::unexpected(more.error());
            if (!*more) break;
        }
        std::string_view view(buffer_.data() + pos_, std::min(available(), limit - line.size()));
        auto nl = view.find('\n');
        size_t take = nl == std::string_view::npos ? view.size() : nl + 1;
        line.append(view.substr(0, take));
        pos_ += take;
        if (nl != std::string_view::npos) break;
    }
    co_return Result(std::move(line));
}

asio::awaitable<std::expected<std::vector<std::string>, FileErrorInfo>> AsyncBufferedReader::read_lines(size_t hint) {
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

asio::awaitable<std::expected<std::string, FileErrorInfo>> AsyncBufferedReader::peek(size_t size) {
    using Result = std::expected<std::string, FileErrorInfo>;
    if (closed()) co_return std::unexpected(closed_error());
    if (available() == 0) {
        auto more = co_await fill();
        if (!more) co_return std::unexpected(more.error());
    }
    co_return Result(buffer_.substr(pos_, std::min(size, available())));
}

std::expected<std::uint64_t, FileErrorInfo> AsyncBufferedReader::tell() const {
    auto inner = inner_->tell();
    if (!inner) return std::unexpected(inner.error());
    return *inner - available();
}

asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> AsyncBufferedReader::seek(std::int64_t pos, Whence whence) {
    using Result = std::expected<std::uint64_t, FileErrorInfo>;
    if (closed()) co_return std::unexpected(closed_error());
    if (!seekable()) co_return co_await inner_->seek(pos, whence);

    auto current = tell();
    if (!current) co_return std::unexpected(current.error());

    std::int64_t target = pos;
    if (whence == Whence::Set || whence == Whence::Current) {
        if (whence == Whence::Current) target += static_cast<std::int64_t>(*current);
        if (target < 0) {
            co_return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "negative seek position: " + std::to_string(target)});
        }
        auto buffer_start = *current - pos_;
        auto absolute = static_cast<std::uint64_t>(target);
        if (absolute >= buffer_start && absolute <= buffer_start + buffer_.size()) {
            pos_ = static_cast<size_t>(absolute - buffer_start);
            co_return Result(absolute);
        }
        whence = Whence::Set;
    }

    // The buffer stays valid until the inner reader has actually moved.
    auto inner_before = *current + available();
    auto moved = co_await inner_->seek(target, whence);
    if (moved) {
        drop();
        co_return moved;
    }
    auto inner_after = inner_->tell();
    if (!inner_after || *inner_after != inner_before) drop();
    co_return moved;
}

asio::awaitable<void> AsyncBufferedReader::close() {
    drop();
    co_await inner_->close();
}

} // namespace httpfile
