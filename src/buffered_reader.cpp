#include "buffered_reader.hpp"
#include <algorithm>

namespace httpfile {

BufferedReader::BufferedReader(std::unique_ptr<Reader> inner, size_t buffer_size)
    : inner_(std::move(inner)), buffer_size_(buffer_size > 0 ? buffer_size : kDefaultBufferSize) {}

std::expected<bool, FileErrorInfo> BufferedReader::fill() {
    buffer_.resize(buffer_size_);
    pos_ = 0;
    auto n = inner_->read_into(std::span{buffer_.data(), buffer_.size()});
    if (!n) {
        buffer_.clear();
        return std::unexpected(n.error());
    }
    buffer_.resize(*n);
    return *n > 0;
}

std::expected<std::string, FileErrorInfo> BufferedReader::read(size_t size) {
    if (closed()) return std::unexpected(closed_error());
    if (size == 0) return std::string{};

    std::string out;
    while (out.size() < size) {
        if (available() == 0) {
            size_t want = size - out.size();
            if (want >= buffer_size_) {
                // Large reads go straight to the inner reader.
                auto direct = inner_->read(want);
                if (!direct) return std::unexpected(direct.error());
                out += *direct;
                break;
            }
            auto more = fill();
            if (!more) return std::unexpected(more.error());
            if (!*more) break;
        }
        size_t n = std::min(size - out.size(), available());
        out.append(buffer_, pos_, n);
        pos_ += n;
    }
    return out;
}

std::expected<size_t, FileErrorInfo> BufferedReader::read_into(std::span<char> buffer) {
    if (closed()) return std::unexpected(closed_error());
    if (buffer.empty()) return 0;

    if (available() == 0) {
        if (buffer.size() >= buffer_size_) return inner_->read_into(buffer);
        auto more = fill();
        if (!more) return std::unexpected(more.error());
        if (!*more) return 0;
    }
    size_t n = std::min(buffer.size(), available());
    std::copy_n(buffer_.data() + pos_, n, buffer.data());
    pos_ += n;
    return n;
}

std::expected<std::string, FileErrorInfo> BufferedReader::read_line(size_t limit) {
    if (closed()) return std::unexpected(closed_error());

    std::string line;
    while (line.size() < limit) {
        if (available() == 0) {
            auto more = fill();
            if (!more) return std::unexpected(more.error());
            if (!*more) break;
        }
        std::string_view view(buffer_.data() + pos_, std::min(available(), limit - line.size()));
        auto nl = view.find('\n');
        size_t take = nl == std::string_view::npos ? view.size() : nl + 1;
        line.append(view.substr(0, take));
        pos_ += take;
        if (nl != std::string_view::npos) break;
    }
    return line;
}

std::expected<std::string, FileErrorInfo> BufferedReader::peek(size_t size) {
    if (closed()) return std::unexpected(closed_error());
    if (available() == 0) {
        auto more = fill();
        if (!more) return std::unexpected(more.error());
    }
    return buffer_.substr(pos_, std::min(size, available()));
}

std::expected<std::uint64_t, FileErrorInfo> BufferedReader::tell() const {
    auto inner = inner_->tell();
    if (!inner) return std::unexpected(inner.error());
    return *inner - available();
}

std::expected<std::uint64_t, FileErrorInfo> BufferedReader::seek(std::int64_t pos, Whence whence) {
    if (closed()) return std::unexpected(closed_error());
    if (!seekable()) return inner_->seek(pos, whence);

    auto current = tell();
    if (!current) return std::unexpected(current.error());

    std::int64_t target = pos;
    if (whence == Whence::Set || whence == Whence::Current) {
        if (whence == Whence::Current) target += static_cast<std::int64_t>(*current);
        if (target < 0) {
            return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "negative seek position: " + std::to_string(target)});
        }
        auto buffer_start = *current - pos_;
        auto absolute = static_cast<std::uint64_t>(target);
        if (absolute >= buffer_start && absolute <= buffer_start + buffer_.size()) {
            pos_ = static_cast<size_t>(absolute - buffer_start);
            return absolute;
        }
        whence = Whence::Set;
    }

    // The buffer stays valid until the inner reader has actually moved.
    auto inner_before = *current + available();
    auto moved = inner_->seek(target, whence);
    if (moved) {
        drop();
        return moved;
    }
    auto inner_after = inner_->tell();
    if (!inner_after || *inner_after != inner_before) drop();
    return moved;
}

void BufferedReader::close() {
    drop();
    inner_->close();
}

} // namespace httpfile
