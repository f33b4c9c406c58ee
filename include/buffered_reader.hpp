#pragma once

#include "reader.hpp"
#include <memory>
#include <string>

namespace httpfile {

inline constexpr size_t kDefaultBufferSize = 8192;

// Block buffering over another reader. Seeks inside the current block do not touch the inner reader.
class BufferedReader : public Reader {
public:
    explicit BufferedReader(std::unique_ptr<Reader> inner, size_t buffer_size = kDefaultBufferSize);

    std::expected<std::string, FileErrorInfo> read(size_t size) override;
    std::expected<size_t, FileErrorInfo> read_into(std::span<char> buffer) override;
    std::expected<std::string, FileErrorInfo> read_line(size_t limit = npos) override;

    // Buffered bytes without consuming them; fills the buffer if it is empty.
    std::expected<std::string, FileErrorInfo> peek(size_t size = 1);

    std::expected<std::uint64_t, FileErrorInfo> seek(std::int64_t pos, Whence whence = Whence::Set) override;
    std::expected<std::uint64_t, FileErrorInfo> tell() const override;

    void close() override;
    bool closed() const override { return inner_->closed(); }
    bool seekable() const override { return inner_->seekable(); }

    std::string name() const override { return inner_->name(); }
    std::string mode() const override { return inner_->mode(); }

    Reader& raw() { return *inner_; }
    size_t buffer_size() const { return buffer_size_; }

private:
    size_t available() const { return buffer_.size() - pos_; }
    void drop() {
        buffer_.clear();
        pos_ = 0;
    }

    // Refills an empty buffer; false at end of stream.
    std::expected<bool, FileErrorInfo> fill();

    std::unique_ptr<Reader> inner_;
    size_t buffer_size_;
    std::string buffer_;
    size_t pos_ = 0;
};

} // namespace httpfile
