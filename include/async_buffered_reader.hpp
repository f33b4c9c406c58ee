#pragma once

#include "async_http_file.hpp"
#include "buffered_reader.hpp"
#include <memory>
#include <string>
#include <vector>

namespace httpfile {

// BufferedReader for AsyncHttpFile.
class AsyncBufferedReader {
public:
    static constexpr size_t npos = Reader::npos;

    explicit AsyncBufferedReader(std::unique_ptr<AsyncHttpFile> inner, size_t buffer_size = kDefaultBufferSize);

    asio::awaitable<std::expected<std::string, FileErrorInfo>> read(size_t size);
    asio::awaitable<std::expected<size_t, FileErrorInfo>> read_into(std::span<char> buffer);
    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit = npos);
    asio::awaitable<std::expected<std::vector<std::string>, FileErrorInfo>> read_lines(size_t hint = 0);
    asio::awaitable<std::expected<std::string, FileErrorInfo>> peek(size_t size = 1);

    asio::awaitable<std::expected<std::uint64_t, FileErrorInfo>> seek(std::int64_t pos, Whence whence = Whence::Set);
    std::expected<std::uint64_t, FileErrorInfo> tell() const;

    asio::awaitable<void> close();
    bool closed() const { return inner_->closed(); }
    bool seekable() const { return inner_->seekable(); }

    std::string name() const { return inner_->name(); }
    std::string mode() const { return inner_->mode(); }

    AsyncHttpFile& raw() { return *inner_; }

private:
    size_t available() const { return buffer_.size() - pos_; }
    void drop() {
        buffer_.clear();
        pos_ = 0;
    }

    asio::awaitable<std::expected<bool, FileErrorInfo>> fill();

    std::unique_ptr<AsyncHttpFile> inner_;
    size_t buffer_size_;
    std::string buffer_;
    size_t pos_ = 0;
};

} // namespace httpfile
