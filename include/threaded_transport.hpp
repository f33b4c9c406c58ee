#pragma once

#include "async_transport.hpp"
#include <memory>

namespace httpfile {

// Blocking transport driven from coroutines: each call runs on a worker executor
// while the calling coroutine stays suspended.
class ThreadedTransport : public AsyncTransport {
public:
    ThreadedTransport(std::unique_ptr<Transport> inner, asio::any_io_executor executor);
    ~ThreadedTransport() override;

    const ResponseHead& head() const override { return inner_->head(); }
    asio::awaitable<std::expected<size_t, FileErrorInfo>> read(std::span<char> buffer) override;
    asio::awaitable<std::expected<std::string, FileErrorInfo>> read_line(size_t limit) override;
    bool tracks_position() const override { return inner_->tracks_position(); }
    std::uint64_t position() const override { return inner_->position(); }
    asio::awaitable<void> close() override;

private:
    std::shared_ptr<Transport> inner_;
    asio::any_io_executor executor_;
};

} // namespace httpfile
