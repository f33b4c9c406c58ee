#pragma once

#include "file_error.hpp"
#include "http_protocol.hpp"
#include "reader.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace httpfile {

inline constexpr std::uint64_t kDefaultSeekThreshold = 1 << 20;
inline constexpr size_t kDiscardChunkSize = 64 * 1024;

struct ReaderOptions {
    Headers headers;
    std::int64_t start = 0;                              // negative: relative to the end
    std::uint64_t seek_threshold = kDefaultSeekThreshold; // forward seeks up to this are read and dropped
};

// What the first response told us; fixed for the lifetime of a reader.
struct StreamInfo {
    std::uint64_t length = 0;
    bool chunked = false;
    bool seekable = false;
    std::uint64_t start = 0;
    std::string name;
};

enum class SeekAction { None, Discard, Reconnect };

struct SeekPlan {
    SeekAction action = SeekAction::None;
    std::uint64_t target = 0;
    std::uint64_t distance = 0;   // bytes to discard
};

struct ReconnectPlan {
    std::uint64_t start = 0;
    bool detach = false;          // start at or past the end: no connection needed
};

// Discard-read for a forward hop of at most `threshold` bytes, reconnect otherwise.
// The boundary is inclusive: a hop of exactly `threshold` bytes is discarded.
SeekAction choose_seek(std::uint64_t current, std::uint64_t target, std::uint64_t threshold);

// Caller headers with compression negotiation disabled.
Headers base_headers(const Headers& caller);

// Headers for one request: base, then per-URL overrides, then the Range directive (none when start is empty).
Headers request_headers(const Headers& base, const Headers& overrides, std::optional<std::int64_t> start);

// Derives the stream description from the first response for a requested start.
StreamInfo describe(const ResponseHead& head, std::int64_t requested_start);

// State machine shared by the blocking and the coroutine readers.
// Holds no I/O: the facades open and close handles and feed the results back.
template<typename Handle>
class ReaderCore {
public:
    ReaderCore(Headers headers, std::uint64_t seek_threshold)
        : headers_(std::move(headers)), seek_threshold_(seek_threshold) {}

    ReaderCore(const ReaderCore&) = delete;
    ReaderCore& operator=(const ReaderCore&) = delete;

    // Binds the handle from the initial open.
    void establish(std::shared_ptr<Handle> handle, StreamInfo info) {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = std::move(info);
        start_ = info_.start;
        tracks_position_ = handle && handle->tracks_position();
        handle_ = std::move(handle);
    }

    const StreamInfo& info() const { return info_; }
    const Headers& headers() const { return headers_; }
    std::uint64_t seek_threshold() const { return seek_threshold_; }
    std::size_t reconnects() const { return reconnects_.load(); }

    bool closed() const { return closed_.load(); }

    std::uint64_t tell() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tell_locked();
    }

    std::expected<void, FileErrorInfo> check_open() const {
        if (closed_) return std::unexpected(closed_error());
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_) return std::unexpected(*broken_);
        return {};
    }

    // Length-based end of stream; never applies to chunked transfers.
    bool at_eof() const {
        return !info_.chunked && tell() >= info_.length;
    }

    // The bound handle, or null when detached or closed.
    std::shared_ptr<Handle> handle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handle_;
    }

    // Called after every I/O step: a close() that raced the operation wins.
    std::expected<void, FileErrorInfo> settle() const {
        if (closed_) return std::unexpected(closed_error());
        return {};
    }

    void advance(std::uint64_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!tracks_position_) start_ += n;
    }

    std::expected<SeekPlan, FileErrorInfo> plan_seek(std::int64_t pos, Whence whence) const {
        if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
        if (!info_.seekable) {
            return std::unexpected(FileErrorInfo{FileError::Unsupported, "not a seekable stream"});
        }

        auto current = tell();
        std::int64_t target = 0;
        switch (whence) {
            case Whence::Set:
                target = pos;
                break;
            case Whence::Current:
                if (pos == 0) return SeekPlan{SeekAction::None, current, 0};
                target = static_cast<std::int64_t>(current) + pos;
                break;
            case Whence::End:
                target = static_cast<std::int64_t>(info_.length) + pos;
                break;
            default:
                return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "whence value unsupported"});
        }
        if (target < 0) {
            return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "negative seek position: " + std::to_string(target)});
        }

        auto absolute = static_cast<std::uint64_t>(target);
        auto action = choose_seek(current, absolute, seek_threshold_);
        // Discarding cannot move past the last byte; a reconnect there just detaches.
        if (action == SeekAction::Discard && !info_.chunked && absolute > info_.length) action = SeekAction::Reconnect;
        return SeekPlan{action, absolute, action == SeekAction::Discard ? absolute - current : 0};
    }

    std::expected<ReconnectPlan, FileErrorInfo> plan_reconnect(std::optional<std::int64_t> target) const {
        if (auto ok = check_open(); !ok) return std::unexpected(ok.error());

        auto current = tell();
        std::int64_t start = 0;
        if (!info_.seekable) {
            if ((!target && current != 0) || (target && *target != 0)) {
                return std::unexpected(FileErrorInfo{FileError::Unsupported, "reconnecting a non-seekable stream away from its start"});
            }
        } else if (!target) {
            start = static_cast<std::int64_t>(current);
        } else if (*target < 0) {
            start = std::max<std::int64_t>(static_cast<std::int64_t>(info_.length) + *target, 0);
        } else {
            start = *target;
        }

        auto absolute = static_cast<std::uint64_t>(start);
        return ReconnectPlan{absolute, !info_.chunked && absolute >= info_.length};
    }

    // Releases the handle and records the new position. The caller closes the returned handle.
    std::shared_ptr<Handle> detach(std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_ = start;
        tracks_position_ = false;
        return std::exchange(handle_, nullptr);
    }

    // Reconnects always ask for a range, except on a stream that never confirmed one.
    Headers headers_for(std::uint64_t start, const Headers& overrides) const {
        if (!info_.seekable) return request_headers(headers_, overrides, std::nullopt);
        return request_headers(headers_, overrides, static_cast<std::int64_t>(start));
    }

    // A reconnect must see the same total length; a mismatch breaks the reader for good.
    // Chunked transfers announce no length to compare against.
    std::expected<void, FileErrorInfo> verify_length(const ResponseHead& head) {
        if (info_.chunked) return {};
        auto length = HttpProtocol::total_length(head).value_or(0);
        if (length == info_.length) return {};

        FileErrorInfo err{FileError::Protocol,
            "file size changed: " + std::to_string(info_.length) + " -> " + std::to_string(length)};
        std::lock_guard<std::mutex> lock(mutex_);
        broken_ = err;
        return std::unexpected(err);
    }

    // A reconnect past byte 0 must be answered from the requested offset.
    // Failing here leaves the reader detached; a later read asks again.
    std::expected<void, FileErrorInfo> verify_range(const ResponseHead& head, std::uint64_t start) const {
        if (start == 0) return {};
        auto range = HttpProtocol::content_range(head);
        if (range && range->first == start) return {};
        return std::unexpected(FileErrorInfo{FileError::Transport,
            "server ignored Range: bytes=" + std::to_string(start) + "-", head.status_code});
    }

    // Binds a freshly opened handle. False if close() won the race; the caller then closes the handle.
    bool attach(std::shared_ptr<Handle> handle, std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        start_ = start;
        tracks_position_ = handle->tracks_position();
        handle_ = std::move(handle);
        ++reconnects_;
        return true;
    }

    // First call returns the handle to close (possibly null); later calls return null.
    std::pair<bool, std::shared_ptr<Handle>> close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) return {false, nullptr};
        start_ = tell_locked();
        tracks_position_ = false;
        return {true, std::exchange(handle_, nullptr)};
    }

private:
    std::uint64_t tell_locked() const {
        if (handle_ && tracks_position_) {
            if (!info_.chunked && start_ >= info_.length) return start_;
            return start_ + handle_->position();
        }
        return start_;
    }

    const Headers headers_;
    const std::uint64_t seek_threshold_;
    StreamInfo info_;

    mutable std::mutex mutex_;
    std::shared_ptr<Handle> handle_;
    bool tracks_position_ = false;
    std::uint64_t start_ = 0;
    std::atomic<bool> closed_ = false;
    std::optional<FileErrorInfo> broken_;
    std::atomic<std::size_t> reconnects_ = 0;
};

} // namespace httpfile
