#pragma once

#include "file_error.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace httpfile {

enum class Whence { Set = 0, Current = 1, End = 2 };

// Maps the POSIX-style integer (0, 1, 2) to a Whence.
std::expected<Whence, FileErrorInfo> whence_from_int(int value);

// Read-only, file-like view shared by the raw HTTP reader and the layers stacked on it.
class Reader {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    virtual ~Reader() = default;

    // Up to `size` units (bytes, or characters for text); npos reads to the end.
    virtual std::expected<std::string, FileErrorInfo> read(size_t size) = 0;
    std::expected<std::string, FileErrorInfo> read_all() { return read(npos); }

    // One read into the caller's buffer; may return fewer bytes than requested.
    virtual std::expected<size_t, FileErrorInfo> read_into(std::span<char> buffer) = 0;

    virtual std::expected<std::string, FileErrorInfo> read_line(size_t limit = npos) = 0;

    // Lines until their total size reaches `hint`; 0 reads every remaining line.
    std::expected<std::vector<std::string>, FileErrorInfo> read_lines(size_t hint = 0);

    virtual std::expected<std::uint64_t, FileErrorInfo> seek(std::int64_t pos, Whence whence = Whence::Set) = 0;
    virtual std::expected<std::uint64_t, FileErrorInfo> tell() const = 0;

    virtual void close() = 0;
    virtual bool closed() const = 0;
    virtual bool seekable() const = 0;

    bool readable() const { return true; }
    bool writable() const { return false; }

    std::expected<size_t, FileErrorInfo> write(std::string_view) { return std::unexpected(unsupported_error("write")); }
    std::expected<void, FileErrorInfo> write_lines(const std::vector<std::string>&) { return std::unexpected(unsupported_error("write")); }
    std::expected<std::uint64_t, FileErrorInfo> truncate(std::uint64_t) { return std::unexpected(unsupported_error("truncate")); }

    virtual std::string name() const = 0;
    virtual std::string mode() const = 0;
};

} // namespace httpfile
