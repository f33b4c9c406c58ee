#pragma once

#include "reader.hpp"
#include <memory>
#include <optional>
#include <string>

namespace httpfile {

struct TextOptions {
    std::string encoding = "utf-8";       // utf-8, latin-1 / iso-8859-1, ascii
    std::string errors = "strict";        // strict, replace, ignore
    std::optional<std::string> newline;   // unset: universal newlines translated to "\n"
    bool line_buffering = false;
};

// Decodes a byte reader into UTF-8 text. Sizes count characters; tell() and seek() use byte offsets.
class TextReader : public Reader {
public:
    static std::expected<std::unique_ptr<TextReader>, FileErrorInfo> create(
        std::unique_ptr<Reader> inner,
        TextOptions options = {}
    );

    std::expected<std::string, FileErrorInfo> read(size_t size) override;
    std::expected<size_t, FileErrorInfo> read_into(std::span<char> buffer) override;
    std::expected<std::string, FileErrorInfo> read_line(size_t limit = npos) override;

    // Only absolute seeks and zero offsets from the current position or the end.
    std::expected<std::uint64_t, FileErrorInfo> seek(std::int64_t pos, Whence whence = Whence::Set) override;
    std::expected<std::uint64_t, FileErrorInfo> tell() const override;

    void close() override;
    bool closed() const override { return inner_->closed(); }
    bool seekable() const override { return inner_->seekable(); }

    std::string name() const override { return inner_->name(); }
    std::string mode() const override { return "r"; }

    const std::string& encoding() const { return options_.encoding; }
    const std::string& errors() const { return options_.errors; }
    const std::optional<std::string>& newline() const { return options_.newline; }
    bool line_buffering() const { return options_.line_buffering; }

    Reader& buffer() { return *inner_; }

private:
    enum class Codec { Utf8, Latin1, Ascii };
    enum class OnError { Strict, Replace, Ignore };

    // One decoded character (or newline pair) and the bytes it came from.
    struct Unit {
        std::string text;
        size_t width = 0;
    };

    TextReader(std::unique_ptr<Reader> inner, TextOptions options, Codec codec, OnError on_error);

    // Makes `count` undecoded bytes available; false if the stream ends first.
    std::expected<bool, FileErrorInfo> ensure(size_t count);
    std::expected<std::optional<Unit>, FileErrorInfo> decode_at(size_t offset);
    std::expected<std::optional<Unit>, FileErrorInfo> next_unit();
    std::expected<Unit, FileErrorInfo> invalid(size_t offset, size_t width, std::string_view reason);
    std::expected<bool, FileErrorInfo> ends_line(const std::string& line, const std::string& text);

    // Moves the inner reader; pending bytes are dropped once it has moved.
    std::expected<std::uint64_t, FileErrorInfo> reposition(std::int64_t pos, Whence whence);

    void consume(size_t width) { raw_pos_ += width; }
    void drop() {
        raw_.clear();
        raw_pos_ = 0;
    }

    std::unique_ptr<Reader> inner_;
    TextOptions options_;
    Codec codec_;
    OnError on_error_;
    std::string raw_;
    size_t raw_pos_ = 0;
};

} // namespace httpfile
