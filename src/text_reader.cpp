#include "text_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace httpfile {

static constexpr size_t kDecodeChunk = 8192;
static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

static std::string normalize(std::string_view name) {
    std::string out(name);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return c == '_' ? '-' : std::tolower(c); });
    return out;
}

static std::string utf8_encode(unsigned char byte) {
    std::string out;
    if (byte < 0x80) {
        out += static_cast<char>(byte);
    } else {
        out += static_cast<char>(0xC0 | (byte >> 6));
        out += static_cast<char>(0x80 | (byte & 0x3F));
    }
    return out;
}

static std::string hex_byte(unsigned char byte) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", byte);
    return buf;
}

std::expected<std::unique_ptr<TextReader>, FileErrorInfo> TextReader::create(
    std::unique_ptr<Reader> inner,
    TextOptions options
) {
    Codec codec;
    auto encoding = normalize(options.encoding);
    if (encoding == "utf-8" || encoding == "utf8") {
        codec = Codec::Utf8;
    } else if (encoding == "latin-1" || encoding == "latin1" || encoding == "iso-8859-1" || encoding == "iso8859-1") {
        codec = Codec::Latin1;
    } else if (encoding == "ascii" || encoding == "us-ascii") {
        codec = Codec::Ascii;
    } else {
        return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "unknown encoding: " + options.encoding});
    }

    OnError on_error;
    if (options.errors == "strict") {
        on_error = OnError::Strict;
    } else if (options.errors == "replace") {
        on_error = OnError::Replace;
    } else if (options.errors == "ignore") {
        on_error = OnError::Ignore;
    } else {
        return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "unknown error handler: " + options.errors});
    }

    if (options.newline) {
        const auto& nl = *options.newline;
        if (!nl.empty() && nl != "\n" && nl != "\r" && nl != "\r\n") {
            return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "illegal newline value"});
        }
    }

    return std::unique_ptr<TextReader>(new TextReader(std::move(inner), std::move(options), codec, on_error));
}

TextReader::TextReader(std::unique_ptr<Reader> inner, TextOptions options, Codec codec, OnError on_error)
    : inner_(std::move(inner)), options_(std::move(options)), codec_(codec), on_error_(on_error) {}

std::expected<bool, FileErrorInfo> TextReader::ensure(size_t count) {
    while (raw_.size() - raw_pos_ < count) {
        if (raw_pos_ > 0) {
            raw_.erase(0, raw_pos_);
            raw_pos_ = 0;
        }
        auto more = inner_->read(kDecodeChunk);
        if (!more) return std::unexpected(more.error());
        if (more->empty()) return false;
        raw_ += *more;
    }
    return true;
}

std::expected<TextReader::Unit, FileErrorInfo> TextReader::invalid(size_t offset, size_t width, std::string_view reason) {
    switch (on_error_) {
        case OnError::Replace:
            return Unit{std::string(kReplacement), width};
        case OnError::Ignore:
            return Unit{"", width};
        case OnError::Strict:
            break;
    }
    auto byte = static_cast<unsigned char>(raw_[raw_pos_ + offset]);
    std::string where;
    if (auto pos = tell()) where = " at byte " + std::to_string(*pos + offset);
    return std::unexpected(FileErrorInfo{FileError::Decode,
        "'" + options_.encoding + "' codec can't decode byte " + hex_byte(byte) + where + ": " + std::string(reason)});
}

std::expected<std::optional<TextReader::Unit>, FileErrorInfo> TextReader::decode_at(size_t offset) {
    auto have = ensure(offset + 1);
    if (!have) return std::unexpected(have.error());
    if (!*have) return std::nullopt;

    auto lead = static_cast<unsigned char>(raw_[raw_pos_ + offset]);
    if (lead < 0x80) return Unit{std::string(1, static_cast<char>(lead)), 1};

    if (codec_ == Codec::Latin1) return Unit{utf8_encode(lead), 1};
    if (codec_ == Codec::Ascii) return invalid(offset, 1, "ordinal not in range(128)");

    size_t len = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
    } else {
        return invalid(offset, 1, "invalid start byte");
    }

    auto complete = ensure(offset + len);
    if (!complete) return std::unexpected(complete.error());

    size_t avail = raw_.size() - raw_pos_ - offset;
    for (size_t i = 1; i < len; ++i) {
        if (i >= avail) return invalid(offset, i, "unexpected end of data");
        auto byte = static_cast<unsigned char>(raw_[raw_pos_ + offset + i]);
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (i == 1) {
            // Reject overlong forms, surrogates and code points past U+10FFFF.
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        }
        if (byte < low || byte > high) return invalid(offset, i, "invalid continuation byte");
    }
    return Unit{raw_.substr(raw_pos_ + offset, len), len};
}

std::expected<std::optional<TextReader::Unit>, FileErrorInfo> TextReader::next_unit() {
    auto unit = decode_at(0);
    if (!unit || !*unit) return unit;
    if (options_.newline || (*unit)->text != "\r") return unit;

    // Translated universal newlines: "\r\n" and a lone "\r" both become "\n".
    auto more = ensure(2);
    if (!more) return std::unexpected(more.error());
    if (*more && raw_[raw_pos_ + 1] == '\n') return Unit{"\n", 2};
    return Unit{"\n", 1};
}

std::expected<bool, FileErrorInfo> TextReader::ends_line(const std::string& line, const std::string& text) {
    if (!options_.newline) return text == "\n";

    const auto& nl = *options_.newline;
    if (nl.empty()) {
        if (text == "\n") return true;
        if (text != "\r") return false;
        // A "\r" directly followed by "\n" is the first half of one terminator.
        auto more = ensure(1);
        if (!more) return std::unexpected(more.error());
        return !*more || raw_[raw_pos_] != '\n';
    }
    if (nl == "\r\n") return line.ends_with("\r\n");
    return text == nl;
}

std::expected<std::string, FileErrorInfo> TextReader::read(size_t size) {
    if (closed()) return std::unexpected(closed_error());

    std::string out;
    size_t chars = 0;
    while (chars < size) {
        auto unit = next_unit();
        if (!unit) return std::unexpected(unit.error());
        if (!*unit) break;
        consume((*unit)->width);
        if ((*unit)->text.empty()) continue;
        out += (*unit)->text;
        ++chars;
    }
    return out;
}

std::expected<size_t, FileErrorInfo> TextReader::read_into(std::span<char>) {
    return std::unexpected(FileErrorInfo{FileError::Unsupported, "read_into is not supported on a text stream"});
}

std::expected<std::string, FileErrorInfo> TextReader::read_line(size_t limit) {
    if (closed()) return std::unexpected(closed_error());

    std::string line;
    size_t chars = 0;
    while (chars < limit) {
        auto unit = next_unit();
        if (!unit) return std::unexpected(unit.error());
        if (!*unit) break;
        consume((*unit)->width);
        if ((*unit)->text.empty()) continue;
        line += (*unit)->text;
        ++chars;

        auto done = ends_line(line, (*unit)->text);
        if (!done) return std::unexpected(done.error());
        if (*done) break;
    }
    return line;
}

std::expected<std::uint64_t, FileErrorInfo> TextReader::tell() const {
    auto inner = inner_->tell();
    if (!inner) return std::unexpected(inner.error());
    return *inner - (raw_.size() - raw_pos_);
}

std::expected<std::uint64_t, FileErrorInfo> TextReader::seek(std::int64_t pos, Whence whence) {
    if (closed()) return std::unexpected(closed_error());
    if (!seekable()) return inner_->seek(pos, whence);

    switch (whence) {
        case Whence::Set:
            if (pos < 0) {
                return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "negative seek position: " + std::to_string(pos)});
            }
            return reposition(pos, Whence::Set);
        case Whence::Current:
            if (pos != 0) return std::unexpected(FileErrorInfo{FileError::Unsupported, "can't do nonzero cur-relative seeks"});
            return tell();
        case Whence::End:
            if (pos != 0) return std::unexpected(FileErrorInfo{FileError::Unsupported, "can't do nonzero end-relative seeks"});
            return reposition(0, Whence::End);
    }
    return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "whence value unsupported"});
}

std::expected<std::uint64_t, FileErrorInfo> TextReader::reposition(std::int64_t pos, Whence whence) {
    auto before = inner_->tell();
    auto moved = inner_->seek(pos, whence);
    if (moved) {
        drop();
        return moved;
    }
    auto after = inner_->tell();
    if (!before || !after || *after != *before) drop();
    return moved;
}

void TextReader::close() {
    drop();
    inner_->close();
}

} // namespace httpfile
