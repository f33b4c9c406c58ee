#include "open.hpp"
#include "buffered_reader.hpp"
#include "log.hpp"

namespace httpfile {

std::expected<std::unique_ptr<Reader>, FileErrorInfo> wrap(
    std::unique_ptr<HttpFile> file,
    bool text_mode,
    WrapOptions options
) {
    int buffering = options.buffering.value_or(text_mode ? static_cast<int>(kDefaultBufferSize) : 0);
    if (buffering == 0) {
        if (text_mode) return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "can't have unbuffered text I/O"});
        return std::unique_ptr<Reader>(std::move(file));
    }

    bool line_buffering = options.text.line_buffering;
    size_t buffer_size = kDefaultBufferSize;
    if (buffering == 1) {
        if (!text_mode) {
            log::warn("line buffering (buffering=1) isn't supported in binary mode, the default buffer size will be used");
        }
        line_buffering = true;
    } else if (buffering > 1) {
        buffer_size = static_cast<size_t>(buffering);
    }

    auto buffered = std::make_unique<BufferedReader>(std::move(file), buffer_size);
    if (!text_mode) return std::unique_ptr<Reader>(std::move(buffered));

    options.text.line_buffering = line_buffering;
    auto text = TextReader::create(std::move(buffered), std::move(options.text));
    if (!text) return std::unexpected(text.error());
    return std::unique_ptr<Reader>(std::move(*text));
}

std::expected<std::unique_ptr<Reader>, FileErrorInfo> open(
    Locator locator,
    std::string_view mode,
    OpenOptions options
) {
    bool text_mode;
    if (mode == "r" || mode == "rt" || mode == "tr") {
        text_mode = true;
    } else if (mode == "rb" || mode == "br") {
        text_mode = false;
    } else {
        return std::unexpected(FileErrorInfo{FileError::InvalidConfig,
            "invalid (or unsupported) mode: '" + std::string(mode) + "'"});
    }
    if (text_mode && options.wrap.buffering && *options.wrap.buffering == 0) {
        return std::unexpected(FileErrorInfo{FileError::InvalidConfig, "can't have unbuffered text I/O"});
    }

    auto file = HttpFile::open(std::move(locator), std::move(options.reader), std::move(options.opener));
    if (!file) return std::unexpected(file.error());
    return wrap(std::move(*file), text_mode, std::move(options.wrap));
}

} // namespace httpfile
