#pragma once

#include "http_file.hpp"
#include "text_reader.hpp"
#include <memory>
#include <optional>
#include <string_view>

namespace httpfile {

struct WrapOptions {
    std::optional<int> buffering;   // unset: text 8192, binary unbuffered; 1: line buffering; <0: default size
    TextOptions text;
};

struct OpenOptions {
    ReaderOptions reader;
    WrapOptions wrap;
    Opener opener = default_opener();
};

// Stacks buffering and, in text mode, decoding over an open file.
// Unbuffered binary returns the file itself.
std::expected<std::unique_ptr<Reader>, FileErrorInfo> wrap(
    std::unique_ptr<HttpFile> file,
    bool text_mode,
    WrapOptions options = {}
);

// Opens `locator` with a mode of "r", "rt", "tr" (text) or "rb", "br" (binary).
std::expected<std::unique_ptr<Reader>, FileErrorInfo> open(
    Locator locator,
    std::string_view mode = "r",
    OpenOptions options = {}
);

} // namespace httpfile
