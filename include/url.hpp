#pragma once

#include "file_error.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace httpfile {

struct UrlParts {
    std::string protocol;
    std::string host;
    uint16_t port = 80;
    std::string path;  // includes the query string
};

std::expected<UrlParts, FileErrorInfo> parse_url(std::string_view url);

std::string percent_decode(std::string_view text);

} // namespace httpfile
