#include "url.hpp"
#include <charconv>

namespace httpfile {

std::expected<UrlParts, FileErrorInfo> parse_url(std::string_view url) {
    UrlParts parts;
    auto rest = url;

    if (auto proto_end = url.find("://"); proto_end != std::string_view::npos) {
        parts.protocol = std::string(url.substr(0, proto_end));
        rest = url.substr(proto_end + 3);
    } else {
        return std::unexpected(FileErrorInfo{FileError::Transport, "URL has no scheme: " + std::string(url)});
    }

    if (parts.protocol != "http" && parts.protocol != "https") {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Unsupported URL scheme: " + parts.protocol});
    }
    parts.port = (parts.protocol == "https") ? 443 : 80;

    auto path_start = rest.find_first_of("/?");
    auto host_part = (path_start != std::string_view::npos) ? rest.substr(0, path_start) : rest;
    if (path_start == std::string_view::npos) {
        parts.path = "/";
    } else if (rest[path_start] == '?') {
        parts.path = "/" + std::string(rest.substr(path_start));
    } else {
        parts.path = std::string(rest.substr(path_start));
    }

    if (auto at = host_part.rfind('@'); at != std::string_view::npos) {
        host_part = host_part.substr(at + 1);
    }

    if (auto port_pos = host_part.rfind(':'); port_pos != std::string_view::npos && host_part.find(']') == std::string_view::npos) {
        auto port_str = host_part.substr(port_pos + 1);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc() || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
            return std::unexpected(FileErrorInfo{FileError::Transport, "Invalid port in URL: " + std::string(url)});
        }
        parts.port = static_cast<uint16_t>(port);
        parts.host = std::string(host_part.substr(0, port_pos));
    } else {
        parts.host = std::string(host_part);
    }

    if (parts.host.empty()) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "URL has no host: " + std::string(url)});
    }
    return parts;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace httpfile
