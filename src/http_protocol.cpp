#include "http_protocol.hpp"
#include "socket_wrapper.hpp"
#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace httpfile {

bool HeaderLess::operator()(std::string_view a, std::string_view b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) < std::tolower(static_cast<unsigned char>(y));
    });
}

static std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static std::optional<std::uint64_t> parse_u64(std::string_view s) {
    s = trim(s);
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::string HttpProtocol::build_request(const HttpRequest& req, std::string_view user_agent) {
    std::ostringstream oss;
    oss << req.method << " " << req.path << " HTTP/1.1\r\n";
    oss << "Host: " << req.host << "\r\n";
    if (!req.headers.contains("User-Agent")) oss << "User-Agent: " << user_agent << "\r\n";
    if (!req.headers.contains("Accept")) oss << "Accept: */*\r\n";
    oss << "Connection: close\r\n";

    for (const auto& [key, value] : req.headers) {
        oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n";
    return oss.str();
}

std::optional<std::string> HttpProtocol::get_header(const ResponseHead& resp, std::string_view name) {
    if (auto it = resp.headers.find(name); it != resp.headers.end()) return it->second;
    return std::nullopt;
}

bool HttpProtocol::header_equals(const std::string& value, std::string_view expected) {
    auto lower_value = std::string(trim(value));
    std::ranges::transform(lower_value, lower_value.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower_value == expected;
}

std::optional<std::uint64_t> HttpProtocol::content_length(const ResponseHead& resp) {
    auto cl = get_header(resp, "content-length");
    if (!cl) return std::nullopt;
    return parse_u64(*cl);
}

std::optional<ByteRange> HttpProtocol::content_range(const ResponseHead& resp) {
    auto cr = get_header(resp, "content-range");
    if (!cr) return std::nullopt;

    std::string_view value = trim(*cr);
    if (value.size() < 6 || !header_equals(std::string(value.substr(0, 5)), "bytes")) return std::nullopt;
    value = trim(value.substr(5));

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) return std::nullopt;

    auto first = parse_u64(value.substr(0, dash));
    auto last = parse_u64(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) return std::nullopt;

    ByteRange range{*first, *last, std::nullopt};
    if (auto total = value.substr(slash + 1); trim(total) != "*") {
        range.total = parse_u64(total);
    }
    return range;
}

std::optional<std::uint64_t> HttpProtocol::total_length(const ResponseHead& resp) {
    if (auto range = content_range(resp); range && range->total) return range->total;
    return content_length(resp);
}

bool HttpProtocol::is_chunked(const ResponseHead& resp) {
    auto te = get_header(resp, "transfer-encoding");
    if (!te) return false;
    auto lower = *te;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower.find("chunked") != std::string::npos;
}

bool HttpProtocol::is_range_request(const ResponseHead& resp) {
    if (resp.status_code == 206) return true;
    if (get_header(resp, "content-range")) return true;
    if (auto ar = get_header(resp, "accept-ranges")) return header_equals(*ar, "bytes");
    return false;
}

std::string HttpProtocol::filename(const ResponseHead& resp) {
    if (auto cd = get_header(resp, "content-disposition")) {
        std::string_view value = *cd;
        std::string plain;
        size_t pos = 0;
        while (pos < value.size()) {
            auto semi = value.find(';', pos);
            auto param = trim(value.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
            pos = (semi == std::string_view::npos) ? value.size() : semi + 1;

            auto eq = param.find('=');
            if (eq == std::string_view::npos) continue;
            auto key = std::string(trim(param.substr(0, eq)));
            auto val = trim(param.substr(eq + 1));
            std::ranges::transform(key, key.begin(), [](unsigned char c) { return std::tolower(c); });

            if (key == "filename*") {
                // RFC 5987: charset'language'percent-encoded
                if (auto quote = val.rfind('\''); quote != std::string_view::npos) val = val.substr(quote + 1);
                if (!val.empty()) return percent_decode(val);
            } else if (key == "filename") {
                if (val.size() >= 2 && val.front() == '"' && val.back() == '"') val = val.substr(1, val.size() - 2);
                plain = std::string(val);
            }
        }
        if (!plain.empty()) return plain;
    }

    std::string_view path = resp.url;
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path = path.substr(scheme + 3);
        auto slash = path.find('/');
        path = (slash == std::string_view::npos) ? std::string_view{} : path.substr(slash);
    }
    if (auto q = path.find_first_of("?#"); q != std::string_view::npos) path = path.substr(0, q);
    if (auto slash = path.rfind('/'); slash != std::string_view::npos) path = path.substr(slash + 1);
    return percent_decode(path);
}

std::string HttpProtocol::range_value(std::int64_t start) {
    if (start < 0) return "bytes=" + std::to_string(start);
    return "bytes=" + std::to_string(start) + "-";
}

template<typename SocketType>
std::expected<ResponseHead, FileErrorInfo> HttpProtocol::parse_response(SocketType& socket) {
    auto status_line = socket.read_until("\r\n");
    if (!status_line) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to read status line: " + status_line.error().message});
    }

    ResponseHead response;
    std::istringstream iss(*status_line);
    std::string http_version;
    iss >> http_version >> response.status_code;
    if (!http_version.starts_with("HTTP/") || response.status_code == 0) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Malformed status line"});
    }
    std::getline(iss, response.status_message);
    response.status_message = std::string(trim(response.status_message));

    while (true) {
        auto line = socket.read_until("\r\n");
        if (!line) return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to read headers: " + line.error().message});
        if (*line == "\r\n") break;

        if (auto colon = line->find(':'); colon != std::string::npos) {
            auto key = line->substr(0, colon);
            auto value = std::string(trim(std::string_view(*line).substr(colon + 1)));
            if (auto it = response.headers.find(key); it != response.headers.end()) {
                it->second += ", " + value;
            } else {
                response.headers.emplace(std::move(key), std::move(value));
            }
        }
    }

    return response;
}

template<typename SocketType>
std::expected<std::uint64_t, FileErrorInfo> HttpProtocol::read_chunk_size(SocketType& socket) {
    auto size_line = socket.read_until("\r\n");
    if (!size_line) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to read chunk size: " + size_line.error().message});
    }

    std::string_view digits = trim(*size_line);
    if (auto ext = digits.find(';'); ext != std::string_view::npos) digits = trim(digits.substr(0, ext));

    std::uint64_t chunk_size = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), chunk_size, 16);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Malformed chunk size line"});
    }
    return chunk_size;
}

template<typename SocketType>
std::expected<void, FileErrorInfo> HttpProtocol::skip_chunk_trailer(SocketType& socket) {
    while (true) {
        auto line = socket.read_until("\r\n");
        if (!line) return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to read trailer"});
        if (*line == "\r\n") break;
    }
    return {};
}

// Explicit template instantiations
template std::expected<ResponseHead, FileErrorInfo> HttpProtocol::parse_response(ISocket&);
template std::expected<std::uint64_t, FileErrorInfo> HttpProtocol::read_chunk_size(ISocket&);
template std::expected<void, FileErrorInfo> HttpProtocol::skip_chunk_trailer(ISocket&);

} // namespace httpfile
