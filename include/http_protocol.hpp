#pragma once

#include "file_error.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace httpfile {

// Header names compare case-insensitively.
struct HeaderLess {
    bool operator()(std::string_view a, std::string_view b) const;
    using is_transparent = void;
};

using Headers = std::map<std::string, std::string, HeaderLess>;

struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    std::string host;
    Headers headers;
};

struct ResponseHead {
    int status_code = 0;
    std::string status_message;
    Headers headers;
    std::string url;
};

// First byte, last byte and total of a Content-Range header; total is empty for "*".
struct ByteRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
    std::optional<std::uint64_t> total;
};

class HttpProtocol {
public:
    static std::string build_request(const HttpRequest& req, std::string_view user_agent);

    // Parses the status line and header block of a response.
    template<typename SocketType>
    static std::expected<ResponseHead, FileErrorInfo> parse_response(SocketType& socket);

    // Reads a chunk-size line; 0 marks the last chunk.
    template<typename SocketType>
    static std::expected<std::uint64_t, FileErrorInfo> read_chunk_size(SocketType& socket);

    template<typename SocketType>
    static std::expected<void, FileErrorInfo> skip_chunk_trailer(SocketType& socket);

    static std::optional<std::string> get_header(const ResponseHead& resp, std::string_view name);

    static std::optional<std::uint64_t> content_length(const ResponseHead& resp);
    static std::optional<ByteRange> content_range(const ResponseHead& resp);

    // Full resource size: Content-Range total, else Content-Length.
    static std::optional<std::uint64_t> total_length(const ResponseHead& resp);

    static bool is_chunked(const ResponseHead& resp);

    // True when the server confirmed byte-range support for this response.
    static bool is_range_request(const ResponseHead& resp);

    // Best-effort resource name from Content-Disposition or the URL path.
    static std::string filename(const ResponseHead& resp);

    // Range header value for a start offset: "bytes=N-" or the suffix form "bytes=-N".
    static std::string range_value(std::int64_t start);

private:
    static bool header_equals(const std::string& value, std::string_view expected);
};

} // namespace httpfile
