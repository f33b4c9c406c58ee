#include "reader_core.hpp"
#include "log.hpp"

namespace httpfile {

SeekAction choose_seek(std::uint64_t current, std::uint64_t target, std::uint64_t threshold) {
    if (target == current) return SeekAction::None;
    if (target > current && target - current <= threshold) return SeekAction::Discard;
    return SeekAction::Reconnect;
}

Headers base_headers(const Headers& caller) {
    Headers headers = caller;
    // Byte offsets only make sense on the identity encoding.
    headers["Accept-Encoding"] = "identity";
    return headers;
}

Headers request_headers(const Headers& base, const Headers& overrides, std::optional<std::int64_t> start) {
    Headers headers = base;
    for (const auto& [key, value] : overrides) headers[key] = value;
    headers["Accept-Encoding"] = "identity";
    if (start) {
        headers["Range"] = HttpProtocol::range_value(*start);
    } else {
        headers.erase("Range");
    }
    return headers;
}

StreamInfo describe(const ResponseHead& head, std::int64_t requested_start) {
    StreamInfo info;
    info.length = HttpProtocol::total_length(head).value_or(0);
    info.chunked = HttpProtocol::is_chunked(head);
    info.seekable = HttpProtocol::is_range_request(head);
    info.name = HttpProtocol::filename(head);

    if (requested_start != 0) {
        if (auto range = HttpProtocol::content_range(head)) {
            info.start = range->first;
        } else {
            log::warn("server ignored Range: bytes from offset " + std::to_string(requested_start) +
                      " of " + head.url + " start at 0, seeking disabled");
            info.seekable = false;
            info.start = 0;
        }
    }
    return info;
}

} // namespace httpfile
