#include "curl_transport.hpp"
#include "log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>

namespace httpfile {

static constexpr long kMaxRedirects = 5;

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

class CurlTransport::Impl {
public:
    CURLM* multi = nullptr;
    CURL* easy = nullptr;
    curl_slist* header_list = nullptr;
    char error_buffer[CURL_ERROR_SIZE] = {};

    ResponseHead head;
    std::string pending;
    size_t pending_pos = 0;
    bool body_started = false;
    bool done = false;
    CURLcode result = CURLE_OK;
    std::atomic<bool> aborted = false;
    std::atomic<std::uint64_t> delivered = 0;

    ~Impl() {
        if (multi && easy) curl_multi_remove_handle(multi, easy);
        if (easy) curl_easy_cleanup(easy);
        if (multi) curl_multi_cleanup(multi);
        if (header_list) curl_slist_free_all(header_list);
    }

    size_t available() const { return pending.size() - pending_pos; }

    void consume(size_t n) {
        pending_pos += n;
        delivered += n;
        if (pending_pos == pending.size()) {
            pending.clear();
            pending_pos = 0;
        }
    }

    std::expected<void, FileErrorInfo> transfer_error() const {
        if (result == CURLE_OK) return {};
        std::string reason = error_buffer[0] ? error_buffer : curl_easy_strerror(result);
        return std::unexpected(FileErrorInfo{FileError::Transport, "Transfer failed: " + reason, head.status_code});
    }

    // One round of curl_multi_perform, waiting for socket activity if the transfer is still running.
    std::expected<void, FileErrorInfo> pump() {
        if (aborted) return std::unexpected(FileErrorInfo{FileError::Transport, "Transfer aborted"});

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            return std::unexpected(FileErrorInfo{FileError::Transport, std::string("curl_multi_perform: ") + curl_multi_strerror(mc)});
        }

        if (running == 0) {
            int left = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &left)) {
                if (msg->msg == CURLMSG_DONE) result = msg->data.result;
            }
            done = true;
            return transfer_error();
        }

        if (available() > 0) return {};

        mc = curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
        if (mc != CURLM_OK) {
            return std::unexpected(FileErrorInfo{FileError::Transport, std::string("curl_multi_poll: ") + curl_multi_strerror(mc)});
        }
        return {};
    }

    static size_t on_body(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* impl = static_cast<Impl*>(userp);
        if (impl->aborted) return 0;
        impl->pending.append(static_cast<char*>(contents), realsize);
        impl->body_started = true;
        return realsize;
    }

    static size_t on_header(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* impl = static_cast<Impl*>(userp);
        std::string line(static_cast<char*>(contents), realsize);

        if (line.starts_with("HTTP/")) {
            // A new status line: redirects and 1xx responses replace the previous head.
            impl->head.headers.clear();
            auto sp = line.find(' ');
            if (sp != std::string::npos) {
                impl->head.status_code = std::atoi(line.c_str() + sp + 1);
                auto msg_start = line.find(' ', sp + 1);
                impl->head.status_message = msg_start == std::string::npos ? "" : line.substr(msg_start + 1);
                impl->head.status_message.erase(impl->head.status_message.find_last_not_of(" \t\r\n") + 1);
            }
            return realsize;
        }

        if (auto colon = line.find(':'); colon != std::string::npos) {
            auto key = line.substr(0, colon);
            auto value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);
            if (auto it = impl->head.headers.find(key); it != impl->head.headers.end()) {
                it->second += ", " + value;
            } else {
                impl->head.headers.emplace(std::move(key), std::move(value));
            }
        }
        return realsize;
    }

    std::expected<void, FileErrorInfo> fill() {
        while (available() == 0 && !done) {
            if (auto r = pump(); !r) return r;
        }
        return {};
    }
};

static void set_http_version(CURL* curl, const TransportConfig& config, std::string_view url) {
    if (config.enable_http2 && url.starts_with("https://")) {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    }
}

CurlTransport::CurlTransport() : pImpl_(std::make_unique<Impl>()) {}
CurlTransport::~CurlTransport() = default;

std::expected<std::unique_ptr<CurlTransport>, FileErrorInfo> CurlTransport::open(
    const std::string& url,
    const Headers& headers,
    const TransportConfig& config
) {
    ensure_curl_global_init();

    std::unique_ptr<CurlTransport> transport(new CurlTransport());
    auto& impl = *transport->pImpl_;

    impl.multi = curl_multi_init();
    impl.easy = curl_easy_init();
    if (!impl.multi || !impl.easy) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "Failed to init CURL"});
    }

    for (const auto& [k, v] : headers) {
        std::string h = k;
        if (v.empty()) {
            h += ";";
        } else {
            h += ": ";
            h += v;
        }
        impl.header_list = curl_slist_append(impl.header_list, h.c_str());
    }

    CURL* curl = impl.easy;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, impl.header_list);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, config.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.timeout);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, config.timeout);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, Impl::on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &impl);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, Impl::on_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &impl);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, impl.error_buffer);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(config.buffer_size));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_peer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_peer ? 2L : 0L);
    if (config.enable_tcp_nodelay) curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    if (config.enable_tcp_keepalive) curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    set_http_version(curl, config, url);

    if (CURLMcode mc = curl_multi_add_handle(impl.multi, curl); mc != CURLM_OK) {
        return std::unexpected(FileErrorInfo{FileError::Transport, std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)});
    }

    log::debug("curl GET " + url);
    while (!impl.body_started && !impl.done) {
        if (auto r = impl.pump(); !r) return std::unexpected(r.error());
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    impl.head.status_code = static_cast<int>(http_code);
    char* effective = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective);
    impl.head.url = effective ? effective : url;

    // Anything but 2xx is a failure here, including a redirect that was not followed.
    if (http_code < 200 || http_code >= 300) {
        return std::unexpected(FileErrorInfo{FileError::Transport, "HTTP error: " + std::to_string(http_code), static_cast<int>(http_code)});
    }
    return transport;
}

const ResponseHead& CurlTransport::head() const {
    return pImpl_->head;
}

std::expected<size_t, FileErrorInfo> CurlTransport::read(std::span<char> buffer) {
    if (buffer.empty()) return 0;
    if (auto r = pImpl_->fill(); !r) return std::unexpected(r.error());

    size_t n = std::min(buffer.size(), pImpl_->available());
    std::copy_n(pImpl_->pending.data() + pImpl_->pending_pos, n, buffer.data());
    pImpl_->consume(n);
    return n;
}

std::expected<std::string, FileErrorInfo> CurlTransport::read_line(size_t limit) {
    auto& impl = *pImpl_;
    size_t scanned = 0;
    while (true) {
        std::string_view view(impl.pending.data() + impl.pending_pos, impl.available());
        auto nl = view.find('\n', scanned);
        if (nl != std::string_view::npos || view.size() >= limit || impl.done) {
            size_t n = (nl != std::string_view::npos) ? nl + 1 : view.size();
            n = std::min(n, limit);
            std::string line(view.substr(0, n));
            impl.consume(n);
            return line;
        }
        scanned = view.size();
        if (auto r = impl.pump(); !r) return std::unexpected(r.error());
    }
}

std::uint64_t CurlTransport::position() const {
    return pImpl_->delivered;
}

void CurlTransport::close() {
    if (pImpl_->aborted.exchange(true)) return;
    if (pImpl_->multi) curl_multi_wakeup(pImpl_->multi);
}

Opener curl_opener(TransportConfig config) {
    return [config](const std::string& url, const Headers& headers)
        -> std::expected<std::unique_ptr<Transport>, FileErrorInfo> {
        auto transport = CurlTransport::open(url, headers, config);
        if (!transport) return std::unexpected(transport.error());
        return std::unique_ptr<Transport>(std::move(*transport));
    };
}

Opener default_opener() {
    return curl_opener();
}

} // namespace httpfile
