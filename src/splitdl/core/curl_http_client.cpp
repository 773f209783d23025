// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/curl_http_client.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <new>
#include <vector>

namespace splitdl::core {

namespace {

// RAII curl easy handle
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlHeaders {
    curl_slist* list = nullptr;

    CurlHeaders() = default;
    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    bool append(const char* header) noexcept {
        auto* next = curl_slist_append(list, header);
        if (!next) return false;
        list = next;
        return true;
    }
};

// Shared by HEAD and ranged GET
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* response = static_cast<HttpResponse*>(userdata);
    if (!response) return total;

    try {
        append_header_line(*response, std::string_view(buffer, total));
    } catch (const std::bad_alloc&) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

std::error_code from_curl(CURLcode code) noexcept {
    return CurlHttpClient::to_error_code(static_cast<int>(code));
}

//=============================================================================
// CurlRangeStream
//=============================================================================

// Pull-based body of one ranged GET. The transfer runs on its own multi
// handle; at most one curl delivery is buffered, further deliveries are
// paused until read() has drained it.
class CurlRangeStream final : public ByteStream {
public:
    explicit CurlRangeStream(std::stop_token stop) noexcept
        : stop_(std::move(stop)) {}

    ~CurlRangeStream() override {
        if (multi_) {
            if (easy_) curl_multi_remove_handle(multi_, easy_);
            curl_multi_cleanup(multi_);
        }
        if (easy_) curl_easy_cleanup(easy_);
    }

    CurlRangeStream(const CurlRangeStream&) = delete;
    CurlRangeStream& operator=(const CurlRangeStream&) = delete;

    [[nodiscard]] CURL* easy() const noexcept { return easy_; }
    [[nodiscard]] HttpResponse& head() noexcept { return head_; }
    [[nodiscard]] curl_slist* request_headers() const noexcept { return request_headers_.list; }
    [[nodiscard]] CurlHeaders& header_list() noexcept { return request_headers_; }

    [[nodiscard]] std::error_code init() noexcept {
        easy_ = curl_easy_init();
        multi_ = curl_multi_init();
        if (!easy_ || !multi_) {
            return make_error_code(DownloadErrc::network_error);
        }
        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlRangeStream::body_callback);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &header_callback);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &head_);
        return {};
    }

    // Start the transfer and run it until the first body bytes (or the end
    // of the response) arrive. Headers are complete afterwards.
    [[nodiscard]] std::error_code wait_for_headers() noexcept {
        if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
            return make_error_code(DownloadErrc::network_error);
        }
        while (!has_pending() && !paused_ && !done_) {
            if (auto ec = pump()) return ec;
        }
        if (done_ && result_ != CURLE_OK) {
            return from_curl(result_);
        }
        return {};
    }

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept override {
        if (buffer.empty()) return 0;

        while (!has_pending()) {
            if (paused_) {
                paused_ = false;
                pending_.clear();
                pending_pos_ = 0;
                // May deliver the held-back data synchronously
                if (CURLcode rc = curl_easy_pause(easy_, CURLPAUSE_CONT); rc != CURLE_OK) {
                    spdlog::debug("cannot resume range transfer: {}", curl_easy_strerror(rc));
                    return std::unexpected(make_error_code(DownloadErrc::network_error));
                }
                continue;
            }
            if (done_) {
                if (result_ != CURLE_OK) {
                    spdlog::debug("range transfer ended with curl error {}: {}",
                                  static_cast<int>(result_), curl_easy_strerror(result_));
                    return std::unexpected(from_curl(result_));
                }
                return 0;
            }
            if (auto ec = pump()) {
                return std::unexpected(ec);
            }
        }

        auto available = pending_.size() - pending_pos_;
        auto n = std::min(available, buffer.size());
        std::memcpy(buffer.data(), pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        return n;
    }

private:
    [[nodiscard]] bool has_pending() const noexcept { return pending_pos_ < pending_.size(); }

    // One round of transfer work; blocks at most TRANSFER_POLL_MS
    [[nodiscard]] std::error_code pump() noexcept {
        if (stop_.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }

        int running = 0;
        if (curl_multi_perform(multi_, &running) != CURLM_OK) {
            return make_error_code(DownloadErrc::network_error);
        }

        int left = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                done_ = true;
                result_ = msg->data.result;
            }
        }

        if (!done_ && !has_pending() && !paused_) {
            if (curl_multi_poll(multi_, nullptr, 0, TRANSFER_POLL_MS, nullptr) != CURLM_OK) {
                return make_error_code(DownloadErrc::network_error);
            }
        }
        return {};
    }

    static std::size_t body_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlRangeStream*>(userdata);
        std::size_t total = size * nmemb;

        if (self->has_pending()) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        auto* bytes = reinterpret_cast<const std::byte*>(ptr);
        try {
            self->pending_.assign(bytes, bytes + total);
        } catch (const std::bad_alloc&) {
            return 0;
        }
        self->pending_pos_ = 0;
        return total;
    }

    std::stop_token stop_;
    CURL* easy_{nullptr};
    CURLM* multi_{nullptr};
    CurlHeaders request_headers_;
    HttpResponse head_;

    std::vector<std::byte> pending_;
    std::size_t pending_pos_{0};
    bool paused_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

//=============================================================================
// CurlHttpClient
//=============================================================================

CurlHttpClient::CurlHttpClient(const DownloadConfig& config)
    : connect_timeout_sec_(static_cast<long>(config.connect_timeout_sec))
    , follow_redirects_(config.follow_redirects)
    , verify_tls_(config.verify_tls)
    , user_agent_(config.user_agent) {}

std::expected<HttpResponse, std::error_code>
CurlHttpClient::head(const std::string& url) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    // Declared length must be the identity length, so never negotiate compression
    CurlHeaders headers;
    if (!headers.append("Accept-Encoding: identity")) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, follow_redirects_ ? 1L : 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec_);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, verify_tls_ ? 1L : 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, verify_tls_ ? 2L : 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::error("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(from_curl(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    return response;
}

std::expected<StreamedResponse, std::error_code>
CurlHttpClient::get_range(const std::string& url,
                          std::uint64_t first,
                          std::uint64_t last,
                          std::stop_token stop) noexcept {
    try {
        auto stream = std::make_unique<CurlRangeStream>(std::move(stop));
        if (auto ec = stream->init()) {
            return std::unexpected(ec);
        }
        if (!stream->header_list().append("Accept-Encoding: identity")) {
            return std::unexpected(make_error_code(DownloadErrc::network_error));
        }

        // CURLOPT_RANGE takes "first-last" and emits "Range: bytes=first-last"
        std::string range = std::to_string(first) + "-" + std::to_string(last);

        CURL* curl = stream->easy();
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, stream->request_headers());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow_redirects_ ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_sec_);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify_tls_ ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify_tls_ ? 2L : 0L);
        curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

        if (auto ec = stream->wait_for_headers()) {
            spdlog::debug("GET {} range {} failed before body: {}", url, range, ec.message());
            return std::unexpected(ec);
        }

        StreamedResponse response;
        response.head = stream->head();
        response.body = std::move(stream);
        return response;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
}

std::error_code CurlHttpClient::to_error_code(int code) noexcept {
    switch (static_cast<CURLcode>(code)) {
        case CURLE_OK:
            return {};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlHttpClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHttpClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace splitdl::core
