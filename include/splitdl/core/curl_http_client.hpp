// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/http_client.hpp>
#include <splitdl/core/config.hpp>
#include <string>

namespace splitdl::core {

// libcurl transport. HEAD uses the easy interface; ranged GETs run on a
// private multi handle so the body can be pulled block by block.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient() = default;
    explicit CurlHttpClient(const DownloadConfig& config);

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept override;

    [[nodiscard]] std::expected<StreamedResponse, std::error_code>
    get_range(const std::string& url,
              std::uint64_t first,
              std::uint64_t last,
              std::stop_token stop) noexcept override;

    // CURLcode -> DownloadErrc
    [[nodiscard]] static std::error_code to_error_code(int code) noexcept;

    // Global initialization (call once at startup, before any thread starts)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    long connect_timeout_sec_{CONNECTION_TIMEOUT_SEC};
    bool follow_redirects_{FOLLOW_REDIRECTS};
    bool verify_tls_{true};
    std::string user_agent_{DEFAULT_USER_AGENT};
};

} // namespace splitdl::core
