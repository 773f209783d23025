// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/curl_http_client.hpp>
#include <curl/curl.h>

using namespace splitdl::core;

TEST_CASE("CurlHttpClient::to_error_code", "[http]") {
    CHECK_FALSE(CurlHttpClient::to_error_code(CURLE_OK));
    CHECK(CurlHttpClient::to_error_code(CURLE_URL_MALFORMAT) == DownloadErrc::invalid_url);
    CHECK(CurlHttpClient::to_error_code(CURLE_UNSUPPORTED_PROTOCOL) == DownloadErrc::invalid_url);
    CHECK(CurlHttpClient::to_error_code(CURLE_ABORTED_BY_CALLBACK) == DownloadErrc::cancelled);
    CHECK(CurlHttpClient::to_error_code(CURLE_COULDNT_CONNECT) == DownloadErrc::network_error);
    CHECK(CurlHttpClient::to_error_code(CURLE_OPERATION_TIMEDOUT) == DownloadErrc::network_error);
    CHECK(CurlHttpClient::to_error_code(CURLE_WRITE_ERROR) == DownloadErrc::network_error);
}

TEST_CASE("CurlHttpClient - unreachable host fails without a body", "[http]") {
    CurlHttpClient::global_init();
    {
        DownloadConfig config;
        config.connect_timeout_sec = 2;
        CurlHttpClient client(config);

        // Nothing listens on loopback port 1
        auto head = client.head("http://127.0.0.1:1/data.bin");
        REQUIRE_FALSE(head.has_value());
        CHECK(head.error() == DownloadErrc::network_error);

        auto range = client.get_range("http://127.0.0.1:1/data.bin", 0, 9, {});
        REQUIRE_FALSE(range.has_value());
        CHECK(range.error() == DownloadErrc::network_error);
    }
    CurlHttpClient::global_cleanup();
}
