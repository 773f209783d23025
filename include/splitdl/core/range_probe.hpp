// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <splitdl/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace splitdl::core {

// What the probe learned about the remote object. Immutable once probed.
struct DownloadTarget {
    std::string url;
    std::uint64_t total_size{0};
    std::uint32_t chunk_count{0};
    std::uint64_t chunk_size{0};     // floor(total_size / chunk_count)
};

// Checks range support and discovers the object size with one HEAD request
class RangeProbe {
public:
    explicit RangeProbe(HttpClient& client) noexcept : client_(client) {}

    [[nodiscard]] std::expected<DownloadTarget, std::error_code>
    probe(const std::string& url, std::uint32_t chunk_count) noexcept;

    // Accept-Ranges present and not "none"
    [[nodiscard]] static bool accepts_ranges(const HttpResponse& response) noexcept;

    // Content-Length as a non-negative 64-bit integer, or nothing
    [[nodiscard]] static std::optional<std::uint64_t> content_length(const HttpResponse& response) noexcept;

private:
    HttpClient& client_;
};

// Strict decimal parse; rejects signs, blanks inside, and overflow
[[nodiscard]] std::optional<std::uint64_t> parse_length(std::string_view text) noexcept;

} // namespace splitdl::core
