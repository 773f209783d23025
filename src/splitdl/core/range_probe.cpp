// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/range_probe.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <new>

namespace splitdl::core {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace

std::optional<std::uint64_t> parse_length(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    // No sign allowed
    if (!std::isdigit(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool RangeProbe::accepts_ranges(const HttpResponse& response) noexcept {
    auto value = response.header("accept-ranges");
    if (!value) {
        return false;
    }
    auto trimmed = trim(*value);
    return !trimmed.empty() && !iequals(trimmed, "none");
}

std::optional<std::uint64_t> RangeProbe::content_length(const HttpResponse& response) noexcept {
    auto value = response.header("content-length");
    if (!value) {
        return std::nullopt;
    }
    return parse_length(*value);
}

std::expected<DownloadTarget, std::error_code>
RangeProbe::probe(const std::string& url, std::uint32_t chunk_count) noexcept {
    if (chunk_count == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_chunk_count));
    }

    auto response = client_.head(url);
    if (!response) {
        return std::unexpected(response.error());
    }

    spdlog::debug("probe {}: status={} accept-ranges={} content-length={}",
                  url, response->status_code,
                  response->header("accept-ranges").value_or("<missing>"),
                  response->header("content-length").value_or("<missing>"));

    if (response->status_code >= 400) {
        return std::unexpected(make_error_code(response->status_code == 404
            ? DownloadErrc::not_found
            : DownloadErrc::http_error));
    }

    if (!accepts_ranges(*response)) {
        spdlog::error("{} does not advertise byte range support", url);
        return std::unexpected(make_error_code(DownloadErrc::unsupported_server));
    }

    auto size = content_length(*response);
    if (!size) {
        spdlog::error("{} did not report a usable Content-Length", url);
        return std::unexpected(make_error_code(DownloadErrc::size_unknown));
    }

    DownloadTarget target;
    try {
        target.url = url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
    target.total_size = *size;
    target.chunk_count = chunk_count;
    target.chunk_size = *size / chunk_count;
    return target;
}

} // namespace splitdl::core
