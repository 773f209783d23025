// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace splitdl::core {

// Parsed http(s) URL. Only the pieces the downloader needs are kept.
class Url {
public:
    // Accepts http:// and https:// URLs with a non-empty host
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    // The URL exactly as given to parse()
    [[nodiscard]] const std::string& full() const noexcept { return str_; }

    // Last path segment, without query or fragment. Empty when the path
    // names a directory (or is empty).
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace splitdl::core
