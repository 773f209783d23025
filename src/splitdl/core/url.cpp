// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <new>

namespace splitdl::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    Url url;
    try {
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto rest = url_str.substr(scheme_end + 3);

        // Fragment never reaches the server
        if (auto hash = rest.find('#'); hash != std::string_view::npos) {
            rest = rest.substr(0, hash);
        }

        auto authority_end = std::min(rest.find('/'), rest.find('?'));
        if (authority_end == std::string_view::npos) {
            authority_end = rest.size();
        }
        auto authority = rest.substr(0, authority_end);
        auto path_and_query = rest.substr(authority_end);

        // Drop userinfo
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        // IPv6 literal [::1]:port
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, close + 1));
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(DownloadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (!url.port_.empty()) {
            std::uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(url.port_.data(), url.port_.data() + url.port_.size(), port);
            if (ec != std::errc{} || ptr != url.port_.data() + url.port_.size() || port == 0) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
        }

        auto query_pos = path_and_query.find('?');
        if (query_pos != std::string_view::npos) {
            url.query_ = std::string(path_and_query.substr(query_pos + 1));
            path_and_query = path_and_query.substr(0, query_pos);
        }
        url.path_ = path_and_query.empty() ? std::string("/") : std::string(path_and_query);

        url.str_ = std::string(url_str);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }

    return url;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

} // namespace splitdl::core
