// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace splitdl::core {

enum class DownloadErrc {
    success = 0,
    unsupported_server,     // Accept-Ranges missing or "none"
    size_unknown,           // Content-Length missing or not an integer
    chunk_request_failed,   // transport failure or non-206 / wrong length
    short_write,            // positional write wrote less than it read
    size_mismatch,          // chunk body length differs from declared length
    network_error,
    http_error,
    not_found,
    invalid_url,
    invalid_chunk_count,
    invalid_state,
    cancelled,
    checksum_failed,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "splitdl::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::unsupported_server:   return "Server does not accept byte range requests";
            case DownloadErrc::size_unknown:         return "Server did not report a usable Content-Length";
            case DownloadErrc::chunk_request_failed: return "Chunk request failed";
            case DownloadErrc::short_write:          return "Bytes written do not match bytes read";
            case DownloadErrc::size_mismatch:        return "Chunk size does not match declared length";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::http_error:           return "HTTP error status";
            case DownloadErrc::not_found:            return "Resource not found (404)";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_chunk_count:  return "Chunk count must be at least 1";
            case DownloadErrc::invalid_state:        return "Operation not valid in current state";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::checksum_failed:      return "Checksum computation failed";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace splitdl::core

namespace std {

template<>
struct is_error_code_enum<splitdl::core::DownloadErrc> : true_type {};

} // namespace std
