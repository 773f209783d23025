// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace splitdl::core {

// Status line and headers of an HTTP response. Header names are stored lowercase.
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string, std::less<>> headers;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
};

// Sequential source of response body bytes.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Read up to buffer.size() bytes. Returns 0 at end of stream.
    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    read(std::span<std::byte> buffer) noexcept = 0;
};

// Response to a ranged GET: headers are complete, body is still on the wire
struct StreamedResponse {
    HttpResponse head;
    std::unique_ptr<ByteStream> body;
};

// Transport used by the probe and the chunk fetchers. Implementations must
// allow concurrent get_range() calls from several threads.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Headers-only request with compression disabled
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // GET with "Range: bytes=<first>-<last>" (inclusive). The body stream stops
    // early with DownloadErrc::cancelled once stop is requested.
    [[nodiscard]] virtual std::expected<StreamedResponse, std::error_code>
    get_range(const std::string& url,
              std::uint64_t first,
              std::uint64_t last,
              std::stop_token stop) noexcept = 0;
};

// Parse a header line ("Name: value\r\n") into lowercase name and trimmed value.
// Returns false for status lines and the blank terminator.
bool parse_header_line(std::string_view line, std::string& name, std::string& value);

// "HTTP/1.1 206 Partial Content" -> 206. Returns 0 when no code is present.
[[nodiscard]] std::int32_t parse_status_line(std::string_view line) noexcept;

// Feed one raw header line into response. A status line starts a fresh
// header set, so after a redirect or 100 Continue only the final hop remains.
void append_header_line(HttpResponse& response, std::string_view line);

} // namespace splitdl::core
