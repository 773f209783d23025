// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/http_client.hpp>
#include <cctype>
#include <charconv>

namespace splitdl::core {

std::optional<std::string_view> HttpResponse::header(std::string_view name) const noexcept {
    // Keys are stored lowercase; callers pass lowercase names
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

bool parse_header_line(std::string_view line, std::string& name, std::string& value) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }

    auto raw_name = line.substr(0, colon);
    auto raw_value = line.substr(colon + 1);

    while (!raw_value.empty() && (raw_value.front() == ' ' || raw_value.front() == '\t')) {
        raw_value.remove_prefix(1);
    }
    while (!raw_value.empty() && (raw_value.back() == '\r' || raw_value.back() == '\n' ||
                                  raw_value.back() == ' ' || raw_value.back() == '\t')) {
        raw_value.remove_suffix(1);
    }

    name.clear();
    name.reserve(raw_name.size());
    for (char c : raw_name) {
        name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    value.assign(raw_value);
    return true;
}

std::int32_t parse_status_line(std::string_view line) noexcept {
    if (!line.starts_with("HTTP/")) {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return 0;
    }
    auto code = line.substr(space + 1, 3);
    std::int32_t status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec != std::errc{} || ptr != code.data() + code.size()) {
        return 0;
    }
    return status;
}

void append_header_line(HttpResponse& response, std::string_view line) {
    if (line.starts_with("HTTP/")) {
        response.headers.clear();
        response.status_code = parse_status_line(line);
        return;
    }

    std::string name;
    std::string value;
    if (parse_header_line(line, name, value)) {
        response.headers[std::move(name)] = std::move(value);
    }
}

} // namespace splitdl::core
