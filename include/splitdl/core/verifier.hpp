// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace splitdl::core {

// SHA-256 of a finished file, as lowercase hex. Reporting only; the core
// never compares it against an expected value.
[[nodiscard]] std::expected<std::string, std::error_code>
sha256_file(std::string_view path) noexcept;

// SHA-256 of an in-memory byte sequence, as lowercase hex
[[nodiscard]] std::expected<std::string, std::error_code>
sha256_bytes(std::span<const std::byte> data) noexcept;

} // namespace splitdl::core
