// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace splitdl::core {

// One contiguous byte range of the object. Both ends inclusive, as in HTTP Range.
struct ChunkRange {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start + 1; }

    // "bytes=<start>-<end>"
    [[nodiscard]] std::string header_value() const;

    friend bool operator==(const ChunkRange&, const ChunkRange&) = default;
};

// Split [0, total_size) into disjoint contiguous ranges.
//
// The effective count is min(chunk_count, total_size), so no range is empty.
// Every range but the last is floor(total_size / count) bytes; the last one
// ends at total_size - 1 and absorbs the remainder. A zero-byte object yields
// no ranges. chunk_count == 0 is rejected.
[[nodiscard]] std::expected<std::vector<ChunkRange>, std::error_code>
plan_chunks(std::uint64_t total_size, std::uint32_t chunk_count) noexcept;

} // namespace splitdl::core
