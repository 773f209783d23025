// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/chunk_planner.hpp>
#include <algorithm>
#include <format>
#include <new>

namespace splitdl::core {

std::string ChunkRange::header_value() const {
    return std::format("bytes={}-{}", start, end);
}

std::expected<std::vector<ChunkRange>, std::error_code>
plan_chunks(std::uint64_t total_size, std::uint32_t chunk_count) noexcept {
    if (chunk_count == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_chunk_count));
    }

    std::vector<ChunkRange> chunks;
    if (total_size == 0) {
        return chunks;
    }

    // Tiny objects: one byte per chunk rather than empty chunks
    auto count = static_cast<std::uint32_t>(std::min<std::uint64_t>(chunk_count, total_size));
    std::uint64_t chunk_size = total_size / count;

    try {
        chunks.reserve(count);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }

    std::uint64_t start = 0;
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint64_t end = (i == count - 1) ? total_size - 1 : start + chunk_size - 1;
        chunks.push_back(ChunkRange{i, start, end});
        start = end + 1;
    }

    return chunks;
}

} // namespace splitdl::core
