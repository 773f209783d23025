// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/chunk_fetcher.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/core/error.hpp>
#include <splitdl/core/http_client.hpp>
#include <splitdl/disk/output_file.hpp>
#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <system_error>
#include <vector>

namespace splitdl::core {

// Result of one chunk task, handed to the coordinator's join barrier
struct ChunkOutcome {
    std::uint32_t index{0};
    std::uint64_t bytes_written{0};
    std::error_code error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
};

// Drains a chunk body into its region of the output file, one bounded block
// at a time.
class ChunkWriter {
public:
    // block_size is clamped to [1, MAX_READ_BLOCK_SIZE]
    explicit ChunkWriter(std::size_t block_size = READ_BLOCK_SIZE);

    // Per block: written must equal read (else short_write). At end of
    // stream: total written must equal declared_length (else size_mismatch).
    [[nodiscard]] ChunkOutcome write(ByteStream& body,
                                     disk::RegionWriter& region,
                                     std::uint32_t index,
                                     std::uint64_t declared_length,
                                     std::stop_token stop = {}) noexcept;

    // Writes a fetched chunk to its own span of file
    [[nodiscard]] ChunkOutcome write(FetchedChunk& chunk,
                                     disk::OutputFile& file,
                                     std::stop_token stop = {}) noexcept;

    [[nodiscard]] std::size_t block_size() const noexcept { return buffer_.size(); }

private:
    std::vector<std::byte> buffer_;
};

} // namespace splitdl::core
