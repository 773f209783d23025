// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/chunk_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <span>

namespace splitdl::core {

ChunkWriter::ChunkWriter(std::size_t block_size)
    : buffer_(std::clamp<std::size_t>(block_size, 1, MAX_READ_BLOCK_SIZE)) {}

ChunkOutcome ChunkWriter::write(ByteStream& body,
                                disk::RegionWriter& region,
                                std::uint32_t index,
                                std::uint64_t declared_length,
                                std::stop_token stop) noexcept {
    ChunkOutcome outcome{index, 0, {}};

    auto fail = [&](std::error_code ec) {
        outcome.bytes_written = region.written();
        outcome.error = ec;
        return outcome;
    };

    while (true) {
        if (stop.stop_requested()) {
            return fail(make_error_code(DownloadErrc::cancelled));
        }

        auto read = body.read(std::span<std::byte>(buffer_));
        if (!read) {
            if (read.error() == DownloadErrc::cancelled) {
                return fail(read.error());
            }
            spdlog::error("chunk {}: read failed after {} bytes: {}",
                          index, region.written(), read.error().message());
            return fail(make_error_code(DownloadErrc::chunk_request_failed));
        }
        if (*read == 0) {
            break;
        }

        auto block = std::span<const std::byte>(buffer_.data(), *read);
        auto written = region.write(block);
        if (!written) {
            if (written.error() == disk::DiskErrc::out_of_region) {
                spdlog::error("chunk {}: body exceeds declared length of {} bytes", index, declared_length);
                return fail(make_error_code(DownloadErrc::size_mismatch));
            }
            spdlog::error("chunk {}: write at offset {} failed: {}",
                          index, region.offset() + region.written(), written.error().message());
            return fail(written.error());
        }
        if (*written != *read) {
            spdlog::error("chunk {}: short write, read {} bytes but wrote {}", index, *read, *written);
            return fail(make_error_code(DownloadErrc::short_write));
        }
    }

    if (region.written() != declared_length) {
        spdlog::error("chunk {}: received {} bytes, expected {}", index, region.written(), declared_length);
        return fail(make_error_code(DownloadErrc::size_mismatch));
    }

    outcome.bytes_written = region.written();
    return outcome;
}

ChunkOutcome ChunkWriter::write(FetchedChunk& chunk,
                                disk::OutputFile& file,
                                std::stop_token stop) noexcept {
    auto region = file.region(chunk.range.start, chunk.range.size());
    return write(*chunk.body, region, chunk.range.index, chunk.declared_length, std::move(stop));
}

} // namespace splitdl::core
