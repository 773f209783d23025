// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/chunk_planner.hpp>
#include <splitdl/core/error.hpp>
#include <splitdl/core/http_client.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace splitdl::core {

// A validated 206 response whose body has not been read yet
struct FetchedChunk {
    ChunkRange range;
    std::uint64_t declared_length{0};
    std::unique_ptr<ByteStream> body;
};

// Issues the ranged GET for one chunk. No retries: anything but a 206 with
// Content-Length == range.size() is DownloadErrc::chunk_request_failed.
class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& client, std::string url) noexcept
        : client_(client), url_(std::move(url)) {}

    [[nodiscard]] std::expected<FetchedChunk, std::error_code>
    fetch(const ChunkRange& range, std::stop_token stop = {}) noexcept;

private:
    HttpClient& client_;
    std::string url_;
};

} // namespace splitdl::core
