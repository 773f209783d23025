// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace splitdl::core {

constexpr std::uint32_t DEFAULT_CHUNK_COUNT = 10;
constexpr std::size_t READ_BLOCK_SIZE = 64 * 1024;                  // 64 KB per positional write
constexpr std::size_t MAX_READ_BLOCK_SIZE = 16 * 1024 * 1024;       // upper clamp for DownloadConfig::block_size
constexpr std::size_t HASH_BUFFER_SIZE = 64 * 1024;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

// Poll interval while waiting on a chunk transfer (abort token is checked in between)
constexpr int TRANSFER_POLL_MS = 200;

constexpr const char* DEFAULT_USER_AGENT = "splitdl/0.1";

// Run-time download settings, filled in by the CLI
struct DownloadConfig {
    std::uint32_t chunk_count{DEFAULT_CHUNK_COUNT};
    std::size_t block_size{READ_BLOCK_SIZE};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    bool follow_redirects{FOLLOW_REDIRECTS};
    bool verify_tls{true};
    bool keep_partial{false};             // Leave the output file behind on failure
    std::string user_agent{DEFAULT_USER_AGENT};
};

} // namespace splitdl::core
