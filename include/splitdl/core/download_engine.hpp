// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/core/chunk_planner.hpp>
#include <splitdl/core/chunk_writer.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/core/error.hpp>
#include <splitdl/core/http_client.hpp>
#include <splitdl/core/range_probe.hpp>
#include <splitdl/disk/output_file.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace splitdl::core {

// Overall download state. failed is reachable from every non-terminal state.
enum class DownloadState : std::uint8_t {
    idle,
    probing,
    planning,
    downloading,
    verifying,
    done,
    failed
};

[[nodiscard]] const char* to_string(DownloadState state) noexcept;

// Emitted once per chunk that finished successfully
struct ChunkEvent {
    std::uint32_t index{0};
    std::uint64_t bytes_written{0};
    std::uint32_t completed{0};        // chunks finished so far, this one included
    std::uint32_t chunk_count{0};
};

using ChunkCallback = std::function<void(const ChunkEvent&)>;

// Everything a caller needs to present a finished download
struct DownloadReport {
    std::string url;
    std::string output_path;
    std::uint64_t total_size{0};
    std::uint32_t chunk_count{0};
    std::vector<ChunkOutcome> chunks;
    std::string sha256;
    std::chrono::milliseconds elapsed{0};
};

// Probe -> plan -> one thread per chunk (fetch + write) -> join -> verify.
//
// Single use: run() may be called once. Any failure is fatal to the whole
// download; the first error observed is returned and the partial output file
// is removed unless DownloadConfig::keep_partial is set.
class DownloadEngine {
public:
    explicit DownloadEngine(HttpClient& client, DownloadConfig config = {});

    // Non-copyable, non-movable (atomic members can't be moved)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) = delete;
    DownloadEngine& operator=(DownloadEngine&&) = delete;

    [[nodiscard]] std::expected<DownloadReport, std::error_code>
    run(const std::string& url, const std::string& output_path) noexcept;

    // Set per-chunk completion callback (thread-safe). Invoked from worker threads.
    void callback(ChunkCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }

    // Probe result, once probing has succeeded
    [[nodiscard]] const std::optional<DownloadTarget>& target() const noexcept { return target_; }

private:
    // Spawns the workers and waits for all of them. Returns the first failure.
    [[nodiscard]] std::error_code download_chunks(const std::vector<ChunkRange>& chunks,
                                                  disk::OutputFile& file,
                                                  std::vector<ChunkOutcome>& outcomes) noexcept;

    // Body of one worker: fetch then write
    [[nodiscard]] ChunkOutcome run_chunk(const ChunkRange& range,
                                         disk::OutputFile& file,
                                         std::stop_token abort) noexcept;

    void notify(const ChunkEvent& event) noexcept;

    // Move to failed and discard the partial file
    [[nodiscard]] std::unexpected<std::error_code> fail(std::error_code ec,
                                                        disk::OutputFile* file,
                                                        const std::string& output_path) noexcept;

    HttpClient& client_;
    DownloadConfig config_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    std::optional<DownloadTarget> target_;
    std::atomic<std::uint32_t> completed_{0};
    std::uint32_t planned_count_{0};
    bool output_created_{false};

    ChunkCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access
};

} // namespace splitdl::core
