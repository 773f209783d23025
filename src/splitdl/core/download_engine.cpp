// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/chunk_fetcher.hpp>
#include <splitdl/core/verifier.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace splitdl::core {

const char* to_string(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::idle:        return "idle";
        case DownloadState::probing:     return "probing";
        case DownloadState::planning:    return "planning";
        case DownloadState::downloading: return "downloading";
        case DownloadState::verifying:   return "verifying";
        case DownloadState::done:        return "done";
        case DownloadState::failed:      return "failed";
    }
    return "unknown";
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(HttpClient& client, DownloadConfig config)
    : client_(client)
    , config_(std::move(config)) {}

std::expected<DownloadReport, std::error_code>
DownloadEngine::run(const std::string& url, const std::string& output_path) noexcept {
    auto expected = DownloadState::idle;
    if (!state_.compare_exchange_strong(expected, DownloadState::probing, std::memory_order_acq_rel)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_state));
    }

    auto start_time = std::chrono::steady_clock::now();

    // 1. Probe: range support and size
    auto probed = RangeProbe(client_).probe(url, config_.chunk_count);
    if (!probed) {
        return fail(probed.error(), nullptr, output_path);
    }
    target_ = std::move(*probed);

    // 2. Plan
    state_.store(DownloadState::planning, std::memory_order_release);
    auto chunks = plan_chunks(target_->total_size, target_->chunk_count);
    if (!chunks) {
        return fail(chunks.error(), nullptr, output_path);
    }
    planned_count_ = static_cast<std::uint32_t>(chunks->size());
    for (const auto& range : *chunks) {
        spdlog::debug("chunk {}: planned {}", range.index, range.header_value());
    }

    // Output exists (truncated) before any chunk starts
    auto file = disk::OutputFile::create(output_path);
    if (!file) {
        spdlog::error("cannot create {}: {}", output_path, file.error().message());
        return fail(file.error(), nullptr, output_path);
    }
    output_created_ = true;

    // 3. Download, one worker per chunk
    state_.store(DownloadState::downloading, std::memory_order_release);
    spdlog::info("downloading {} ({} bytes) in {} chunks to {}",
                 url, target_->total_size, planned_count_, output_path);

    std::vector<ChunkOutcome> outcomes;
    if (auto ec = download_chunks(*chunks, *file, outcomes)) {
        return fail(ec, &*file, output_path);
    }

    // Every outcome is in hand; flush, then close the shared handle
    if (auto ec = file->sync()) {
        spdlog::error("cannot flush {}: {}", output_path, ec.message());
        return fail(ec, &*file, output_path);
    }
    if (auto ec = file->close()) {
        return fail(ec, nullptr, output_path);
    }

    // 4. Verify
    state_.store(DownloadState::verifying, std::memory_order_release);
    auto digest = sha256_file(output_path);
    if (!digest) {
        return fail(digest.error(), nullptr, output_path);
    }

    DownloadReport report;
    try {
        report.url = url;
        report.output_path = output_path;
        report.sha256 = std::move(*digest);
    } catch (const std::bad_alloc&) {
        return fail(make_error_code(std::errc::not_enough_memory), nullptr, output_path);
    }
    report.total_size = target_->total_size;
    report.chunk_count = planned_count_;
    report.chunks = std::move(outcomes);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    state_.store(DownloadState::done, std::memory_order_release);
    spdlog::info("downloaded {} in {} ms, sha256 {}", output_path, report.elapsed.count(), report.sha256);
    return report;
}

std::error_code DownloadEngine::download_chunks(const std::vector<ChunkRange>& chunks,
                                                disk::OutputFile& file,
                                                std::vector<ChunkOutcome>& outcomes) noexcept {
    try {
        outcomes.assign(chunks.size(), ChunkOutcome{});
    } catch (const std::bad_alloc&) {
        return make_error_code(std::errc::not_enough_memory);
    }

    // Raised by the first failing chunk; every other worker stops at its next
    // read or write boundary
    std::stop_source abort;
    std::mutex error_mutex;
    std::error_code first_error;

    auto record_failure = [&](std::error_code ec) {
        std::lock_guard<std::mutex> lock(error_mutex);
        // A cancellation is only a consequence; never let it hide the cause
        if (!first_error || (first_error == DownloadErrc::cancelled && ec != DownloadErrc::cancelled)) {
            first_error = ec;
        }
        abort.request_stop();
    };

    {
        std::vector<std::jthread> workers;
        try {
            workers.reserve(chunks.size());
            for (const auto& range : chunks) {
                workers.emplace_back([&, range] {
                    auto outcome = run_chunk(range, file, abort.get_token());
                    outcomes[range.index] = outcome;
                    if (!outcome.ok()) {
                        record_failure(outcome.error);
                        return;
                    }
                    auto done = completed_.fetch_add(1, std::memory_order_acq_rel) + 1;
                    notify(ChunkEvent{range.index, outcome.bytes_written, done, planned_count_});
                });
            }
        } catch (const std::system_error& e) {
            spdlog::error("cannot start chunk worker: {}", e.what());
            record_failure(e.code());
        } catch (const std::bad_alloc&) {
            record_failure(make_error_code(std::errc::not_enough_memory));
        }
        // Join barrier: jthread destructors join every worker here
    }

    std::lock_guard<std::mutex> lock(error_mutex);
    return first_error;
}

ChunkOutcome DownloadEngine::run_chunk(const ChunkRange& range,
                                       disk::OutputFile& file,
                                       std::stop_token abort) noexcept {
    if (abort.stop_requested()) {
        return ChunkOutcome{range.index, 0, make_error_code(DownloadErrc::cancelled)};
    }

    try {
        ChunkFetcher fetcher(client_, target_->url);
        auto fetched = fetcher.fetch(range, abort);
        if (!fetched) {
            return ChunkOutcome{range.index, 0, fetched.error()};
        }

        ChunkWriter writer(config_.block_size);
        auto outcome = writer.write(*fetched, file, abort);
        if (outcome.ok()) {
            spdlog::debug("chunk {}: wrote {} bytes at offset {}", range.index, outcome.bytes_written, range.start);
        } else if (outcome.error != DownloadErrc::cancelled) {
            spdlog::error("chunk {} failed: {}", range.index, outcome.error.message());
        }
        return outcome;
    } catch (const std::bad_alloc&) {
        return ChunkOutcome{range.index, 0, make_error_code(std::errc::not_enough_memory)};
    } catch (const std::length_error&) {
        return ChunkOutcome{range.index, 0, make_error_code(std::errc::not_enough_memory)};
    }
}

void DownloadEngine::notify(const ChunkEvent& event) noexcept {
    ChunkCallback cb;
    try {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    } catch (const std::bad_alloc&) {
        return;
    }
    if (!cb) {
        return;
    }
    try {
        cb(event);
    } catch (const std::exception& e) {
        spdlog::warn("chunk callback threw: {}", e.what());
    }
}

std::unexpected<std::error_code> DownloadEngine::fail(std::error_code ec,
                                                      disk::OutputFile* file,
                                                      const std::string& output_path) noexcept {
    state_.store(DownloadState::failed, std::memory_order_release);
    spdlog::error("download failed: {}", ec.message());

    if (file) {
        (void)file->close();
    }

    // Only remove what this run created; a probe failure leaves any
    // existing file at output_path alone
    if (!config_.keep_partial && output_created_) {
        std::error_code remove_ec;
        if (std::filesystem::remove(output_path, remove_ec)) {
            spdlog::debug("removed partial file {}", output_path);
        } else if (remove_ec) {
            spdlog::warn("cannot remove partial file {}: {}", output_path, remove_ec.message());
        }
    }

    return std::unexpected(ec);
}

} // namespace splitdl::core
