// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/chunk_fetcher.hpp>
#include <splitdl/core/range_probe.hpp>
#include <spdlog/spdlog.h>

namespace splitdl::core {

namespace {

constexpr std::int32_t HTTP_PARTIAL_CONTENT = 206;

} // namespace

std::expected<FetchedChunk, std::error_code>
ChunkFetcher::fetch(const ChunkRange& range, std::stop_token stop) noexcept {
    spdlog::debug("chunk {}: requesting bytes {}-{}", range.index, range.start, range.end);

    auto response = client_.get_range(url_, range.start, range.end, std::move(stop));
    if (!response) {
        if (response.error() == DownloadErrc::cancelled) {
            return std::unexpected(response.error());
        }
        spdlog::error("chunk {}: request failed: {}", range.index, response.error().message());
        return std::unexpected(make_error_code(DownloadErrc::chunk_request_failed));
    }

    const auto& head = response->head;
    if (head.status_code != HTTP_PARTIAL_CONTENT) {
        spdlog::error("chunk {}: expected 206 Partial Content, got {}", range.index, head.status_code);
        return std::unexpected(make_error_code(DownloadErrc::chunk_request_failed));
    }

    auto declared = RangeProbe::content_length(head);
    if (!declared || *declared != range.size()) {
        spdlog::error("chunk {}: Content-Length {} does not match requested span of {} bytes",
                      range.index, head.header("content-length").value_or("<missing>"), range.size());
        return std::unexpected(make_error_code(DownloadErrc::chunk_request_failed));
    }

    if (!response->body) {
        return std::unexpected(make_error_code(DownloadErrc::chunk_request_failed));
    }

    return FetchedChunk{range, *declared, std::move(response->body)};
}

} // namespace splitdl::core
