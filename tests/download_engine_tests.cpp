// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/download_engine.hpp>
#include <splitdl/core/verifier.hpp>
#include <chrono>
#include <limits>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include "fake_http.hpp"

using namespace splitdl::core;
using splitdl::test::FakeHttpServer;
using splitdl::test::TempPath;
using splitdl::test::make_content;
using splitdl::test::read_file;

namespace {

constexpr const char* URL = "http://example.com/archive.tar";
constexpr const char* SHA256_EMPTY = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

DownloadConfig config_with(std::uint32_t chunks, std::size_t block_size = 64) {
    DownloadConfig config;
    config.chunk_count = chunks;
    config.block_size = block_size;
    return config;
}

} // namespace

TEST_CASE("DownloadEngine - reassembles the object losslessly", "[engine]") {
    // Last case: one byte per chunk
    auto shape = GENERATE(std::pair<std::size_t, std::uint32_t>{10'007, 1},
                          std::pair<std::size_t, std::uint32_t>{10'007, 3},
                          std::pair<std::size_t, std::uint32_t>{10'007, 10},
                          std::pair<std::size_t, std::uint32_t>{64, 64});
    const std::size_t size = shape.first;
    const std::uint32_t chunks = shape.second;

    FakeHttpServer server(make_content(size));
    TempPath tmp("engine_ok");
    DownloadEngine engine(server, config_with(chunks));

    auto report = engine.run(URL, tmp.str());
    REQUIRE(report.has_value());
    CHECK(engine.state() == DownloadState::done);

    CHECK(report->url == URL);
    CHECK(report->output_path == tmp.str());
    CHECK(report->total_size == size);
    CHECK(report->chunk_count == chunks);
    CHECK(report->chunks.size() == chunks);
    CHECK(server.head_requests.load() == 1);
    CHECK(server.range_requests.load() == static_cast<int>(chunks));

    std::uint64_t total = 0;
    for (std::size_t i = 0; i < report->chunks.size(); ++i) {
        CHECK(report->chunks[i].ok());
        CHECK(report->chunks[i].index == i);
        total += report->chunks[i].bytes_written;
    }
    CHECK(total == size);

    CHECK(read_file(tmp.path()) == server.content());

    auto expected = sha256_bytes(server.content());
    REQUIRE(expected.has_value());
    CHECK(report->sha256 == *expected);

    REQUIRE(engine.target().has_value());
    CHECK(engine.target()->total_size == size);
}

TEST_CASE("DownloadEngine - chunk count is clamped to the object size", "[engine]") {
    FakeHttpServer server(make_content(3));
    TempPath tmp("engine_clamp");
    DownloadEngine engine(server, config_with(10));

    std::mutex mutex;
    std::vector<std::uint32_t> announced;
    engine.callback([&](const ChunkEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        announced.push_back(event.chunk_count);
    });

    auto report = engine.run(URL, tmp.str());
    REQUIRE(report.has_value());
    CHECK(report->chunk_count == 3);
    CHECK(server.range_requests.load() == 3);
    CHECK(announced == std::vector<std::uint32_t>{3, 3, 3});
    CHECK(read_file(tmp.path()) == server.content());
}

TEST_CASE("DownloadEngine - oversized block size is clamped", "[engine]") {
    FakeHttpServer server(make_content(1000));
    TempPath tmp("engine_big_block");
    DownloadEngine engine(server, config_with(2, std::numeric_limits<std::size_t>::max()));

    auto report = engine.run(URL, tmp.str());
    REQUIRE(report.has_value());
    CHECK(read_file(tmp.path()) == server.content());
}

TEST_CASE("DownloadEngine - zero-byte object", "[engine]") {
    FakeHttpServer server(make_content(0));
    TempPath tmp("engine_empty");
    DownloadEngine engine(server, config_with(10));

    auto report = engine.run(URL, tmp.str());
    REQUIRE(report.has_value());
    CHECK(report->total_size == 0);
    CHECK(report->chunk_count == 0);
    CHECK(report->chunks.empty());
    CHECK(report->sha256 == SHA256_EMPTY);
    CHECK(server.range_requests.load() == 0);

    REQUIRE(std::filesystem::exists(tmp.path()));
    CHECK(std::filesystem::file_size(tmp.path()) == 0);
}

TEST_CASE("DownloadEngine - rejected HEAD issues no range requests", "[engine]") {
    FakeHttpServer server(make_content(500));
    TempPath tmp("engine_head");

    SECTION("No range support") {
        server.accept_ranges = "none";
        DownloadEngine engine(server, config_with(4));
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::unsupported_server);
        CHECK(engine.state() == DownloadState::failed);
        CHECK_FALSE(engine.target().has_value());
    }

    SECTION("Unknown size") {
        server.omit_content_length = true;
        DownloadEngine engine(server, config_with(4));
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::size_unknown);
    }

    CHECK(server.range_requests.load() == 0);
    CHECK_FALSE(std::filesystem::exists(tmp.path()));
}

TEST_CASE("DownloadEngine - failed HEAD leaves an existing file alone", "[engine]") {
    FakeHttpServer server(make_content(500));
    server.accept_ranges.reset();
    TempPath tmp("engine_existing");
    {
        std::ofstream out(tmp.path(), std::ios::binary);
        out << "precious";
    }

    DownloadEngine engine(server, config_with(4));
    auto report = engine.run(URL, tmp.str());
    REQUIRE_FALSE(report.has_value());
    REQUIRE(std::filesystem::exists(tmp.path()));
    CHECK(std::filesystem::file_size(tmp.path()) == 8);
}

TEST_CASE("DownloadEngine - one bad chunk fails the whole download", "[engine]") {
    // 1000 bytes in 4 chunks: chunk 1 starts at byte 250
    FakeHttpServer server(make_content(1000));
    TempPath tmp("engine_bad_chunk");

    SECTION("Short body") {
        server.truncate_range_at = 250;
        DownloadEngine engine(server, config_with(4));
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::size_mismatch);
        CHECK(engine.state() == DownloadState::failed);
        CHECK_FALSE(std::filesystem::exists(tmp.path()));
    }

    SECTION("Server ignores the range") {
        server.range_status = 200;
        DownloadEngine engine(server, config_with(4));
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::chunk_request_failed);
        CHECK_FALSE(std::filesystem::exists(tmp.path()));
    }

    SECTION("Transport failure") {
        server.fail_range_at = 750;
        DownloadEngine engine(server, config_with(4));
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::chunk_request_failed);
        CHECK_FALSE(std::filesystem::exists(tmp.path()));
    }

    SECTION("Partial file kept on request") {
        server.truncate_range_at = 250;
        auto config = config_with(4);
        config.keep_partial = true;
        DownloadEngine engine(server, config);
        auto report = engine.run(URL, tmp.str());
        REQUIRE_FALSE(report.has_value());
        CHECK(report.error() == DownloadErrc::size_mismatch);
        CHECK(std::filesystem::exists(tmp.path()));
    }
}

TEST_CASE("DownloadEngine - first failure stops the other chunks", "[engine]") {
    // 1000 bytes in 4 chunks: chunk 0 never delivers, chunk 2 comes up short
    FakeHttpServer server(make_content(1000));
    server.stall_range_at = 0;
    server.truncate_range_at = 500;
    TempPath tmp("engine_abort");
    DownloadEngine engine(server, config_with(4));

    auto started = std::chrono::steady_clock::now();
    auto report = engine.run(URL, tmp.str());
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(report.has_value());
    CHECK(report.error() == DownloadErrc::size_mismatch);
    CHECK(server.stalled_range_cancelled.load());
    CHECK(elapsed < std::chrono::seconds(5));
    CHECK(engine.state() == DownloadState::failed);
    CHECK_FALSE(std::filesystem::exists(tmp.path()));
}

TEST_CASE("DownloadEngine - per-chunk completion events", "[engine]") {
    FakeHttpServer server(make_content(4096));
    TempPath tmp("engine_events");
    DownloadEngine engine(server, config_with(8));

    // Invoked on worker threads; assertions happen after the join
    std::mutex mutex;
    std::vector<ChunkEvent> events;
    engine.callback([&](const ChunkEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });

    auto report = engine.run(URL, tmp.str());
    REQUIRE(report.has_value());
    REQUIRE(events.size() == 8);

    std::set<std::uint32_t> indices;
    std::set<std::uint32_t> completed;
    for (const auto& event : events) {
        indices.insert(event.index);
        completed.insert(event.completed);
        CHECK(event.chunk_count == 8);
        CHECK(event.bytes_written == 512);
    }
    CHECK(indices.size() == 8);
    CHECK(completed.size() == 8);
    CHECK(*completed.rbegin() == 8);
}

TEST_CASE("DownloadEngine - single use", "[engine]") {
    FakeHttpServer server(make_content(100));
    TempPath tmp("engine_once");
    DownloadEngine engine(server, config_with(2));
    CHECK(engine.state() == DownloadState::idle);

    REQUIRE(engine.run(URL, tmp.str()).has_value());

    auto again = engine.run(URL, tmp.str());
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error() == DownloadErrc::invalid_state);
    CHECK(engine.state() == DownloadState::done);
    CHECK(server.head_requests.load() == 1);
}

TEST_CASE("DownloadEngine - zero chunk count", "[engine]") {
    FakeHttpServer server(make_content(100));
    TempPath tmp("engine_zero");
    DownloadEngine engine(server, config_with(0));

    auto report = engine.run(URL, tmp.str());
    REQUIRE_FALSE(report.has_value());
    CHECK(report.error() == DownloadErrc::invalid_chunk_count);
    CHECK(server.head_requests.load() == 0);
}

TEST_CASE("DownloadState names", "[engine]") {
    CHECK(std::string(to_string(DownloadState::idle)) == "idle");
    CHECK(std::string(to_string(DownloadState::downloading)) == "downloading");
    CHECK(std::string(to_string(DownloadState::failed)) == "failed");
}
