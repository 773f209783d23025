// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/chunk_planner.hpp>

using namespace splitdl::core;

namespace {

// Ranges must tile [0, total) with no gap and no overlap
void check_partition(const std::vector<ChunkRange>& chunks, std::uint64_t total) {
    REQUIRE_FALSE(chunks.empty());
    CHECK(chunks.front().start == 0);
    CHECK(chunks.back().end == total - 1);

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        CHECK(chunks[i].index == i);
        CHECK(chunks[i].start <= chunks[i].end);
        if (i > 0) {
            CHECK(chunks[i].start == chunks[i - 1].end + 1);
        }
        sum += chunks[i].size();
    }
    CHECK(sum == total);
}

} // namespace

TEST_CASE("plan_chunks - even split", "[planner]") {
    auto chunks = plan_chunks(100, 4);
    REQUIRE(chunks.has_value());
    REQUIRE(chunks->size() == 4);

    CHECK(chunks->at(0) == ChunkRange{0, 0, 24});
    CHECK(chunks->at(1) == ChunkRange{1, 25, 49});
    CHECK(chunks->at(2) == ChunkRange{2, 50, 74});
    CHECK(chunks->at(3) == ChunkRange{3, 75, 99});
    check_partition(*chunks, 100);
}

TEST_CASE("plan_chunks - last chunk absorbs the remainder", "[planner]") {
    SECTION("103 bytes in 4 chunks") {
        auto chunks = plan_chunks(103, 4);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 4);
        CHECK(chunks->at(0).size() == 25);
        CHECK(chunks->at(2).size() == 25);
        CHECK(chunks->at(3) == ChunkRange{3, 75, 102});
        CHECK(chunks->at(3).size() == 28);
        check_partition(*chunks, 103);
    }

    SECTION("Default chunk count on an odd size") {
        auto chunks = plan_chunks(1'000'003, DEFAULT_CHUNK_COUNT);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == DEFAULT_CHUNK_COUNT);
        CHECK(chunks->front().size() == 100'000);
        CHECK(chunks->back().size() == 100'003);
        check_partition(*chunks, 1'000'003);
    }
}

TEST_CASE("plan_chunks - single chunk covers everything", "[planner]") {
    auto chunks = plan_chunks(4096, 1);
    REQUIRE(chunks.has_value());
    REQUIRE(chunks->size() == 1);
    CHECK(chunks->front() == ChunkRange{0, 0, 4095});
}

TEST_CASE("plan_chunks - more chunks than bytes", "[planner]") {
    SECTION("Clamped to one byte per chunk") {
        auto chunks = plan_chunks(3, 10);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 3);
        for (const auto& range : *chunks) {
            CHECK(range.size() == 1);
        }
        check_partition(*chunks, 3);
    }

    SECTION("Count equal to size") {
        auto chunks = plan_chunks(7, 7);
        REQUIRE(chunks.has_value());
        CHECK(chunks->size() == 7);
        check_partition(*chunks, 7);
    }
}

TEST_CASE("plan_chunks - zero-byte object", "[planner]") {
    auto chunks = plan_chunks(0, 10);
    REQUIRE(chunks.has_value());
    CHECK(chunks->empty());
}

TEST_CASE("plan_chunks - zero chunk count is rejected", "[planner]") {
    auto chunks = plan_chunks(100, 0);
    REQUIRE_FALSE(chunks.has_value());
    CHECK(chunks.error() == DownloadErrc::invalid_chunk_count);
}

TEST_CASE("plan_chunks - large objects", "[planner]") {
    constexpr std::uint64_t five_gb = 5'000'000'000ULL;
    auto chunks = plan_chunks(five_gb, 16);
    REQUIRE(chunks.has_value());
    REQUIRE(chunks->size() == 16);
    check_partition(*chunks, five_gb);
}

TEST_CASE("ChunkRange::header_value", "[planner]") {
    CHECK(ChunkRange{0, 0, 24}.header_value() == "bytes=0-24");
    CHECK(ChunkRange{3, 75, 102}.header_value() == "bytes=75-102");
    CHECK(ChunkRange{0, 0, 0}.size() == 1);
}
