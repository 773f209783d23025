// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/core/verifier.hpp>
#include <splitdl/disk/error.hpp>
#include "fake_http.hpp"

using namespace splitdl::core;
using splitdl::test::TempPath;
using splitdl::test::make_content;
using splitdl::test::to_bytes;

namespace {

constexpr const char* SHA256_EMPTY = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

void write_file(const std::filesystem::path& path, const std::vector<std::byte>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // namespace

TEST_CASE("sha256_bytes - known vectors", "[verifier]") {
    auto empty = sha256_bytes({});
    REQUIRE(empty.has_value());
    CHECK(*empty == SHA256_EMPTY);

    auto abc = sha256_bytes(to_bytes("abc"));
    REQUIRE(abc.has_value());
    CHECK(*abc == SHA256_ABC);
}

TEST_CASE("sha256_file - matches the in-memory digest", "[verifier]") {
    TempPath tmp("verify");

    SECTION("Known vector") {
        write_file(tmp.path(), to_bytes("abc"));
        auto digest = sha256_file(tmp.str());
        REQUIRE(digest.has_value());
        CHECK(*digest == SHA256_ABC);
    }

    SECTION("Empty file") {
        write_file(tmp.path(), {});
        auto digest = sha256_file(tmp.str());
        REQUIRE(digest.has_value());
        CHECK(*digest == SHA256_EMPTY);
    }

    SECTION("Larger than one hash buffer") {
        auto data = make_content(HASH_BUFFER_SIZE * 3 + 17);
        write_file(tmp.path(), data);
        auto from_file = sha256_file(tmp.str());
        auto from_memory = sha256_bytes(data);
        REQUIRE(from_file.has_value());
        REQUIRE(from_memory.has_value());
        CHECK(*from_file == *from_memory);
        CHECK(from_file->size() == 64);
    }
}

TEST_CASE("sha256_file - missing file", "[verifier]") {
    TempPath tmp("verify_missing");
    auto digest = sha256_file(tmp.str());
    REQUIRE_FALSE(digest.has_value());
    CHECK(digest.error() == splitdl::disk::DiskErrc::file_not_found);
}
