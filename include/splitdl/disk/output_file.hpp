// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitdl/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace splitdl::disk {

class RegionWriter;

// Output file opened for positional writes. Writers at disjoint offsets may
// share one instance across threads without locking.
class OutputFile {
public:
    // Create or truncate path for writing
    static std::expected<OutputFile, std::error_code>
    create(std::string_view path) noexcept;

    ~OutputFile();

    // Non-copyable, movable
    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;
    OutputFile(OutputFile&& other) noexcept;
    OutputFile& operator=(OutputFile&& other) noexcept;

    // One pwrite at offset. Returns the count the OS accepted, which may be short.
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write_at(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    // Exclusive view over [offset, offset + length)
    [[nodiscard]] RegionWriter region(std::uint64_t offset, std::uint64_t length) noexcept;

    [[nodiscard]] std::error_code sync() noexcept;

    // Returns the close(2) error, if any
    std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    OutputFile() = default;

    int fd_{-1};
    std::string path_;
};

// A chunk's logical ownership of its byte span in the shared file. Writes
// are sequential from the start of the span and never cross its end.
class RegionWriter {
public:
    RegionWriter(OutputFile& file, std::uint64_t offset, std::uint64_t length) noexcept
        : file_(&file), offset_(offset), length_(length) {}

    // Write at the cursor and advance it by the bytes actually written.
    // Fails with DiskErrc::out_of_region when data would overrun the span.
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::uint64_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::uint64_t length() const noexcept { return length_; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] std::uint64_t remaining() const noexcept { return length_ - written_; }

private:
    OutputFile* file_;
    std::uint64_t offset_;
    std::uint64_t length_;
    std::uint64_t written_{0};
};

} // namespace splitdl::disk
