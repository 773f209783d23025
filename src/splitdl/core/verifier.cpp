// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/core/verifier.hpp>
#include <splitdl/core/config.hpp>
#include <splitdl/disk/error.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <new>
#include <unistd.h>
#include <vector>

namespace splitdl::core {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

// RAII read-only descriptor
struct ReadFd {
    int fd = -1;

    explicit ReadFd(int f) : fd(f) {}
    ~ReadFd() { if (fd >= 0) ::close(fd); }

    ReadFd(const ReadFd&) = delete;
    ReadFd& operator=(const ReadFd&) = delete;
};

std::string to_hex(const unsigned char* digest, unsigned int length) {
    constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0f];
    }
    return out;
}

[[nodiscard]] DigestContext new_sha256() noexcept {
    DigestContext ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

[[nodiscard]] std::expected<std::string, std::error_code> finish(EVP_MD_CTX* ctx) noexcept {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_failed));
    }
    try {
        return to_hex(digest.data(), length);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace

std::expected<std::string, std::error_code>
sha256_file(std::string_view path) noexcept {
    std::vector<unsigned char> buffer;
    std::string path_str;
    try {
        buffer.resize(HASH_BUFFER_SIZE);
        path_str = std::string(path);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }

    ReadFd file(::open(path_str.c_str(), O_RDONLY | O_CLOEXEC));
    if (file.fd < 0) {
        auto ec = disk::errno_to_error_code(errno);
        spdlog::error("cannot open {} for checksum: {}", path_str, ec.message());
        return std::unexpected(ec);
    }

    auto ctx = new_sha256();
    if (!ctx) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_failed));
    }

    while (true) {
        ssize_t n = ::read(file.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        if (n == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(n)) != 1) {
            return std::unexpected(make_error_code(DownloadErrc::checksum_failed));
        }
    }

    return finish(ctx.get());
}

std::expected<std::string, std::error_code>
sha256_bytes(std::span<const std::byte> data) noexcept {
    auto ctx = new_sha256();
    if (!ctx) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_failed));
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return std::unexpected(make_error_code(DownloadErrc::checksum_failed));
    }
    return finish(ctx.get());
}

} // namespace splitdl::core
