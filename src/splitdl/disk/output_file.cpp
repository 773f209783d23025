// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/disk/output_file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <new>
#include <sys/stat.h>
#include <unistd.h>

namespace splitdl::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// OutputFile
//=============================================================================

std::expected<OutputFile, std::error_code>
OutputFile::create(std::string_view path) noexcept {
    OutputFile file;
    try {
        file.path_ = std::string(path);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(std::errc::not_enough_memory));
    }

    file.fd_ = ::open(file.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return file;
}

OutputFile::~OutputFile() {
    (void)close();
}

OutputFile::OutputFile(OutputFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

OutputFile& OutputFile::operator=(OutputFile&& other) noexcept {
    if (this != &other) {
        (void)close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::size_t, std::error_code>
OutputFile::write_at(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    ssize_t n;
    do {
        n = ::pwrite(fd_, data.data(), data.size(), static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return static_cast<std::size_t>(n);
}

RegionWriter OutputFile::region(std::uint64_t offset, std::uint64_t length) noexcept {
    return RegionWriter(*this, offset, length);
}

std::error_code OutputFile::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::error_code OutputFile::close() noexcept {
    if (fd_ < 0) {
        return {};
    }
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0 ? std::error_code{} : errno_to_error_code(errno);
}

//=============================================================================
// RegionWriter
//=============================================================================

std::expected<std::size_t, std::error_code>
RegionWriter::write(std::span<const std::byte> data) noexcept {
    if (data.size() > remaining()) {
        return std::unexpected(make_error_code(DiskErrc::out_of_region));
    }
    if (data.empty()) {
        return 0;
    }

    auto n = file_->write_at(offset_ + written_, data);
    if (n) {
        written_ += *n;
    }
    return n;
}

} // namespace splitdl::disk
