// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/disk/file_writer.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <new>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shelf::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:       return make_error_code(DiskErrc::invalid_path);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        default:           return {err, std::system_category()};
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , size_(other.size_)
    , existed_(other.existed_)
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        size_ = other.size_;
        existed_ = other.existed_;
        path_ = std::move(other.path_);
    }
    return *this;
}

std::expected<std::uint64_t, std::error_code>
FileWriter::open(std::string_view path, std::uint64_t offset) noexcept {
    close();

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    struct stat st{};
    existed_ = ::stat(path_.c_str(), &st) == 0;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(errno_to_error_code(errno));
    }

    if (::fstat(fd, &st) != 0) {
        auto ec = errno_to_error_code(errno);
        ::close(fd);
        return std::unexpected(ec);
    }

    // Bytes past the recorded offset were never checkpointed; drop them
    auto on_disk = static_cast<std::uint64_t>(st.st_size);
    auto resume_at = std::min(on_disk, offset);
    if (on_disk != resume_at && ::ftruncate(fd, static_cast<off_t>(resume_at)) != 0) {
        auto ec = errno_to_error_code(errno);
        ::close(fd);
        return std::unexpected(ec);
    }

    if (::lseek(fd, static_cast<off_t>(resume_at), SEEK_SET) < 0) {
        auto ec = errno_to_error_code(errno);
        ::close(fd);
        return std::unexpected(ec);
    }

    fd_ = fd;
    size_ = resume_at;
    return resume_at;
}

std::error_code FileWriter::append(const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t written = 0;

    while (written < size) {
        auto n = ::write(fd_, bytes + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = errno_to_error_code(errno);
            // Keep the file at its last good length
            if (auto rollback = truncate(size_)) {
                return rollback;
            }
            return ec;
        }
        if (n == 0) {
            if (auto rollback = truncate(size_)) {
                return rollback;
            }
            return make_error_code(DiskErrc::short_write);
        }
        written += static_cast<std::size_t>(n);
    }

    size_ += size;
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t length) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
        return make_error_code(DiskErrc::rollback_failed);
    }
    if (::lseek(fd_, static_cast<off_t>(length), SEEK_SET) < 0) {
        return errno_to_error_code(errno);
    }

    size_ = length;
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// ChunkBuffer
//=============================================================================

ChunkBuffer::ChunkBuffer(std::size_t capacity) {
    buffer_.resize(capacity);
}

std::size_t ChunkBuffer::fill(const std::byte* data, std::size_t size) noexcept {
    auto take = std::min(size, buffer_.size() - size_);
    std::memcpy(buffer_.data() + size_, data, take);
    size_ += take;
    return take;
}

//=============================================================================
// Helpers
//=============================================================================

std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept {
    try {
        std::string p(path);
        struct stat st{};
        if (::stat(p.c_str(), &st) != 0) {
            return std::unexpected(errno_to_error_code(errno));
        }
        return static_cast<std::uint64_t>(st.st_size);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace shelf::disk
