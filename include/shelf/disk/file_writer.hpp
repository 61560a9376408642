// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <shelf/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::disk {

// Append-only writer for one partial download.
// A failed append is rolled back so the bytes already on disk stay intact.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Open (creating if needed) and cut the file at `offset`.
    // Returns the offset writing continues from, which is smaller when the
    // file on disk is shorter than requested.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    open(std::string_view path, std::uint64_t offset) noexcept;

    // Append at the end of the file (all or nothing)
    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;

    // Cut the file to `length` bytes and continue appending from there
    [[nodiscard]] std::error_code truncate(std::uint64_t length) noexcept;

    // Flush file data to stable storage
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool existed() const noexcept { return existed_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t size_{0};
    bool existed_{false};
    std::string path_;
};

// Fixed-capacity staging buffer; a full buffer is one chunk
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t capacity);

    [[nodiscard]] const std::byte* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    // Copy as much of `data` as fits; returns the number of bytes taken
    std::size_t fill(const std::byte* data, std::size_t size) noexcept;

    void reset() noexcept { size_ = 0; }

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

// Length of a regular file, file_not_found when it does not exist
[[nodiscard]] std::expected<std::uint64_t, std::error_code> file_size(std::string_view path) noexcept;

// errno to error_code, DiskErrc where a specific code exists
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace shelf::disk
