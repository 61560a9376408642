// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <shelf/disk/file_writer.hpp>
#include "support/temp_dir.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/resource.h>

using namespace shelf::disk;
using shelf::test::TempDir;
using shelf::test::read_file;
using shelf::test::write_file;

namespace {

// Caps the size of files this process may write; writes past it fail with EFBIG
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        ::getrlimit(RLIMIT_FSIZE, &previous_);
        rlimit limit = previous_;
        limit.rlim_cur = bytes;
        active_ = ::setrlimit(RLIMIT_FSIZE, &limit) == 0;
    }

    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &previous_);
        std::signal(SIGXFSZ, previous_handler_);
    }

    FileSizeLimit(const FileSizeLimit&) = delete;
    FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    rlimit previous_{};
    void (*previous_handler_)(int){SIG_DFL};
    bool active_{false};
};

} // namespace

TEST_CASE("FileWriter open and append", "[disk]") {
    TempDir dir;
    auto path = dir.file("part.bin");

    SECTION("New file starts at zero") {
        FileWriter writer;
        auto offset = writer.open(path, 100);
        REQUIRE(offset.has_value());
        CHECK(*offset == 0);
        CHECK_FALSE(writer.existed());

        REQUIRE_FALSE(writer.append("hello", 5));
        REQUIRE_FALSE(writer.append(" world", 6));
        REQUIRE_FALSE(writer.sync());
        CHECK(writer.size() == 11);
        writer.close();

        CHECK(read_file(path) == "hello world");
    }

    SECTION("Bytes past the offset are dropped") {
        write_file(path, "0123456789garbage");

        FileWriter writer;
        auto offset = writer.open(path, 10);
        REQUIRE(offset.has_value());
        CHECK(*offset == 10);
        CHECK(writer.existed());

        REQUIRE_FALSE(writer.append("AB", 2));
        writer.close();
        CHECK(read_file(path) == "0123456789AB");
    }

    SECTION("Shorter file resumes at its length") {
        write_file(path, "01234");

        FileWriter writer;
        auto offset = writer.open(path, 10);
        REQUIRE(offset.has_value());
        CHECK(*offset == 5);
    }

    SECTION("Truncate") {
        FileWriter writer;
        REQUIRE(writer.open(path, 0).has_value());
        REQUIRE_FALSE(writer.append("abcdef", 6));
        REQUIRE_FALSE(writer.truncate(0));
        REQUIRE_FALSE(writer.append("xy", 2));
        writer.close();
        CHECK(read_file(path) == "xy");
    }

    SECTION("Missing directory") {
        FileWriter writer;
        auto offset = writer.open(dir.file("missing/part.bin"), 0);
        REQUIRE_FALSE(offset.has_value());
        CHECK(offset.error() == DiskErrc::file_not_found);
    }

    SECTION("Closed writer rejects appends") {
        FileWriter writer;
        CHECK(writer.append("x", 1) == DiskErrc::handle_invalid);
        CHECK(writer.sync() == DiskErrc::handle_invalid);
    }
}

TEST_CASE("A failed append leaves the earlier bytes intact", "[disk]") {
    TempDir dir;
    auto path = dir.file("full.bin");
    std::string first(3000, 'a');
    std::string second(2000, 'b');

    FileWriter writer;
    REQUIRE(writer.open(path, 0).has_value());
    REQUIRE_FALSE(writer.append(first.data(), first.size()));

    std::error_code ec;
    {
        // Room for part of the second append only
        FileSizeLimit limit(4096);
        REQUIRE(limit.active());
        ec = writer.append(second.data(), second.size());
    }

    CHECK(ec == DiskErrc::disk_full);
    CHECK(writer.size() == first.size());
    auto on_disk = file_size(path);
    REQUIRE(on_disk.has_value());
    CHECK(*on_disk == first.size());

    // The writer continues from the last good length
    REQUIRE_FALSE(writer.append("c", 1));
    writer.close();
    CHECK(read_file(path) == first + "c");
}

TEST_CASE("errno_to_error_code", "[disk]") {
    CHECK(errno_to_error_code(ENOSPC) == DiskErrc::disk_full);
    CHECK(errno_to_error_code(EFBIG) == DiskErrc::disk_full);
    CHECK(errno_to_error_code(ENOENT) == DiskErrc::file_not_found);
    CHECK(errno_to_error_code(EACCES) == DiskErrc::access_denied);
    CHECK(errno_to_error_code(EIO) == std::error_code(EIO, std::system_category()));
}

TEST_CASE("ChunkBuffer", "[disk]") {
    ChunkBuffer buffer(8);
    const char* text = "0123456789";
    auto bytes = reinterpret_cast<const std::byte*>(text);

    CHECK(buffer.empty());
    CHECK(buffer.fill(bytes, 5) == 5);
    CHECK_FALSE(buffer.full());
    CHECK(buffer.fill(bytes + 5, 5) == 3);
    CHECK(buffer.full());
    CHECK(std::memcmp(buffer.data(), text, 8) == 0);

    buffer.reset();
    CHECK(buffer.empty());
    CHECK(buffer.capacity() == 8);
}

TEST_CASE("file_size", "[disk]") {
    TempDir dir;
    write_file(dir.path() / "a.bin", "12345");

    auto size = file_size(dir.file("a.bin"));
    REQUIRE(size.has_value());
    CHECK(*size == 5);

    auto missing = file_size(dir.file("b.bin"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error() == DiskErrc::file_not_found);
}
