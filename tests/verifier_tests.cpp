// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <shelf/core/verifier.hpp>
#include <shelf/disk/error.hpp>
#include "support/temp_dir.hpp"
#include <cctype>

using namespace shelf::core;
using shelf::test::TempDir;
using shelf::test::write_file;

namespace {

constexpr const char* ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* ABC_SHA1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
constexpr const char* ABC_MD5 = "900150983cd24fb0d6963f7d28e17f72";
constexpr const char* EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

} // namespace

TEST_CASE("compute_digest", "[verify]") {
    TempDir dir;
    auto path = dir.file("abc.txt");
    write_file(path, "abc");

    SECTION("Known vectors") {
        CHECK(compute_digest(path, "sha256") == std::string(ABC_SHA256));
        CHECK(compute_digest(path, "SHA1") == std::string(ABC_SHA1));
        CHECK(compute_digest(path, "md5") == std::string(ABC_MD5));
    }

    SECTION("Empty file") {
        auto empty = dir.file("empty.bin");
        write_file(empty, "");
        CHECK(compute_digest(empty, "sha256") == std::string(EMPTY_SHA256));
    }

    SECTION("Unsupported algorithm") {
        auto digest = compute_digest(path, "crc32");
        REQUIRE_FALSE(digest.has_value());
        CHECK(digest.error() == DownloadErrc::unsupported_checksum);
    }

    SECTION("Missing file") {
        auto digest = compute_digest(dir.file("nope"), "sha256");
        REQUIRE_FALSE(digest.has_value());
        CHECK(digest.error() == shelf::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("verify_file", "[verify]") {
    TempDir dir;
    auto path = dir.file("model.bin");
    write_file(path, "abc");

    SECTION("Nothing to check") {
        CHECK_FALSE(verify_file(path, std::nullopt, std::nullopt));
    }

    SECTION("Size") {
        CHECK_FALSE(verify_file(path, 3, std::nullopt));
        CHECK(verify_file(path, 4, std::nullopt) == DownloadErrc::size_mismatch);
    }

    SECTION("Checksum, hex case does not matter") {
        CHECK_FALSE(verify_file(path, 3, Checksum{"sha256", ABC_SHA256}));

        std::string upper(ABC_SHA256);
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        CHECK_FALSE(verify_file(path, std::nullopt, Checksum{"SHA256", upper}));
    }

    SECTION("Checksum mismatch") {
        CHECK(verify_file(path, 3, Checksum{"sha256", EMPTY_SHA256}) == DownloadErrc::checksum_mismatch);
    }

    SECTION("Missing file") {
        CHECK(verify_file(dir.file("gone.bin"), 3, std::nullopt) == shelf::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("is_supported_algorithm", "[verify]") {
    CHECK(is_supported_algorithm("sha256"));
    CHECK(is_supported_algorithm("SHA512"));
    CHECK(is_supported_algorithm("md5"));
    CHECK_FALSE(is_supported_algorithm("crc32"));
    CHECK_FALSE(is_supported_algorithm(""));
}
