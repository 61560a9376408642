// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/core/verifier.hpp>
#include <shelf/core/config.hpp>
#include <shelf/disk/file_writer.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

namespace shelf::core {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

const EVP_MD* digest_for(std::string_view algorithm) noexcept {
    if (iequals(algorithm, "sha256")) return EVP_sha256();
    if (iequals(algorithm, "sha1"))   return EVP_sha1();
    if (iequals(algorithm, "sha512")) return EVP_sha512();
    if (iequals(algorithm, "md5"))    return EVP_md5();
    return nullptr;
}

std::string to_hex(const unsigned char* data, unsigned int size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (unsigned int i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

bool is_supported_algorithm(std::string_view algorithm) noexcept {
    return digest_for(algorithm) != nullptr;
}

std::expected<std::string, std::error_code>
compute_digest(const std::string& path, std::string_view algorithm) {
    const EVP_MD* md = digest_for(algorithm);
    if (!md) {
        return std::unexpected(make_error_code(DownloadErrc::unsupported_checksum));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    std::vector<char> buffer(VERIFY_BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(file.gcount())) != 1) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
    }
    if (file.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return to_hex(hash, hash_len);
}

std::error_code verify_file(const std::string& path,
                            std::optional<std::uint64_t> expected_size,
                            const std::optional<Checksum>& expected_checksum) {
    auto size = disk::file_size(path);
    if (!size) {
        return size.error();
    }

    if (expected_size && *size != *expected_size) {
        spdlog::warn("verify {}: size {} != expected {}", path, *size, *expected_size);
        return make_error_code(DownloadErrc::size_mismatch);
    }

    if (!expected_checksum) {
        return {};
    }

    auto digest = compute_digest(path, expected_checksum->algorithm);
    if (!digest) {
        return digest.error();
    }
    if (!iequals(*digest, expected_checksum->hex)) {
        spdlog::warn("verify {}: {} {} != expected {}", path, expected_checksum->algorithm,
                     *digest, expected_checksum->hex);
        return make_error_code(DownloadErrc::checksum_mismatch);
    }
    return {};
}

} // namespace shelf::core
