/**
 * @file checksum.cpp
 * @brief SHA-256 implementation using OpenSSL EVP
 */

#include <kcenon/file_delivery/core/checksum.h>

#include <array>
#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace kcenon::file_delivery {

namespace {

constexpr std::size_t read_buffer_size = 1024 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex_chars[(digest[i] >> 4) & 0x0F];
        out += hex_chars[digest[i] & 0x0F];
    }
    return out;
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "cannot open file for hashing: " + path.string()});
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "SHA-256 context init failed"});
    }

    std::vector<char> buffer(read_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "SHA-256 update failed"});
        }
    }
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "read error while hashing: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return unexpected(error{error_code::internal_error, "SHA-256 finalize failed"});
    }
    return to_hex(digest.data(), length);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr);
    return to_hex(digest.data(), length);
}

}  // namespace kcenon::file_delivery
