/**
 * @file checksum.h
 * @brief SHA-256 digests for delivered files and chunks
 */

#ifndef KCENON_FILE_DELIVERY_CORE_CHECKSUM_H
#define KCENON_FILE_DELIVERY_CORE_CHECKSUM_H

#include <kcenon/file_delivery/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief SHA-256 helpers backed by OpenSSL EVP
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return Lowercase hex digest, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return Lowercase hex digest
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_CHECKSUM_H
