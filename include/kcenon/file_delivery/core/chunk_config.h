/**
 * @file chunk_config.h
 * @brief Chunked-transfer thresholds
 */

#ifndef KCENON_FILE_DELIVERY_CORE_CHUNK_CONFIG_H
#define KCENON_FILE_DELIVERY_CORE_CHUNK_CONFIG_H

#include <kcenon/file_delivery/core/types.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::file_delivery {

/**
 * @brief Decides between whole-file and chunked transfer
 *
 * Files strictly larger than @c threshold are sent in sequential chunks of
 * @c chunk_size bytes; everything else is sent in a single request.
 */
struct chunk_config {
    /// Default chunk size and threshold (25 MiB)
    static constexpr std::size_t default_chunk_size = 25 * 1024 * 1024;

    /// Minimum allowed chunk size (64 KiB)
    static constexpr std::size_t min_chunk_size = 64 * 1024;

    /// Maximum allowed chunk size (512 MiB)
    static constexpr std::size_t max_chunk_size = 512ULL * 1024 * 1024;

    std::size_t chunk_size = default_chunk_size;
    uint64_t threshold = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size), threshold(size) {}

    chunk_config(std::size_t size, uint64_t chunk_threshold)
        : chunk_size(size), threshold(chunk_threshold) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size < min_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        return {};
    }

    [[nodiscard]] auto requires_chunking(uint64_t file_size) const -> bool {
        return file_size > threshold;
    }

    /**
     * @brief Calculate number of chunks for a given file size
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_CHUNK_CONFIG_H
