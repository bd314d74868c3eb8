/**
 * @file chunk_splitter.h
 * @brief Sequential chunk reader for large uploads
 */

#ifndef KCENON_FILE_DELIVERY_CORE_CHUNK_SPLITTER_H
#define KCENON_FILE_DELIVERY_CORE_CHUNK_SPLITTER_H

#include <kcenon/file_delivery/core/chunk_config.h>
#include <kcenon/file_delivery/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::file_delivery {

/**
 * @brief One slice of a file, in upload order
 */
struct file_chunk {
    uint64_t index = 0;
    uint64_t total_chunks = 0;
    uint64_t offset = 0;
    std::vector<uint8_t> data;

    [[nodiscard]] auto is_last() const -> bool { return index + 1 == total_chunks; }
};

/**
 * @brief Splits files into chunks for streaming transfer
 *
 * Only one chunk is held in memory at a time.
 */
class chunk_splitter {
public:
    /**
     * @brief Iterator for streaming chunk access
     */
    class chunk_iterator {
    public:
        [[nodiscard]] auto has_next() const -> bool;

        /**
         * @brief Read the next chunk
         * @return Next chunk or error
         */
        [[nodiscard]] auto next() -> result<file_chunk>;

        [[nodiscard]] auto current_index() const -> uint64_t;
        [[nodiscard]] auto total_chunks() const -> uint64_t;
        [[nodiscard]] auto file_size() const -> uint64_t;

        // Move-only
        chunk_iterator(chunk_iterator&&) noexcept;
        auto operator=(chunk_iterator&&) noexcept -> chunk_iterator&;
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        auto operator=(const chunk_iterator&) -> chunk_iterator& = delete;

    private:
        friend class chunk_splitter;

        chunk_iterator(std::ifstream file,
                       std::size_t chunk_size,
                       uint64_t file_size,
                       uint64_t total_chunks);

        std::ifstream file_;
        std::size_t chunk_size_;
        uint64_t file_size_;
        uint64_t total_chunks_;
        uint64_t current_index_;
    };

    chunk_splitter();

    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Create chunk iterator for a file
     * @param file_path Path to the file to split
     * @return Chunk iterator or error
     */
    [[nodiscard]] auto split(const std::filesystem::path& file_path) -> result<chunk_iterator>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_CHUNK_SPLITTER_H
