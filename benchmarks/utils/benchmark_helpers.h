/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_FILE_DELIVERY_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FILE_DELIVERY_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::file_delivery::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<uint8_t>;

/**
 * @brief Scratch directory removed on destruction
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::string& tag);
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const std::vector<uint8_t>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path& { return base_dir_; }

private:
    std::filesystem::path base_dir_;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t default_chunk = 25 * MB;
}  // namespace sizes

}  // namespace kcenon::file_delivery::benchmark

#endif  // KCENON_FILE_DELIVERY_BENCHMARKS_BENCHMARK_HELPERS_H
