/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>

namespace kcenon::file_delivery::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }

    return data;
}

temp_file_manager::temp_file_manager(const std::string& tag)
    : base_dir_(std::filesystem::temp_directory_path() /
                ("file_delivery_bench_" + tag + "_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_file_manager::create_file(const std::string& name, const std::vector<uint8_t>& data)
    -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_file_manager::create_random_file(const std::string& name, std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    return create_file(name, generate_random_data(size, seed));
}

}  // namespace kcenon::file_delivery::benchmark
