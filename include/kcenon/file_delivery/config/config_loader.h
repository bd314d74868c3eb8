/**
 * @file config_loader.h
 * @brief JSON configuration file and command-line override merging
 */

#ifndef KCENON_FILE_DELIVERY_CONFIG_CONFIG_LOADER_H
#define KCENON_FILE_DELIVERY_CONFIG_CONFIG_LOADER_H

#include "kcenon/file_delivery/client/delivery_config.h"
#include "kcenon/file_delivery/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Settings supplied by a config file or the command line
 *
 * Unset fields leave the delivery_config default in place.
 */
struct config_overrides {
    std::optional<std::string> url;
    std::optional<std::string> api_key;
    std::optional<std::filesystem::path> folder;
    std::optional<std::string> status_path;
    std::optional<std::size_t> batch_size;
    std::optional<std::chrono::seconds> polling_interval;
    std::optional<uint64_t> chunk_threshold_mb;
    std::optional<std::size_t> max_retries;
};

/**
 * @brief Reads configuration files and merges them with CLI values
 *
 * Recognized keys (camelCase and snake_case are both accepted):
 * @code
 * {
 *   "url": "https://ingest.example.com",
 *   "key": "api-key",
 *   "folder": "/srv/delivery",
 *   "batchSize": 5,
 *   "pollingInterval": 10,
 *   "chunkThresholdMb": 25,
 *   "maxRetries": 3,
 *   "statusPath": "/api/uploader/status"
 * }
 * @endcode
 */
class config_loader {
public:
    /**
     * @brief Read and parse a configuration file
     * @return error_code::file_not_found if missing,
     *         error_code::config_parse_error if it is not a JSON object or a
     *         value has the wrong type
     */
    [[nodiscard]] static auto load_file(const std::filesystem::path& path)
        -> result<config_overrides>;

    [[nodiscard]] static auto parse(const std::string& text) -> result<config_overrides>;

    /**
     * @brief Combine file and CLI values; a CLI value always wins
     */
    [[nodiscard]] static auto merge(const config_overrides& file, const config_overrides& cli)
        -> config_overrides;

    /**
     * @brief Apply overrides on top of the defaults and validate
     */
    [[nodiscard]] static auto to_delivery_config(const config_overrides& overrides)
        -> result<delivery_config>;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CONFIG_CONFIG_LOADER_H
