/**
 * @file config_loader.cpp
 * @brief Configuration file parsing and override merging
 */

#include "kcenon/file_delivery/config/config_loader.h"

#include "kcenon/file_delivery/core/json_utils.h"

#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string_view>

namespace kcenon::file_delivery {

namespace {

constexpr uint64_t bytes_per_mb = 1024ULL * 1024ULL;

// First spelling present wins.
auto find_key(const std::string& text, std::initializer_list<std::string_view> keys)
    -> std::optional<std::string_view> {
    for (auto key : keys) {
        if (json::find_raw(text, key)) {
            return key;
        }
    }
    return std::nullopt;
}

auto read_string(const std::string& text, std::initializer_list<std::string_view> keys)
    -> std::optional<std::string> {
    auto key = find_key(text, keys);
    if (!key) {
        return std::nullopt;
    }
    return json::get_string(text, *key);
}

auto read_count(const std::string& text, std::initializer_list<std::string_view> keys)
    -> result<std::optional<int64_t>> {
    auto key = find_key(text, keys);
    if (!key) {
        return std::optional<int64_t>{};
    }
    auto value = json::get_int(text, *key);
    if (!value || *value < 0) {
        return unexpected{error{error_code::config_parse_error,
                                "'" + std::string(*key) +
                                    "' must be a non-negative integer"}};
    }
    return std::optional<int64_t>{*value};
}

}  // namespace

auto config_loader::load_file(const std::filesystem::path& path) -> result<config_overrides> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "Config file not found: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
                                "Cannot open config file: " + path.string()}};
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto parsed = parse(content.str());
    if (!parsed) {
        return unexpected{error{parsed.error().code,
                                path.string() + ": " + parsed.error().message}};
    }
    return parsed;
}

auto config_loader::parse(const std::string& text) -> result<config_overrides> {
    if (!json::looks_like_object(text)) {
        return unexpected{error{error_code::config_parse_error,
                                "Invalid JSON: expected a single object"}};
    }

    config_overrides overrides;

    overrides.url = read_string(text, {"url"});
    overrides.api_key = read_string(text, {"key", "apiKey", "api_key"});
    overrides.status_path = read_string(text, {"statusPath", "status_path"});
    if (auto folder = read_string(text, {"folder"})) {
        overrides.folder = std::filesystem::path(*folder);
    }

    auto batch = read_count(text, {"batchSize", "batch_size"});
    if (!batch) {
        return unexpected{batch.error()};
    }
    if (batch.value()) {
        overrides.batch_size = static_cast<std::size_t>(*batch.value());
    }

    auto polling = read_count(text, {"pollingInterval", "polling_interval"});
    if (!polling) {
        return unexpected{polling.error()};
    }
    if (polling.value()) {
        overrides.polling_interval = std::chrono::seconds(*polling.value());
    }

    auto threshold = read_count(text, {"chunkThresholdMb", "chunk_threshold_mb"});
    if (!threshold) {
        return unexpected{threshold.error()};
    }
    if (threshold.value()) {
        overrides.chunk_threshold_mb = static_cast<uint64_t>(*threshold.value());
    }

    auto retries = read_count(text, {"maxRetries", "max_retries"});
    if (!retries) {
        return unexpected{retries.error()};
    }
    if (retries.value()) {
        overrides.max_retries = static_cast<std::size_t>(*retries.value());
    }

    return overrides;
}

auto config_loader::merge(const config_overrides& file, const config_overrides& cli)
    -> config_overrides {
    config_overrides merged = file;
    if (cli.url) merged.url = cli.url;
    if (cli.api_key) merged.api_key = cli.api_key;
    if (cli.folder) merged.folder = cli.folder;
    if (cli.status_path) merged.status_path = cli.status_path;
    if (cli.batch_size) merged.batch_size = cli.batch_size;
    if (cli.polling_interval) merged.polling_interval = cli.polling_interval;
    if (cli.chunk_threshold_mb) merged.chunk_threshold_mb = cli.chunk_threshold_mb;
    if (cli.max_retries) merged.max_retries = cli.max_retries;
    return merged;
}

auto config_loader::to_delivery_config(const config_overrides& overrides)
    -> result<delivery_config> {
    delivery_config::builder builder;

    if (overrides.folder) builder.with_base_directory(*overrides.folder);
    if (overrides.url) builder.with_server_url(*overrides.url);
    if (overrides.api_key) builder.with_api_key(*overrides.api_key);
    if (overrides.status_path) builder.with_status_path(*overrides.status_path);
    if (overrides.batch_size) builder.with_batch_size(*overrides.batch_size);
    if (overrides.polling_interval) {
        builder.with_polling_interval(
            std::chrono::duration_cast<std::chrono::milliseconds>(*overrides.polling_interval));
    }
    if (overrides.chunk_threshold_mb) {
        auto bytes = *overrides.chunk_threshold_mb * bytes_per_mb;
        builder.with_chunk_config(chunk_config(static_cast<std::size_t>(bytes), bytes));
    }
    if (overrides.max_retries) {
        retry_policy policy;
        policy.max_attempts = *overrides.max_retries;
        builder.with_retry_policy(policy);
    }

    return builder.build();
}

}  // namespace kcenon::file_delivery
