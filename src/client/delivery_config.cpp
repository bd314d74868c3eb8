/**
 * @file delivery_config.cpp
 * @brief Delivery configuration validation and retry delays
 */

#include "kcenon/file_delivery/client/delivery_config.h"

#include <algorithm>
#include <cmath>

namespace kcenon::file_delivery {

auto retry_policy::delay_before(std::size_t attempt) const -> std::chrono::milliseconds {
    if (attempt < 2) {
        return std::chrono::milliseconds(0);
    }

    auto delay = static_cast<double>(initial_delay.count());
    for (std::size_t i = 2; i < attempt; ++i) {
        delay *= backoff_multiplier;
    }
    delay = std::min(delay, static_cast<double>(max_delay.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

auto delivery_config::validate() const -> result<void> {
    if (base_dir.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Base folder is required"}};
    }
    if (remote.base_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Server URL is required"}};
    }
    if (remote.base_url.rfind("http://", 0) != 0 && remote.base_url.rfind("https://", 0) != 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Server URL must start with http:// or https://"}};
    }
    if (remote.api_key.empty()) {
        return unexpected{error{error_code::missing_api_key,
                                "API key is required for uploads"}};
    }
    if (pacing.batch_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Batch size must be at least 1"}};
    }
    if (retry.max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Retry policy needs at least one attempt"}};
    }
    if (wakeup.max_attempts == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Wake-up policy needs at least one attempt"}};
    }
    if (retry.backoff_multiplier < 1.0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Backoff multiplier must be at least 1.0"}};
    }
    if (auto chunks = chunking.validate(); !chunks) {
        return chunks;
    }
    return {};
}

// ============================================================================
// Builder
// ============================================================================

auto delivery_config::builder::with_base_directory(std::filesystem::path dir) -> builder& {
    config_.base_dir = std::move(dir);
    return *this;
}

auto delivery_config::builder::with_server_url(std::string url) -> builder& {
    config_.remote.base_url = std::move(url);
    return *this;
}

auto delivery_config::builder::with_api_key(std::string key) -> builder& {
    config_.remote.api_key = std::move(key);
    return *this;
}

auto delivery_config::builder::with_status_path(std::string path) -> builder& {
    config_.remote.endpoints.status = std::move(path);
    return *this;
}

auto delivery_config::builder::with_batch_size(std::size_t size) -> builder& {
    config_.pacing.batch_size = size;
    return *this;
}

auto delivery_config::builder::with_polling_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.pacing.polling_interval = interval;
    return *this;
}

auto delivery_config::builder::with_max_busy_polls(std::size_t polls) -> builder& {
    config_.pacing.max_busy_polls = polls;
    return *this;
}

auto delivery_config::builder::with_chunk_config(chunk_config config) -> builder& {
    config_.chunking = config;
    return *this;
}

auto delivery_config::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto delivery_config::builder::with_wakeup_policy(wakeup_policy policy) -> builder& {
    config_.wakeup = policy;
    return *this;
}

auto delivery_config::builder::with_lock_stale_after(std::chrono::seconds age) -> builder& {
    config_.lock_stale_after = age;
    return *this;
}

auto delivery_config::builder::with_claim_stale_after(std::chrono::seconds age) -> builder& {
    config_.claim_stale_after = age;
    return *this;
}

auto delivery_config::builder::build() const -> result<delivery_config> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }
    return config_;
}

}  // namespace kcenon::file_delivery
