/**
 * @file delivery_config.h
 * @brief Configuration of a delivery run
 */

#ifndef KCENON_FILE_DELIVERY_CLIENT_DELIVERY_CONFIG_H
#define KCENON_FILE_DELIVERY_CLIENT_DELIVERY_CONFIG_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "kcenon/file_delivery/core/chunk_config.h"
#include "kcenon/file_delivery/core/types.h"
#include "kcenon/file_delivery/transport/remote_service_client.h"

namespace kcenon::file_delivery {

/**
 * @brief Per-file retry policy
 *
 * @c max_attempts counts every attempt including the first. The delay
 * before attempt n (n >= 2) is initial_delay * backoff_multiplier^(n-2),
 * capped at max_delay.
 */
struct retry_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    [[nodiscard]] auto delay_before(std::size_t attempt) const -> std::chrono::milliseconds;
};

/**
 * @brief Server wake-up polling
 */
struct wakeup_policy {
    std::size_t max_attempts = 30;
    std::chrono::milliseconds interval{5000};
};

/**
 * @brief Batch size and busy polling between batches
 *
 * @c max_busy_polls bounds the wait for a busy server; zero waits forever.
 */
struct pacing_policy {
    std::size_t batch_size = 5;
    std::chrono::milliseconds polling_interval{10000};
    std::size_t max_busy_polls = 360;
};

/**
 * @brief Complete configuration of a delivery run
 */
struct delivery_config {
    std::filesystem::path base_dir;

    remote_client_config remote;
    chunk_config chunking;
    retry_policy retry;
    wakeup_policy wakeup;
    pacing_policy pacing;

    std::chrono::seconds lock_stale_after{30 * 60};

    /// Age after which an abandoned claim is returned to the inbox; 0 disables
    std::chrono::seconds claim_stale_after{60 * 60};

    [[nodiscard]] auto inbox_dir() const -> std::filesystem::path { return base_dir / "inbox"; }
    [[nodiscard]] auto processed_dir() const -> std::filesystem::path {
        return base_dir / "processed";
    }
    [[nodiscard]] auto logs_dir() const -> std::filesystem::path { return base_dir / "logs"; }
    [[nodiscard]] auto lock_file() const -> std::filesystem::path {
        return logs_dir() / "uploader.lock";
    }
    [[nodiscard]] auto log_file() const -> std::filesystem::path {
        return logs_dir() / "uploader.log";
    }

    /**
     * @brief Check the settings an upload run depends on
     */
    [[nodiscard]] auto validate() const -> result<void>;

    class builder;
};

/**
 * @brief Builder for delivery_config
 *
 * @code
 * auto config = delivery_config::builder()
 *     .with_base_directory("/srv/delivery")
 *     .with_server_url("https://ingest.example.com")
 *     .with_api_key(key)
 *     .with_batch_size(5)
 *     .build();
 * @endcode
 */
class delivery_config::builder {
public:
    builder() = default;

    auto with_base_directory(std::filesystem::path dir) -> builder&;
    auto with_server_url(std::string url) -> builder&;
    auto with_api_key(std::string key) -> builder&;
    auto with_status_path(std::string path) -> builder&;
    auto with_batch_size(std::size_t size) -> builder&;
    auto with_polling_interval(std::chrono::milliseconds interval) -> builder&;
    auto with_max_busy_polls(std::size_t polls) -> builder&;
    auto with_chunk_config(chunk_config config) -> builder&;
    auto with_retry_policy(retry_policy policy) -> builder&;
    auto with_wakeup_policy(wakeup_policy policy) -> builder&;
    auto with_lock_stale_after(std::chrono::seconds age) -> builder&;
    auto with_claim_stale_after(std::chrono::seconds age) -> builder&;

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<delivery_config>;

private:
    delivery_config config_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CLIENT_DELIVERY_CONFIG_H
