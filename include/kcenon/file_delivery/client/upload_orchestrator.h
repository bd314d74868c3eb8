/**
 * @file upload_orchestrator.h
 * @brief Drives one delivery run from lock acquisition to the report
 */

#ifndef KCENON_FILE_DELIVERY_CLIENT_UPLOAD_ORCHESTRATOR_H
#define KCENON_FILE_DELIVERY_CLIENT_UPLOAD_ORCHESTRATOR_H

#include "kcenon/file_delivery/client/delivery_config.h"
#include "kcenon/file_delivery/client/run_result.h"
#include "kcenon/file_delivery/core/clock.h"
#include "kcenon/file_delivery/core/logging.h"
#include "kcenon/file_delivery/core/types.h"
#include "kcenon/file_delivery/transport/http_client.h"
#include "kcenon/file_delivery/transport/remote_types.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Progress notification emitted during a run
 */
struct delivery_event {
    enum class kind {
        state_changed,
        wakeup_attempt,
        waiting_for_server,
        batch_started,
        file_started,
        attempt_failed,
        chunk_sent,
        file_finished,
        run_finished,
    };

    kind type = kind::state_changed;
    run_state state = run_state::idle;
    std::string file;

    /// Wake-up attempt, transfer attempt, busy poll or batch number (1-based)
    uint32_t sequence = 0;
    uint32_t limit = 0;

    uint64_t chunk_index = 0;
    uint64_t total_chunks = 0;
    uint64_t bytes = 0;

    std::string message;
    std::optional<file_outcome> outcome;
};

using delivery_event_handler = std::function<void(const delivery_event&)>;

/**
 * @brief Runs the delivery pipeline
 *
 * States:
 * idle -> lock_acquired -> waking_server -> scanning
 *      -> {claim_pending -> uploading -> finalizing}* -> reporting -> done
 *
 * lock_conflict, server_unresponsive and host_not_approved end the run
 * before any file is claimed. Every sleep goes through the clock, so a
 * manual clock makes a run complete instantly.
 *
 * @code
 * auto config = delivery_config::builder()
 *     .with_base_directory(base)
 *     .with_server_url(url)
 *     .with_api_key(key)
 *     .build();
 * if (!config) { ... }
 *
 * upload_orchestrator orchestrator(config.value(),
 *                                  std::make_shared<network_http_client_factory>(),
 *                                  make_system_clock(), logger);
 * auto outcome = orchestrator.run();
 * return outcome ? outcome.value().exit_code() : 1;
 * @endcode
 */
class upload_orchestrator {
public:
    upload_orchestrator(delivery_config config,
                        std::shared_ptr<http_client_factory> factory,
                        std::shared_ptr<delivery_clock> clock = nullptr,
                        std::shared_ptr<delivery_logger> logger = nullptr);

    ~upload_orchestrator();

    upload_orchestrator(const upload_orchestrator&) = delete;
    auto operator=(const upload_orchestrator&) -> upload_orchestrator& = delete;
    upload_orchestrator(upload_orchestrator&&) noexcept;
    auto operator=(upload_orchestrator&&) noexcept -> upload_orchestrator&;

    /**
     * @brief Execute one run
     * @return The run result, or an error when the configuration is invalid.
     *         Run-level failures (lock conflict, unresponsive server, host not
     *         approved) are reported through run_result::outcome.
     */
    [[nodiscard]] auto run() -> result<run_result>;

    void on_event(delivery_event_handler handler);

    [[nodiscard]] auto state() const -> run_state;

    /**
     * @brief Remote state observed by the last ping and status calls
     */
    [[nodiscard]] auto snapshot() const -> const server_snapshot&;

    [[nodiscard]] auto config() const -> const delivery_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CLIENT_UPLOAD_ORCHESTRATOR_H
