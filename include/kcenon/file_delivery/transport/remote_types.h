/**
 * @file remote_types.h
 * @brief Decoded responses of the remote upload service
 */

#ifndef KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_TYPES_H
#define KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_TYPES_H

#include <kcenon/file_delivery/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::file_delivery {

/**
 * @brief Server's verdict on the API key
 */
enum class key_status {
    unknown,
    valid,
    invalid,
    not_provided,
};

[[nodiscard]] constexpr auto to_string(key_status status) -> const char* {
    switch (status) {
        case key_status::valid: return "valid";
        case key_status::invalid: return "invalid";
        case key_status::not_provided: return "not_provided";
        case key_status::unknown:
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_key_status(std::string_view text) -> key_status;

/**
 * @brief Whether this host may upload
 */
enum class host_approval {
    approved,
    pending,
    denied,
};

[[nodiscard]] constexpr auto to_string(host_approval approval) -> const char* {
    switch (approval) {
        case host_approval::approved: return "approved";
        case host_approval::pending: return "pending";
        case host_approval::denied: return "denied";
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_host_approval(std::string_view text) -> std::optional<host_approval>;

/**
 * @brief Response schema generation observed on the wire
 *
 * The legacy service reports "status"/"message" on ping and a nested
 * "queue" object on batch-status; the current service reports
 * "serviceStatus", "keyStatus" and "hostStatus" on ping and flat counts
 * on status.
 */
enum class protocol_revision {
    unknown,
    legacy,
    current,
};

[[nodiscard]] constexpr auto to_string(protocol_revision revision) -> const char* {
    switch (revision) {
        case protocol_revision::legacy: return "legacy";
        case protocol_revision::current: return "current";
        case protocol_revision::unknown:
        default: return "unknown";
    }
}

/**
 * @brief Decoded ping response
 *
 * Every field other than the service status is optional on the wire.
 */
struct ping_response {
    std::string service_status;
    std::string environment;
    key_status key = key_status::unknown;
    std::string key_user;
    std::optional<host_approval> approval;
    std::string hostname;
    std::string server_timestamp;
    std::string message;
    protocol_revision revision = protocol_revision::unknown;
    std::chrono::milliseconds response_time{0};

    [[nodiscard]] auto is_running() const -> bool;

    /**
     * @brief Decode a ping body
     * @return invalid_response when the body is not a JSON object or
     *         carries no service status in either revision
     */
    [[nodiscard]] static auto parse(const std::string& body) -> result<ping_response>;
};

/**
 * @brief Remote queue counters
 */
struct queue_counts {
    int64_t pending = 0;
    int64_t processing = 0;
    int64_t completed = 0;
    int64_t failed = 0;
};

/**
 * @brief Decoded status / batch-status response
 */
struct status_response {
    queue_counts counts;
    bool busy = false;
    std::optional<int64_t> max_concurrent;
    protocol_revision revision = protocol_revision::unknown;

    /**
     * @brief Decode a status body
     *
     * Nested "queue" counts map active to processing and waiting to
     * pending. A missing "isBusy" means not busy.
     */
    [[nodiscard]] static auto parse(const std::string& body) -> result<status_response>;
};

/**
 * @brief How the server took an upload
 */
enum class upload_disposition {
    accepted,
    already_present,
};

struct upload_ack {
    upload_disposition disposition = upload_disposition::accepted;
    int http_status = 0;
};

/**
 * @brief Server-side chunked upload session
 */
struct upload_session {
    std::string id;
    upload_disposition disposition = upload_disposition::accepted;
};

/**
 * @brief Last observed remote state
 */
struct server_snapshot {
    std::optional<ping_response> last_ping;
    std::optional<status_response> last_status;

    [[nodiscard]] auto approval() const -> std::optional<host_approval> {
        return last_ping ? last_ping->approval : std::nullopt;
    }

    [[nodiscard]] auto busy() const -> bool {
        return last_status && last_status->busy;
    }
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_TYPES_H
