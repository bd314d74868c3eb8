/**
 * @file remote_service_client.h
 * @brief Timeout-bounded calls to the remote upload service
 */

#ifndef KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_SERVICE_CLIENT_H
#define KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_SERVICE_CLIENT_H

#include <kcenon/file_delivery/core/chunk_splitter.h>
#include <kcenon/file_delivery/core/clock.h>
#include <kcenon/file_delivery/core/logging.h>
#include <kcenon/file_delivery/core/types.h>
#include <kcenon/file_delivery/transport/http_client.h>
#include <kcenon/file_delivery/transport/remote_types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Endpoint paths, relative to the service base URL
 *
 * @c chunk_upload contains an "{id}" placeholder for the session id.
 */
struct remote_endpoints {
    static constexpr const char* current_status_path = "/api/uploader/status";
    static constexpr const char* legacy_status_path = "/api/uploader/batch-status";

    std::string ping = "/api/uploader/ping";
    std::string status = current_status_path;
    std::string upload = "/api/uploader/upload";
    std::string start_session = "/api/uploader/start";
    std::string chunk_upload = "/api/uploader/{id}/upload-chunk";
};

/**
 * @brief Remote client configuration
 */
struct remote_client_config {
    std::string base_url;
    std::string api_key;
    remote_endpoints endpoints;

    std::chrono::milliseconds ping_timeout{15000};
    std::chrono::milliseconds control_timeout{30000};
    std::chrono::milliseconds transfer_timeout{300000};
};

/**
 * @brief Thin request layer over the remote upload service
 *
 * Each call performs exactly one HTTP exchange and never retries.
 * Failures are reported as:
 * - error_code::connection_timeout / error_code::connection_failed when
 *   the exchange did not complete,
 * - error_code::http_error (with error::http_status) for unexpected status codes,
 * - error_code::invalid_response when the body cannot be decoded,
 * - error_code::missing_api_key for authenticated calls without a key.
 *
 * HTTP 409 on any upload call is not an error; it decodes to
 * upload_disposition::already_present.
 */
class remote_service_client {
public:
    remote_service_client(remote_client_config config,
                          std::shared_ptr<http_client_factory> factory,
                          std::shared_ptr<delivery_clock> clock = nullptr,
                          std::shared_ptr<delivery_logger> logger = nullptr);

    /**
     * @brief Ping the service; authenticated when a key is configured
     */
    [[nodiscard]] auto ping() -> result<ping_response>;

    /**
     * @brief Query the remote queue
     */
    [[nodiscard]] auto status() -> result<status_response>;

    /**
     * @brief Upload a file in a single multipart request (field "file")
     * @param path File to read
     * @param name Name announced to the server
     * @param sha256 Hex digest sent as X-Content-SHA256 when non-empty
     */
    [[nodiscard]] auto upload_whole(const std::filesystem::path& path,
                                    const std::string& name,
                                    const std::string& sha256 = {}) -> result<upload_ack>;

    /**
     * @brief Open a chunked upload session
     */
    [[nodiscard]] auto start_session(const std::string& name,
                                     uint64_t size,
                                     const std::string& sha256 = {}) -> result<upload_session>;

    /**
     * @brief Upload one chunk of an open session
     *
     * Multipart fields: "chunk" (bytes), "chunkIndex", "totalChunks".
     */
    [[nodiscard]] auto upload_chunk(const std::string& session_id,
                                    const std::string& name,
                                    const file_chunk& chunk) -> result<upload_ack>;

    [[nodiscard]] auto has_api_key() const -> bool { return !config_.api_key.empty(); }

    [[nodiscard]] auto config() const -> const remote_client_config& { return config_; }

    /**
     * @brief "<product>/<version> (<os>; <host>)"
     */
    [[nodiscard]] static auto user_agent() -> std::string;

private:
    [[nodiscard]] auto url_for(const std::string& path) const -> std::string;
    [[nodiscard]] auto headers(bool authenticated) const -> std::map<std::string, std::string>;
    [[nodiscard]] auto require_key(const char* operation) const -> result<void>;
    [[nodiscard]] auto to_upload_ack(const result<http_response>& response,
                                     const std::string& what) const -> result<upload_ack>;

    remote_client_config config_;
    std::shared_ptr<http_client_interface> ping_client_;
    std::shared_ptr<http_client_interface> control_client_;
    std::shared_ptr<http_client_interface> transfer_client_;
    std::shared_ptr<delivery_clock> clock_;
    std::shared_ptr<delivery_logger> logger_;
};

/**
 * @brief Build the error for a completed exchange with an unexpected status
 */
[[nodiscard]] auto make_http_error(const http_response& response, const std::string& what)
    -> error;

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_TRANSPORT_REMOTE_SERVICE_CLIENT_H
