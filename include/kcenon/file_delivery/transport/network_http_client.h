/**
 * @file network_http_client.h
 * @brief http_client_interface backed by network_system
 *
 * Wraps kcenon::network::core::http_client and converts its responses and
 * failures into file_delivery types.
 */

#ifndef KCENON_FILE_DELIVERY_TRANSPORT_NETWORK_HTTP_CLIENT_H
#define KCENON_FILE_DELIVERY_TRANSPORT_NETWORK_HTTP_CLIENT_H

#include <kcenon/file_delivery/transport/http_client.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief HTTP client using the network_system HTTP stack
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::vector<uint8_t>& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds;

    /**
     * @brief Map a transport failure message to an error code
     *
     * Messages mentioning a timeout become connection_timeout; everything
     * else is connection_failed.
     */
    [[nodiscard]] static auto classify_failure(const std::string& message) -> error_code;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Factory producing network_http_client instances
 */
class network_http_client_factory : public http_client_factory {
public:
    [[nodiscard]] auto create(std::chrono::milliseconds timeout)
        -> std::shared_ptr<http_client_interface> override;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_TRANSPORT_NETWORK_HTTP_CLIENT_H
