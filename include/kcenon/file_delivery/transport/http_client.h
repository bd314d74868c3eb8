/**
 * @file http_client.h
 * @brief HTTP client seam used by the remote service client
 */

#ifndef KCENON_FILE_DELIVERY_TRANSPORT_HTTP_CLIENT_H
#define KCENON_FILE_DELIVERY_TRANSPORT_HTTP_CLIENT_H

#include <kcenon/file_delivery/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::file_delivery {

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        auto wanted = lower(key);
        for (const auto& [name, value] : headers) {
            if (lower(name) == wanted) {
                return value;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Abstract HTTP client
 *
 * A returned error means the exchange did not complete (timeout, refused
 * connection, TLS failure); any completed exchange, whatever its status
 * code, is returned as an http_response. Implementations must classify
 * failures as error_code::connection_timeout or error_code::connection_failed.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute GET request
     */
    virtual auto get(const std::string& url,
                     const std::map<std::string, std::string>& query,
                     const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute POST request with string body
     */
    virtual auto post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    /**
     * @brief Execute POST request with binary body
     */
    virtual auto post(const std::string& url,
                      const std::vector<uint8_t>& body,
                      const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief Creates HTTP clients bound to a request timeout
 *
 * The remote service client needs clients with different timeouts for
 * control calls and file transfers.
 */
class http_client_factory {
public:
    virtual ~http_client_factory() = default;

    [[nodiscard]] virtual auto create(std::chrono::milliseconds timeout)
        -> std::shared_ptr<http_client_interface> = 0;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_TRANSPORT_HTTP_CLIENT_H
