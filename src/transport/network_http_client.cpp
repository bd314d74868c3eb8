/**
 * @file network_http_client.cpp
 * @brief network_system backed HTTP client
 */

#include <kcenon/file_delivery/transport/network_http_client.h>

#include <kcenon/network/core/http_client.h>

#include <algorithm>
#include <cctype>

namespace kcenon::file_delivery {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_client::impl {
    std::shared_ptr<kcenon::network::core::http_client> client;
    std::chrono::milliseconds timeout;

    explicit impl(std::chrono::milliseconds t)
        : client(std::make_shared<kcenon::network::core::http_client>(t)), timeout(t) {}

    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Response>
    static auto finish(Response&& response, const char* method, const std::string& url)
        -> result<http_response> {
        if (response.is_err()) {
            const auto& message = response.error().message;
            return unexpected{error{classify_failure(message),
                                    std::string(method) + " " + url + " failed: " + message}};
        }
        return convert_response(response.value());
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::get(const std::string& url,
                              const std::map<std::string, std::string>& query,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl::finish(impl_->client->get(url, query, headers), "GET", url);
}

auto network_http_client::post(const std::string& url,
                               const std::string& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl::finish(impl_->client->post(url, body, headers), "POST", url);
}

auto network_http_client::post(const std::string& url,
                               const std::vector<uint8_t>& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
    return impl::finish(impl_->client->post(url, body, headers), "POST", url);
}

auto network_http_client::timeout() const -> std::chrono::milliseconds {
    return impl_->timeout;
}

auto network_http_client::classify_failure(const std::string& message) -> error_code {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("timeout") != std::string::npos ||
        lower.find("timed out") != std::string::npos) {
        return error_code::connection_timeout;
    }
    return error_code::connection_failed;
}

auto network_http_client_factory::create(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::file_delivery
