/**
 * @file remote_service_client.cpp
 * @brief Remote upload service requests and response classification
 */

#include <kcenon/file_delivery/transport/remote_service_client.h>

#include <kcenon/file_delivery/core/json_utils.h>
#include <kcenon/file_delivery/core/version.h>
#include <kcenon/file_delivery/lock/process_info.h>
#include <kcenon/file_delivery/transport/multipart.h>

#include <fstream>
#include <sstream>

namespace kcenon::file_delivery {

namespace {

constexpr int http_conflict = 409;
constexpr int http_unauthorized = 401;
constexpr int http_forbidden = 403;
constexpr std::size_t max_error_body = 200;

auto platform_name() -> const char* {
#if defined(__linux__)
    return "Linux";
#elif defined(__APPLE__)
    return "Darwin";
#elif defined(_WIN32)
    return "Windows";
#else
    return "Unknown";
#endif
}

auto read_whole_file(const std::filesystem::path& path) -> result<std::vector<uint8_t>> {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "cannot open " + path.filename().string()});
    }
    auto size = file.tellg();
    if (size < 0) {
        return unexpected(error{error_code::file_read_error,
                                "cannot size " + path.filename().string()});
    }
    std::vector<uint8_t> data(static_cast<std::size_t>(size));
    file.seekg(0, std::ios::beg);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::size_t>(file.gcount()) != data.size()) {
        return unexpected(error{error_code::file_read_error,
                                "short read on " + path.filename().string()});
    }
    return data;
}

auto replace_all(std::string text, const std::string& from, const std::string& to)
    -> std::string {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

}  // namespace

auto make_http_error(const http_response& response, const std::string& what) -> error {
    std::ostringstream oss;
    oss << what << " failed: HTTP " << response.status_code;

    if (response.status_code == http_unauthorized || response.status_code == http_forbidden) {
        oss << " (authentication failed, check the API key)";
    }

    auto body = response.get_body_string();
    if (auto message = json::get_string(body, "error")) {
        oss << ": " << *message;
    } else if (auto message = json::get_string(body, "message")) {
        oss << ": " << *message;
    } else if (!body.empty() && body.size() <= max_error_body) {
        oss << ": " << body;
    }
    return error{error_code::http_error, oss.str(), response.status_code};
}

// ============================================================================
// Construction
// ============================================================================

remote_service_client::remote_service_client(remote_client_config config,
                                             std::shared_ptr<http_client_factory> factory,
                                             std::shared_ptr<delivery_clock> clock,
                                             std::shared_ptr<delivery_logger> logger)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : make_system_clock()),
      logger_(logger ? std::move(logger) : make_null_logger()) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
    ping_client_ = factory->create(config_.ping_timeout);
    control_client_ = factory->create(config_.control_timeout);
    transfer_client_ = factory->create(config_.transfer_timeout);
    logger_->add_secret(config_.api_key);
}

auto remote_service_client::user_agent() -> std::string {
    return std::string(version::product) + "/" + version::to_string() + " (" + platform_name() +
           "; " + process_info::local_hostname() + ")";
}

auto remote_service_client::url_for(const std::string& path) const -> std::string {
    return config_.base_url + path;
}

auto remote_service_client::headers(bool authenticated) const
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> result{
        {"User-Agent", user_agent()},
        {"Accept", "application/json"},
    };
    if (authenticated && has_api_key()) {
        result["X-API-Key"] = config_.api_key;
    }
    return result;
}

auto remote_service_client::require_key(const char* operation) const -> result<void> {
    if (!has_api_key()) {
        return unexpected(error{error_code::missing_api_key,
                                std::string(operation) + " requires an API key"});
    }
    return {};
}

auto remote_service_client::to_upload_ack(const result<http_response>& response,
                                          const std::string& what) const
    -> result<upload_ack> {
    if (!response) {
        return unexpected(response.error());
    }
    const auto& resp = response.value();
    if (resp.status_code == http_conflict) {
        return upload_ack{upload_disposition::already_present, resp.status_code};
    }
    if (!resp.is_success()) {
        return unexpected(make_http_error(resp, what));
    }
    return upload_ack{upload_disposition::accepted, resp.status_code};
}

// ============================================================================
// Control calls
// ============================================================================

auto remote_service_client::ping() -> result<ping_response> {
    auto started = clock_->steady_now();
    auto response = ping_client_->get(url_for(config_.endpoints.ping), {}, headers(true));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_->steady_now() - started);

    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(make_http_error(response.value(), "ping"));
    }

    auto parsed = ping_response::parse(response.value().get_body_string());
    if (!parsed) {
        return parsed;
    }
    parsed.value().response_time = elapsed;

    FD_LOG_DEBUG(logger_, log_category::transport,
                 "Ping: status=" + parsed.value().service_status +
                     " key=" + to_string(parsed.value().key) + " (" +
                     std::to_string(elapsed.count()) + " ms)");
    return parsed;
}

auto remote_service_client::status() -> result<status_response> {
    if (auto key = require_key("status"); !key) {
        return unexpected(key.error());
    }

    auto response = control_client_->get(url_for(config_.endpoints.status), {}, headers(true));
    if (!response) {
        return unexpected(response.error());
    }
    if (!response.value().is_success()) {
        return unexpected(make_http_error(response.value(), "status"));
    }
    return status_response::parse(response.value().get_body_string());
}

// ============================================================================
// Transfers
// ============================================================================

auto remote_service_client::upload_whole(const std::filesystem::path& path,
                                         const std::string& name,
                                         const std::string& sha256) -> result<upload_ack> {
    if (auto key = require_key("upload"); !key) {
        return unexpected(key.error());
    }

    auto data = read_whole_file(path);
    if (!data) {
        return unexpected(data.error());
    }

    multipart_builder form;
    form.add_file("file", name, data.value());

    auto request_headers = headers(true);
    request_headers["Content-Type"] = form.content_type();
    if (!sha256.empty()) {
        request_headers["X-Content-SHA256"] = sha256;
    }

    FD_LOG_DEBUG(logger_, log_category::transport,
                 "POST " + config_.endpoints.upload + " " + name + " (" +
                     std::to_string(data.value().size()) + " bytes)");
    return to_upload_ack(
        transfer_client_->post(url_for(config_.endpoints.upload), form.build(), request_headers),
        "upload of " + name);
}

auto remote_service_client::start_session(const std::string& name,
                                          uint64_t size,
                                          const std::string& sha256) -> result<upload_session> {
    if (auto key = require_key("start session"); !key) {
        return unexpected(key.error());
    }

    // Both spellings of the name field are accepted by different service revisions.
    std::ostringstream body;
    body << "{\"fileName\":\"" << json::escape(name) << "\","
         << "\"filename\":\"" << json::escape(name) << "\","
         << "\"fileSize\":" << size;
    if (!sha256.empty()) {
        body << ",\"sha256\":\"" << sha256 << "\"";
    }
    body << "}";

    auto request_headers = headers(true);
    request_headers["Content-Type"] = "application/json";
    if (!sha256.empty()) {
        request_headers["X-Content-SHA256"] = sha256;
    }

    auto response = control_client_->post(url_for(config_.endpoints.start_session), body.str(),
                                          request_headers);
    if (!response) {
        return unexpected(response.error());
    }
    const auto& resp = response.value();
    if (resp.status_code == http_conflict) {
        return upload_session{"", upload_disposition::already_present};
    }
    if (!resp.is_success()) {
        return unexpected(make_http_error(resp, "start session for " + name));
    }

    auto text = resp.get_body_string();
    auto id = json::get_string(text, "id");
    if (!id) {
        id = json::get_string(text, "uploadId");
    }
    if (!id || id->empty()) {
        return unexpected(error{error_code::invalid_response,
                                "start session for " + name + " returned no session id"});
    }
    return upload_session{*id, upload_disposition::accepted};
}

auto remote_service_client::upload_chunk(const std::string& session_id,
                                         const std::string& name,
                                         const file_chunk& chunk) -> result<upload_ack> {
    if (auto key = require_key("chunk upload"); !key) {
        return unexpected(key.error());
    }

    multipart_builder form;
    form.add_file("chunk", name, chunk.data);
    form.add_field("chunkIndex", std::to_string(chunk.index));
    form.add_field("totalChunks", std::to_string(chunk.total_chunks));

    auto request_headers = headers(true);
    request_headers["Content-Type"] = form.content_type();

    auto path = replace_all(config_.endpoints.chunk_upload, "{id}", session_id);
    return to_upload_ack(
        transfer_client_->post(url_for(path), form.build(), request_headers),
        "chunk " + std::to_string(chunk.index + 1) + "/" +
            std::to_string(chunk.total_chunks) + " of " + name);
}

}  // namespace kcenon::file_delivery
