/**
 * @file remote_types.cpp
 * @brief Decoding of ping and status responses across protocol revisions
 */

#include <kcenon/file_delivery/transport/remote_types.h>

#include <kcenon/file_delivery/core/json_utils.h>

#include <algorithm>
#include <cctype>

namespace kcenon::file_delivery {

namespace {

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

auto parse_key_status(std::string_view text) -> key_status {
    auto lower = to_lower(text);
    if (lower == "valid") return key_status::valid;
    if (lower == "invalid") return key_status::invalid;
    if (lower == "not_provided" || lower == "missing") return key_status::not_provided;
    return key_status::unknown;
}

auto parse_host_approval(std::string_view text) -> std::optional<host_approval> {
    auto lower = to_lower(text);
    if (lower == "approved") return host_approval::approved;
    if (lower == "pending") return host_approval::pending;
    if (lower == "denied" || lower == "rejected") return host_approval::denied;
    return std::nullopt;
}

// ============================================================================
// ping_response
// ============================================================================

auto ping_response::is_running() const -> bool {
    auto lower = to_lower(service_status);
    if (lower == "running") {
        return true;
    }
    // Legacy services answered with a generic health word.
    return revision == protocol_revision::legacy && (lower == "ok" || lower == "online");
}

auto ping_response::parse(const std::string& body) -> result<ping_response> {
    if (!json::looks_like_object(body)) {
        return unexpected(error{error_code::invalid_response, "ping response is not JSON"});
    }

    ping_response ping;
    if (auto status = json::get_string(body, "serviceStatus")) {
        ping.service_status = *status;
        ping.revision = protocol_revision::current;
    } else if (auto legacy = json::get_string(body, "status")) {
        ping.service_status = *legacy;
        ping.revision = protocol_revision::legacy;
    } else {
        return unexpected(error{error_code::invalid_response,
                                "ping response carries no service status"});
    }

    ping.environment = json::get_string(body, "environment").value_or("");
    ping.key_user = json::get_string(body, "keyUser").value_or("");
    ping.server_timestamp = json::get_string(body, "timestamp").value_or("");
    ping.message = json::get_string(body, "message").value_or("");
    if (auto key = json::get_string(body, "keyStatus")) {
        ping.key = parse_key_status(*key);
    }

    if (auto host = json::get_object(body, "hostStatus")) {
        ping.hostname = json::get_string(*host, "hostname").value_or("");
        if (auto approval = json::get_string(*host, "approvalStatus")) {
            ping.approval = parse_host_approval(*approval);
        }
        if (!ping.approval) {
            if (auto approved = json::get_bool(*host, "isApproved")) {
                ping.approval = *approved ? host_approval::approved : host_approval::pending;
            }
        }
    }
    if (!ping.approval) {
        if (auto flat = json::get_string(body, "hostApproval")) {
            ping.approval = parse_host_approval(*flat);
        }
    }

    return ping;
}

// ============================================================================
// status_response
// ============================================================================

auto status_response::parse(const std::string& body) -> result<status_response> {
    if (!json::looks_like_object(body)) {
        return unexpected(error{error_code::invalid_response, "status response is not JSON"});
    }

    status_response status;
    if (auto queue = json::get_object(body, "queue")) {
        status.revision = protocol_revision::legacy;
        status.counts.processing = json::get_int(*queue, "active").value_or(0);
        status.counts.pending = json::get_int(*queue, "waiting").value_or(0);
        status.counts.completed = json::get_int(*queue, "completed").value_or(0);
        status.counts.failed = json::get_int(*queue, "failed").value_or(0);
    } else {
        auto pending = json::get_int(body, "pending");
        auto processing = json::get_int(body, "processing");
        if (!pending && !processing) {
            return unexpected(error{error_code::invalid_response,
                                    "status response carries no queue counts"});
        }
        status.revision = protocol_revision::current;
        status.counts.pending = pending.value_or(0);
        status.counts.processing = processing.value_or(0);
        status.counts.completed = json::get_int(body, "completed").value_or(0);
        status.counts.failed = json::get_int(body, "failed").value_or(0);
    }

    status.busy = json::get_bool(body, "isBusy").value_or(false);
    status.max_concurrent = json::get_int(body, "maxConcurrent");
    return status;
}

}  // namespace kcenon::file_delivery
