/**
 * @file run_result.h
 * @brief Per-file outcomes and the aggregate result of a delivery run
 */

#ifndef KCENON_FILE_DELIVERY_CLIENT_RUN_RESULT_H
#define KCENON_FILE_DELIVERY_CLIENT_RUN_RESULT_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::file_delivery {

/**
 * @brief What happened to one inbox file
 */
enum class file_outcome_status {
    success,          ///< Uploaded and moved to processed
    already_present,  ///< Server already had it (HTTP 409); moved to processed
    failed,           ///< Not delivered; left in (or returned to) the inbox
    skipped,          ///< Claimed by another process first
};

[[nodiscard]] constexpr auto to_string(file_outcome_status status) -> const char* {
    switch (status) {
        case file_outcome_status::success:
            return "success";
        case file_outcome_status::already_present:
            return "already_present";
        case file_outcome_status::failed:
            return "failed";
        case file_outcome_status::skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

/**
 * @brief How the run as a whole ended
 */
enum class run_outcome {
    completed,
    lock_conflict,
    server_unresponsive,
    host_not_approved,
    inbox_unreadable,
};

[[nodiscard]] constexpr auto to_string(run_outcome outcome) -> const char* {
    switch (outcome) {
        case run_outcome::completed:
            return "completed";
        case run_outcome::lock_conflict:
            return "lock_conflict";
        case run_outcome::server_unresponsive:
            return "server_unresponsive";
        case run_outcome::host_not_approved:
            return "host_not_approved";
        case run_outcome::inbox_unreadable:
            return "inbox_unreadable";
        default:
            return "unknown";
    }
}

/**
 * @brief Orchestrator state machine
 */
enum class run_state {
    idle,
    lock_acquired,
    waking_server,
    scanning,
    claim_pending,
    uploading,
    finalizing,
    reporting,
    done,
    lock_conflict,
    server_unresponsive,
    host_not_approved,
};

[[nodiscard]] constexpr auto to_string(run_state state) -> const char* {
    switch (state) {
        case run_state::idle:
            return "idle";
        case run_state::lock_acquired:
            return "lock_acquired";
        case run_state::waking_server:
            return "waking_server";
        case run_state::scanning:
            return "scanning";
        case run_state::claim_pending:
            return "claim_pending";
        case run_state::uploading:
            return "uploading";
        case run_state::finalizing:
            return "finalizing";
        case run_state::reporting:
            return "reporting";
        case run_state::done:
            return "done";
        case run_state::lock_conflict:
            return "lock_conflict";
        case run_state::server_unresponsive:
            return "server_unresponsive";
        case run_state::host_not_approved:
            return "host_not_approved";
        default:
            return "unknown";
    }
}

/**
 * @brief Result of delivering one file
 */
struct file_outcome {
    std::string name;
    file_outcome_status status = file_outcome_status::failed;
    uint32_t attempts = 0;
    uint64_t size = 0;

    /// Number of chunks sent by the last attempt; 0 for whole-file uploads
    uint64_t chunks = 0;

    std::optional<std::filesystem::path> destination;
    std::string sha256;
    std::string error_message;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto delivered() const -> bool {
        return status == file_outcome_status::success ||
               status == file_outcome_status::already_present;
    }
};

/**
 * @brief Aggregate of one run
 *
 * already_present outcomes count as successful.
 */
struct run_result {
    std::string run_id;
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    run_outcome outcome = run_outcome::completed;
    std::string message;
    std::vector<file_outcome> files;

    /// Claims returned to the inbox by the stale-claim sweep
    std::size_t recovered_claims = 0;

    /// Where the reporter wrote this result, once written
    std::optional<std::filesystem::path> report_path;

    [[nodiscard]] auto total() const -> std::size_t { return files.size(); }

    [[nodiscard]] auto successful() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& file : files) {
            if (file.delivered()) {
                ++count;
            }
        }
        return count;
    }

    [[nodiscard]] auto failed() const -> std::size_t { return count(file_outcome_status::failed); }

    [[nodiscard]] auto skipped() const -> std::size_t {
        return count(file_outcome_status::skipped);
    }

    [[nodiscard]] auto count(file_outcome_status status) const -> std::size_t {
        std::size_t n = 0;
        for (const auto& file : files) {
            if (file.status == status) {
                ++n;
            }
        }
        return n;
    }

    /**
     * @brief Process exit status: 0 only for a completed run without failures
     */
    [[nodiscard]] auto exit_code() const -> int {
        return (outcome == run_outcome::completed && failed() == 0) ? 0 : 1;
    }
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CLIENT_RUN_RESULT_H
