/**
 * @file instance_lock.h
 * @brief Cross-process single-instance lock backed by a token file
 */

#ifndef KCENON_FILE_DELIVERY_LOCK_INSTANCE_LOCK_H
#define KCENON_FILE_DELIVERY_LOCK_INSTANCE_LOCK_H

#include <kcenon/file_delivery/core/clock.h>
#include <kcenon/file_delivery/core/logging.h>
#include <kcenon/file_delivery/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Identity of the process holding the instance lock
 *
 * Serialized as JSON: {"pid", "hostname", "started_at", "timestamp"}.
 * @c timestamp is the acquisition time in Unix seconds and drives
 * staleness; @c started_at is the same instant in ISO-8601 for humans.
 */
struct lock_token {
    int64_t pid = 0;
    std::string hostname;
    std::string started_at;
    int64_t timestamp = 0;

    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Parse a token; fails with invalid_response on malformed input
     */
    [[nodiscard]] static auto from_json(const std::string& json) -> result<lock_token>;

    [[nodiscard]] auto operator==(const lock_token& other) const -> bool = default;
};

/**
 * @brief Lock configuration
 */
struct instance_lock_config {
    /// Default staleness window (30 minutes)
    static constexpr std::chrono::seconds default_stale_after{30 * 60};

    std::filesystem::path lock_file;
    std::chrono::seconds stale_after = default_stale_after;
};

/**
 * @brief Mutual exclusion between agent processes sharing a base directory
 *
 * The lock is a JSON token file. A token is overridden when it is older
 * than the staleness window, when its owner process no longer exists on
 * this host, or when it cannot be parsed. A fresh token written by another
 * host is always respected.
 *
 * Held locks are released by the destructor and by a process-exit hook.
 *
 * @code
 * instance_lock lock(config, clock, logger);
 * if (auto r = lock.acquire(); !r) {
 *     std::cerr << r.error().message << "\n";
 *     return 1;
 * }
 * @endcode
 */
class instance_lock {
public:
    instance_lock(instance_lock_config config,
                  std::shared_ptr<delivery_clock> clock = nullptr,
                  std::shared_ptr<delivery_logger> logger = nullptr);

    ~instance_lock();

    instance_lock(const instance_lock&) = delete;
    auto operator=(const instance_lock&) -> instance_lock& = delete;
    instance_lock(instance_lock&&) = delete;
    auto operator=(instance_lock&&) -> instance_lock& = delete;

    /**
     * @brief Take the lock
     * @return Success, or lock_conflict naming the current holder,
     *         or lock_io_error when the token cannot be written
     */
    [[nodiscard]] auto acquire() -> result<void>;

    /**
     * @brief Give up the lock
     *
     * The token file is removed only if it still names this process.
     * Releasing a lock that is not held is a no-op.
     */
    auto release() -> result<void>;

    [[nodiscard]] auto is_held() const -> bool { return held_; }

    [[nodiscard]] auto lock_path() const -> const std::filesystem::path& {
        return config_.lock_file;
    }

    /**
     * @brief Token this process writes when it takes the lock
     */
    [[nodiscard]] auto own_token() const -> const lock_token& { return own_token_; }

    /**
     * @brief Read the token currently on disk
     */
    [[nodiscard]] static auto read_token(const std::filesystem::path& path)
        -> result<lock_token>;

    /**
     * @brief Replace a token that acquire() judged overridable
     *
     * The token on disk is first moved aside with a single rename; if what
     * was moved differs from @p judged (raw file content, std::nullopt when
     * it was unreadable) it is put back and the call fails with
     * lock_conflict. The new token is then created exclusively, so of several
     * processes overriding the same stale token exactly one succeeds.
     */
    [[nodiscard]] auto take_over(const std::optional<std::string>& judged) -> result<void>;

    /**
     * @brief Raw content of the token file, std::nullopt when unreadable
     */
    [[nodiscard]] static auto read_raw(const std::filesystem::path& path)
        -> std::optional<std::string>;

private:
    void stamp_own_token();
    auto try_create(const lock_token& token) -> result<bool>;
    [[nodiscard]] auto is_ours(const lock_token& token) const -> bool;

    instance_lock_config config_;
    std::shared_ptr<delivery_clock> clock_;
    std::shared_ptr<delivery_logger> logger_;
    lock_token own_token_;
    bool held_ = false;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_LOCK_INSTANCE_LOCK_H
