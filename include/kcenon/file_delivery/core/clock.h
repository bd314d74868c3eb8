/**
 * @file clock.h
 * @brief Time source abstraction for waits, backoff and timestamps
 */

#ifndef KCENON_FILE_DELIVERY_CORE_CLOCK_H
#define KCENON_FILE_DELIVERY_CORE_CLOCK_H

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Clock used by every blocking wait in the agent
 *
 * Wake-up polling, batch pacing and retry backoff all sleep through this
 * interface so that tests can substitute a clock which advances instantly.
 */
class delivery_clock {
public:
    virtual ~delivery_clock() = default;

    /**
     * @brief Wall-clock time (lock tokens, report timestamps)
     */
    [[nodiscard]] virtual auto system_now() const -> std::chrono::system_clock::time_point = 0;

    /**
     * @brief Monotonic time (elapsed durations)
     */
    [[nodiscard]] virtual auto steady_now() const -> std::chrono::steady_clock::time_point = 0;

    /**
     * @brief Block the caller for the given duration
     */
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief delivery_clock backed by std::chrono and std::this_thread
 */
class system_delivery_clock final : public delivery_clock {
public:
    [[nodiscard]] auto system_now() const -> std::chrono::system_clock::time_point override;
    [[nodiscard]] auto steady_now() const -> std::chrono::steady_clock::time_point override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

/**
 * @brief Create the default system clock
 */
[[nodiscard]] auto make_system_clock() -> std::shared_ptr<delivery_clock>;

/**
 * @brief Format a time point as ISO-8601 UTC ("2025-01-31T12:00:00Z")
 */
[[nodiscard]] auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Format a time point in local time with a strftime pattern
 */
[[nodiscard]] auto format_local(std::chrono::system_clock::time_point tp,
                                const char* pattern) -> std::string;

/**
 * @brief Seconds since the Unix epoch
 */
[[nodiscard]] auto to_unix_seconds(std::chrono::system_clock::time_point tp) -> int64_t;

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_CLOCK_H
