/**
 * @file clock.cpp
 * @brief System clock and time formatting helpers
 */

#include <kcenon/file_delivery/core/clock.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace kcenon::file_delivery {

auto system_delivery_clock::system_now() const -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::now();
}

auto system_delivery_clock::steady_now() const -> std::chrono::steady_clock::time_point {
    return std::chrono::steady_clock::now();
}

void system_delivery_clock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

auto make_system_clock() -> std::shared_ptr<delivery_clock> {
    return std::make_shared<system_delivery_clock>();
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto format_local(std::chrono::system_clock::time_point tp, const char* pattern) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);

    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, pattern);
    return oss.str();
}

auto to_unix_seconds(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace kcenon::file_delivery
