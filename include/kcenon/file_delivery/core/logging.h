// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/file_delivery/core/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::logger {
class logger;
}

namespace kcenon::file_delivery {

/**
 * @brief Log categories for the delivery agent
 */
struct log_category {
    static constexpr std::string_view agent = "delivery.agent";
    static constexpr std::string_view lock = "delivery.lock";
    static constexpr std::string_view claim = "delivery.claim";
    static constexpr std::string_view transport = "delivery.transport";
    static constexpr std::string_view orchestrator = "delivery.orchestrator";
    static constexpr std::string_view report = "delivery.report";
    static constexpr std::string_view config = "delivery.config";
};

/**
 * @brief Log levels for the delivery agent
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Mask a secret, keeping the first @p visible characters
 *
 * "abcd1234efgh" becomes "abcd********". Secrets no longer than
 * @p visible are fully masked.
 */
[[nodiscard]] auto mask_secret(std::string_view secret, std::size_t visible = 4) -> std::string;

/**
 * @brief Structured context attached to a log line
 */
struct delivery_log_context {
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<int> http_status;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    /**
     * @brief Render as a single-line JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Where a delivery_logger writes
 */
struct logger_options {
    /// Append-only log file; no file writer when empty
    std::filesystem::path log_file;

    /// Mirror log lines to the console
    bool console = false;

    log_level min_level = log_level::info;

    bool async = true;
};

/**
 * @brief Per-run logging context
 *
 * One instance is created by the entry point and shared with every
 * component of the run. Without open() the logger has no backend and
 * only forwards entries to the callback, which is how tests observe it.
 * Registered secrets are masked in every message and in the string fields
 * of the context before either reaches the callback or the backend.
 */
class delivery_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view category,
                                            std::string_view message,
                                            const delivery_log_context*)>;

    delivery_logger();
    ~delivery_logger();

    delivery_logger(const delivery_logger&) = delete;
    delivery_logger& operator=(const delivery_logger&) = delete;

    /**
     * @brief Build the logger_system backend with the requested writers
     */
    [[nodiscard]] auto open(const logger_options& options) -> result<void>;

    /**
     * @brief Flush and stop the backend
     */
    void shutdown();

    [[nodiscard]] auto has_backend() const -> bool;

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Register a value that must never appear in log output
     */
    void add_secret(std::string secret);

    void set_callback(log_callback callback);

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const delivery_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    [[nodiscard]] auto redact(std::string text) const -> std::string;

    std::atomic<log_level> min_level_{log_level::info};
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::vector<std::string> secrets_;
    log_callback callback_;
    mutable std::mutex mutex_;
};

/**
 * @brief Logger with no backend, for components constructed without one
 */
[[nodiscard]] auto make_null_logger() -> std::shared_ptr<delivery_logger>;

// Logging macros; the first argument is a pointer or shared_ptr to a delivery_logger
#define FD_LOG(logger, level, category, message) \
    (logger)->log(level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_CTX(logger, level, category, message, context) \
    (logger)->log(level, category, message, &(context), __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_DEBUG(logger, category, message) \
    FD_LOG(logger, kcenon::file_delivery::log_level::debug, category, message)

#define FD_LOG_INFO(logger, category, message) \
    FD_LOG(logger, kcenon::file_delivery::log_level::info, category, message)

#define FD_LOG_WARN(logger, category, message) \
    FD_LOG(logger, kcenon::file_delivery::log_level::warn, category, message)

#define FD_LOG_ERROR(logger, category, message) \
    FD_LOG(logger, kcenon::file_delivery::log_level::error, category, message)

#define FD_LOG_DEBUG_CTX(logger, category, message, ctx) \
    FD_LOG_CTX(logger, kcenon::file_delivery::log_level::debug, category, message, ctx)

#define FD_LOG_INFO_CTX(logger, category, message, ctx) \
    FD_LOG_CTX(logger, kcenon::file_delivery::log_level::info, category, message, ctx)

#define FD_LOG_WARN_CTX(logger, category, message, ctx) \
    FD_LOG_CTX(logger, kcenon::file_delivery::log_level::warn, category, message, ctx)

#define FD_LOG_ERROR_CTX(logger, category, message, ctx) \
    FD_LOG_CTX(logger, kcenon::file_delivery::log_level::error, category, message, ctx)

}  // namespace kcenon::file_delivery
