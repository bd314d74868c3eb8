// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include <kcenon/file_delivery/core/logging.h>

#include <kcenon/file_delivery/core/json_utils.h>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/file_writer.h>

#include <optional>
#include <sstream>

namespace kcenon::file_delivery {

namespace {

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
        default: return kcenon::logger::log_level::info;
    }
}

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

auto mask_secret(std::string_view secret, std::size_t visible) -> std::string {
    if (secret.size() <= visible) {
        return std::string(secret.size(), '*');
    }
    return std::string(secret.substr(0, visible)) + std::string(secret.size() - visible, '*');
}

// ============================================================================
// delivery_log_context
// ============================================================================

auto delivery_log_context::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    auto add_string = [&](const char* name, const std::string& value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":\"" << json::escape(value) << "\"";
        first = false;
    };
    auto add_number = [&](const char* name, auto value) {
        if (!first) oss << ",";
        oss << "\"" << name << "\":" << value;
        first = false;
    };

    if (!filename.empty()) add_string("filename", filename);
    if (file_size) add_number("size", *file_size);
    if (attempt) add_number("attempt", *attempt);
    if (chunk_index) add_number("chunk_index", *chunk_index);
    if (total_chunks) add_number("total_chunks", *total_chunks);
    if (http_status) add_number("http_status", *http_status);
    if (duration_ms) add_number("duration_ms", *duration_ms);
    if (error_message) add_string("error", *error_message);

    oss << "}";
    return oss.str();
}

// ============================================================================
// delivery_logger
// ============================================================================

delivery_logger::delivery_logger() = default;

delivery_logger::~delivery_logger() {
    shutdown();
}

auto delivery_logger::open(const logger_options& options) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        return {};
    }

    min_level_.store(options.min_level);

    if (options.log_file.empty() && !options.console) {
        return {};
    }

    kcenon::logger::logger_builder builder;
    builder.with_async(options.async)
        .with_min_level(to_logger_level(options.min_level));

    if (!options.log_file.empty()) {
        std::error_code ec;
        if (options.log_file.has_parent_path()) {
            std::filesystem::create_directories(options.log_file.parent_path(), ec);
        }
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create log directory: " + ec.message()});
        }
        builder.add_writer("file", std::make_unique<kcenon::logger::file_writer>(
                                       options.log_file.string()));
    }
    if (options.console) {
        builder.add_writer("console", std::make_unique<kcenon::logger::console_writer>());
    }

    auto built = builder.build();
    if (!built) {
        return unexpected(error{error_code::not_initialized, "failed to build logger backend"});
    }
    logger_ = std::move(built.value());
    return {};
}

void delivery_logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }
}

auto delivery_logger::has_backend() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
}

void delivery_logger::set_level(log_level level) {
    min_level_.store(level);
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_min_level(to_logger_level(level));
    }
}

void delivery_logger::add_secret(std::string secret) {
    if (secret.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.push_back(std::move(secret));
}

void delivery_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

auto delivery_logger::redact(std::string text) const -> std::string {
    for (const auto& secret : secrets_) {
        auto masked = mask_secret(secret);
        std::size_t pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), masked);
            pos += masked.size();
        }
    }
    return text;
}

void delivery_logger::log(log_level level,
                          std::string_view category,
                          std::string_view message,
                          const delivery_log_context* context,
                          const char* file,
                          int line,
                          const char* function) {
    if (!is_enabled(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);

    auto clean = redact(std::string(message));

    std::optional<delivery_log_context> clean_context;
    if (context) {
        clean_context = *context;
        clean_context->filename = redact(clean_context->filename);
        if (clean_context->error_message) {
            clean_context->error_message = redact(*clean_context->error_message);
        }
    }
    const delivery_log_context* forwarded = clean_context ? &*clean_context : nullptr;

    if (callback_) {
        callback_(level, category, clean, forwarded);
    }

    if (!logger_) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << category << "] " << clean;
    if (forwarded) {
        oss << " " << forwarded->to_json();
    }

    if (file && line > 0 && function) {
        logger_->log(to_logger_level(level), oss.str(), file, line, function);
    } else {
        logger_->log(to_logger_level(level), oss.str());
    }
}

void delivery_logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

auto make_null_logger() -> std::shared_ptr<delivery_logger> {
    return std::make_shared<delivery_logger>();
}

}  // namespace kcenon::file_delivery
