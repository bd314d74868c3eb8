/**
 * @file instance_lock.cpp
 * @brief Implementation of the single-instance token lock
 */

#include <kcenon/file_delivery/lock/instance_lock.h>

#include <kcenon/file_delivery/core/json_utils.h>
#include <kcenon/file_delivery/lock/process_info.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace kcenon::file_delivery {

namespace {

// ============================================================================
// Process-exit release
// ============================================================================

auto registry_mutex() -> std::mutex& {
    static std::mutex mutex;
    return mutex;
}

auto registry() -> std::vector<instance_lock*>& {
    static std::vector<instance_lock*> locks;
    return locks;
}

void release_all_at_exit() {
    std::vector<instance_lock*> snapshot;
    {
        std::lock_guard<std::mutex> guard(registry_mutex());
        snapshot = registry();
    }
    for (auto* lock : snapshot) {
        (void)lock->release();
    }
}

void register_for_exit(instance_lock* lock) {
    // Construct the registry before atexit so it outlives the handler.
    std::lock_guard<std::mutex> guard(registry_mutex());
    auto& locks = registry();
    static const bool hook_installed = (std::atexit(release_all_at_exit) == 0);
    (void)hook_installed;
    if (std::find(locks.begin(), locks.end(), lock) == locks.end()) {
        locks.push_back(lock);
    }
}

void unregister_for_exit(instance_lock* lock) {
    std::lock_guard<std::mutex> guard(registry_mutex());
    auto& locks = registry();
    locks.erase(std::remove(locks.begin(), locks.end(), lock), locks.end());
}

// ============================================================================
// File helpers
// ============================================================================

auto write_all(int fd, const std::string& data) -> bool {
    std::size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

auto write_file(const std::filesystem::path& path, const std::string& data, int flags)
    -> result<void> {
    int fd = ::open(path.c_str(), flags | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected(error{error_code::lock_io_error,
                                "cannot open " + path.string() + ": " + std::strerror(errno)});
    }
    bool ok = write_all(fd, data) && ::fsync(fd) == 0;
    int saved_errno = errno;
    ::close(fd);
    if (!ok) {
        return unexpected(error{error_code::lock_io_error,
                                "cannot write " + path.string() + ": " +
                                    std::strerror(saved_errno)});
    }
    return {};
}

auto temp_path_for(const std::filesystem::path& lock_file, int64_t pid) -> std::filesystem::path {
    auto tmp = lock_file;
    tmp += "." + std::to_string(pid) + ".tmp";
    return tmp;
}

auto aside_path_for(const std::filesystem::path& lock_file, int64_t pid)
    -> std::filesystem::path {
    auto aside = lock_file;
    aside += "." + std::to_string(pid) + ".stale";
    return aside;
}

auto describe(const lock_token& token) -> std::string {
    std::ostringstream oss;
    oss << "PID " << token.pid;
    if (!token.started_at.empty()) {
        oss << ", started " << token.started_at;
    }
    return oss.str();
}

}  // namespace

// ============================================================================
// lock_token
// ============================================================================

auto lock_token::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"pid\": " << pid << ",\n";
    oss << "  \"hostname\": \"" << json::escape(hostname) << "\",\n";
    oss << "  \"started_at\": \"" << json::escape(started_at) << "\",\n";
    oss << "  \"timestamp\": " << timestamp << "\n";
    oss << "}\n";
    return oss.str();
}

auto lock_token::from_json(const std::string& text) -> result<lock_token> {
    if (!json::looks_like_object(text)) {
        return unexpected(error{error_code::invalid_response, "lock token is not a JSON object"});
    }

    auto pid = json::get_int(text, "pid");
    auto timestamp = json::get_int(text, "timestamp");
    if (!pid || !timestamp) {
        return unexpected(error{error_code::invalid_response,
                                "lock token is missing pid or timestamp"});
    }

    lock_token token;
    token.pid = *pid;
    token.timestamp = *timestamp;
    token.hostname = json::get_string(text, "hostname").value_or("");
    token.started_at = json::get_string(text, "started_at").value_or("");
    return token;
}

namespace {

auto describe_raw(const std::optional<std::string>& raw) -> std::string {
    if (!raw) {
        return "unknown holder";
    }
    auto token = lock_token::from_json(*raw);
    return token ? describe(token.value()) : "unknown holder";
}

}  // namespace

// ============================================================================
// instance_lock
// ============================================================================

instance_lock::instance_lock(instance_lock_config config,
                             std::shared_ptr<delivery_clock> clock,
                             std::shared_ptr<delivery_logger> logger)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : make_system_clock()),
      logger_(logger ? std::move(logger) : make_null_logger()) {
    own_token_.pid = process_info::current_pid();
    own_token_.hostname = process_info::local_hostname();
}

instance_lock::~instance_lock() {
    (void)release();
    unregister_for_exit(this);
}

auto instance_lock::read_token(const std::filesystem::path& path) -> result<lock_token> {
    std::ifstream file(path);
    if (!file) {
        return unexpected(error{error_code::file_not_found, "lock file not readable"});
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return lock_token::from_json(buffer.str());
}

auto instance_lock::read_raw(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void instance_lock::stamp_own_token() {
    auto now = clock_->system_now();
    own_token_.timestamp = to_unix_seconds(now);
    own_token_.started_at = format_iso8601(now);
}

auto instance_lock::is_ours(const lock_token& token) const -> bool {
    return token.pid == own_token_.pid && token.hostname == own_token_.hostname;
}

auto instance_lock::try_create(const lock_token& token) -> result<bool> {
    // Publish the full token under a private name, then hard-link it into
    // place: link(2) fails with EEXIST if the lock exists, so no reader can
    // ever observe a half-written token.
    auto tmp = temp_path_for(config_.lock_file, own_token_.pid);
    if (auto written = write_file(tmp, token.to_json(), O_CREAT | O_TRUNC); !written) {
        return unexpected(written.error());
    }

    int rc = ::link(tmp.c_str(), config_.lock_file.c_str());
    int link_errno = errno;
    std::error_code ec;
    std::filesystem::remove(tmp, ec);

    if (rc == 0) {
        return true;
    }
    if (link_errno == EEXIST) {
        return false;
    }
    if (link_errno == EPERM || link_errno == ENOTSUP || link_errno == EOPNOTSUPP) {
        // Filesystem without hard links.
        auto created = write_file(config_.lock_file, token.to_json(), O_CREAT | O_EXCL);
        if (created) {
            return true;
        }
        std::error_code exists_ec;
        if (std::filesystem::exists(config_.lock_file, exists_ec)) {
            return false;
        }
        return unexpected(created.error());
    }
    return unexpected(error{error_code::lock_io_error,
                            "cannot create lock file " + config_.lock_file.string() + ": " +
                                std::strerror(link_errno)});
}

auto instance_lock::take_over(const std::optional<std::string>& judged) -> result<void> {
    if (held_) {
        return {};
    }

    // Move the judged token aside in one rename. Only one contender can move
    // a given file; the others see ENOENT or a token that differs from the
    // one they judged.
    auto aside = aside_path_for(config_.lock_file, own_token_.pid);
    std::error_code ec;
    std::filesystem::rename(config_.lock_file, aside, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return unexpected(error{error_code::lock_io_error,
                                "cannot move stale lock file aside: " + ec.message()});
    }

    if (!ec) {
        auto moved = read_raw(aside);
        if (moved != judged) {
            // A fresh token replaced the stale one after it was judged; put it back.
            if (::link(aside.c_str(), config_.lock_file.c_str()) != 0) {
                FD_LOG_WARN(logger_, log_category::lock,
                            "Cannot restore lock file moved aside: " +
                                std::string(std::strerror(errno)));
            }
            std::filesystem::remove(aside, ec);
            return unexpected(error{error_code::lock_conflict,
                                    "Another instance took the lock first (" +
                                        describe_raw(moved) + ")"});
        }
        std::filesystem::remove(aside, ec);
    }

    stamp_own_token();
    auto created = try_create(own_token_);
    if (!created) {
        return unexpected(created.error());
    }
    if (!created.value()) {
        return unexpected(error{error_code::lock_conflict,
                                "Another instance took the lock first (" +
                                    describe_raw(read_raw(config_.lock_file)) + ")"});
    }

    held_ = true;
    register_for_exit(this);
    return {};
}

auto instance_lock::acquire() -> result<void> {
    if (held_) {
        return {};
    }

    std::error_code ec;
    if (config_.lock_file.has_parent_path()) {
        std::filesystem::create_directories(config_.lock_file.parent_path(), ec);
        if (ec) {
            return unexpected(error{error_code::lock_io_error,
                                    "cannot create lock directory: " + ec.message()});
        }
    }

    stamp_own_token();

    // Two passes: the existing token may vanish between our create attempt
    // and reading it, in which case the create is simply retried.
    for (int pass = 0; pass < 2; ++pass) {
        auto created = try_create(own_token_);
        if (!created) {
            return unexpected(created.error());
        }
        if (created.value()) {
            held_ = true;
            register_for_exit(this);
            FD_LOG_DEBUG(logger_, log_category::lock,
                         "Acquired lock " + config_.lock_file.string());
            return {};
        }

        auto judged = read_raw(config_.lock_file);
        if (!judged && !std::filesystem::exists(config_.lock_file, ec)) {
            continue;
        }

        auto existing = judged ? lock_token::from_json(*judged)
                               : result<lock_token>(unexpected(
                                     error{error_code::file_read_error, "lock file not readable"}));
        if (!existing) {
            FD_LOG_WARN(logger_, log_category::lock,
                        "Lock file is unreadable (" + existing.error().message +
                            "), overriding it");
        } else {
            const auto& holder = existing.value();
            auto age = std::chrono::seconds(own_token_.timestamp - holder.timestamp);

            if (age > config_.stale_after) {
                FD_LOG_WARN(logger_, log_category::lock,
                            "Stale lock from " + describe(holder) + " on " + holder.hostname +
                                " is " + std::to_string(age.count() / 60) +
                                " minutes old, overriding it");
            } else if (holder.hostname != own_token_.hostname) {
                return unexpected(error{error_code::lock_conflict,
                                        "Another instance is already running on " +
                                            holder.hostname + " (" + describe(holder) + ")"});
            } else if (process_info::is_process_alive(holder.pid)) {
                return unexpected(error{error_code::lock_conflict,
                                        "Another instance is already running (" +
                                            describe(holder) + ")"});
            } else {
                FD_LOG_WARN(logger_, log_category::lock,
                            "Lock owner PID " + std::to_string(holder.pid) +
                                " is no longer running, overriding lock");
            }
        }

        if (auto taken = take_over(judged); !taken) {
            return taken;
        }
        FD_LOG_DEBUG(logger_, log_category::lock,
                     "Acquired lock " + config_.lock_file.string() + " by override");
        return {};
    }

    return unexpected(error{error_code::lock_io_error,
                            "lock file changed repeatedly while acquiring"});
}

auto instance_lock::release() -> result<void> {
    if (!held_) {
        return {};
    }
    held_ = false;
    unregister_for_exit(this);

    auto on_disk = read_token(config_.lock_file);
    if (!on_disk) {
        FD_LOG_WARN(logger_, log_category::lock,
                    "Lock file disappeared before release: " + config_.lock_file.string());
        return {};
    }
    if (!is_ours(on_disk.value())) {
        FD_LOG_WARN(logger_, log_category::lock,
                    "Lock is now held by " + describe(on_disk.value()) +
                        ", leaving it in place");
        return {};
    }

    std::error_code ec;
    std::filesystem::remove(config_.lock_file, ec);
    if (ec) {
        return unexpected(error{error_code::lock_io_error,
                                "cannot remove lock file: " + ec.message()});
    }
    FD_LOG_DEBUG(logger_, log_category::lock, "Released lock " + config_.lock_file.string());
    return {};
}

}  // namespace kcenon::file_delivery
