/**
 * @file claim_store.cpp
 * @brief Implementation of rename-based file claiming
 */

#include <kcenon/file_delivery/storage/claim_store.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>

#include <fcntl.h>
#include <unistd.h>

namespace kcenon::file_delivery {

namespace {

auto has_suffix(const std::string& name, const std::string& suffix) -> bool {
    return !suffix.empty() && name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// rename(2) that fails with EEXIST instead of replacing the target. Where the
// filesystem has no RENAME_NOREPLACE, a hard link is published first and the
// source unlinked afterwards.
auto rename_no_replace(const std::filesystem::path& from, const std::filesystem::path& to)
    -> std::error_code {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }
    int rename_errno = errno;
    if (rename_errno != EINVAL && rename_errno != ENOSYS && rename_errno != ENOTSUP) {
        return {rename_errno, std::generic_category()};
    }

    if (::link(from.c_str(), to.c_str()) != 0) {
        return {errno, std::generic_category()};
    }
    if (::unlink(from.c_str()) != 0) {
        int unlink_errno = errno;
        ::unlink(to.c_str());
        return {unlink_errno, std::generic_category()};
    }
    return {};
}

}  // namespace

auto claim_store::publish(const std::filesystem::path& from, const std::filesystem::path& to)
    -> std::error_code {
    auto ec = rename_no_replace(from, to);
    if (ec != std::errc::cross_device_link && ec != std::errc::operation_not_permitted &&
        ec != std::errc::not_supported) {
        return ec;
    }

    // Different filesystems, or no hard links: copy_options::none refuses an
    // existing target.
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::none, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::remove(from, ec);
    return ec;
}

auto claim_store::slot_name(const std::filesystem::path& directory,
                            const std::string& filename,
                            uint64_t slot) -> std::filesystem::path {
    if (slot == 0) {
        return directory / filename;
    }
    std::filesystem::path name(filename);
    return directory /
           (name.stem().string() + " (" + std::to_string(slot) + ")" + name.extension().string());
}

auto claim_store::place(const claimed_file& claimed,
                        const std::filesystem::path& directory,
                        const std::string& filename) -> result<std::filesystem::path> {
    for (uint64_t slot = 0;; ++slot) {
        auto target = slot_name(directory, filename, slot);
        auto ec = publish(claimed.claimed_path, target);
        if (!ec) {
            std::error_code mtime_ec;
            std::filesystem::last_write_time(target, claimed.original_mtime, mtime_ec);
            return target;
        }
        if (ec != std::errc::file_exists) {
            return unexpected(error{error_code::file_move_error,
                                    "cannot move " + filename + " to " + directory.string() +
                                        ": " + ec.message()});
        }
    }
}

claim_store::claim_store(claim_store_config config,
                         std::shared_ptr<delivery_clock> clock,
                         std::shared_ptr<delivery_logger> logger)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : make_system_clock()),
      logger_(logger ? std::move(logger) : make_null_logger()) {}

auto claim_store::ensure_directories() -> result<void> {
    for (const auto& dir : {config_.inbox_dir, config_.processed_dir}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create directory " + dir.string() + ": " +
                                        ec.message()});
        }
    }
    return {};
}

auto claim_store::is_claim_name(const std::filesystem::path& path) const -> bool {
    return has_suffix(path.filename().string(), config_.claim_suffix);
}

auto claim_store::strip_suffix(const std::filesystem::path& claimed_path) const
    -> std::filesystem::path {
    auto name = claimed_path.filename().string();
    if (has_suffix(name, config_.claim_suffix)) {
        name.erase(name.size() - config_.claim_suffix.size());
    }
    return claimed_path.parent_path() / name;
}

auto claim_store::now_file_time() const -> std::filesystem::file_time_type {
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(clock_->system_now()));
}

auto claim_store::list_candidates() const -> result<std::vector<std::filesystem::path>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.inbox_dir, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot list inbox " + config_.inbox_dir.string() + ": " +
                                    ec.message()});
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : it) {
        auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (is_claim_name(entry.path())) {
            continue;
        }
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec) || type_ec) {
            continue;
        }
        candidates.push_back(entry.path());
    }

    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

auto claim_store::claim(const std::filesystem::path& path) -> std::optional<claimed_file> {
    claimed_file claimed;
    claimed.original_path = path;
    claimed.claimed_path = path;
    claimed.claimed_path += config_.claim_suffix;

    std::error_code ec;
    if (std::filesystem::exists(claimed.claimed_path, ec)) {
        FD_LOG_DEBUG(logger_, log_category::claim,
                     "Claim already exists for " + claimed.name() + ", skipping");
        return std::nullopt;
    }

    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        FD_LOG_DEBUG(logger_, log_category::claim,
                     "File vanished before claim: " + claimed.name());
        return std::nullopt;
    }

    // ENOENT when another process claimed the file first, EEXIST when a
    // claim of the same name is still in place.
    ec = rename_no_replace(path, claimed.claimed_path);
    if (ec == std::errc::operation_not_permitted || ec == std::errc::not_supported) {
        // No hard links on this filesystem; the existence check above is the
        // only guard left.
        ec.clear();
        std::filesystem::rename(path, claimed.claimed_path, ec);
    }
    if (ec) {
        FD_LOG_DEBUG(logger_, log_category::claim,
                     "Claim lost for " + claimed.name() + ": " + ec.message());
        return std::nullopt;
    }

    claimed.original_mtime = mtime;
    claimed.size = std::filesystem::file_size(claimed.claimed_path, ec);
    if (ec) {
        claimed.size = 0;
    }
    touch(claimed);

    FD_LOG_DEBUG(logger_, log_category::claim, "Claimed " + claimed.name());
    return claimed;
}

void claim_store::touch(const claimed_file& claimed) {
    std::error_code ec;
    std::filesystem::last_write_time(claimed.claimed_path, now_file_time(), ec);
    if (ec) {
        FD_LOG_DEBUG(logger_, log_category::claim,
                     "Cannot refresh claim heartbeat for " + claimed.name() + ": " +
                         ec.message());
    }
}

auto claim_store::unclaim(const claimed_file& claimed) -> result<std::filesystem::path> {
    auto original = claimed.original_path.filename().string();
    auto restored = place(claimed, claimed.original_path.parent_path(), original);
    if (!restored) {
        return unexpected(error{error_code::file_move_error,
                                "cannot unclaim " + claimed.name() + ": " +
                                    restored.error().message});
    }

    if (restored.value().filename().string() != original) {
        // A new file with the same name arrived while this one was in flight.
        FD_LOG_WARN(logger_, log_category::claim,
                    claimed.name() + " reappeared in the inbox, restoring as " +
                        restored.value().filename().string());
    }
    FD_LOG_DEBUG(logger_, log_category::claim, "Unclaimed " + claimed.name());
    return restored;
}

auto claim_store::finalize(const claimed_file& claimed) -> result<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(config_.processed_dir, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create processed directory: " + ec.message()});
    }

    auto logical = strip_suffix(claimed.claimed_path).filename().string();
    auto placed = place(claimed, config_.processed_dir, logical);
    if (!placed) {
        return unexpected(placed.error());
    }
    const auto& destination = placed.value();

    if (destination.filename().string() != logical) {
        FD_LOG_INFO(logger_, log_category::claim,
                    logical + " already processed before, stored as " +
                        destination.filename().string());
    }
    return destination;
}

auto claim_store::recover_stale_claims(std::chrono::seconds max_age)
    -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> recovered;
    if (max_age.count() <= 0) {
        return recovered;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.inbox_dir, ec);
    if (ec) {
        return recovered;
    }

    auto now = clock_->system_now();
    for (const auto& entry : it) {
        if (!is_claim_name(entry.path())) {
            continue;
        }
        std::error_code entry_ec;
        auto mtime = std::filesystem::last_write_time(entry.path(), entry_ec);
        if (entry_ec) {
            continue;
        }
        auto age = now - std::chrono::file_clock::to_sys(mtime);
        if (age <= max_age) {
            continue;
        }

        claimed_file stale;
        stale.claimed_path = entry.path();
        stale.original_path = strip_suffix(entry.path());
        stale.original_mtime = mtime;
        stale.size = std::filesystem::file_size(entry.path(), entry_ec);

        auto restored = unclaim(stale);
        if (!restored) {
            FD_LOG_WARN(logger_, log_category::claim, restored.error().message);
            continue;
        }
        FD_LOG_WARN(logger_, log_category::claim,
                    "Recovered abandoned claim " + entry.path().filename().string() + " (" +
                        std::to_string(
                            std::chrono::duration_cast<std::chrono::minutes>(age).count()) +
                        " minutes old)");
        recovered.push_back(restored.value());
    }
    return recovered;
}

auto claim_store::unique_destination(const std::filesystem::path& directory,
                                     const std::string& filename) -> std::filesystem::path {
    for (uint64_t slot = 0;; ++slot) {
        auto candidate = slot_name(directory, filename, slot);
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

}  // namespace kcenon::file_delivery
