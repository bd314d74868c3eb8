/**
 * @file claim_store.h
 * @brief Rename-based file claiming between inbox and processed directories
 */

#ifndef KCENON_FILE_DELIVERY_STORAGE_CLAIM_STORE_H
#define KCENON_FILE_DELIVERY_STORAGE_CLAIM_STORE_H

#include <kcenon/file_delivery/core/clock.h>
#include <kcenon/file_delivery/core/logging.h>
#include <kcenon/file_delivery/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace kcenon::file_delivery {

/**
 * @brief A file this process has claimed for transfer
 */
struct claimed_file {
    std::filesystem::path original_path;
    std::filesystem::path claimed_path;
    uint64_t size = 0;
    std::filesystem::file_time_type original_mtime{};

    /**
     * @brief Logical name (without the claim suffix)
     */
    [[nodiscard]] auto name() const -> std::string {
        return original_path.filename().string();
    }
};

/**
 * @brief Claim store configuration
 */
struct claim_store_config {
    static constexpr std::string_view default_claim_suffix = ".uploading";

    std::filesystem::path inbox_dir;
    std::filesystem::path processed_dir;
    std::string claim_suffix{default_claim_suffix};
};

/**
 * @brief Moves files through unclaimed, claimed and processed states
 *
 * Every transition is a single no-replace rename (renameat2 with
 * RENAME_NOREPLACE, or link + unlink where that is unsupported), so an
 * existing file is never overwritten. unclaim() and finalize() take the
 * next free "name (n).ext" slot when the target exists. The inbox and the
 * processed directory are expected to live on the same filesystem;
 * finalize falls back to a non-replacing copy and remove when they do not,
 * which is not atomic.
 *
 * A claimed file's modification time is the claim heartbeat: claim() and
 * touch() set it to the current time, and recover_stale_claims() uses it
 * to find claims abandoned by a killed process. The original modification
 * time is restored when the file leaves the claimed state.
 */
class claim_store {
public:
    explicit claim_store(claim_store_config config,
                         std::shared_ptr<delivery_clock> clock = nullptr,
                         std::shared_ptr<delivery_logger> logger = nullptr);

    /**
     * @brief Create the inbox and processed directories if missing
     */
    [[nodiscard]] auto ensure_directories() -> result<void>;

    /**
     * @brief Regular, visible, unclaimed files in the inbox, sorted by name
     */
    [[nodiscard]] auto list_candidates() const -> result<std::vector<std::filesystem::path>>;

    /**
     * @brief Claim a file by renaming it to its claimed name
     * @return The claim, or std::nullopt if the file is gone or the rename
     *         lost a race with another process
     */
    [[nodiscard]] auto claim(const std::filesystem::path& path) -> std::optional<claimed_file>;

    /**
     * @brief Refresh the claim heartbeat
     */
    void touch(const claimed_file& claimed);

    /**
     * @brief Return a claimed file to the inbox under its original name
     */
    [[nodiscard]] auto unclaim(const claimed_file& claimed) -> result<std::filesystem::path>;

    /**
     * @brief Move a claimed file to the processed directory
     * @return Destination path (collision-free "name (n).ext" if needed)
     */
    [[nodiscard]] auto finalize(const claimed_file& claimed) -> result<std::filesystem::path>;

    /**
     * @brief Unclaim claims whose heartbeat is older than @p max_age
     *
     * Only safe while holding the instance lock.
     * @return Original paths of the recovered files
     */
    [[nodiscard]] auto recover_stale_claims(std::chrono::seconds max_age)
        -> std::vector<std::filesystem::path>;

    [[nodiscard]] auto is_claim_name(const std::filesystem::path& path) const -> bool;

    /**
     * @brief First free name for @p filename in @p directory
     *
     * Probes "name.ext", "name (1).ext", "name (2).ext", ...
     */
    [[nodiscard]] static auto unique_destination(const std::filesystem::path& directory,
                                                 const std::string& filename)
        -> std::filesystem::path;

    /**
     * @brief "name.ext" for slot 0, "name (n).ext" for slot n
     */
    [[nodiscard]] static auto slot_name(const std::filesystem::path& directory,
                                        const std::string& filename,
                                        uint64_t slot) -> std::filesystem::path;

    /**
     * @brief Move @p from to @p to without ever replacing an existing file
     * @return std::errc::file_exists when @p to is taken, both files untouched
     */
    [[nodiscard]] static auto publish(const std::filesystem::path& from,
                                      const std::filesystem::path& to) -> std::error_code;

    [[nodiscard]] auto config() const -> const claim_store_config& { return config_; }

private:
    [[nodiscard]] auto place(const claimed_file& claimed,
                             const std::filesystem::path& directory,
                             const std::string& filename) -> result<std::filesystem::path>;
    [[nodiscard]] auto strip_suffix(const std::filesystem::path& claimed_path) const
        -> std::filesystem::path;
    [[nodiscard]] auto now_file_time() const -> std::filesystem::file_time_type;

    claim_store_config config_;
    std::shared_ptr<delivery_clock> clock_;
    std::shared_ptr<delivery_logger> logger_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_STORAGE_CLAIM_STORE_H
