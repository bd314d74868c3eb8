/**
 * @file run_reporter.h
 * @brief Persists the result of a delivery run as a JSON report
 */

#ifndef KCENON_FILE_DELIVERY_REPORT_RUN_REPORTER_H
#define KCENON_FILE_DELIVERY_REPORT_RUN_REPORTER_H

#include <kcenon/file_delivery/client/run_result.h>
#include <kcenon/file_delivery/core/logging.h>
#include <kcenon/file_delivery/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Writes one report file per run
 *
 * Reports are named "upload-report-YYYYMMDD-HHMMSS.json" after the run
 * start time (local time). A second report in the same second gets a
 * "-1", "-2", ... suffix. The file is written to a temporary name and
 * renamed into place, so a reader never sees a partial report.
 *
 * Report content:
 * @code
 * {
 *   "runId": "20240102-030405",
 *   "outcome": "completed",
 *   "successful": 2, "failed": 0, "skipped": 0, "total": 2,
 *   "files": [ { "name": "a.txt", "status": "success", ... } ]
 * }
 * @endcode
 */
class run_reporter {
public:
    explicit run_reporter(std::filesystem::path report_dir,
                          std::shared_ptr<delivery_logger> logger = nullptr);

    /**
     * @brief Write the report for @p run
     * @return Path of the written report
     */
    [[nodiscard]] auto write(const run_result& run) -> result<std::filesystem::path>;

    [[nodiscard]] static auto to_json(const run_result& run) -> std::string;

    [[nodiscard]] static auto report_filename(std::chrono::system_clock::time_point started_at,
                                              std::size_t sequence = 0) -> std::string;

    [[nodiscard]] auto report_dir() const -> const std::filesystem::path& { return report_dir_; }

private:
    std::filesystem::path report_dir_;
    std::shared_ptr<delivery_logger> logger_;
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_REPORT_RUN_REPORTER_H
