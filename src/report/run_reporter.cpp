/**
 * @file run_reporter.cpp
 * @brief JSON run report writer
 */

#include <kcenon/file_delivery/report/run_reporter.h>

#include <kcenon/file_delivery/core/clock.h>
#include <kcenon/file_delivery/core/json_utils.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace kcenon::file_delivery {

namespace {

constexpr std::size_t max_report_sequence = 1000;

void write_file_entry(std::ostringstream& out, const file_outcome& file) {
    out << "    {\n"
        << "      \"name\": \"" << json::escape(file.name) << "\",\n"
        << "      \"status\": \"" << to_string(file.status) << "\",\n"
        << "      \"attempts\": " << file.attempts << ",\n"
        << "      \"size\": " << file.size << ",\n"
        << "      \"chunks\": " << file.chunks << ",\n"
        << "      \"elapsedMs\": " << file.elapsed.count();
    if (!file.sha256.empty()) {
        out << ",\n      \"sha256\": \"" << file.sha256 << "\"";
    }
    if (file.destination) {
        out << ",\n      \"destination\": \"" << json::escape(file.destination->string())
            << "\"";
    }
    if (!file.error_message.empty()) {
        out << ",\n      \"error\": \"" << json::escape(file.error_message) << "\"";
    }
    out << "\n    }";
}

}  // namespace

run_reporter::run_reporter(std::filesystem::path report_dir,
                           std::shared_ptr<delivery_logger> logger)
    : report_dir_(std::move(report_dir)),
      logger_(logger ? std::move(logger) : make_null_logger()) {}

auto run_reporter::report_filename(std::chrono::system_clock::time_point started_at,
                                   std::size_t sequence) -> std::string {
    auto name = "upload-report-" + format_local(started_at, "%Y%m%d-%H%M%S");
    if (sequence > 0) {
        name += "-" + std::to_string(sequence);
    }
    return name + ".json";
}

auto run_reporter::to_json(const run_result& run) -> std::string {
    std::ostringstream out;
    out << "{\n"
        << "  \"runId\": \"" << json::escape(run.run_id) << "\",\n"
        << "  \"startedAt\": \"" << format_iso8601(run.started_at) << "\",\n"
        << "  \"finishedAt\": \"" << format_iso8601(run.finished_at) << "\",\n"
        << "  \"outcome\": \"" << to_string(run.outcome) << "\",\n";
    if (!run.message.empty()) {
        out << "  \"message\": \"" << json::escape(run.message) << "\",\n";
    }
    out << "  \"successful\": " << run.successful() << ",\n"
        << "  \"failed\": " << run.failed() << ",\n"
        << "  \"skipped\": " << run.skipped() << ",\n"
        << "  \"total\": " << run.total() << ",\n"
        << "  \"recoveredClaims\": " << run.recovered_claims << ",\n"
        << "  \"files\": [";

    for (std::size_t i = 0; i < run.files.size(); ++i) {
        out << (i == 0 ? "\n" : ",\n");
        write_file_entry(out, run.files[i]);
    }
    out << (run.files.empty() ? "]\n" : "\n  ]\n") << "}\n";
    return out.str();
}

auto run_reporter::write(const run_result& run) -> result<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::create_directories(report_dir_, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
                                "cannot create report directory " + report_dir_.string() +
                                    ": " + ec.message()}};
    }

    std::filesystem::path target;
    for (std::size_t sequence = 0; sequence < max_report_sequence; ++sequence) {
        auto candidate = report_dir_ / report_filename(run.started_at, sequence);
        if (!std::filesystem::exists(candidate, ec)) {
            target = candidate;
            break;
        }
    }
    if (target.empty()) {
        return unexpected{error{error_code::file_already_exists,
                                "no free report name in " + report_dir_.string()}};
    }

    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected{error{error_code::file_write_error,
                                    "cannot open " + temp.string()}};
        }
        file << to_json(run);
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp, ec);
            return unexpected{error{error_code::file_write_error,
                                    "cannot write " + temp.string()}};
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return unexpected{error{error_code::file_write_error,
                                "cannot publish report " + target.string() + ": " +
                                    ec.message()}};
    }

    FD_LOG_INFO(logger_, log_category::report, "Report written to " + target.string());
    return target;
}

}  // namespace kcenon::file_delivery
