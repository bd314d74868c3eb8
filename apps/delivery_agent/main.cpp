/**
 * @file main.cpp
 * @brief delivery_agent command-line entry point
 *
 * Actions:
 * - --ping    single connectivity check
 * - --status  remote queue state
 * - --upload  deliver every file in <folder>/inbox
 */

#include <kcenon/file_delivery/file_delivery.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

using namespace kcenon::file_delivery;

namespace {

enum class action {
    none,
    ping,
    status,
    upload,
};

struct cli_options {
    action selected = action::none;
    int action_count = 0;
    std::optional<std::filesystem::path> config_file;
    config_overrides overrides;
    bool verbose = false;
};

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto format_duration(std::chrono::milliseconds ms) -> std::string {
    if (ms.count() >= 1000) {
        return std::to_string(ms.count() / 1000) + "." +
               std::to_string((ms.count() % 1000) / 100) + "s";
    }
    return std::to_string(ms.count()) + "ms";
}

auto parse_count(const std::string& text) -> std::optional<std::size_t> {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void print_usage(const char* program) {
    std::cout << "File Delivery Agent " << version::to_string() << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] (--ping | --status | --upload)" << std::endl;
    std::cout << std::endl;
    std::cout << "Actions:" << std::endl;
    std::cout << "  --ping                      Test server connectivity" << std::endl;
    std::cout << "  --status                    Show the server upload queue" << std::endl;
    std::cout << "  --upload                    Deliver all files in <folder>/inbox" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config <file>             JSON config file (command line wins)" << std::endl;
    std::cout << "  --url <url>                 Server base URL" << std::endl;
    std::cout << "  --key <key>                 API key" << std::endl;
    std::cout << "  --folder <dir>              Base folder (inbox/, processed/, logs/)" << std::endl;
    std::cout << "  --batch-size <n>            Files per batch (default: 5)" << std::endl;
    std::cout << "  --polling-interval <s>      Busy polling interval (default: 10s)" << std::endl;
    std::cout << "  -v, --verbose               Debug logging to the console" << std::endl;
    std::cout << "  --version                   Show version" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " --url https://ingest.example.com --key KEY --ping" << std::endl;
    std::cout << "  " << program << " --config agent.json --folder /srv/delivery --upload"
              << std::endl;
}

// Returns an exit code when parsing should stop, std::nullopt to continue.
auto parse_arguments(int argc, char* argv[], cli_options& options) -> std::optional<int> {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& name) -> std::optional<std::string> {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                return std::nullopt;
            }
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << version::product << " " << version::to_string() << std::endl;
            return 0;
        } else if (arg == "--ping") {
            options.selected = action::ping;
            ++options.action_count;
        } else if (arg == "--status") {
            options.selected = action::status;
            ++options.action_count;
        } else if (arg == "--upload") {
            options.selected = action::upload;
            ++options.action_count;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--config") {
            auto value = require_value(arg);
            if (!value) return 1;
            options.config_file = *value;
        } else if (arg == "--url") {
            auto value = require_value(arg);
            if (!value) return 1;
            options.overrides.url = *value;
        } else if (arg == "--key") {
            auto value = require_value(arg);
            if (!value) return 1;
            options.overrides.api_key = *value;
        } else if (arg == "--folder") {
            auto value = require_value(arg);
            if (!value) return 1;
            options.overrides.folder = std::filesystem::path(*value);
        } else if (arg == "--batch-size") {
            auto value = require_value(arg);
            if (!value) return 1;
            auto count = parse_count(*value);
            if (!count || *count == 0) {
                std::cerr << "Error: --batch-size must be a positive integer" << std::endl;
                return 1;
            }
            options.overrides.batch_size = *count;
        } else if (arg == "--polling-interval") {
            auto value = require_value(arg);
            if (!value) return 1;
            auto seconds = parse_count(*value);
            if (!seconds) {
                std::cerr << "Error: --polling-interval must be a number of seconds" << std::endl;
                return 1;
            }
            options.overrides.polling_interval = std::chrono::seconds(*seconds);
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }
    return std::nullopt;
}

auto open_logger(const std::optional<std::filesystem::path>& log_file, bool verbose)
    -> std::shared_ptr<delivery_logger> {
    auto logger = std::make_shared<delivery_logger>();

    logger_options options;
    options.console = verbose;
    options.min_level = verbose ? log_level::debug : log_level::info;
    if (log_file) {
        std::error_code ec;
        std::filesystem::create_directories(log_file->parent_path(), ec);
        options.log_file = *log_file;
    }

    if (auto opened = logger->open(options); !opened) {
        std::cerr << "Warning: logging disabled: " << opened.error().message << std::endl;
    }
    return logger;
}

auto make_remote(const config_overrides& settings, std::shared_ptr<delivery_logger> logger)
    -> std::unique_ptr<remote_service_client> {
    remote_client_config remote;
    remote.base_url = settings.url.value_or("");
    remote.api_key = settings.api_key.value_or("");
    if (settings.status_path) {
        remote.endpoints.status = *settings.status_path;
    }
    return std::make_unique<remote_service_client>(
        remote, std::make_shared<network_http_client_factory>(), make_system_clock(),
        std::move(logger));
}

// ============================================================================
// Actions
// ============================================================================

auto run_ping(const config_overrides& settings, std::shared_ptr<delivery_logger> logger) -> int {
    auto remote = make_remote(settings, std::move(logger));

    std::cout << "Pinging " << remote->config().base_url << " ..." << std::endl;
    auto ping = remote->ping();
    if (!ping) {
        std::cerr << "Ping failed: " << ping.error().message << std::endl;
        return 1;
    }

    const auto& response = ping.value();
    std::cout << "  Service status: " << response.service_status << std::endl;
    if (!response.environment.empty()) {
        std::cout << "  Environment:    " << response.environment << std::endl;
    }
    std::cout << "  API key:        " << to_string(response.key);
    if (!response.key_user.empty()) {
        std::cout << " (" << response.key_user << ")";
    }
    std::cout << std::endl;
    if (response.approval) {
        std::cout << "  Host approval:  " << to_string(*response.approval);
        if (!response.hostname.empty()) {
            std::cout << " (" << response.hostname << ")";
        }
        std::cout << std::endl;
    }
    if (!response.server_timestamp.empty()) {
        std::cout << "  Server time:    " << response.server_timestamp << std::endl;
    }
    std::cout << "  Response time:  " << format_duration(response.response_time) << std::endl;

    return response.is_running() ? 0 : 1;
}

auto run_status(const config_overrides& settings, std::shared_ptr<delivery_logger> logger)
    -> int {
    auto remote = make_remote(settings, std::move(logger));

    auto status = remote->status();
    if (!status) {
        std::cerr << "Status check failed: " << status.error().message << std::endl;
        return 1;
    }

    const auto& response = status.value();
    std::cout << "Upload queue:" << std::endl;
    std::cout << "  Pending:    " << response.counts.pending << std::endl;
    std::cout << "  Processing: " << response.counts.processing << std::endl;
    std::cout << "  Completed:  " << response.counts.completed << std::endl;
    std::cout << "  Failed:     " << response.counts.failed << std::endl;
    if (response.max_concurrent) {
        std::cout << "  Max concurrent: " << *response.max_concurrent << std::endl;
    }
    std::cout << "  Busy:       " << (response.busy ? "yes" : "no") << std::endl;
    return 0;
}

void print_event(const delivery_event& event) {
    switch (event.type) {
        case delivery_event::kind::wakeup_attempt:
            if (event.sequence == 1) {
                std::cout << "Waking server..." << std::endl;
            } else {
                std::cout << "  attempt " << event.sequence << "/" << event.limit << std::endl;
            }
            break;
        case delivery_event::kind::batch_started:
            std::cout << std::endl
                      << "Batch " << event.sequence << "/" << event.limit << std::endl;
            break;
        case delivery_event::kind::waiting_for_server:
            std::cout << "  Server busy, waiting..." << std::endl;
            break;
        case delivery_event::kind::file_started:
            std::cout << "  " << event.file << std::endl;
            break;
        case delivery_event::kind::chunk_sent:
            std::cout << "    chunk " << (event.chunk_index + 1) << "/" << event.total_chunks
                      << " (" << format_bytes(event.bytes) << ")" << std::endl;
            break;
        case delivery_event::kind::attempt_failed:
            std::cout << "    attempt " << event.sequence << "/" << event.limit
                      << " failed: " << event.message << std::endl;
            break;
        case delivery_event::kind::file_finished:
            if (event.outcome) {
                std::cout << "    " << to_string(event.outcome->status) << " ("
                          << format_bytes(event.outcome->size) << ", "
                          << format_duration(event.outcome->elapsed) << ")" << std::endl;
            }
            break;
        default:
            break;
    }
}

auto run_upload(const config_overrides& settings, std::shared_ptr<delivery_logger> logger)
    -> int {
    auto config = config_loader::to_delivery_config(settings);
    if (!config) {
        std::cerr << "Error: " << config.error().message << std::endl;
        return 1;
    }

    std::cout << "Configuration:" << std::endl;
    std::cout << "  Server:           " << config.value().remote.base_url << std::endl;
    std::cout << "  API key:          " << mask_secret(config.value().remote.api_key)
              << std::endl;
    std::cout << "  Folder:           " << config.value().base_dir.string() << std::endl;
    std::cout << "  Batch size:       " << config.value().pacing.batch_size << std::endl;
    std::cout << "  Polling interval: "
              << format_duration(config.value().pacing.polling_interval) << std::endl;
    std::cout << "  Chunk threshold:  " << format_bytes(config.value().chunking.threshold)
              << std::endl;

    upload_orchestrator orchestrator(config.value(),
                                     std::make_shared<network_http_client_factory>(),
                                     make_system_clock(), logger);
    orchestrator.on_event(print_event);

    auto outcome = orchestrator.run();
    if (!outcome) {
        std::cerr << "Error: " << outcome.error().message << std::endl;
        return 1;
    }

    const auto& run = outcome.value();
    std::cout << std::endl << "Summary (" << to_string(run.outcome) << ")" << std::endl;
    if (!run.message.empty()) {
        std::cout << "  " << run.message << std::endl;
    }
    std::cout << "  Total:      " << run.total() << std::endl;
    std::cout << "  Successful: " << run.successful() << std::endl;
    std::cout << "  Failed:     " << run.failed() << std::endl;
    std::cout << "  Skipped:    " << run.skipped() << std::endl;
    for (const auto& file : run.files) {
        if (file.status == file_outcome_status::failed) {
            std::cout << "    - " << file.name << ": " << file.error_message << std::endl;
        }
    }
    if (run.report_path) {
        std::cout << "Report: " << run.report_path->string() << std::endl;
    }
    return run.exit_code();
}

}  // namespace

int main(int argc, char* argv[]) {
    cli_options options;
    if (auto exit_code = parse_arguments(argc, argv, options)) {
        return *exit_code;
    }

    if (options.action_count == 0) {
        std::cerr << "No action specified. Use --ping, --status or --upload" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (options.action_count > 1) {
        std::cerr << "Error: --ping, --status and --upload are mutually exclusive" << std::endl;
        return 1;
    }

    config_overrides file_settings;
    if (options.config_file) {
        auto loaded = config_loader::load_file(*options.config_file);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message << std::endl;
            return 1;
        }
        file_settings = loaded.value();
    }
    auto settings = config_loader::merge(file_settings, options.overrides);

    if (!settings.url) {
        std::cerr << "Error: --url or config file with 'url' is required" << std::endl;
        return 1;
    }
    if (options.selected != action::ping && !settings.api_key) {
        std::cerr << "Error: --key or config file with 'key' is required" << std::endl;
        return 1;
    }
    if (options.selected == action::upload && !settings.folder) {
        std::cerr << "Error: --folder or config file with 'folder' is required for upload"
                  << std::endl;
        return 1;
    }

    std::optional<std::filesystem::path> log_file;
    if (settings.folder) {
        log_file = *settings.folder / "logs" / "uploader.log";
    }
    auto logger = open_logger(log_file, options.verbose);

    int exit_code = 1;
    switch (options.selected) {
        case action::ping:
            exit_code = run_ping(settings, logger);
            break;
        case action::status:
            exit_code = run_status(settings, logger);
            break;
        case action::upload:
            exit_code = run_upload(settings, logger);
            break;
        default:
            break;
    }

    logger->shutdown();
    return exit_code;
}
