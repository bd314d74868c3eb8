/**
 * @file upload_orchestrator.cpp
 * @brief Implementation of the delivery run pipeline
 */

#include "kcenon/file_delivery/client/upload_orchestrator.h"

#include "kcenon/file_delivery/core/checksum.h"
#include "kcenon/file_delivery/core/chunk_splitter.h"
#include "kcenon/file_delivery/lock/instance_lock.h"
#include "kcenon/file_delivery/lock/process_info.h"
#include "kcenon/file_delivery/report/run_reporter.h"
#include "kcenon/file_delivery/storage/claim_store.h"
#include "kcenon/file_delivery/transport/remote_service_client.h"

#include <algorithm>
#include <system_error>

namespace kcenon::file_delivery {

namespace {

auto elapsed_since(const delivery_clock& clock, std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock.steady_now() - start);
}

auto terminal_state_for(run_outcome outcome) -> run_state {
    switch (outcome) {
        case run_outcome::lock_conflict:
            return run_state::lock_conflict;
        case run_outcome::server_unresponsive:
            return run_state::server_unresponsive;
        case run_outcome::host_not_approved:
            return run_state::host_not_approved;
        default:
            return run_state::done;
    }
}

}  // namespace

// ============================================================================
// upload_orchestrator::impl
// ============================================================================

struct upload_orchestrator::impl {
    delivery_config config;
    std::shared_ptr<delivery_clock> clock;
    std::shared_ptr<delivery_logger> logger;

    remote_service_client remote;
    claim_store claims;
    run_reporter reporter;
    chunk_splitter splitter;

    server_snapshot snapshot;
    run_state current_state = run_state::idle;
    delivery_event_handler event_handler;

    impl(delivery_config cfg,
         std::shared_ptr<http_client_factory> factory,
         std::shared_ptr<delivery_clock> clk,
         std::shared_ptr<delivery_logger> log)
        : config(std::move(cfg)),
          clock(clk ? std::move(clk) : make_system_clock()),
          logger(log ? std::move(log) : make_null_logger()),
          remote(config.remote, std::move(factory), clock, logger),
          claims(claim_store_config{config.inbox_dir(), config.processed_dir()}, clock, logger),
          reporter(config.logs_dir(), logger),
          splitter(config.chunking) {}

    void emit(delivery_event event) {
        if (event_handler) {
            event.state = current_state;
            event_handler(event);
        }
    }

    void set_state(run_state new_state) {
        if (current_state == new_state) {
            return;
        }
        FD_LOG_DEBUG(logger, log_category::orchestrator,
                     std::string("State ") + to_string(current_state) + " -> " +
                         to_string(new_state));
        current_state = new_state;

        delivery_event event;
        event.type = delivery_event::kind::state_changed;
        emit(std::move(event));
    }

    // ------------------------------------------------------------------------
    // Run
    // ------------------------------------------------------------------------

    auto run() -> result<run_result> {
        if (auto valid = config.validate(); !valid) {
            return unexpected{valid.error()};
        }

        snapshot = server_snapshot{};
        current_state = run_state::idle;

        run_result outcome;
        outcome.started_at = clock->system_now();
        outcome.run_id = format_local(outcome.started_at, "%Y%m%d-%H%M%S");

        std::error_code ec;
        std::filesystem::create_directories(config.logs_dir(), ec);

        instance_lock lock(instance_lock_config{config.lock_file(), config.lock_stale_after},
                           clock, logger);
        if (auto acquired = lock.acquire(); !acquired) {
            FD_LOG_ERROR(logger, log_category::orchestrator, acquired.error().message);
            outcome.outcome = run_outcome::lock_conflict;
            outcome.message = acquired.error().message;
            outcome.finished_at = clock->system_now();
            set_state(run_state::lock_conflict);
            notify_finished(outcome);
            return outcome;
        }
        set_state(run_state::lock_acquired);

        FD_LOG_INFO(logger, log_category::orchestrator,
                    "Run " + outcome.run_id + " started for " + config.base_dir.string());

        if (auto dirs = claims.ensure_directories(); !dirs) {
            outcome.outcome = run_outcome::inbox_unreadable;
            outcome.message = dirs.error().message;
            FD_LOG_ERROR(logger, log_category::orchestrator, outcome.message);
            return finish(outcome, lock);
        }

        if (config.claim_stale_after.count() > 0) {
            auto recovered = claims.recover_stale_claims(config.claim_stale_after);
            outcome.recovered_claims = recovered.size();
        }

        set_state(run_state::waking_server);
        if (!wake_server()) {
            outcome.outcome = run_outcome::server_unresponsive;
            outcome.message = "Server did not become ready after " +
                              std::to_string(config.wakeup.max_attempts) + " attempts";
            FD_LOG_ERROR(logger, log_category::orchestrator, outcome.message);
            record_unattempted(outcome, outcome.message);
            return finish(outcome, lock);
        }

        if (auto approved = check_host_approval(); !approved) {
            outcome.outcome = run_outcome::host_not_approved;
            outcome.message = approved.error().message;
            FD_LOG_ERROR(logger, log_category::orchestrator, outcome.message);
            return finish(outcome, lock);
        }

        set_state(run_state::scanning);
        auto candidates = claims.list_candidates();
        if (!candidates) {
            outcome.outcome = run_outcome::inbox_unreadable;
            outcome.message = candidates.error().message;
            FD_LOG_ERROR(logger, log_category::orchestrator, outcome.message);
            return finish(outcome, lock);
        }

        const auto& files = candidates.value();
        if (files.empty()) {
            FD_LOG_INFO(logger, log_category::orchestrator, "Inbox is empty");
        } else {
            FD_LOG_INFO(logger, log_category::orchestrator,
                        std::to_string(files.size()) + " file(s) to deliver");
        }

        const auto batch_size = config.pacing.batch_size;
        const auto batch_count = static_cast<uint32_t>((files.size() + batch_size - 1) / batch_size);
        for (std::size_t start = 0; start < files.size(); start += batch_size) {
            auto batch_number = static_cast<uint32_t>(start / batch_size) + 1;
            if (start > 0) {
                wait_until_ready();
            }

            delivery_event event;
            event.type = delivery_event::kind::batch_started;
            event.sequence = batch_number;
            event.limit = batch_count;
            emit(std::move(event));

            auto end = std::min(files.size(), start + batch_size);
            for (auto i = start; i < end; ++i) {
                outcome.files.push_back(deliver(files[i]));
            }
        }

        return finish(outcome, lock);
    }

    auto finish(run_result& outcome, instance_lock& lock) -> run_result {
        set_state(run_state::reporting);
        outcome.finished_at = clock->system_now();

        if (auto written = reporter.write(outcome); written) {
            outcome.report_path = written.value();
        } else {
            FD_LOG_ERROR(logger, log_category::report,
                         "Failed to write report: " + written.error().message);
        }

        if (auto released = lock.release(); !released) {
            FD_LOG_WARN(logger, log_category::lock,
                        "Failed to release lock: " + released.error().message);
        }

        FD_LOG_INFO(logger, log_category::orchestrator,
                    "Run " + outcome.run_id + " " + to_string(outcome.outcome) + ": " +
                        std::to_string(outcome.successful()) + " successful, " +
                        std::to_string(outcome.failed()) + " failed, " +
                        std::to_string(outcome.skipped()) + " skipped");

        set_state(terminal_state_for(outcome.outcome));
        notify_finished(outcome);
        return outcome;
    }

    void notify_finished(const run_result& outcome) {
        delivery_event event;
        event.type = delivery_event::kind::run_finished;
        event.message = outcome.message;
        emit(std::move(event));
        logger->flush();
    }

    void record_unattempted(run_result& outcome, const std::string& reason) {
        auto candidates = claims.list_candidates();
        if (!candidates) {
            return;
        }
        for (const auto& path : candidates.value()) {
            file_outcome file;
            file.name = path.filename().string();
            file.status = file_outcome_status::failed;
            file.error_message = reason;
            std::error_code ec;
            auto size = std::filesystem::file_size(path, ec);
            file.size = ec ? 0 : size;
            outcome.files.push_back(std::move(file));
        }
    }

    // ------------------------------------------------------------------------
    // Remote readiness
    // ------------------------------------------------------------------------

    auto wake_server() -> bool {
        const auto attempts = config.wakeup.max_attempts;
        for (std::size_t attempt = 1; attempt <= attempts; ++attempt) {
            delivery_event event;
            event.type = delivery_event::kind::wakeup_attempt;
            event.sequence = static_cast<uint32_t>(attempt);
            event.limit = static_cast<uint32_t>(attempts);
            emit(std::move(event));

            auto ping = remote.ping();
            if (ping) {
                snapshot.last_ping = ping.value();
                const auto& response = ping.value();
                bool key_ok = !remote.has_api_key() || response.key == key_status::valid;
                if (response.is_running() && key_ok) {
                    FD_LOG_INFO(logger, log_category::orchestrator,
                                "Server ready (" + response.environment + ", key user " +
                                    (response.key_user.empty() ? "-" : response.key_user) +
                                    ")");
                    return true;
                }
                if (response.is_running()) {
                    FD_LOG_WARN(logger, log_category::orchestrator,
                                std::string("Server running but API key is ") +
                                    to_string(response.key));
                } else {
                    FD_LOG_INFO(logger, log_category::orchestrator,
                                "Server not ready yet (status " + response.service_status +
                                    ")");
                }
            } else {
                FD_LOG_WARN(logger, log_category::orchestrator,
                            "Ping " + std::to_string(attempt) + "/" +
                                std::to_string(attempts) +
                                " failed: " + ping.error().message);
            }

            if (attempt < attempts) {
                clock->sleep_for(config.wakeup.interval);
            }
        }
        return false;
    }

    auto check_host_approval() -> result<void> {
        auto approval = snapshot.approval();
        const auto host = process_info::local_hostname();
        if (!approval) {
            FD_LOG_WARN(logger, log_category::orchestrator,
                        "Server did not report host approval; continuing");
            return {};
        }
        switch (*approval) {
            case host_approval::approved:
                FD_LOG_DEBUG(logger, log_category::orchestrator, "Host " + host + " approved");
                return {};
            case host_approval::pending:
                return unexpected{error{error_code::host_not_approved,
                                        "Host " + host +
                                            " is pending approval on the server"}};
            case host_approval::denied:
            default:
                return unexpected{error{error_code::host_not_approved,
                                        "Host " + host + " was denied by the server"}};
        }
    }

    void wait_until_ready() {
        for (std::size_t poll = 1;; ++poll) {
            auto status = remote.status();
            if (status) {
                snapshot.last_status = status.value();
                if (!status.value().busy) {
                    return;
                }
                const auto& counts = status.value().counts;
                FD_LOG_INFO(logger, log_category::orchestrator,
                            "Server busy (processing " + std::to_string(counts.processing) +
                                ", pending " + std::to_string(counts.pending) + ")");
            } else {
                FD_LOG_WARN(logger, log_category::orchestrator,
                            "Status check failed, treating server as busy: " +
                                status.error().message);
            }

            const auto limit = config.pacing.max_busy_polls;
            if (limit > 0 && poll >= limit) {
                FD_LOG_WARN(logger, log_category::orchestrator,
                            "Server still busy after " + std::to_string(poll) +
                                " polls; continuing");
                return;
            }

            delivery_event event;
            event.type = delivery_event::kind::waiting_for_server;
            event.sequence = static_cast<uint32_t>(poll);
            event.limit = static_cast<uint32_t>(limit);
            emit(std::move(event));

            clock->sleep_for(config.pacing.polling_interval);
        }
    }

    // ------------------------------------------------------------------------
    // Per-file pipeline
    // ------------------------------------------------------------------------

    auto deliver(const std::filesystem::path& path) -> file_outcome {
        file_outcome outcome;
        outcome.name = path.filename().string();
        const auto started = clock->steady_now();

        set_state(run_state::claim_pending);
        {
            delivery_event event;
            event.type = delivery_event::kind::file_started;
            event.file = outcome.name;
            emit(std::move(event));
        }

        auto claimed = claims.claim(path);
        if (!claimed) {
            outcome.status = file_outcome_status::skipped;
            outcome.error_message = "claimed by another process";
            FD_LOG_INFO(logger, log_category::orchestrator,
                        "Skipping " + outcome.name + ": " + outcome.error_message);
            return finish_file(std::move(outcome), started);
        }
        outcome.size = claimed->size;

        if (auto digest = checksum::sha256_file(claimed->claimed_path); digest) {
            outcome.sha256 = digest.value();
        } else {
            FD_LOG_WARN(logger, log_category::orchestrator,
                        "Cannot hash " + outcome.name + ", sending without checksum: " +
                            digest.error().message);
        }

        set_state(run_state::uploading);
        std::optional<upload_disposition> delivered;
        error last_error{error_code::internal_error, "no attempt made"};

        const auto max_attempts = config.retry.max_attempts;
        for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
            if (attempt > 1) {
                auto delay = config.retry.delay_before(attempt);
                FD_LOG_INFO(logger, log_category::orchestrator,
                            "Retrying " + outcome.name + " in " +
                                std::to_string(delay.count()) + " ms (attempt " +
                                std::to_string(attempt) + "/" +
                                std::to_string(max_attempts) + ")");
                clock->sleep_for(delay);
                claims.touch(*claimed);
            }
            outcome.attempts = static_cast<uint32_t>(attempt);

            const auto attempt_started = clock->steady_now();
            auto sent = transfer(*claimed, outcome);
            if (sent) {
                delivered = sent.value();
                break;
            }
            last_error = sent.error();

            delivery_log_context ctx;
            ctx.filename = outcome.name;
            ctx.file_size = outcome.size;
            ctx.attempt = outcome.attempts;
            ctx.duration_ms =
                static_cast<uint64_t>(elapsed_since(*clock, attempt_started).count());
            ctx.error_message = last_error.message;
            if (last_error.http_status != 0) {
                ctx.http_status = last_error.http_status;
            }
            FD_LOG_WARN_CTX(logger, log_category::orchestrator,
                            "Attempt " + std::to_string(attempt) + " for " + outcome.name +
                                " failed",
                            ctx);

            delivery_event event;
            event.type = delivery_event::kind::attempt_failed;
            event.file = outcome.name;
            event.sequence = outcome.attempts;
            event.limit = static_cast<uint32_t>(max_attempts);
            event.message = last_error.message;
            emit(std::move(event));
        }

        if (!delivered) {
            outcome.status = file_outcome_status::failed;
            outcome.error_message = last_error.message;
            return_to_inbox(*claimed);
            return finish_file(std::move(outcome), started);
        }

        set_state(run_state::finalizing);
        auto moved = claims.finalize(*claimed);
        if (!moved) {
            outcome.status = file_outcome_status::failed;
            outcome.error_message =
                "delivered but not moved to processed: " + moved.error().message;
            FD_LOG_ERROR(logger, log_category::orchestrator,
                         outcome.name + " " + outcome.error_message);
            return_to_inbox(*claimed);
            return finish_file(std::move(outcome), started);
        }

        outcome.destination = moved.value();
        outcome.status = (*delivered == upload_disposition::already_present)
                             ? file_outcome_status::already_present
                             : file_outcome_status::success;
        return finish_file(std::move(outcome), started);
    }

    auto transfer(const claimed_file& claimed, file_outcome& outcome)
        -> result<upload_disposition> {
        if (!config.chunking.requires_chunking(claimed.size)) {
            outcome.chunks = 0;
            auto ack = remote.upload_whole(claimed.claimed_path, claimed.name(), outcome.sha256);
            if (!ack) {
                return unexpected{ack.error()};
            }
            return ack.value().disposition;
        }

        // A retry always opens a new session.
        auto session = remote.start_session(claimed.name(), claimed.size, outcome.sha256);
        if (!session) {
            return unexpected{session.error()};
        }
        if (session.value().disposition == upload_disposition::already_present) {
            return upload_disposition::already_present;
        }

        auto chunks = splitter.split(claimed.claimed_path);
        if (!chunks) {
            return unexpected{chunks.error()};
        }
        auto& iterator = chunks.value();
        outcome.chunks = iterator.total_chunks();

        while (iterator.has_next()) {
            auto chunk = iterator.next();
            if (!chunk) {
                return unexpected{chunk.error()};
            }

            auto ack = remote.upload_chunk(session.value().id, claimed.name(), chunk.value());
            if (!ack) {
                return unexpected{ack.error()};
            }
            claims.touch(claimed);

            delivery_log_context ctx;
            ctx.filename = claimed.name();
            ctx.chunk_index = chunk.value().index;
            ctx.total_chunks = chunk.value().total_chunks;
            FD_LOG_DEBUG_CTX(logger, log_category::orchestrator, "Chunk sent", ctx);

            delivery_event event;
            event.type = delivery_event::kind::chunk_sent;
            event.file = claimed.name();
            event.chunk_index = chunk.value().index;
            event.total_chunks = chunk.value().total_chunks;
            event.bytes = chunk.value().data.size();
            emit(std::move(event));

            if (ack.value().disposition == upload_disposition::already_present) {
                return upload_disposition::already_present;
            }
        }
        return upload_disposition::accepted;
    }

    void return_to_inbox(const claimed_file& claimed) {
        auto restored = claims.unclaim(claimed);
        if (!restored) {
            FD_LOG_ERROR(logger, log_category::claim,
                         "Failed to return " + claimed.name() +
                             " to the inbox: " + restored.error().message);
        }
    }

    auto finish_file(file_outcome outcome, std::chrono::steady_clock::time_point started)
        -> file_outcome {
        outcome.elapsed = elapsed_since(*clock, started);

        delivery_log_context ctx;
        ctx.filename = outcome.name;
        ctx.file_size = outcome.size;
        ctx.attempt = outcome.attempts;
        ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());
        if (outcome.chunks > 0) {
            ctx.total_chunks = outcome.chunks;
        }
        if (!outcome.error_message.empty()) {
            ctx.error_message = outcome.error_message;
        }

        if (outcome.status == file_outcome_status::failed) {
            FD_LOG_ERROR_CTX(logger, log_category::orchestrator,
                             "Delivery failed: " + outcome.name, ctx);
        } else if (outcome.delivered()) {
            FD_LOG_INFO_CTX(logger, log_category::orchestrator,
                            std::string("Delivered ") + outcome.name + " (" +
                                to_string(outcome.status) + ")",
                            ctx);
        }

        delivery_event event;
        event.type = delivery_event::kind::file_finished;
        event.file = outcome.name;
        event.bytes = outcome.size;
        event.outcome = outcome;
        emit(std::move(event));
        return outcome;
    }
};

// ============================================================================
// upload_orchestrator
// ============================================================================

upload_orchestrator::upload_orchestrator(delivery_config config,
                                         std::shared_ptr<http_client_factory> factory,
                                         std::shared_ptr<delivery_clock> clock,
                                         std::shared_ptr<delivery_logger> logger)
    : impl_(std::make_unique<impl>(std::move(config), std::move(factory), std::move(clock),
                                   std::move(logger))) {}

upload_orchestrator::~upload_orchestrator() = default;

upload_orchestrator::upload_orchestrator(upload_orchestrator&&) noexcept = default;
auto upload_orchestrator::operator=(upload_orchestrator&&) noexcept
    -> upload_orchestrator& = default;

auto upload_orchestrator::run() -> result<run_result> {
    return impl_->run();
}

void upload_orchestrator::on_event(delivery_event_handler handler) {
    impl_->event_handler = std::move(handler);
}

auto upload_orchestrator::state() const -> run_state {
    return impl_->current_state;
}

auto upload_orchestrator::snapshot() const -> const server_snapshot& {
    return impl_->snapshot;
}

auto upload_orchestrator::config() const -> const delivery_config& {
    return impl_->config;
}

}  // namespace kcenon::file_delivery
