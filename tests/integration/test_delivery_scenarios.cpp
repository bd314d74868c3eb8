/**
 * @file test_delivery_scenarios.cpp
 * @brief End-to-end delivery runs against the in-memory upload service
 */

#include "test_fixtures.h"

namespace kcenon::file_delivery::test {

namespace {

constexpr std::size_t KiB = 1024;
constexpr std::size_t MiB = 1024 * 1024;

auto small_chunks() -> chunk_config {
    return chunk_config(chunk_config::min_chunk_size, chunk_config::min_chunk_size);
}

auto contains(const std::vector<std::chrono::milliseconds>& sleeps,
              std::chrono::milliseconds value) -> bool {
    return std::find(sleeps.begin(), sleeps.end(), value) != sleeps.end();
}

}  // namespace

// ============================================================================
// Successful runs
// ============================================================================

class DeliveryScenarioTest : public DeliveryFixture {};

TEST_F(DeliveryScenarioTest, SmallFileWholeAndLargeFileChunked) {
    create_file(inbox_, "a.txt", 10 * KiB);
    create_file(inbox_, "b.bin", 40 * MiB);

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_EQ(run.total(), 2u);
    EXPECT_EQ(run.successful(), 2u);
    EXPECT_EQ(run.failed(), 0u);
    EXPECT_EQ(run.exit_code(), 0);

    ASSERT_EQ(service_.whole_uploads.size(), 1u);
    EXPECT_EQ(service_.whole_uploads[0], "a.txt");
    ASSERT_EQ(service_.sessions_started.size(), 1u);
    EXPECT_EQ(service_.sessions_started[0], "b.bin");
    EXPECT_EQ(service_.chunks_by_session["session-1"].size(), 2u);

    auto* large = find_outcome(run, "b.bin");
    ASSERT_NE(large, nullptr);
    EXPECT_EQ(large->chunks, 2u);
    EXPECT_EQ(large->size, 40 * MiB);
    EXPECT_EQ(large->attempts, 1u);

    EXPECT_EQ(list_names(processed_), (std::set<std::string>{"a.txt", "b.bin"}));
    EXPECT_TRUE(list_names(inbox_).empty());
    EXPECT_FALSE(std::filesystem::exists(logs_ / "uploader.lock"));
    ASSERT_TRUE(run.report_path.has_value());
    EXPECT_TRUE(std::filesystem::exists(*run.report_path));
}

TEST_F(DeliveryScenarioTest, ChecksumMatchesDeliveredFile) {
    create_file(inbox_, "a.txt", 10 * KiB);

    auto run = run_once();

    auto* file = find_outcome(run, "a.txt");
    ASSERT_NE(file, nullptr);
    ASSERT_TRUE(file->destination.has_value());
    auto expected = checksum::sha256_file(*file->destination);
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(file->sha256, expected.value());

    bool header_seen = false;
    for (const auto& request : server_->requests()) {
        if (request.path_ends_with("/api/uploader/upload")) {
            EXPECT_EQ(request.header("X-Content-SHA256"), expected.value());
            header_seen = true;
        }
    }
    EXPECT_TRUE(header_seen);
}

TEST_F(DeliveryScenarioTest, RequestsCarryKeyAndUserAgent) {
    create_file(inbox_, "a.txt", KiB);

    run_once();

    auto requests = server_->requests();
    ASSERT_FALSE(requests.empty());
    for (const auto& request : requests) {
        EXPECT_EQ(request.header("X-API-Key"), "secret-api-key-123") << request.url;
        EXPECT_EQ(request.header("User-Agent").rfind("file-delivery-agent/", 0), 0u);
    }
}

TEST_F(DeliveryScenarioTest, ApiKeyNeverReachesLog) {
    create_file(inbox_, "a.txt", KiB);

    run_once();

    std::lock_guard<std::mutex> guard(log_mutex_);
    for (const auto& line : log_lines_) {
        EXPECT_EQ(line.find("secret-api-key-123"), std::string::npos) << line;
    }
}

TEST_F(DeliveryScenarioTest, EmptyInboxCompletes) {
    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_EQ(run.total(), 0u);
    EXPECT_EQ(run.exit_code(), 0);
    EXPECT_TRUE(logged("Inbox is empty"));
}

TEST_F(DeliveryScenarioTest, CreatesMissingFolders) {
    std::filesystem::remove_all(base_dir_);

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_TRUE(std::filesystem::is_directory(inbox_));
    EXPECT_TRUE(std::filesystem::is_directory(processed_));
    EXPECT_TRUE(std::filesystem::is_directory(logs_));
}

TEST_F(DeliveryScenarioTest, EmitsEventsForEveryFile) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);

    run_once();

    EXPECT_EQ(count_events(delivery_event::kind::file_started), 2u);
    EXPECT_EQ(count_events(delivery_event::kind::file_finished), 2u);
    EXPECT_EQ(count_events(delivery_event::kind::run_finished), 1u);
    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.back().type, delivery_event::kind::run_finished);
    EXPECT_EQ(events_.back().state, run_state::done);
}

// ============================================================================
// Retry
// ============================================================================

TEST_F(DeliveryScenarioTest, TransientFailureIsRetried) {
    create_file(inbox_, "a.txt", KiB);
    service_.upload_codes["a.txt"] = {500, 200};

    auto run = run_once();

    auto* file = find_outcome(run, "a.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::success);
    EXPECT_EQ(file->attempts, 2u);
    EXPECT_TRUE(contains(clock_->sleeps(), std::chrono::milliseconds(1000)));
    EXPECT_EQ(count_events(delivery_event::kind::attempt_failed), 1u);
}

TEST_F(DeliveryScenarioTest, RetryBoundReturnsFileToInbox) {
    auto original = create_file(inbox_, "a.txt", 10 * KiB);
    auto content = read_file(original);
    service_.upload_codes["a.txt"] = {500};

    auto run = run_once();

    auto* file = find_outcome(run, "a.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::failed);
    EXPECT_EQ(file->attempts, 3u);
    EXPECT_NE(file->error_message.find("HTTP 500"), std::string::npos);
    EXPECT_EQ(server_->count("/api/uploader/upload"), 3u);

    auto sleeps = clock_->sleeps();
    EXPECT_TRUE(contains(sleeps, std::chrono::milliseconds(1000)));
    EXPECT_TRUE(contains(sleeps, std::chrono::milliseconds(2000)));
    EXPECT_FALSE(contains(sleeps, std::chrono::milliseconds(4000)));

    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"a.txt"}));
    EXPECT_EQ(read_file(inbox_ / "a.txt"), content);
    EXPECT_TRUE(list_names(processed_).empty());
    EXPECT_EQ(run.failed(), 1u);
    EXPECT_EQ(run.exit_code(), 1);
}

TEST_F(DeliveryScenarioTest, ConfiguredAttemptCountIsHonored) {
    create_file(inbox_, "a.txt", KiB);
    service_.upload_codes["a.txt"] = {503};

    auto config = make_config();
    config.retry.max_attempts = 5;
    auto run = run_once(config);

    EXPECT_EQ(server_->count("/api/uploader/upload"), 5u);
    auto* file = find_outcome(run, "a.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->attempts, 5u);
}

TEST_F(DeliveryScenarioTest, ChunkFailureRestartsWithNewSession) {
    create_file(inbox_, "big.bin", 150 * KiB);
    service_.failing_chunks = 1;

    auto config = make_config();
    config.chunking = small_chunks();
    auto run = run_once(config);

    auto* file = find_outcome(run, "big.bin");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::success);
    EXPECT_EQ(file->attempts, 2u);
    EXPECT_EQ(file->chunks, 3u);
    ASSERT_EQ(service_.sessions_started.size(), 2u);
    EXPECT_TRUE(service_.chunks_by_session["session-1"].empty());
    EXPECT_EQ(service_.chunks_by_session["session-2"].size(), 3u);
}

// ============================================================================
// Duplicates
// ============================================================================

TEST_F(DeliveryScenarioTest, ConflictCountsAsAlreadyPresent) {
    create_file(inbox_, "a.txt", KiB);
    service_.upload_codes["a.txt"] = {409};

    auto run = run_once();

    auto* file = find_outcome(run, "a.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::already_present);
    EXPECT_EQ(file->attempts, 1u);
    EXPECT_EQ(run.successful(), 1u);
    EXPECT_EQ(run.exit_code(), 0);
    EXPECT_EQ(list_names(processed_), (std::set<std::string>{"a.txt"}));
}

TEST_F(DeliveryScenarioTest, SessionConflictSkipsChunks) {
    create_file(inbox_, "big.bin", 150 * KiB);
    service_.session_codes["big.bin"] = {409};

    auto config = make_config();
    config.chunking = small_chunks();
    auto run = run_once(config);

    auto* file = find_outcome(run, "big.bin");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::already_present);
    EXPECT_EQ(server_->count("/upload-chunk"), 0u);
}

TEST_F(DeliveryScenarioTest, DuplicateNameInProcessedGetsSuffix) {
    create_text_file(processed_, "dup.txt", "first");
    create_text_file(processed_, "dup (1).txt", "second");
    create_text_file(inbox_, "dup.txt", "third");

    auto run = run_once();

    auto* file = find_outcome(run, "dup.txt");
    ASSERT_NE(file, nullptr);
    ASSERT_TRUE(file->destination.has_value());
    EXPECT_EQ(file->destination->filename().string(), "dup (2).txt");
    EXPECT_EQ(read_file(processed_ / "dup.txt"), "first");
    EXPECT_EQ(read_file(processed_ / "dup (1).txt"), "second");
    EXPECT_EQ(read_file(processed_ / "dup (2).txt"), "third");
}

TEST_F(DeliveryScenarioTest, FileClaimedElsewhereIsSkipped) {
    create_text_file(inbox_, "x.txt", "mine");
    create_text_file(inbox_, "x.txt.uploading", "theirs");
    create_text_file(inbox_, "y.txt", "other");

    auto run = run_once();

    auto* skipped = find_outcome(run, "x.txt");
    ASSERT_NE(skipped, nullptr);
    EXPECT_EQ(skipped->status, file_outcome_status::skipped);
    EXPECT_EQ(run.skipped(), 1u);
    EXPECT_EQ(run.successful(), 1u);
    EXPECT_EQ(run.exit_code(), 0);
    EXPECT_EQ(read_file(inbox_ / "x.txt"), "mine");
    EXPECT_EQ(read_file(inbox_ / "x.txt.uploading"), "theirs");
}

// ============================================================================
// Wake-up and host approval
// ============================================================================

TEST_F(DeliveryScenarioTest, WakeUpToleratesEarlyFailures) {
    create_file(inbox_, "a.txt", KiB);
    service_.failing_pings = 3;

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_EQ(server_->count("/api/uploader/ping"), 4u);
    auto sleeps = clock_->sleeps();
    ASSERT_GE(sleeps.size(), 3u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(5000));
    EXPECT_EQ(sleeps[2], std::chrono::milliseconds(5000));
}

TEST_F(DeliveryScenarioTest, UnresponsiveServerFailsFilesWithoutClaiming) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);
    service_.failing_pings = 1000;

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::server_unresponsive);
    EXPECT_EQ(server_->count("/api/uploader/ping"), 30u);
    EXPECT_EQ(clock_->sleeps().size(), 29u);
    EXPECT_EQ(clock_->total_slept(), std::chrono::milliseconds(29 * 5000));
    EXPECT_EQ(server_->count("/api/uploader/upload"), 0u);

    EXPECT_EQ(run.failed(), 2u);
    for (const auto& file : run.files) {
        EXPECT_EQ(file.attempts, 0u);
    }
    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(run.exit_code(), 1);
    ASSERT_TRUE(run.report_path.has_value());
    EXPECT_FALSE(std::filesystem::exists(logs_ / "uploader.lock"));
}

TEST_F(DeliveryScenarioTest, InvalidKeyIsNotReady) {
    service_.ping_body = R"({"serviceStatus":"running","keyStatus":"invalid"})";
    auto config = make_config();
    config.wakeup.max_attempts = 3;

    auto run = run_once(config);

    EXPECT_EQ(run.outcome, run_outcome::server_unresponsive);
    EXPECT_EQ(server_->count("/api/uploader/ping"), 3u);
    EXPECT_TRUE(logged("API key is invalid"));
}

TEST_F(DeliveryScenarioTest, PendingHostAbortsBeforeAnyClaim) {
    create_file(inbox_, "a.txt", KiB);
    service_.ping_body =
        R"({"serviceStatus":"running","keyStatus":"valid",)"
        R"("hostStatus":{"hostname":"agent-host","isApproved":false,"approvalStatus":"pending"}})";

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::host_not_approved);
    EXPECT_TRUE(run.files.empty());
    EXPECT_EQ(run.exit_code(), 1);
    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"a.txt"}));
    EXPECT_EQ(server_->count("/api/uploader/upload"), 0u);
    EXPECT_NE(run.message.find("pending approval"), std::string::npos);
}

TEST_F(DeliveryScenarioTest, DeniedHostAborts) {
    create_file(inbox_, "a.txt", KiB);
    service_.ping_body =
        R"({"serviceStatus":"running","keyStatus":"valid","hostApproval":"denied"})";

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::host_not_approved);
    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"a.txt"}));
}

TEST_F(DeliveryScenarioTest, MissingApprovalProceedsWithWarning) {
    create_file(inbox_, "a.txt", KiB);
    service_.ping_body = R"({"serviceStatus":"running","keyStatus":"valid"})";

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_EQ(run.successful(), 1u);
    EXPECT_TRUE(logged("did not report host approval"));
}

// ============================================================================
// Batch pacing
// ============================================================================

TEST_F(DeliveryScenarioTest, WaitsWhileServerBusyBetweenBatches) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);
    create_file(inbox_, "c.txt", KiB);
    service_.status_bodies = {fake_upload_service::busy_status, fake_upload_service::busy_status,
                              fake_upload_service::idle_status};

    auto config = make_config();
    config.pacing.batch_size = 2;
    auto run = run_once(config);

    EXPECT_EQ(run.successful(), 3u);
    EXPECT_EQ(server_->count("/api/uploader/status"), 3u);
    EXPECT_EQ(count_events(delivery_event::kind::batch_started), 2u);
    EXPECT_EQ(count_events(delivery_event::kind::waiting_for_server), 2u);

    auto sleeps = clock_->sleeps();
    EXPECT_EQ(std::count(sleeps.begin(), sleeps.end(), std::chrono::milliseconds(10000)), 2);
}

TEST_F(DeliveryScenarioTest, FirstBatchDoesNotPollStatus) {
    create_file(inbox_, "a.txt", KiB);

    run_once();

    EXPECT_EQ(server_->count("/api/uploader/status"), 0u);
}

TEST_F(DeliveryScenarioTest, StatusFailureCountsAsBusyAndIsBounded) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);
    service_.status_bodies = {"not json"};

    auto config = make_config();
    config.pacing.batch_size = 1;
    config.pacing.max_busy_polls = 2;
    auto run = run_once(config);

    EXPECT_EQ(run.successful(), 2u);
    EXPECT_EQ(server_->count("/api/uploader/status"), 2u);
    EXPECT_TRUE(logged("still busy after 2 polls"));
}

TEST_F(DeliveryScenarioTest, LegacyStatusPathIsUsedWhenConfigured) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);
    service_.status_bodies = {R"({"queue":{"active":0,"waiting":0,"completed":1,"failed":0},)"
                              R"("maxConcurrent":2,"isBusy":false})"};

    auto config = make_config();
    config.pacing.batch_size = 1;
    config.remote.endpoints.status = remote_endpoints::legacy_status_path;
    auto run = run_once(config);

    EXPECT_EQ(run.successful(), 2u);
    EXPECT_EQ(server_->count("/api/uploader/batch-status"), 1u);
}

// ============================================================================
// Coordination
// ============================================================================

TEST_F(DeliveryScenarioTest, LockConflictTouchesNothing) {
    create_file(inbox_, "a.txt", KiB);
    instance_lock holder(instance_lock_config{logs_ / "uploader.lock"}, clock_);
    ASSERT_TRUE(holder.acquire().has_value());

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::lock_conflict);
    EXPECT_EQ(run.exit_code(), 1);
    EXPECT_TRUE(server_->requests().empty());
    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"a.txt"}));
    EXPECT_FALSE(run.report_path.has_value());
    EXPECT_TRUE(std::filesystem::exists(logs_ / "uploader.lock"));
    EXPECT_NE(run.message.find("already running"), std::string::npos);
}

TEST_F(DeliveryScenarioTest, StaleLockFromAnotherHostIsOverridden) {
    create_file(inbox_, "a.txt", KiB);
    std::filesystem::create_directories(logs_);

    lock_token stale;
    stale.pid = 4242;
    stale.hostname = "other-host";
    stale.timestamp = to_unix_seconds(clock_->system_now() - std::chrono::minutes(45));
    stale.started_at = format_iso8601(clock_->system_now() - std::chrono::minutes(45));
    std::ofstream(logs_ / "uploader.lock") << stale.to_json();

    auto run = run_once();

    EXPECT_EQ(run.outcome, run_outcome::completed);
    EXPECT_EQ(run.successful(), 1u);
    EXPECT_TRUE(logged("Stale lock"));
}

TEST_F(DeliveryScenarioTest, AbandonedClaimIsRecovered) {
    auto claimed = create_text_file(inbox_, "old.txt.uploading", "left behind");
    auto two_hours_ago = std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(clock_->system_now() - std::chrono::hours(2)));
    std::filesystem::last_write_time(claimed, two_hours_ago);

    auto run = run_once();

    EXPECT_EQ(run.recovered_claims, 1u);
    auto* file = find_outcome(run, "old.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->status, file_outcome_status::success);
    EXPECT_EQ(read_file(processed_ / "old.txt"), "left behind");
}

TEST_F(DeliveryScenarioTest, ClaimSweepCanBeDisabled) {
    auto claimed = create_text_file(inbox_, "old.txt.uploading", "left behind");
    auto two_hours_ago = std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(clock_->system_now() - std::chrono::hours(2)));
    std::filesystem::last_write_time(claimed, two_hours_ago);

    auto config = make_config();
    config.claim_stale_after = std::chrono::seconds(0);
    auto run = run_once(config);

    EXPECT_EQ(run.recovered_claims, 0u);
    EXPECT_TRUE(std::filesystem::exists(claimed));
}

// ============================================================================
// Report
// ============================================================================

TEST_F(DeliveryScenarioTest, ReportSummarizesRun) {
    create_file(inbox_, "a.txt", KiB);
    create_file(inbox_, "b.txt", KiB);
    service_.upload_codes["b.txt"] = {500};

    auto run = run_once();

    ASSERT_TRUE(run.report_path.has_value());
    EXPECT_EQ(run.report_path->parent_path(), logs_);
    EXPECT_EQ(run.report_path->filename().string().rfind("upload-report-", 0), 0u);

    auto report = read_file(*run.report_path);
    EXPECT_NE(report.find("\"successful\": 1"), std::string::npos);
    EXPECT_NE(report.find("\"failed\": 1"), std::string::npos);
    EXPECT_NE(report.find("\"skipped\": 0"), std::string::npos);
    EXPECT_NE(report.find("\"name\": \"a.txt\""), std::string::npos);
    EXPECT_NE(report.find("\"status\": \"failed\""), std::string::npos);
}

TEST_F(DeliveryScenarioTest, SecondRunInSameSecondGetsOwnReport) {
    create_file(inbox_, "a.txt", KiB);
    auto first = run_once();
    create_file(inbox_, "b.txt", KiB);
    auto second = run_once();

    ASSERT_TRUE(first.report_path.has_value());
    ASSERT_TRUE(second.report_path.has_value());
    EXPECT_NE(*first.report_path, *second.report_path);
    EXPECT_TRUE(std::filesystem::exists(*first.report_path));
}

TEST_F(DeliveryScenarioTest, InvalidConfigurationIsRejected) {
    auto config = make_config();
    config.remote.api_key.clear();

    auto orchestrator = make_orchestrator(config);
    auto outcome = orchestrator->run();

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::missing_api_key);
    EXPECT_TRUE(server_->requests().empty());
}

}  // namespace kcenon::file_delivery::test
