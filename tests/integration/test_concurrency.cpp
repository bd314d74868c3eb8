/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for claims and parallel delivery runs
 *
 * This file contains tests for:
 * - Claim races between workers sharing one inbox
 * - Independent agents running at the same time against one service
 */

#include "test_fixtures.h"

#include <atomic>
#include <latch>
#include <thread>
#include <vector>

namespace kcenon::file_delivery::test {

// =============================================================================
// Claim races
// =============================================================================

class ClaimRaceTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        inbox_ = test_dir_ / "inbox";
        processed_ = test_dir_ / "processed";
        std::filesystem::create_directories(inbox_);
        std::filesystem::create_directories(processed_);
    }

    auto make_store() -> claim_store {
        return claim_store(claim_store_config{inbox_, processed_});
    }

    std::filesystem::path inbox_;
    std::filesystem::path processed_;
};

TEST_F(ClaimRaceTest, EachFileIsClaimedExactlyOnce) {
    constexpr int file_count = 200;
    constexpr int worker_count = 8;
    for (int i = 0; i < file_count; ++i) {
        create_text_file(inbox_, "file_" + std::to_string(i) + ".txt", std::to_string(i));
    }

    auto store = make_store();
    auto candidates = store.list_candidates();
    ASSERT_TRUE(candidates.has_value());
    ASSERT_EQ(candidates.value().size(), static_cast<std::size_t>(file_count));

    std::mutex claimed_mutex;
    std::vector<std::string> claimed_names;
    std::latch start(worker_count);

    std::vector<std::thread> workers;
    for (int w = 0; w < worker_count; ++w) {
        workers.emplace_back([&] {
            auto local = make_store();
            start.arrive_and_wait();
            for (const auto& path : candidates.value()) {
                if (auto claimed = local.claim(path)) {
                    std::lock_guard<std::mutex> guard(claimed_mutex);
                    claimed_names.push_back(claimed->name());
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(claimed_names.size(), static_cast<std::size_t>(file_count));
    std::set<std::string> unique(claimed_names.begin(), claimed_names.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(file_count));

    auto remaining = store.list_candidates();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_TRUE(remaining.value().empty());
}

TEST_F(ClaimRaceTest, ClaimAndUnclaimInterleaveWithoutLoss) {
    constexpr int worker_count = 4;
    constexpr int rounds = 100;
    create_text_file(inbox_, "shared.txt", "payload");

    std::atomic<int> successful_claims{0};
    std::latch start(worker_count);

    std::vector<std::thread> workers;
    for (int w = 0; w < worker_count; ++w) {
        workers.emplace_back([&] {
            auto local = make_store();
            start.arrive_and_wait();
            for (int i = 0; i < rounds; ++i) {
                if (auto claimed = local.claim(inbox_ / "shared.txt")) {
                    ++successful_claims;
                    EXPECT_TRUE(local.unclaim(*claimed).has_value());
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_GT(successful_claims.load(), 0);
    EXPECT_EQ(list_names(inbox_), (std::set<std::string>{"shared.txt"}));
    EXPECT_EQ(read_file(inbox_ / "shared.txt"), "payload");
}

// =============================================================================
// Parallel agents
// =============================================================================

class ParallelAgentsTest : public TempDirectoryFixture {};

TEST_F(ParallelAgentsTest, SeparateBaseFoldersDeliverIndependently) {
    constexpr int agent_count = 4;
    constexpr int files_per_agent = 6;

    auto server = std::make_shared<mock_http_server>();
    fake_upload_service service;
    service.install(*server);
    auto factory = std::make_shared<mock_http_factory>(server);

    std::vector<delivery_config> configs;
    for (int a = 0; a < agent_count; ++a) {
        auto base = test_dir_ / ("agent_" + std::to_string(a));
        for (int f = 0; f < files_per_agent; ++f) {
            create_file(base / "inbox",
                        "a" + std::to_string(a) + "_f" + std::to_string(f) + ".bin",
                        1024 + static_cast<std::size_t>(f));
        }
        delivery_config config;
        config.base_dir = base;
        config.remote.base_url = "https://ingest.test";
        config.remote.api_key = "secret-api-key-123";
        config.pacing.batch_size = 2;
        configs.push_back(std::move(config));
    }

    std::vector<run_result> results(agent_count);
    std::vector<std::thread> agents;
    for (int a = 0; a < agent_count; ++a) {
        agents.emplace_back([&, a] {
            upload_orchestrator orchestrator(configs[a], factory, std::make_shared<manual_clock>());
            auto outcome = orchestrator.run();
            if (outcome.has_value()) {
                results[a] = outcome.value();
            }
        });
    }
    for (auto& agent : agents) {
        agent.join();
    }

    for (int a = 0; a < agent_count; ++a) {
        EXPECT_EQ(results[a].outcome, run_outcome::completed) << "agent " << a;
        EXPECT_EQ(results[a].successful(), static_cast<std::size_t>(files_per_agent));
        EXPECT_EQ(list_names(configs[a].processed_dir()).size(),
                  static_cast<std::size_t>(files_per_agent));
    }
    EXPECT_EQ(server->count("/api/uploader/upload"),
              static_cast<std::size_t>(agent_count * files_per_agent));
}

}  // namespace kcenon::file_delivery::test
