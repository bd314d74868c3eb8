/**
 * @file test_config_loader.cpp
 * @brief Unit tests for configuration file parsing and CLI merging
 */

#include <gtest/gtest.h>

#include <kcenon/file_delivery/config/config_loader.h>

#include <filesystem>
#include <fstream>
#include <random>

namespace kcenon::file_delivery::test {

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_delivery_test_config_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_config(const std::string& content) -> std::filesystem::path {
        auto path = test_dir_ / "config.json";
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigLoaderTest, ParsesCamelCaseKeys) {
    auto parsed = config_loader::parse(R"({
        "url": "https://ingest.example.com",
        "key": "abc",
        "folder": "/srv/delivery",
        "batchSize": 8,
        "pollingInterval": 15,
        "chunkThresholdMb": 50,
        "maxRetries": 4,
        "statusPath": "/api/uploader/batch-status"
    })");

    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    const auto& o = parsed.value();
    EXPECT_EQ(o.url, "https://ingest.example.com");
    EXPECT_EQ(o.api_key, "abc");
    EXPECT_EQ(o.folder, std::filesystem::path("/srv/delivery"));
    EXPECT_EQ(o.batch_size, 8u);
    EXPECT_EQ(o.polling_interval, std::chrono::seconds(15));
    EXPECT_EQ(o.chunk_threshold_mb, 50u);
    EXPECT_EQ(o.max_retries, 4u);
    EXPECT_EQ(o.status_path, "/api/uploader/batch-status");
}

TEST_F(ConfigLoaderTest, ParsesSnakeCaseKeys) {
    auto parsed = config_loader::parse(
        R"({"api_key":"abc","batch_size":2,"polling_interval":"20","max_retries":1})");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().api_key, "abc");
    EXPECT_EQ(parsed.value().batch_size, 2u);
    EXPECT_EQ(parsed.value().polling_interval, std::chrono::seconds(20));
    EXPECT_EQ(parsed.value().max_retries, 1u);
}

TEST_F(ConfigLoaderTest, MissingKeysStayUnset) {
    auto parsed = config_loader::parse(R"({"url":"https://x"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed.value().api_key.has_value());
    EXPECT_FALSE(parsed.value().folder.has_value());
    EXPECT_FALSE(parsed.value().batch_size.has_value());
}

TEST_F(ConfigLoaderTest, RejectsNonObject) {
    auto parsed = config_loader::parse(R"(["url"])");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::config_parse_error);
}

TEST_F(ConfigLoaderTest, RejectsBadCounts) {
    auto negative = config_loader::parse(R"({"batchSize":-1})");
    ASSERT_FALSE(negative.has_value());
    EXPECT_NE(negative.error().message.find("batchSize"), std::string::npos);

    auto text = config_loader::parse(R"({"pollingInterval":"soon"})");
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, error_code::config_parse_error);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigLoaderTest, LoadsFile) {
    auto path = write_config(R"({"url":"https://ingest.example.com","key":"abc"})");
    auto loaded = config_loader::load_file(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().url, "https://ingest.example.com");
}

TEST_F(ConfigLoaderTest, MissingFile) {
    auto loaded = config_loader::load_file(test_dir_ / "absent.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::file_not_found);
}

TEST_F(ConfigLoaderTest, ParseErrorNamesFile) {
    auto path = write_config("url = https://x");
    auto loaded = config_loader::load_file(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::config_parse_error);
    EXPECT_NE(loaded.error().message.find(path.string()), std::string::npos);
}

// ============================================================================
// Merging
// ============================================================================

TEST_F(ConfigLoaderTest, CliWins) {
    config_overrides file;
    file.url = "https://from-file";
    file.api_key = "file-key";
    file.batch_size = 3;

    config_overrides cli;
    cli.url = "https://from-cli";
    cli.folder = "/cli/folder";

    auto merged = config_loader::merge(file, cli);
    EXPECT_EQ(merged.url, "https://from-cli");
    EXPECT_EQ(merged.api_key, "file-key");
    EXPECT_EQ(merged.folder, std::filesystem::path("/cli/folder"));
    EXPECT_EQ(merged.batch_size, 3u);
}

TEST_F(ConfigLoaderTest, ToDeliveryConfigAppliesOverrides) {
    config_overrides o;
    o.url = "https://ingest.example.com";
    o.api_key = "abc";
    o.folder = "/srv/delivery";
    o.batch_size = 9;
    o.polling_interval = std::chrono::seconds(3);
    o.chunk_threshold_mb = 10;
    o.max_retries = 5;
    o.status_path = "/api/uploader/batch-status";

    auto config = config_loader::to_delivery_config(o);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.base_dir, std::filesystem::path("/srv/delivery"));
    EXPECT_EQ(c.pacing.batch_size, 9u);
    EXPECT_EQ(c.pacing.polling_interval, std::chrono::milliseconds(3000));
    EXPECT_EQ(c.chunking.chunk_size, 10u * 1024 * 1024);
    EXPECT_EQ(c.chunking.threshold, 10u * 1024 * 1024);
    EXPECT_EQ(c.retry.max_attempts, 5u);
    EXPECT_EQ(c.remote.endpoints.status, "/api/uploader/batch-status");
}

TEST_F(ConfigLoaderTest, ToDeliveryConfigValidates) {
    config_overrides o;
    o.url = "https://ingest.example.com";
    o.folder = "/srv/delivery";

    auto config = config_loader::to_delivery_config(o);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::missing_api_key);
}

TEST_F(ConfigLoaderTest, ZeroThresholdIsRejected) {
    config_overrides o;
    o.url = "https://ingest.example.com";
    o.api_key = "abc";
    o.folder = "/srv/delivery";
    o.chunk_threshold_mb = 0;

    auto config = config_loader::to_delivery_config(o);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_chunk_size);
}

}  // namespace kcenon::file_delivery::test
