/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 helpers
 */

#include <gtest/gtest.h>

#include <kcenon/file_delivery/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace kcenon::file_delivery::test {

namespace {

auto as_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    std::memcpy(bytes.data(), text.data(), text.size());
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "file_delivery_test_checksum";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const std::string& content) -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, EmptyInputDigest) {
    EXPECT_EQ(checksum::sha256({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, KnownVector) {
    auto bytes = as_bytes("abc");
    EXPECT_EQ(checksum::sha256(bytes),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, FileMatchesInMemoryDigest) {
    std::string content;
    for (int i = 0; i < 300000; ++i) {
        content += static_cast<char>('a' + (i % 26));
    }
    auto path = write_file("large.txt", content);

    auto digest = checksum::sha256_file(path);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), checksum::sha256(as_bytes(content)));
    EXPECT_EQ(digest.value().size(), 64u);
}

TEST_F(ChecksumTest, EmptyFile) {
    auto path = write_file("empty.txt", "");
    auto digest = checksum::sha256_file(path);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, MissingFileIsReadError) {
    auto digest = checksum::sha256_file(test_dir_ / "missing.bin");
    ASSERT_FALSE(digest.has_value());
    EXPECT_EQ(digest.error().code, error_code::file_read_error);
}

}  // namespace kcenon::file_delivery::test
