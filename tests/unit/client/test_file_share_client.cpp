/**
 * @file test_file_share_client.cpp
 * @brief Unit tests for file_share_client
 */

#include <gtest/gtest.h>

#include <fileshare/client/file_share_client.h>
#include <fileshare/client/transfer_ledger.h>
#include <fileshare/config/feature_flags.h>

#include "unit/client/mock_http_client.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>

namespace fileshare::test {

namespace fs = std::filesystem;

class FileShareClientTest : public ::testing::Test {
protected:
    static constexpr const char* server_url = "http://srv:8080";

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("fileshare_test_client_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        fs::create_directories(test_dir_);
        http_ = std::make_shared<mock_http_client>();

        auto client = file_share_client::builder()
            .with_server_url(server_url)
            .with_save_directory(test_dir_ / "out")
            .with_concurrency(3)
            .with_ledger_path(test_dir_ / "state.json")
            .with_http_client(http_)
            .build();
        ASSERT_TRUE(client) << client.error().message;
        client_.emplace(std::move(client.value()));
    }

    void TearDown() override {
        client_.reset();
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    fs::path test_dir_;
    std::shared_ptr<mock_http_client> http_;
    std::optional<file_share_client> client_;
};

// ============================================================================
// Builder
// ============================================================================

TEST_F(FileShareClientTest, BuilderKeepsConfiguration) {
    const auto& config = client_->config();
    EXPECT_EQ(config.server_url, server_url);
    EXPECT_EQ(config.save_directory, test_dir_ / "out");
    EXPECT_EQ(config.concurrency, 3u);
    EXPECT_EQ(config.ledger_path, test_dir_ / "state.json");
}

TEST_F(FileShareClientTest, RequestTimeoutDefaultsToNone) {
    EXPECT_EQ(client_->config().request_timeout, std::chrono::milliseconds::zero());

    auto client = file_share_client::builder()
        .with_server_url(server_url)
        .with_save_directory(test_dir_ / "out")
        .with_request_timeout(std::chrono::seconds(90))
        .with_http_client(http_)
        .build();
    ASSERT_TRUE(client);
    EXPECT_EQ(client.value().config().request_timeout, std::chrono::seconds(90));
}

TEST(NetworkHttpClientTest, ZeroTimeoutWaitsIndefinitely) {
    network_http_client unbounded;
    EXPECT_GE(unbounded.effective_timeout(), std::chrono::hours(24));

    network_http_client bounded(std::chrono::seconds(5));
    EXPECT_EQ(bounded.effective_timeout(), std::chrono::seconds(5));
}

TEST(NetworkHttpClientTest, AvailabilityFollowsBuild) {
    network_http_client client(std::chrono::milliseconds(200));
#if KCENON_WITH_NETWORK_SYSTEM
    EXPECT_TRUE(client.is_available());
#else
    EXPECT_FALSE(client.is_available());
    auto response = client.get("http://127.0.0.1:9/list");
    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, error_code::connection_failed);
#endif
}

TEST_F(FileShareClientTest, BuilderClampsConcurrency) {
    auto client = file_share_client::builder()
        .with_concurrency(0)
        .with_http_client(http_)
        .build();
    ASSERT_TRUE(client);
    EXPECT_EQ(client.value().config().concurrency, 1u);
}

TEST_F(FileShareClientTest, BuilderRejectsEmptyServerUrl) {
    auto client = file_share_client::builder()
        .with_server_url("")
        .with_http_client(http_)
        .build();
    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

// ============================================================================
// Operations
// ============================================================================

TEST_F(FileShareClientTest, DownloadFile) {
    http_->respond_file(std::string(server_url) + "/download/a%2Fb.txt", "payload");

    auto outcome = client_->download_file("a/b.txt");

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_EQ(read_file(test_dir_ / "out" / "a" / "b.txt"), "payload");
}

TEST_F(FileShareClientTest, DownloadDirectory) {
    http_->respond_listing(std::string(server_url) + "/list/docs",
                           {{"docs/one.txt", 3}, {"docs/sub/two.txt", 3}});
    http_->respond_file(std::string(server_url) + "/download/docs%2Fone.txt", "one");
    http_->respond_file(std::string(server_url) + "/download/docs%2Fsub%2Ftwo.txt", "two");

    auto summary = client_->download_directory("docs");
    ASSERT_TRUE(summary) << summary.error().message;
    EXPECT_EQ(summary.value().downloaded, 2u);
    EXPECT_TRUE(summary.value().all_succeeded());

    EXPECT_EQ(read_file(test_dir_ / "out" / "docs" / "one.txt"), "one");
    EXPECT_EQ(read_file(test_dir_ / "out" / "docs" / "sub" / "two.txt"), "two");

    auto ledger = transfer_ledger::load(test_dir_ / "state.json");
    EXPECT_EQ(ledger.size(), 2u);

    auto again = client_->download_directory("docs");
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().skipped, 2u);
    EXPECT_EQ(again.value().downloaded, 0u);
}

TEST_F(FileShareClientTest, ListDirectories) {
    http_->respond_listing(std::string(server_url) + "/list/.",
                           {{"top.txt", 1},
                            {"photos/2024/a.jpg", 2},
                            {"photos/2024/b.jpg", 3},
                            {"music/c.mp3", 4}});

    auto directories = client_->list_directories(".");
    ASSERT_TRUE(directories) << directories.error().message;
    EXPECT_EQ(directories.value(), (std::vector<std::string>{"music", "photos/2024"}));
}

TEST_F(FileShareClientTest, ListFilesReportsServerError) {
    http_->respond(std::string(server_url) + "/list/secret", 403,
                   "{\"error\":\"Access denied\"}");

    auto files = client_->list_files("secret");
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, error_code::http_status_error);

    auto directories = client_->list_directories("secret");
    EXPECT_FALSE(directories);
}

}  // namespace fileshare::test
