/**
 * @file test_single_file_transfer.cpp
 * @brief Unit tests for single_file_transfer
 */

#include <gtest/gtest.h>

#include <fileshare/client/single_file_transfer.h>

#include "unit/client/mock_http_client.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fileshare::test {

namespace fs = std::filesystem;

class SingleFileTransferTest : public ::testing::Test {
protected:
    static constexpr const char* server_url = "http://files.test:8080";

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("fileshare_test_transfer_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        save_dir_ = test_dir_ / "downloads";
        fs::create_directories(save_dir_);
        ledger_file_ = test_dir_ / "state.json";

        http_ = std::make_shared<mock_http_client>();
        ledger_ = std::make_shared<ledger_store>(ledger_file_);
        transfer_ = std::make_unique<single_file_transfer>(http_, server_url, save_dir_, ledger_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    static auto download_url(const std::string& encoded) -> std::string {
        return std::string(server_url) + "/download/" + encoded;
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    static void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path test_dir_;
    fs::path save_dir_;
    fs::path ledger_file_;
    std::shared_ptr<mock_http_client> http_;
    std::shared_ptr<ledger_store> ledger_;
    std::unique_ptr<single_file_transfer> transfer_;
};

TEST_F(SingleFileTransferTest, DownloadsIntoMirroredPath) {
    http_->respond_file(download_url("docs%2Fa%20b.txt"), "hello world");

    auto outcome = transfer_->run("docs/a b.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_EQ(outcome.code, error_code::success);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.bytes_written, 11);
    EXPECT_EQ(outcome.expected_size, 11);
    EXPECT_EQ(read_file(save_dir_ / "docs" / "a b.txt"), "hello world");
    EXPECT_EQ(ledger_->snapshot().get("docs/a b.txt"), 11);
}

TEST_F(SingleFileTransferTest, SkipsCompleteLocalFile) {
    http_->respond_file(download_url("a.txt"), "0123456789");
    write_file(save_dir_ / "a.txt", "abcdefghij");

    auto outcome = transfer_->run("a.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::skipped);
    EXPECT_EQ(outcome.bytes_written, 0);
    // Same size means complete; content is left alone
    EXPECT_EQ(read_file(save_dir_ / "a.txt"), "abcdefghij");
    EXPECT_TRUE(ledger_->snapshot().empty());
}

TEST_F(SingleFileTransferTest, ReplacesPartialLocalFile) {
    http_->respond_file(download_url("a.txt"), "0123456789");
    write_file(save_dir_ / "a.txt", "0123");

    auto outcome = transfer_->run("a.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_EQ(read_file(save_dir_ / "a.txt"), "0123456789");
}

TEST_F(SingleFileTransferTest, SizeMismatchKeepsBytesWithoutLedgerEntry) {
    http_->respond(download_url("short.bin"), 200, "12345", {{"Content-Length", "8"}});

    auto outcome = transfer_->run("short.bin", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    EXPECT_EQ(outcome.bytes_written, 5);
    EXPECT_EQ(outcome.code, error_code::size_mismatch);
    EXPECT_EQ(outcome.error_message, "size mismatch: expected 8 bytes, wrote 5");
    EXPECT_EQ(read_file(save_dir_ / "short.bin"), "12345");
    EXPECT_FALSE(ledger_->snapshot().get("short.bin").has_value());
}

TEST_F(SingleFileTransferTest, MissingContentLengthSkipsSizeCheck) {
    http_->respond(download_url("stream.log"), 200, "line\n");

    auto outcome = transfer_->run("stream.log", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_FALSE(outcome.expected_size.has_value());
    EXPECT_EQ(read_file(save_dir_ / "stream.log"), "line\n");
    EXPECT_EQ(ledger_->snapshot().get("stream.log"), 5);
}

TEST_F(SingleFileTransferTest, NonSuccessStatusFails) {
    http_->respond(download_url("locked.txt"), 403, "{\"error\":\"Access denied\"}");

    auto outcome = transfer_->run("locked.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    EXPECT_EQ(outcome.code, error_code::http_status_error);
    EXPECT_EQ(outcome.error_message, "server returned status 403: Access denied");
    EXPECT_FALSE(fs::exists(save_dir_ / "locked.txt"));
}

TEST_F(SingleFileTransferTest, TransportErrorFails) {
    http_->fail(download_url("a.txt"), "connection refused");

    auto outcome = transfer_->run("a.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    EXPECT_EQ(outcome.code, error_code::connection_failed);
    EXPECT_EQ(outcome.error_message, "connection refused");
}

TEST_F(SingleFileTransferTest, DirectoryCreationFailureIsReported) {
    write_file(save_dir_ / "reports", "a file where a directory belongs");
    http_->respond_file(download_url("reports%2Fq1.txt"), "q1");

    auto outcome = transfer_->run("reports/q1.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::failed);
    EXPECT_EQ(outcome.code, error_code::directory_create_error);
    EXPECT_TRUE(ledger_->snapshot().empty());
}

TEST_F(SingleFileTransferTest, CancelledBeforeRequest) {
    cancellation_token token;
    token.cancel();

    auto outcome = transfer_->run("a.txt", token);

    EXPECT_EQ(outcome.status, transfer_status::cancelled);
    EXPECT_EQ(outcome.code, error_code::transfer_cancelled);
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(SingleFileTransferTest, CancelledWhileRequestInFlight) {
    cancellation_token token;
    http_->respond_file(download_url("a.txt"), "data");
    http_->on_request([token]() mutable { token.cancel(); });

    auto outcome = transfer_->run("a.txt", token);

    EXPECT_EQ(outcome.status, transfer_status::cancelled);
    EXPECT_FALSE(fs::exists(save_dir_ / "a.txt"));
}

TEST_F(SingleFileTransferTest, RejectsPathsLeavingSaveDirectory) {
    for (const char* path : {"../evil.txt", "a/../../evil.txt", "/../evil.txt", "/", ""}) {
        auto outcome = transfer_->run(path, cancellation_token{});
        EXPECT_EQ(outcome.status, transfer_status::failed) << path;
        EXPECT_EQ(outcome.code, error_code::invalid_file_path) << path;
        EXPECT_EQ(outcome.error_message, "invalid file path") << path;
    }
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(SingleFileTransferTest, LocalPath) {
    EXPECT_EQ(transfer_->local_path("a/b.txt"), save_dir_ / "a/b.txt");
    EXPECT_FALSE(transfer_->local_path("../x").has_value());
    EXPECT_EQ(transfer_->local_path("/x"), save_dir_ / "x");
    EXPECT_EQ(transfer_->local_path("//a/b.txt"), save_dir_ / "a/b.txt");
}

TEST_F(SingleFileTransferTest, LeadingSlashIsDroppedLikeTheServer) {
    http_->respond_file(download_url("docs%2Fa.txt"), "report");

    auto outcome = transfer_->run("/docs/a.txt", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_EQ(http_->requests(), std::vector<std::string>{download_url("docs%2Fa.txt")});
    EXPECT_EQ(read_file(save_dir_ / "docs" / "a.txt"), "report");
    EXPECT_EQ(ledger_->snapshot().get("docs/a.txt"), 6);
    EXPECT_FALSE(ledger_->snapshot().get("/docs/a.txt").has_value());
}

TEST_F(SingleFileTransferTest, WritesBinaryBodyUnchanged) {
    const std::string payload("\x00\xff\x01\n\r\x00\x80tail", 11);
    http_->respond_file(download_url("blob.bin"), payload);

    auto outcome = transfer_->run("blob.bin", cancellation_token{});

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_EQ(outcome.bytes_written, 11);
    EXPECT_EQ(read_file(save_dir_ / "blob.bin"), payload);
}

}  // namespace fileshare::test
