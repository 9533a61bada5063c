/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, file records, cancellation)
 */

#include <gtest/gtest.h>

#include <fileshare/core/cancellation.h>
#include <fileshare/core/types.h>
#include <fileshare/client/client_types.h>
#include <fileshare/server/server_types.h>

#include <string>
#include <thread>

namespace fileshare::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::directory_create_error), -107);
    EXPECT_EQ(static_cast<int>(error_code::size_mismatch), -120);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -141);
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::file_access_denied), "file access denied");
    EXPECT_STREQ(to_string(error_code::transfer_cancelled), "transfer cancelled");
}

TEST_F(ErrorCodeTest, HttpStatusMapping) {
    EXPECT_EQ(to_http_status(error_code::success), 200);
    EXPECT_EQ(to_http_status(error_code::file_access_denied), 403);
    EXPECT_EQ(to_http_status(error_code::file_not_found), 404);
    EXPECT_EQ(to_http_status(error_code::not_a_directory), 400);
    EXPECT_EQ(to_http_status(error_code::is_a_directory), 400);
    EXPECT_EQ(to_http_status(error_code::invalid_file_path), 400);
    EXPECT_EQ(to_http_status(error_code::file_read_error), 500);
    EXPECT_EQ(to_http_status(error_code::internal_error), 500);
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected{error{error_code::file_not_found, "missing"}};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::internal_error}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "internal error");
}

// =============================================================================
// file_record Tests
// =============================================================================

TEST(FileRecordTest, Equality) {
    EXPECT_EQ(file_record("a/b.txt", 10), file_record("a/b.txt", 10));
    EXPECT_NE(file_record("a/b.txt", 10), file_record("a/b.txt", 11));
    EXPECT_NE(file_record("a/b.txt", 10), file_record("a/c.txt", 10));
}

// =============================================================================
// cancellation_token Tests
// =============================================================================

TEST(CancellationTokenTest, NotCancelledByDefault) {
    cancellation_token token;
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTokenTest, CopiesShareState) {
    cancellation_token token;
    auto copy = token;
    token.cancel();
    EXPECT_TRUE(copy.is_cancelled());
}

TEST(CancellationTokenTest, VisibleAcrossThreads) {
    cancellation_token token;
    std::thread canceller([token]() mutable { token.cancel(); });
    canceller.join();
    EXPECT_TRUE(token.is_cancelled());
}

// =============================================================================
// Config and summary Tests
// =============================================================================

TEST(ConfigTest, ClientDefaults) {
    client_config config;
    EXPECT_EQ(config.server_url, "http://localhost:8080");
    EXPECT_EQ(config.save_directory, ".");
    EXPECT_EQ(config.concurrency, 5u);
    EXPECT_EQ(config.ledger_path, ".download_state.json");
    EXPECT_TRUE(config.is_valid());

    config.server_url.clear();
    EXPECT_FALSE(config.is_valid());
}

TEST(ConfigTest, ServerDefaults) {
    server_config config;
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.root_directory, ".");
    EXPECT_TRUE(config.is_valid());

    config.port = 0;
    EXPECT_FALSE(config.is_valid());
}

TEST(BatchSummaryTest, Counters) {
    batch_summary summary;
    summary.total_files = 3;
    summary.downloaded = 2;
    summary.skipped = 1;
    EXPECT_EQ(summary.processed(), 3u);
    EXPECT_TRUE(summary.all_succeeded());

    summary.skipped = 0;
    summary.failed = 1;
    EXPECT_FALSE(summary.all_succeeded());
}

TEST(HttpReplyTest, FailureCarriesJsonError) {
    auto reply = http_reply::failure(error{error_code::file_access_denied, "Access denied"});
    EXPECT_EQ(reply.status_code, 403);
    EXPECT_EQ(reply.get_body_string(), "{\"error\":\"Access denied\"}");
    EXPECT_EQ(reply.headers["Content-Type"], "application/json; charset=utf-8");
    EXPECT_EQ(reply.headers["Content-Length"], std::to_string(reply.body.size()));
}

}  // namespace fileshare::test
