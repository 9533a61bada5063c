/**
 * @file test_basic_scenarios.cpp
 * @brief Basic integration tests for server-client communication
 */

#include "test_fixtures.h"

#include <fileshare/config/feature_flags.h>

#include <algorithm>

namespace fileshare::test {

// Single file download tests
class SingleFileDownloadTest : public IntegrationFixture {};

TEST_F(SingleFileDownloadTest, DownloadSmallFile) {
    auto source = create_shared_file("small.bin", test_data::small_file_size);

    auto outcome = client_->download_file("small.bin");

    ASSERT_EQ(outcome.status, transfer_status::downloaded) << outcome.error_message;
    EXPECT_EQ(outcome.bytes_written, static_cast<int64_t>(test_data::small_file_size));
    EXPECT_TRUE(files_equal(source, download_dir_ / "small.bin"));
    EXPECT_EQ(ledger().get("small.bin"), static_cast<int64_t>(test_data::small_file_size));
}

TEST_F(SingleFileDownloadTest, DownloadNestedFileWithSpaces) {
    auto source = create_shared_file("my docs/2024/q1 report.pdf", 4096);

    auto outcome = client_->download_file("my docs/2024/q1 report.pdf");

    ASSERT_EQ(outcome.status, transfer_status::downloaded) << outcome.error_message;
    EXPECT_TRUE(files_equal(source, download_dir_ / "my docs" / "2024" / "q1 report.pdf"));
}

TEST_F(SingleFileDownloadTest, LeadingSlashPathIsServedAndDownloaded) {
    auto source = create_shared_file("docs/a.txt", 512);

    EXPECT_EQ(server_->handle_get("/download/%2Fdocs%2Fa.txt").status_code, 200);

    auto outcome = client_->download_file("/docs/a.txt");

    ASSERT_EQ(outcome.status, transfer_status::downloaded) << outcome.error_message;
    EXPECT_TRUE(files_equal(source, download_dir_ / "docs" / "a.txt"));
    EXPECT_EQ(ledger().get("docs/a.txt"), 512);
}

TEST_F(SingleFileDownloadTest, SecondDownloadIsSkipped) {
    create_shared_file("a.bin", 2048);

    ASSERT_EQ(client_->download_file("a.bin").status, transfer_status::downloaded);
    auto second = client_->download_file("a.bin");
    EXPECT_EQ(second.status, transfer_status::skipped);
}

TEST_F(SingleFileDownloadTest, EmptyFileIsDownloaded) {
    create_shared_file("empty.txt", 0);

    auto outcome = client_->download_file("empty.txt");

    EXPECT_EQ(outcome.status, transfer_status::downloaded);
    EXPECT_TRUE(std::filesystem::exists(download_dir_ / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(download_dir_ / "empty.txt"), 0u);
}

// Directory download tests
class DirectoryDownloadTest : public IntegrationFixture {};

TEST_F(DirectoryDownloadTest, DownloadWholeTree) {
    create_shared_file("photos/a.jpg", 3000);
    create_shared_file("photos/trip/b.jpg", 5000);
    create_shared_file("photos/trip/deep/c.jpg", 7000);
    create_shared_file("other/d.txt", 100);

    auto summary = client_->download_directory("photos");
    ASSERT_TRUE(summary) << summary.error().message;

    const auto& s = summary.value();
    EXPECT_EQ(s.total_files, 3u);
    EXPECT_EQ(s.downloaded, 3u);
    EXPECT_EQ(s.total_bytes, 15000u);
    EXPECT_TRUE(s.all_succeeded());

    EXPECT_TRUE(files_equal(share_dir_ / "photos/a.jpg", download_dir_ / "photos/a.jpg"));
    EXPECT_TRUE(files_equal(share_dir_ / "photos/trip/b.jpg",
                            download_dir_ / "photos/trip/b.jpg"));
    EXPECT_TRUE(files_equal(share_dir_ / "photos/trip/deep/c.jpg",
                            download_dir_ / "photos/trip/deep/c.jpg"));
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "other"));
    EXPECT_EQ(ledger().size(), 3u);
}

TEST_F(DirectoryDownloadTest, RootDirectory) {
    create_shared_file("x.bin", 10);
    create_shared_file("y/z.bin", 20);

    auto summary = client_->download_directory(".");
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().downloaded, 2u);
}

TEST_F(DirectoryDownloadTest, ResumeAfterPartialDownload) {
    create_shared_file("set/1.bin", 1000);
    create_shared_file("set/2.bin", 2000);
    create_shared_file("set/3.bin", 3000);

    // A complete copy of 1.bin and a truncated copy of 2.bin are already present
    ASSERT_EQ(client_->download_file("set/1.bin").status, transfer_status::downloaded);
    {
        std::ofstream partial(download_dir_ / "set" / "2.bin", std::ios::binary);
        partial << std::string(500, 'p');
    }

    auto summary = client_->download_directory("set");
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().skipped, 1u);
    EXPECT_EQ(summary.value().downloaded, 2u);
    EXPECT_TRUE(files_equal(share_dir_ / "set/2.bin", download_dir_ / "set/2.bin"));
}

TEST_F(DirectoryDownloadTest, EmptyDirectory) {
    std::filesystem::create_directories(share_dir_ / "nothing");

    auto summary = client_->download_directory("nothing");
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary.value().total_files, 0u);
    EXPECT_EQ(transport_->request_count(), 1u);
}

// Listing tests
class ListingTest : public IntegrationFixture {};

TEST_F(ListingTest, ListFilesMatchesShare) {
    create_shared_file("a.txt", 1);
    create_shared_file("b/c.txt", 2);

    auto files = client_->list_files(".");
    ASSERT_TRUE(files);

    auto sorted = files.value();
    std::sort(sorted.begin(), sorted.end(),
              [](const file_record& a, const file_record& b) { return a.path < b.path; });
    EXPECT_EQ(sorted, (listing{{"a.txt", 1}, {"b/c.txt", 2}}));
}

TEST_F(ListingTest, ListDirectories) {
    create_shared_file("root.txt", 1);
    create_shared_file("music/a.mp3", 1);
    create_shared_file("music/live/b.mp3", 1);
    create_shared_file("video/c.mp4", 1);

    auto directories = client_->list_directories(".");
    ASSERT_TRUE(directories);
    EXPECT_EQ(directories.value(),
              (std::vector<std::string>{"music", "music/live", "video"}));
}

#if KCENON_WITH_NETWORK_SYSTEM
// Real socket round trip through network_system
class NetworkRoundTripTest : public TempDirectoryFixture {};

TEST_F(NetworkRoundTripTest, DownloadOverHttp) {
    create_shared_file("net/file.bin", 64 * 1024);

    constexpr uint16_t port = 18473;
    auto server = file_share_server::builder()
        .with_root_directory(share_dir_)
        .with_port(port)
        .build();
    ASSERT_TRUE(server.has_value());

    auto started = server.value().start();
    if (!started) {
        GTEST_SKIP() << "Cannot bind test port: " << started.error().message;
    }
    EXPECT_TRUE(server.value().is_running());

    auto client = file_share_client::builder()
        .with_server_url("http://127.0.0.1:" + std::to_string(port))
        .with_save_directory(download_dir_)
        .with_ledger_path(test_dir_ / ".download_state.json")
        .with_concurrency(2)
        .build();
    ASSERT_TRUE(client.has_value());

    auto summary = client.value().download_directory("net");
    ASSERT_TRUE(summary) << summary.error().message;
    EXPECT_EQ(summary.value().downloaded, 1u);
    EXPECT_TRUE(files_equal(share_dir_ / "net/file.bin", download_dir_ / "net/file.bin"));

    EXPECT_TRUE(server.value().stop().has_value());
    EXPECT_FALSE(server.value().is_running());
}
#endif

}  // namespace fileshare::test
