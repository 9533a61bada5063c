/**
 * @file test_listing_service.cpp
 * @brief Unit tests for listing_service
 */

#include <gtest/gtest.h>

#include <fileshare/core/json_codec.h>
#include <fileshare/server/listing_service.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fileshare::test {

namespace fs = std::filesystem;

class ListingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir_ = fs::temp_directory_path() /
                    ("fileshare_test_listing_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        root_ = base_dir_ / "root";
        fs::create_directories(root_ / "b");
        fs::create_directories(root_ / "empty");
        write_file(root_ / "a", 10);
        write_file(root_ / "b" / "c", 20);
        write_file(base_dir_ / "outside.txt", 7);

        auto resolver = path_resolver::create(root_);
        ASSERT_TRUE(resolver) << resolver.error().message;
        service_.emplace(resolver.value());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_dir_, ec);
    }

    static void write_file(const fs::path& path, std::size_t size) {
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, 'x');
    }

    static auto sorted(listing files) -> listing {
        std::sort(files.begin(), files.end(),
                  [](const file_record& a, const file_record& b) { return a.path < b.path; });
        return files;
    }

    fs::path base_dir_;
    fs::path root_;
    std::optional<listing_service> service_;
};

TEST_F(ListingServiceTest, ListsRootRecursively) {
    auto files = service_->list("");
    ASSERT_TRUE(files) << files.error().message;
    EXPECT_EQ(sorted(files.value()), (listing{{"a", 10}, {"b/c", 20}}));
}

TEST_F(ListingServiceTest, DotIsRoot) {
    auto files = service_->list(".");
    ASSERT_TRUE(files);
    EXPECT_EQ(files.value().size(), 2u);
}

TEST_F(ListingServiceTest, SubdirectoryPathsRelativeToRoot) {
    auto files = service_->list("b");
    ASSERT_TRUE(files);
    EXPECT_EQ(files.value(), (listing{{"b/c", 20}}));
}

TEST_F(ListingServiceTest, EmptyDirectoryGivesEmptyListing) {
    auto files = service_->list("empty");
    ASSERT_TRUE(files);
    EXPECT_TRUE(files.value().empty());
}

TEST_F(ListingServiceTest, MissingDirectoryIsNotFound) {
    auto files = service_->list("nope");
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, error_code::file_not_found);
    EXPECT_EQ(files.error().message, "Directory not found");
}

TEST_F(ListingServiceTest, FileIsNotADirectory) {
    auto files = service_->list("a");
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, error_code::not_a_directory);
    EXPECT_EQ(files.error().message, "Not a directory");
}

TEST_F(ListingServiceTest, TraversalIsForbidden) {
    auto files = service_->list("..");
    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, error_code::file_access_denied);
}

TEST_F(ListingServiceTest, SymlinksLeavingRootAreSkipped) {
    std::error_code ec;
    fs::create_symlink(base_dir_ / "outside.txt", root_ / "link_out", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks not supported: " << ec.message();
    }
    fs::create_symlink(root_ / "a", root_ / "link_in", ec);
    ASSERT_FALSE(ec);
    fs::create_directory_symlink(root_ / "b", root_ / "dir_link", ec);
    ASSERT_FALSE(ec);

    auto files = service_->list("");
    ASSERT_TRUE(files);
    EXPECT_EQ(sorted(files.value()), (listing{{"a", 10}, {"b/c", 20}, {"link_in", 10}}));
}

// ============================================================================
// HTTP replies
// ============================================================================

TEST_F(ListingServiceTest, HandleReturnsJsonListing) {
    auto reply = service_->handle("b");
    EXPECT_EQ(reply.status_code, 200);
    EXPECT_EQ(reply.headers["Content-Type"], "application/json; charset=utf-8");
    EXPECT_EQ(reply.get_body_string(), "{\"files\":[{\"path\":\"b/c\",\"size\":20}]}");
}

TEST_F(ListingServiceTest, HandleMapsErrorsToStatus) {
    auto missing = service_->handle("nope");
    EXPECT_EQ(missing.status_code, 404);
    EXPECT_EQ(json_codec::decode_error(missing.get_body_string()), "Directory not found");

    auto file = service_->handle("a");
    EXPECT_EQ(file.status_code, 400);

    auto escape = service_->handle("..%2F..");
    EXPECT_EQ(escape.status_code, 403);
    EXPECT_EQ(json_codec::decode_error(escape.get_body_string()), "Access denied");

    auto malformed = service_->handle("%G1");
    EXPECT_EQ(malformed.status_code, 400);
    EXPECT_EQ(json_codec::decode_error(malformed.get_body_string()), "invalid file path");
}

}  // namespace fileshare::test
