/**
 * @file client_types.h
 * @brief Client-related type definitions for fileshare
 */

#ifndef FILESHARE_CLIENT_CLIENT_TYPES_H
#define FILESHARE_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief Client configuration
 */
struct client_config {
    std::string server_url = "http://localhost:8080";
    std::filesystem::path save_directory = ".";
    std::size_t concurrency = 5;
    std::filesystem::path ledger_path = ".download_state.json";
    std::chrono::milliseconds request_timeout{0};  ///< Per request; 0 waits indefinitely

    [[nodiscard]] auto is_valid() const -> bool {
        return !server_url.empty() && !save_directory.empty() && !ledger_path.empty();
    }
};

/**
 * @brief Final state of a single file transfer
 */
enum class transfer_status {
    downloaded,  ///< Body written and verified against the advertised size
    skipped,     ///< Local file already had the advertised size
    failed,      ///< Transport, HTTP, local I/O or size check failure
    cancelled    ///< Cancellation observed before the body was written
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::downloaded: return "downloaded";
        case transfer_status::skipped: return "skipped";
        case transfer_status::failed: return "failed";
        case transfer_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Result of one SingleFileTransfer run
 */
struct transfer_outcome {
    std::string path;
    transfer_status status = transfer_status::failed;
    int64_t bytes_written = 0;
    std::optional<int64_t> expected_size;
    error_code code = error_code::success;  ///< Why a failed or cancelled run stopped
    std::string error_message;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == transfer_status::downloaded || status == transfer_status::skipped;
    }
};

/**
 * @brief Summary of a directory download
 */
struct batch_summary {
    std::string directory;
    std::size_t total_files = 0;        ///< Files in the listing
    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    uint64_t total_bytes = 0;           ///< Bytes written by downloaded files
    std::chrono::milliseconds elapsed{0};
    std::vector<transfer_outcome> outcomes;  ///< One entry per processed task

    /**
     * @brief Tasks that reached a worker
     */
    [[nodiscard]] auto processed() const noexcept -> std::size_t {
        return downloaded + skipped + failed + cancelled;
    }

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failed == 0 && cancelled == 0 && downloaded + skipped == total_files;
    }
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_CLIENT_TYPES_H
