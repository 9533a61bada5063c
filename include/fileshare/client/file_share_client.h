/**
 * @file file_share_client.h
 * @brief Client for the HTTP file sharing server
 */

#ifndef FILESHARE_CLIENT_FILE_SHARE_CLIENT_H
#define FILESHARE_CLIENT_FILE_SHARE_CLIENT_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fileshare/client/client_types.h"
#include "fileshare/client/http_client.h"
#include "fileshare/core/cancellation.h"
#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief Downloads files and directories from a fileshare server
 *
 * Owns one ledger store for its ledger file, shared by every transfer it
 * starts.
 *
 * @code
 * auto client = file_share_client::builder()
 *     .with_server_url("http://localhost:8080")
 *     .with_save_directory("./downloads")
 *     .with_concurrency(8)
 *     .build();
 * if (client) {
 *     auto summary = client.value().download_directory("photos");
 * }
 * @endcode
 */
class file_share_client {
public:
    /**
     * @brief Builder for file_share_client
     */
    class builder {
    public:
        builder();

        auto with_server_url(std::string url) -> builder&;

        auto with_save_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Worker count for directory downloads (values < 1 become 1)
         */
        auto with_concurrency(std::size_t workers) -> builder&;

        auto with_ledger_path(const std::filesystem::path& file) -> builder&;

        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Use a custom transport instead of network_http_client
         */
        auto with_http_client(std::shared_ptr<http_client_interface> http) -> builder&;

        [[nodiscard]] auto build() -> result<file_share_client>;

    private:
        client_config config_;
        std::shared_ptr<http_client_interface> http_;
    };

    // Non-copyable, movable
    file_share_client(const file_share_client&) = delete;
    auto operator=(const file_share_client&) -> file_share_client& = delete;
    file_share_client(file_share_client&&) noexcept;
    auto operator=(file_share_client&&) noexcept -> file_share_client&;
    ~file_share_client();

    /**
     * @brief Download one file into the save directory, mirroring its path
     */
    [[nodiscard]] auto download_file(const std::string& path,
                                     const cancellation_token& token = {}) -> transfer_outcome;

    /**
     * @brief Download every file below @p path
     * @return Error only when the listing could not be obtained
     */
    [[nodiscard]] auto download_directory(const std::string& path,
                                          const cancellation_token& token = {})
        -> result<batch_summary>;

    /**
     * @brief Files below @p path, as listed by the server
     */
    [[nodiscard]] auto list_files(const std::string& path) -> result<listing>;

    /**
     * @brief Distinct parent directories of the files below @p path
     *
     * Sorted; the root itself (".") is excluded.
     */
    [[nodiscard]] auto list_directories(const std::string& path)
        -> result<std::vector<std::string>>;

    [[nodiscard]] auto config() const -> const client_config&;

private:
    file_share_client(client_config config, std::shared_ptr<http_client_interface> http);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_FILE_SHARE_CLIENT_H
