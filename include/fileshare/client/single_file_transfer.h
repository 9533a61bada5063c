/**
 * @file single_file_transfer.h
 * @brief Download of one file with the size-based completeness check
 */

#ifndef FILESHARE_CLIENT_SINGLE_FILE_TRANSFER_H
#define FILESHARE_CLIENT_SINGLE_FILE_TRANSFER_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "fileshare/client/client_types.h"
#include "fileshare/client/http_client.h"
#include "fileshare/client/transfer_ledger.h"
#include "fileshare/core/cancellation.h"

namespace fileshare {

/**
 * @brief Fetches one server file into the save directory
 *
 * The expected size is the response Content-Length. A local file that
 * already has that size is left untouched (skipped). A written file whose
 * size differs from it is kept on disk but not recorded in the ledger. No
 * partial-byte resume is performed.
 *
 * Instances are immutable and may be shared by concurrent workers.
 */
class single_file_transfer {
public:
    single_file_transfer(std::shared_ptr<http_client_interface> http,
                         std::string server_url,
                         std::filesystem::path save_directory,
                         std::shared_ptr<ledger_store> ledger);

    /**
     * @brief Download @p relative_path
     * @param token Checked before the request and again before writing
     * @param worker_id Batch worker running the transfer, for logging
     */
    [[nodiscard]] auto run(const std::string& relative_path,
                           const cancellation_token& token,
                           std::optional<std::size_t> worker_id = std::nullopt) const
        -> transfer_outcome;

    /**
     * @brief Local destination of @p relative_path
     *
     * Leading '/' separators are dropped, so "/docs/a.txt" lands at
     * save_directory/docs/a.txt.
     * @return std::nullopt if nothing remains or the path climbs out with ".."
     */
    [[nodiscard]] auto local_path(const std::string& relative_path) const
        -> std::optional<std::filesystem::path>;

private:
    std::shared_ptr<http_client_interface> http_;
    std::string server_url_;
    std::filesystem::path save_directory_;
    std::shared_ptr<ledger_store> ledger_;
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_SINGLE_FILE_TRANSFER_H
