/**
 * @file listing_service.h
 * @brief Recursive directory listing under the served root
 */

#ifndef FILESHARE_SERVER_LISTING_SERVICE_H
#define FILESHARE_SERVER_LISTING_SERVICE_H

#include <filesystem>
#include <string_view>

#include "fileshare/core/types.h"
#include "fileshare/server/path_resolver.h"
#include "fileshare/server/server_types.h"

namespace fileshare {

/**
 * @brief Enumerates every file below a directory of the served root
 *
 * Records carry paths relative to the root (not to the queried directory).
 * Directory symlinks are not descended into; a symlink to a regular file is
 * reported with the target's size; other entry kinds are skipped.
 */
class listing_service {
public:
    explicit listing_service(path_resolver resolver);

    /**
     * @brief List a directory given its raw (percent-encoded) request path
     *
     * Errors: file_access_denied when the path escapes the root,
     * file_not_found when it does not exist, not_a_directory when it names a
     * file, file_read_error when the walk fails (no partial result).
     */
    [[nodiscard]] auto list(std::string_view raw_path) const -> result<listing>;

    /**
     * @brief Walk an already resolved directory
     */
    [[nodiscard]] auto walk(const std::filesystem::path& directory) const -> result<listing>;

    /**
     * @brief Serve GET /list/{raw_path}
     */
    [[nodiscard]] auto handle(std::string_view raw_path) const -> http_reply;

private:
    path_resolver resolver_;
};

}  // namespace fileshare

#endif  // FILESHARE_SERVER_LISTING_SERVICE_H
