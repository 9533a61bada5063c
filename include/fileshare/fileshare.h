/**
 * @file fileshare.h
 * @brief Main header for the fileshare library
 * @version 0.1.0
 *
 * @code
 * #include <fileshare/fileshare.h>
 *
 * using namespace fileshare;
 *
 * // Serve a directory
 * auto server = file_share_server::builder()
 *     .with_root_directory("/srv/share")
 *     .build();
 *
 * // Download it elsewhere
 * auto client = file_share_client::builder()
 *     .with_server_url("http://localhost:8080")
 *     .build();
 * @endcode
 */

#ifndef FILESHARE_FILESHARE_H
#define FILESHARE_FILESHARE_H

#include <string>

// Core types
#include "fileshare/core/cancellation.h"
#include "fileshare/core/types.h"

// Server
#include "fileshare/server/file_share_server.h"
#include "fileshare/server/server_types.h"

// Client
#include "fileshare/client/client_types.h"
#include "fileshare/client/file_share_client.h"

namespace fileshare {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace fileshare

#endif  // FILESHARE_FILESHARE_H
