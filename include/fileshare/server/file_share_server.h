/**
 * @file file_share_server.h
 * @brief HTTP file sharing server
 */

#ifndef FILESHARE_SERVER_FILE_SHARE_SERVER_H
#define FILESHARE_SERVER_FILE_SHARE_SERVER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

#include "fileshare/core/types.h"
#include "fileshare/server/path_resolver.h"
#include "fileshare/server/server_types.h"

namespace fileshare {

/**
 * @brief Serves a directory tree over HTTP
 *
 * Routes:
 * - GET /download/{path}: file bytes
 * - GET /list/{path}: recursive listing, paths relative to the root
 *
 * @code
 * auto server = file_share_server::builder()
 *     .with_root_directory("/srv/share")
 *     .with_port(8080)
 *     .build();
 * if (server) {
 *     auto started = server.value().start();
 * }
 * @endcode
 */
class file_share_server {
public:
    /**
     * @brief Builder for file_share_server
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the served root directory (default ".")
         */
        auto with_root_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Set the listening port (default 8080)
         */
        auto with_port(uint16_t port) -> builder&;

        /**
         * @brief Build the server
         *
         * The root must exist and be a directory; it is stored in canonical
         * absolute form.
         */
        [[nodiscard]] auto build() -> result<file_share_server>;

    private:
        server_config config_;
    };

    // Non-copyable, movable
    file_share_server(const file_share_server&) = delete;
    auto operator=(const file_share_server&) -> file_share_server& = delete;
    file_share_server(file_share_server&&) noexcept;
    auto operator=(file_share_server&&) noexcept -> file_share_server&;
    ~file_share_server();

    /**
     * @brief Dispatch a GET request target such as "/list/docs?x=1"
     *
     * The query string is ignored. Unknown routes yield 404
     * {"error": "Not found"}.
     */
    [[nodiscard]] auto handle_get(std::string_view target) const -> http_reply;

    /**
     * @brief Start listening on the configured port
     */
    [[nodiscard]] auto start() -> result<void>;

    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto state() const -> server_state;

    [[nodiscard]] auto port() const -> uint16_t;

    /**
     * @brief Configuration with the canonical root
     */
    [[nodiscard]] auto config() const -> const server_config&;

private:
    file_share_server(server_config config, path_resolver resolver);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace fileshare

#endif  // FILESHARE_SERVER_FILE_SHARE_SERVER_H
