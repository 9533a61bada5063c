/**
 * @file server_types.h
 * @brief Server-related type definitions for fileshare
 */

#ifndef FILESHARE_SERVER_SERVER_TYPES_H
#define FILESHARE_SERVER_SERVER_TYPES_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "fileshare/core/json_codec.h"
#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief Server state enumeration
 */
enum class server_state {
    stopped,
    starting,
    running,
    stopping
};

/**
 * @brief Convert server_state to string
 */
[[nodiscard]] constexpr auto to_string(server_state state) -> const char* {
    switch (state) {
        case server_state::stopped: return "stopped";
        case server_state::starting: return "starting";
        case server_state::running: return "running";
        case server_state::stopping: return "stopping";
        default: return "unknown";
    }
}

/**
 * @brief Server configuration
 */
struct server_config {
    std::filesystem::path root_directory = ".";
    uint16_t port = 8080;

    [[nodiscard]] auto is_valid() const -> bool {
        return !root_directory.empty() && port != 0;
    }
};

/**
 * @brief Reply produced by a request handler, independent of the HTTP stack
 *
 * Header names are stored as given. The body is kept in the byte form the
 * HTTP layer sends, so a served file is read into it once and then moved.
 */
struct http_reply {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    /**
     * @brief Get body as string
     */
    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] static auto json(int status, std::string body) -> http_reply {
        http_reply reply;
        reply.status_code = status;
        reply.headers["Content-Type"] = "application/json; charset=utf-8";
        reply.headers["Content-Length"] = std::to_string(body.size());
        reply.body.assign(body.begin(), body.end());
        return reply;
    }

    /**
     * @brief Build an {"error": message} reply
     */
    [[nodiscard]] static auto failure(int status, std::string_view message) -> http_reply {
        return json(status, json_codec::encode_error(message));
    }

    /**
     * @brief Build an error reply with the status mapped from @p err
     */
    [[nodiscard]] static auto failure(const error& err) -> http_reply {
        return failure(to_http_status(err.code), err.message);
    }
};

}  // namespace fileshare

#endif  // FILESHARE_SERVER_SERVER_TYPES_H
