/**
 * @file http_client.h
 * @brief HTTP GET transport used by the client
 *
 * The client talks to the server only through http_client_interface, so
 * tests can inject an in-process implementation.
 */

#ifndef FILESHARE_CLIENT_HTTP_CLIENT_H
#define FILESHARE_CLIENT_HTTP_CLIENT_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief HTTP response as seen by the client
 */
struct http_response {
    int status_code = 0;
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

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };
        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Content-Length as a positive integer
     * @return std::nullopt when absent, unparseable or not positive
     */
    [[nodiscard]] auto content_length() const -> std::optional<int64_t>;
};

/**
 * @brief Abstract GET transport
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    /**
     * @brief Execute a GET request
     *
     * Transport failures are errors; any HTTP status, including 4xx/5xx, is
     * a successful result.
     */
    [[nodiscard]] virtual auto get(const std::string& url) -> result<http_response> = 0;
};

/**
 * @brief http_client_interface backed by network_system's HTTP client
 *
 * A timeout of zero means requests never time out. Without network_system
 * every request fails with connection_failed.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto get(const std::string& url) -> result<http_response> override;

    /**
     * @brief Check if the HTTP stack is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

    /**
     * @brief Timeout handed to the HTTP stack for each request
     */
    [[nodiscard]] auto effective_timeout() const noexcept -> std::chrono::milliseconds;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_HTTP_CLIENT_H
