/**
 * @file http_client.cpp
 * @brief network_system-backed HTTP client
 */

#include "fileshare/client/http_client.h"
#include "fileshare/core/logging.h"

#include <charconv>

#include "fileshare/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace fileshare {

auto http_response::content_length() const -> std::optional<int64_t> {
    auto header = get_header("Content-Length");
    if (!header) {
        return std::nullopt;
    }

    const auto& text = *header;
    auto first = text.find_first_not_of(" \t");
    auto last = text.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data() + first, text.data() + last + 1, value);
    if (ec != std::errc{} || ptr != text.data() + last + 1 || value <= 0) {
        return std::nullopt;
    }
    return value;
}

namespace {

// The network client needs a finite deadline; "no timeout" maps to a year
constexpr std::chrono::milliseconds unbounded_timeout = std::chrono::hours(24 * 365);

}  // namespace

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;
    std::chrono::milliseconds timeout;

    explicit impl(std::chrono::milliseconds requested)
        : timeout(requested > std::chrono::milliseconds::zero() ? requested
                                                                : unbounded_timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(kcenon::network::internal::http_response&& resp)
        -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = std::move(resp.headers);
        result.body = std::move(resp.body);
        return result;
    }
#endif
};

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

auto network_http_client::get(const std::string& url) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (!impl_->client) {
        return unexpected{error{error_code::not_initialized,
            "HTTP client not initialized"}};
    }

    auto response = impl_->client->get(url, {}, {});
    if (response.is_err()) {
        FS_LOG_DEBUG(log_category::client,
                     "GET " + url + " failed: " + response.error().message);
        return unexpected{error{error_code::connection_failed,
            "HTTP GET request failed: " + response.error().message}};
    }
    return impl_->convert_response(std::move(response.value()));
#else
    (void)url;
    return unexpected{error{error_code::connection_failed,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto network_http_client::effective_timeout() const noexcept -> std::chrono::milliseconds {
    return impl_->timeout;
}

}  // namespace fileshare
