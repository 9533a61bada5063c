/**
 * @file file_share_server.cpp
 * @brief HTTP file sharing server implementation
 */

#include "fileshare/server/file_share_server.h"
#include "fileshare/core/logging.h"
#include "fileshare/server/file_serving_endpoint.h"
#include "fileshare/server/listing_service.h"

#include <atomic>
#include <mutex>
#include <optional>

#include "fileshare/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_server.h>
#endif

namespace fileshare {

namespace {

constexpr std::string_view download_prefix = "/download";
constexpr std::string_view list_prefix = "/list";

/**
 * @brief Return the route tail if @p path is @p prefix or @p prefix + "/..."
 */
auto match_route(std::string_view path, std::string_view prefix)
    -> std::optional<std::string_view> {
    if (!path.starts_with(prefix)) {
        return std::nullopt;
    }
    auto tail = path.substr(prefix.size());
    if (tail.empty()) {
        return tail;
    }
    if (tail.front() != '/') {
        return std::nullopt;
    }
    return tail.substr(1);
}

}  // namespace

struct file_share_server::impl {
    server_config config;
    listing_service listings;
    file_serving_endpoint files;
    std::atomic<server_state> current_state{server_state::stopped};
    std::mutex lifecycle_mutex;

#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_server> http_server;
#endif

    impl(server_config cfg, const path_resolver& resolver)
        : config(std::move(cfg)), listings(resolver), files(resolver) {}

    auto dispatch(std::string_view target) const -> http_reply {
        auto path = target.substr(0, target.find_first_of("?#"));

        if (auto tail = match_route(path, download_prefix)) {
            return files.handle(*tail);
        }
        if (auto tail = match_route(path, list_prefix)) {
            return listings.handle(*tail);
        }

        FS_LOG_DEBUG(log_category::server, "No route for " + std::string(target));
        return http_reply::failure(404, "Not found");
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto to_network_response(http_reply&& reply)
        -> kcenon::network::internal::http_response {
        kcenon::network::internal::http_response response;
        response.status_code = reply.status_code;
        for (auto& [name, value] : reply.headers) {
            response.headers[name] = std::move(value);
        }
        response.body = std::move(reply.body);
        return response;
    }

    void register_routes() {
        auto handler = [this](const kcenon::network::core::http_request_context& ctx) {
            return to_network_response(dispatch(ctx.request.uri));
        };

        http_server->get("/list", handler);
        http_server->get("/list/:path", handler);
        http_server->get("/download/:path", handler);
        // Nested paths arrive here; dispatch() answers 404 for unknown routes
        http_server->set_not_found_handler(handler);
    }
#endif
};

// Builder implementation
file_share_server::builder::builder() = default;

auto file_share_server::builder::with_root_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.root_directory = dir;
    return *this;
}

auto file_share_server::builder::with_port(uint16_t port) -> builder& {
    config_.port = port;
    return *this;
}

auto file_share_server::builder::build() -> result<file_share_server> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                               "root directory and a non-zero port are required"}};
    }

    auto resolver = path_resolver::create(config_.root_directory);
    if (!resolver) {
        return unexpected{resolver.error()};
    }

    config_.root_directory = resolver.value().root();
    return file_share_server{std::move(config_), std::move(resolver.value())};
}

// file_share_server implementation
file_share_server::file_share_server(server_config config, path_resolver resolver)
    : impl_(std::make_unique<impl>(std::move(config), resolver)) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

file_share_server::file_share_server(file_share_server&&) noexcept = default;
auto file_share_server::operator=(file_share_server&&) noexcept
    -> file_share_server& = default;
file_share_server::~file_share_server() {
    if (impl_ && is_running()) {
        auto stopped = stop();
        if (!stopped) {
            FS_LOG_WARN(log_category::server,
                        "Server stop during destruction failed: " + stopped.error().message);
        }
    }
}

auto file_share_server::handle_get(std::string_view target) const -> http_reply {
    return impl_->dispatch(target);
}

auto file_share_server::start() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

    if (impl_->current_state != server_state::stopped) {
        FS_LOG_WARN(log_category::server, "Server start failed: already running");
        return unexpected{error{error_code::already_initialized,
                               "Server is already running"}};
    }

    FS_LOG_INFO(log_category::server,
        "Starting server on port " + std::to_string(impl_->config.port) +
        ", serving files from " + impl_->config.root_directory.string());

    impl_->current_state = server_state::starting;

#if KCENON_WITH_NETWORK_SYSTEM
    impl_->http_server =
        std::make_shared<kcenon::network::core::http_server>("fileshare_server");
    impl_->register_routes();

    auto result = impl_->http_server->start(impl_->config.port);
    if (result.is_err()) {
        impl_->http_server.reset();
        impl_->current_state = server_state::stopped;
        FS_LOG_ERROR(log_category::server,
            "Failed to start HTTP server: " + result.error().message);
        return unexpected{error{error_code::connection_failed,
                               "Failed to start HTTP server: " + result.error().message}};
    }
#else
    impl_->current_state = server_state::stopped;
    FS_LOG_ERROR(log_category::server, "HTTP server not available");
    return unexpected{error{error_code::server_not_running,
        "HTTP server not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif

    impl_->current_state = server_state::running;
    FS_LOG_INFO(log_category::server,
        "Server started successfully on port " + std::to_string(impl_->config.port));
    return {};
}

auto file_share_server::stop() -> result<void> {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

    if (impl_->current_state != server_state::running) {
        return unexpected{error{error_code::server_not_running,
                               "Server is not running"}};
    }

    FS_LOG_INFO(log_category::server, "Stopping server");
    impl_->current_state = server_state::stopping;

#if KCENON_WITH_NETWORK_SYSTEM
    if (impl_->http_server) {
        auto result = impl_->http_server->stop();
        impl_->http_server.reset();
        if (result.is_err()) {
            impl_->current_state = server_state::stopped;
            FS_LOG_ERROR(log_category::server,
                "Failed to stop HTTP server: " + result.error().message);
            return unexpected{error{error_code::internal_error,
                                   "Failed to stop HTTP server: " + result.error().message}};
        }
    }
#endif

    impl_->current_state = server_state::stopped;
    FS_LOG_INFO(log_category::server, "Server stopped");
    return {};
}

auto file_share_server::is_running() const -> bool {
    return impl_->current_state == server_state::running;
}

auto file_share_server::state() const -> server_state {
    return impl_->current_state;
}

auto file_share_server::port() const -> uint16_t {
    return impl_->config.port;
}

auto file_share_server::config() const -> const server_config& {
    return impl_->config;
}

}  // namespace fileshare
