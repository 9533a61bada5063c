/**
 * @file file_share_client.cpp
 * @brief Client implementation
 */

#include "fileshare/client/file_share_client.h"
#include "fileshare/client/batch_download.h"
#include "fileshare/client/single_file_transfer.h"
#include "fileshare/client/transfer_ledger.h"
#include "fileshare/core/logging.h"

#include <algorithm>
#include <set>

namespace fileshare {

struct file_share_client::impl {
    client_config config;
    std::shared_ptr<http_client_interface> http;
    std::shared_ptr<ledger_store> ledger;
    std::shared_ptr<const single_file_transfer> transfer;

    impl(client_config cfg, std::shared_ptr<http_client_interface> client)
        : config(std::move(cfg)),
          http(std::move(client)),
          ledger(std::make_shared<ledger_store>(config.ledger_path)),
          transfer(std::make_shared<single_file_transfer>(
              http, config.server_url, config.save_directory, ledger)) {}
};

// Builder implementation
file_share_client::builder::builder() = default;

auto file_share_client::builder::with_server_url(std::string url) -> builder& {
    config_.server_url = std::move(url);
    return *this;
}

auto file_share_client::builder::with_save_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.save_directory = dir;
    return *this;
}

auto file_share_client::builder::with_concurrency(std::size_t workers) -> builder& {
    config_.concurrency = std::max<std::size_t>(workers, 1);
    return *this;
}

auto file_share_client::builder::with_ledger_path(const std::filesystem::path& file)
    -> builder& {
    config_.ledger_path = file;
    return *this;
}

auto file_share_client::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto file_share_client::builder::with_http_client(std::shared_ptr<http_client_interface> http)
    -> builder& {
    http_ = std::move(http);
    return *this;
}

auto file_share_client::builder::build() -> result<file_share_client> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                               "server URL, save directory and ledger path are required"}};
    }

    std::shared_ptr<http_client_interface> http = http_;
    if (!http) {
        http = std::make_shared<network_http_client>(config_.request_timeout);
    }
    return file_share_client{std::move(config_), std::move(http)};
}

// file_share_client implementation
file_share_client::file_share_client(client_config config,
                                     std::shared_ptr<http_client_interface> http)
    : impl_(std::make_unique<impl>(std::move(config), std::move(http))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

file_share_client::file_share_client(file_share_client&&) noexcept = default;
auto file_share_client::operator=(file_share_client&&) noexcept
    -> file_share_client& = default;
file_share_client::~file_share_client() = default;

auto file_share_client::download_file(const std::string& path,
                                      const cancellation_token& token) -> transfer_outcome {
    return impl_->transfer->run(path, token);
}

auto file_share_client::download_directory(const std::string& path,
                                           const cancellation_token& token)
    -> result<batch_summary> {
    batch_download_orchestrator orchestrator(
        impl_->http, impl_->config.server_url, impl_->transfer, impl_->config.concurrency);
    return orchestrator.run(path, token);
}

auto file_share_client::list_files(const std::string& path) -> result<listing> {
    auto files = fetch_listing(*impl_->http, impl_->config.server_url, path);
    if (!files) {
        FS_LOG_ERROR(log_category::client,
            "Failed to list " + path + ": " + files.error().message);
    }
    return files;
}

auto file_share_client::list_directories(const std::string& path)
    -> result<std::vector<std::string>> {
    auto files = list_files(path);
    if (!files) {
        return unexpected{files.error()};
    }

    std::set<std::string> directories;
    for (const auto& file : files.value()) {
        auto parent = std::filesystem::path(file.path).parent_path().generic_string();
        if (!parent.empty() && parent != ".") {
            directories.insert(parent);
        }
    }
    return std::vector<std::string>(directories.begin(), directories.end());
}

auto file_share_client::config() const -> const client_config& {
    return impl_->config;
}

}  // namespace fileshare
