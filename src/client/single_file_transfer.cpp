/**
 * @file single_file_transfer.cpp
 * @brief Single file download implementation
 */

#include "fileshare/client/single_file_transfer.h"
#include "fileshare/core/json_codec.h"
#include "fileshare/core/logging.h"
#include "fileshare/core/url_codec.h"

#include <chrono>
#include <fstream>
#include <string_view>

namespace fileshare {

namespace fs = std::filesystem;

namespace {

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

// Leading separators are dropped, as the server does before resolving
auto strip_leading_separators(std::string_view path) -> std::string {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    return std::string(path);
}

}  // namespace

single_file_transfer::single_file_transfer(std::shared_ptr<http_client_interface> http,
                                           std::string server_url,
                                           fs::path save_directory,
                                           std::shared_ptr<ledger_store> ledger)
    : http_(std::move(http)),
      server_url_(std::move(server_url)),
      save_directory_(std::move(save_directory)),
      ledger_(std::move(ledger)) {}

auto single_file_transfer::local_path(const std::string& relative_path) const
    -> std::optional<fs::path> {
    const auto stripped = strip_leading_separators(relative_path);
    fs::path relative(stripped);
    if (stripped.empty() || relative.is_absolute() || relative.has_root_path()) {
        return std::nullopt;
    }
    for (const auto& segment : relative) {
        if (segment == "..") {
            return std::nullopt;
        }
    }
    return save_directory_ / relative;
}

auto single_file_transfer::run(const std::string& relative_path,
                               const cancellation_token& token,
                               std::optional<std::size_t> worker_id) const
    -> transfer_outcome {
    const auto started = std::chrono::steady_clock::now();

    transfer_outcome outcome;
    outcome.path = relative_path;

    const auto remote_path = strip_leading_separators(relative_path);

    transfer_log_context ctx;
    ctx.path = remote_path;
    ctx.worker_id = worker_id;
    ctx.server_address = server_url_;

    auto fail = [&](error_code code, std::string message) {
        outcome.status = transfer_status::failed;
        outcome.code = code;
        outcome.error_message = std::move(message);
        ctx.error_message = outcome.error_message;
        ctx.duration_ms = elapsed_ms(started);
        FS_LOG_ERROR_CTX(log_category::transfer, "Download failed", ctx);
        return outcome;
    };
    auto cancelled = [&]() {
        outcome.status = transfer_status::cancelled;
        outcome.code = error_code::transfer_cancelled;
        outcome.error_message = to_string(error_code::transfer_cancelled);
        FS_LOG_INFO_CTX(log_category::transfer, "Download cancelled", ctx);
        return outcome;
    };

    if (token.is_cancelled()) {
        return cancelled();
    }

    auto destination = local_path(relative_path);
    if (!destination) {
        return fail(error_code::invalid_file_path, "invalid file path");
    }

    auto url = url_codec::join_url(server_url_,
        "download/" + url_codec::url_encode(remote_path, true));

    auto response = http_->get(url);
    if (!response) {
        return fail(response.error().code, response.error().message);
    }
    const auto& reply = response.value();
    ctx.status_code = reply.status_code;

    if (!reply.is_success()) {
        auto message = "server returned status " + std::to_string(reply.status_code);
        if (auto server_error = json_codec::decode_error(reply.get_body_string())) {
            message += ": " + *server_error;
        }
        return fail(error_code::http_status_error, message);
    }

    auto expected = reply.content_length();
    outcome.expected_size = expected;
    ctx.expected_size = expected;
    if (!expected) {
        FS_LOG_WARN_CTX(log_category::transfer,
            "Server did not report a size, downloading without size check", ctx);
    } else {
        FS_LOG_DEBUG_CTX(log_category::transfer, "Starting download", ctx);
    }

    std::error_code ec;
    fs::create_directories(destination->parent_path(), ec);
    if (ec) {
        return fail(error_code::directory_create_error,
                    "failed to create directory " + destination->parent_path().string() +
                    ": " + ec.message());
    }

    if (expected) {
        auto existing = fs::file_size(*destination, ec);
        if (!ec && static_cast<int64_t>(existing) == *expected) {
            outcome.status = transfer_status::skipped;
            outcome.bytes_written = 0;
            FS_LOG_INFO_CTX(log_category::transfer,
                "File already complete, skipping", ctx);
            return outcome;
        }
    }

    if (token.is_cancelled()) {
        return cancelled();
    }

    std::ofstream out(*destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(error_code::file_write_error, "failed to create file " + destination->string());
    }
    out.write(reinterpret_cast<const char*>(reply.body.data()),
              static_cast<std::streamsize>(reply.body.size()));
    out.close();
    if (!out) {
        return fail(error_code::file_write_error, "failed to write file " + destination->string());
    }

    const auto written = static_cast<int64_t>(reply.body.size());
    outcome.bytes_written = written;
    ctx.bytes_written = written;

    if (expected && written != *expected) {
        outcome.status = transfer_status::failed;
        outcome.code = error_code::size_mismatch;
        outcome.error_message = "size mismatch: expected " + std::to_string(*expected) +
                                " bytes, wrote " + std::to_string(written);
        ctx.error_message = outcome.error_message;
        ctx.duration_ms = elapsed_ms(started);
        FS_LOG_WARN_CTX(log_category::transfer, "Downloaded size mismatch", ctx);
        return outcome;
    }

    auto recorded = ledger_->record(remote_path, written);
    if (!recorded) {
        FS_LOG_WARN_CTX(log_category::transfer,
            "Downloaded but ledger entry not saved", ctx);
    }

    outcome.status = transfer_status::downloaded;
    ctx.duration_ms = elapsed_ms(started);
    FS_LOG_INFO_CTX(log_category::transfer, "Downloaded " + destination->string(), ctx);
    return outcome;
}

}  // namespace fileshare
