/**
 * @file file_serving_endpoint.cpp
 * @brief Single-file download endpoint implementation
 */

#include "fileshare/server/file_serving_endpoint.h"
#include "fileshare/core/logging.h"

#include <filesystem>
#include <fstream>
#include <new>
#include <stdexcept>

namespace fileshare {

namespace fs = std::filesystem;

file_serving_endpoint::file_serving_endpoint(path_resolver resolver)
    : resolver_(std::move(resolver)) {}

auto file_serving_endpoint::handle(std::string_view raw_path) const -> http_reply {
    transfer_log_context ctx;
    ctx.path = std::string(raw_path);

    auto resolved = resolver_.resolve(raw_path);
    if (!resolved) {
        ctx.status_code = to_http_status(resolved.error().code);
        ctx.error_message = resolved.error().message;
        FS_LOG_INFO_CTX(log_category::server, "Download rejected", ctx);
        return http_reply::failure(resolved.error());
    }

    const auto& target = resolved.value();
    std::error_code ec;
    auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        ctx.status_code = 404;
        FS_LOG_INFO_CTX(log_category::server, "Download of missing file", ctx);
        return http_reply::failure(404, "File not found");
    }
    if (fs::is_directory(status)) {
        ctx.status_code = 400;
        FS_LOG_INFO_CTX(log_category::server, "Download of directory refused", ctx);
        return http_reply::failure(error{error_code::is_a_directory,
            "Cannot download directory directly, use /list endpoint"});
    }

    auto size = fs::file_size(target, ec);
    if (ec) {
        ctx.status_code = 500;
        ctx.error_message = ec.message();
        FS_LOG_ERROR_CTX(log_category::server, "Failed to stat file", ctx);
        return http_reply::failure(500, "Failed to read file");
    }

    std::ifstream file(target, std::ios::binary);
    if (!file) {
        ctx.status_code = 500;
        FS_LOG_ERROR_CTX(log_category::server, "Failed to open file", ctx);
        return http_reply::failure(500, "Failed to read file");
    }

    http_reply reply;
    reply.status_code = 200;
    try {
        reply.body.resize(static_cast<std::size_t>(size));
    } catch (const std::bad_alloc&) {
        ctx.status_code = 500;
        ctx.expected_size = static_cast<int64_t>(size);
        FS_LOG_ERROR_CTX(log_category::server, "Not enough memory to serve file", ctx);
        return http_reply::failure(500, "Failed to read file");
    } catch (const std::length_error&) {
        ctx.status_code = 500;
        ctx.expected_size = static_cast<int64_t>(size);
        FS_LOG_ERROR_CTX(log_category::server, "File too large to serve", ctx);
        return http_reply::failure(500, "Failed to read file");
    }
    file.read(reinterpret_cast<char*>(reply.body.data()), static_cast<std::streamsize>(size));
    if (static_cast<uintmax_t>(file.gcount()) != size) {
        ctx.status_code = 500;
        ctx.expected_size = static_cast<int64_t>(size);
        ctx.bytes_written = static_cast<int64_t>(file.gcount());
        FS_LOG_ERROR_CTX(log_category::server, "Short read while serving file", ctx);
        return http_reply::failure(500, "Failed to read file");
    }

    reply.headers["Content-Type"] = "application/octet-stream";
    reply.headers["Content-Length"] = std::to_string(size);

    ctx.status_code = 200;
    ctx.expected_size = static_cast<int64_t>(size);
    FS_LOG_DEBUG_CTX(log_category::server, "Serving file", ctx);
    return reply;
}

}  // namespace fileshare
