/**
 * @file listing_service.cpp
 * @brief Recursive directory listing implementation
 */

#include "fileshare/server/listing_service.h"
#include "fileshare/core/json_codec.h"
#include "fileshare/core/logging.h"

namespace fileshare {

namespace fs = std::filesystem;

listing_service::listing_service(path_resolver resolver) : resolver_(std::move(resolver)) {}

auto listing_service::list(std::string_view raw_path) const -> result<listing> {
    auto resolved = resolver_.resolve(raw_path);
    if (!resolved) {
        return unexpected{resolved.error()};
    }

    std::error_code ec;
    auto status = fs::status(resolved.value(), ec);
    if (ec || !fs::exists(status)) {
        return unexpected{error{error_code::file_not_found, "Directory not found"}};
    }
    if (!fs::is_directory(status)) {
        return unexpected{error{error_code::not_a_directory, "Not a directory"}};
    }

    return walk(resolved.value());
}

auto listing_service::walk(const fs::path& directory) const -> result<listing> {
    listing files;
    std::error_code ec;

    fs::recursive_directory_iterator it(directory, ec);
    const fs::recursive_directory_iterator end;

    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;

        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            continue;
        }
        if (!entry.is_regular_file(entry_ec)) {
            // Sockets, FIFOs, devices and dangling symlinks
            continue;
        }

        if (entry.is_symlink(entry_ec)) {
            auto target = fs::canonical(entry.path(), entry_ec);
            if (entry_ec || !resolver_.contains(target)) {
                FS_LOG_DEBUG(log_category::listing,
                             "Skipping symlink leaving root: " + entry.path().string());
                continue;
            }
        }

        auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            ec = entry_ec;
            break;
        }

        files.emplace_back(resolver_.relative_to_root(entry.path()),
                           static_cast<int64_t>(size));
    }

    if (ec) {
        FS_LOG_ERROR(log_category::listing,
                     "Directory walk failed under " + directory.string() + ": " + ec.message());
        return unexpected{error{error_code::file_read_error, ec.message()}};
    }

    return files;
}

auto listing_service::handle(std::string_view raw_path) const -> http_reply {
    auto files = list(raw_path);
    if (!files) {
        transfer_log_context ctx;
        ctx.path = std::string(raw_path);
        ctx.status_code = to_http_status(files.error().code);
        ctx.error_message = files.error().message;
        FS_LOG_INFO_CTX(log_category::listing, "Listing rejected", ctx);
        return http_reply::failure(files.error());
    }

    transfer_log_context ctx;
    ctx.path = std::string(raw_path);
    ctx.status_code = 200;
    FS_LOG_DEBUG_CTX(log_category::listing,
                     "Listed " + std::to_string(files.value().size()) + " files", ctx);
    return http_reply::json(200, json_codec::encode_listing(files.value()));
}

}  // namespace fileshare
