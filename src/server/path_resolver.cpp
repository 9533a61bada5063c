/**
 * @file path_resolver.cpp
 * @brief Path containment for served files
 */

#include "fileshare/server/path_resolver.h"
#include "fileshare/core/logging.h"
#include "fileshare/core/url_codec.h"

#include <algorithm>
#include <iterator>

namespace fileshare {

namespace fs = std::filesystem;

path_resolver::path_resolver(fs::path canonical_root) : root_(std::move(canonical_root)) {}

auto path_resolver::create(const fs::path& root) -> result<path_resolver> {
    if (root.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                               "root directory is required"}};
    }

    std::error_code ec;
    auto canonical_root = fs::canonical(fs::absolute(root, ec), ec);
    if (ec) {
        return unexpected{error{error_code::file_not_found,
                               "Root directory not found: " + root.string()}};
    }
    if (!fs::is_directory(canonical_root, ec)) {
        return unexpected{error{error_code::not_a_directory,
                               "Root is not a directory: " + root.string()}};
    }

    return path_resolver{std::move(canonical_root)};
}

auto path_resolver::resolve(std::string_view raw_path) const -> result<fs::path> {
    auto decoded = url_codec::url_decode(raw_path);
    if (!decoded) {
        FS_LOG_DEBUG(log_category::server,
                     "Rejected malformed path: " + std::string(raw_path));
        return unexpected{error{error_code::invalid_file_path, "invalid file path"}};
    }
    return resolve_decoded(decoded.value());
}

auto path_resolver::resolve_decoded(std::string_view relative_path) const
    -> result<fs::path> {
    while (!relative_path.empty() && relative_path.front() == '/') {
        relative_path.remove_prefix(1);
    }

    if (relative_path.find('\0') != std::string_view::npos) {
        return unexpected{error{error_code::invalid_file_path, "invalid file path"}};
    }

    if (relative_path.empty() || relative_path == ".") {
        return root_;
    }

    auto candidate = (root_ / fs::path(std::string(relative_path))).lexically_normal();

    std::error_code ec;
    auto resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        FS_LOG_WARN(log_category::server,
                    "Cannot canonicalize " + candidate.string() + ": " + ec.message());
        return unexpected{error{error_code::file_access_denied, "Access denied"}};
    }

    if (!contains(resolved)) {
        FS_LOG_WARN(log_category::server,
                    "Path escapes root: " + std::string(relative_path) +
                    " (resolved to " + resolved.string() + ")");
        return unexpected{error{error_code::file_access_denied, "Access denied"}};
    }

    return resolved;
}

auto path_resolver::contains(const fs::path& candidate) const -> bool {
    // Segment-wise prefix: "/data/ab" is not under "/data/a"
    auto root_it = root_.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root_.end(); ++root_it, ++cand_it) {
        // A trailing separator yields an empty final element
        if (root_it->empty() && std::next(root_it) == root_.end()) {
            break;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return std::none_of(cand_it, candidate.end(),
                        [](const fs::path& segment) { return segment == ".."; });
}

auto path_resolver::relative_to_root(const fs::path& absolute) const -> std::string {
    auto relative = absolute.lexically_relative(root_);
    if (relative.empty()) {
        return {};
    }
    return relative.generic_string();
}

}  // namespace fileshare
