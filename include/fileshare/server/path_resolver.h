/**
 * @file path_resolver.h
 * @brief Maps client-supplied relative paths onto the served root
 */

#ifndef FILESHARE_SERVER_PATH_RESOLVER_H
#define FILESHARE_SERVER_PATH_RESOLVER_H

#include <filesystem>
#include <string>
#include <string_view>

#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief Resolves request paths under a fixed root directory
 *
 * A resolved path is always the root itself or one of its descendants
 * after symbolic links are followed. Anything else is rejected with
 * error_code::file_access_denied (HTTP 403).
 *
 * @code
 * auto resolver = path_resolver::create("/srv/share");
 * auto target = resolver.value().resolve("docs%2Freport.pdf");
 * // target.value() == "/srv/share/docs/report.pdf"
 * @endcode
 */
class path_resolver {
public:
    /**
     * @brief Create a resolver for @p root
     * @return error_code::file_not_found if root is missing or not a directory
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> result<path_resolver>;

    /**
     * @brief Resolve a raw (still percent-encoded) request path
     *
     * Decodes once with query-unescape rules, then behaves like
     * resolve_decoded(). A malformed escape yields
     * error_code::invalid_file_path.
     */
    [[nodiscard]] auto resolve(std::string_view raw_path) const
        -> result<std::filesystem::path>;

    /**
     * @brief Resolve an already decoded relative path
     *
     * Leading '/' characters are ignored; an empty path or "." is the root.
     */
    [[nodiscard]] auto resolve_decoded(std::string_view relative_path) const
        -> result<std::filesystem::path>;

    /**
     * @brief Check that @p candidate (canonical) lies at or below the root
     */
    [[nodiscard]] auto contains(const std::filesystem::path& candidate) const -> bool;

    /**
     * @brief '/'-separated form of @p absolute relative to the root
     */
    [[nodiscard]] auto relative_to_root(const std::filesystem::path& absolute) const
        -> std::string;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    explicit path_resolver(std::filesystem::path canonical_root);

    std::filesystem::path root_;
};

}  // namespace fileshare

#endif  // FILESHARE_SERVER_PATH_RESOLVER_H
