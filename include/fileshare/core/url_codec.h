/**
 * @file url_codec.h
 * @brief Percent-encoding helpers for request paths
 */

#ifndef FILESHARE_CORE_URL_CODEC_H
#define FILESHARE_CORE_URL_CODEC_H

#include <string>
#include <string_view>

#include "fileshare/core/types.h"

namespace fileshare::url_codec {

/**
 * @brief URL encode a string (RFC 3986 unreserved characters pass through)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(std::string_view value, bool encode_slash = true) -> std::string;

/**
 * @brief Decode a percent-encoded string once
 *
 * Follows query-unescape rules: "%XX" becomes the byte XX and '+' becomes a
 * space. A '%' that is not followed by two hex digits is an error.
 *
 * @param value Encoded string
 * @return Decoded string or invalid_file_path
 */
auto url_decode(std::string_view value) -> result<std::string>;

/**
 * @brief Join a base URL and an already encoded path
 *
 * Exactly one '/' separates the two parts.
 */
auto join_url(std::string_view base, std::string_view path) -> std::string;

}  // namespace fileshare::url_codec

#endif  // FILESHARE_CORE_URL_CODEC_H
