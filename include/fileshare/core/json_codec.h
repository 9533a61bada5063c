/**
 * @file json_codec.h
 * @brief JSON bodies exchanged by the server, the client and the ledger file
 *
 * Wire formats:
 * - listing: {"files": [{"path": "a/b.txt", "size": 20}, ...]}
 * - error:   {"error": "File not found"}
 * - ledger:  {"files": {"a/b.txt": 20, ...}}
 *
 * Decoders ignore unknown members and fail on malformed documents.
 */

#ifndef FILESHARE_CORE_JSON_CODEC_H
#define FILESHARE_CORE_JSON_CODEC_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "fileshare/core/types.h"

namespace fileshare::json_codec {

[[nodiscard]] auto encode_listing(const listing& files) -> std::string;

[[nodiscard]] auto decode_listing(std::string_view json) -> result<listing>;

[[nodiscard]] auto encode_error(std::string_view message) -> std::string;

/**
 * @brief Extract the "error" member of an error body
 * @return The message, or std::nullopt if the body is not an error object
 */
[[nodiscard]] auto decode_error(std::string_view json) -> std::optional<std::string>;

[[nodiscard]] auto encode_ledger(const std::map<std::string, int64_t>& entries) -> std::string;

[[nodiscard]] auto decode_ledger(std::string_view json)
    -> result<std::map<std::string, int64_t>>;

}  // namespace fileshare::json_codec

#endif  // FILESHARE_CORE_JSON_CODEC_H
