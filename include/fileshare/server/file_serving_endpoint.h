/**
 * @file file_serving_endpoint.h
 * @brief Single-file download endpoint
 */

#ifndef FILESHARE_SERVER_FILE_SERVING_ENDPOINT_H
#define FILESHARE_SERVER_FILE_SERVING_ENDPOINT_H

#include <string_view>

#include "fileshare/server/path_resolver.h"
#include "fileshare/server/server_types.h"

namespace fileshare {

/**
 * @brief Serves GET /download/{path}
 *
 * A successful reply carries the file bytes, Content-Length equal to the
 * size reported by stat and Content-Type application/octet-stream.
 */
class file_serving_endpoint {
public:
    explicit file_serving_endpoint(path_resolver resolver);

    [[nodiscard]] auto handle(std::string_view raw_path) const -> http_reply;

private:
    path_resolver resolver_;
};

}  // namespace fileshare

#endif  // FILESHARE_SERVER_FILE_SERVING_ENDPOINT_H
