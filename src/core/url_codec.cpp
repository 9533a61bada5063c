/**
 * @file url_codec.cpp
 * @brief Percent-encoding helpers for request paths
 */

#include "fileshare/core/url_codec.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace fileshare::url_codec {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

auto url_encode(std::string_view value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto url_decode(std::string_view value) -> result<std::string> {
    std::string decoded;
    decoded.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%') {
            if (i + 2 >= value.size()) {
                return unexpected{error{error_code::invalid_file_path,
                    "truncated escape sequence in path"}};
            }
            int high = hex_value(value[i + 1]);
            int low = hex_value(value[i + 2]);
            if (high < 0 || low < 0) {
                return unexpected{error{error_code::invalid_file_path,
                    "invalid escape sequence in path"}};
            }
            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else if (c == '+') {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }

    return decoded;
}

auto join_url(std::string_view base, std::string_view path) -> std::string {
    std::string url(base);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    url += '/';
    url += path;
    return url;
}

}  // namespace fileshare::url_codec
