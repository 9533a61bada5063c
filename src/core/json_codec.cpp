/**
 * @file json_codec.cpp
 * @brief JSON encoding and decoding of listings, errors and ledgers
 */

#include "fileshare/core/json_codec.h"
#include "fileshare/core/logging.h"

#include <cctype>
#include <charconv>
#include <functional>
#include <sstream>

namespace fileshare::json_codec {

namespace {

constexpr int max_nesting_depth = 64;

auto malformed(const std::string& what) -> unexpected {
    return unexpected{error{error_code::invalid_response, "malformed JSON: " + what}};
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * @brief Minimal pull reader over a JSON document
 */
class json_reader {
public:
    explicit json_reader(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    [[nodiscard]] auto peek() -> char {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    [[nodiscard]] auto consume(char c) -> bool {
        if (peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    [[nodiscard]] auto at_end() -> bool {
        skip_ws();
        return pos_ >= text_.size();
    }

    auto read_string() -> result<std::string> {
        if (!consume('"')) {
            return malformed("expected string");
        }

        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = read_hex4();
                    if (!cp) {
                        return unexpected{cp.error()};
                    }
                    uint32_t code = cp.value();
                    if (code >= 0xDC00 && code <= 0xDFFF) {
                        return malformed("unpaired low surrogate");
                    }
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (text_.substr(pos_, 2) != "\\u") {
                            return malformed("unpaired high surrogate");
                        }
                        pos_ += 2;
                        auto low = read_hex4();
                        if (!low) {
                            return unexpected{low.error()};
                        }
                        if (low.value() < 0xDC00 || low.value() > 0xDFFF) {
                            return malformed("invalid low surrogate");
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (low.value() - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return malformed("invalid escape");
            }
        }
        return malformed("unterminated string");
    }

    auto read_int64() -> result<int64_t> {
        skip_ws();
        auto start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return malformed("expected integer");
        }

        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, value);
        if (ec != std::errc{} || ptr != text_.data() + pos_) {
            return malformed("expected integer");
        }
        return value;
    }

    /**
     * @brief Visit every member of an object; the visitor must consume the value
     */
    auto read_object(const std::function<result<void>(const std::string&)>& visit)
        -> result<void> {
        if (!consume('{')) {
            return malformed("expected object");
        }
        if (consume('}')) {
            return {};
        }
        while (true) {
            auto key = read_string();
            if (!key) {
                return unexpected{key.error()};
            }
            if (!consume(':')) {
                return malformed("expected ':'");
            }
            auto visited = visit(key.value());
            if (!visited) {
                return visited;
            }
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return {};
            }
            return malformed("expected ',' or '}'");
        }
    }

    /**
     * @brief Visit every element of an array; the visitor must consume it
     */
    auto read_array(const std::function<result<void>()>& visit) -> result<void> {
        if (!consume('[')) {
            return malformed("expected array");
        }
        if (consume(']')) {
            return {};
        }
        while (true) {
            auto visited = visit();
            if (!visited) {
                return visited;
            }
            if (consume(',')) {
                continue;
            }
            if (consume(']')) {
                return {};
            }
            return malformed("expected ',' or ']'");
        }
    }

    auto skip_value(int depth = 0) -> result<void> {
        if (depth > max_nesting_depth) {
            return malformed("nesting too deep");
        }

        char c = peek();
        if (c == '{') {
            return read_object([&](const std::string&) { return skip_value(depth + 1); });
        }
        if (c == '[') {
            return read_array([&]() { return skip_value(depth + 1); });
        }
        if (c == '"') {
            auto s = read_string();
            if (!s) {
                return unexpected{s.error()};
            }
            return {};
        }
        for (std::string_view literal : {"true", "false", "null"}) {
            if (text_.substr(pos_, literal.size()) == literal) {
                pos_ += literal.size();
                return {};
            }
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            while (pos_ < text_.size() &&
                   (std::isdigit(static_cast<unsigned char>(text_[pos_])) ||
                    text_[pos_] == '-' || text_[pos_] == '+' || text_[pos_] == '.' ||
                    text_[pos_] == 'e' || text_[pos_] == 'E')) {
                ++pos_;
            }
            return {};
        }
        return malformed("unexpected character");
    }

private:
    auto read_hex4() -> result<uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return malformed("truncated \\u escape");
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) {
            return malformed("invalid \\u escape");
        }
        pos_ += 4;
        return value;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

auto finish(json_reader& reader) -> result<void> {
    if (!reader.at_end()) {
        return malformed("trailing characters");
    }
    return {};
}

}  // namespace

auto encode_listing(const listing& files) -> std::string {
    std::ostringstream oss;
    oss << "{\"files\":[";
    bool first = true;
    for (const auto& file : files) {
        if (!first) oss << ",";
        oss << "{\"path\":\"" << detail::escape_json_string(file.path)
            << "\",\"size\":" << file.size << "}";
        first = false;
    }
    oss << "]}";
    return oss.str();
}

auto decode_listing(std::string_view json) -> result<listing> {
    json_reader reader(json);
    listing files;

    auto parsed = reader.read_object([&](const std::string& key) -> result<void> {
        if (key != "files") {
            return reader.skip_value();
        }
        // An empty listing may arrive as "files": null
        if (reader.peek() == 'n') {
            return reader.skip_value();
        }
        return reader.read_array([&]() -> result<void> {
            file_record record;
            bool has_path = false;
            auto entry = reader.read_object([&](const std::string& field) -> result<void> {
                if (field == "path") {
                    auto path = reader.read_string();
                    if (!path) {
                        return unexpected{path.error()};
                    }
                    record.path = std::move(path.value());
                    has_path = true;
                    return {};
                }
                if (field == "size") {
                    auto size = reader.read_int64();
                    if (!size) {
                        return unexpected{size.error()};
                    }
                    record.size = size.value();
                    return {};
                }
                return reader.skip_value();
            });
            if (!entry) {
                return entry;
            }
            if (!has_path) {
                return malformed("file entry without path");
            }
            files.push_back(std::move(record));
            return {};
        });
    });

    if (!parsed) {
        return unexpected{parsed.error()};
    }
    auto done = finish(reader);
    if (!done) {
        return unexpected{done.error()};
    }
    return files;
}

auto encode_error(std::string_view message) -> std::string {
    return "{\"error\":\"" + detail::escape_json_string(message) + "\"}";
}

auto decode_error(std::string_view json) -> std::optional<std::string> {
    json_reader reader(json);
    std::optional<std::string> message;

    auto parsed = reader.read_object([&](const std::string& key) -> result<void> {
        if (key != "error") {
            return reader.skip_value();
        }
        auto value = reader.read_string();
        if (!value) {
            return unexpected{value.error()};
        }
        message = std::move(value.value());
        return {};
    });

    if (!parsed || !finish(reader)) {
        return std::nullopt;
    }
    return message;
}

auto encode_ledger(const std::map<std::string, int64_t>& entries) -> std::string {
    std::ostringstream oss;
    oss << "{\"files\":{";
    bool first = true;
    for (const auto& [path, size] : entries) {
        if (!first) oss << ",";
        oss << "\"" << detail::escape_json_string(path) << "\":" << size;
        first = false;
    }
    oss << "}}";
    return oss.str();
}

auto decode_ledger(std::string_view json) -> result<std::map<std::string, int64_t>> {
    json_reader reader(json);
    std::map<std::string, int64_t> entries;

    auto parsed = reader.read_object([&](const std::string& key) -> result<void> {
        if (key != "files") {
            return reader.skip_value();
        }
        if (reader.peek() == 'n') {
            return reader.skip_value();
        }
        return reader.read_object([&](const std::string& path) -> result<void> {
            auto size = reader.read_int64();
            if (!size) {
                return unexpected{size.error()};
            }
            entries[path] = size.value();
            return {};
        });
    });

    if (!parsed) {
        return unexpected{parsed.error()};
    }
    auto done = finish(reader);
    if (!done) {
        return unexpected{done.error()};
    }
    return entries;
}

}  // namespace fileshare::json_codec
