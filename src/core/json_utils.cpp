/**
 * @file json_utils.cpp
 * @brief Implementation of minimal JSON helpers
 */

#include <kcenon/file_delivery/core/json_utils.h>

#include <cctype>
#include <charconv>
#include <cstdio>

namespace kcenon::file_delivery::json {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

auto skip_space(std::string_view s, std::size_t pos) -> std::size_t {
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos;
}

// Returns the index of the closing quote of a string starting at `open`.
auto string_end(std::string_view s, std::size_t open) -> std::size_t {
    std::size_t i = open + 1;
    while (i < s.size()) {
        if (s[i] == '\\') {
            i += 2;
            continue;
        }
        if (s[i] == '"') {
            return i;
        }
        ++i;
    }
    return std::string_view::npos;
}

// Returns one past the matching close bracket of a container starting at `open`.
auto container_end(std::string_view s, std::size_t open) -> std::size_t {
    int depth = 0;
    std::size_t i = open;
    while (i < s.size()) {
        char c = s[i];
        if (c == '"') {
            auto end = string_end(s, i);
            if (end == std::string_view::npos) {
                return end;
            }
            i = end + 1;
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        }
        ++i;
    }
    return std::string_view::npos;
}

auto value_at(std::string_view s, std::size_t pos) -> std::optional<std::string> {
    pos = skip_space(s, pos);
    if (pos >= s.size()) {
        return std::nullopt;
    }

    if (s[pos] == '"') {
        auto end = string_end(s, pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return std::string(s.substr(pos + 1, end - pos - 1));
    }

    if (s[pos] == '{' || s[pos] == '[') {
        auto end = container_end(s, pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return std::string(s.substr(pos, end - pos));
    }

    auto end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']' &&
           !is_space(s[end])) {
        ++end;
    }
    if (end == pos) {
        return std::nullopt;
    }
    return std::string(s.substr(pos, end - pos));
}

}  // namespace

auto escape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

auto unescape(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            output += input[i];
            continue;
        }
        switch (input[i + 1]) {
            case '"':  output += '"';  ++i; break;
            case '\\': output += '\\'; ++i; break;
            case '/':  output += '/';  ++i; break;
            case 'b':  output += '\b'; ++i; break;
            case 'f':  output += '\f'; ++i; break;
            case 'n':  output += '\n'; ++i; break;
            case 'r':  output += '\r'; ++i; break;
            case 't':  output += '\t'; ++i; break;
            case 'u':
                if (i + 5 < input.size()) {
                    unsigned int code = 0;
                    auto hex = input.substr(i + 2, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(),
                                                     code, 16);
                    if (ec == std::errc{} && ptr == hex.data() + hex.size()) {
                        if (code < 0x80) {
                            output += static_cast<char>(code);
                        } else if (code < 0x800) {
                            output += static_cast<char>(0xC0 | (code >> 6));
                            output += static_cast<char>(0x80 | (code & 0x3F));
                        } else {
                            output += static_cast<char>(0xE0 | (code >> 12));
                            output += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                            output += static_cast<char>(0x80 | (code & 0x3F));
                        }
                        i += 5;
                        break;
                    }
                }
                output += input[i];
                break;
            default:
                output += input[i];
                break;
        }
    }
    return output;
}

auto find_raw(std::string_view json, std::string_view key) -> std::optional<std::string> {
    // Scan the whole document and keep the shallowest occurrence of the key,
    // so a top-level "status" wins over a nested one.
    int depth = 0;
    int best_depth = -1;
    std::size_t best_value_pos = std::string_view::npos;

    std::size_t i = 0;
    while (i < json.size()) {
        char c = json[i];
        if (c == '{' || c == '[') {
            ++depth;
            ++i;
            continue;
        }
        if (c == '}' || c == ']') {
            --depth;
            ++i;
            continue;
        }
        if (c != '"') {
            ++i;
            continue;
        }

        auto end = string_end(json, i);
        if (end == std::string_view::npos) {
            break;
        }
        auto token = json.substr(i + 1, end - i - 1);
        auto after = skip_space(json, end + 1);
        if (after < json.size() && json[after] == ':' && token == key &&
            (best_depth < 0 || depth < best_depth)) {
            best_depth = depth;
            best_value_pos = after + 1;
        }
        i = end + 1;
    }

    if (best_value_pos == std::string_view::npos) {
        return std::nullopt;
    }
    return value_at(json, best_value_pos);
}

auto get_string(std::string_view json, std::string_view key) -> std::optional<std::string> {
    auto raw = find_raw(json, key);
    if (!raw || *raw == "null") {
        return std::nullopt;
    }
    return unescape(*raw);
}

auto get_int(std::string_view json, std::string_view key) -> std::optional<int64_t> {
    auto raw = find_raw(json, key);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }

    int64_t value = 0;
    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    // Accept a fractional part ("12.0") but not trailing garbage.
    if (ptr != last && *ptr != '.') {
        return std::nullopt;
    }
    return value;
}

auto get_bool(std::string_view json, std::string_view key) -> std::optional<bool> {
    auto raw = find_raw(json, key);
    if (!raw) {
        return std::nullopt;
    }
    if (*raw == "true") {
        return true;
    }
    if (*raw == "false") {
        return false;
    }
    return std::nullopt;
}

auto get_object(std::string_view json, std::string_view key) -> std::optional<std::string> {
    auto raw = find_raw(json, key);
    if (!raw || raw->empty() || raw->front() != '{') {
        return std::nullopt;
    }
    return raw;
}

auto looks_like_object(std::string_view json) -> bool {
    auto start = skip_space(json, 0);
    if (start >= json.size() || json[start] != '{') {
        return false;
    }
    auto end = container_end(json, start);
    if (end == std::string_view::npos) {
        return false;
    }
    return skip_space(json, end) == json.size();
}

}  // namespace kcenon::file_delivery::json
