/**
 * @file json_utils.cpp
 * @brief JSON helpers (simple implementation without external library)
 */

#include <kcenon/media_relay/core/json_utils.h>

#include <charconv>
#include <iomanip>
#include <sstream>

namespace kcenon::media_relay::json {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\n' || c == '\t' || c == '\r';
}

auto skip_space(std::string_view s, std::size_t pos) -> std::size_t {
    while (pos < s.size() && is_space(s[pos])) ++pos;
    return pos;
}

/// Returns the index of the closing quote of a string starting at pos
auto string_end(std::string_view s, std::size_t pos) -> std::size_t {
    for (auto i = pos + 1; i < s.size(); ++i) {
        if (s[i] == '\\') {
            ++i;
        } else if (s[i] == '"') {
            return i;
        }
    }
    return std::string_view::npos;
}

}  // namespace

auto escape(std::string_view s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                      << static_cast<int>(c);
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape(std::string_view s) -> std::string {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out += s[i];
            continue;
        }
        switch (s[i + 1]) {
            case '"': out += '"'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '/': out += '/'; ++i; break;
            case 'b': out += '\b'; ++i; break;
            case 'f': out += '\f'; ++i; break;
            case 'n': out += '\n'; ++i; break;
            case 'r': out += '\r'; ++i; break;
            case 't': out += '\t'; ++i; break;
            case 'u':
                if (i + 5 < s.size()) {
                    unsigned code = 0;
                    auto hex = s.substr(i + 2, 4);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                    if (ec == std::errc{} && ptr == hex.data() + hex.size()) {
                        out += static_cast<char>(code);
                        i += 5;
                        break;
                    }
                }
                out += s[i];
                break;
            default: out += s[i]; break;
        }
    }
    return out;
}

auto has_key(std::string_view json, std::string_view key) -> bool {
    std::string quoted = "\"" + std::string(key) + "\"";
    auto pos = json.find(quoted);
    while (pos != std::string_view::npos) {
        auto after = skip_space(json, pos + quoted.size());
        if (after < json.size() && json[after] == ':') {
            return true;
        }
        pos = json.find(quoted, pos + 1);
    }
    return false;
}

auto extract_value(std::string_view json, std::string_view key) -> std::optional<std::string> {
    std::string quoted = "\"" + std::string(key) + "\"";
    auto pos = json.find(quoted);
    while (pos != std::string_view::npos) {
        auto colon = skip_space(json, pos + quoted.size());
        if (colon < json.size() && json[colon] == ':') {
            break;
        }
        pos = json.find(quoted, pos + 1);
    }
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    auto value_start = skip_space(json, json.find(':', pos + quoted.size()) + 1);
    if (value_start >= json.size()) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto end = string_end(json, value_start);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return unescape(json.substr(value_start + 1, end - value_start - 1));
    }

    auto value_end = value_start;
    while (value_end < json.size() && json[value_end] != ',' && json[value_end] != '}' &&
           json[value_end] != ']' && !is_space(json[value_end])) {
        ++value_end;
    }
    if (value_end == value_start) {
        return std::nullopt;
    }
    return std::string(json.substr(value_start, value_end - value_start));
}

auto parse_string_array(std::string_view json) -> std::optional<std::vector<std::string>> {
    auto pos = skip_space(json, 0);
    if (pos >= json.size() || json[pos] != '[') {
        return std::nullopt;
    }

    std::vector<std::string> items;
    pos = skip_space(json, pos + 1);
    if (pos < json.size() && json[pos] == ']') {
        return items;
    }

    while (pos < json.size()) {
        if (json[pos] != '"') {
            return std::nullopt;
        }
        auto end = string_end(json, pos);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        items.push_back(unescape(json.substr(pos + 1, end - pos - 1)));

        pos = skip_space(json, end + 1);
        if (pos < json.size() && json[pos] == ',') {
            pos = skip_space(json, pos + 1);
            continue;
        }
        if (pos < json.size() && json[pos] == ']') {
            return items;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace kcenon::media_relay::json
