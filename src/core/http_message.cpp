/**
 * @file http_message.cpp
 * @brief HTTP framing helpers
 */

#include <kcenon/media_relay/core/http_message.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace kcenon::media_relay {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

auto split_lines(std::string_view head) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < head.size()) {
        auto end = head.find("\r\n", start);
        if (end == std::string_view::npos) {
            lines.push_back(head.substr(start));
            break;
        }
        lines.push_back(head.substr(start, end - start));
        start = end + 2;
    }
    return lines;
}

}  // namespace

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto to_bytes(std::string_view text) -> std::vector<std::byte> {
    std::vector<std::byte> out(text.size());
    std::transform(text.begin(), text.end(), out.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return out;
}

auto to_text(std::span<const std::byte> bytes) -> std::string {
    std::string out(bytes.size(), '\0');
    std::transform(bytes.begin(), bytes.end(), out.begin(),
                   [](std::byte b) { return static_cast<char>(b); });
    return out;
}

auto url_encode(std::string_view value) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += hex[uc >> 4];
            out += hex[uc & 0x0F];
        }
    }
    return out;
}

auto http_response::header(std::string_view name) const -> std::optional<std::string> {
    for (const auto& [key, value] : headers) {
        if (equals_ignore_case(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

auto http_response::body_text() const -> std::string {
    return to_text(body);
}

auto serialize_request_head(const http_request& request,
                            std::optional<uint64_t> content_length_override) -> std::string {
    std::ostringstream oss;
    oss << to_string(request.method) << ' ' << request.path << " HTTP/1.1\r\n";

    bool has_length = false;
    for (const auto& [key, value] : request.headers) {
        if (equals_ignore_case(key, "Content-Length")) {
            if (content_length_override) {
                continue;
            }
            has_length = true;
        }
        oss << key << ": " << value << "\r\n";
    }

    if (content_length_override) {
        oss << "Content-Length: " << *content_length_override << "\r\n";
    } else if (!has_length && request.body) {
        oss << "Content-Length: " << request.body->size() << "\r\n";
    }

    oss << "\r\n";
    return oss.str();
}

auto serialize_request(const http_request& request) -> std::vector<std::byte> {
    auto text = serialize_request_head(request);
    if (request.body) {
        text += *request.body;
    }
    return to_bytes(text);
}

auto find_header_end(std::span<const std::byte> bytes) -> std::optional<std::size_t> {
    if (bytes.size() < header_terminator.size()) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i + header_terminator.size() <= bytes.size(); ++i) {
        if (bytes[i] == std::byte{'\r'} && bytes[i + 1] == std::byte{'\n'} &&
            bytes[i + 2] == std::byte{'\r'} && bytes[i + 3] == std::byte{'\n'}) {
            return i + header_terminator.size();
        }
    }
    return std::nullopt;
}

auto parse_content_length(std::string_view head) -> std::optional<uint64_t> {
    for (auto line : split_lines(head)) {
        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        if (!equals_ignore_case(trim(line.substr(0, colon)), "Content-Length")) {
            continue;
        }
        auto value = trim(line.substr(colon + 1));
        uint64_t length = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return std::nullopt;
        }
        return length;
    }
    return std::nullopt;
}

auto parse_response(std::span<const std::byte> bytes) -> std::optional<http_response> {
    auto header_end = find_header_end(bytes);
    if (!header_end) {
        return std::nullopt;
    }

    auto head = to_text(bytes.first(*header_end - header_terminator.size()));
    auto lines = split_lines(head);
    if (lines.empty()) {
        return std::nullopt;
    }

    http_response response;
    response.status_line = std::string(lines.front());

    // "<version> <code> <reason>", where the reason phrase may be empty
    std::string_view status = response.status_line;
    const auto first_space = status.find(' ');
    if (first_space == 0 || first_space == std::string_view::npos) {
        return std::nullopt;
    }
    auto code_text = status.substr(first_space + 1);
    code_text = code_text.substr(0, code_text.find(' '));
    if (code_text.empty()) {
        return std::nullopt;
    }
    int code = 0;
    auto [ptr, ec] = std::from_chars(code_text.data(), code_text.data() + code_text.size(), code);
    if (ec != std::errc{} || ptr != code_text.data() + code_text.size()) {
        return std::nullopt;
    }
    response.status_code = code;

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto sep = lines[i].find(": ");
        if (sep == std::string_view::npos) {
            continue;
        }
        response.headers[std::string(lines[i].substr(0, sep))] =
            std::string(lines[i].substr(sep + 2));
    }

    auto body = bytes.subspan(*header_end);
    response.body.assign(body.begin(), body.end());
    return response;
}

}  // namespace kcenon::media_relay
