/**
 * @file http_message.h
 * @brief Minimal HTTP/1.1 request framing and response parsing
 *
 * Only what the processing node speaks: GET and POST, Content-Length framed
 * bodies, no chunked encoding.
 */

#ifndef KCENON_MEDIA_RELAY_CORE_HTTP_MESSAGE_H
#define KCENON_MEDIA_RELAY_CORE_HTTP_MESSAGE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay {

enum class http_method {
    get,
    post
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        default: return "GET";
    }
}

/// Header block terminator
inline constexpr std::string_view header_terminator = "\r\n\r\n";

struct http_request {
    std::string path;
    http_method method = http_method::get;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

struct http_response {
    int status_code = 0;
    std::string status_line;
    std::map<std::string, std::string> headers;
    std::vector<std::byte> body;

    /**
     * @brief Case-insensitive header lookup
     */
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto body_text() const -> std::string;
};

/**
 * @brief Serialize request line and headers, including the blank line
 * @param request Request to serialize
 * @param content_length_override When set, emitted as Content-Length instead
 *        of the body size (used for streamed file bodies)
 */
[[nodiscard]] auto serialize_request_head(
    const http_request& request,
    std::optional<uint64_t> content_length_override = std::nullopt) -> std::string;

/**
 * @brief Serialize a complete request (head plus inline body)
 */
[[nodiscard]] auto serialize_request(const http_request& request) -> std::vector<std::byte>;

/**
 * @brief Find the end of the header block
 * @return Offset of the first body byte, or nullopt if not yet complete
 */
[[nodiscard]] auto find_header_end(std::span<const std::byte> bytes) -> std::optional<std::size_t>;

/**
 * @brief Read Content-Length from a header block (name is case-insensitive)
 */
[[nodiscard]] auto parse_content_length(std::string_view head) -> std::optional<uint64_t>;

/**
 * @brief Parse a full response
 * @return nullopt if the terminator is missing or the status line is malformed
 */
[[nodiscard]] auto parse_response(std::span<const std::byte> bytes) -> std::optional<http_response>;

[[nodiscard]] auto equals_ignore_case(std::string_view a, std::string_view b) -> bool;

[[nodiscard]] auto to_bytes(std::string_view text) -> std::vector<std::byte>;
[[nodiscard]] auto to_text(std::span<const std::byte> bytes) -> std::string;

/**
 * @brief Percent-encode a query parameter value
 */
[[nodiscard]] auto url_encode(std::string_view value) -> std::string;

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_HTTP_MESSAGE_H
