/**
 * @file json_utils.h
 * @brief Small JSON helpers for node responses and journal records
 *
 * Flat objects and string arrays only. Nested objects are not interpreted.
 */

#ifndef KCENON_MEDIA_RELAY_CORE_JSON_UTILS_H
#define KCENON_MEDIA_RELAY_CORE_JSON_UTILS_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_relay::json {

[[nodiscard]] auto escape(std::string_view s) -> std::string;
[[nodiscard]] auto unescape(std::string_view s) -> std::string;

/**
 * @brief Extract a top-level string or number value
 * @return The raw value (string values unescaped), or nullopt if absent
 */
[[nodiscard]] auto extract_value(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

[[nodiscard]] auto has_key(std::string_view json, std::string_view key) -> bool;

/**
 * @brief Parse a JSON array of strings, e.g. ["a.mp4", "b.mp4"]
 * @return nullopt if the text is not an array of strings
 */
[[nodiscard]] auto parse_string_array(std::string_view json)
    -> std::optional<std::vector<std::string>>;

}  // namespace kcenon::media_relay::json

#endif  // KCENON_MEDIA_RELAY_CORE_JSON_UTILS_H
