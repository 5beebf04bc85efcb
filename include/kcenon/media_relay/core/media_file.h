/**
 * @file media_file.h
 * @brief Media file descriptors shared by both transfer legs
 */

#ifndef KCENON_MEDIA_RELAY_CORE_MEDIA_FILE_H
#define KCENON_MEDIA_RELAY_CORE_MEDIA_FILE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::media_relay {

/// Prefix of hand-off files that exist only to feed the upload leg
inline constexpr std::string_view temp_prefix = "_tmp.";

/**
 * @brief A file known by name and size
 *
 * Identity is the name. Files reported by the device with a zero size or
 * an unreadable entry are flagged invalid and never transferred.
 */
struct media_file {
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point created_at{};
    bool valid = true;

    [[nodiscard]] auto operator==(const media_file& other) const -> bool {
        return name == other.name;
    }
};

/**
 * @brief A file that already exists on local storage, ready for upload
 *
 * logical_name is the name the server will know it by, without any
 * temporary prefix.
 */
struct local_media {
    std::filesystem::path path;
    std::string logical_name;
};

[[nodiscard]] inline auto has_temp_prefix(std::string_view name) -> bool {
    return name.substr(0, temp_prefix.size()) == temp_prefix;
}

[[nodiscard]] inline auto temp_name(std::string_view name) -> std::string {
    if (has_temp_prefix(name)) {
        return std::string(name);
    }
    return std::string(temp_prefix) + std::string(name);
}

[[nodiscard]] inline auto strip_temp_prefix(std::string_view name) -> std::string {
    if (has_temp_prefix(name)) {
        return std::string(name.substr(temp_prefix.size()));
    }
    return std::string(name);
}

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_MEDIA_FILE_H
