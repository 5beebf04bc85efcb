/**
 * @file directory_media_source.h
 * @brief media_source over a mounted storage directory
 */

#ifndef KCENON_MEDIA_RELAY_DEVICE_DIRECTORY_MEDIA_SOURCE_H
#define KCENON_MEDIA_RELAY_DEVICE_DIRECTORY_MEDIA_SOURCE_H

#include <kcenon/media_relay/device/media_source.h>

#include <filesystem>

namespace kcenon::media_relay {

/**
 * @brief Reads media from a directory (e.g. a mounted SD card)
 *
 * Only regular files directly under the root are listed. Empty files are
 * reported as invalid.
 */
class directory_media_source : public media_source {
public:
    explicit directory_media_source(std::filesystem::path root,
                                    std::size_t chunk_size = 64 * 1024);

    [[nodiscard]] auto list() -> result<std::vector<media_file>> override;

    [[nodiscard]] auto fetch(const media_file& file,
                             uint64_t offset,
                             std::stop_token stop,
                             const chunk_fn& on_chunk) -> result<void> override;

    [[nodiscard]] auto is_available() const -> bool override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
    std::size_t chunk_size_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_DEVICE_DIRECTORY_MEDIA_SOURCE_H
