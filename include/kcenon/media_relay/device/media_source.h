/**
 * @file media_source.h
 * @brief Removable storage the download leg reads from
 */

#ifndef KCENON_MEDIA_RELAY_DEVICE_MEDIA_SOURCE_H
#define KCENON_MEDIA_RELAY_DEVICE_MEDIA_SOURCE_H

#include <kcenon/media_relay/core/media_file.h>
#include <kcenon/media_relay/core/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Device media access
 *
 * Calls block and run on the I/O pool.
 */
class media_source {
public:
    using chunk_fn = std::function<result<void>(std::span<const std::byte>)>;

    virtual ~media_source() = default;

    [[nodiscard]] virtual auto list() -> result<std::vector<media_file>> = 0;

    /**
     * @brief Stream a file starting at offset
     *
     * on_chunk is called per chunk in order; an error from it aborts the
     * fetch and is returned unchanged. Stop is checked before every chunk
     * and yields error_code::download_cancelled.
     */
    [[nodiscard]] virtual auto fetch(const media_file& file,
                                     uint64_t offset,
                                     std::stop_token stop,
                                     const chunk_fn& on_chunk) -> result<void> = 0;

    /**
     * @brief Whether the device is currently reachable
     */
    [[nodiscard]] virtual auto is_available() const -> bool = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_DEVICE_MEDIA_SOURCE_H
