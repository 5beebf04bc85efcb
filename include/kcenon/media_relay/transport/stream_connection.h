/**
 * @file stream_connection.h
 * @brief Byte stream seam below the HTTP transport
 */

#ifndef KCENON_MEDIA_RELAY_TRANSPORT_STREAM_CONNECTION_H
#define KCENON_MEDIA_RELAY_TRANSPORT_STREAM_CONNECTION_H

#include <kcenon/media_relay/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief A blocking, ordered byte stream
 *
 * One connection is used by one thread at a time; http_transport
 * serializes access.
 */
class stream_connection {
public:
    virtual ~stream_connection() = default;

    [[nodiscard]] virtual auto open(const std::string& host,
                                    uint16_t port,
                                    std::chrono::milliseconds timeout,
                                    bool keep_alive) -> result<void> = 0;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Read up to max_bytes
     * @return The bytes read; an empty vector means the peer closed the stream
     */
    [[nodiscard]] virtual auto read_some(std::size_t max_bytes,
                                         std::chrono::milliseconds timeout)
        -> result<std::vector<std::byte>> = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;
};

/**
 * @brief Creates a fresh connection for every (re)connect
 */
class connection_factory {
public:
    virtual ~connection_factory() = default;
    [[nodiscard]] virtual auto create() -> std::unique_ptr<stream_connection> = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSPORT_STREAM_CONNECTION_H
