/**
 * @file tcp_stream_connection.h
 * @brief TCP stream connection over network_system
 */

#ifndef KCENON_MEDIA_RELAY_TRANSPORT_TCP_STREAM_CONNECTION_H
#define KCENON_MEDIA_RELAY_TRANSPORT_TCP_STREAM_CONNECTION_H

#include <kcenon/media_relay/config/feature_flags.h>
#include <kcenon/media_relay/transport/stream_connection.h>

#if MEDIA_RELAY_HAS_TCP_CONNECTION

namespace kcenon::media_relay {

/**
 * @brief stream_connection backed by network_system's messaging_client
 *
 * Received packets are queued by the client's callback thread and consumed
 * by read_some(). open() waits up to its timeout for the client's connected
 * callback. keep_alive is left to network_system's socket defaults.
 */
class tcp_stream_connection : public stream_connection {
public:
    tcp_stream_connection();
    ~tcp_stream_connection() override;

    tcp_stream_connection(const tcp_stream_connection&) = delete;
    auto operator=(const tcp_stream_connection&) -> tcp_stream_connection& = delete;

    [[nodiscard]] auto open(const std::string& host,
                            uint16_t port,
                            std::chrono::milliseconds timeout,
                            bool keep_alive) -> result<void> override;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> result<void> override;

    [[nodiscard]] auto read_some(std::size_t max_bytes, std::chrono::milliseconds timeout)
        -> result<std::vector<std::byte>> override;

    void close() override;

    [[nodiscard]] auto is_open() const -> bool override;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

class tcp_connection_factory : public connection_factory {
public:
    [[nodiscard]] auto create() -> std::unique_ptr<stream_connection> override {
        return std::make_unique<tcp_stream_connection>();
    }
};

}  // namespace kcenon::media_relay

#endif  // MEDIA_RELAY_HAS_TCP_CONNECTION

#endif  // KCENON_MEDIA_RELAY_TRANSPORT_TCP_STREAM_CONNECTION_H
