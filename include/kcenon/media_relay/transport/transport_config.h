/**
 * @file transport_config.h
 * @brief Configuration of the node transport
 */

#ifndef KCENON_MEDIA_RELAY_TRANSPORT_TRANSPORT_CONFIG_H
#define KCENON_MEDIA_RELAY_TRANSPORT_TRANSPORT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace kcenon::media_relay {

/**
 * @brief Connection state as seen by observers
 */
enum class connection_state {
    started,       ///< Transport created, never connected
    connected,     ///< Connection established
    disconnected,  ///< Closed on request, or reconnection given up
    lost           ///< Dropped unexpectedly; reconnection follows
};

[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::started: return "started";
        case connection_state::connected: return "connected";
        case connection_state::disconnected: return "disconnected";
        case connection_state::lost: return "lost";
        default: return "unknown";
    }
}

/**
 * @brief Reconnection policy configuration
 */
struct reconnect_policy {
    std::size_t max_attempts = 5;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before the given attempt (1-based)
     */
    [[nodiscard]] auto delay_for(std::size_t attempt) const -> std::chrono::milliseconds {
        double delay = static_cast<double>(initial_delay.count());
        for (std::size_t i = 1; i < attempt; ++i) {
            delay *= backoff_multiplier;
            if (delay >= static_cast<double>(max_delay.count())) {
                return max_delay;
            }
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay));
    }
};

/**
 * @brief Transport configuration
 */
struct transport_config {
    std::string host;
    uint16_t port = 8000;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    bool keep_alive = true;
    bool auto_reconnect = true;
    reconnect_policy reconnect;
    std::size_t chunk_size = 64 * 1024;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSPORT_TRANSPORT_CONFIG_H
