/**
 * @file tcp_stream_connection.cpp
 * @brief network_system backed stream connection
 */

#include "kcenon/media_relay/transport/tcp_stream_connection.h"

#if MEDIA_RELAY_HAS_TCP_CONNECTION

#include "kcenon/media_relay/core/logging.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>

#include <kcenon/network/core/messaging_client.h>

namespace kcenon::media_relay {

struct tcp_stream_connection::impl {
    std::shared_ptr<network_system::core::messaging_client> client;

    std::mutex mutex;
    std::condition_variable readable;
    std::deque<std::byte> buffer;
    bool open = false;
    bool connected = false;
    bool peer_closed = false;
    std::string last_error;
};

tcp_stream_connection::tcp_stream_connection() : impl_(std::make_shared<impl>()) {}

tcp_stream_connection::~tcp_stream_connection() {
    close();
}

auto tcp_stream_connection::open(const std::string& host,
                                 uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 [[maybe_unused]] bool keep_alive) -> result<void> {
    close();

    impl_->client = std::make_shared<network_system::core::messaging_client>("media_relay_node");

    std::weak_ptr<impl> weak = impl_;
    impl_->client->set_receive_callback([weak](const std::vector<std::uint8_t>& data) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            std::transform(data.begin(), data.end(), std::back_inserter(self->buffer),
                           [](std::uint8_t b) { return std::byte{b}; });
        }
        self->readable.notify_all();
    });
    impl_->client->set_connected_callback([weak]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->connected = true;
        }
        self->readable.notify_all();
    });
    impl_->client->set_disconnected_callback([weak]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->peer_closed = true;
        }
        self->readable.notify_all();
    });

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->buffer.clear();
        impl_->connected = false;
        impl_->peer_closed = false;
    }

    auto started = impl_->client->start_client(host, port);
    if (started.is_err()) {
        MR_LOG_ERROR(log_category::transport,
            "TCP connect to " + host + ":" + std::to_string(port) + " failed: " +
            started.error().message);
        impl_->client.reset();
        return unexpected(error(error_code::connection_failed,
            "Connection failed: " + started.error().message));
    }

    // start_client returns once the connect is under way
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        const bool settled = impl_->readable.wait_for(lock, timeout, [this] {
            return impl_->connected || impl_->peer_closed;
        });
        if (settled && impl_->connected && !impl_->peer_closed) {
            impl_->open = true;
            return {};
        }
    }

    const bool timed_out = [this] {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        return !impl_->peer_closed;
    }();
    close();
    if (timed_out) {
        MR_LOG_WARN(log_category::transport,
            "TCP connect to " + host + ":" + std::to_string(port) + " timed out after " +
            std::to_string(timeout.count()) + " ms");
        return unexpected(error(error_code::connection_timeout,
            host + " did not answer within " + std::to_string(timeout.count()) + " ms"));
    }
    return unexpected(error(error_code::connection_refused,
        host + " closed the connection while connecting"));
}

auto tcp_stream_connection::write(std::span<const std::byte> data) -> result<void> {
    std::shared_ptr<network_system::core::messaging_client> client;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->open || impl_->peer_closed) {
            return unexpected(error(error_code::not_connected, "connection is not open"));
        }
        client = impl_->client;
    }
    if (data.empty()) {
        return {};
    }

    std::vector<std::uint8_t> packet(data.size());
    std::transform(data.begin(), data.end(), packet.begin(),
                   [](std::byte b) { return static_cast<std::uint8_t>(b); });

    auto sent = client->send_packet(std::move(packet));
    if (sent.is_err()) {
        return unexpected(error(error_code::connection_lost,
            "Send failed: " + sent.error().message));
    }
    return {};
}

auto tcp_stream_connection::read_some(std::size_t max_bytes, std::chrono::milliseconds timeout)
    -> result<std::vector<std::byte>> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    if (!impl_->open) {
        return unexpected(error(error_code::not_connected, "connection is not open"));
    }

    bool ready = impl_->readable.wait_for(lock, timeout, [this] {
        return !impl_->buffer.empty() || impl_->peer_closed || !impl_->open;
    });
    if (!ready) {
        return unexpected(error(error_code::connection_timeout, "Receive timeout"));
    }
    if (impl_->buffer.empty()) {
        // Peer closed (or local close): end of stream
        return std::vector<std::byte>{};
    }

    auto count = std::min(max_bytes, impl_->buffer.size());
    std::vector<std::byte> out(impl_->buffer.begin(),
                               impl_->buffer.begin() + static_cast<std::ptrdiff_t>(count));
    impl_->buffer.erase(impl_->buffer.begin(),
                        impl_->buffer.begin() + static_cast<std::ptrdiff_t>(count));
    return out;
}

void tcp_stream_connection::close() {
    std::shared_ptr<network_system::core::messaging_client> client;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->open = false;
        client = std::move(impl_->client);
    }
    impl_->readable.notify_all();

    if (client) {
        auto stopped = client->stop_client();
        if (stopped.is_err()) {
            MR_LOG_WARN(log_category::transport,
                "TCP disconnect failed: " + stopped.error().message);
        }
    }
}

auto tcp_stream_connection::is_open() const -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->open && !impl_->peer_closed;
}

}  // namespace kcenon::media_relay

#endif  // MEDIA_RELAY_HAS_TCP_CONNECTION
