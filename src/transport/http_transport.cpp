/**
 * @file http_transport.cpp
 * @brief Implementation of http_transport
 */

#include "kcenon/media_relay/transport/http_transport.h"
#include "kcenon/media_relay/core/logging.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>

namespace kcenon::media_relay {

namespace {

/// Upper bound of a response head; anything longer is not our node
constexpr std::size_t max_head_size = 64 * 1024;

auto is_stream_breaking(const error& err) -> bool {
    auto category = err.category();
    return category == error_category::connectivity ||
           category == error_category::cancellation;
}

}  // namespace

struct http_transport::impl {
    /**
     * @brief Per-operation view of the open connection
     */
    struct op_context {
        stream_connection& conn;
        bool dirty = false;        ///< Stream left out of sync
        bool peer_closed = false;  ///< Response ended by close
    };

    transport_config config;
    std::shared_ptr<connection_factory> factory;
    std::shared_ptr<adapters::io_task_pool> io_pool;

    // Serializes request/response exchanges and guards `connection`
    std::mutex io_mutex;
    std::unique_ptr<stream_connection> connection;

    mutable std::mutex state_mutex;
    connection_state current_state = connection_state::started;
    std::vector<connection_observer*> observers;
    std::mutex notify_mutex;

    std::mutex stop_mutex;
    std::stop_source upload_stop;
    std::stop_source download_stop;

    // Reconnection
    std::mutex reconnect_mutex;
    std::condition_variable reconnect_cv;
    bool reconnecting = false;
    bool shutting_down = false;
    std::atomic<uint64_t> generation{0};

    impl(transport_config cfg,
         std::shared_ptr<connection_factory> f,
         std::shared_ptr<adapters::io_task_pool> pool)
        : config(std::move(cfg)), factory(std::move(f)), io_pool(std::move(pool)) {}

    // ------------------------------------------------------------------------
    // State and observers
    // ------------------------------------------------------------------------

    void set_state(connection_state new_state) {
        std::lock_guard<std::mutex> notify_lock(notify_mutex);
        std::vector<connection_observer*> targets;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            auto old_state = std::exchange(current_state, new_state);
            if (old_state == new_state) {
                return;
            }
            MR_LOG_DEBUG(log_category::transport,
                "Node connection state changed: " + std::string(to_string(old_state)) +
                " -> " + std::string(to_string(new_state)));
            targets = observers;
        }
        for (auto* observer : targets) {
            observer->on_connection_state(new_state);
        }
    }

    auto get_state() const -> connection_state {
        std::lock_guard<std::mutex> lock(state_mutex);
        return current_state;
    }

    // ------------------------------------------------------------------------
    // Connection management
    // ------------------------------------------------------------------------

    /// Requires io_mutex
    auto connect_locked() -> result<void> {
        if (connection) {
            connection->close();
            connection.reset();
        }
        auto conn = factory->create();
        if (!conn) {
            return unexpected(error(error_code::invalid_configuration,
                "connection factory produced no connection"));
        }
        auto opened = conn->open(config.host, config.port, config.connect_timeout,
                                 config.keep_alive);
        if (!opened) {
            return opened;
        }
        connection = std::move(conn);
        return {};
    }

    /// Requires io_mutex
    void close_locked() {
        if (connection) {
            connection->close();
            connection.reset();
        }
    }

    void schedule_reconnect(bool forced) {
        if (!config.auto_reconnect && !forced) {
            set_state(connection_state::disconnected);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex);
            if (reconnecting || shutting_down) {
                return;
            }
            reconnecting = true;
        }
        const auto gen = generation.load();
        io_pool->submit([this, gen] { reconnect_loop(gen); }, "reconnect");
    }

    void reconnect_loop(uint64_t gen) {
        const auto& policy = config.reconnect;
        bool connected = false;

        for (std::size_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
            {
                std::unique_lock<std::mutex> lock(reconnect_mutex);
                reconnect_cv.wait_for(lock, policy.delay_for(attempt), [this, gen] {
                    return shutting_down || generation.load() != gen;
                });
                if (shutting_down || generation.load() != gen) {
                    break;
                }
            }

            MR_LOG_INFO(log_category::transport,
                "Reconnecting to " + config.host + ":" + std::to_string(config.port) +
                " (attempt " + std::to_string(attempt) + "/" +
                std::to_string(policy.max_attempts) + ")");

            std::lock_guard<std::mutex> io_lock(io_mutex);
            if (generation.load() != gen) {
                break;
            }
            auto r = connect_locked();
            if (r) {
                connected = true;
                break;
            }
            MR_LOG_WARN(log_category::transport, "Reconnect failed: " + r.error().message);
        }

        bool superseded = false;
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex);
            reconnecting = false;
            superseded = shutting_down || generation.load() != gen;
        }
        reconnect_cv.notify_all();

        if (superseded) {
            return;
        }
        if (connected) {
            set_state(connection_state::connected);
        } else {
            MR_LOG_ERROR(log_category::transport, "Giving up reconnecting to " + config.host);
            set_state(connection_state::disconnected);
        }
    }

    /**
     * @brief Run one exchange on the open connection
     *
     * Breaking failures tear the connection down and start reconnection
     * after the I/O lock is released.
     */
    template <typename T, typename Fn>
    auto with_connection(Fn&& body) -> result<T> {
        bool torn_down = false;
        result<T> outcome = [&]() -> result<T> {
            std::lock_guard<std::mutex> lock(io_mutex);
            if (!connection || !connection->is_open()) {
                return unexpected(error(error_code::not_connected, "not connected to node"));
            }
            op_context ctx{*connection};
            result<T> r = body(ctx);
            if ((!r && (is_stream_breaking(r.error()) || ctx.dirty)) || ctx.peer_closed) {
                close_locked();
                torn_down = true;
            }
            return r;
        }();

        if (torn_down) {
            if (!outcome) {
                MR_LOG_WARN(log_category::transport,
                    "Connection to node dropped: " + outcome.error().message);
            }
            set_state(connection_state::lost);
            schedule_reconnect(false);
        }
        return outcome;
    }

    // ------------------------------------------------------------------------
    // Wire helpers
    // ------------------------------------------------------------------------

    static auto write_all(op_context& ctx, std::span<const std::byte> data) -> result<void> {
        auto r = ctx.conn.write(data);
        if (!r) {
            ctx.dirty = true;
        }
        return r;
    }

    /**
     * @brief Read until the header terminator
     * @param head Receives the bytes up to and including the terminator
     * @param leftover Receives body bytes that arrived with the head
     */
    auto read_head(op_context& ctx, std::vector<std::byte>& head,
                   std::vector<std::byte>& leftover) -> result<void> {
        std::vector<std::byte> buffer;
        while (true) {
            if (auto end = find_header_end(buffer)) {
                head.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*end));
                leftover.assign(buffer.begin() + static_cast<std::ptrdiff_t>(*end), buffer.end());
                return {};
            }
            if (buffer.size() > max_head_size) {
                ctx.dirty = true;
                return unexpected(error(error_code::malformed_response, "response head too large"));
            }
            auto chunk = ctx.conn.read_some(config.chunk_size, config.read_timeout);
            if (!chunk) {
                ctx.dirty = true;
                return unexpected(chunk.error());
            }
            if (chunk.value().empty()) {
                ctx.peer_closed = true;
                return unexpected(error(error_code::connection_lost,
                    "connection closed before response head"));
            }
            buffer.insert(buffer.end(), chunk.value().begin(), chunk.value().end());
        }
    }

    /**
     * @brief Deliver the body to sink, either Content-Length bytes or until close
     */
    template <typename Sink>
    auto read_body(op_context& ctx, const std::vector<std::byte>& head,
                   std::vector<std::byte> leftover, Sink&& sink,
                   const std::stop_token& stop, error_code cancel_code) -> result<void> {
        auto length = parse_content_length(to_text(head));
        uint64_t received = 0;

        auto deliver = [&](std::span<const std::byte> bytes) -> result<void> {
            if (length && received + bytes.size() > *length) {
                bytes = bytes.first(static_cast<std::size_t>(*length - received));
            }
            received += bytes.size();
            if (bytes.empty()) {
                return {};
            }
            return sink(bytes);
        };

        if (auto r = deliver(leftover); !r) {
            ctx.dirty = true;
            return r;
        }

        while (!length || received < *length) {
            if (stop.stop_requested()) {
                ctx.dirty = true;
                return unexpected(error(cancel_code));
            }
            auto chunk = ctx.conn.read_some(config.chunk_size, config.read_timeout);
            if (!chunk) {
                ctx.dirty = true;
                return unexpected(chunk.error());
            }
            if (chunk.value().empty()) {
                ctx.peer_closed = true;
                if (length) {
                    return unexpected(error(error_code::connection_lost,
                        "connection closed mid-body (" + std::to_string(received) + "/" +
                        std::to_string(*length) + ")"));
                }
                return {};
            }
            if (auto r = deliver(chunk.value()); !r) {
                ctx.dirty = true;
                return r;
            }
        }
        return {};
    }

    auto fresh_stop(std::stop_source& source) -> std::stop_token {
        std::lock_guard<std::mutex> lock(stop_mutex);
        source = std::stop_source{};
        return source.get_token();
    }

    void request_stop(std::stop_source& source) {
        std::lock_guard<std::mutex> lock(stop_mutex);
        source.request_stop();
    }
};

http_transport::http_transport(transport_config config,
                               std::shared_ptr<connection_factory> factory,
                               std::shared_ptr<adapters::io_task_pool> io_pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(factory), std::move(io_pool))) {
    get_logger().initialize();
}

http_transport::~http_transport() {
    {
        std::unique_lock<std::mutex> lock(impl_->reconnect_mutex);
        impl_->shutting_down = true;
        impl_->reconnect_cv.notify_all();
        impl_->reconnect_cv.wait(lock, [this] { return !impl_->reconnecting; });
    }
    impl_->request_stop(impl_->upload_stop);
    impl_->request_stop(impl_->download_stop);
    std::lock_guard<std::mutex> io_lock(impl_->io_mutex);
    impl_->close_locked();
}

auto http_transport::open() -> result<void> {
    impl_->generation.fetch_add(1);
    impl_->reconnect_cv.notify_all();

    MR_LOG_INFO(log_category::transport,
        "Connecting to node " + impl_->config.host + ":" + std::to_string(impl_->config.port));

    result<void> r;
    {
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        r = impl_->connect_locked();
    }
    if (!r) {
        MR_LOG_ERROR(log_category::transport, "Node connection failed: " + r.error().message);
        impl_->set_state(connection_state::disconnected);
        if (r.error().category() != error_category::connectivity) {
            return unexpected(error(error_code::connection_failed, r.error().message));
        }
        return r;
    }
    impl_->set_state(connection_state::connected);
    return {};
}

auto http_transport::send(const http_request& request) -> result<std::vector<std::byte>> {
    return impl_->with_connection<std::vector<std::byte>>(
        [&](impl::op_context& ctx) -> result<std::vector<std::byte>> {
            auto bytes = serialize_request(request);
            if (auto w = impl::write_all(ctx, bytes); !w) {
                return unexpected(w.error());
            }

            std::vector<std::byte> head;
            std::vector<std::byte> leftover;
            if (auto h = impl_->read_head(ctx, head, leftover); !h) {
                return unexpected(h.error());
            }

            std::vector<std::byte> raw = head;
            auto body = impl_->read_body(
                ctx, head, std::move(leftover),
                [&raw](std::span<const std::byte> chunk) -> result<void> {
                    raw.insert(raw.end(), chunk.begin(), chunk.end());
                    return {};
                },
                std::stop_token{}, error_code::transfer_cancelled);
            if (!body) {
                return unexpected(body.error());
            }
            return raw;
        });
}

auto http_transport::send_file(const http_request& request,
                               const std::filesystem::path& path,
                               progress_fn on_bytes_sent,
                               std::stop_token stop) -> result<std::vector<std::byte>> {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error(error_code::file_not_found,
            "cannot stat " + path.filename().string() + ": " + ec.message()));
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_access_denied,
            "cannot open " + path.filename().string()));
    }

    auto internal = impl_->fresh_stop(impl_->upload_stop);

    return impl_->with_connection<std::vector<std::byte>>(
        [&](impl::op_context& ctx) -> result<std::vector<std::byte>> {
            auto head_text = serialize_request_head(request, file_size);
            ctx.dirty = true;  // cleared once the whole body is out
            if (auto w = impl::write_all(ctx, to_bytes(head_text)); !w) {
                return unexpected(w.error());
            }

            std::vector<char> buffer(impl_->config.chunk_size);
            uint64_t sent = 0;
            while (sent < file_size) {
                if (stop.stop_requested() || internal.stop_requested()) {
                    MR_LOG_INFO(log_category::transport,
                        "Upload of " + path.filename().string() + " cancelled at " +
                        std::to_string(sent) + "/" + std::to_string(file_size));
                    return unexpected(error(error_code::upload_cancelled));
                }
                auto want = static_cast<std::streamsize>(
                    std::min<uint64_t>(buffer.size(), file_size - sent));
                file.read(buffer.data(), want);
                auto got = file.gcount();
                if (got <= 0) {
                    return unexpected(error(error_code::file_read_error,
                        "short read from " + path.filename().string()));
                }
                std::span<const std::byte> chunk(
                    reinterpret_cast<const std::byte*>(buffer.data()),
                    static_cast<std::size_t>(got));
                if (auto w = impl::write_all(ctx, chunk); !w) {
                    return unexpected(w.error());
                }
                sent += static_cast<uint64_t>(got);
                if (on_bytes_sent) {
                    on_bytes_sent(static_cast<std::size_t>(got));
                }
            }
            ctx.dirty = false;

            std::vector<std::byte> head;
            std::vector<std::byte> leftover;
            if (auto h = impl_->read_head(ctx, head, leftover); !h) {
                return unexpected(h.error());
            }
            std::vector<std::byte> raw = head;
            auto body = impl_->read_body(
                ctx, head, std::move(leftover),
                [&raw](std::span<const std::byte> bytes) -> result<void> {
                    raw.insert(raw.end(), bytes.begin(), bytes.end());
                    return {};
                },
                std::stop_token{}, error_code::upload_cancelled);
            if (!body) {
                return unexpected(body.error());
            }
            return raw;
        });
}

auto http_transport::download_to_file(const http_request& request,
                                      const std::filesystem::path& destination,
                                      progress_fn on_bytes_received,
                                      std::stop_token stop) -> result<std::string> {
    auto internal = impl_->fresh_stop(impl_->download_stop);

    std::stop_source merged;
    std::stop_callback link_external(stop, [&merged] { merged.request_stop(); });
    std::stop_callback link_internal(internal, [&merged] { merged.request_stop(); });

    return impl_->with_connection<std::string>(
        [&](impl::op_context& ctx) -> result<std::string> {
            if (auto w = impl::write_all(ctx, serialize_request(request)); !w) {
                return unexpected(w.error());
            }

            std::vector<std::byte> head;
            std::vector<std::byte> leftover;
            if (auto h = impl_->read_head(ctx, head, leftover); !h) {
                return unexpected(h.error());
            }
            auto head_text = to_text(head);

            auto parsed = parse_response(head);
            if (!parsed) {
                ctx.dirty = true;
                return unexpected(error(error_code::malformed_response,
                    "malformed response status line"));
            }

            if (!parsed->is_success()) {
                // Drain the error body to keep the stream in sync
                auto drained = impl_->read_body(
                    ctx, head, std::move(leftover),
                    [](std::span<const std::byte>) -> result<void> { return {}; },
                    std::stop_token{}, error_code::download_cancelled);
                if (!drained) {
                    return unexpected(drained.error());
                }
                return head_text;
            }

            std::ofstream out(destination, std::ios::binary | std::ios::trunc);
            if (!out) {
                ctx.dirty = true;
                return unexpected(error(error_code::file_write_error,
                    "cannot open " + destination.filename().string() + " for writing"));
            }

            auto body = impl_->read_body(
                ctx, head, std::move(leftover),
                [&](std::span<const std::byte> bytes) -> result<void> {
                    out.write(reinterpret_cast<const char*>(bytes.data()),
                              static_cast<std::streamsize>(bytes.size()));
                    if (!out) {
                        return unexpected(error(error_code::file_write_error,
                            "write to " + destination.filename().string() + " failed"));
                    }
                    if (on_bytes_received) {
                        on_bytes_received(bytes.size());
                    }
                    return {};
                },
                merged.get_token(), error_code::download_cancelled);
            if (!body) {
                return unexpected(body.error());
            }
            out.flush();
            if (!out) {
                return unexpected(error(error_code::file_write_error,
                    "flush of " + destination.filename().string() + " failed"));
            }
            return head_text;
        });
}

void http_transport::cancel_send_file() {
    impl_->request_stop(impl_->upload_stop);
}

void http_transport::cancel_download_file() {
    impl_->request_stop(impl_->download_stop);
}

void http_transport::terminate(bool try_restart) {
    impl_->request_stop(impl_->upload_stop);
    impl_->request_stop(impl_->download_stop);

    if (!try_restart) {
        impl_->generation.fetch_add(1);
        impl_->reconnect_cv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        impl_->close_locked();
    }

    if (try_restart) {
        MR_LOG_INFO(log_category::transport, "Restarting node connection");
        impl_->set_state(connection_state::lost);
        impl_->schedule_reconnect(true);
    } else {
        MR_LOG_INFO(log_category::transport, "Node connection closed");
        impl_->set_state(connection_state::disconnected);
    }
}

void http_transport::add_observer(connection_observer* observer) {
    if (observer == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> notify_lock(impl_->notify_mutex);
    connection_state current;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (std::find(impl_->observers.begin(), impl_->observers.end(), observer) !=
            impl_->observers.end()) {
            return;
        }
        impl_->observers.push_back(observer);
        current = impl_->current_state;
    }
    observer->on_connection_state(current);
}

void http_transport::remove_observer(connection_observer* observer) {
    std::lock_guard<std::mutex> notify_lock(impl_->notify_mutex);
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->observers.erase(
        std::remove(impl_->observers.begin(), impl_->observers.end(), observer),
        impl_->observers.end());
}

auto http_transport::state() const -> connection_state {
    return impl_->get_state();
}

auto http_transport::is_connected() const -> bool {
    return impl_->get_state() == connection_state::connected;
}

auto http_transport::config() const -> const transport_config& {
    return impl_->config;
}

}  // namespace kcenon::media_relay
