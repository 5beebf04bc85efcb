/**
 * @file http_transport.h
 * @brief HTTP over a single persistent stream to the processing node
 */

#ifndef KCENON_MEDIA_RELAY_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_MEDIA_RELAY_TRANSPORT_HTTP_TRANSPORT_H

#include <kcenon/media_relay/adapters/thread_pool_adapter.h>
#include <kcenon/media_relay/core/http_message.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/transport/stream_connection.h>
#include <kcenon/media_relay/transport/transport_config.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Receives every distinct connection state transition
 *
 * Called from whichever thread caused the transition. Implementations
 * should hand the state over to their own context.
 */
class connection_observer {
public:
    virtual ~connection_observer() = default;
    virtual void on_connection_state(connection_state state) = 0;
};

/**
 * @brief Blocking HTTP/1.1 client for one node
 *
 * Every request method blocks and must be called from an I/O task. Calls
 * are serialized internally; a second caller waits for the first.
 *
 * An I/O failure while connected closes the stream, reports
 * connection_state::lost, starts reconnection on the I/O pool, and
 * returns the error to the caller. Cancelling a streaming call has the
 * same effect, since the stream is no longer in sync afterwards.
 *
 * @code
 * http_transport transport(config, factory, pool);
 * if (auto r = transport.open(); !r) { ... }
 * auto raw = transport.send({"/node/connectuser", http_method::get, {}, {}});
 * auto response = parse_response(raw.value());
 * @endcode
 */
class http_transport {
public:
    using progress_fn = std::function<void(std::size_t bytes)>;

    http_transport(transport_config config,
                   std::shared_ptr<connection_factory> factory,
                   std::shared_ptr<adapters::io_task_pool> io_pool);
    ~http_transport();

    http_transport(const http_transport&) = delete;
    auto operator=(const http_transport&) -> http_transport& = delete;

    /**
     * @brief Connect to the configured node
     *
     * Success moves the state to connected; failure to disconnected.
     */
    [[nodiscard]] auto open() -> result<void>;

    /**
     * @brief Send a request and return the raw response bytes (head and body)
     */
    [[nodiscard]] auto send(const http_request& request) -> result<std::vector<std::byte>>;

    /**
     * @brief Send a request whose body is streamed from a file
     *
     * Content-Length is set to the file size. on_bytes_sent is called after
     * each chunk written. Cancellation is checked before every chunk.
     */
    [[nodiscard]] auto send_file(const http_request& request,
                                 const std::filesystem::path& path,
                                 progress_fn on_bytes_sent,
                                 std::stop_token stop = {}) -> result<std::vector<std::byte>>;

    /**
     * @brief Send a request and stream the response body into a file
     * @return The response head (status line and headers), so the caller can
     *         check the status. The file is only written for 2xx responses.
     */
    [[nodiscard]] auto download_to_file(const http_request& request,
                                        const std::filesystem::path& destination,
                                        progress_fn on_bytes_received,
                                        std::stop_token stop = {}) -> result<std::string>;

    void cancel_send_file();
    void cancel_download_file();

    /**
     * @brief Close the connection
     * @param try_restart true: report lost and reconnect; false: report disconnected
     */
    void terminate(bool try_restart);

    /**
     * @brief Register an observer; it immediately receives the current state
     */
    void add_observer(connection_observer* observer);
    void remove_observer(connection_observer* observer);

    [[nodiscard]] auto state() const -> connection_state;
    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto config() const -> const transport_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSPORT_HTTP_TRANSPORT_H
