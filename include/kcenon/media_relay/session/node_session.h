/**
 * @file node_session.h
 * @brief Connection to the processing node and its HTTP endpoints
 */

#ifndef KCENON_MEDIA_RELAY_SESSION_NODE_SESSION_H
#define KCENON_MEDIA_RELAY_SESSION_NODE_SESSION_H

#include <kcenon/media_relay/adapters/thread_pool_adapter.h>
#include <kcenon/media_relay/executor/command.h>
#include <kcenon/media_relay/executor/command_queue.h>
#include <kcenon/media_relay/executor/serial_dispatcher.h>
#include <kcenon/media_relay/transfer/remote_catalog.h>
#include <kcenon/media_relay/transfer/upload_sink.h>
#include <kcenon/media_relay/transport/http_transport.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Node session configuration
 */
struct node_session_config {
    uint16_t port = 8000;

    /// Bearer token sent with every request
    std::string token;

    /// Value of the Session header
    std::string session_id;

    /// Timeout of the reachability probe
    std::chrono::milliseconds probe_timeout{2000};

    /// Connect timeout of the persistent connection
    std::chrono::milliseconds connect_timeout{10000};

    std::chrono::milliseconds read_timeout{30000};

    bool auto_reconnect = true;
    reconnect_policy reconnect;
};

/**
 * @brief The relay's view of one processing node
 *
 * Owns the persistent http_transport once connect() has found a node that
 * answers. Connection state changes are marshalled onto the serialized
 * context, where they enable or disable the server queue:
 * - connected enables the queue and refreshes the remote catalog;
 * - lost disables the queue until the transport reconnects;
 * - disconnected disables the queue and calls the disconnect handler.
 *
 * The blocking methods (connect, probe, fetch_catalog, download_remote and
 * send_file) must be called from I/O tasks.
 */
class node_session : public upload_sink, public connection_observer {
public:
    using disconnect_handler = std::function<void()>;

    node_session(serial_dispatcher& dispatcher,
                 command_queue& server_queue,
                 remote_catalog& catalog,
                 std::shared_ptr<connection_factory> factory,
                 std::shared_ptr<adapters::io_task_pool> io_pool,
                 node_session_config config);
    ~node_session() override;

    node_session(const node_session&) = delete;
    auto operator=(const node_session&) -> node_session& = delete;

    void set_disconnect_handler(disconnect_handler handler) {
        on_disconnect_ = std::move(handler);
    }

    /**
     * @brief Probe candidate addresses in order and connect to the first that answers
     * @return The address connected to
     */
    [[nodiscard]] auto connect(const std::vector<std::string>& addresses) -> result<std::string>;

    /**
     * @brief Close the persistent connection; observers see disconnected
     */
    void disconnect();

    /**
     * @brief Check that a node answers GET /node/connectuser at host
     */
    [[nodiscard]] auto probe(const std::string& host) -> result<void>;

    /**
     * @brief Names of the files the node holds in its data folder
     */
    [[nodiscard]] auto fetch_catalog() -> result<std::vector<std::string>>;

    /**
     * @brief Download a processed file from the node's output folder
     *
     * A partial destination file is removed on failure.
     */
    [[nodiscard]] auto download_remote(const std::string& name,
                                       const std::filesystem::path& destination,
                                       http_transport::progress_fn on_bytes,
                                       std::stop_token stop = {}) -> result<void>;

    // upload_sink
    [[nodiscard]] auto send_file(const std::string& name,
                                 const std::filesystem::path& path,
                                 std::stop_token stop,
                                 progress_fn on_bytes) -> result<std::string> override;

    // connection_observer
    void on_connection_state(connection_state state) override;

    /**
     * @brief Queue a catalog refresh unless one is already queued
     */
    void refresh_catalog();

    // Command hooks, called on the serialized context
    void run_catalog_refresh(command_completion done);
    void run_remote_fetch(const std::string& name,
                          const std::filesystem::path& destination,
                          command_completion done);

    [[nodiscard]] auto state() const -> connection_state;
    [[nodiscard]] auto is_connected() const -> bool;
    [[nodiscard]] auto host() const -> std::string;
    [[nodiscard]] auto config() const -> const node_session_config& { return config_; }

    /**
     * @brief Request with the session's authorization headers
     */
    [[nodiscard]] auto make_request(std::string path, http_method method) const -> http_request;

private:
    [[nodiscard]] auto current() const -> std::shared_ptr<http_transport>;
    [[nodiscard]] auto transport_for(const std::string& host, bool persistent) const
        -> transport_config;
    void apply_state(connection_state state);

    serial_dispatcher& dispatcher_;
    command_queue& queue_;
    remote_catalog& catalog_;
    std::shared_ptr<connection_factory> factory_;
    std::shared_ptr<adapters::io_task_pool> io_pool_;
    node_session_config config_;
    disconnect_handler on_disconnect_;

    mutable std::mutex mutex_;
    std::shared_ptr<http_transport> transport_;
    std::string host_;

    // I/O tasks capturing this; the destructor waits for them
    adapters::pending_tasks tasks_;
    std::shared_ptr<char> lifetime_;
};

/**
 * @brief Interpret the node's reply to an add command
 * @return The taskID, or a protocol error carrying the node's code and message
 */
[[nodiscard]] auto parse_upload_reply(const http_response& response) -> result<std::string>;

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_SESSION_NODE_SESSION_H
