/**
 * @file relay_client.h
 * @brief Device to node media relay
 */

#ifndef KCENON_MEDIA_RELAY_CLIENT_RELAY_CLIENT_H
#define KCENON_MEDIA_RELAY_CLIENT_RELAY_CLIENT_H

#include <kcenon/media_relay/core/transfer_state.h>
#include <kcenon/media_relay/core/types.h>
#include <kcenon/media_relay/device/media_source.h>
#include <kcenon/media_relay/executor/command_queue.h>
#include <kcenon/media_relay/executor/user_notifier.h>
#include <kcenon/media_relay/session/node_session.h>
#include <kcenon/media_relay/transfer/transfer_leg.h>
#include <kcenon/media_relay/transport/stream_connection.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Relay configuration
 */
struct relay_config {
    /// Mounted removable-storage directory read by the default media source
    std::filesystem::path media_root;

    /// Where downloaded media is saved
    std::filesystem::path storage_root;

    /// Resume journal directory; defaults to <storage_root>/.relay_state
    std::filesystem::path state_directory;

    node_session_config node;

    command_queue_config device_queue{3, std::chrono::milliseconds(1000), "device", false};
    command_queue_config server_queue{3, std::chrono::milliseconds(1000), "server", false};

    leg_config legs;

    /// I/O pool size; 0 picks the hardware concurrency
    std::size_t io_workers = 0;

    uint32_t checkpoint_interval = 16;
};

/**
 * @brief Progress of one transfer leg
 */
struct leg_status {
    std::optional<transfer_state> state;
    double percent_complete = 0.0;
    uint64_t speed = 0;
    pause_reason paused = pause_reason::none;

    [[nodiscard]] auto is_active() const -> bool { return state.has_value(); }
};

/**
 * @brief Moves media from a device to local storage and on to a node
 *
 * Owns the serialized event loop, the device and server queues, both
 * transfer legs and the node session. Public methods may be called from
 * any thread except the event loop; they hand the work to the loop.
 *
 * @code
 * auto client = relay_client::builder()
 *     .with_media_root("/media/card")
 *     .with_storage_root("/var/lib/relay/media")
 *     .with_node(8000, token, session_id)
 *     .build();
 *
 * if (client.has_value()) {
 *     auto& relay = client.value();
 *     relay.start();
 *     relay.connect({"192.168.1.20"});
 *     relay.upload_from_device({"clip01.mp4", "clip02.mp4"});
 * }
 * @endcode
 */
class relay_client {
public:
    class builder {
    public:
        builder();

        auto with_media_root(std::filesystem::path root) -> builder&;
        auto with_storage_root(std::filesystem::path root) -> builder&;
        auto with_state_directory(std::filesystem::path dir) -> builder&;

        /**
         * @brief Node port and credentials
         */
        auto with_node(uint16_t port, std::string token, std::string session_id) -> builder&;

        auto with_reconnect(bool enable, reconnect_policy policy = {}) -> builder&;

        /**
         * @brief Retry bound shared by both queues
         */
        auto with_retries(uint32_t retries, std::chrono::milliseconds delay) -> builder&;

        auto with_io_workers(std::size_t workers) -> builder&;
        auto with_checkpoint_interval(uint32_t chunks) -> builder&;

        /**
         * @brief Replace the directory media source, e.g. with a vendor SDK adapter
         */
        auto with_media_source(std::shared_ptr<media_source> source) -> builder&;

        /**
         * @brief Replace the TCP connection, e.g. for a different stream
         */
        auto with_connection_factory(std::shared_ptr<connection_factory> factory) -> builder&;

        auto with_notifier(std::shared_ptr<user_notifier> notifier) -> builder&;

        /**
         * @brief Validate the configuration and build the client
         */
        [[nodiscard]] auto build() -> result<relay_client>;

    private:
        relay_config config_;
        std::shared_ptr<media_source> source_;
        std::shared_ptr<connection_factory> factory_;
        std::shared_ptr<user_notifier> notifier_;
    };

    relay_client(const relay_client&) = delete;
    auto operator=(const relay_client&) -> relay_client& = delete;
    relay_client(relay_client&&) noexcept;
    auto operator=(relay_client&&) noexcept -> relay_client&;
    ~relay_client();

    /**
     * @brief Start the event loop and prepare local storage
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Connect to the first node address that answers (blocking)
     */
    [[nodiscard]] auto connect(const std::vector<std::string>& addresses) -> result<std::string>;

    void disconnect();

    [[nodiscard]] auto connection() const -> connection_state;

    /**
     * @brief Enable or disable the device queue as the device comes and goes
     *
     * A download force-paused by device errors continues once the device is
     * back.
     */
    void set_device_available(bool available);

    /**
     * @brief Files on the device (blocking)
     */
    [[nodiscard]] auto list_device() -> result<std::vector<media_file>>;

    /**
     * @brief Download device files by name into local storage
     * @return error_code::file_not_found if a name is not on the device
     */
    [[nodiscard]] auto download(const std::vector<std::string>& names) -> result<void>;
    void download(std::vector<media_file> files);

    /**
     * @brief Upload files already saved in local storage
     */
    void upload_local(const std::vector<std::string>& names);

    /**
     * @brief Upload device files, downloading the ones not yet local first
     *
     * Saved files go straight to the upload leg. The rest become waiting
     * entries fed by a temporary download.
     */
    [[nodiscard]] auto upload_from_device(const std::vector<std::string>& names) -> result<void>;

    /**
     * @brief Queue a download of a processed file from the node's output folder
     */
    void fetch_result(const std::string& name, const std::filesystem::path& destination);

    void pause_download();
    [[nodiscard]] auto resume_download() -> result<void>;
    void stop_download();

    void pause_upload();
    [[nodiscard]] auto resume_upload() -> result<void>;
    void stop_upload();

    /**
     * @brief Observe a leg's progress on the event loop
     *
     * The last call for a set carries its final totals.
     */
    void on_download_progress(transfer_leg::state_listener listener);
    void on_upload_progress(transfer_leg::state_listener listener);

    [[nodiscard]] auto download_status() const -> leg_status;
    [[nodiscard]] auto upload_status() const -> leg_status;
    [[nodiscard]] auto remote_files() const -> std::vector<std::string>;

    [[nodiscard]] auto config() const -> const relay_config&;

private:
    struct impl;
    explicit relay_client(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CLIENT_RELAY_CLIENT_H
