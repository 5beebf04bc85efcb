/**
 * @file upload_coordinator.h
 * @brief Local storage to processing node transfer leg
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_COORDINATOR_H
#define KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_COORDINATOR_H

#include <kcenon/media_relay/executor/command.h>
#include <kcenon/media_relay/transfer/leg_events.h>
#include <kcenon/media_relay/transfer/remote_catalog.h>
#include <kcenon/media_relay/transfer/transfer_leg.h>
#include <kcenon/media_relay/transfer/upload_sink.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Uploads local files to the processing node one at a time
 *
 * Files that are still on the device sit in the waiting set until the
 * download leg reports them local. A leg with nothing but waiting entries
 * force-pauses itself and is restarted by on_download_completed().
 *
 * A partial POST cannot be resumed, so any interruption rolls the cursor
 * back to zero.
 */
class upload_coordinator : public transfer_leg, public download_events {
public:
    upload_coordinator(serial_dispatcher& dispatcher,
                       command_queue& server_queue,
                       user_notifier& notifier,
                       adapters::io_task_pool& io_pool,
                       upload_sink& sink,
                       remote_catalog& catalog,
                       leg_config config = {});
    ~upload_coordinator() override;

    void set_upload_events(upload_events* events) { events_ = events; }

    /**
     * @brief Queue a request to upload files
     * @param local_files Files already on local storage
     * @param waiting Files that the download leg is still fetching
     * @param start_if_user_paused Also restart a leg the user paused
     */
    void request_upload(std::vector<local_media> local_files,
                        std::vector<waiting_entry> waiting,
                        bool start_if_user_paused = true);

    void pause();
    auto resume() -> result<void>;
    void stop();
    void release_force_pause();

    // download_events
    void on_download_completed(const std::string& name,
                               const std::filesystem::path& local_path) override;
    void on_download_cancelled(const std::vector<std::string>& names) override;
    [[nodiscard]] auto local_copy_for(const std::string& name)
        -> std::optional<std::filesystem::path> override;

    // Command hooks
    void apply_request(const std::vector<local_media>& local_files,
                       const std::vector<waiting_entry>& waiting,
                       bool start_if_user_paused);
    void run_step(command_completion done);
    void on_step_abandoned(const std::optional<user_error>& err);

private:
    void push_step();
    void restart();
    void on_bytes_sent(uint64_t generation, std::size_t bytes);
    void finish_step(uint64_t generation, const std::string& name,
                     result<std::string> outcome, command_completion done);
    void drop_entry(const std::string& name, const std::string& reason);
    void discard_hand_off(const std::filesystem::path& path);

    upload_sink& sink_;
    remote_catalog& catalog_;
    upload_events* events_ = nullptr;

    std::map<std::string, local_media> sources_;
    std::map<std::string, std::filesystem::path> arrived_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_COORDINATOR_H
