/**
 * @file download_coordinator.h
 * @brief Device to local storage transfer leg
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_DOWNLOAD_COORDINATOR_H
#define KCENON_MEDIA_RELAY_TRANSFER_DOWNLOAD_COORDINATOR_H

#include <kcenon/media_relay/core/resume_journal.h>
#include <kcenon/media_relay/device/local_store.h>
#include <kcenon/media_relay/device/media_source.h>
#include <kcenon/media_relay/executor/command.h>
#include <kcenon/media_relay/transfer/leg_events.h>
#include <kcenon/media_relay/transfer/transfer_leg.h>

#include <set>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Downloads media from the device one file at a time
 *
 * Each file is written to its temporary name in the local store, chunk by
 * chunk, so the temporary file size is always the resumable offset. A
 * finished file is renamed to its final name, unless it was requested as a
 * temporary hand-off for the upload leg.
 *
 * Public operations run on the serialized context. The apply_request(),
 * run_step() and on_step_abandoned() hooks are driven by the download
 * commands on the device queue.
 */
class download_coordinator : public transfer_leg, public upload_events {
public:
    download_coordinator(serial_dispatcher& dispatcher,
                         command_queue& device_queue,
                         user_notifier& notifier,
                         adapters::io_task_pool& io_pool,
                         media_source& source,
                         local_store& store,
                         resume_journal* journal = nullptr,
                         leg_config config = {});
    ~download_coordinator() override;

    void set_download_events(download_events* events) { events_ = events; }

    /**
     * @brief Queue a request to download files
     * @param temporary Keep the files under their temporary name for upload
     */
    void request_download(std::vector<media_file> files, bool temporary);

    /**
     * @brief Pause; the in-flight read stops at the next chunk
     */
    void pause();

    /**
     * @brief Resume a user-paused leg
     * @return error_code::transfer_force_paused while force-paused
     */
    auto resume() -> result<void>;

    /**
     * @brief Abandon the whole set, removing the partial file
     */
    void stop();

    /**
     * @brief Clear a force pause once its cause is gone and continue
     */
    void release_force_pause();

    [[nodiscard]] auto is_temporary(const std::string& name) const -> bool {
        return temporary_.count(name) != 0;
    }

    // upload_events
    void on_upload_cancelled(const std::vector<std::string>& names) override;

    // Command hooks
    void apply_request(const std::vector<media_file>& files, bool temporary);
    void run_step(command_completion done);
    void on_step_abandoned(const std::optional<user_error>& err);

private:
    void push_step();
    void on_chunk_committed(uint64_t generation, std::size_t bytes);
    void finish_step(uint64_t generation, const std::string& name, result<void> outcome,
                     command_completion done);
    void drop_file(const std::string& name);
    void persist_cursor();

    media_source& source_;
    local_store& store_;
    resume_journal* journal_;
    download_events* events_ = nullptr;
    std::set<std::string> temporary_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_DOWNLOAD_COORDINATOR_H
