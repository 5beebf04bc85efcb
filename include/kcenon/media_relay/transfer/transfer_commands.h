/**
 * @file transfer_commands.h
 * @brief Commands that drive the transfer legs
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_COMMANDS_H
#define KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_COMMANDS_H

#include <kcenon/media_relay/core/media_file.h>
#include <kcenon/media_relay/core/transfer_state.h>
#include <kcenon/media_relay/executor/command.h>

#include <vector>

namespace kcenon::media_relay {

class download_coordinator;
class upload_coordinator;

/**
 * @brief Merges a download request into the download set
 */
class download_start_command : public command {
public:
    download_start_command(download_coordinator& coordinator,
                           std::vector<media_file> files,
                           bool temporary)
        : coordinator_(coordinator), files_(std::move(files)), temporary_(temporary) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "download_start"; }

private:
    download_coordinator& coordinator_;
    std::vector<media_file> files_;
    bool temporary_;
};

/**
 * @brief Downloads the cursor file, then queues the next step
 */
class download_step_command : public command {
public:
    explicit download_step_command(download_coordinator& coordinator)
        : coordinator_(coordinator) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "download_step"; }
    void on_abandoned(const std::optional<user_error>& err) override;

private:
    download_coordinator& coordinator_;
};

class upload_start_command : public command {
public:
    upload_start_command(upload_coordinator& coordinator,
                         std::vector<local_media> local_files,
                         std::vector<waiting_entry> waiting,
                         bool start_if_user_paused)
        : coordinator_(coordinator),
          local_files_(std::move(local_files)),
          waiting_(std::move(waiting)),
          start_if_user_paused_(start_if_user_paused) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "upload_start"; }

private:
    upload_coordinator& coordinator_;
    std::vector<local_media> local_files_;
    std::vector<waiting_entry> waiting_;
    bool start_if_user_paused_;
};

class upload_step_command : public command {
public:
    explicit upload_step_command(upload_coordinator& coordinator)
        : coordinator_(coordinator) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "upload_step"; }
    void on_abandoned(const std::optional<user_error>& err) override;

private:
    upload_coordinator& coordinator_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_COMMANDS_H
