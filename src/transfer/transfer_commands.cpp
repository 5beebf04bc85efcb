/**
 * @file transfer_commands.cpp
 * @brief Transfer command implementations
 */

#include <kcenon/media_relay/transfer/transfer_commands.h>
#include <kcenon/media_relay/transfer/download_coordinator.h>
#include <kcenon/media_relay/transfer/upload_coordinator.h>

namespace kcenon::media_relay {

void download_start_command::execute(command_completion completion) {
    coordinator_.apply_request(files_, temporary_);
    completion(true, false, std::nullopt);
}

void download_step_command::execute(command_completion completion) {
    coordinator_.run_step(std::move(completion));
}

void download_step_command::on_abandoned(const std::optional<user_error>& err) {
    coordinator_.on_step_abandoned(err);
}

void upload_start_command::execute(command_completion completion) {
    coordinator_.apply_request(local_files_, waiting_, start_if_user_paused_);
    completion(true, false, std::nullopt);
}

void upload_step_command::execute(command_completion completion) {
    coordinator_.run_step(std::move(completion));
}

void upload_step_command::on_abandoned(const std::optional<user_error>& err) {
    coordinator_.on_step_abandoned(err);
}

}  // namespace kcenon::media_relay
