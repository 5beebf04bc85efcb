/**
 * @file session_commands.cpp
 * @brief Session command implementations
 */

#include <kcenon/media_relay/session/session_commands.h>
#include <kcenon/media_relay/session/node_session.h>

namespace kcenon::media_relay {

void refresh_catalog_command::execute(command_completion completion) {
    session_.run_catalog_refresh(std::move(completion));
}

void fetch_remote_file_command::execute(command_completion completion) {
    session_.run_remote_fetch(file_name_, destination_, std::move(completion));
}

}  // namespace kcenon::media_relay
