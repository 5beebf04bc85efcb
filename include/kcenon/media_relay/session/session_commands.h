/**
 * @file session_commands.h
 * @brief Server queue commands that talk to the node directly
 */

#ifndef KCENON_MEDIA_RELAY_SESSION_SESSION_COMMANDS_H
#define KCENON_MEDIA_RELAY_SESSION_SESSION_COMMANDS_H

#include <kcenon/media_relay/executor/command.h>

#include <filesystem>
#include <string>

namespace kcenon::media_relay {

class node_session;

/**
 * @brief Replaces the remote catalog with the node's file list
 */
class refresh_catalog_command : public command {
public:
    explicit refresh_catalog_command(node_session& session) : session_(session) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "refresh_catalog"; }

private:
    node_session& session_;
};

/**
 * @brief Downloads one processed file from the node's output folder
 */
class fetch_remote_file_command : public command {
public:
    fetch_remote_file_command(node_session& session,
                              std::string file_name,
                              std::filesystem::path destination)
        : session_(session),
          file_name_(std::move(file_name)),
          destination_(std::move(destination)) {}

    void execute(command_completion completion) override;
    [[nodiscard]] auto name() const -> std::string override { return "fetch_remote_file"; }

private:
    node_session& session_;
    std::string file_name_;
    std::filesystem::path destination_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_SESSION_SESSION_COMMANDS_H
