/**
 * @file command.h
 * @brief Unit of work executed by a command_queue
 */

#ifndef KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_H
#define KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_H

#include <kcenon/media_relay/core/types.h>

#include <functional>
#include <optional>
#include <string>

namespace kcenon::media_relay {

/**
 * @brief Completion handler of a command
 *
 * May be invoked from any thread, exactly once per execute() call.
 * - success: the command finished its work
 * - retryable: on failure, whether running it again may help
 * - err: user-facing description, or nullopt for the generic message
 */
using command_completion =
    std::function<void(bool success, bool retryable, std::optional<user_error> err)>;

/**
 * @brief A polymorphic, self-contained unit of work
 *
 * Commands carry only what they were constructed with. They are owned by
 * the queue while pending and destroyed after terminal completion.
 */
class command {
public:
    virtual ~command() = default;

    virtual void execute(command_completion completion) = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Called once when the queue drops the command after a terminal failure
     */
    virtual void on_abandoned([[maybe_unused]] const std::optional<user_error>& err) {}
};

/**
 * @brief Convenience for completing a command from a result
 */
[[nodiscard]] inline auto to_user_error(const error& err, std::string title) -> user_error {
    return user_error{std::move(title), err.message};
}

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_H
