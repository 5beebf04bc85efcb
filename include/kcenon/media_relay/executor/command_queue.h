/**
 * @file command_queue.h
 * @brief Serial command executor with bounded retry
 */

#ifndef KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_QUEUE_H
#define KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_QUEUE_H

#include <kcenon/media_relay/executor/command.h>
#include <kcenon/media_relay/executor/serial_dispatcher.h>
#include <kcenon/media_relay/executor/user_notifier.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace kcenon::media_relay {

struct command_queue_config {
    uint32_t retries = 3;                                ///< Retries after the first attempt
    std::chrono::milliseconds retry_delay{1000};         ///< Delay before a retry
    std::string name = "queue";                          ///< Name used in logs
    bool start_enabled = false;                          ///< Initial enabled flag
};

/// Title and message surfaced when a failing command supplies no error
inline constexpr const char* generic_error_title = "Unexpected Error Occurred";
inline constexpr const char* generic_error_message =
    "An error occurred during execution due to an undefined error message!";

/**
 * @brief Runs commands one at a time, in order, while enabled
 *
 * All member functions must be called from the dispatcher's context.
 * Command completions may arrive from any thread; they are marshalled onto
 * the dispatcher. A completion that arrives after clear() or after the
 * queue is destroyed is ignored.
 *
 * Failure handling:
 * - retryable failure: the command is put back at the head and run again
 *   after retry_delay, up to `retries` times
 * - non-retryable failure, or retries exhausted: on_abandoned() is called,
 *   the error is handed to the user_notifier, and the next command runs
 * - completion while disabled: a failed command is put back at the head
 *   and nothing further starts until re-enabled
 */
class command_queue {
public:
    command_queue(serial_dispatcher& dispatcher,
                  user_notifier& notifier,
                  command_queue_config config = {});
    ~command_queue();

    command_queue(const command_queue&) = delete;
    auto operator=(const command_queue&) -> command_queue& = delete;

    void push(std::unique_ptr<command> cmd);

    /**
     * @brief Push unless a queued command has the same concrete type
     * @return true if the command was added
     */
    auto push_once(std::unique_ptr<command> cmd) -> bool;

    /**
     * @brief Insert at the head; runs next
     */
    void prepend(std::unique_ptr<command> cmd);

    void set_enabled(bool enabled);

    /**
     * @brief Drop every queued command
     *
     * An executing command is not interrupted but its completion is ignored.
     */
    void clear();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto is_enabled() const -> bool;
    [[nodiscard]] auto is_executing() const -> bool;

    /**
     * @brief Number of retries scheduled since construction
     */
    [[nodiscard]] auto retries_scheduled() const -> uint64_t;

    [[nodiscard]] auto config() const -> const command_queue_config&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_EXECUTOR_COMMAND_QUEUE_H
