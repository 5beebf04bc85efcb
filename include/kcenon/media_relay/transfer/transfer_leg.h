/**
 * @file transfer_leg.h
 * @brief State and scheduling shared by the download and upload coordinators
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_LEG_H
#define KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_LEG_H

#include <kcenon/media_relay/adapters/thread_pool_adapter.h>
#include <kcenon/media_relay/core/transfer_state.h>
#include <kcenon/media_relay/executor/command_queue.h>
#include <kcenon/media_relay/executor/serial_dispatcher.h>
#include <kcenon/media_relay/executor/user_notifier.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace kcenon::media_relay {

enum class pause_reason {
    none,    ///< Running, or no transfer at all
    user,    ///< Paused on request
    system   ///< Force-paused by a blocking condition
};

[[nodiscard]] constexpr auto to_string(pause_reason reason) -> const char* {
    switch (reason) {
        case pause_reason::none: return "none";
        case pause_reason::user: return "user";
        case pause_reason::system: return "system";
        default: return "unknown";
    }
}

struct leg_config {
    std::chrono::milliseconds speed_interval{500};  ///< Speed sampling period
};

/**
 * @brief Common part of a transfer leg
 *
 * Owns the optional transfer_state, the in-flight stop source, the speed
 * sampler and the lifetime token that posted callbacks check before
 * touching the leg. Everything here runs on the serialized context.
 */
class transfer_leg {
public:
    using state_listener = std::function<void(const transfer_state&)>;

    virtual ~transfer_leg();

    transfer_leg(const transfer_leg&) = delete;
    auto operator=(const transfer_leg&) -> transfer_leg& = delete;

    [[nodiscard]] auto snapshot() const -> std::optional<transfer_state> { return state_; }
    [[nodiscard]] auto percent_complete() const -> double;
    [[nodiscard]] auto speed() const -> uint64_t;
    [[nodiscard]] auto paused_reason() const -> pause_reason;
    [[nodiscard]] auto is_active() const -> bool { return state_.has_value(); }
    [[nodiscard]] auto has_in_flight() const -> bool { return in_flight_.has_value(); }

    /**
     * @brief Observe progress; called on the serialized context after each change
     *
     * The last call before the state is dropped carries the final totals.
     */
    void set_state_listener(state_listener listener) { listener_ = std::move(listener); }

protected:
    transfer_leg(std::string leg_name,
                 serial_dispatcher& dispatcher,
                 command_queue& queue,
                 user_notifier& notifier,
                 adapters::io_task_pool& io_pool,
                 leg_config config);

    /**
     * @brief Start a new in-flight call and return its token
     */
    auto begin_call() -> std::stop_token;
    void end_call();
    void cancel_call();

    /**
     * @brief Cancel the in-flight call and wait for the leg's I/O tasks
     *
     * Derived destructors call this before their members go away.
     */
    void drain_io();

    /**
     * @brief Invalidate completions of calls started before now
     */
    void bump_generation() { ++generation_; }

    void start_sampler();
    void stop_sampler();

    /**
     * @brief Drop the state entirely
     */
    void reset_state();

    void report_skipped(std::size_t count, const std::string& title);

    void publish() const {
        if (state_ && listener_) {
            listener_(*state_);
        }
    }

    /**
     * @brief Run fn on the dispatcher if this leg still exists
     */
    template <typename Fn>
    void post_guarded(Fn fn) {
        std::weak_ptr<char> alive = lifetime_;
        dispatcher_.post([alive, fn = std::move(fn)]() mutable {
            if (alive.lock()) {
                fn();
            }
        });
    }

    std::string leg_name_;
    serial_dispatcher& dispatcher_;
    command_queue& queue_;
    user_notifier& notifier_;
    adapters::io_task_pool& io_pool_;
    leg_config config_;

    std::optional<transfer_state> state_;
    std::optional<std::stop_source> in_flight_;
    uint64_t generation_ = 0;

    /// Wrap every io_pool_ task that captures this
    adapters::pending_tasks io_tasks_;

private:
    void sample(uint64_t sampler_id);

    state_listener listener_;
    std::shared_ptr<char> lifetime_;
    uint64_t sampler_id_ = 0;
    bool sampling_ = false;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_TRANSFER_LEG_H
