/**
 * @file serial_dispatcher.h
 * @brief The single serialized context that owns relay state
 */

#ifndef KCENON_MEDIA_RELAY_EXECUTOR_SERIAL_DISPATCHER_H
#define KCENON_MEDIA_RELAY_EXECUTOR_SERIAL_DISPATCHER_H

#include <chrono>
#include <functional>
#include <memory>

namespace kcenon::media_relay {

/**
 * @brief Runs posted tasks one at a time, in post order
 *
 * Queues, coordinators and transfer states are only touched from tasks
 * run by the dispatcher. post() and post_after() are thread-safe.
 */
class serial_dispatcher {
public:
    using task = std::function<void()>;

    virtual ~serial_dispatcher() = default;

    virtual void post(task t) = 0;

    /**
     * @brief Run a task once the delay has elapsed
     *
     * Delayed tasks run after any task posted earlier with the same due time.
     */
    virtual void post_after(std::chrono::milliseconds delay, task t) = 0;

    /**
     * @brief True when called from a task this dispatcher is running
     */
    [[nodiscard]] virtual auto in_context() const -> bool = 0;
};

/**
 * @brief Dispatcher backed by one thread and a timer queue
 */
class event_loop : public serial_dispatcher {
public:
    event_loop();
    ~event_loop() override;

    event_loop(const event_loop&) = delete;
    auto operator=(const event_loop&) -> event_loop& = delete;

    void start();

    /**
     * @brief Stop the loop thread; pending tasks are discarded
     */
    void stop();

    [[nodiscard]] auto is_running() const -> bool;

    void post(task t) override;
    void post_after(std::chrono::milliseconds delay, task t) override;
    [[nodiscard]] auto in_context() const -> bool override;

    /**
     * @brief Block until every task due now has run
     */
    void drain();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_EXECUTOR_SERIAL_DISPATCHER_H
