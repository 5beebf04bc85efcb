/**
 * @file command_queue.cpp
 * @brief Implementation of command_queue
 */

#include <kcenon/media_relay/executor/command_queue.h>
#include <kcenon/media_relay/core/logging.h>

#include <deque>
#include <map>
#include <typeinfo>

namespace kcenon::media_relay {

struct command_queue::impl : std::enable_shared_from_this<command_queue::impl> {
    impl(serial_dispatcher& d, user_notifier& n, command_queue_config cfg)
        : dispatcher(d), notifier(n), config(std::move(cfg)), enabled(config.start_enabled) {}

    serial_dispatcher& dispatcher;
    user_notifier& notifier;
    command_queue_config config;

    std::deque<std::unique_ptr<command>> queue;
    std::unique_ptr<command> current;
    // Commands still running after clear(), kept alive until they complete
    std::map<uint64_t, std::unique_ptr<command>> detached;
    bool enabled;
    bool executing = false;
    bool waiting_retry = false;
    uint32_t retry_count = 0;
    uint64_t execution_id = 0;
    uint64_t retries_scheduled = 0;

    void schedule_next() {
        if (executing || waiting_retry || !enabled || queue.empty()) {
            return;
        }
        executing = true;
        std::weak_ptr<impl> weak = weak_from_this();
        dispatcher.post([weak] {
            if (auto self = weak.lock()) {
                self->process_next();
            }
        });
    }

    void process_next() {
        if (queue.empty() || !enabled) {
            executing = false;
            return;
        }

        current = std::move(queue.front());
        queue.pop_front();
        const auto id = ++execution_id;

        MR_LOG_DEBUG(log_category::executor,
            "[" + config.name + "] executing " + current->name());

        std::weak_ptr<impl> weak = weak_from_this();
        current->execute(
            [weak, id](bool success, bool retryable, std::optional<user_error> err) {
                auto self = weak.lock();
                if (!self) {
                    return;
                }
                self->dispatcher.post([weak, id, success, retryable, err = std::move(err)]() mutable {
                    if (auto s = weak.lock()) {
                        s->on_complete(id, success, retryable, std::move(err));
                    }
                });
            });
    }

    void on_complete(uint64_t id, bool success, bool retryable, std::optional<user_error> err) {
        detached.erase(id);
        if (id != execution_id || !current) {
            MR_LOG_TRACE(log_category::executor,
                "[" + config.name + "] ignoring stale completion");
            return;
        }

        auto cmd = std::move(current);
        executing = false;

        // Disabled mid-run: the command goes back to the head whatever its outcome
        if (!enabled) {
            queue.push_front(std::move(cmd));
            return;
        }

        if (success) {
            retry_count = 0;
            schedule_next();
            return;
        }

        ++retry_count;
        if (retry_count > config.retries || !retryable) {
            MR_LOG_WARN(log_category::executor,
                "[" + config.name + "] abandoning " + cmd->name() + " after " +
                std::to_string(retry_count) + " attempt(s)");
            retry_count = 0;
            cmd->on_abandoned(err);
            notifier.notify(err.value_or(user_error{generic_error_title, generic_error_message}));
            schedule_next();
            return;
        }

        MR_LOG_INFO(log_category::executor,
            "[" + config.name + "] retrying " + cmd->name() + " (" +
            std::to_string(retry_count) + "/" + std::to_string(config.retries) + ")");
        ++retries_scheduled;
        queue.push_front(std::move(cmd));
        waiting_retry = true;

        std::weak_ptr<impl> weak = weak_from_this();
        const auto generation = execution_id;
        dispatcher.post_after(config.retry_delay, [weak, generation] {
            auto self = weak.lock();
            if (!self || self->execution_id != generation) {
                return;
            }
            self->waiting_retry = false;
            self->schedule_next();
        });
    }
};

command_queue::command_queue(serial_dispatcher& dispatcher,
                             user_notifier& notifier,
                             command_queue_config config)
    : impl_(std::make_shared<impl>(dispatcher, notifier, std::move(config))) {}

command_queue::~command_queue() = default;

void command_queue::push(std::unique_ptr<command> cmd) {
    if (!cmd) {
        return;
    }
    impl_->queue.push_back(std::move(cmd));
    impl_->schedule_next();
}

auto command_queue::push_once(std::unique_ptr<command> cmd) -> bool {
    if (!cmd) {
        return false;
    }
    const auto& type = typeid(*cmd);
    for (const auto& queued : impl_->queue) {
        if (typeid(*queued) == type) {
            return false;
        }
    }
    push(std::move(cmd));
    return true;
}

void command_queue::prepend(std::unique_ptr<command> cmd) {
    if (!cmd) {
        return;
    }
    impl_->queue.push_front(std::move(cmd));
    impl_->schedule_next();
}

void command_queue::set_enabled(bool enabled) {
    if (impl_->enabled == enabled) {
        return;
    }
    impl_->enabled = enabled;
    MR_LOG_DEBUG(log_category::executor,
        "[" + impl_->config.name + "] " + (enabled ? "enabled" : "disabled"));
    if (enabled) {
        impl_->waiting_retry = false;
        impl_->schedule_next();
    }
}

void command_queue::clear() {
    impl_->queue.clear();
    impl_->retry_count = 0;
    impl_->waiting_retry = false;
    if (impl_->current) {
        impl_->detached.emplace(impl_->execution_id, std::move(impl_->current));
        ++impl_->execution_id;
        impl_->executing = false;
    }
}

auto command_queue::size() const -> std::size_t {
    return impl_->queue.size();
}

auto command_queue::is_enabled() const -> bool {
    return impl_->enabled;
}

auto command_queue::is_executing() const -> bool {
    return impl_->executing;
}

auto command_queue::retries_scheduled() const -> uint64_t {
    return impl_->retries_scheduled;
}

auto command_queue::config() const -> const command_queue_config& {
    return impl_->config;
}

}  // namespace kcenon::media_relay
