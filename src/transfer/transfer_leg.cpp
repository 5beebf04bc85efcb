/**
 * @file transfer_leg.cpp
 * @brief Implementation of transfer_leg
 */

#include <kcenon/media_relay/transfer/transfer_leg.h>
#include <kcenon/media_relay/core/logging.h>

namespace kcenon::media_relay {

transfer_leg::transfer_leg(std::string leg_name,
                           serial_dispatcher& dispatcher,
                           command_queue& queue,
                           user_notifier& notifier,
                           adapters::io_task_pool& io_pool,
                           leg_config config)
    : leg_name_(std::move(leg_name)),
      dispatcher_(dispatcher),
      queue_(queue),
      notifier_(notifier),
      io_pool_(io_pool),
      config_(config),
      lifetime_(std::make_shared<char>(0)) {}

transfer_leg::~transfer_leg() {
    drain_io();
}

auto transfer_leg::percent_complete() const -> double {
    return state_ ? state_->percent_complete() : 0.0;
}

auto transfer_leg::speed() const -> uint64_t {
    return state_ && sampling_ ? state_->speed() : 0;
}

auto transfer_leg::paused_reason() const -> pause_reason {
    if (!state_ || !state_->is_paused()) {
        return pause_reason::none;
    }
    return state_->is_force_paused() ? pause_reason::system : pause_reason::user;
}

auto transfer_leg::begin_call() -> std::stop_token {
    in_flight_.emplace();
    return in_flight_->get_token();
}

void transfer_leg::end_call() {
    in_flight_.reset();
}

void transfer_leg::cancel_call() {
    if (in_flight_) {
        in_flight_->request_stop();
    }
}

void transfer_leg::drain_io() {
    cancel_call();
    io_tasks_.wait();
}

void transfer_leg::start_sampler() {
    if (sampling_) {
        return;
    }
    sampling_ = true;
    const auto id = ++sampler_id_;
    std::weak_ptr<char> alive = lifetime_;
    dispatcher_.post_after(config_.speed_interval, [this, alive, id] {
        if (alive.lock()) {
            sample(id);
        }
    });
}

void transfer_leg::stop_sampler() {
    sampling_ = false;
    ++sampler_id_;
}

void transfer_leg::sample(uint64_t sampler_id) {
    if (sampler_id != sampler_id_ || !state_) {
        return;
    }
    state_->sample_speed(config_.speed_interval);

    std::weak_ptr<char> alive = lifetime_;
    dispatcher_.post_after(config_.speed_interval, [this, alive, sampler_id] {
        if (alive.lock()) {
            sample(sampler_id);
        }
    });
}

void transfer_leg::reset_state() {
    if (state_) {
        MR_LOG_DEBUG(leg_name_ == "download" ? log_category::download : log_category::upload,
            "Transfer set finished: " + std::to_string(state_->transferred_files()) +
            " file(s), " + std::to_string(state_->transferred_bytes()) + " bytes");
    }
    publish();
    stop_sampler();
    state_.reset();
}

void transfer_leg::report_skipped(std::size_t count, const std::string& title) {
    if (count == 0) {
        return;
    }
    notifier_.notify(user_error{
        title,
        "Files that are invalid or already present at the destination were skipped (" +
            std::to_string(count) + ") files."});
}

}  // namespace kcenon::media_relay
