/**
 * @file upload_coordinator.cpp
 * @brief Implementation of upload_coordinator
 */

#include <kcenon/media_relay/transfer/upload_coordinator.h>
#include <kcenon/media_relay/transfer/transfer_commands.h>
#include <kcenon/media_relay/core/logging.h>

#include <system_error>

namespace kcenon::media_relay {

namespace {

constexpr const char* leg_name = "upload";
constexpr const char* error_title = "Error Uploading Media";

auto is_hand_off(const std::filesystem::path& path) -> bool {
    return has_temp_prefix(path.filename().string());
}

}  // namespace

upload_coordinator::upload_coordinator(serial_dispatcher& dispatcher,
                                       command_queue& server_queue,
                                       user_notifier& notifier,
                                       adapters::io_task_pool& io_pool,
                                       upload_sink& sink,
                                       remote_catalog& catalog,
                                       leg_config config)
    : transfer_leg(leg_name, dispatcher, server_queue, notifier, io_pool, config),
      sink_(sink),
      catalog_(catalog) {}

upload_coordinator::~upload_coordinator() {
    drain_io();
}

// ============================================================================
// User operations
// ============================================================================

void upload_coordinator::request_upload(std::vector<local_media> local_files,
                                        std::vector<waiting_entry> waiting,
                                        bool start_if_user_paused) {
    queue_.push(std::make_unique<upload_start_command>(
        *this, std::move(local_files), std::move(waiting), start_if_user_paused));
}

void upload_coordinator::pause() {
    if (!state_ || state_->is_paused()) {
        return;
    }
    MR_LOG_INFO(log_category::upload, "Upload paused");
    state_->set_paused(true);
    stop_sampler();
    cancel_call();
    state_->rollback_cursor(0);
}

auto upload_coordinator::resume() -> result<void> {
    if (!state_) {
        return {};
    }
    if (state_->is_force_paused()) {
        return unexpected(error(error_code::transfer_force_paused,
            "upload is waiting for its files or for the node"));
    }
    if (!state_->is_paused()) {
        return {};
    }
    MR_LOG_INFO(log_category::upload, "Upload resumed");
    state_->set_paused(false);
    start_sampler();
    push_step();
    return {};
}

void upload_coordinator::release_force_pause() {
    if (!state_ || !state_->is_force_paused()) {
        return;
    }
    restart();
}

void upload_coordinator::stop() {
    if (!state_) {
        return;
    }
    MR_LOG_INFO(log_category::upload, "Upload stopped");

    state_->set_paused(true);
    cancel_call();
    end_call();
    bump_generation();

    std::vector<std::string> names;
    for (const auto& file : state_->pending()) {
        names.push_back(file.name);
    }
    for (const auto& entry : state_->waiting()) {
        names.push_back(entry.name);
    }

    for (const auto& [name, source] : sources_) {
        if (is_hand_off(source.path)) {
            discard_hand_off(source.path);
        }
    }
    for (const auto& [name, path] : arrived_) {
        discard_hand_off(path);
    }
    sources_.clear();
    arrived_.clear();
    reset_state();

    if (events_ && !names.empty()) {
        events_->on_upload_cancelled(names);
    }
}

// ============================================================================
// Cross-leg
// ============================================================================

void upload_coordinator::on_download_completed(const std::string& name,
                                               const std::filesystem::path& local_path) {
    if (!state_ || !state_->has_waiting(name)) {
        if (is_hand_off(local_path)) {
            arrived_[name] = local_path;
        }
        return;
    }

    uint64_t size = 0;
    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(local_path, ec);
    if (!ec) {
        size = on_disk;
    } else {
        for (const auto& entry : state_->waiting()) {
            if (entry.name == name) {
                size = entry.size;
            }
        }
    }

    media_file file;
    file.name = name;
    file.size = size;
    file.created_at = std::chrono::system_clock::now();

    transfer_state::mutation m;
    m.move_waiting_to_pending.push_back(file);
    state_->apply(m);
    sources_[name] = local_media{local_path, name};
    publish();

    MR_LOG_DEBUG(log_category::upload, name + " is local and ready for upload");

    if (state_->is_force_paused()) {
        restart();
    }
}

void upload_coordinator::on_download_cancelled(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        arrived_.erase(name);
    }
    if (!state_) {
        return;
    }

    transfer_state::mutation m;
    for (const auto& name : names) {
        if (state_->has_waiting(name)) {
            m.remove.push_back(name);
        }
    }
    if (m.remove.empty()) {
        return;
    }

    auto removed = state_->apply(m);
    publish();
    MR_LOG_INFO(log_category::upload,
        "Dropped " + std::to_string(removed.size()) + " upload(s) whose download was cancelled");

    if (state_->is_empty() && !has_in_flight()) {
        reset_state();
    }
}

auto upload_coordinator::local_copy_for(const std::string& name)
    -> std::optional<std::filesystem::path> {
    std::error_code ec;
    auto it = sources_.find(name);
    if (it != sources_.end() && is_hand_off(it->second.path) &&
        std::filesystem::exists(it->second.path, ec)) {
        return it->second.path;
    }
    auto arrived = arrived_.find(name);
    if (arrived != arrived_.end() && std::filesystem::exists(arrived->second, ec)) {
        return arrived->second;
    }
    return std::nullopt;
}

// ============================================================================
// Command hooks
// ============================================================================

void upload_coordinator::apply_request(const std::vector<local_media>& local_files,
                                       const std::vector<waiting_entry>& waiting,
                                       bool start_if_user_paused) {
    std::size_t skipped = 0;
    std::vector<std::string> cancelled;
    transfer_state::mutation m;

    // Pending files the node received meanwhile
    if (state_) {
        for (const auto& file : state_->pending()) {
            if (catalog_.contains(file.name)) {
                m.remove.push_back(file.name);
            }
        }
    }

    auto already_listed = [this, &m](const std::string& name) {
        if (state_ && (state_->has_pending(name) || state_->has_waiting(name))) {
            return true;
        }
        for (const auto& file : m.add_pending) {
            if (file.name == name) return true;
        }
        for (const auto& entry : m.add_waiting) {
            if (entry.name == name) return true;
        }
        return false;
    };

    for (const auto& local : local_files) {
        const auto& name = local.logical_name;
        if (catalog_.contains(name)) {
            ++skipped;
            if (is_hand_off(local.path)) {
                discard_hand_off(local.path);
            }
            continue;
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(local.path, ec);
        if (ec || size == 0) {
            ++skipped;
            continue;
        }
        if (already_listed(name)) {
            continue;
        }

        media_file file;
        file.name = name;
        file.size = size;
        file.created_at = std::chrono::system_clock::now();
        m.add_pending.push_back(file);
        sources_[name] = local;
    }

    for (const auto& entry : waiting) {
        if (catalog_.contains(entry.name)) {
            ++skipped;
            cancelled.push_back(entry.name);
            continue;
        }
        if (already_listed(entry.name)) {
            continue;
        }

        auto arrived = arrived_.find(entry.name);
        if (arrived != arrived_.end()) {
            std::error_code ec;
            const auto size = std::filesystem::file_size(arrived->second, ec);
            if (!ec && size > 0) {
                media_file file;
                file.name = entry.name;
                file.size = size;
                file.created_at = std::chrono::system_clock::now();
                m.add_pending.push_back(file);
                sources_[entry.name] = local_media{arrived->second, entry.name};
                arrived_.erase(arrived);
                continue;
            }
            arrived_.erase(arrived);
        }
        m.add_waiting.push_back(entry);
    }

    const bool adding = !m.add_pending.empty() || !m.add_waiting.empty();
    const bool created = !state_ && adding;
    if (created) {
        state_.emplace();
    }

    if (state_) {
        auto removed = state_->apply(m);
        publish();
        for (const auto& name : removed) {
            auto it = sources_.find(name);
            if (it != sources_.end()) {
                if (is_hand_off(it->second.path)) {
                    discard_hand_off(it->second.path);
                }
                sources_.erase(it);
            }
        }

        if (state_->is_empty() && !has_in_flight()) {
            reset_state();
        } else if (created) {
            MR_LOG_INFO(log_category::upload,
                "Upload set created with " + std::to_string(state_->pending().size()) +
                " local and " + std::to_string(state_->waiting().size()) + " waiting file(s)");
            start_sampler();
            push_step();
        } else if (state_->is_paused() && adding &&
                   (state_->is_force_paused() || start_if_user_paused)) {
            restart();
        }
    }

    if (events_ && !cancelled.empty()) {
        events_->on_upload_cancelled(cancelled);
    }

    report_skipped(skipped, "Upload Skipped");
}

void upload_coordinator::run_step(command_completion done) {
    if (!state_ || state_->is_paused() || has_in_flight()) {
        done(true, false, std::nullopt);
        return;
    }
    if (state_->is_empty()) {
        reset_state();
        done(true, false, std::nullopt);
        return;
    }
    if (state_->pending().empty()) {
        MR_LOG_INFO(log_category::upload,
            "Waiting for " + std::to_string(state_->waiting().size()) +
            " file(s) to arrive from the device");
        state_->set_paused(true);
        state_->set_force_paused(true);
        stop_sampler();
        done(true, false, std::nullopt);
        return;
    }

    const media_file file = *state_->select_cursor();
    state_->rollback_cursor(0);

    auto source = sources_.find(file.name);
    std::error_code ec;
    if (source == sources_.end() || !std::filesystem::exists(source->second.path, ec)) {
        drop_entry(file.name, "the local copy of " + file.name + " is missing");
        done(true, false, std::nullopt);
        return;
    }
    const auto path = source->second.path;

    transfer_log_context ctx;
    ctx.leg = leg_name;
    ctx.filename = file.name;
    ctx.file_size = file.size;
    MR_LOG_INFO_CTX(log_category::upload, "Uploading to node", ctx);

    auto stop = begin_call();
    bump_generation();
    const auto generation = generation_;

    io_pool_.submit(io_tasks_.track(
        [this, name = file.name, path, stop, generation, done = std::move(done)]() mutable {
            auto outcome = sink_.send_file(name, path, stop, [this, generation](std::size_t n) {
                post_guarded([this, generation, n] { on_bytes_sent(generation, n); });
            });
            post_guarded([this, generation, name, outcome = std::move(outcome),
                          done = std::move(done)]() mutable {
                finish_step(generation, name, std::move(outcome), std::move(done));
            });
        }),
        leg_name);
}

void upload_coordinator::on_step_abandoned(const std::optional<user_error>& err) {
    if (!state_ || state_->is_paused()) {
        return;
    }
    MR_LOG_WARN(log_category::upload,
        "Upload force-paused" + (err ? ": " + err->message : std::string()));
    state_->set_paused(true);
    state_->set_force_paused(true);
    state_->rollback_cursor(0);
    stop_sampler();
}

// ============================================================================
// Internals
// ============================================================================

void upload_coordinator::push_step() {
    queue_.push_once(std::make_unique<upload_step_command>(*this));
}

void upload_coordinator::restart() {
    state_->set_force_paused(false);
    state_->set_paused(false);
    start_sampler();
    push_step();
}

void upload_coordinator::on_bytes_sent(uint64_t generation, std::size_t bytes) {
    // Progress queued before a pause must not move the rolled-back cursor
    if (generation != generation_ || !state_ || !state_->cursor() || state_->is_paused()) {
        return;
    }
    state_->advance_cursor(bytes);
    publish();
}

void upload_coordinator::finish_step(uint64_t generation,
                                     const std::string& name,
                                     result<std::string> outcome,
                                     command_completion done) {
    if (generation != generation_) {
        done(true, false, std::nullopt);
        return;
    }
    end_call();

    if (!state_ || !state_->cursor() || state_->cursor()->name != name) {
        if (state_) {
            if (state_->is_empty()) {
                reset_state();
            } else if (!state_->is_paused()) {
                push_step();
            }
        }
        done(true, false, std::nullopt);
        return;
    }

    if (outcome) {
        auto source = sources_.find(name);
        if (source != sources_.end()) {
            if (is_hand_off(source->second.path)) {
                discard_hand_off(source->second.path);
            }
            sources_.erase(source);
        }
        catalog_.insert(name);

        const auto* file = state_->find_pending(name);
        transfer_log_context ctx;
        ctx.leg = leg_name;
        ctx.filename = name;
        ctx.file_size = file ? file->size : 0;
        MR_LOG_INFO_CTX(log_category::upload, "Upload complete, task " + outcome.value(), ctx);

        state_->complete_current();
        publish();
        if (state_->is_empty()) {
            reset_state();
        } else if (!state_->is_paused()) {
            push_step();
        }
        done(true, false, std::nullopt);
        return;
    }

    const auto& err = outcome.error();
    switch (err.category()) {
        case error_category::cancellation:
            state_->rollback_cursor(0);
            if (!state_->is_paused()) {
                push_step();
            }
            done(true, false, std::nullopt);
            return;

        case error_category::connectivity:
            MR_LOG_WARN(log_category::upload,
                "Upload of " + name + " interrupted: " + err.message);
            state_->rollback_cursor(0);
            done(false, true, user_error{error_title, err.message});
            return;

        case error_category::filesystem:
            drop_entry(name, err.message);
            done(true, false, std::nullopt);
            return;

        default:
            MR_LOG_ERROR(log_category::upload, "Node refused " + name + ": " + err.message);
            state_->rollback_cursor(0);
            state_->set_paused(true);
            stop_sampler();
            done(false, false, user_error{error_title, err.message});
            return;
    }
}

void upload_coordinator::drop_entry(const std::string& name, const std::string& reason) {
    MR_LOG_ERROR(log_category::upload, "Dropping " + name + ": " + reason);

    transfer_state::mutation m;
    m.remove.push_back(name);
    state_->apply(m);

    auto source = sources_.find(name);
    if (source != sources_.end()) {
        if (is_hand_off(source->second.path)) {
            discard_hand_off(source->second.path);
        }
        sources_.erase(source);
    }

    notifier_.notify(user_error{error_title, reason});

    if (events_) {
        events_->on_upload_cancelled({name});
    }

    if (state_->is_empty()) {
        reset_state();
    } else if (!state_->is_paused()) {
        push_step();
    }
}

void upload_coordinator::discard_hand_off(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        MR_LOG_WARN(log_category::upload,
            "Cannot remove " + path.filename().string() + ": " + ec.message());
    }
}

}  // namespace kcenon::media_relay
