/**
 * @file download_coordinator.cpp
 * @brief Implementation of download_coordinator
 */

#include <kcenon/media_relay/transfer/download_coordinator.h>
#include <kcenon/media_relay/transfer/transfer_commands.h>
#include <kcenon/media_relay/core/logging.h>

#include <fstream>

namespace kcenon::media_relay {

namespace {

constexpr const char* leg_name = "download";
constexpr const char* error_title = "Error Downloading Media";

}  // namespace

download_coordinator::download_coordinator(serial_dispatcher& dispatcher,
                                           command_queue& device_queue,
                                           user_notifier& notifier,
                                           adapters::io_task_pool& io_pool,
                                           media_source& source,
                                           local_store& store,
                                           resume_journal* journal,
                                           leg_config config)
    : transfer_leg(leg_name, dispatcher, device_queue, notifier, io_pool, config),
      source_(source),
      store_(store),
      journal_(journal) {}

download_coordinator::~download_coordinator() {
    drain_io();
}

// ============================================================================
// User operations
// ============================================================================

void download_coordinator::request_download(std::vector<media_file> files, bool temporary) {
    queue_.push(std::make_unique<download_start_command>(*this, std::move(files), temporary));
}

void download_coordinator::pause() {
    if (!state_ || state_->is_paused()) {
        return;
    }
    MR_LOG_INFO(log_category::download, "Download paused");
    state_->set_paused(true);
    stop_sampler();
    if (has_in_flight()) {
        cancel_call();
    } else {
        persist_cursor();
    }
}

auto download_coordinator::resume() -> result<void> {
    if (!state_) {
        return {};
    }
    if (state_->is_force_paused()) {
        return unexpected(error(error_code::transfer_force_paused,
            "download is paused until the device is available again"));
    }
    if (!state_->is_paused()) {
        return {};
    }
    MR_LOG_INFO(log_category::download, "Download resumed");
    state_->set_paused(false);
    start_sampler();
    push_step();
    return {};
}

void download_coordinator::release_force_pause() {
    if (!state_ || !state_->is_force_paused()) {
        return;
    }
    state_->set_force_paused(false);
    state_->set_paused(false);
    start_sampler();
    push_step();
}

void download_coordinator::stop() {
    if (!state_) {
        return;
    }
    MR_LOG_INFO(log_category::download, "Download stopped");

    state_->set_paused(true);
    cancel_call();
    end_call();
    bump_generation();

    if (const auto& cursor = state_->cursor()) {
        if (auto r = store_.remove_temp(cursor->name); !r) {
            MR_LOG_WARN(log_category::download, r.error().message);
        }
        if (journal_) {
            if (auto r = journal_->remove(leg_name, cursor->name); !r) {
                MR_LOG_WARN(log_category::resume, r.error().message);
            }
        }
    }

    std::vector<std::string> names;
    for (const auto& file : state_->pending()) {
        names.push_back(file.name);
    }
    temporary_.clear();
    reset_state();

    if (events_ && !names.empty()) {
        events_->on_download_cancelled(names);
    }
}

// ============================================================================
// Cross-leg
// ============================================================================

void download_coordinator::on_upload_cancelled(const std::vector<std::string>& names) {
    if (!state_) {
        for (const auto& name : names) {
            temporary_.erase(name);
        }
        return;
    }

    transfer_state::mutation m;
    for (const auto& name : names) {
        if (temporary_.erase(name) != 0 && state_->has_pending(name)) {
            m.remove.push_back(name);
        }
    }
    if (m.remove.empty()) {
        return;
    }

    const auto cursor = state_->cursor();
    for (const auto& name : m.remove) {
        if (cursor && cursor->name == name) {
            cancel_call();
        }
        if (auto r = store_.remove_temp(name); !r) {
            MR_LOG_WARN(log_category::download, r.error().message);
        }
        if (journal_) {
            (void)journal_->remove(leg_name, name);
        }
    }

    auto removed = state_->apply(m);
    MR_LOG_INFO(log_category::download,
        "Dropped " + std::to_string(removed.size()) + " temporary download(s) without an upload");

    if (state_->is_empty() && !has_in_flight()) {
        reset_state();
    }
}

// ============================================================================
// Command hooks
// ============================================================================

void download_coordinator::apply_request(const std::vector<media_file>& files, bool temporary) {
    std::size_t skipped = 0;
    transfer_state::mutation m;
    std::vector<std::string> already_local;

    // Files already pending that reached their destination meanwhile
    if (state_) {
        const auto cursor = state_->cursor();
        for (const auto& file : state_->pending()) {
            if (temporary_.count(file.name) != 0 || !store_.contains(file.name)) {
                continue;
            }
            m.remove.push_back(file.name);
            already_local.push_back(file.name);

            if (cursor && cursor->name == file.name) {
                cancel_call();
            }
            if (auto r = store_.remove_temp(file.name); !r) {
                MR_LOG_WARN(log_category::download, r.error().message);
            }
            if (journal_) {
                if (auto r = journal_->remove(leg_name, file.name); !r) {
                    MR_LOG_WARN(log_category::resume, r.error().message);
                }
            }
        }
    }

    for (const auto& file : files) {
        if (!file.valid) {
            ++skipped;
            continue;
        }

        if (store_.contains(file.name)) {
            if (temporary) {
                already_local.push_back(file.name);
            } else {
                ++skipped;
            }
            continue;
        }

        if (events_) {
            if (auto copy = events_->local_copy_for(file.name)) {
                if (temporary) {
                    events_->on_download_completed(file.name, *copy);
                    continue;
                }
                if (store_.copy_to_final(*copy, file.name)) {
                    MR_LOG_INFO(log_category::download,
                        "Saved " + file.name + " from its upload hand-off copy");
                    continue;
                }
            }
        }

        if (state_ && state_->has_pending(file.name)) {
            if (!temporary) {
                temporary_.erase(file.name);
            }
            continue;
        }

        m.add_pending.push_back(file);
        if (temporary) {
            temporary_.insert(file.name);
        } else {
            temporary_.erase(file.name);
        }
    }

    const bool created = !state_ && !m.add_pending.empty();
    if (created) {
        state_.emplace();
    }

    if (state_) {
        state_->apply(m);
        publish();
        if (state_->is_empty() && !has_in_flight()) {
            reset_state();
        } else if (created) {
            MR_LOG_INFO(log_category::download,
                "Download set created with " + std::to_string(state_->total_files()) +
                " file(s), " + std::to_string(state_->total_bytes()) + " bytes");
            start_sampler();
            push_step();
        } else if (state_->is_paused() && !m.add_pending.empty()) {
            state_->set_paused(false);
            state_->set_force_paused(false);
            start_sampler();
            push_step();
        }
    }

    if (events_) {
        for (const auto& name : already_local) {
            events_->on_download_completed(name, store_.final_path(name));
        }
    }

    report_skipped(skipped, "Download Skipped");
}

void download_coordinator::run_step(command_completion done) {
    if (!state_ || state_->is_paused() || has_in_flight()) {
        done(true, false, std::nullopt);
        return;
    }
    if (state_->is_empty()) {
        reset_state();
        done(true, false, std::nullopt);
        return;
    }

    const auto* selected = state_->select_cursor();
    const media_file file = *selected;
    uint64_t offset = state_->cursor()->offset;

    if (offset == 0 && journal_) {
        auto resumable = journal_->resumable_offset(leg_name, file.name, store_.temp_path(file.name));
        if (resumable > 0 && state_->set_cursor(file.name, resumable)) {
            offset = resumable;
        }
    }

    if (auto r = store_.truncate_temp(file.name, offset); !r) {
        drop_file(file.name);
        if (state_) {
            state_->set_paused(true);
            state_->set_force_paused(true);
            stop_sampler();
        }
        done(false, false, user_error{error_title, r.error().message});
        return;
    }

    transfer_log_context ctx;
    ctx.leg = leg_name;
    ctx.filename = file.name;
    ctx.file_size = file.size;
    ctx.offset = offset;
    MR_LOG_INFO_CTX(log_category::download, "Downloading from device", ctx);

    auto stop = begin_call();
    bump_generation();
    const auto generation = generation_;
    const auto temp = store_.temp_path(file.name);

    io_pool_.submit(io_tasks_.track(
        [this, file, offset, temp, stop, generation, done = std::move(done)]() mutable {
            result<void> outcome;
            std::ofstream out(temp, std::ios::binary | std::ios::app);
            if (!out) {
                outcome = unexpected(error(error_code::file_write_error,
                    "cannot open " + temp.filename().string()));
            } else {
                outcome = source_.fetch(file, offset, stop,
                    [&](std::span<const std::byte> chunk) -> result<void> {
                        out.write(reinterpret_cast<const char*>(chunk.data()),
                                  static_cast<std::streamsize>(chunk.size()));
                        out.flush();
                        if (!out) {
                            return unexpected(error(error_code::file_write_error,
                                "cannot write " + temp.filename().string()));
                        }
                        post_guarded([this, generation, n = chunk.size()] {
                            on_chunk_committed(generation, n);
                        });
                        return {};
                    });
            }
            out.close();

            post_guarded([this, generation, name = file.name, outcome = std::move(outcome),
                          done = std::move(done)]() mutable {
                finish_step(generation, name, std::move(outcome), std::move(done));
            });
        }),
        leg_name);
}

void download_coordinator::on_step_abandoned(const std::optional<user_error>& err) {
    if (!state_) {
        return;
    }
    MR_LOG_WARN(log_category::download,
        "Download force-paused" + (err ? ": " + err->message : std::string()));
    state_->set_paused(true);
    state_->set_force_paused(true);
    stop_sampler();
    persist_cursor();
}

// ============================================================================
// Internals
// ============================================================================

void download_coordinator::push_step() {
    queue_.push_once(std::make_unique<download_step_command>(*this));
}

void download_coordinator::on_chunk_committed(uint64_t generation, std::size_t bytes) {
    if (generation != generation_ || !state_ || !state_->cursor()) {
        return;
    }
    state_->advance_cursor(bytes);
    publish();

    if (journal_) {
        const auto& cursor = *state_->cursor();
        const auto* file = state_->find_pending(cursor.name);
        auto r = journal_->checkpoint({leg_name, cursor.name, file ? file->size : 0,
                                       cursor.offset, std::chrono::system_clock::now()});
        if (!r) {
            MR_LOG_WARN(log_category::resume, "Checkpoint failed: " + r.error().message);
        }
    }
}

void download_coordinator::finish_step(uint64_t generation,
                                       const std::string& name,
                                       result<void> outcome,
                                       command_completion done) {
    if (generation != generation_) {
        done(true, false, std::nullopt);
        return;
    }
    end_call();

    if (!state_ || !state_->cursor() || state_->cursor()->name != name) {
        // The file was removed while it was being read
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
        const bool temporary = temporary_.count(name) != 0;
        std::filesystem::path local = store_.temp_path(name);
        if (!temporary) {
            if (auto c = store_.commit(name); !c) {
                drop_file(name);
                if (state_) {
                    state_->set_paused(true);
                    state_->set_force_paused(true);
                    stop_sampler();
                }
                done(false, false, user_error{error_title, c.error().message});
                return;
            }
            local = store_.final_path(name);
        }
        if (journal_) {
            if (auto r = journal_->remove(leg_name, name); !r) {
                MR_LOG_WARN(log_category::resume, r.error().message);
            }
        }

        const auto* file = state_->find_pending(name);
        transfer_log_context ctx;
        ctx.leg = leg_name;
        ctx.filename = name;
        ctx.file_size = file ? file->size : 0;
        ctx.bytes_transferred = state_->transferred_bytes() + (file ? file->size : 0) -
                                state_->cursor()->offset;
        MR_LOG_INFO_CTX(log_category::download, "Download complete", ctx);

        state_->complete_current();
        temporary_.erase(name);
        publish();

        if (events_) {
            events_->on_download_completed(name, local);
        }

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

    const auto& err = outcome.error();
    switch (err.category()) {
        case error_category::cancellation:
            persist_cursor();
            if (!state_->is_paused()) {
                push_step();
            }
            done(true, false, std::nullopt);
            return;

        case error_category::connectivity:
            MR_LOG_WARN(log_category::download,
                "Device read of " + name + " interrupted at " +
                std::to_string(state_->cursor()->offset) + ": " + err.message);
            persist_cursor();
            done(false, true, user_error{error_title,
                "Reading " + name + " from the device failed: " + err.message});
            return;

        default:
            MR_LOG_ERROR(log_category::download,
                "Dropping " + name + " after local failure: " + err.message);
            drop_file(name);
            if (state_) {
                state_->set_paused(true);
                state_->set_force_paused(true);
                stop_sampler();
            }
            done(false, false, user_error{error_title, err.message});
            return;
    }
}

void download_coordinator::drop_file(const std::string& name) {
    if (!state_) {
        return;
    }
    transfer_state::mutation m;
    m.remove.push_back(name);
    state_->apply(m);

    if (auto r = store_.remove_temp(name); !r) {
        MR_LOG_WARN(log_category::download, r.error().message);
    }
    if (journal_) {
        (void)journal_->remove(leg_name, name);
    }
    temporary_.erase(name);

    if (events_) {
        events_->on_download_cancelled({name});
    }
    if (state_->is_empty()) {
        reset_state();
    }
}

void download_coordinator::persist_cursor() {
    if (!journal_ || !state_ || !state_->cursor()) {
        return;
    }
    const auto& cursor = *state_->cursor();
    const auto* file = state_->find_pending(cursor.name);
    if (file == nullptr || cursor.offset == 0) {
        return;
    }
    auto r = journal_->save({leg_name, cursor.name, file->size, cursor.offset,
                             std::chrono::system_clock::now()});
    if (!r) {
        MR_LOG_WARN(log_category::resume, "Cannot persist cursor: " + r.error().message);
    }
}

}  // namespace kcenon::media_relay
