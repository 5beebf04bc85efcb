/**
 * @file transfer_state.cpp
 * @brief Implementation of transfer_state
 */

#include <kcenon/media_relay/core/transfer_state.h>

#include <algorithm>

namespace kcenon::media_relay {

namespace {

template <typename Entries>
auto find_by_name(Entries& entries, const std::string& name) {
    return std::find_if(entries.begin(), entries.end(),
                        [&name](const auto& e) { return e.name == name; });
}

}  // namespace

auto transfer_state::apply(const mutation& m) -> std::vector<std::string> {
    std::vector<std::string> removed;

    for (const auto& name : m.remove) {
        bool hit = false;
        if (auto it = find_by_name(pending_, name); it != pending_.end()) {
            pending_.erase(it);
            hit = true;
        }
        if (auto it = find_by_name(waiting_, name); it != waiting_.end()) {
            waiting_.erase(it);
            hit = true;
        }
        if (hit) {
            removed.push_back(name);
            if (cursor_ && cursor_->name == name) {
                cursor_.reset();
            }
        }
    }

    for (const auto& file : m.move_waiting_to_pending) {
        auto it = find_by_name(waiting_, file.name);
        if (it == waiting_.end()) {
            continue;
        }
        waiting_.erase(it);
        if (!has_pending(file.name)) {
            pending_.push_back(file);
        }
    }

    for (const auto& entry : m.add_waiting) {
        if (!has_waiting(entry.name) && !has_pending(entry.name)) {
            waiting_.push_back(entry);
        }
    }

    for (const auto& file : m.add_pending) {
        if (!has_pending(file.name)) {
            if (auto it = find_by_name(waiting_, file.name); it != waiting_.end()) {
                waiting_.erase(it);
            }
            pending_.push_back(file);
        }
    }

    rederive();
    return removed;
}

auto transfer_state::find_pending(const std::string& name) const -> const media_file* {
    auto it = find_by_name(pending_, name);
    return it == pending_.end() ? nullptr : &*it;
}

auto transfer_state::has_pending(const std::string& name) const -> bool {
    return find_pending(name) != nullptr;
}

auto transfer_state::has_waiting(const std::string& name) const -> bool {
    return find_by_name(waiting_, name) != waiting_.end();
}

auto transfer_state::select_cursor() -> const media_file* {
    if (cursor_) {
        if (const auto* file = find_pending(cursor_->name)) {
            return file;
        }
        cursor_.reset();
    }
    if (pending_.empty()) {
        rederive();
        return nullptr;
    }
    cursor_ = transfer_cursor{pending_.front().name, 0};
    rederive();
    return &pending_.front();
}

auto transfer_state::set_cursor(const std::string& name, uint64_t offset) -> bool {
    const auto* file = find_pending(name);
    if (file == nullptr || offset > file->size) {
        return false;
    }
    cursor_ = transfer_cursor{name, offset};
    rederive();
    return true;
}

void transfer_state::advance_cursor(uint64_t bytes) {
    if (!cursor_) {
        return;
    }
    const auto* file = find_pending(cursor_->name);
    uint64_t limit = file ? file->size : cursor_->offset + bytes;
    cursor_->offset = std::min(cursor_->offset + bytes, limit);
    rederive();
}

void transfer_state::rollback_cursor(uint64_t to_offset) {
    if (!cursor_) {
        return;
    }
    cursor_->offset = std::min(cursor_->offset, to_offset);
    rederive();
}

void transfer_state::complete_current() {
    if (!cursor_) {
        return;
    }
    auto it = find_by_name(pending_, cursor_->name);
    if (it != pending_.end()) {
        completed_bytes_ += it->size;
        ++transferred_files_;
        pending_.erase(it);
    }
    cursor_.reset();
    rederive();
}

void transfer_state::sample_speed(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        return;
    }
    uint64_t delta = transferred_bytes_ > speed_last_bytes_
        ? transferred_bytes_ - speed_last_bytes_
        : 0;
    speed_ = delta * 1000 / static_cast<uint64_t>(interval.count());
    speed_last_bytes_ = transferred_bytes_;
}

auto transfer_state::remaining_bytes() const -> uint64_t {
    uint64_t sum = 0;
    for (const auto& f : pending_) sum += f.size;
    for (const auto& w : waiting_) sum += w.size;
    uint64_t offset = cursor_ ? cursor_->offset : 0;
    return sum >= offset ? sum - offset : 0;
}

auto transfer_state::percent_complete() const -> double {
    if (total_bytes_ == 0) {
        return 0.0;
    }
    return static_cast<double>(transferred_bytes_) * 100.0 /
           static_cast<double>(total_bytes_);
}

auto transfer_state::invariant_holds() const -> bool {
    if (cursor_) {
        const auto* file = find_pending(cursor_->name);
        if (file == nullptr || cursor_->offset > file->size) {
            return false;
        }
    }
    return transferred_bytes_ + remaining_bytes() == total_bytes_ &&
           total_files_ == transferred_files_ + pending_.size() + waiting_.size();
}

void transfer_state::rederive() {
    uint64_t sum = 0;
    for (const auto& f : pending_) sum += f.size;
    for (const auto& w : waiting_) sum += w.size;

    total_bytes_ = completed_bytes_ + sum;
    total_files_ = transferred_files_ + pending_.size() + waiting_.size();
    transferred_bytes_ = completed_bytes_ + (cursor_ ? cursor_->offset : 0);
}

}  // namespace kcenon::media_relay
