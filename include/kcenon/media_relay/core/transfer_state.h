/**
 * @file transfer_state.h
 * @brief Progress and membership state of one transfer leg
 *
 * Both legs share this type. The download leg never uses the waiting set.
 * Every aggregate is derived from the sets, the cursor and the bytes of
 * completed files, so callers can never observe totals that disagree with
 * membership.
 */

#ifndef KCENON_MEDIA_RELAY_CORE_TRANSFER_STATE_H
#define KCENON_MEDIA_RELAY_CORE_TRANSFER_STATE_H

#include <kcenon/media_relay/core/media_file.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Current file and byte offset of a leg
 */
struct transfer_cursor {
    std::string name;
    uint64_t offset = 0;
};

/**
 * @brief Upload entry known by name and size but not yet local
 */
struct waiting_entry {
    std::string name;
    uint64_t size = 0;
};

class transfer_state {
public:
    /**
     * @brief Atomic edit of the pending and waiting sets
     *
     * Removals are applied first, then waiting entries are promoted, then
     * additions. Names already present are ignored.
     */
    struct mutation {
        std::vector<media_file> add_pending;
        std::vector<waiting_entry> add_waiting;
        std::vector<std::string> remove;
        std::vector<media_file> move_waiting_to_pending;
    };

    transfer_state() = default;

    /**
     * @brief Apply a mutation and re-derive every aggregate
     * @return Names that were actually removed from either set
     */
    auto apply(const mutation& m) -> std::vector<std::string>;

    [[nodiscard]] auto pending() const -> const std::vector<media_file>& { return pending_; }
    [[nodiscard]] auto waiting() const -> const std::vector<waiting_entry>& { return waiting_; }
    [[nodiscard]] auto cursor() const -> const std::optional<transfer_cursor>& { return cursor_; }

    [[nodiscard]] auto find_pending(const std::string& name) const -> const media_file*;
    [[nodiscard]] auto has_pending(const std::string& name) const -> bool;
    [[nodiscard]] auto has_waiting(const std::string& name) const -> bool;

    /**
     * @brief Make sure a cursor exists when files are pending
     * @return The cursor file, or nullptr when nothing is pending
     *
     * Without a cursor the first pending file is selected at offset 0.
     */
    auto select_cursor() -> const media_file*;

    /**
     * @brief Place the cursor on a pending file at a given offset
     * @return false when the name is not pending or the offset exceeds its size
     */
    auto set_cursor(const std::string& name, uint64_t offset) -> bool;

    void advance_cursor(uint64_t bytes);
    void rollback_cursor(uint64_t to_offset);

    /**
     * @brief Finish the cursor file
     *
     * Moves its size into the completed bytes, counts it as transferred and
     * clears the cursor.
     */
    void complete_current();

    [[nodiscard]] auto is_paused() const -> bool { return paused_; }
    [[nodiscard]] auto is_force_paused() const -> bool { return force_paused_; }
    void set_paused(bool paused) { paused_ = paused; }
    void set_force_paused(bool force_paused) { force_paused_ = force_paused; }

    [[nodiscard]] auto total_bytes() const -> uint64_t { return total_bytes_; }
    [[nodiscard]] auto total_files() const -> uint64_t { return total_files_; }
    [[nodiscard]] auto transferred_bytes() const -> uint64_t { return transferred_bytes_; }
    [[nodiscard]] auto transferred_files() const -> uint64_t { return transferred_files_; }
    [[nodiscard]] auto completed_bytes() const -> uint64_t { return completed_bytes_; }
    [[nodiscard]] auto speed() const -> uint64_t { return speed_; }
    [[nodiscard]] auto speed_last_bytes() const -> uint64_t { return speed_last_bytes_; }

    /**
     * @brief Take a speed sample over the given interval
     *
     * speed becomes the bytes moved since the previous sample, scaled to one
     * second. A rollback never produces a negative speed.
     */
    void sample_speed(std::chrono::milliseconds interval);

    [[nodiscard]] auto remaining_bytes() const -> uint64_t;
    [[nodiscard]] auto percent_complete() const -> double;
    [[nodiscard]] auto is_empty() const -> bool { return pending_.empty() && waiting_.empty(); }
    [[nodiscard]] auto invariant_holds() const -> bool;

private:
    void rederive();

    std::vector<media_file> pending_;
    std::vector<waiting_entry> waiting_;
    std::optional<transfer_cursor> cursor_;
    bool paused_ = false;
    bool force_paused_ = false;

    uint64_t completed_bytes_ = 0;
    uint64_t transferred_files_ = 0;
    uint64_t total_bytes_ = 0;
    uint64_t total_files_ = 0;
    uint64_t transferred_bytes_ = 0;
    uint64_t speed_ = 0;
    uint64_t speed_last_bytes_ = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_TRANSFER_STATE_H
