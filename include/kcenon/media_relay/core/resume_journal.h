/**
 * @file resume_journal.h
 * @brief Persisted checkpoints of in-flight downloads
 *
 * A download writes into a temporary file whose size is the committed
 * offset. The journal remembers that offset across restarts so a later
 * run can verify the temporary file before appending to it.
 */

#ifndef KCENON_MEDIA_RELAY_CORE_RESUME_JOURNAL_H
#define KCENON_MEDIA_RELAY_CORE_RESUME_JOURNAL_H

#include <kcenon/media_relay/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief One journaled transfer
 */
struct journal_record {
    std::string leg;                   ///< "download" or "upload"
    std::string name;                  ///< Logical file name
    uint64_t expected_size = 0;        ///< Full size of the file
    uint64_t committed_offset = 0;     ///< Bytes durably written
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Configuration for resume_journal
 */
struct resume_journal_config {
    std::filesystem::path state_directory;  ///< Directory for record files
    uint32_t checkpoint_interval = 16;      ///< Persist every N chunks

    resume_journal_config();
    explicit resume_journal_config(std::filesystem::path dir);
};

/**
 * @brief Journal of resumable transfers
 *
 * Records are one JSON file per (leg, name). Thread-safe.
 *
 * @code
 * resume_journal journal({"/var/lib/relay/state"});
 * journal.checkpoint({"download", "a.mp4", 1000, 65536, now});
 * auto offset = journal.resumable_offset("download", "a.mp4", temp_path);
 * @endcode
 */
class resume_journal {
public:
    explicit resume_journal(const resume_journal_config& config);
    ~resume_journal();

    resume_journal(const resume_journal&) = delete;
    auto operator=(const resume_journal&) -> resume_journal& = delete;
    resume_journal(resume_journal&&) noexcept;
    auto operator=(resume_journal&&) noexcept -> resume_journal&;

    /**
     * @brief Write a record unconditionally
     */
    [[nodiscard]] auto save(const journal_record& record) -> result<void>;

    /**
     * @brief Count a committed chunk and persist every checkpoint_interval chunks
     */
    [[nodiscard]] auto checkpoint(const journal_record& record) -> result<void>;

    [[nodiscard]] auto load(const std::string& leg, const std::string& name)
        -> result<journal_record>;

    [[nodiscard]] auto remove(const std::string& leg, const std::string& name) -> result<void>;

    [[nodiscard]] auto contains(const std::string& leg, const std::string& name) const -> bool;

    /**
     * @brief Offset a transfer may resume from
     *
     * Returns the journaled offset when the temporary file exists and its
     * size equals that offset, otherwise 0.
     */
    [[nodiscard]] auto resumable_offset(const std::string& leg,
                                        const std::string& name,
                                        const std::filesystem::path& temp_file) -> uint64_t;

    [[nodiscard]] auto list() -> std::vector<journal_record>;

    [[nodiscard]] auto config() const -> const resume_journal_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_CORE_RESUME_JOURNAL_H
