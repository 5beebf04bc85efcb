/**
 * @file resume_journal.cpp
 * @brief Implementation of resume_journal
 */

#include <kcenon/media_relay/core/resume_journal.h>
#include <kcenon/media_relay/core/json_utils.h>
#include <kcenon/media_relay/core/logging.h>

#include <cctype>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace kcenon::media_relay {

resume_journal_config::resume_journal_config()
    : state_directory(std::filesystem::temp_directory_path() / "media_relay_journal") {}

resume_journal_config::resume_journal_config(std::filesystem::path dir)
    : state_directory(std::move(dir)) {}

namespace {

auto to_millis(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto serialize(const journal_record& record) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"leg\": \"" << json::escape(record.leg) << "\",\n";
    oss << "  \"name\": \"" << json::escape(record.name) << "\",\n";
    oss << "  \"expected_size\": " << record.expected_size << ",\n";
    oss << "  \"committed_offset\": " << record.committed_offset << ",\n";
    oss << "  \"updated_at\": " << to_millis(record.updated_at) << "\n";
    oss << "}";
    return oss.str();
}

auto deserialize(const std::string& text) -> result<journal_record> {
    journal_record record;
    auto leg = json::extract_value(text, "leg");
    auto name = json::extract_value(text, "name");
    if (!leg || !name) {
        return unexpected(error(error_code::missing_field, "journal record without leg or name"));
    }
    record.leg = *leg;
    record.name = *name;

    try {
        record.expected_size = std::stoull(json::extract_value(text, "expected_size").value_or(""));
        record.committed_offset =
            std::stoull(json::extract_value(text, "committed_offset").value_or(""));
        record.updated_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(std::stoll(json::extract_value(text, "updated_at").value_or(""))));
    } catch (const std::exception&) {
        return unexpected(error(error_code::malformed_response, "invalid numeric field"));
    }
    return record;
}

/// File names may contain anything the device reports, so encode them
auto record_file_name(const std::string& leg, const std::string& name) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out = leg + "-";
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out + ".json";
}

}  // namespace

class resume_journal::impl {
public:
    explicit impl(const resume_journal_config& cfg) : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);
        if (ec) {
            MR_LOG_WARN(log_category::resume,
                "Cannot create journal directory " + config_.state_directory.string() +
                ": " + ec.message());
        }
    }

    auto save(const journal_record& record) -> result<void> {
        std::unique_lock lock(mutex_);
        return write_locked(record);
    }

    auto checkpoint(const journal_record& record) -> result<void> {
        std::unique_lock lock(mutex_);
        auto& count = chunks_since_checkpoint_[key(record.leg, record.name)];
        if (++count < config_.checkpoint_interval) {
            return {};
        }
        count = 0;
        return write_locked(record);
    }

    auto load(const std::string& leg, const std::string& name) -> result<journal_record> {
        std::shared_lock lock(mutex_);
        auto path = path_for(leg, name);
        if (!std::filesystem::exists(path)) {
            return unexpected(error(error_code::file_not_found, "no journal record"));
        }

        std::ifstream file(path);
        if (!file) {
            MR_LOG_ERROR(log_category::resume, "Failed to open journal record: " + path.string());
            return unexpected(error(error_code::file_read_error, "failed to open journal record"));
        }
        std::ostringstream oss;
        oss << file.rdbuf();
        return deserialize(oss.str());
    }

    auto remove(const std::string& leg, const std::string& name) -> result<void> {
        std::unique_lock lock(mutex_);
        chunks_since_checkpoint_.erase(key(leg, name));

        auto path = path_for(leg, name);
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            std::filesystem::remove(path, ec);
            if (ec) {
                MR_LOG_ERROR(log_category::resume,
                    "Failed to delete journal record: " + path.string() + " (" + ec.message() + ")");
                return unexpected(error(error_code::file_remove_error,
                    "failed to delete journal record: " + ec.message()));
            }
            MR_LOG_TRACE(log_category::resume, "Journal record deleted: " + path.string());
        }
        return {};
    }

    auto contains(const std::string& leg, const std::string& name) const -> bool {
        std::shared_lock lock(mutex_);
        std::error_code ec;
        return std::filesystem::exists(path_for(leg, name), ec);
    }

    auto list() -> std::vector<journal_record> {
        std::vector<journal_record> records;
        std::shared_lock lock(mutex_);
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(config_.state_directory, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            std::ifstream file(entry.path());
            std::ostringstream oss;
            oss << file.rdbuf();
            auto parsed = deserialize(oss.str());
            if (parsed) {
                records.push_back(std::move(parsed.value()));
            } else {
                MR_LOG_WARN(log_category::resume,
                    "Skipping unreadable journal record " + entry.path().string());
            }
        }
        return records;
    }

    [[nodiscard]] auto config() const -> const resume_journal_config& { return config_; }

private:
    static auto key(const std::string& leg, const std::string& name) -> std::string {
        return leg + "/" + name;
    }

    auto path_for(const std::string& leg, const std::string& name) const -> std::filesystem::path {
        return config_.state_directory / record_file_name(leg, name);
    }

    auto write_locked(const journal_record& record) -> result<void> {
        auto path = path_for(record.leg, record.name);
        auto staging = path;
        staging += ".part";

        {
            std::ofstream file(staging, std::ios::trunc);
            if (!file) {
                MR_LOG_ERROR(log_category::resume,
                    "Failed to open journal record for writing: " + staging.string());
                return unexpected(error(error_code::file_write_error,
                    "failed to open journal record for writing"));
            }
            file << serialize(record);
            if (!file) {
                return unexpected(error(error_code::file_write_error,
                    "failed to write journal record"));
            }
        }

        std::error_code ec;
        std::filesystem::rename(staging, path, ec);
        if (ec) {
            return unexpected(error(error_code::file_rename_error,
                "failed to publish journal record: " + ec.message()));
        }

        MR_LOG_TRACE(log_category::resume,
            "Checkpoint " + record.name + " at " + std::to_string(record.committed_offset) +
            "/" + std::to_string(record.expected_size));
        return {};
    }

    resume_journal_config config_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, uint32_t> chunks_since_checkpoint_;
};

resume_journal::resume_journal(const resume_journal_config& config)
    : impl_(std::make_unique<impl>(config)) {}

resume_journal::~resume_journal() = default;

resume_journal::resume_journal(resume_journal&&) noexcept = default;
auto resume_journal::operator=(resume_journal&&) noexcept -> resume_journal& = default;

auto resume_journal::save(const journal_record& record) -> result<void> {
    return impl_->save(record);
}

auto resume_journal::checkpoint(const journal_record& record) -> result<void> {
    return impl_->checkpoint(record);
}

auto resume_journal::load(const std::string& leg, const std::string& name)
    -> result<journal_record> {
    return impl_->load(leg, name);
}

auto resume_journal::remove(const std::string& leg, const std::string& name) -> result<void> {
    return impl_->remove(leg, name);
}

auto resume_journal::contains(const std::string& leg, const std::string& name) const -> bool {
    return impl_->contains(leg, name);
}

auto resume_journal::resumable_offset(const std::string& leg,
                                      const std::string& name,
                                      const std::filesystem::path& temp_file) -> uint64_t {
    auto record = impl_->load(leg, name);
    if (!record) {
        return 0;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(temp_file, ec);
    const auto& r = record.value();
    if (ec || size != r.committed_offset || r.committed_offset > r.expected_size) {
        MR_LOG_INFO(log_category::resume,
            "Discarding stale checkpoint for " + name + " (journal " +
            std::to_string(r.committed_offset) + ", file " +
            (ec ? std::string("missing") : std::to_string(size)) + ")");
        return 0;
    }

    MR_LOG_INFO(log_category::resume,
        "Resuming " + name + " from offset " + std::to_string(r.committed_offset));
    return r.committed_offset;
}

auto resume_journal::list() -> std::vector<journal_record> {
    return impl_->list();
}

auto resume_journal::config() const -> const resume_journal_config& {
    return impl_->config();
}

}  // namespace kcenon::media_relay
