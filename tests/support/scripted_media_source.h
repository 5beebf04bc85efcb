/**
 * @file scripted_media_source.h
 * @brief In-memory device with failure injection
 */

#ifndef KCENON_MEDIA_RELAY_TEST_SCRIPTED_MEDIA_SOURCE_H
#define KCENON_MEDIA_RELAY_TEST_SCRIPTED_MEDIA_SOURCE_H

#include <kcenon/media_relay/device/media_source.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::media_relay::test {

/**
 * @brief Device holding files in memory
 *
 * Chunk indexes count from the start of the file, so "the second chunk" is
 * the same bytes whatever offset a fetch started from.
 */
class scripted_media_source : public media_source {
public:
    using chunk_hook = std::function<void(const std::string& name, uint64_t position)>;

    explicit scripted_media_source(std::size_t chunk_size = 64) : chunk_size_(chunk_size) {}

    /**
     * @brief Add a file with deterministic content
     */
    void add_file(const std::string& name, std::size_t size) {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::byte>((i * 31 + name.size() * 7) & 0xFF);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        files_[name] = std::move(data);
    }

    /**
     * @brief Fail the next read of the given chunk once
     */
    void fail_once_at(const std::string& name, std::size_t chunk_index,
                      error_code code = error_code::device_read_error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back(failure{name, chunk_index, code});
    }

    /**
     * @brief Fail every read of the given file
     */
    void fail_always(const std::string& name, error_code code) {
        std::lock_guard<std::mutex> lock(mutex_);
        permanent_[name] = code;
    }

    void set_available(bool available) { available_ = available; }

    /**
     * @brief Called after each chunk was accepted by the consumer
     */
    void set_chunk_hook(chunk_hook hook) { hook_ = std::move(hook); }

    [[nodiscard]] auto content(const std::string& name) const -> std::vector<std::byte> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(name);
        return it == files_.end() ? std::vector<std::byte>{} : it->second;
    }

    [[nodiscard]] auto fetch_offsets(const std::string& name) const -> std::vector<uint64_t> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offsets_.find(name);
        return it == offsets_.end() ? std::vector<uint64_t>{} : it->second;
    }

    auto list() -> result<std::vector<media_file>> override {
        if (!available_) {
            return unexpected(error(error_code::device_unavailable, "device not connected"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<media_file> out;
        for (const auto& [name, data] : files_) {
            media_file file;
            file.name = name;
            file.size = data.size();
            file.valid = !data.empty();
            out.push_back(file);
        }
        return out;
    }

    auto fetch(const media_file& file,
               uint64_t offset,
               std::stop_token stop,
               const chunk_fn& on_chunk) -> result<void> override {
        std::vector<std::byte> data;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            offsets_[file.name].push_back(offset);
            if (auto p = permanent_.find(file.name); p != permanent_.end()) {
                return unexpected(error(p->second, "scripted failure of " + file.name));
            }
            auto it = files_.find(file.name);
            if (it == files_.end()) {
                return unexpected(error(error_code::file_not_found, file.name));
            }
            data = it->second;
        }
        if (!available_) {
            return unexpected(error(error_code::device_unavailable, "device not connected"));
        }

        uint64_t position = offset;
        while (position < data.size()) {
            if (stop.stop_requested()) {
                return unexpected(error(error_code::download_cancelled));
            }
            const std::size_t index = static_cast<std::size_t>(position / chunk_size_);
            if (auto code = take_failure(file.name, index)) {
                return unexpected(error(*code, "scripted read failure of " + file.name));
            }
            const auto len = static_cast<std::size_t>(
                std::min<uint64_t>(chunk_size_ - position % chunk_size_, data.size() - position));
            std::span<const std::byte> chunk(data.data() + position, len);
            if (auto r = on_chunk(chunk); !r) {
                return r;
            }
            position += len;
            if (hook_) {
                hook_(file.name, position);
            }
        }
        return {};
    }

    [[nodiscard]] auto is_available() const -> bool override { return available_; }

private:
    struct failure {
        std::string name;
        std::size_t chunk_index;
        error_code code;
    };

    auto take_failure(const std::string& name, std::size_t index) -> std::optional<error_code> {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = failures_.begin(); it != failures_.end(); ++it) {
            if (it->name == name && it->chunk_index == index) {
                auto code = it->code;
                failures_.erase(it);
                return code;
            }
        }
        return std::nullopt;
    }

    std::size_t chunk_size_;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::byte>> files_;
    std::map<std::string, std::vector<uint64_t>> offsets_;
    std::map<std::string, error_code> permanent_;
    std::vector<failure> failures_;
    std::atomic<bool> available_{true};
    chunk_hook hook_;
};

}  // namespace kcenon::media_relay::test

#endif  // KCENON_MEDIA_RELAY_TEST_SCRIPTED_MEDIA_SOURCE_H
