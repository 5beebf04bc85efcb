/**
 * @file local_store.cpp
 * @brief Implementation of local_store
 */

#include <kcenon/media_relay/device/local_store.h>
#include <kcenon/media_relay/core/logging.h>

#include <algorithm>
#include <fstream>

namespace kcenon::media_relay {

local_store::local_store(std::filesystem::path root) : root_(std::move(root)) {}

auto local_store::prepare() -> result<void> {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return unexpected(error(error_code::storage_unavailable,
            "cannot create storage directory: " + ec.message()));
    }
    return {};
}

auto local_store::contains(const std::string& name) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(final_path(name), ec);
}

auto local_store::temp_path(const std::string& name) const -> std::filesystem::path {
    return root_ / temp_name(name);
}

auto local_store::final_path(const std::string& name) const -> std::filesystem::path {
    return root_ / strip_temp_prefix(name);
}

auto local_store::truncate_temp(const std::string& name, uint64_t offset) -> result<void> {
    auto path = temp_path(name);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::ofstream create(path, std::ios::binary);
        if (!create) {
            return unexpected(error(error_code::file_write_error,
                "cannot create " + path.filename().string()));
        }
    }
    std::filesystem::resize_file(path, offset, ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
            "cannot truncate " + path.filename().string() + ": " + ec.message()));
    }
    return {};
}

auto local_store::temp_size(const std::string& name) const -> std::optional<uint64_t> {
    std::error_code ec;
    auto size = std::filesystem::file_size(temp_path(name), ec);
    if (ec) {
        return std::nullopt;
    }
    return size;
}

auto local_store::commit(const std::string& name) -> result<void> {
    auto from = temp_path(name);
    auto to = final_path(name);
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        MR_LOG_ERROR(log_category::download,
            "Failed to commit " + name + ": " + ec.message());
        return unexpected(error(error_code::file_rename_error,
            "cannot rename " + from.filename().string() + ": " + ec.message()));
    }
    std::filesystem::last_write_time(to, std::filesystem::file_time_type::clock::now(), ec);
    if (ec) {
        MR_LOG_WARN(log_category::download,
            "Cannot stamp creation time of " + name + ": " + ec.message());
    }
    return {};
}

auto local_store::remove_temp(const std::string& name) -> result<void> {
    std::error_code ec;
    std::filesystem::remove(temp_path(name), ec);
    if (ec) {
        return unexpected(error(error_code::file_remove_error,
            "cannot remove " + temp_name(name) + ": " + ec.message()));
    }
    return {};
}

auto local_store::copy_to_final(const std::filesystem::path& source,
                                const std::string& name) -> result<void> {
    std::error_code ec;
    std::filesystem::copy_file(source, final_path(name),
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
            "cannot copy " + source.filename().string() + ": " + ec.message()));
    }
    return {};
}

auto local_store::list() const -> result<std::vector<media_file>> {
    std::vector<media_file> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (has_temp_prefix(name)) {
            continue;
        }
        media_file file;
        file.name = name;
        file.size = entry.file_size(entry_ec);
        file.valid = !entry_ec;
        files.push_back(std::move(file));
    }
    if (ec) {
        return unexpected(error(error_code::storage_unavailable,
            "cannot list storage: " + ec.message()));
    }
    std::sort(files.begin(), files.end(),
              [](const media_file& a, const media_file& b) { return a.name < b.name; });
    return files;
}

}  // namespace kcenon::media_relay
