/**
 * @file directory_media_source.cpp
 * @brief Implementation of directory_media_source
 */

#include <kcenon/media_relay/device/directory_media_source.h>
#include <kcenon/media_relay/core/logging.h>

#include <algorithm>
#include <fstream>

namespace kcenon::media_relay {

namespace {

auto to_system_time(std::filesystem::file_time_type t) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        t - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

}  // namespace

directory_media_source::directory_media_source(std::filesystem::path root, std::size_t chunk_size)
    : root_(std::move(root)), chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size) {}

auto directory_media_source::is_available() const -> bool {
    std::error_code ec;
    return std::filesystem::is_directory(root_, ec);
}

auto directory_media_source::list() -> result<std::vector<media_file>> {
    if (!is_available()) {
        return unexpected(error(error_code::device_unavailable,
            "media directory not mounted: " + root_.string()));
    }

    std::vector<media_file> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        media_file file;
        file.name = entry.path().filename().string();
        file.size = entry.file_size(entry_ec);
        file.valid = !entry_ec && file.size > 0;
        if (auto t = entry.last_write_time(entry_ec); !entry_ec) {
            file.created_at = to_system_time(t);
        }
        files.push_back(std::move(file));
    }
    if (ec) {
        return unexpected(error(error_code::device_read_error,
            "cannot list media directory: " + ec.message()));
    }

    std::sort(files.begin(), files.end(),
              [](const media_file& a, const media_file& b) { return a.name < b.name; });
    return files;
}

auto directory_media_source::fetch(const media_file& file,
                                   uint64_t offset,
                                   std::stop_token stop,
                                   const chunk_fn& on_chunk) -> result<void> {
    auto path = root_ / file.name;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (!is_available()) {
            return unexpected(error(error_code::device_unavailable, "media directory unavailable"));
        }
        return unexpected(error(error_code::device_read_error, "cannot open " + file.name));
    }
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
        return unexpected(error(error_code::device_read_error,
            "cannot seek " + file.name + " to " + std::to_string(offset)));
    }

    std::vector<char> buffer(chunk_size_);
    uint64_t position = offset;
    while (position < file.size) {
        if (stop.stop_requested()) {
            return unexpected(error(error_code::download_cancelled));
        }
        auto want = static_cast<std::streamsize>(
            std::min<uint64_t>(buffer.size(), file.size - position));
        in.read(buffer.data(), want);
        auto got = in.gcount();
        if (got <= 0) {
            MR_LOG_WARN(log_category::download,
                "Short read of " + file.name + " at " + std::to_string(position));
            return unexpected(error(error_code::device_read_error,
                "unexpected end of " + file.name));
        }
        auto r = on_chunk(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        if (!r) {
            return r;
        }
        position += static_cast<uint64_t>(got);
    }
    return {};
}

}  // namespace kcenon::media_relay
