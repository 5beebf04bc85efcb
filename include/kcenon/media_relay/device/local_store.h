/**
 * @file local_store.h
 * @brief Local persistent storage of downloaded media
 */

#ifndef KCENON_MEDIA_RELAY_DEVICE_LOCAL_STORE_H
#define KCENON_MEDIA_RELAY_DEVICE_LOCAL_STORE_H

#include <kcenon/media_relay/core/media_file.h>
#include <kcenon/media_relay/core/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief Flat directory of media files
 *
 * In-flight downloads live under their temporary name and are renamed
 * to the final name by commit().
 */
class local_store {
public:
    explicit local_store(std::filesystem::path root);

    /**
     * @brief Create the root directory if needed
     */
    [[nodiscard]] auto prepare() -> result<void>;

    /**
     * @brief Whether the final (committed) file exists
     */
    [[nodiscard]] auto contains(const std::string& name) const -> bool;

    [[nodiscard]] auto temp_path(const std::string& name) const -> std::filesystem::path;
    [[nodiscard]] auto final_path(const std::string& name) const -> std::filesystem::path;

    /**
     * @brief Create or cut the temporary file to exactly offset bytes
     */
    [[nodiscard]] auto truncate_temp(const std::string& name, uint64_t offset) -> result<void>;

    /**
     * @brief Size of the temporary file, or nullopt when absent
     */
    [[nodiscard]] auto temp_size(const std::string& name) const -> std::optional<uint64_t>;

    /**
     * @brief Rename the temporary file to its final name and stamp the time
     */
    [[nodiscard]] auto commit(const std::string& name) -> result<void>;

    [[nodiscard]] auto remove_temp(const std::string& name) -> result<void>;

    /**
     * @brief Copy an existing local file to the final name
     */
    [[nodiscard]] auto copy_to_final(const std::filesystem::path& source,
                                     const std::string& name) -> result<void>;

    /**
     * @brief Committed files, excluding temporaries
     */
    [[nodiscard]] auto list() const -> result<std::vector<media_file>>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_DEVICE_LOCAL_STORE_H
