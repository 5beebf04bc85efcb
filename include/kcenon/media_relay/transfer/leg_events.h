/**
 * @file leg_events.h
 * @brief Interfaces through which the two transfer legs talk to each other
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_LEG_EVENTS_H
#define KCENON_MEDIA_RELAY_TRANSFER_LEG_EVENTS_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_relay {

/**
 * @brief What the download leg reports to the upload leg
 *
 * Implemented by upload_coordinator. Called on the serialized context.
 */
class download_events {
public:
    virtual ~download_events() = default;

    /**
     * @brief A file is now local at local_path
     */
    virtual void on_download_completed(const std::string& name,
                                       const std::filesystem::path& local_path) = 0;

    /**
     * @brief These files will not become local; drop anything waiting on them
     */
    virtual void on_download_cancelled(const std::vector<std::string>& names) = 0;

    /**
     * @brief A local hand-off copy of name held by the upload leg, if any
     */
    [[nodiscard]] virtual auto local_copy_for(const std::string& name)
        -> std::optional<std::filesystem::path> = 0;
};

/**
 * @brief What the upload leg reports to the download leg
 *
 * Implemented by download_coordinator. Called on the serialized context.
 */
class upload_events {
public:
    virtual ~upload_events() = default;

    /**
     * @brief Nobody will upload these files; temporary downloads can go
     */
    virtual void on_upload_cancelled(const std::vector<std::string>& names) = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_LEG_EVENTS_H
