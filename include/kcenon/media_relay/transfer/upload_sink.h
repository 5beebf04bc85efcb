/**
 * @file upload_sink.h
 * @brief Destination of the upload leg
 */

#ifndef KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_SINK_H
#define KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_SINK_H

#include <kcenon/media_relay/core/types.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace kcenon::media_relay {

class upload_sink {
public:
    using progress_fn = std::function<void(std::size_t bytes)>;

    virtual ~upload_sink() = default;

    /**
     * @brief Upload one file under name, blocking
     * @return The task id the server assigned to the new file
     */
    [[nodiscard]] virtual auto send_file(const std::string& name,
                                         const std::filesystem::path& path,
                                         std::stop_token stop,
                                         progress_fn on_bytes) -> result<std::string> = 0;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_TRANSFER_UPLOAD_SINK_H
