/**
 * @file media_relay.h
 * @brief Main header for media_relay_system library
 * @version 0.1.0
 *
 * This is the primary include file for the media_relay_system library.
 * Include this header to access the relay client and its building blocks.
 *
 * @code
 * #include <kcenon/media_relay/media_relay.h>
 *
 * using namespace kcenon::media_relay;
 *
 * auto client = relay_client::builder()
 *     .with_media_root("/media/card")
 *     .with_storage_root("/srv/relay")
 *     .build();
 * @endcode
 */

#ifndef KCENON_MEDIA_RELAY_MEDIA_RELAY_H
#define KCENON_MEDIA_RELAY_MEDIA_RELAY_H

#include <string>

// Core types
#include "kcenon/media_relay/core/types.h"
#include "kcenon/media_relay/core/media_file.h"
#include "kcenon/media_relay/core/transfer_state.h"

// Executor
#include "kcenon/media_relay/executor/command.h"
#include "kcenon/media_relay/executor/command_queue.h"
#include "kcenon/media_relay/executor/serial_dispatcher.h"
#include "kcenon/media_relay/executor/user_notifier.h"

// Transport
#include "kcenon/media_relay/transport/http_transport.h"
#include "kcenon/media_relay/transport/tcp_stream_connection.h"

// Transfer legs
#include "kcenon/media_relay/transfer/download_coordinator.h"
#include "kcenon/media_relay/transfer/upload_coordinator.h"

// Client
#include "kcenon/media_relay/client/relay_client.h"

namespace kcenon::media_relay {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_MEDIA_RELAY_H
