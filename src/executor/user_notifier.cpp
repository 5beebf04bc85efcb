/**
 * @file user_notifier.cpp
 * @brief log_notifier implementation
 */

#include <kcenon/media_relay/executor/user_notifier.h>
#include <kcenon/media_relay/core/logging.h>

namespace kcenon::media_relay {

void log_notifier::notify(const user_error& err) {
    MR_LOG_WARN(log_category::executor, err.title + ": " + err.message);
    if (forward_) {
        forward_(err);
    }
}

}  // namespace kcenon::media_relay
