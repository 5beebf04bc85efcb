/**
 * @file user_notifier.h
 * @brief Sink for user-facing failure notices
 */

#ifndef KCENON_MEDIA_RELAY_EXECUTOR_USER_NOTIFIER_H
#define KCENON_MEDIA_RELAY_EXECUTOR_USER_NOTIFIER_H

#include <kcenon/media_relay/core/types.h>

#include <functional>

namespace kcenon::media_relay {

class user_notifier {
public:
    virtual ~user_notifier() = default;
    virtual void notify(const user_error& err) = 0;
};

/**
 * @brief Default notifier: logs each notice at warn level
 *
 * An optional forward callback lets a front-end display the notice too.
 */
class log_notifier : public user_notifier {
public:
    using forward_fn = std::function<void(const user_error&)>;

    log_notifier() = default;
    explicit log_notifier(forward_fn forward) : forward_(std::move(forward)) {}

    void notify(const user_error& err) override;

private:
    forward_fn forward_;
};

}  // namespace kcenon::media_relay

#endif  // KCENON_MEDIA_RELAY_EXECUTOR_USER_NOTIFIER_H
