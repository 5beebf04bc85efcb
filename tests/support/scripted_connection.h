/**
 * @file scripted_connection.h
 * @brief In-memory stream_connection answering from a reply script
 */

#ifndef KCENON_MEDIA_RELAY_TEST_SCRIPTED_CONNECTION_H
#define KCENON_MEDIA_RELAY_TEST_SCRIPTED_CONNECTION_H

#include <kcenon/media_relay/transport/stream_connection.h>

#include <algorithm>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::media_relay::test {

/**
 * @brief One scripted server reply
 */
struct scripted_reply {
    std::string bytes;
    bool close_after = false;   ///< Peer closes once the bytes are read
    bool fail_read = false;     ///< Reading fails instead of answering
};

/**
 * @brief Server side shared by every connection a factory creates
 *
 * A reply is released to the reader once the client has written something
 * since the previous reply.
 */
class scripted_server {
public:
    void reply(std::string bytes, bool close_after = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(scripted_reply{std::move(bytes), close_after, false});
    }

    void reply_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(scripted_reply{{}, false, true});
    }

    /**
     * @brief Refuse the next n connection attempts
     */
    void refuse_opens(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_opens_ = n;
    }

    /**
     * @brief Limit the bytes handed out per read
     */
    void set_read_limit(std::size_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_limit_ = limit;
    }

    [[nodiscard]] auto written() const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    [[nodiscard]] auto opens() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return opens_;
    }

    [[nodiscard]] auto last_host() const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_host_;
    }

    /**
     * @brief Hosts that accept connections; empty means all
     */
    void accept_only(std::vector<std::string> hosts) {
        std::lock_guard<std::mutex> lock(mutex_);
        accepted_hosts_ = std::move(hosts);
    }

private:
    friend class scripted_connection;

    mutable std::mutex mutex_;
    std::deque<scripted_reply> replies_;
    std::string written_;
    int refuse_opens_ = 0;
    int opens_ = 0;
    std::size_t read_limit_ = 1 << 20;
    std::string last_host_;
    std::vector<std::string> accepted_hosts_;
};

class scripted_connection : public stream_connection {
public:
    explicit scripted_connection(std::shared_ptr<scripted_server> server)
        : server_(std::move(server)) {}

    auto open(const std::string& host, uint16_t, std::chrono::milliseconds, bool)
        -> result<void> override {
        std::lock_guard<std::mutex> lock(server_->mutex_);
        server_->last_host_ = host;
        if (server_->refuse_opens_ > 0) {
            --server_->refuse_opens_;
            return unexpected(error(error_code::connection_refused, "scripted refusal"));
        }
        const auto& accepted = server_->accepted_hosts_;
        if (!accepted.empty() &&
            std::find(accepted.begin(), accepted.end(), host) == accepted.end()) {
            return unexpected(error(error_code::connection_timeout, host + " does not answer"));
        }
        ++server_->opens_;
        open_ = true;
        return {};
    }

    auto write(std::span<const std::byte> data) -> result<void> override {
        if (!open_) {
            return unexpected(error(error_code::not_connected));
        }
        std::lock_guard<std::mutex> lock(server_->mutex_);
        server_->written_.append(reinterpret_cast<const char*>(data.data()), data.size());
        awaiting_ = true;
        return {};
    }

    auto read_some(std::size_t max_bytes, std::chrono::milliseconds)
        -> result<std::vector<std::byte>> override {
        std::lock_guard<std::mutex> lock(server_->mutex_);
        if (inbound_.empty() && !closing_ && awaiting_ && !server_->replies_.empty()) {
            auto next = std::move(server_->replies_.front());
            server_->replies_.pop_front();
            awaiting_ = false;
            if (next.fail_read) {
                return unexpected(error(error_code::connection_lost, "scripted read failure"));
            }
            inbound_.assign(next.bytes.begin(), next.bytes.end());
            closing_ = next.close_after;
        }
        if (inbound_.empty()) {
            if (closing_) {
                return std::vector<std::byte>{};
            }
            return unexpected(error(error_code::connection_timeout, "no scripted reply"));
        }

        const auto n = std::min({max_bytes, server_->read_limit_, inbound_.size()});
        std::vector<std::byte> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back(static_cast<std::byte>(inbound_.front()));
            inbound_.pop_front();
        }
        return out;
    }

    void close() override { open_ = false; }

    [[nodiscard]] auto is_open() const -> bool override { return open_; }

private:
    std::shared_ptr<scripted_server> server_;
    std::deque<char> inbound_;
    bool open_ = false;
    bool awaiting_ = false;
    bool closing_ = false;
};

class scripted_connection_factory : public connection_factory {
public:
    explicit scripted_connection_factory(std::shared_ptr<scripted_server> server)
        : server_(std::move(server)) {}

    auto create() -> std::unique_ptr<stream_connection> override {
        return std::make_unique<scripted_connection>(server_);
    }

private:
    std::shared_ptr<scripted_server> server_;
};

/**
 * @brief HTTP reply with a Content-Length header
 */
inline auto http_reply(int status, const std::string& reason, const std::string& body) -> std::string {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

}  // namespace kcenon::media_relay::test

#endif  // KCENON_MEDIA_RELAY_TEST_SCRIPTED_CONNECTION_H
