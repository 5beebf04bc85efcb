/**
 * @file node_session.cpp
 * @brief Implementation of node_session
 */

#include <kcenon/media_relay/session/node_session.h>
#include <kcenon/media_relay/session/session_commands.h>
#include <kcenon/media_relay/core/json_utils.h>
#include <kcenon/media_relay/core/logging.h>

#include <system_error>
#include <utility>

namespace kcenon::media_relay {

namespace {

constexpr const char* probe_path = "/node/connectuser";
constexpr const char* catalog_path = "/project/list?folder=data";
constexpr const char* catalog_error_title = "Error Loading Files";
constexpr const char* fetch_error_title = "Error Downloading Result";

auto parse_failure(const std::string& detail) -> unexpected {
    return unexpected(error(error_code::malformed_response,
        "An issue was encountered while parsing the response from the node" + detail));
}

}  // namespace

auto parse_upload_reply(const http_response& response) -> result<std::string> {
    const auto body = response.body_text();

    if (auto task_id = json::extract_value(body, "taskID")) {
        return *task_id;
    }

    auto code = json::extract_value(body, "code");
    auto message = json::extract_value(body, "message");
    if (code && message) {
        return unexpected(error(error_code::missing_field,
            "An issue was encountered while parsing the response from the node, error(" +
                *code + "): " + *message));
    }
    if (!response.is_success()) {
        return unexpected(error(error_code::remote_rejected,
            "An issue was encountered while parsing the response from the node, " +
                response.status_line));
    }
    return parse_failure("");
}

node_session::node_session(serial_dispatcher& dispatcher,
                           command_queue& server_queue,
                           remote_catalog& catalog,
                           std::shared_ptr<connection_factory> factory,
                           std::shared_ptr<adapters::io_task_pool> io_pool,
                           node_session_config config)
    : dispatcher_(dispatcher),
      queue_(server_queue),
      catalog_(catalog),
      factory_(std::move(factory)),
      io_pool_(std::move(io_pool)),
      config_(std::move(config)),
      lifetime_(std::make_shared<char>(0)) {}

node_session::~node_session() {
    lifetime_.reset();
    std::shared_ptr<http_transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = std::move(transport_);
    }
    if (transport) {
        transport->remove_observer(this);
        transport->terminate(false);
    }
    tasks_.wait();
}

// ============================================================================
// Connection
// ============================================================================

auto node_session::transport_for(const std::string& host, bool persistent) const
    -> transport_config {
    transport_config cfg;
    cfg.host = host;
    cfg.port = config_.port;
    if (persistent) {
        cfg.connect_timeout = config_.connect_timeout;
        cfg.read_timeout = config_.read_timeout;
        cfg.keep_alive = true;
        cfg.auto_reconnect = config_.auto_reconnect;
        cfg.reconnect = config_.reconnect;
    } else {
        cfg.connect_timeout = config_.probe_timeout;
        cfg.read_timeout = config_.probe_timeout;
        cfg.keep_alive = false;
        cfg.auto_reconnect = false;
    }
    return cfg;
}

auto node_session::make_request(std::string path, http_method method) const -> http_request {
    http_request request;
    request.path = std::move(path);
    request.method = method;
    if (!config_.token.empty()) {
        request.headers["Authorization"] = "Bearer " + config_.token;
    }
    if (!config_.session_id.empty()) {
        request.headers["Session"] = config_.session_id;
    }
    if (method == http_method::post) {
        request.headers["Content-Type"] = "application/octet-stream";
    }
    return request;
}

auto node_session::probe(const std::string& host) -> result<void> {
    http_transport probe_transport(transport_for(host, false), factory_, io_pool_);

    if (auto r = probe_transport.open(); !r) {
        return r;
    }

    auto raw = probe_transport.send(make_request(probe_path, http_method::get));
    probe_transport.terminate(false);
    if (!raw) {
        return unexpected(raw.error());
    }

    auto response = parse_response(raw.value());
    if (!response) {
        return parse_failure("");
    }
    if (!response->is_success()) {
        return unexpected(error(error_code::unexpected_status,
            host + " answered " + response->status_line));
    }
    return {};
}

auto node_session::connect(const std::vector<std::string>& addresses) -> result<std::string> {
    if (addresses.empty()) {
        return unexpected(error(error_code::invalid_configuration, "no node address given"));
    }

    for (const auto& host : addresses) {
        if (auto r = probe(host); !r) {
            MR_LOG_DEBUG(log_category::session,
                "Node probe of " + host + " failed: " + r.error().message);
            continue;
        }

        auto transport = std::make_shared<http_transport>(
            transport_for(host, true), factory_, io_pool_);

        std::shared_ptr<http_transport> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = std::exchange(transport_, transport);
            host_ = host;
        }
        if (previous) {
            previous->remove_observer(this);
            previous->terminate(false);
        }

        transport->add_observer(this);
        if (auto r = transport->open(); !r) {
            MR_LOG_WARN(log_category::session,
                "Node at " + host + " answered the probe but refused the session: " +
                r.error().message);
            continue;
        }

        MR_LOG_INFO(log_category::session, "Connected to node at " + host);
        return host;
    }

    return unexpected(error(error_code::connection_failed,
        "no node answered at any of " + std::to_string(addresses.size()) + " address(es)"));
}

void node_session::disconnect() {
    std::shared_ptr<http_transport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport = transport_;
    }
    if (transport) {
        transport->terminate(false);
    }
}

auto node_session::current() const -> std::shared_ptr<http_transport> {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
}

auto node_session::state() const -> connection_state {
    auto transport = current();
    return transport ? transport->state() : connection_state::disconnected;
}

auto node_session::is_connected() const -> bool {
    auto transport = current();
    return transport && transport->is_connected();
}

auto node_session::host() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return host_;
}

void node_session::on_connection_state(connection_state state) {
    std::weak_ptr<char> alive = lifetime_;
    dispatcher_.post([this, alive, state] {
        if (alive.lock()) {
            apply_state(state);
        }
    });
}

void node_session::apply_state(connection_state state) {
    switch (state) {
        case connection_state::connected:
            queue_.set_enabled(true);
            refresh_catalog();
            break;
        case connection_state::lost:
            MR_LOG_WARN(log_category::session, "Node connection lost, waiting for reconnect");
            queue_.set_enabled(false);
            break;
        case connection_state::disconnected:
            queue_.set_enabled(false);
            if (on_disconnect_) {
                on_disconnect_();
            }
            break;
        case connection_state::started:
            break;
    }
}

// ============================================================================
// Endpoints
// ============================================================================

auto node_session::fetch_catalog() -> result<std::vector<std::string>> {
    auto transport = current();
    if (!transport) {
        return unexpected(error(error_code::not_connected, "not connected to node"));
    }

    auto raw = transport->send(make_request(catalog_path, http_method::get));
    if (!raw) {
        return unexpected(raw.error());
    }

    auto response = parse_response(raw.value());
    if (!response) {
        return parse_failure("");
    }
    if (!response->is_success()) {
        return unexpected(error(error_code::unexpected_status,
            "file list request answered " + response->status_line));
    }

    auto names = json::parse_string_array(response->body_text());
    if (!names) {
        return parse_failure(", the file list is not a string array");
    }
    return *names;
}

auto node_session::download_remote(const std::string& name,
                                   const std::filesystem::path& destination,
                                   http_transport::progress_fn on_bytes,
                                   std::stop_token stop) -> result<void> {
    auto transport = current();
    if (!transport) {
        return unexpected(error(error_code::not_connected, "not connected to node"));
    }

    auto request = make_request("/project/download?name=" + url_encode(name) + "&folder=output",
                                http_method::get);
    auto head = transport->download_to_file(request, destination, std::move(on_bytes), stop);

    result<void> outcome;
    if (!head) {
        outcome = unexpected(head.error());
    } else if (auto response = parse_response(to_bytes(head.value())); !response) {
        outcome = parse_failure("");
    } else if (!response->is_success()) {
        outcome = unexpected(error(error_code::unexpected_status,
            "download of " + name + " answered " + response->status_line));
    }

    if (!outcome) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        if (ec) {
            MR_LOG_WARN(log_category::session,
                "Cannot remove partial " + destination.filename().string() + ": " + ec.message());
        }
    }
    return outcome;
}

auto node_session::send_file(const std::string& name,
                             const std::filesystem::path& path,
                             std::stop_token stop,
                             progress_fn on_bytes) -> result<std::string> {
    auto transport = current();
    if (!transport) {
        return unexpected(error(error_code::not_connected, "not connected to node"));
    }

    auto request = make_request("/project/command?name=add&param1=" + url_encode(name),
                                http_method::post);
    auto raw = transport->send_file(request, path, std::move(on_bytes), stop);
    if (!raw) {
        return unexpected(raw.error());
    }

    auto response = parse_response(raw.value());
    if (!response) {
        return parse_failure("");
    }
    return parse_upload_reply(*response);
}

// ============================================================================
// Command hooks
// ============================================================================

void node_session::refresh_catalog() {
    queue_.push_once(std::make_unique<refresh_catalog_command>(*this));
}

void node_session::run_catalog_refresh(command_completion done) {
    std::weak_ptr<char> alive = lifetime_;
    io_pool_->submit(tasks_.track(
        [this, alive, done = std::move(done)]() mutable {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            auto names = fetch_catalog();
            dispatcher_.post([this, alive, names = std::move(names), done = std::move(done)] {
                if (!alive.lock()) {
                    return;
                }
                if (!names) {
                    const auto& err = names.error();
                    done(false, err.retryable(), to_user_error(err, catalog_error_title));
                    return;
                }
                catalog_.replace(names.value());
                MR_LOG_DEBUG(log_category::session,
                    "Node holds " + std::to_string(catalog_.size()) + " file(s)");
                done(true, false, std::nullopt);
            });
        }),
        "session");
}

void node_session::run_remote_fetch(const std::string& name,
                                    const std::filesystem::path& destination,
                                    command_completion done) {
    std::weak_ptr<char> alive = lifetime_;
    io_pool_->submit(tasks_.track(
        [this, alive, name, destination, done = std::move(done)]() mutable {
            auto self = alive.lock();
            if (!self) {
                return;
            }
            auto outcome = download_remote(name, destination, nullptr);
            dispatcher_.post([alive, name, outcome = std::move(outcome), done = std::move(done)] {
                if (!alive.lock()) {
                    return;
                }
                if (!outcome) {
                    const auto& err = outcome.error();
                    done(false, err.retryable(), to_user_error(err, fetch_error_title));
                    return;
                }
                MR_LOG_INFO(log_category::session, "Fetched " + name + " from the node");
                done(true, false, std::nullopt);
            });
        }),
        "session");
}

}  // namespace kcenon::media_relay
