/**
 * @file relay_client.cpp
 * @brief Implementation of relay_client
 */

#include "kcenon/media_relay/client/relay_client.h"

#include <kcenon/media_relay/adapters/thread_pool_adapter.h>
#include <kcenon/media_relay/core/logging.h>
#include <kcenon/media_relay/core/resume_journal.h>
#include <kcenon/media_relay/device/directory_media_source.h>
#include <kcenon/media_relay/device/local_store.h>
#include <kcenon/media_relay/executor/serial_dispatcher.h>
#include <kcenon/media_relay/session/session_commands.h>
#include <kcenon/media_relay/transfer/download_coordinator.h>
#include <kcenon/media_relay/transfer/remote_catalog.h>
#include <kcenon/media_relay/transfer/upload_coordinator.h>
#include <kcenon/media_relay/transport/tcp_stream_connection.h>

#include <future>
#include <map>
#include <type_traits>

namespace kcenon::media_relay {

struct relay_client::impl {
    relay_config config;

    event_loop loop;
    std::shared_ptr<adapters::io_task_pool> io_pool;
    std::shared_ptr<user_notifier> notifier;
    std::shared_ptr<media_source> source;
    std::shared_ptr<connection_factory> factory;

    local_store store;
    resume_journal journal;
    remote_catalog catalog;

    command_queue device_queue;
    command_queue server_queue;

    node_session session;
    download_coordinator downloads;
    upload_coordinator uploads;

    bool started = false;

    impl(relay_config cfg,
         std::shared_ptr<media_source> src,
         std::shared_ptr<connection_factory> conn_factory,
         std::shared_ptr<user_notifier> user_notice)
        : config(std::move(cfg)),
          io_pool(adapters::io_pool_factory::create(config.io_workers, "media_relay_io")),
          notifier(std::move(user_notice)),
          source(std::move(src)),
          factory(std::move(conn_factory)),
          store(config.storage_root),
          journal(make_journal_config(config)),
          device_queue(loop, *notifier, config.device_queue),
          server_queue(loop, *notifier, config.server_queue),
          session(loop, server_queue, catalog, factory, io_pool, config.node),
          downloads(loop, device_queue, *notifier, *io_pool, *source, store, &journal, config.legs),
          uploads(loop, server_queue, *notifier, *io_pool, session, catalog, config.legs) {
        downloads.set_download_events(&uploads);
        uploads.set_upload_events(&downloads);
        session.set_disconnect_handler([this] { uploads.stop(); });
    }

    ~impl() {
        if (started) {
            // Stop in-flight reads and sends; pause persists the download cursor
            run([this] {
                downloads.pause();
                uploads.pause();
            });
        }
        session.disconnect();
        io_pool->wait_idle();
        loop.stop();
    }

    static auto make_journal_config(const relay_config& cfg) -> resume_journal_config {
        resume_journal_config journal_config(cfg.state_directory);
        journal_config.checkpoint_interval = cfg.checkpoint_interval;
        return journal_config;
    }

    /**
     * @brief Run fn on the event loop and wait for its result
     */
    template <typename Fn>
    auto run(Fn fn) -> std::invoke_result_t<Fn> {
        using value_type = std::invoke_result_t<Fn>;
        if (loop.in_context() || !loop.is_running()) {
            return fn();
        }
        auto promise = std::make_shared<std::promise<value_type>>();
        auto future = promise->get_future();
        loop.post([promise, fn = std::move(fn)]() mutable {
            if constexpr (std::is_void_v<value_type>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        });
        return future.get();
    }

    template <typename Fn>
    void post(Fn fn) {
        if (loop.in_context() || !loop.is_running()) {
            fn();
            return;
        }
        loop.post(std::move(fn));
    }

    static auto status_of(const transfer_leg& leg) -> leg_status {
        leg_status status;
        status.state = leg.snapshot();
        status.percent_complete = leg.percent_complete();
        status.speed = leg.speed();
        status.paused = leg.paused_reason();
        return status;
    }

    auto find_on_device(const std::vector<std::string>& names)
        -> result<std::vector<media_file>> {
        auto listing = source->list();
        if (!listing) {
            return unexpected(listing.error());
        }

        std::map<std::string, media_file> by_name;
        for (auto& file : listing.value()) {
            by_name.emplace(file.name, file);
        }

        std::vector<media_file> files;
        for (const auto& name : names) {
            auto it = by_name.find(name);
            if (it == by_name.end()) {
                return unexpected(error(error_code::file_not_found,
                    name + " is not on the device"));
            }
            files.push_back(it->second);
        }
        return files;
    }
};

// ============================================================================
// builder
// ============================================================================

relay_client::builder::builder() = default;

auto relay_client::builder::with_media_root(std::filesystem::path root) -> builder& {
    config_.media_root = std::move(root);
    return *this;
}

auto relay_client::builder::with_storage_root(std::filesystem::path root) -> builder& {
    config_.storage_root = std::move(root);
    return *this;
}

auto relay_client::builder::with_state_directory(std::filesystem::path dir) -> builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto relay_client::builder::with_node(uint16_t port, std::string token, std::string session_id)
    -> builder& {
    config_.node.port = port;
    config_.node.token = std::move(token);
    config_.node.session_id = std::move(session_id);
    return *this;
}

auto relay_client::builder::with_reconnect(bool enable, reconnect_policy policy) -> builder& {
    config_.node.auto_reconnect = enable;
    config_.node.reconnect = policy;
    return *this;
}

auto relay_client::builder::with_retries(uint32_t retries, std::chrono::milliseconds delay)
    -> builder& {
    config_.device_queue.retries = retries;
    config_.device_queue.retry_delay = delay;
    config_.server_queue.retries = retries;
    config_.server_queue.retry_delay = delay;
    return *this;
}

auto relay_client::builder::with_io_workers(std::size_t workers) -> builder& {
    config_.io_workers = workers;
    return *this;
}

auto relay_client::builder::with_checkpoint_interval(uint32_t chunks) -> builder& {
    config_.checkpoint_interval = chunks;
    return *this;
}

auto relay_client::builder::with_media_source(std::shared_ptr<media_source> source) -> builder& {
    source_ = std::move(source);
    return *this;
}

auto relay_client::builder::with_connection_factory(std::shared_ptr<connection_factory> factory)
    -> builder& {
    factory_ = std::move(factory);
    return *this;
}

auto relay_client::builder::with_notifier(std::shared_ptr<user_notifier> notifier) -> builder& {
    notifier_ = std::move(notifier);
    return *this;
}

auto relay_client::builder::build() -> result<relay_client> {
    if (config_.storage_root.empty()) {
        return unexpected(error(error_code::invalid_configuration, "storage root is required"));
    }
    if (!source_ && config_.media_root.empty()) {
        return unexpected(error(error_code::invalid_configuration,
            "a media root or a media source is required"));
    }
    if (config_.node.port == 0) {
        return unexpected(error(error_code::invalid_configuration, "node port must not be 0"));
    }
    if (config_.checkpoint_interval == 0) {
        return unexpected(error(error_code::invalid_configuration,
            "checkpoint interval must be at least 1"));
    }

    if (config_.state_directory.empty()) {
        config_.state_directory = config_.storage_root / ".relay_state";
    }
    if (!source_) {
        source_ = std::make_shared<directory_media_source>(config_.media_root);
    }
    if (!factory_) {
#if MEDIA_RELAY_HAS_TCP_CONNECTION
        factory_ = std::make_shared<tcp_connection_factory>();
#else
        return unexpected(error(error_code::invalid_configuration,
            "built without network_system; a connection factory is required"));
#endif
    }
    if (!notifier_) {
        notifier_ = std::make_shared<log_notifier>();
    }

    return relay_client{std::make_unique<impl>(
        std::move(config_), std::move(source_), std::move(factory_), std::move(notifier_))};
}

// ============================================================================
// relay_client
// ============================================================================

relay_client::relay_client(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {
    get_logger().initialize();
}

relay_client::relay_client(relay_client&&) noexcept = default;
auto relay_client::operator=(relay_client&&) noexcept -> relay_client& = default;
relay_client::~relay_client() = default;

auto relay_client::start() -> result<void> {
    if (impl_->started) {
        return {};
    }
    if (auto r = impl_->store.prepare(); !r) {
        return r;
    }

    impl_->loop.start();
    impl_->started = true;

    MR_LOG_INFO(log_category::session,
        "Relay started, storing media in " + impl_->config.storage_root.string());

    set_device_available(impl_->source->is_available());
    return {};
}

auto relay_client::connect(const std::vector<std::string>& addresses) -> result<std::string> {
    return impl_->session.connect(addresses);
}

void relay_client::disconnect() {
    impl_->session.disconnect();
}

auto relay_client::connection() const -> connection_state {
    return impl_->session.state();
}

void relay_client::set_device_available(bool available) {
    impl_->post([self = impl_.get(), available] {
        self->device_queue.set_enabled(available);
        if (available) {
            self->downloads.release_force_pause();
        }
    });
}

auto relay_client::list_device() -> result<std::vector<media_file>> {
    return impl_->source->list();
}

auto relay_client::download(const std::vector<std::string>& names) -> result<void> {
    auto files = impl_->find_on_device(names);
    if (!files) {
        return unexpected(files.error());
    }
    download(std::move(files.value()));
    return {};
}

void relay_client::download(std::vector<media_file> files) {
    impl_->post([self = impl_.get(), files = std::move(files)]() mutable {
        self->downloads.request_download(std::move(files), false);
    });
}

void relay_client::upload_local(const std::vector<std::string>& names) {
    std::vector<local_media> local;
    for (const auto& name : names) {
        local.push_back(local_media{impl_->store.final_path(name), name});
    }
    impl_->post([self = impl_.get(), local = std::move(local)]() mutable {
        self->uploads.request_upload(std::move(local), {});
    });
}

auto relay_client::upload_from_device(const std::vector<std::string>& names) -> result<void> {
    std::vector<std::string> missing;
    std::vector<local_media> local;
    for (const auto& name : names) {
        if (impl_->store.contains(name)) {
            local.push_back(local_media{impl_->store.final_path(name), name});
        } else {
            missing.push_back(name);
        }
    }

    std::vector<media_file> to_fetch;
    std::vector<waiting_entry> waiting;
    if (!missing.empty()) {
        auto files = impl_->find_on_device(missing);
        if (!files) {
            return unexpected(files.error());
        }
        for (const auto& file : files.value()) {
            if (!file.valid) {
                continue;
            }
            to_fetch.push_back(file);
            waiting.push_back(waiting_entry{file.name, file.size});
        }
    }

    MR_LOG_INFO(log_category::session,
        "Relaying " + std::to_string(local.size()) + " saved and " +
        std::to_string(waiting.size()) + " device file(s)");

    impl_->post([self = impl_.get(), local = std::move(local), waiting = std::move(waiting),
                 to_fetch = std::move(to_fetch)]() mutable {
        self->uploads.request_upload(std::move(local), std::move(waiting));
        if (!to_fetch.empty()) {
            self->downloads.request_download(std::move(to_fetch), true);
        }
    });
    return {};
}

void relay_client::fetch_result(const std::string& name, const std::filesystem::path& destination) {
    impl_->post([self = impl_.get(), name, destination] {
        self->server_queue.push(
            std::make_unique<fetch_remote_file_command>(self->session, name, destination));
    });
}

void relay_client::pause_download() {
    impl_->post([self = impl_.get()] { self->downloads.pause(); });
}

auto relay_client::resume_download() -> result<void> {
    return impl_->run([self = impl_.get()] { return self->downloads.resume(); });
}

void relay_client::stop_download() {
    impl_->post([self = impl_.get()] { self->downloads.stop(); });
}

void relay_client::pause_upload() {
    impl_->post([self = impl_.get()] { self->uploads.pause(); });
}

auto relay_client::resume_upload() -> result<void> {
    return impl_->run([self = impl_.get()] { return self->uploads.resume(); });
}

void relay_client::stop_upload() {
    impl_->post([self = impl_.get()] { self->uploads.stop(); });
}

void relay_client::on_download_progress(transfer_leg::state_listener listener) {
    impl_->run([self = impl_.get(), listener = std::move(listener)] {
        self->downloads.set_state_listener(listener);
    });
}

void relay_client::on_upload_progress(transfer_leg::state_listener listener) {
    impl_->run([self = impl_.get(), listener = std::move(listener)] {
        self->uploads.set_state_listener(listener);
    });
}

auto relay_client::download_status() const -> leg_status {
    return impl_->run([self = impl_.get()] { return impl::status_of(self->downloads); });
}

auto relay_client::upload_status() const -> leg_status {
    return impl_->run([self = impl_.get()] { return impl::status_of(self->uploads); });
}

auto relay_client::remote_files() const -> std::vector<std::string> {
    return impl_->run([self = impl_.get()] {
        const auto& names = self->catalog.names();
        return std::vector<std::string>(names.begin(), names.end());
    });
}

auto relay_client::config() const -> const relay_config& {
    return impl_->config;
}

}  // namespace kcenon::media_relay
