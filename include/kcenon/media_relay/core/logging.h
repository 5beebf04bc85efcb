// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/media_relay/config/feature_flags.h"

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#endif

namespace kcenon::media_relay {

/**
 * @brief Log categories for the relay
 */
struct log_category {
    static constexpr std::string_view executor = "media_relay.executor";
    static constexpr std::string_view transport = "media_relay.transport";
    static constexpr std::string_view download = "media_relay.download";
    static constexpr std::string_view upload = "media_relay.upload";
    static constexpr std::string_view resume = "media_relay.resume";
    static constexpr std::string_view session = "media_relay.session";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Which parts of a log line should be masked
 *
 * Node addresses, the storage layout and node credentials can leak through
 * transfer logs. Each can be hidden independently.
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_ips = false;
    char mask_char = '*';

    /// Bearer tokens and Session header values
    bool mask_credentials = true;

    static masking_config all_masked() { return {true, true, '*', true}; }
    static masking_config none() { return {false, false, '*', false}; }
};

class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string;

    /**
     * @brief Hide the directories of a path, keep the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    /**
     * @brief Hide all but the last octet of an IPv4 address
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string;

    /**
     * @brief Replace the value after "Bearer " or "Session: "
     */
    [[nodiscard]] auto mask_credentials(const std::string& input) const -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured fields attached to a transfer log line
 */
struct transfer_log_context {
    std::string leg;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> offset;
    std::optional<uint64_t> bytes_transferred;
    std::optional<double> progress_percent;
    std::optional<std::string> error_message;
    std::optional<std::string> server_address;

    /**
     * @brief Render the set fields as one JSON object
     * @param masker Applied to the error message and server address
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string;

    [[nodiscard]] static auto escape(const std::string& input) -> std::string;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Relay logging front-end
 *
 * Writes through logger_system when it is linked in, otherwise to stderr.
 * A callback sees every accepted message before formatting.
 */
class media_relay_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    media_relay_logger();
    ~media_relay_logger();

    media_relay_logger(const media_relay_logger&) = delete;
    media_relay_logger& operator=(const media_relay_logger&) = delete;

    /**
     * @brief Attach the backend; later calls are no-ops
     */
    void initialize();
    void shutdown();

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_output_format(log_output_format format);
    void set_masking_config(masking_config config);
    void set_callback(log_callback callback);

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    [[nodiscard]] auto render(log_level level,
                              std::string_view category,
                              std::string_view message,
                              const transfer_log_context* context) const -> std::string;

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_{masking_config{}};
    mutable std::mutex config_mutex_;

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> backend_;
#endif
};

media_relay_logger& get_logger();

#define MR_LOG(level, category, message) \
    kcenon::media_relay::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MR_LOG_CTX(level, category, message, context) \
    kcenon::media_relay::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MR_LOG_TRACE(category, message) \
    MR_LOG(kcenon::media_relay::log_level::trace, category, message)

#define MR_LOG_DEBUG(category, message) \
    MR_LOG(kcenon::media_relay::log_level::debug, category, message)

#define MR_LOG_INFO(category, message) \
    MR_LOG(kcenon::media_relay::log_level::info, category, message)

#define MR_LOG_WARN(category, message) \
    MR_LOG(kcenon::media_relay::log_level::warn, category, message)

#define MR_LOG_ERROR(category, message) \
    MR_LOG(kcenon::media_relay::log_level::error, category, message)

#define MR_LOG_DEBUG_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::debug, category, message, ctx)

#define MR_LOG_INFO_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::info, category, message, ctx)

#define MR_LOG_WARN_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::warn, category, message, ctx)

#define MR_LOG_ERROR_CTX(category, message, ctx) \
    MR_LOG_CTX(kcenon::media_relay::log_level::error, category, message, ctx)

}  // namespace kcenon::media_relay
