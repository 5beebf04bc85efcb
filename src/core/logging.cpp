// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "kcenon/media_relay/core/logging.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::media_relay {

namespace {

const std::regex& ipv4_pattern() {
    static const std::regex pattern(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");
    return pattern;
}

const std::regex& absolute_path_pattern() {
    static const std::regex pattern(R"((?:/[A-Za-z0-9._-]+)+)");
    return pattern;
}

const std::regex& credential_pattern() {
    static const std::regex pattern(R"((Bearer\s+|Session:\s*)([^\s,"]+))");
    return pattern;
}

/**
 * @brief Rewrite every match of pattern with fn(match)
 */
template <typename Fn>
auto rewrite_matches(const std::string& input, const std::regex& pattern, Fn fn) -> std::string {
    std::string output;
    output.reserve(input.size());
    auto tail = input.cbegin();
    for (std::sregex_iterator it(input.cbegin(), input.cend(), pattern), end; it != end; ++it) {
        const auto& match = *it;
        output.append(tail, match[0].first);
        output += fn(match);
        tail = match[0].second;
    }
    output.append(tail, input.cend());
    return output;
}

auto local_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm parts{};
#if defined(_WIN32)
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count();
    return oss.str();
}

void write_stderr(const std::string& text) {
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << text << '\n';
}

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
auto to_backend_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
    }
    return kcenon::logger::log_level::info;
}
#endif

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// ============================================================================
// sensitive_info_masker
// ============================================================================

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    std::string output = mask_credentials(input);
    if (config_.mask_ips) {
        output = rewrite_matches(output, ipv4_pattern(),
                                 [this](const std::smatch& m) { return mask_ip(m.str()); });
    }
    if (config_.mask_paths) {
        output = rewrite_matches(output, absolute_path_pattern(),
                                 [this](const std::smatch& m) { return mask_path(m.str()); });
    }
    return output;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths || path.empty()) {
        return path;
    }
    const auto separator = path.find_last_of("/\\");
    if (separator == std::string::npos) {
        return path;
    }
    return std::string(separator, config_.mask_char) + "/" + path.substr(separator + 1);
}

auto sensitive_info_masker::mask_ip(const std::string& ip) const -> std::string {
    if (!config_.mask_ips || ip.empty()) {
        return ip;
    }
    const auto dot = ip.find_last_of('.');
    if (dot == std::string::npos) {
        return std::string(ip.size(), config_.mask_char);
    }
    return std::string(dot, config_.mask_char) + ip.substr(dot);
}

auto sensitive_info_masker::mask_credentials(const std::string& input) const -> std::string {
    if (!config_.mask_credentials || input.empty()) {
        return input;
    }
    return rewrite_matches(input, credential_pattern(), [this](const std::smatch& m) {
        return m[1].str() + std::string(m[2].length(), config_.mask_char);
    });
}

// ============================================================================
// transfer_log_context
// ============================================================================

auto transfer_log_context::to_json(const sensitive_info_masker* masker) const -> std::string {
    std::ostringstream oss;
    const char* separator = "";
    auto key = [&](const char* name) -> std::ostringstream& {
        oss << separator << '"' << name << "\":";
        separator = ",";
        return oss;
    };

    oss << '{';
    if (!leg.empty()) {
        key("leg") << '"' << escape(leg) << '"';
    }
    if (!filename.empty()) {
        key("filename") << '"' << escape(filename) << '"';
    }
    if (file_size) {
        key("size") << *file_size;
    }
    if (offset) {
        key("offset") << *offset;
    }
    if (bytes_transferred) {
        key("bytes_transferred") << *bytes_transferred;
    }
    if (progress_percent) {
        key("progress_percent") << std::fixed << std::setprecision(2) << *progress_percent;
    }
    if (error_message) {
        key("error_message") << '"'
            << escape(masker != nullptr ? masker->mask(*error_message) : *error_message) << '"';
    }
    if (server_address) {
        key("server_address") << '"'
            << escape(masker != nullptr ? masker->mask_ip(*server_address) : *server_address)
            << '"';
    }
    oss << '}';
    return oss.str();
}

auto transfer_log_context::escape(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

// ============================================================================
// media_relay_logger
// ============================================================================

media_relay_logger::media_relay_logger() = default;

media_relay_logger::~media_relay_logger() {
    shutdown();
}

void media_relay_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
        .with_async(true)
        .with_min_level(to_backend_level(min_level_.load()))
        .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
        .build();
    if (built) {
        backend_ = std::move(built.value());
    } else {
        write_stderr("[media_relay] logger_system unavailable, logging to stderr");
    }
#endif
}

void media_relay_logger::shutdown() {
#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    if (backend_) {
        backend_->flush();
        backend_->stop();
        backend_.reset();
    }
#endif
    initialized_ = false;
}

void media_relay_logger::set_level(log_level level) {
    min_level_.store(level);
#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    if (backend_) {
        backend_->set_min_level(to_backend_level(level));
    }
#endif
}

void media_relay_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

void media_relay_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(config);
}

void media_relay_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void media_relay_logger::log(log_level level,
                             std::string_view category,
                             std::string_view message,
                             const transfer_log_context* context,
                             [[maybe_unused]] const char* file,
                             [[maybe_unused]] int line,
                             [[maybe_unused]] const char* function) {
    if (!is_enabled(level)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(level, category, message, context);
        }
    }

    auto text = render(level, category, message, context);

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    if (backend_) {
        if (file != nullptr && line > 0 && function != nullptr) {
            backend_->log(to_backend_level(level), text, file, line, function);
        } else {
            backend_->log(to_backend_level(level), text);
        }
        return;
    }
#endif
    write_stderr(text);
}

void media_relay_logger::flush() {
#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    if (backend_) {
        backend_->flush();
    }
#endif
}

auto media_relay_logger::render(log_level level,
                                std::string_view category,
                                std::string_view message,
                                const transfer_log_context* context) const -> std::string {
    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        masker = masker_;
    }

    const auto masked = masker.mask(std::string(message));
    std::ostringstream oss;

    if (format == log_output_format::json) {
        oss << "{\"timestamp\":\"" << local_timestamp() << "\",\"level\":\""
            << log_level_to_string(level) << "\",\"category\":\"" << category
            << "\",\"message\":\"" << transfer_log_context::escape(masked) << '"';
        if (context != nullptr) {
            auto fields = context->to_json(&masker);
            if (fields.size() > 2) {
                oss << ',' << fields.substr(1, fields.size() - 2);
            }
        }
        oss << '}';
        return oss.str();
    }

#if MEDIA_RELAY_USE_LOGGER_SYSTEM
    // logger_system stamps time and level itself
    if (!backend_) {
        oss << local_timestamp() << " [" << log_level_to_string(level) << "] ";
    }
#else
    oss << local_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
    oss << '[' << category << "] " << masked;
    if (context != nullptr) {
        oss << ' ' << context->to_json(&masker);
    }
    return oss.str();
}

media_relay_logger& get_logger() {
    static media_relay_logger instance;
    return instance;
}

}  // namespace kcenon::media_relay
