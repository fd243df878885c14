// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::chunked_upload {

/**
 * @brief Log categories, one per component
 */
struct log_category {
    static constexpr std::string_view client = "chunked_upload.client";
    static constexpr std::string_view scheduler = "chunked_upload.scheduler";
    static constexpr std::string_view retry = "chunked_upload.retry";
    static constexpr std::string_view server = "chunked_upload.server";
    static constexpr std::string_view registry = "chunked_upload.registry";
    static constexpr std::string_view receiver = "chunked_upload.receiver";
    static constexpr std::string_view assembler = "chunked_upload.assembler";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

}  // namespace detail

/**
 * @brief Hides the directory part of storage paths in log output
 *
 * Upload roots tend to reveal host layout, so deployments can turn this on
 * to keep only the final path component.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(bool mask_paths = false, char mask_char = '*')
        : mask_paths_(mask_paths), mask_char_(mask_char) {}

    [[nodiscard]] auto enabled() const -> bool { return mask_paths_; }

    [[nodiscard]] auto mask_path(std::string_view path) const -> std::string {
        if (!mask_paths_ || path.empty()) {
            return std::string(path);
        }
        auto sep = path.find_last_of("/\\");
        if (sep == std::string_view::npos) {
            return std::string(path);
        }
        return std::string(sep, mask_char_) + "/" + std::string(path.substr(sep + 1));
    }

private:
    bool mask_paths_;
    char mask_char_;
};

/**
 * @brief Structured fields attached to an upload log record
 */
struct upload_log_context {
    std::string session_id;
    std::string object_name;
    std::optional<uint64_t> object_size;
    std::optional<uint64_t> bytes_sent;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<uint32_t> attempts_left;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> path;
    std::optional<std::string> error_message;

    /**
     * @brief Serialize the populated fields as a JSON object
     * @param masker Optional masker applied to the path field
     */
    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        bool first = true;
        auto key = [&](const char* name) {
            oss << (first ? "" : ",") << '"' << name << "\":";
            first = false;
        };
        auto str = [&](const char* name, std::string_view v) {
            key(name);
            oss << '"' << detail::escape_json(v) << '"';
        };

        oss << '{';
        if (!session_id.empty()) str("session_id", session_id);
        if (!object_name.empty()) str("object_name", object_name);
        if (object_size) { key("object_size"); oss << *object_size; }
        if (bytes_sent) { key("bytes_sent"); oss << *bytes_sent; }
        if (chunk_index) { key("chunk_index"); oss << *chunk_index; }
        if (total_chunks) { key("total_chunks"); oss << *total_chunks; }
        if (attempts_left) { key("attempts_left"); oss << *attempts_left; }
        oss << std::fixed << std::setprecision(2);
        if (progress_percent) { key("progress_percent"); oss << *progress_percent; }
        if (rate_mbps) { key("rate_mbps"); oss << *rate_mbps; }
        if (duration_ms) { key("duration_ms"); oss << *duration_ms; }
        if (path) str("path", masker ? masker->mask_path(*path) : *path);
        if (error_message) str("error_message", *error_message);
        oss << '}';
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

class upload_logger;

upload_logger& get_logger();

/**
 * @brief Process-wide logger for the upload components
 *
 * Records go to logger_system when the library is built with it, and to
 * stderr otherwise. A callback can observe every record that passes the
 * level filter, which tests use to capture output.
 */
class upload_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const upload_log_context*)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Create the backend; repeated calls are no-ops
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_backend_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            backend_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (backend_) {
            backend_->set_min_level(to_backend_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return format_;
    }

    void enable_path_masking(bool enable = true) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_ = sensitive_info_masker(enable);
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Emit one record
     *
     * @param level Severity
     * @param category One of the log_category values
     * @param message Human-readable message
     * @param context Structured fields, may be null
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = format_;
            masker = masker_;
        }

        std::string record = format == log_output_format::json
            ? format_json(level, category, message, context, file, line, function, masker)
            : format_text(category, message, context, masker);

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (backend_) {
                if (file && line > 0 && function) {
                    backend_->log(to_backend_level(level), record, file, line, function);
                } else {
                    backend_->log(to_backend_level(level), record);
                }
                return;
            }
        }
#endif
        write_stderr(timestamp() + " [" + std::string(log_level_to_string(level)) + "] " +
                     record);
    }

    void flush() {
#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (backend_) {
            backend_->flush();
        }
#endif
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::string out = "[" + std::string(category) + "] " + std::string(message);
        if (context) {
            out += " " + context->to_json(&masker);
        }
        return out;
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const upload_log_context* context,
                            const char* file,
                            int line,
                            const char* function,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"level\":\"" << log_level_to_string(level) << '"'
            << ",\"category\":\"" << category << '"'
            << ",\"message\":\"" << detail::escape_json(message) << '"';
        if (context) {
            auto fields = context->to_json(&masker);
            if (fields.size() > 2) {
                oss << ',' << fields.substr(1, fields.size() - 2);
            }
        }
        if (file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(masker.mask_path(file))
                << "\",\"line\":" << line;
            if (function) {
                oss << ",\"function\":\"" << function << '"';
            }
            oss << '}';
        }
        oss << '}';
        return oss.str();
    }

    static void write_stderr(const std::string& line) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << '\n';
    }

    static auto timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &seconds);
#else
        localtime_r(&seconds, &tm_buf);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> backend_;
    std::mutex backend_mutex_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define CU_LOG(level, category, message) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_CTX(level, category, message, context) \
    kcenon::chunked_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CU_LOG_TRACE(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::trace, category, message)

#define CU_LOG_DEBUG(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::debug, category, message)

#define CU_LOG_INFO(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::info, category, message)

#define CU_LOG_WARN(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::warn, category, message)

#define CU_LOG_ERROR(category, message) \
    CU_LOG(kcenon::chunked_upload::log_level::error, category, message)

#define CU_LOG_DEBUG_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::debug, category, message, ctx)

#define CU_LOG_INFO_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::info, category, message, ctx)

#define CU_LOG_WARN_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::warn, category, message, ctx)

#define CU_LOG_ERROR_CTX(category, message, ctx) \
    CU_LOG_CTX(kcenon::chunked_upload::log_level::error, category, message, ctx)

}  // namespace kcenon::chunked_upload
