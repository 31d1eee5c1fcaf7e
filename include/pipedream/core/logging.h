/**
 * @file logging.h
 * @brief Structured logging for upload, part and session activity
 * @version 0.1.0
 */

#ifndef PIPEDREAM_CORE_LOGGING_H
#define PIPEDREAM_CORE_LOGGING_H

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

#if PIPEDREAM_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace pipedream {

/**
 * @brief Log categories for pipedream
 */
struct log_category {
    static constexpr std::string_view upload = "pipedream.upload";
    static constexpr std::string_view chunk = "pipedream.chunk";
    static constexpr std::string_view part = "pipedream.part";
    static constexpr std::string_view session = "pipedream.session";
    static constexpr std::string_view backend = "pipedream.backend";
};

/**
 * @brief Log levels for pipedream
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
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

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
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

}  // namespace detail

/**
 * @brief Structured log context for a multipart upload
 *
 * Credentials never belong here.
 */
struct upload_log_context {
    std::string upload_id;
    std::string key;
    std::optional<int> part_number;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> total_bytes;
    std::optional<int> attempt;
    std::optional<int> max_attempts;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!upload_id.empty()) add_field("upload_id", upload_id);
        if (!key.empty()) add_field("key", key);
        if (part_number) add_int("part_number", *part_number);
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (total_bytes) add_int("total_bytes", static_cast<int64_t>(*total_bytes));
        if (attempt) add_int("attempt", *attempt);
        if (max_attempts) add_int("max_attempts", *max_attempts);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Logging front end shared by every pipedream component
 *
 * Routes to kcenon::logger when logger_system is integrated, and to
 * stderr otherwise. A callback can be installed to observe entries.
 */
class pipedream_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;

    pipedream_logger() = default;
    ~pipedream_logger() = default;

    pipedream_logger(const pipedream_logger&) = delete;
    pipedream_logger& operator=(const pipedream_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if PIPEDREAM_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if PIPEDREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if PIPEDREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Install a callback invoked for every enabled entry
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Silence stderr output (the callback still fires)
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

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

        if (get_output_format() == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            emit(level, entry.to_json(), file, line, function);
            return;
        }

        std::ostringstream oss;
#if !PIPEDREAM_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        emit(level, oss.str(), file, line, function);
    }

    void flush() {
#if PIPEDREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              const std::string& text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if PIPEDREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#else
        (void)level;
#endif
        if (console_output_.load()) {
            output_to_stderr(text);
        }
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if PIPEDREAM_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
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

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline pipedream_logger& get_logger() {
    static pipedream_logger instance;
    return instance;
}

// Logging macros for convenience
#define PD_LOG(level, category, message) \
    pipedream::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define PD_LOG_CTX(level, category, message, context) \
    pipedream::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define PD_LOG_TRACE(category, message) \
    PD_LOG(pipedream::log_level::trace, category, message)

#define PD_LOG_DEBUG(category, message) \
    PD_LOG(pipedream::log_level::debug, category, message)

#define PD_LOG_INFO(category, message) \
    PD_LOG(pipedream::log_level::info, category, message)

#define PD_LOG_WARN(category, message) \
    PD_LOG(pipedream::log_level::warn, category, message)

#define PD_LOG_ERROR(category, message) \
    PD_LOG(pipedream::log_level::error, category, message)

#define PD_LOG_FATAL(category, message) \
    PD_LOG(pipedream::log_level::fatal, category, message)

#define PD_LOG_DEBUG_CTX(category, message, ctx) \
    PD_LOG_CTX(pipedream::log_level::debug, category, message, ctx)

#define PD_LOG_INFO_CTX(category, message, ctx) \
    PD_LOG_CTX(pipedream::log_level::info, category, message, ctx)

#define PD_LOG_WARN_CTX(category, message, ctx) \
    PD_LOG_CTX(pipedream::log_level::warn, category, message, ctx)

#define PD_LOG_ERROR_CTX(category, message, ctx) \
    PD_LOG_CTX(pipedream::log_level::error, category, message, ctx)

}  // namespace pipedream

#endif  // PIPEDREAM_CORE_LOGGING_H
