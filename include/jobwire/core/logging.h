// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "jobwire/config/feature_flags.h"

#if JOBWIRE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace jobwire {

/**
 * @brief Log categories for jobwire
 */
struct log_category {
    static constexpr std::string_view client = "jobwire.client";
    static constexpr std::string_view api = "jobwire.api";
    static constexpr std::string_view stream = "jobwire.stream";
    static constexpr std::string_view channel = "jobwire.channel";
    static constexpr std::string_view storage = "jobwire.storage";
    static constexpr std::string_view poller = "jobwire.poller";
};

/**
 * @brief Log levels for jobwire
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

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_credentials = false;   ///< Bearer tokens and "credential" fields
    bool mask_signed_urls = false;   ///< Query strings of pre-signed locator URLs
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Utility class for masking sensitive information in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_credentials && !config_.mask_signed_urls) {
            return input;
        }

        std::string result = input;

        if (config_.mask_credentials) {
            result = mask_credentials(result);
        }

        if (config_.mask_signed_urls) {
            result = mask_url_queries(result);
        }

        return result;
    }

    /**
     * @brief Mask a secret, keeping the first visible_chars characters
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Strip the query string of a URL
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_signed_urls) {
            return url;
        }
        auto query = url.find('?');
        if (query == std::string::npos) {
            return url;
        }
        return url.substr(0, query + 1) + std::string(3, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_credentials(const std::string& input) const -> std::string {
        static const std::regex bearer_pattern(R"((Bearer\s+)([A-Za-z0-9._~+/=-]+))");
        static const std::regex field_pattern(R"(("credential"\s*:\s*")([^"]*)("))");

        std::string result;
        {
            std::sregex_iterator it(input.begin(), input.end(), bearer_pattern);
            std::sregex_iterator end;
            size_t last_pos = 0;
            for (; it != end; ++it) {
                result += input.substr(last_pos, it->position() - last_pos);
                result += (*it)[1].str() + mask_secret((*it)[2].str());
                last_pos = it->position() + it->length();
            }
            result += input.substr(last_pos);
        }

        std::string output;
        std::sregex_iterator it(result.begin(), result.end(), field_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            output += result.substr(last_pos, it->position() - last_pos);
            output += (*it)[1].str() + mask_secret((*it)[2].str()) + (*it)[3].str();
            last_pos = it->position() + it->length();
        }
        output += result.substr(last_pos);
        return output;
    }

    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"((https?|wss?)://[^\s"']+)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_url(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

/**
 * @brief Escape a string for embedding in a JSON document
 */
[[nodiscard]] inline auto escape_json_string(const std::string& input) -> std::string {
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
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief Structured log context for job operations
 */
struct job_log_context {
    std::string job_id;
    std::optional<std::string> backend;
    std::optional<std::string> status;
    std::optional<std::string> endpoint;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!job_id.empty()) add_field("job_id", job_id);
        if (backend) add_field("backend", *backend);
        if (status) add_field("status", *status);
        if (endpoint) add_field("endpoint", masker ? masker->mask_url(*endpoint) : *endpoint);
        if (attempt) add_uint("attempt", *attempt);
        if (bytes) add_uint("bytes", *bytes);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", masker ? masker->mask(*error_message) : *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<job_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << escape_json_string(*source_file) << "\"";
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
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::stream)
 *     .with_message("Job reached terminal status")
 *     .with_job_id("5d2f...")
 *     .with_status("COMPLETED")
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_job_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->job_id = std::string(id);
        return *this;
    }

    auto with_status(std::string_view status) -> log_entry_builder& {
        ensure_context();
        entry_.context->status = std::string(status);
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const job_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = job_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
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

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief jobwire logging interface
 */
class jobwire_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const job_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    jobwire_logger() = default;
    ~jobwire_logger() = default;

    jobwire_logger(const jobwire_logger&) = delete;
    jobwire_logger& operator=(const jobwire_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     * Called when a job_client is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if JOBWIRE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if JOBWIRE_USE_LOGGER_SYSTEM
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
#if JOBWIRE_USE_LOGGER_SYSTEM
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Enable masking of credentials and signed URLs
     */
    void enable_masking(bool enable = true) {
        set_masking_config(enable ? masking_config::all_masked() : masking_config::none());
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const job_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            log_json(level, category, message, context, file, line, function, current_masker);
        } else {
            log_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    void flush() {
#if JOBWIRE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const job_log_context* context,
                  const char* file,
                  int line,
                  const char* function,
                  const sensitive_info_masker& masker) {

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);

        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }

        if (context) {
            builder.with_context(*context);
        }

        auto entry = builder.build();
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if JOBWIRE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
        }
#else
        output_to_stderr(json_str);
#endif
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const job_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function,
                  const sensitive_info_masker& masker) {

#if JOBWIRE_USE_LOGGER_SYSTEM
        if (logger_) {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
        }
#else
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

        output_to_stderr(oss.str());
#endif
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if JOBWIRE_USE_LOGGER_SYSTEM
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

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline jobwire_logger& get_logger() {
    static jobwire_logger instance;
    return instance;
}

#define JW_LOG(level, category, message) \
    jobwire::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define JW_LOG_CTX(level, category, message, context) \
    jobwire::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define JW_LOG_TRACE(category, message) \
    JW_LOG(jobwire::log_level::trace, category, message)

#define JW_LOG_DEBUG(category, message) \
    JW_LOG(jobwire::log_level::debug, category, message)

#define JW_LOG_INFO(category, message) \
    JW_LOG(jobwire::log_level::info, category, message)

#define JW_LOG_WARN(category, message) \
    JW_LOG(jobwire::log_level::warn, category, message)

#define JW_LOG_ERROR(category, message) \
    JW_LOG(jobwire::log_level::error, category, message)

#define JW_LOG_DEBUG_CTX(category, message, ctx) \
    JW_LOG_CTX(jobwire::log_level::debug, category, message, ctx)

#define JW_LOG_INFO_CTX(category, message, ctx) \
    JW_LOG_CTX(jobwire::log_level::info, category, message, ctx)

#define JW_LOG_WARN_CTX(category, message, ctx) \
    JW_LOG_CTX(jobwire::log_level::warn, category, message, ctx)

#define JW_LOG_ERROR_CTX(category, message, ctx) \
    JW_LOG_CTX(jobwire::log_level::error, category, message, ctx)

} // namespace jobwire
