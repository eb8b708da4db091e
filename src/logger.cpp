/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace deepdive {

namespace {

bool is_secret_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("key") != std::string::npos ||
           lower.find("token") != std::string::npos ||
           lower.find("secret") != std::string::npos;
}

std::string preview(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    return text.substr(0, max_chars) + "...";
}

} // namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_session_start(
    const ResearchContext& ctx,
    const std::string& user_query,
    size_t max_iterations,
    double temperature,
    bool offline
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "session_start";
    add_context(fields, ctx);
    fields["query"] = user_query;
    fields["max_iterations"] = std::to_string(max_iterations);
    fields["temperature"] = std::to_string(temperature);
    fields["offline"] = offline ? "true" : "false";

    log(LogLevel::INFO, "Research session started", fields);
}

void Logger::log_phase_transition(
    const ResearchContext& ctx,
    const std::string& old_phase,
    const std::string& new_phase
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "phase_transition";
    add_context(fields, ctx);
    fields["old_phase"] = old_phase;
    fields["new_phase"] = new_phase;

    log(LogLevel::DEBUG, "Phase transition", fields);
}

void Logger::log_subqueries(
    const ResearchContext& ctx,
    const std::vector<std::string>& subqueries
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "subqueries_planned";
    add_context(fields, ctx);
    fields["count"] = std::to_string(subqueries.size());
    for (size_t i = 0; i < subqueries.size(); ++i) {
        fields["subquery_" + std::to_string(i)] = subqueries[i];
    }

    log(LogLevel::INFO, "Sub-queries planned", fields);
}

void Logger::log_source_outcome(
    const ResearchContext& ctx,
    const Source& source
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "source_outcome";
    add_context(fields, ctx);
    fields["url"] = source.url;
    fields["status"] = fetch_status_to_string(source.fetch_status);
    fields["subquery"] = source.origin_subquery;
    if (source.http_status != 0) {
        fields["http_status"] = std::to_string(source.http_status);
    }
    if (source.fetch_status == FetchStatus::OK) {
        fields["chars"] = std::to_string(source.extracted_text.size());
    } else if (!source.error_detail.empty()) {
        fields["detail"] = source.error_detail;
    }

    LogLevel level = source.fetch_status == FetchStatus::OK ? LogLevel::INFO : LogLevel::DEBUG;
    log(level, "Source processed", fields);
}

void Logger::log_oracle_call(
    const ResearchContext& ctx,
    const std::string& purpose,
    size_t prompt_chars,
    size_t response_chars,
    double duration_ms,
    bool success
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "oracle_call";
    add_context(fields, ctx);
    fields["purpose"] = purpose;
    fields["prompt_chars"] = std::to_string(prompt_chars);
    fields["response_chars"] = std::to_string(response_chars);
    fields["duration_ms"] = std::to_string(duration_ms);
    fields["success"] = success ? "true" : "false";

    log(success ? LogLevel::DEBUG : LogLevel::WARN, "Language model call", fields);
}

void Logger::log_iteration_complete(
    const ResearchContext& ctx,
    size_t new_usable_sources,
    size_t total_usable_sources,
    size_t total_words,
    size_t distinct_hosts
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "iteration_complete";
    add_context(fields, ctx);
    fields["new_sources"] = std::to_string(new_usable_sources);
    fields["total_sources"] = std::to_string(total_usable_sources);
    fields["total_words"] = std::to_string(total_words);
    fields["distinct_hosts"] = std::to_string(distinct_hosts);

    log(LogLevel::INFO, "Iteration complete", fields);
}

void Logger::log_session_complete(
    const ResearchContext& ctx,
    bool success,
    const std::string& stop_reason,
    size_t citation_count,
    double total_time_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "session_complete";
    add_context(fields, ctx);
    fields["success"] = success ? "true" : "false";
    fields["stop_reason"] = stop_reason;
    fields["citations"] = std::to_string(citation_count);
    fields["total_time_ms"] = std::to_string(total_time_ms);

    log(success ? LogLevel::INFO : LogLevel::ERROR, "Research session finished", fields);
}

void Logger::log_error(
    const ResearchContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Research error", fields);
}

void Logger::log_warning(
    const ResearchContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::string Logger::mask_secret(const std::string& secret) {
    if (secret.size() <= 8) {
        return "***";
    }
    // Show first 4 and last 4 characters
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

void Logger::add_context(std::map<std::string, std::string>& fields, const ResearchContext& ctx) const {
    fields["session_id"] = ctx.session_id;
    fields["iteration"] = std::to_string(ctx.iteration);
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::map<std::string, std::string> safe_fields;
    for (const auto& [key, value] : fields) {
        if (is_secret_key(key)) {
            safe_fields[key] = mask_secret(value);
        } else if (level != LogLevel::DEBUG) {
            safe_fields[key] = preview(value, 512);
        } else {
            safe_fields[key] = value;
        }
    }

    std::string output;

    if (config_.enable_json) {
        safe_fields["timestamp"] = get_timestamp();
        safe_fields["level"] = level_to_string(level);
        safe_fields["message"] = message;
        output = format_json(safe_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!safe_fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : safe_fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace deepdive
