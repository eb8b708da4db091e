/**
 * @file logger.hpp
 * @brief Structured logging for research sessions with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (session ID, iteration, phase)
 * - Thread-safe emission from concurrent fetch workers
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef DEEPDIVE_LOGGER_HPP
#define DEEPDIVE_LOGGER_HPP

#include "research_types.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (prompts, per-request details)
    INFO,    ///< Informational messages (phase changes, iteration summaries)
    WARN,    ///< Warning messages (degraded sub-queries, fallbacks)
    ERROR    ///< Error messages (failures, exceptions)
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Session context attached to every event
 */
struct ResearchContext {
    std::string session_id;
    size_t iteration;
    std::string phase;

    ResearchContext() : session_id(""), iteration(0), phase("") {}

    explicit ResearchContext(const std::string& id)
        : session_id(id), iteration(0), phase("") {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("deepdive.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   ResearchContext ctx("a1b2c3");
 *   ctx.iteration = 1;
 *   Logger::get_instance().log_phase_transition(ctx, "PLANNING", "RETRIEVING");
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    void log_session_start(
        const ResearchContext& ctx,
        const std::string& user_query,
        size_t max_iterations,
        double temperature,
        bool offline
    );

    void log_phase_transition(
        const ResearchContext& ctx,
        const std::string& old_phase,
        const std::string& new_phase
    );

    void log_subqueries(
        const ResearchContext& ctx,
        const std::vector<std::string>& subqueries
    );

    /**
     * @brief Log the fate of one candidate URL
     *
     * OK sources log at INFO, rejected or failed sources at DEBUG.
     */
    void log_source_outcome(
        const ResearchContext& ctx,
        const Source& source
    );

    /**
     * @brief Log one completed language-model call
     *
     * @param purpose "plan_initial", "plan_refinement", "synthesis", ...
     */
    void log_oracle_call(
        const ResearchContext& ctx,
        const std::string& purpose,
        size_t prompt_chars,
        size_t response_chars,
        double duration_ms,
        bool success
    );

    void log_iteration_complete(
        const ResearchContext& ctx,
        size_t new_usable_sources,
        size_t total_usable_sources,
        size_t total_words,
        size_t distinct_hosts
    );

    void log_session_complete(
        const ResearchContext& ctx,
        bool success,
        const std::string& stop_reason,
        size_t citation_count,
        double total_time_ms
    );

    void log_error(
        const ResearchContext& ctx,
        const std::string& error_message
    );

    void log_warning(
        const ResearchContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log a free-form message with extra fields
     *
     * Values of fields whose key contains "key", "token" or "secret" are masked.
     */
    void info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void debug(const std::string& message, const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    static std::string mask_secret(const std::string& secret);

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void add_context(std::map<std::string, std::string>& fields, const ResearchContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace deepdive

#endif // DEEPDIVE_LOGGER_HPP
