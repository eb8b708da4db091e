/**
 * @file research_types.hpp
 * @brief Core data model shared by every stage of a research session
 *
 * A ResearchSession is owned by exactly one orchestrator run. Sources and
 * sub-queries produced in an iteration are never mutated afterwards; the
 * corpus view only ever grows.
 */

#ifndef DEEPDIVE_RESEARCH_TYPES_HPP
#define DEEPDIVE_RESEARCH_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Outcome of fetching a single candidate URL
 */
enum class FetchStatus {
    OK,              ///< Content fetched and extracted
    BLOCKED_ROBOTS,  ///< Disallowed by the host's robots.txt
    BLOCKED_URL,     ///< Rejected by the URL validator
    FETCH_ERROR,     ///< Timeout, transport error, HTTP error or unsupported content
    EMPTY            ///< Fetched but too little text survived extraction
};

inline std::string fetch_status_to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK: return "OK";
        case FetchStatus::BLOCKED_ROBOTS: return "BLOCKED_ROBOTS";
        case FetchStatus::BLOCKED_URL: return "BLOCKED_URL";
        case FetchStatus::FETCH_ERROR: return "FETCH_ERROR";
        case FetchStatus::EMPTY: return "EMPTY";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Report verbosity requested by the user
 */
enum class DetailLevel {
    CONCISE,
    STANDARD,
    DETAILED
};

inline std::string detail_level_to_string(DetailLevel level) {
    switch (level) {
        case DetailLevel::CONCISE: return "concise";
        case DetailLevel::STANDARD: return "standard";
        case DetailLevel::DETAILED: return "detailed";
        default: return "standard";
    }
}

inline DetailLevel string_to_detail_level(const std::string& value) {
    if (value == "concise") return DetailLevel::CONCISE;
    if (value == "detailed") return DetailLevel::DETAILED;
    return DetailLevel::STANDARD;
}

/**
 * @brief One search query issued on behalf of the user query
 */
struct SubQuery {
    std::string text;
    size_t origin_iteration;  ///< 1-based iteration that produced this query

    SubQuery() : origin_iteration(0) {}
    SubQuery(const std::string& text_, size_t iteration)
        : text(text_), origin_iteration(iteration) {}
};

/**
 * @brief A single retrieved (or rejected) web document
 *
 * Non-OK sources never carry extracted text; they are kept for diagnostics only.
 */
struct Source {
    std::string url;
    std::string title;
    std::string extracted_text;
    FetchStatus fetch_status;
    std::chrono::system_clock::time_point retrieved_at;
    std::string origin_subquery;
    std::string snippet;        ///< Search engine snippet, if any
    std::string error_detail;   ///< Why the source is not OK
    int http_status;            ///< Final HTTP status, 0 if no response
    size_t citation_index;      ///< 1-based corpus index, 0 when not in the corpus

    Source()
        : fetch_status(FetchStatus::FETCH_ERROR),
          retrieved_at(std::chrono::system_clock::now()),
          http_status(0),
          citation_index(0) {}

    bool is_usable() const {
        return fetch_status == FetchStatus::OK && !extracted_text.empty();
    }
};

/**
 * @brief Diagnostics for one sub-query run
 */
struct SubQueryOutcome {
    SubQuery subquery;
    size_t sources_returned;
    size_t usable_sources;
    bool degraded;              ///< Pipeline raised instead of returning sources
    std::string error_message;

    SubQueryOutcome() : sources_returned(0), usable_sources(0), degraded(false) {}
};

struct Citation {
    size_t index;
    std::string url;
    std::string title;

    Citation() : index(0) {}
    Citation(size_t index_, const std::string& url_, const std::string& title_)
        : index(index_), url(url_), title(title_) {}
};

/**
 * @brief Final research report
 */
struct Report {
    std::string summary;
    std::vector<std::string> findings;
    std::string conclusion;
    std::vector<Citation> citations;     ///< Sorted by index, only indices present in the corpus
    std::string body;                    ///< Sanitized full text as produced by the model
    bool external_sources_consulted;
    std::string notice;                  ///< e.g. "No external sources were consulted"
    std::optional<double> calculator_result;

    Report() : external_sources_consulted(false) {}
};

/**
 * @brief State of one research run
 */
struct ResearchSession {
    std::string id;
    std::string user_query;
    size_t iteration_count;
    size_t max_iterations;
    double temperature;
    DetailLevel detail_level;
    bool offline;
    std::vector<SubQuery> subqueries;        ///< Every sub-query issued so far
    std::vector<Source> sources;             ///< All sources, corpus members and rejects
    std::vector<SubQueryOutcome> outcomes;
    std::string stop_reason;
    std::optional<Report> report;

    ResearchSession()
        : iteration_count(0), max_iterations(3), temperature(0.6),
          detail_level(DetailLevel::STANDARD), offline(false) {}
};

/**
 * @brief Base exception for research pipeline errors
 */
class ResearchError : public std::runtime_error {
public:
    explicit ResearchError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a URL is refused by the validator or robots policy
 */
class ValidationRejected : public ResearchError {
public:
    explicit ValidationRejected(const std::string& message)
        : ResearchError("Rejected: " + message) {}
};

/**
 * @brief Raised when a page cannot be fetched
 */
class FetchFailed : public ResearchError {
public:
    explicit FetchFailed(const std::string& message)
        : ResearchError("Fetch failed: " + message) {}
};

/**
 * @brief Raised when extraction leaves no usable text
 */
class ExtractionEmpty : public ResearchError {
public:
    explicit ExtractionEmpty(const std::string& message)
        : ResearchError("Extraction empty: " + message) {}
};

/**
 * @brief Raised when the language model cannot be loaded or fails to generate
 */
class OracleUnavailable : public ResearchError {
public:
    explicit OracleUnavailable(const std::string& message)
        : ResearchError("Language model unavailable: " + message), detail_(message) {}

    /// Message without the "Language model unavailable" prefix
    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

/**
 * @brief Raised when the language model cannot be loaded at all
 *
 * Unlike a failed generation this is fatal to a research run.
 */
class OracleLoadFailed : public OracleUnavailable {
public:
    explicit OracleLoadFailed(const std::string& message)
        : OracleUnavailable("failed to load language model: " + message) {}
};

/**
 * @brief Raised when the wall-clock budget of a run is spent
 */
class BudgetExhausted : public ResearchError {
public:
    explicit BudgetExhausted(const std::string& message)
        : ResearchError("Budget exhausted: " + message) {}
};

/**
 * @brief Raised when configuration values are invalid
 */
class ConfigurationError : public ResearchError {
public:
    explicit ConfigurationError(const std::string& message)
        : ResearchError("Configuration error: " + message) {}
};

} // namespace deepdive

#endif // DEEPDIVE_RESEARCH_TYPES_HPP
