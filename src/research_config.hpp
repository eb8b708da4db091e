/**
 * @file research_config.hpp
 * @brief Configuration sections for the research engine
 *
 * Every tunable of the engine lives here with the default used when the
 * configuration file omits it. ResearchConfig::validate() rejects values the
 * engine cannot run with.
 */

#ifndef DEEPDIVE_RESEARCH_CONFIG_HPP
#define DEEPDIVE_RESEARCH_CONFIG_HPP

#include "logger.hpp"
#include "research_types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Orchestration loop budget and stopping rule
 */
struct AgentConfig {
    size_t max_iterations;          ///< Hard cap on loop iterations (>= 1)
    double temperature;             ///< Sampling temperature for synthesis
    int64_t max_wall_time_ms;       ///< Wall-clock budget for planning and retrieval, 0 = unlimited
    size_t initial_subqueries;      ///< Sub-queries requested on the first iteration
    size_t refinement_subqueries;   ///< Sub-queries requested on later iterations
    size_t coverage_min_words;      ///< Coverage threshold: words in the corpus
    size_t coverage_min_hosts;      ///< Coverage threshold: distinct hosts in the corpus
    bool calculator_shortcut;       ///< Answer pure arithmetic queries without research
    bool offline;                   ///< Skip retrieval entirely
    DetailLevel detail_level;

    AgentConfig()
        : max_iterations(3),
          temperature(0.6),
          max_wall_time_ms(300000),
          initial_subqueries(3),
          refinement_subqueries(2),
          coverage_min_words(3000),
          coverage_min_hosts(3),
          calculator_shortcut(true),
          offline(false),
          detail_level(DetailLevel::STANDARD) {}
};

struct PlannerConfig {
    double temperature;
    int max_tokens;
    bool include_original_query;    ///< Put the user query first in the initial plan
    size_t max_query_chars;         ///< Longer candidate queries are discarded
    size_t corpus_summary_chars;    ///< Size of the corpus digest passed to refinement

    PlannerConfig()
        : temperature(0.4),
          max_tokens(150),
          include_original_query(true),
          max_query_chars(200),
          corpus_summary_chars(1500) {}
};

struct SynthesisConfig {
    int max_tokens;
    size_t max_context_words;       ///< Corpus text beyond this many words is left out of the prompt
    size_t history_turns;           ///< Previous exchanges prepended as conversation context
    size_t history_answer_chars;    ///< Truncation of each previous answer
    bool summarize_long_sources;    ///< Condense long extracts with the model before synthesis
    size_t summary_threshold_words; ///< Extracts longer than this are condensed
    size_t summary_max_words;       ///< Target length of a condensed extract

    SynthesisConfig()
        : max_tokens(2048),
          max_context_words(3000),
          history_turns(3),
          history_answer_chars(600),
          summarize_long_sources(false),
          summary_threshold_words(400),
          summary_max_words(250) {}
};

struct RetrievalConfig {
    std::string search_endpoint;
    size_t top_k;                    ///< Candidates requested per sub-query
    size_t max_content_chars;        ///< Extracted text is truncated to this length
    size_t min_content_chars;        ///< Shorter extractions are EMPTY
    int request_timeout_ms;
    int retry_attempts;              ///< Extra attempts after a timeout
    int retry_backoff_ms;            ///< Linear backoff unit between attempts
    size_t max_concurrent_fetches;   ///< Global cap across all sub-queries
    int politeness_delay_ms;         ///< Minimum spacing between requests to one host
    int max_redirects;
    size_t max_body_bytes;
    bool dedupe_ignore_query;        ///< Treat URLs differing only by query as duplicates
    std::vector<std::string> user_agents;

    RetrievalConfig()
        : search_endpoint("https://html.duckduckgo.com/html/"),
          top_k(5),
          max_content_chars(2000),
          min_content_chars(100),
          request_timeout_ms(5000),
          retry_attempts(2),
          retry_backoff_ms(500),
          max_concurrent_fetches(4),
          politeness_delay_ms(1000),
          max_redirects(5),
          max_body_bytes(2 * 1024 * 1024),
          dedupe_ignore_query(true),
          user_agents({
              "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
              "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.1 Safari/605.1.15",
              "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
              "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:121.0) Gecko/20100101 Firefox/121.0",
              "Mozilla/5.0 (X11; Ubuntu; Linux x86_64; rv:121.0) Gecko/20100101 Firefox/121.0"
          }) {}
};

struct SafetyConfig {
    size_t max_url_length;
    std::vector<int> allowed_ports;
    std::vector<int> denied_ports;   ///< Always refused, even if also allowed
    std::string robots_user_agent;   ///< Product token matched against robots.txt groups
    int robots_timeout_ms;
    int robots_negative_ttl_s;       ///< How long a failed robots.txt fetch counts as "allow"
    size_t max_expression_length;
    size_t max_expression_depth;
    double max_result_magnitude;

    SafetyConfig()
        : max_url_length(2048),
          allowed_ports({80, 443}),
          robots_user_agent("DeepDive"),
          robots_timeout_ms(5000),
          robots_negative_ttl_s(300),
          max_expression_length(256),
          max_expression_depth(64),
          max_result_magnitude(1e300) {}
};

struct OracleConfig {
    std::string type;                ///< Registered oracle type, see OracleFactory
    std::string endpoint;            ///< Base URL of the model server
    std::string api_key;
    std::string model;               ///< Informational model name
    int context_size;
    int timeout_ms;
    std::vector<std::string> stop_sequences;

    OracleConfig()
        : type("llama_server"),
          endpoint("http://127.0.0.1:8080"),
          context_size(8192),
          timeout_ms(120000) {}
};

/**
 * @brief Complete engine configuration
 */
struct ResearchConfig {
    AgentConfig agent;
    PlannerConfig planner;
    SynthesisConfig synthesis;
    RetrievalConfig retrieval;
    SafetyConfig safety;
    OracleConfig oracle;
    LoggerConfig logging;

    /**
     * @brief Check value ranges
     *
     * @throws ConfigurationError describing the first invalid value
     */
    void validate() const;
};

} // namespace deepdive

#endif // DEEPDIVE_RESEARCH_CONFIG_HPP
