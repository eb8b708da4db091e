#include "research_config.hpp"

namespace deepdive {

void ResearchConfig::validate() const {
    if (agent.max_iterations < 1) {
        throw ConfigurationError("agent.max_iterations must be at least 1");
    }
    if (agent.temperature < 0.0 || agent.temperature > 2.0) {
        throw ConfigurationError("agent.temperature must be within [0, 2]");
    }
    if (agent.max_wall_time_ms < 0) {
        throw ConfigurationError("agent.max_wall_time_ms must not be negative");
    }
    if (agent.initial_subqueries < 1) {
        throw ConfigurationError("agent.initial_subqueries must be at least 1");
    }

    if (planner.max_tokens <= 0) {
        throw ConfigurationError("planner.max_tokens must be positive");
    }
    if (synthesis.max_tokens <= 0) {
        throw ConfigurationError("synthesis.max_tokens must be positive");
    }
    if (synthesis.summarize_long_sources && synthesis.summary_max_words == 0) {
        throw ConfigurationError("synthesis.summary_max_words must be positive");
    }

    if (retrieval.top_k < 1) {
        throw ConfigurationError("retrieval.top_k must be at least 1");
    }
    if (retrieval.min_content_chars > retrieval.max_content_chars) {
        throw ConfigurationError("retrieval.min_content_chars exceeds retrieval.max_content_chars");
    }
    if (retrieval.request_timeout_ms <= 0) {
        throw ConfigurationError("retrieval.request_timeout_ms must be positive");
    }
    if (retrieval.retry_attempts < 0 || retrieval.max_redirects < 0 ||
        retrieval.politeness_delay_ms < 0 || retrieval.retry_backoff_ms < 0) {
        throw ConfigurationError("retrieval retry, redirect and delay settings must not be negative");
    }
    if (retrieval.max_concurrent_fetches < 1) {
        throw ConfigurationError("retrieval.max_concurrent_fetches must be at least 1");
    }
    if (retrieval.user_agents.empty()) {
        throw ConfigurationError("retrieval.user_agents must contain at least one entry");
    }

    if (safety.allowed_ports.empty()) {
        throw ConfigurationError("safety.allowed_ports must contain at least one port");
    }
    for (int port : safety.allowed_ports) {
        if (port < 1 || port > 65535) {
            throw ConfigurationError("safety.allowed_ports contains invalid port " + std::to_string(port));
        }
    }
    if (safety.robots_user_agent.empty()) {
        throw ConfigurationError("safety.robots_user_agent must not be empty");
    }
    if (safety.max_url_length < 16) {
        throw ConfigurationError("safety.max_url_length is too small");
    }

    if (oracle.type.empty()) {
        throw ConfigurationError("oracle.type must not be empty");
    }
    if (oracle.timeout_ms <= 0) {
        throw ConfigurationError("oracle.timeout_ms must be positive");
    }
}

} // namespace deepdive
