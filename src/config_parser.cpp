#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace deepdive {

namespace {

void read_string(const json& section, const char* key, std::string& target) {
    if (section.contains(key)) {
        target = expand_environment_variables(section[key].get<std::string>());
    }
}

void read_bool(const json& section, const char* key, bool& target) {
    if (section.contains(key)) {
        target = section[key].get<bool>();
    }
}

void read_double(const json& section, const char* key, double& target) {
    if (section.contains(key)) {
        target = section[key].get<double>();
    }
}

void read_int(const json& section, const char* key, int& target) {
    if (section.contains(key)) {
        target = section[key].get<int>();
    }
}

void read_int64(const json& section, const char* key, int64_t& target) {
    if (section.contains(key)) {
        target = section[key].get<int64_t>();
    }
}

// Counts must be non-negative integers; a negative value would wrap in size_t
void read_count(const json& section, const char* key, size_t& target) {
    if (!section.contains(key)) {
        return;
    }
    const json& value = section[key];
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ConfigParseError(std::string("Field '") + key + "' must be a non-negative integer");
    }
    target = value.get<size_t>();
}

void read_string_list(const json& section, const char* key, std::vector<std::string>& target) {
    if (section.contains(key)) {
        target.clear();
        for (const auto& item : section[key]) {
            target.push_back(expand_environment_variables(item.get<std::string>()));
        }
    }
}

void read_int_list(const json& section, const char* key, std::vector<int>& target) {
    if (section.contains(key)) {
        target.clear();
        for (const auto& item : section[key]) {
            target.push_back(item.get<int>());
        }
    }
}

void parse_agent(const json& j, AgentConfig& agent) {
    read_count(j, "max_iterations", agent.max_iterations);
    read_double(j, "temperature", agent.temperature);
    read_int64(j, "max_wall_time_ms", agent.max_wall_time_ms);
    read_count(j, "initial_subqueries", agent.initial_subqueries);
    read_count(j, "refinement_subqueries", agent.refinement_subqueries);
    read_count(j, "coverage_min_words", agent.coverage_min_words);
    read_count(j, "coverage_min_hosts", agent.coverage_min_hosts);
    read_bool(j, "calculator_shortcut", agent.calculator_shortcut);
    read_bool(j, "offline", agent.offline);
    if (j.contains("detail_level")) {
        std::string level = j["detail_level"].get<std::string>();
        if (level != "concise" && level != "standard" && level != "detailed") {
            throw ConfigParseError("Unknown detail_level: " + level);
        }
        agent.detail_level = string_to_detail_level(level);
    }
}

void parse_planner(const json& j, PlannerConfig& planner) {
    read_double(j, "temperature", planner.temperature);
    read_int(j, "max_tokens", planner.max_tokens);
    read_bool(j, "include_original_query", planner.include_original_query);
    read_count(j, "max_query_chars", planner.max_query_chars);
    read_count(j, "corpus_summary_chars", planner.corpus_summary_chars);
}

void parse_synthesis(const json& j, SynthesisConfig& synthesis) {
    read_int(j, "max_tokens", synthesis.max_tokens);
    read_count(j, "max_context_words", synthesis.max_context_words);
    read_count(j, "history_turns", synthesis.history_turns);
    read_count(j, "history_answer_chars", synthesis.history_answer_chars);
    read_bool(j, "summarize_long_sources", synthesis.summarize_long_sources);
    read_count(j, "summary_threshold_words", synthesis.summary_threshold_words);
    read_count(j, "summary_max_words", synthesis.summary_max_words);
}

void parse_retrieval(const json& j, RetrievalConfig& retrieval) {
    read_string(j, "search_endpoint", retrieval.search_endpoint);
    read_count(j, "top_k", retrieval.top_k);
    read_count(j, "max_content_chars", retrieval.max_content_chars);
    read_count(j, "min_content_chars", retrieval.min_content_chars);
    read_int(j, "request_timeout_ms", retrieval.request_timeout_ms);
    read_int(j, "retry_attempts", retrieval.retry_attempts);
    read_int(j, "retry_backoff_ms", retrieval.retry_backoff_ms);
    read_count(j, "max_concurrent_fetches", retrieval.max_concurrent_fetches);
    read_int(j, "politeness_delay_ms", retrieval.politeness_delay_ms);
    read_int(j, "max_redirects", retrieval.max_redirects);
    read_count(j, "max_body_bytes", retrieval.max_body_bytes);
    read_bool(j, "dedupe_ignore_query", retrieval.dedupe_ignore_query);
    read_string_list(j, "user_agents", retrieval.user_agents);
}

void parse_safety(const json& j, SafetyConfig& safety) {
    read_count(j, "max_url_length", safety.max_url_length);
    read_int_list(j, "allowed_ports", safety.allowed_ports);
    read_int_list(j, "denied_ports", safety.denied_ports);
    read_string(j, "robots_user_agent", safety.robots_user_agent);
    read_int(j, "robots_timeout_ms", safety.robots_timeout_ms);
    read_int(j, "robots_negative_ttl_s", safety.robots_negative_ttl_s);
    read_count(j, "max_expression_length", safety.max_expression_length);
    read_count(j, "max_expression_depth", safety.max_expression_depth);
    read_double(j, "max_result_magnitude", safety.max_result_magnitude);
}

void parse_oracle(const json& j, OracleConfig& oracle) {
    read_string(j, "type", oracle.type);
    read_string(j, "endpoint", oracle.endpoint);
    read_string(j, "api_key", oracle.api_key);
    read_string(j, "model", oracle.model);
    read_int(j, "context_size", oracle.context_size);
    read_int(j, "timeout_ms", oracle.timeout_ms);
    read_string_list(j, "stop", oracle.stop_sequences);
}

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("Unknown log level: " + level);
        }
        logging.min_level = string_to_level(level);
    }
    read_bool(j, "console", logging.enable_console);
    read_bool(j, "json", logging.enable_json);
    if (j.contains("file")) {
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
        logging.enable_file = !logging.log_file_path.empty();
    }
}

} // namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference is kept literally
                continue;
            }
            pos++;
        }

        if (name_end == name_start) {
            // Lone '$' is not a reference
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

void apply_environment_overrides(ResearchConfig& config) {
    const char* url = std::getenv("DEEPDIVE_ORACLE_URL");
    if (url && *url) {
        config.oracle.endpoint = url;
    }
    const char* key = std::getenv("DEEPDIVE_ORACLE_API_KEY");
    if (key && *key) {
        config.oracle.api_key = key;
    }
}

ResearchConfig parse_research_config_from_string(const std::string& json_string) {
    ResearchConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be a JSON object");
        }

        if (j.contains("agent")) parse_agent(j["agent"], config.agent);
        if (j.contains("planner")) parse_planner(j["planner"], config.planner);
        if (j.contains("synthesis")) parse_synthesis(j["synthesis"], config.synthesis);
        if (j.contains("retrieval")) parse_retrieval(j["retrieval"], config.retrieval);
        if (j.contains("safety")) parse_safety(j["safety"], config.safety);
        if (j.contains("oracle")) parse_oracle(j["oracle"], config.oracle);
        if (j.contains("logging")) parse_logging(j["logging"], config.logging);

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON value out of range: ") + e.what());
    }

    config.validate();
    return config;
}

ResearchConfig parse_research_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ResearchConfig config = parse_research_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace deepdive
