#include "query_planner.hpp"
#include "response_parser.hpp"
#include "session_cache.hpp"
#include <chrono>
#include <set>
#include <sstream>

namespace deepdive {

QueryPlanner::QueryPlanner(const PlannerConfig& config) : config_(config) {}

std::string QueryPlanner::build_initial_prompt(const std::string& user_query, size_t n) const {
    std::ostringstream prompt;
    prompt << "Based on the user's query, generate " << n
           << " diverse and effective search engine queries.\n"
           << "The queries should be concise and cover different aspects of the original query.\n"
           << "Return the queries as a JSON list of strings.\n\n"
           << "User Query: \"" << user_query << "\"\n\n"
           << "JSON Output:\n";
    return prompt.str();
}

std::string QueryPlanner::build_strict_prompt(const std::string& user_query, size_t n) const {
    std::ostringstream prompt;
    prompt << "Return ONLY a JSON array of " << n << " short web search queries for the topic below.\n"
           << "No explanation, no numbering, no other text.\n"
           << "Example: [\"first query\", \"second query\"]\n\n"
           << "Topic: \"" << user_query << "\"\n\n"
           << "JSON array:\n";
    return prompt.str();
}

std::string QueryPlanner::build_refinement_prompt(const std::string& user_query,
                                                  const std::string& corpus_summary,
                                                  size_t n,
                                                  const std::vector<SubQuery>& issued) const {
    std::ostringstream prompt;
    prompt << "You are researching the query: \"" << user_query << "\"\n\n"
           << "Sources found so far:\n"
           << (corpus_summary.empty() ? std::string("(none)\n") : corpus_summary) << "\n"
           << "Already searched:\n";
    for (const SubQuery& subquery : issued) {
        prompt << "- " << subquery.text << "\n";
    }
    prompt << "\nIdentify what is still missing and generate up to " << n
           << " new search engine queries that would fill the gaps. Do not repeat earlier searches.\n"
           << "If the sources already answer the query well, reply with NONE.\n"
           << "Return the queries as a JSON list of strings.\n\n"
           << "JSON Output:\n";
    return prompt.str();
}

std::optional<std::string> QueryPlanner::ask(const std::string& prompt,
                                             const std::string& purpose,
                                             const ResearchContext& ctx,
                                             PlanResult& result) const {
    Logger& logger = Logger::get_instance();
    auto start = std::chrono::steady_clock::now();
    ++result.oracle_calls;

    try {
        std::string text = SessionCache::get_instance().generate(prompt, config_.temperature, config_.max_tokens);
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        logger.log_oracle_call(ctx, purpose, prompt.size(), text.size(), elapsed, true);
        logger.debug("Planner output", {{"purpose", purpose}, {"output", text}});
        return parsing::strip_reasoning_blocks(text);
    } catch (const OracleLoadFailed&) {
        // No model at all, retrying or falling back would research blind
        throw;
    } catch (const OracleUnavailable& e) {
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        logger.log_oracle_call(ctx, purpose, prompt.size(), 0, elapsed, false);
        logger.log_warning(ctx, std::string("Query planning failed: ") + e.what());
        result.warnings.push_back(e.what());
        return std::nullopt;
    }
}

std::vector<std::string> QueryPlanner::select(const std::vector<std::string>& candidates,
                                              const std::vector<SubQuery>& issued,
                                              size_t n) const {
    std::set<std::string> seen;
    for (const SubQuery& subquery : issued) {
        seen.insert(parsing::query_key(subquery.text));
    }

    std::vector<std::string> selected;
    for (const std::string& candidate : candidates) {
        if (selected.size() >= n) {
            break;
        }
        std::string query = parsing::trim(candidate);
        if (query.size() < 2 || query.size() > config_.max_query_chars) {
            continue;
        }
        if (seen.insert(parsing::query_key(query)).second) {
            selected.push_back(query);
        }
    }
    return selected;
}

PlanResult QueryPlanner::plan_initial(const std::string& user_query,
                                      size_t n,
                                      const std::vector<SubQuery>& issued,
                                      const ResearchContext& ctx) const {
    PlanResult result;
    if (n == 0) {
        n = 1;
    }

    const std::string prompts[] = {build_initial_prompt(user_query, n), build_strict_prompt(user_query, n)};
    for (const std::string& prompt : prompts) {
        std::optional<std::string> output = ask(prompt, "plan_initial", ctx, result);
        if (!output) {
            continue;
        }

        std::vector<std::string> generated = select(parsing::parse_query_list(*output).queries, issued, n);
        if (generated.empty()) {
            continue;
        }

        std::vector<std::string> candidates;
        if (config_.include_original_query) {
            candidates.push_back(user_query);
        }
        candidates.insert(candidates.end(), generated.begin(), generated.end());
        result.queries = select(candidates, issued, n);
        return result;
    }

    result.used_fallback = true;
    result.queries = {user_query};
    Logger::get_instance().log_warning(ctx, "Query planning produced no usable queries, searching the user query");
    return result;
}

PlanResult QueryPlanner::plan_refinement(const std::string& user_query,
                                         const std::string& corpus_summary,
                                         size_t remaining_budget,
                                         const std::vector<SubQuery>& issued,
                                         const ResearchContext& ctx) const {
    PlanResult result;
    if (remaining_budget == 0) {
        return result;
    }

    std::string summary = corpus_summary.substr(0, config_.corpus_summary_chars);
    const std::string prompts[] = {
        build_refinement_prompt(user_query, summary, remaining_budget, issued),
        build_strict_prompt(user_query, remaining_budget)
    };

    for (const std::string& prompt : prompts) {
        std::optional<std::string> output = ask(prompt, "plan_refinement", ctx, result);
        if (!output) {
            continue;
        }

        parsing::QueryListParse parsed = parsing::parse_query_list(*output);
        if (parsed.explicit_none) {
            result.explicit_none = true;
            return result;
        }

        result.queries = select(parsed.queries, issued, remaining_budget);
        if (!result.queries.empty()) {
            return result;
        }
        // Only repeats of earlier searches: nothing new to look for
        if (!parsed.queries.empty()) {
            return result;
        }
    }

    result.used_fallback = true;
    return result;
}

} // namespace deepdive
