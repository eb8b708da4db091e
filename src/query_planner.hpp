/**
 * @file query_planner.hpp
 * @brief Decomposes the user query into search sub-queries
 */

#ifndef DEEPDIVE_QUERY_PLANNER_HPP
#define DEEPDIVE_QUERY_PLANNER_HPP

#include "logger.hpp"
#include "research_config.hpp"
#include "research_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Planner output with diagnostics
 */
struct PlanResult {
    std::vector<std::string> queries;   ///< New, distinct queries in priority order
    bool used_fallback;                 ///< Model output was unusable twice
    bool explicit_none;                 ///< Model said there is nothing left to search
    size_t oracle_calls;
    std::vector<std::string> warnings;

    PlanResult() : used_fallback(false), explicit_none(false), oracle_calls(0) {}
};

/**
 * @brief Query planner backed by the shared language model
 *
 * Every plan is one oracle call, plus at most one retry with a stricter
 * instruction when the answer cannot be parsed or the oracle fails. Returned
 * queries never repeat one already issued in the session (compared case- and
 * whitespace-insensitively).
 *
 * Usage Example:
 *   @code
 *   QueryPlanner planner(config.planner);
 *   PlanResult plan = planner.plan_initial("history of the printing press", 3, {}, ctx);
 *   @endcode
 */
class QueryPlanner {
public:
    explicit QueryPlanner(const PlannerConfig& config = PlannerConfig());

    /**
     * @brief First decomposition of the user query
     *
     * Never returns an empty plan: falls back to the user query verbatim when
     * generation fails or yields nothing usable.
     *
     * @param n Maximum number of queries
     * @param issued Sub-queries already issued in this session
     * @throws OracleLoadFailed If the model cannot be loaded
     */
    PlanResult plan_initial(const std::string& user_query,
                            size_t n,
                            const std::vector<SubQuery>& issued,
                            const ResearchContext& ctx) const;

    /**
     * @brief Follow-up queries given what has been found so far
     *
     * An empty plan means the model considers the query covered.
     *
     * @param corpus_summary Digest from ContextAggregator::corpus_summary
     * @param remaining_budget Maximum number of queries to return
     */
    PlanResult plan_refinement(const std::string& user_query,
                               const std::string& corpus_summary,
                               size_t remaining_budget,
                               const std::vector<SubQuery>& issued,
                               const ResearchContext& ctx) const;

    std::string build_initial_prompt(const std::string& user_query, size_t n) const;
    std::string build_strict_prompt(const std::string& user_query, size_t n) const;
    std::string build_refinement_prompt(const std::string& user_query,
                                        const std::string& corpus_summary,
                                        size_t n,
                                        const std::vector<SubQuery>& issued) const;

private:
    PlannerConfig config_;

    std::optional<std::string> ask(const std::string& prompt,
                                   const std::string& purpose,
                                   const ResearchContext& ctx,
                                   PlanResult& result) const;

    std::vector<std::string> select(const std::vector<std::string>& candidates,
                                    const std::vector<SubQuery>& issued,
                                    size_t n) const;
};

} // namespace deepdive

#endif // DEEPDIVE_QUERY_PLANNER_HPP
