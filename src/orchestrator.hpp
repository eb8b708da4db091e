/**
 * @file orchestrator.hpp
 * @brief Iterative research loop: plan, retrieve, aggregate, decide, synthesize
 *
 * The ResearchOrchestrator is responsible for:
 * - Driving the explicit phase state machine of one research session
 * - Fanning sub-queries out to the retriever concurrently
 * - Enforcing the iteration, wall-clock and cancellation budget
 * - Recovering from per-sub-query faults without aborting the session
 * - Producing either a Report or a failure labelled with its phase
 *
 * State machine:
 *   PLANNING -> RETRIEVING -> AGGREGATING -> DECIDING -> {PLANNING | SYNTHESIZING}
 *   SYNTHESIZING -> DONE
 *   any phase -> FAILED (cancellation, fatal oracle failure)
 */

#ifndef DEEPDIVE_ORCHESTRATOR_HPP
#define DEEPDIVE_ORCHESTRATOR_HPP

#include "cancellation.hpp"
#include "context_aggregator.hpp"
#include "logger.hpp"
#include "query_planner.hpp"
#include "research_config.hpp"
#include "research_types.hpp"
#include "retrieval/retrieval_pipeline.hpp"
#include "synthesizer.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace deepdive {

enum class ResearchPhase {
    PLANNING,
    RETRIEVING,
    AGGREGATING,
    DECIDING,
    SYNTHESIZING,
    DONE,
    FAILED
};

inline std::string phase_to_string(ResearchPhase phase) {
    switch (phase) {
        case ResearchPhase::PLANNING: return "PLANNING";
        case ResearchPhase::RETRIEVING: return "RETRIEVING";
        case ResearchPhase::AGGREGATING: return "AGGREGATING";
        case ResearchPhase::DECIDING: return "DECIDING";
        case ResearchPhase::SYNTHESIZING: return "SYNTHESIZING";
        case ResearchPhase::DONE: return "DONE";
        case ResearchPhase::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Stop reasons recorded on the session
 */
namespace StopReason {
    constexpr const char* MAX_ITERATIONS = "max_iterations";
    constexpr const char* COVERAGE = "coverage";
    constexpr const char* CONVERGED = "converged";
    constexpr const char* BUDGET_EXHAUSTED = "budget_exhausted";
    constexpr const char* NO_USABLE_SOURCES = "no_usable_sources";
    constexpr const char* OFFLINE = "offline";
    constexpr const char* CALCULATOR = "calculator";
    constexpr const char* CANCELLED = "cancelled";
    constexpr const char* ERROR = "error";
}

/**
 * @brief Progress notification, always delivered on the thread that drives the loop
 */
struct ProgressEvent {
    ResearchPhase phase;
    size_t iteration;
    std::string message;

    ProgressEvent(ResearchPhase phase_, size_t iteration_, const std::string& message_)
        : phase(phase_), iteration(iteration_), message(message_) {}
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Final state of a run
 */
struct ResearchOutcome {
    bool success;                        ///< True when a Report was produced
    std::string stop_reason;
    ResearchPhase failed_phase;          ///< Meaningful only when success == false
    std::string error_message;
    std::optional<Report> report;
    ResearchSession session;             ///< Sources and diagnostics, kept on failure too
    std::vector<std::string> warnings;
    double total_time_ms;

    ResearchOutcome()
        : success(false), failed_phase(ResearchPhase::FAILED), total_time_ms(0.0) {}
};

/**
 * @brief Drives one research session at a time
 *
 * Usage Example:
 *   @code
 *   auto fetcher = std::make_shared<CurlPageFetcher>();
 *   auto search = std::make_shared<DuckDuckGoSearchProvider>(fetcher, config.retrieval);
 *   auto retriever = std::make_shared<RetrievalPipeline>(search, fetcher, config.retrieval, config.safety);
 *
 *   ResearchOrchestrator orchestrator(config, retriever);
 *   ResearchOutcome outcome = orchestrator.run("history of the printing press",
 *       [](const ProgressEvent& e) { std::cerr << e.message << std::endl; });
 *
 *   if (outcome.success) {
 *       std::cout << outcome.report->body << std::endl;
 *   } else {
 *       std::cerr << phase_to_string(outcome.failed_phase) << ": " << outcome.error_message << std::endl;
 *   }
 *   @endcode
 *
 * For tests the loop can be driven one phase at a time with begin() and step().
 */
class ResearchOrchestrator {
public:
    /**
     * @param config Engine configuration (agent, planner, synthesis sections are used)
     * @param retriever Sub-query retriever; may be null when config.agent.offline is set
     */
    ResearchOrchestrator(const ResearchConfig& config, std::shared_ptr<SubQueryRetriever> retriever);

    /**
     * @brief Run a whole session
     */
    ResearchOutcome run(const std::string& user_query,
                        ProgressCallback progress = nullptr,
                        const CancellationToken* cancel = nullptr);

    /**
     * @brief Start a session without executing any phase
     *
     * Arithmetic queries are answered immediately (phase DONE). Every other
     * session loads the language model first and fails in PLANNING if it
     * cannot be loaded; offline sessions then start in SYNTHESIZING.
     */
    void begin(const std::string& user_query, const CancellationToken* cancel = nullptr);

    /**
     * @brief Execute the current phase
     *
     * @return Phase after the step; terminal phases are returned unchanged
     */
    ResearchPhase step();

    ResearchPhase phase() const { return phase_; }
    bool is_terminal() const { return phase_ == ResearchPhase::DONE || phase_ == ResearchPhase::FAILED; }
    const ResearchSession& session() const { return session_; }

    /**
     * @brief Snapshot of the current state as an outcome
     */
    ResearchOutcome outcome() const;

private:
    ResearchConfig config_;
    std::shared_ptr<SubQueryRetriever> retriever_;
    QueryPlanner planner_;
    Synthesizer synthesizer_;
    ContextAggregator aggregator_;

    ResearchSession session_;
    ResearchPhase phase_;
    ResearchContext ctx_;
    const CancellationToken* cancel_;
    std::chrono::steady_clock::time_point start_time_;

    std::vector<SubQuery> pending_;              ///< Planned, not yet retrieved
    std::vector<Source> iteration_sources_;      ///< Retrieved, not yet merged
    ResearchPhase failed_phase_;
    std::string error_message_;
    std::vector<std::string> warnings_;
    double total_time_ms_;

    void do_planning();
    void do_retrieving();
    void do_aggregating();
    void do_deciding();
    void do_synthesizing();

    void answer_arithmetic();
    void check_budget() const;
    void transition(ResearchPhase next);
    void finish_synthesis_route(const std::string& stop_reason);
    void fail(ResearchPhase phase, const std::string& message);
    void complete();
    double elapsed_ms() const;

    static std::string generate_session_id();
};

} // namespace deepdive

#endif // DEEPDIVE_ORCHESTRATOR_HPP
