/**
 * @file orchestrator.cpp
 * @brief Implementation of ResearchOrchestrator
 */

#include "orchestrator.hpp"
#include "response_parser.hpp"
#include "safety/expression_evaluator.hpp"
#include "session_cache.hpp"
#include <future>
#include <iomanip>
#include <random>
#include <sstream>

namespace deepdive {

namespace {

std::string phase_message(ResearchPhase phase) {
    switch (phase) {
        case ResearchPhase::PLANNING: return "Planning search queries";
        case ResearchPhase::RETRIEVING: return "Searching and reading sources";
        case ResearchPhase::AGGREGATING: return "Merging sources";
        case ResearchPhase::DECIDING: return "Checking coverage";
        case ResearchPhase::SYNTHESIZING: return "Writing report";
        case ResearchPhase::DONE: return "Done";
        case ResearchPhase::FAILED: return "Failed";
        default: return "";
    }
}

} // namespace

ResearchOrchestrator::ResearchOrchestrator(const ResearchConfig& config,
                                           std::shared_ptr<SubQueryRetriever> retriever)
    : config_(config),
      retriever_(std::move(retriever)),
      planner_(config.planner),
      synthesizer_(config.synthesis),
      aggregator_(config.retrieval.dedupe_ignore_query),
      phase_(ResearchPhase::PLANNING),
      cancel_(nullptr),
      failed_phase_(ResearchPhase::FAILED),
      total_time_ms_(0.0) {

    config_.validate();
    if (!retriever_ && !config_.agent.offline) {
        throw ConfigurationError("a retriever is required unless running offline");
    }
}

std::string ResearchOrchestrator::generate_session_id() {
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<uint32_t> distribution;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return oss.str();
}

double ResearchOrchestrator::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time_).count();
}

ResearchOutcome ResearchOrchestrator::run(const std::string& user_query,
                                          ProgressCallback progress,
                                          const CancellationToken* cancel) {
    begin(user_query, cancel);

    auto notify = [&]() {
        if (progress) {
            std::string message = phase_message(phase_);
            if (phase_ == ResearchPhase::FAILED && !error_message_.empty()) {
                message += ": " + error_message_;
            }
            progress(ProgressEvent(phase_, session_.iteration_count, message));
        }
    };

    notify();
    while (!is_terminal()) {
        ResearchPhase before = phase_;
        step();
        if (phase_ != before) {
            notify();
        }
    }

    return outcome();
}

void ResearchOrchestrator::begin(const std::string& user_query, const CancellationToken* cancel) {
    session_ = ResearchSession();
    session_.id = generate_session_id();
    session_.user_query = parsing::trim(user_query);
    session_.max_iterations = config_.agent.max_iterations;
    session_.temperature = config_.agent.temperature;
    session_.detail_level = config_.agent.detail_level;
    session_.offline = config_.agent.offline;

    ctx_ = ResearchContext(session_.id);
    cancel_ = cancel;
    start_time_ = std::chrono::steady_clock::now();
    pending_.clear();
    iteration_sources_.clear();
    failed_phase_ = ResearchPhase::FAILED;
    error_message_.clear();
    warnings_.clear();
    total_time_ms_ = 0.0;
    phase_ = ResearchPhase::PLANNING;
    ctx_.phase = phase_to_string(phase_);

    Logger::get_instance().log_session_start(ctx_, session_.user_query, session_.max_iterations,
                                             session_.temperature, session_.offline);

    if (session_.user_query.empty()) {
        fail(ResearchPhase::PLANNING, "query is empty");
        return;
    }
    if (is_cancelled(cancel_)) {
        fail(ResearchPhase::PLANNING, StopReason::CANCELLED);
        return;
    }

    if (config_.agent.calculator_shortcut &&
        safety::ExpressionEvaluator::is_arithmetic_query(session_.user_query)) {
        answer_arithmetic();
        return;
    }

    try {
        SessionCache::get_instance().acquire();
    } catch (const ResearchError& e) {
        fail(ResearchPhase::PLANNING, e.what());
        return;
    }

    if (session_.offline) {
        session_.stop_reason = StopReason::OFFLINE;
        transition(ResearchPhase::SYNTHESIZING);
        return;
    }

    session_.iteration_count = 1;
    ctx_.iteration = 1;
}

ResearchPhase ResearchOrchestrator::step() {
    if (is_terminal()) {
        return phase_;
    }

    if (is_cancelled(cancel_)) {
        if (!iteration_sources_.empty()) {
            session_.sources = aggregator_.merge(session_.sources, iteration_sources_);
            iteration_sources_.clear();
        }
        fail(phase_, StopReason::CANCELLED);
        return phase_;
    }

    try {
        switch (phase_) {
            case ResearchPhase::PLANNING: do_planning(); break;
            case ResearchPhase::RETRIEVING: do_retrieving(); break;
            case ResearchPhase::AGGREGATING: do_aggregating(); break;
            case ResearchPhase::DECIDING: do_deciding(); break;
            case ResearchPhase::SYNTHESIZING: do_synthesizing(); break;
            default: break;
        }
    } catch (const BudgetExhausted& e) {
        warnings_.push_back(e.what());
        Logger::get_instance().log_warning(ctx_, e.what());
        finish_synthesis_route(StopReason::BUDGET_EXHAUSTED);
    } catch (const ResearchError& e) {
        fail(phase_, e.what());
    } catch (const std::exception& e) {
        fail(phase_, std::string("Unexpected error: ") + e.what());
    }

    return phase_;
}

void ResearchOrchestrator::do_planning() {
    check_budget();

    PlanResult plan;
    if (session_.subqueries.empty()) {
        plan = planner_.plan_initial(session_.user_query, config_.agent.initial_subqueries,
                                     session_.subqueries, ctx_);
    } else {
        std::string summary = ContextAggregator::corpus_summary(session_.sources,
                                                                config_.planner.corpus_summary_chars);
        plan = planner_.plan_refinement(session_.user_query, summary, config_.agent.refinement_subqueries,
                                        session_.subqueries, ctx_);
    }
    warnings_.insert(warnings_.end(), plan.warnings.begin(), plan.warnings.end());

    if (plan.queries.empty()) {
        finish_synthesis_route(StopReason::CONVERGED);
        return;
    }

    pending_.clear();
    for (const std::string& text : plan.queries) {
        SubQuery subquery(text, session_.iteration_count);
        pending_.push_back(subquery);
        session_.subqueries.push_back(subquery);
    }
    Logger::get_instance().log_subqueries(ctx_, plan.queries);

    transition(ResearchPhase::RETRIEVING);
}

void ResearchOrchestrator::do_retrieving() {
    check_budget();

    iteration_sources_.clear();

    std::shared_ptr<SubQueryRetriever> retriever = retriever_;
    const CancellationToken* cancel = cancel_;

    std::vector<std::future<std::vector<Source>>> futures;
    futures.reserve(pending_.size());
    for (const SubQuery& subquery : pending_) {
        futures.push_back(std::async(std::launch::async, [retriever, subquery, cancel]() {
            return retriever->run(subquery, cancel);
        }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        SubQueryOutcome outcome;
        outcome.subquery = pending_[i];
        try {
            std::vector<Source> sources = futures[i].get();
            outcome.sources_returned = sources.size();
            for (const Source& source : sources) {
                if (source.is_usable()) {
                    ++outcome.usable_sources;
                }
            }
            iteration_sources_.insert(iteration_sources_.end(), sources.begin(), sources.end());
        } catch (const std::exception& e) {
            outcome.degraded = true;
            outcome.error_message = e.what();
            std::string warning = "Sub-query \"" + pending_[i].text + "\" failed: " + e.what();
            warnings_.push_back(warning);
            Logger::get_instance().log_warning(ctx_, warning);
        }
        session_.outcomes.push_back(outcome);
    }

    pending_.clear();
    transition(ResearchPhase::AGGREGATING);
}

void ResearchOrchestrator::do_aggregating() {
    size_t before = session_.sources.size();
    session_.sources = aggregator_.merge(session_.sources, iteration_sources_);
    iteration_sources_.clear();

    Logger& logger = Logger::get_instance();
    size_t new_usable = 0;
    for (size_t i = before; i < session_.sources.size(); ++i) {
        logger.log_source_outcome(ctx_, session_.sources[i]);
        if (session_.sources[i].is_usable()) {
            ++new_usable;
        }
    }

    CoverageSignal signal = ContextAggregator::coverage(session_.sources);
    logger.log_iteration_complete(ctx_, new_usable, signal.usable_sources,
                                  signal.total_words, signal.distinct_hosts);

    transition(ResearchPhase::DECIDING);
}

void ResearchOrchestrator::do_deciding() {
    CoverageSignal signal = ContextAggregator::coverage(session_.sources);

    if (signal.usable_sources == 0) {
        finish_synthesis_route(StopReason::NO_USABLE_SOURCES);
        return;
    }
    if (session_.iteration_count >= session_.max_iterations) {
        finish_synthesis_route(StopReason::MAX_ITERATIONS);
        return;
    }
    if (signal.meets(config_.agent.coverage_min_words, config_.agent.coverage_min_hosts)) {
        finish_synthesis_route(StopReason::COVERAGE);
        return;
    }
    check_budget();

    ++session_.iteration_count;
    ctx_.iteration = session_.iteration_count;
    transition(ResearchPhase::PLANNING);
}

void ResearchOrchestrator::do_synthesizing() {
    std::vector<const Source*> corpus = ContextAggregator::corpus(session_.sources);

    SynthesisOptions options;
    options.detail_level = session_.detail_level;
    options.temperature = session_.temperature;
    options.offline = session_.offline;
    options.history = SessionCache::get_instance().history();

    session_.report = synthesizer_.synthesize(session_.user_query, corpus, options, ctx_);

    transition(ResearchPhase::DONE);
    complete();
}

void ResearchOrchestrator::answer_arithmetic() {
    safety::EvaluatorLimits limits;
    limits.max_length = config_.safety.max_expression_length;
    limits.max_depth = config_.safety.max_expression_depth;
    limits.max_magnitude = config_.safety.max_result_magnitude;
    safety::ExpressionEvaluator evaluator(limits);

    safety::EvalResult result = evaluator.evaluate(session_.user_query);

    Report report;
    if (result.success) {
        report.calculator_result = result.value;
        report.summary = session_.user_query + " = " + safety::ExpressionEvaluator::format_value(result.value);
    } else {
        report.summary = "Could not evaluate \"" + session_.user_query + "\": " + result.message;
    }
    report.body = report.summary;
    report.notice = Synthesizer::NO_SOURCES_NOTICE;
    report.external_sources_consulted = false;

    session_.report = report;
    session_.stop_reason = StopReason::CALCULATOR;
    transition(ResearchPhase::DONE);
    complete();
}

void ResearchOrchestrator::check_budget() const {
    if (config_.agent.max_wall_time_ms > 0 &&
        elapsed_ms() >= static_cast<double>(config_.agent.max_wall_time_ms)) {
        throw BudgetExhausted("wall-clock budget of " + std::to_string(config_.agent.max_wall_time_ms) +
                              " ms spent after iteration " + std::to_string(session_.iteration_count));
    }
}

void ResearchOrchestrator::transition(ResearchPhase next) {
    Logger::get_instance().log_phase_transition(ctx_, phase_to_string(phase_), phase_to_string(next));
    phase_ = next;
    ctx_.phase = phase_to_string(next);
}

void ResearchOrchestrator::finish_synthesis_route(const std::string& stop_reason) {
    session_.stop_reason = stop_reason;
    transition(ResearchPhase::SYNTHESIZING);
}

void ResearchOrchestrator::fail(ResearchPhase phase, const std::string& message) {
    failed_phase_ = phase;
    error_message_ = message;
    session_.stop_reason = message == StopReason::CANCELLED ? StopReason::CANCELLED : StopReason::ERROR;
    Logger::get_instance().log_error(ctx_, phase_to_string(phase) + ": " + message);
    transition(ResearchPhase::FAILED);
    complete();
}

void ResearchOrchestrator::complete() {
    total_time_ms_ = elapsed_ms();

    size_t citations = 0;
    if (phase_ == ResearchPhase::DONE && session_.report) {
        citations = session_.report->citations.size();
        SessionCache::get_instance().add_exchange(session_.user_query, session_.report->body);
    }

    Logger::get_instance().log_session_complete(ctx_, phase_ == ResearchPhase::DONE,
                                                session_.stop_reason, citations, total_time_ms_);
}

ResearchOutcome ResearchOrchestrator::outcome() const {
    ResearchOutcome result;
    result.success = phase_ == ResearchPhase::DONE;
    result.stop_reason = session_.stop_reason;
    result.failed_phase = phase_ == ResearchPhase::FAILED ? failed_phase_ : phase_;
    result.error_message = error_message_;
    result.report = session_.report;
    result.session = session_;
    result.warnings = warnings_;
    result.total_time_ms = is_terminal() ? total_time_ms_ : elapsed_ms();
    return result;
}

} // namespace deepdive
