/**
 * @file synthesizer.hpp
 * @brief Turns the aggregated corpus into the final cited report
 */

#ifndef DEEPDIVE_SYNTHESIZER_HPP
#define DEEPDIVE_SYNTHESIZER_HPP

#include "logger.hpp"
#include "research_config.hpp"
#include "research_types.hpp"
#include "session_cache.hpp"
#include <set>
#include <string>
#include <vector>

namespace deepdive {

struct SynthesisOptions {
    DetailLevel detail_level;
    double temperature;
    bool offline;
    std::vector<HistoryEntry> history;   ///< Earlier exchanges, oldest first

    SynthesisOptions() : detail_level(DetailLevel::STANDARD), temperature(0.6), offline(false) {}
};

/**
 * @brief Report synthesis over the shared language model
 *
 * Citations in the model output are checked against the corpus entries that
 * were actually placed in the prompt; anything else is stripped. The returned
 * citation list holds exactly the surviving indices in ascending order.
 *
 * With summarize_long_sources set, extracts over summary_threshold_words are
 * condensed by the model before they go into the report prompt.
 *
 * Empty corpus:
 * - online: a fixed "no sources were retrievable" report, no oracle call
 * - offline: one oracle call, every citation marker removed, and the notice
 *   "No external sources were consulted"
 */
class Synthesizer {
public:
    static constexpr const char* NO_SOURCES_NOTICE = "No external sources were consulted";

    explicit Synthesizer(const SynthesisConfig& config = SynthesisConfig());

    /**
     * @throws OracleUnavailable If the model cannot be loaded or fails to generate
     */
    Report synthesize(const std::string& user_query,
                      const std::vector<const Source*>& corpus,
                      const SynthesisOptions& options,
                      const ResearchContext& ctx) const;

    static std::string build_system_prompt(DetailLevel detail_level, bool with_sources);

    /**
     * @brief "[Source k] url / Title / Content" blocks within the word budget
     *
     * @param included Receives the citation indices placed in the context
     */
    std::string build_context(const std::vector<const Source*>& corpus, std::set<size_t>& included) const;

    std::string build_history(const std::vector<HistoryEntry>& history) const;

    std::string build_prompt(const std::string& user_query,
                             const std::vector<const Source*>& corpus,
                             const SynthesisOptions& options,
                             std::set<size_t>& included) const;

    /**
     * @brief Sanitize model output and split it into report fields
     */
    static Report build_report(const std::string& text,
                               const std::vector<const Source*>& corpus,
                               const std::set<size_t>& valid);

    static Report no_sources_report(const std::string& user_query);

    /**
     * @brief Model summary of one long extract
     *
     * Falls back to the first summary_max_words words when the model fails or
     * returns nothing.
     */
    std::string summarize_source(const Source& source, double temperature, const ResearchContext& ctx) const;

private:
    SynthesisConfig config_;
};

} // namespace deepdive

#endif // DEEPDIVE_SYNTHESIZER_HPP
