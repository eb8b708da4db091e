/**
 * @file context_aggregator.hpp
 * @brief Merges retrieval results into the deduplicated, citable corpus
 */

#ifndef DEEPDIVE_CONTEXT_AGGREGATOR_HPP
#define DEEPDIVE_CONTEXT_AGGREGATOR_HPP

#include "research_types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief How much usable material the corpus holds
 */
struct CoverageSignal {
    size_t usable_sources;
    size_t total_words;
    size_t distinct_hosts;

    CoverageSignal() : usable_sources(0), total_words(0), distinct_hosts(0) {}

    bool meets(size_t min_words, size_t min_hosts) const {
        return total_words >= min_words && distinct_hosts >= min_hosts;
    }
};

/**
 * @brief Source deduplication and corpus bookkeeping
 *
 * Sources are keyed by normalize_url(). The first Source seen for a key wins;
 * later duplicates are dropped. Usable sources get the next citation index
 * as they enter and keep it for the rest of the session.
 *
 * Usage Example:
 *   @code
 *   ContextAggregator aggregator;
 *   session.sources = aggregator.merge(session.sources, fetched);
 *   CoverageSignal signal = ContextAggregator::coverage(session.sources);
 *   @endcode
 */
class ContextAggregator {
public:
    /**
     * @param ignore_query Treat URLs that differ only in their query string as
     *        duplicates. When false, only tracking parameters are dropped.
     */
    explicit ContextAggregator(bool ignore_query = true);

    /**
     * @return existing followed by the non-duplicate members of incoming
     */
    std::vector<Source> merge(const std::vector<Source>& existing,
                              const std::vector<Source>& incoming) const;

    std::string dedupe_key(const std::string& url) const;

    /**
     * @brief Usable sources ordered by citation index
     */
    static std::vector<const Source*> corpus(const std::vector<Source>& sources);

    static CoverageSignal coverage(const std::vector<Source>& sources);

    /**
     * @brief Compact "[k] title (host): opening text" digest of the corpus
     *
     * Used as planner context for refinement queries; never longer than max_chars.
     */
    static std::string corpus_summary(const std::vector<Source>& sources, size_t max_chars);

    static size_t count_words(const std::string& text);

    /**
     * @brief Host without a leading "www.", empty for unparseable URLs
     */
    static std::string host_of(const std::string& url);

private:
    bool ignore_query_;
};

} // namespace deepdive

#endif // DEEPDIVE_CONTEXT_AGGREGATOR_HPP
