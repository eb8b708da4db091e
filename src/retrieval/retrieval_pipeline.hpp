/**
 * @file retrieval_pipeline.hpp
 * @brief Search, fetch and extraction for a single sub-query
 *
 * For every search candidate the pipeline runs, concurrently:
 *   validate URL -> robots.txt -> fetch gate -> fetch (timeout retries)
 *   -> manual redirects (each hop re-validated) -> content type check
 *   -> extraction -> length check
 * and records the outcome on a Source. A failing candidate never aborts the
 * sub-query; results come back in search-rank order.
 */

#ifndef DEEPDIVE_RETRIEVAL_RETRIEVAL_PIPELINE_HPP
#define DEEPDIVE_RETRIEVAL_RETRIEVAL_PIPELINE_HPP

#include "cancellation.hpp"
#include "research_config.hpp"
#include "research_types.hpp"
#include "retrieval/content_extractor.hpp"
#include "retrieval/fetch_gate.hpp"
#include "retrieval/page_fetcher.hpp"
#include "retrieval/search_provider.hpp"
#include "safety/robots_checker.hpp"
#include "safety/url_validator.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace deepdive {

/**
 * @brief Seam between the orchestration loop and retrieval
 */
class SubQueryRetriever {
public:
    virtual ~SubQueryRetriever() = default;

    /**
     * @brief Retrieve sources for one sub-query
     *
     * @return Sources in search-rank order, including rejected ones
     * @throws ResearchError (or any std::exception) on a hard fault; the caller
     *         records the sub-query as degraded
     */
    virtual std::vector<Source> run(const SubQuery& subquery, const CancellationToken* cancel) = 0;
};

class RetrievalPipeline : public SubQueryRetriever {
public:
    /**
     * @param search Search engine
     * @param fetcher Transport for pages and robots.txt
     * @param retrieval Fetch limits, user agent pool and politeness settings
     * @param safety URL policy and robots settings
     * @param resolver DNS resolver for the URL validator (system resolver when empty)
     */
    RetrievalPipeline(std::shared_ptr<SearchProvider> search,
                      std::shared_ptr<PageFetcher> fetcher,
                      const RetrievalConfig& retrieval,
                      const SafetyConfig& safety,
                      safety::UrlValidator::Resolver resolver = nullptr);

    std::vector<Source> run(const SubQuery& subquery, const CancellationToken* cancel) override;

    /**
     * @brief Process one candidate end to end; never throws
     */
    Source fetch_source(const SearchResult& candidate,
                        const SubQuery& subquery,
                        const CancellationToken* cancel);

    const FetchGate& gate() const { return gate_; }
    const safety::RobotsChecker& robots() const { return robots_; }

private:
    std::shared_ptr<SearchProvider> search_;
    std::shared_ptr<PageFetcher> fetcher_;
    RetrievalConfig retrieval_;
    SafetyConfig safety_;
    safety::UrlValidator validator_;
    FetchGate gate_;
    safety::RobotsChecker robots_;
    ContentExtractor extractor_;
    std::atomic<size_t> user_agent_cursor_;

    std::string next_user_agent();

    net::HttpResponse fetch_with_retry(const std::string& url,
                                       const safety::ValidationResult& validation,
                                       const CancellationToken* cancel);

    static bool is_html_content_type(const std::string& content_type);
};

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_RETRIEVAL_PIPELINE_HPP
