/**
 * @file search_provider.hpp
 * @brief Search engine seam and the DuckDuckGo HTML adapter
 */

#ifndef DEEPDIVE_RETRIEVAL_SEARCH_PROVIDER_HPP
#define DEEPDIVE_RETRIEVAL_SEARCH_PROVIDER_HPP

#include "cancellation.hpp"
#include "research_config.hpp"
#include "retrieval/page_fetcher.hpp"
#include <memory>
#include <string>
#include <vector>

namespace deepdive {

struct SearchResult {
    std::string url;
    std::string title;
    std::string snippet;

    SearchResult() = default;
    SearchResult(const std::string& url_, const std::string& title_, const std::string& snippet_ = "")
        : url(url_), title(title_), snippet(snippet_) {}
};

/**
 * @brief Abstract search engine
 *
 * search() returns results in rank order and never throws for network
 * problems: an unreachable engine yields zero results.
 */
class SearchProvider {
public:
    virtual ~SearchProvider() = default;

    virtual std::vector<SearchResult> search(const std::string& query,
                                             size_t top_k,
                                             const CancellationToken* cancel = nullptr) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Scrapes the DuckDuckGo HTML endpoint
 */
class DuckDuckGoSearchProvider : public SearchProvider {
public:
    DuckDuckGoSearchProvider(std::shared_ptr<PageFetcher> fetcher, const RetrievalConfig& config);

    std::vector<SearchResult> search(const std::string& query,
                                     size_t top_k,
                                     const CancellationToken* cancel = nullptr) override;

    std::string name() const override { return "duckduckgo"; }

    /**
     * @brief Extract organic results from a result page, ads excluded
     */
    static std::vector<SearchResult> parse_results(const std::string& html, size_t top_k);

    /**
     * @brief Turn "//duckduckgo.com/l/?uddg=<encoded>" into the target URL
     *
     * @return Target URL, the input for direct links, or "" for engine-internal links
     */
    static std::string unwrap_redirect(const std::string& href);

private:
    std::shared_ptr<PageFetcher> fetcher_;
    RetrievalConfig config_;
};

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_SEARCH_PROVIDER_HPP
