/**
 * @file page_fetcher.hpp
 * @brief Transport seam for page and robots.txt downloads
 */

#ifndef DEEPDIVE_RETRIEVAL_PAGE_FETCHER_HPP
#define DEEPDIVE_RETRIEVAL_PAGE_FETCHER_HPP

#include "api/http_client.hpp"
#include <memory>

namespace deepdive {

/**
 * @brief Performs one HTTP exchange without following redirects
 *
 * Implementations return the response for any status code and throw
 * net::HttpClientError for transport failures, timeouts, cancellation and
 * oversized bodies. They must be safe to call from several threads.
 */
class PageFetcher {
public:
    virtual ~PageFetcher() = default;

    virtual net::HttpResponse fetch(const net::HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed fetcher
 */
class CurlPageFetcher : public PageFetcher {
public:
    CurlPageFetcher();

    net::HttpResponse fetch(const net::HttpRequest& request) override;

    void set_debug(bool debug) { client_.set_debug(debug); }

private:
    net::HttpClient client_;
};

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_PAGE_FETCHER_HPP
