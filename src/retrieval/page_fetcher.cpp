#include "retrieval/page_fetcher.hpp"

namespace deepdive {

CurlPageFetcher::CurlPageFetcher() : client_("") {}

net::HttpResponse CurlPageFetcher::fetch(const net::HttpRequest& request) {
    net::HttpRequest outgoing = request;
    if (outgoing.headers.find("Accept") == outgoing.headers.end()) {
        outgoing.headers["Accept"] = "text/html,application/xhtml+xml;q=0.9,*/*;q=0.5";
    }
    if (outgoing.headers.find("Accept-Language") == outgoing.headers.end()) {
        outgoing.headers["Accept-Language"] = "en-US,en;q=0.8";
    }
    return client_.send(outgoing);
}

} // namespace deepdive
