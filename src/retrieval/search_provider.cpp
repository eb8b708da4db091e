#include "retrieval/search_provider.hpp"
#include "logger.hpp"
#include "retrieval/html_document.hpp"
#include "url.hpp"
#include <set>

namespace deepdive {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_engine_host(const std::string& host) {
    return host == "duckduckgo.com" || ends_with(host, ".duckduckgo.com");
}

const GumboNode* result_container(const GumboNode* node) {
    for (const GumboNode* p = node->parent; p != nullptr; p = p->parent) {
        if (HtmlDocument::has_class(p, "result")) {
            return p;
        }
    }
    return nullptr;
}

} // namespace

DuckDuckGoSearchProvider::DuckDuckGoSearchProvider(std::shared_ptr<PageFetcher> fetcher,
                                                   const RetrievalConfig& config)
    : fetcher_(std::move(fetcher)), config_(config) {}

std::string DuckDuckGoSearchProvider::unwrap_redirect(const std::string& href) {
    std::string absolute = href.rfind("//", 0) == 0 ? "https:" + href : href;

    auto parsed = parse_url(absolute);
    if (!parsed) {
        return "";
    }
    if (!is_engine_host(parsed->host)) {
        return absolute;
    }
    if (parsed->path.rfind("/l/", 0) != 0) {
        return "";
    }

    std::string query = "&" + parsed->query;
    size_t pos = query.find("&uddg=");
    if (pos == std::string::npos) {
        return "";
    }
    size_t start = pos + 6;
    size_t end = query.find('&', start);
    return url_decode(query.substr(start, end == std::string::npos ? std::string::npos : end - start));
}

std::vector<SearchResult> DuckDuckGoSearchProvider::parse_results(const std::string& html, size_t top_k) {
    std::vector<SearchResult> results;
    HtmlDocument document(html);

    auto anchors = document.find_all([](const GumboNode* node) {
        return HtmlDocument::is_element(node, GUMBO_TAG_A) && HtmlDocument::has_class(node, "result__a");
    });

    std::set<std::string> seen;
    for (const GumboNode* anchor : anchors) {
        if (results.size() >= top_k) {
            break;
        }

        const GumboNode* container = result_container(anchor);
        if (container && HtmlDocument::has_class(container, "result--ad")) {
            continue;
        }

        std::string url = unwrap_redirect(HtmlDocument::attribute(anchor, "href"));
        if (url.empty() || (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)) {
            continue;
        }
        if (!seen.insert(normalize_url(url)).second) {
            continue;
        }

        SearchResult result;
        result.url = url;
        result.title = collapse_whitespace(HtmlDocument::text_content(anchor));

        const GumboNode* snippet = HtmlDocument::find_in(container, [](const GumboNode* node) {
            return HtmlDocument::has_class(node, "result__snippet");
        });
        if (snippet) {
            result.snippet = collapse_whitespace(HtmlDocument::text_content(snippet));
        }

        results.push_back(result);
    }

    return results;
}

std::vector<SearchResult> DuckDuckGoSearchProvider::search(const std::string& query,
                                                           size_t top_k,
                                                           const CancellationToken* cancel) {
    net::HttpRequest request;
    request.url = config_.search_endpoint + "?q=" + url_encode(query);
    request.user_agent = config_.user_agents.front();
    request.timeout_ms = config_.request_timeout_ms * 2;
    request.max_body_bytes = config_.max_body_bytes;
    request.cancel = cancel;

    try {
        net::HttpResponse response = fetcher_->fetch(request);
        if (response.status_code != 200) {
            Logger::get_instance().info("Search request failed", {
                {"provider", name()}, {"query", query},
                {"status", std::to_string(response.status_code)}
            });
            return {};
        }

        std::vector<SearchResult> results = parse_results(response.body, top_k);
        Logger::get_instance().debug("Search results", {
            {"provider", name()}, {"query", query}, {"count", std::to_string(results.size())}
        });
        return results;

    } catch (const net::HttpClientError& e) {
        Logger::get_instance().info("Search request failed", {
            {"provider", name()}, {"query", query}, {"error", e.what()}
        });
    } catch (const ResearchError& e) {
        Logger::get_instance().info("Search page could not be parsed", {
            {"provider", name()}, {"query", query}, {"error", e.what()}
        });
    }
    return {};
}

} // namespace deepdive
