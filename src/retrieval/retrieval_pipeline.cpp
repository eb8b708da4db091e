#include "retrieval/retrieval_pipeline.hpp"
#include "logger.hpp"
#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <set>
#include <thread>

namespace deepdive {

namespace {

bool is_redirect_status(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

Source rejected(Source source, FetchStatus status, const std::string& detail) {
    source.fetch_status = status;
    source.error_detail = detail;
    source.extracted_text.clear();
    return source;
}

} // namespace

RetrievalPipeline::RetrievalPipeline(std::shared_ptr<SearchProvider> search,
                                     std::shared_ptr<PageFetcher> fetcher,
                                     const RetrievalConfig& retrieval,
                                     const SafetyConfig& safety,
                                     safety::UrlValidator::Resolver resolver)
    : search_(std::move(search)),
      fetcher_(std::move(fetcher)),
      retrieval_(retrieval),
      safety_(safety),
      validator_(safety, std::move(resolver)),
      gate_(retrieval.max_concurrent_fetches,
            std::chrono::milliseconds(retrieval.politeness_delay_ms)),
      robots_(fetcher_, safety, &validator_, &gate_),
      extractor_(retrieval.max_content_chars),
      user_agent_cursor_(0) {
    if (!search_ || !fetcher_) {
        throw ConfigurationError("retrieval pipeline needs a search provider and a fetcher");
    }
}

std::string RetrievalPipeline::next_user_agent() {
    if (retrieval_.user_agents.empty()) {
        return safety_.robots_user_agent;
    }
    size_t cursor = user_agent_cursor_.fetch_add(1);
    return retrieval_.user_agents[cursor % retrieval_.user_agents.size()];
}

bool RetrievalPipeline::is_html_content_type(const std::string& content_type) {
    if (content_type.empty()) {
        return true;
    }
    std::string lowered = to_lower(content_type);
    return lowered.find("text/html") != std::string::npos ||
           lowered.find("application/xhtml+xml") != std::string::npos;
}

std::vector<Source> RetrievalPipeline::run(const SubQuery& subquery, const CancellationToken* cancel) {
    if (is_cancelled(cancel)) {
        return {};
    }

    std::vector<SearchResult> results = search_->search(subquery.text, retrieval_.top_k, cancel);

    std::vector<SearchResult> candidates;
    std::set<std::string> seen;
    for (const SearchResult& result : results) {
        if (candidates.size() >= retrieval_.top_k) {
            break;
        }
        if (seen.insert(normalize_url(result.url, retrieval_.dedupe_ignore_query)).second) {
            candidates.push_back(result);
        }
    }

    std::vector<std::future<Source>> futures;
    futures.reserve(candidates.size());
    for (const SearchResult& candidate : candidates) {
        futures.push_back(std::async(std::launch::async, [this, candidate, &subquery, cancel]() {
            return fetch_source(candidate, subquery, cancel);
        }));
    }

    std::vector<Source> sources;
    sources.reserve(futures.size());
    for (auto& future : futures) {
        sources.push_back(future.get());
    }
    return sources;
}

net::HttpResponse RetrievalPipeline::fetch_with_retry(const std::string& url,
                                                      const safety::ValidationResult& validation,
                                                      const CancellationToken* cancel) {
    for (int attempt = 0; ; ++attempt) {
        FetchGate::Permit permit = gate_.acquire(validation.host, cancel);
        if (!permit) {
            throw net::HttpClientError("Request cancelled", 0, net::HttpClientError::Kind::CANCELLED);
        }

        net::HttpRequest request;
        request.url = url;
        request.user_agent = next_user_agent();
        request.timeout_ms = retrieval_.request_timeout_ms;
        request.max_body_bytes = retrieval_.max_body_bytes;
        request.cancel = cancel;
        std::string pin = validation.resolve_entry();
        if (!pin.empty()) {
            request.resolve.push_back(pin);
        }

        try {
            return fetcher_->fetch(request);
        } catch (const net::HttpClientError& e) {
            if (!e.is_timeout() || attempt >= retrieval_.retry_attempts) {
                throw;
            }
            Logger::get_instance().debug("Fetch timed out, retrying", {
                {"url", url}, {"attempt", std::to_string(attempt + 1)}
            });
        }

        permit.release();
        auto backoff = std::chrono::milliseconds(retrieval_.retry_backoff_ms * (attempt + 1));
        if (cancel != nullptr) {
            if (!cancel->wait_for(backoff)) {
                throw net::HttpClientError("Request cancelled", 0, net::HttpClientError::Kind::CANCELLED);
            }
        } else {
            std::this_thread::sleep_for(backoff);
        }
    }
}

Source RetrievalPipeline::fetch_source(const SearchResult& candidate,
                                       const SubQuery& subquery,
                                       const CancellationToken* cancel) {
    Source source;
    source.url = candidate.url;
    source.title = candidate.title;
    source.snippet = candidate.snippet;
    source.origin_subquery = subquery.text;

    try {
        std::string current = candidate.url;
        for (int hop = 0; ; ++hop) {
            if (is_cancelled(cancel)) {
                return rejected(source, FetchStatus::FETCH_ERROR, "cancelled");
            }

            safety::ValidationResult validation = validator_.validate(current);
            if (!validation.ok) {
                std::string detail = safety::reject_reason_to_string(validation.reason);
                if (!validation.detail.empty()) {
                    detail += ": " + validation.detail;
                }
                return rejected(source, FetchStatus::BLOCKED_URL, detail);
            }

            if (!robots_.is_allowed(current, safety_.robots_user_agent, cancel)) {
                if (is_cancelled(cancel)) {
                    return rejected(source, FetchStatus::FETCH_ERROR, "cancelled");
                }
                return rejected(source, FetchStatus::BLOCKED_ROBOTS, "disallowed by robots.txt");
            }

            net::HttpResponse response = fetch_with_retry(current, validation, cancel);
            source.http_status = response.status_code;
            source.retrieved_at = std::chrono::system_clock::now();

            if (is_redirect_status(response.status_code)) {
                std::string location = response.header("location");
                if (location.empty()) {
                    return rejected(source, FetchStatus::FETCH_ERROR, "redirect without Location header");
                }
                if (hop >= retrieval_.max_redirects) {
                    return rejected(source, FetchStatus::FETCH_ERROR, "too many redirects");
                }
                std::string next = resolve_url(current, location);
                if (next.empty()) {
                    return rejected(source, FetchStatus::FETCH_ERROR, "invalid redirect target");
                }
                current = next;
                source.url = current;
                continue;
            }

            if (response.status_code < 200 || response.status_code >= 300) {
                return rejected(source, FetchStatus::FETCH_ERROR,
                                "HTTP " + std::to_string(response.status_code));
            }
            if (!is_html_content_type(response.content_type)) {
                return rejected(source, FetchStatus::FETCH_ERROR,
                                "unsupported content type " + response.content_type);
            }

            ExtractedContent content = extractor_.extract(response.body);
            if (source.title.empty()) {
                source.title = content.title;
            }
            if (content.boilerplate) {
                return rejected(source, FetchStatus::EMPTY, "only boilerplate text");
            }
            if (content.text.size() < retrieval_.min_content_chars) {
                return rejected(source, FetchStatus::EMPTY,
                                "extracted " + std::to_string(content.text.size()) + " characters");
            }

            source.fetch_status = FetchStatus::OK;
            source.extracted_text = content.text;
            source.error_detail.clear();
            return source;
        }

    } catch (const net::HttpClientError& e) {
        return rejected(source, FetchStatus::FETCH_ERROR, e.what());
    } catch (const ExtractionEmpty& e) {
        return rejected(source, FetchStatus::EMPTY, e.what());
    } catch (const std::exception& e) {
        return rejected(source, FetchStatus::FETCH_ERROR, e.what());
    }
}

} // namespace deepdive
