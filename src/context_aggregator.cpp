#include "context_aggregator.hpp"
#include "retrieval/content_extractor.hpp"
#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace deepdive {

ContextAggregator::ContextAggregator(bool ignore_query) : ignore_query_(ignore_query) {}

std::string ContextAggregator::dedupe_key(const std::string& url) const {
    std::string key = normalize_url(url, ignore_query_);
    return key.empty() ? url : key;
}

std::vector<Source> ContextAggregator::merge(const std::vector<Source>& existing,
                                             const std::vector<Source>& incoming) const {
    std::vector<Source> merged = existing;
    std::set<std::string> seen;
    size_t next_index = 1;

    for (const Source& source : existing) {
        seen.insert(dedupe_key(source.url));
        next_index = std::max(next_index, source.citation_index + 1);
    }

    for (const Source& source : incoming) {
        if (!seen.insert(dedupe_key(source.url)).second) {
            continue;
        }

        Source entry = source;
        if (entry.is_usable()) {
            entry.citation_index = next_index++;
        } else {
            entry.extracted_text.clear();
            entry.citation_index = 0;
        }
        merged.push_back(entry);
    }

    return merged;
}

std::vector<const Source*> ContextAggregator::corpus(const std::vector<Source>& sources) {
    std::vector<const Source*> view;
    for (const Source& source : sources) {
        if (source.is_usable() && source.citation_index > 0) {
            view.push_back(&source);
        }
    }
    std::stable_sort(view.begin(), view.end(), [](const Source* a, const Source* b) {
        return a->citation_index < b->citation_index;
    });
    return view;
}

size_t ContextAggregator::count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

std::string ContextAggregator::host_of(const std::string& url) {
    auto parsed = parse_url(url);
    if (!parsed) {
        return "";
    }
    std::string host = parsed->host;
    if (host.rfind("www.", 0) == 0) {
        host = host.substr(4);
    }
    return host;
}

CoverageSignal ContextAggregator::coverage(const std::vector<Source>& sources) {
    CoverageSignal signal;
    std::set<std::string> hosts;
    for (const Source* source : corpus(sources)) {
        ++signal.usable_sources;
        signal.total_words += count_words(source->extracted_text);
        std::string host = host_of(source->url);
        if (!host.empty()) {
            hosts.insert(host);
        }
    }
    signal.distinct_hosts = hosts.size();
    return signal;
}

std::string ContextAggregator::corpus_summary(const std::vector<Source>& sources, size_t max_chars) {
    constexpr size_t EXCERPT_CHARS = 160;

    std::string summary;
    for (const Source* source : corpus(sources)) {
        std::string line = "[" + std::to_string(source->citation_index) + "] " + source->title;
        std::string host = host_of(source->url);
        if (!host.empty()) {
            line += " (" + host + ")";
        }
        line += ": " + ContentExtractor::truncate(source->extracted_text, EXCERPT_CHARS) + "\n";

        if (summary.size() + line.size() > max_chars) {
            break;
        }
        summary += line;
    }
    return summary;
}

} // namespace deepdive
