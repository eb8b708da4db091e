/**
 * @file robots_checker.hpp
 * @brief robots.txt parsing and per-host policy cache
 */

#ifndef DEEPDIVE_SAFETY_ROBOTS_CHECKER_HPP
#define DEEPDIVE_SAFETY_ROBOTS_CHECKER_HPP

#include "cancellation.hpp"
#include "research_config.hpp"
#include "retrieval/fetch_gate.hpp"
#include "retrieval/page_fetcher.hpp"
#include "safety/url_validator.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace deepdive {
namespace safety {

struct RobotsRule {
    std::string pattern;   ///< Path pattern, may contain '*' and a trailing '$'
    bool allow;

    RobotsRule() : allow(false) {}
    RobotsRule(const std::string& pattern_, bool allow_) : pattern(pattern_), allow(allow_) {}
};

/**
 * @brief Parsed robots.txt
 *
 * Group selection: the group whose user-agent token is the longest match for
 * the crawler's product token wins, otherwise the '*' group. Within a group
 * the longest matching pattern decides, ties go to Allow.
 */
class RobotsPolicy {
public:
    RobotsPolicy() = default;

    static RobotsPolicy parse(const std::string& content);

    /**
     * @param path_and_query Request target, e.g. "/private/x?y=1"
     * @param user_agent Full user agent string or bare product token
     */
    bool is_allowed(const std::string& path_and_query, const std::string& user_agent) const;

    size_t group_count() const { return groups_.size(); }

    static bool pattern_matches(const std::string& pattern, const std::string& path);

private:
    struct Group {
        std::vector<std::string> agents;   ///< Lower-cased tokens
        std::vector<RobotsRule> rules;
    };

    std::vector<Group> groups_;

    std::vector<const RobotsRule*> rules_for(const std::string& user_agent) const;
};

/**
 * @brief Session-scoped robots.txt checker
 *
 * Policies are fetched at most once per origin while concurrent callers for
 * the same origin wait on a per-origin lock. A failed fetch (transport error,
 * timeout or non-2xx status) allows everything and is retried after the
 * negative TTL.
 */
class RobotsChecker {
public:
    /**
     * @param fetcher Transport used for robots.txt downloads
     * @param config Timeout, negative TTL and user agent token
     * @param validator Optional guard applied to the robots.txt URL; its
     *                  resolved addresses pin the download
     * @param gate Optional admission gate shared with page fetches, so the
     *             robots.txt download counts against the concurrency cap and
     *             the host's politeness delay
     */
    RobotsChecker(std::shared_ptr<PageFetcher> fetcher,
                  const SafetyConfig& config,
                  const UrlValidator* validator = nullptr,
                  FetchGate* gate = nullptr);

    /**
     * @brief Check whether user_agent may fetch url
     *
     * Returns false for unparseable URLs and when cancelled before a decision.
     */
    bool is_allowed(const std::string& url,
                    const std::string& user_agent,
                    const CancellationToken* cancel = nullptr);

    size_t fetch_count() const { return fetch_count_.load(); }
    size_t cached_origins() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::mutex mutex;
        bool loaded;
        bool negative;
        RobotsPolicy policy;
        Clock::time_point expires;

        Entry() : loaded(false), negative(false) {}
    };

    std::shared_ptr<PageFetcher> fetcher_;
    SafetyConfig config_;
    const UrlValidator* validator_;
    FetchGate* gate_;

    mutable std::mutex entries_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::atomic<size_t> fetch_count_;

    std::shared_ptr<Entry> entry_for(const std::string& origin);
    void load(Entry& entry, const std::string& origin, const CancellationToken* cancel);
};

} // namespace safety
} // namespace deepdive

#endif // DEEPDIVE_SAFETY_ROBOTS_CHECKER_HPP
