#include "safety/robots_checker.hpp"
#include "logger.hpp"
#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace deepdive {
namespace safety {

namespace {

constexpr size_t MAX_ROBOTS_BYTES = 512 * 1024;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

// "DeepDive/1.0 (+https://...)" -> "deepdive"
std::string product_token(const std::string& user_agent) {
    std::string token = trim(user_agent);
    size_t end = token.find_first_of("/ ;(\t");
    if (end != std::string::npos) {
        token = token.substr(0, end);
    }
    return to_lower(token);
}

} // namespace

RobotsPolicy RobotsPolicy::parse(const std::string& content) {
    RobotsPolicy policy;
    bool collecting_agents = false;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (key == "user-agent") {
            if (!collecting_agents) {
                policy.groups_.emplace_back();
                collecting_agents = true;
            }
            std::string agent = value == "*" ? "*" : product_token(value);
            if (!agent.empty()) {
                policy.groups_.back().agents.push_back(agent);
            }
        } else if (key == "allow" || key == "disallow") {
            collecting_agents = false;
            if (policy.groups_.empty() || value.empty()) {
                continue;
            }
            policy.groups_.back().rules.emplace_back(value, key == "allow");
        } else if (key == "crawl-delay") {
            collecting_agents = false;
        }
    }

    return policy;
}

std::vector<const RobotsRule*> RobotsPolicy::rules_for(const std::string& user_agent) const {
    std::string token = product_token(user_agent);

    size_t best_length = 0;
    for (const auto& group : groups_) {
        for (const auto& agent : group.agents) {
            if (agent != "*" && !token.empty() && token.rfind(agent, 0) == 0) {
                best_length = std::max(best_length, agent.size());
            }
        }
    }

    std::vector<const RobotsRule*> rules;
    for (const auto& group : groups_) {
        bool selected = false;
        for (const auto& agent : group.agents) {
            if (best_length > 0) {
                selected = selected || (agent != "*" && agent.size() == best_length &&
                                        token.rfind(agent, 0) == 0);
            } else {
                selected = selected || agent == "*";
            }
        }
        if (selected) {
            for (const auto& rule : group.rules) {
                rules.push_back(&rule);
            }
        }
    }
    return rules;
}

bool RobotsPolicy::is_allowed(const std::string& path_and_query, const std::string& user_agent) const {
    std::string path = path_and_query.empty() ? "/" : path_and_query;
    if (path == "/robots.txt") {
        return true;
    }

    const RobotsRule* best = nullptr;
    for (const RobotsRule* rule : rules_for(user_agent)) {
        if (!pattern_matches(rule->pattern, path)) {
            continue;
        }
        if (best == nullptr ||
            rule->pattern.size() > best->pattern.size() ||
            (rule->pattern.size() == best->pattern.size() && rule->allow && !best->allow)) {
            best = rule;
        }
    }

    return best == nullptr || best->allow;
}

bool RobotsPolicy::pattern_matches(const std::string& pattern, const std::string& path) {
    bool anchored = !pattern.empty() && pattern.back() == '$';
    std::string p = anchored ? pattern.substr(0, pattern.size() - 1) : pattern;

    size_t pi = 0;
    size_t si = 0;
    size_t star = std::string::npos;
    size_t star_match = 0;

    while (si < path.size()) {
        if (pi == p.size() && !anchored) {
            return true;
        }
        if (pi < p.size() && p[pi] == '*') {
            star = pi++;
            star_match = si;
        } else if (pi < p.size() && p[pi] == path[si]) {
            ++pi;
            ++si;
        } else if (star != std::string::npos) {
            pi = star + 1;
            si = ++star_match;
        } else {
            return false;
        }
    }

    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

RobotsChecker::RobotsChecker(std::shared_ptr<PageFetcher> fetcher,
                             const SafetyConfig& config,
                             const UrlValidator* validator,
                             FetchGate* gate)
    : fetcher_(std::move(fetcher)),
      config_(config),
      validator_(validator),
      gate_(gate),
      fetch_count_(0) {}

size_t RobotsChecker::cached_origins() const {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    return entries_.size();
}

std::shared_ptr<RobotsChecker::Entry> RobotsChecker::entry_for(const std::string& origin) {
    std::lock_guard<std::mutex> lock(entries_mutex_);
    auto& entry = entries_[origin];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

bool RobotsChecker::is_allowed(const std::string& url,
                               const std::string& user_agent,
                               const CancellationToken* cancel) {
    auto parsed = parse_url(url);
    if (!parsed) {
        return false;
    }
    if (parsed->path == "/robots.txt") {
        return true;
    }

    std::string origin = parsed->origin();
    std::shared_ptr<Entry> entry = entry_for(origin);

    std::lock_guard<std::mutex> lock(entry->mutex);
    bool stale = !entry->loaded || (entry->negative && Clock::now() >= entry->expires);
    if (stale) {
        if (is_cancelled(cancel)) {
            return false;
        }
        load(*entry, origin, cancel);
        if (!entry->loaded) {
            // Cancelled mid-download, nothing was cached
            return false;
        }
    }

    return entry->policy.is_allowed(parsed->path_and_query(),
                                    user_agent.empty() ? config_.robots_user_agent : user_agent);
}

void RobotsChecker::load(Entry& entry, const std::string& origin, const CancellationToken* cancel) {
    fetch_count_++;

    std::string robots_url = origin + "/robots.txt";
    std::string failure;

    net::HttpRequest request;
    request.url = robots_url;
    request.user_agent = config_.robots_user_agent;
    request.timeout_ms = config_.robots_timeout_ms;
    request.max_body_bytes = MAX_ROBOTS_BYTES;
    request.cancel = cancel;

    bool fetchable = true;
    std::string host;
    if (auto parsed = parse_url(robots_url)) {
        host = parsed->host;
    }
    if (validator_ != nullptr) {
        ValidationResult validation = validator_->validate(robots_url);
        if (!validation.ok) {
            fetchable = false;
            failure = "robots.txt URL rejected: " + validation.detail;
        } else {
            host = validation.host;
            std::string pin = validation.resolve_entry();
            if (!pin.empty()) {
                request.resolve.push_back(pin);
            }
        }
    }

    if (fetchable) {
        FetchGate::Permit permit;
        if (gate_ != nullptr) {
            permit = gate_->acquire(host, cancel);
            if (!permit) {
                // Cancelled while queued, leave the entry unloaded
                return;
            }
        }
        try {
            net::HttpResponse response = fetcher_->fetch(request);
            if (response.status_code >= 200 && response.status_code < 300) {
                entry.policy = RobotsPolicy::parse(response.body);
                entry.loaded = true;
                entry.negative = false;
                Logger::get_instance().debug("robots.txt loaded", {
                    {"origin", origin},
                    {"groups", std::to_string(entry.policy.group_count())}
                });
                return;
            }
            failure = "HTTP " + std::to_string(response.status_code);
        } catch (const net::HttpClientError& e) {
            if (e.kind() == net::HttpClientError::Kind::CANCELLED) {
                return;
            }
            failure = e.what();
        }
    }

    entry.policy = RobotsPolicy();
    entry.loaded = true;
    entry.negative = true;
    entry.expires = Clock::now() + std::chrono::seconds(config_.robots_negative_ttl_s);

    Logger::get_instance().debug("robots.txt unavailable, allowing", {
        {"origin", origin}, {"reason", failure}
    });
}

} // namespace safety
} // namespace deepdive
