/**
 * @file session_cache.hpp
 * @brief Process-wide language model handle and conversation history
 *
 * The SessionCache owns the only oracle instance of the process. It is
 * created lazily on first use, reused by every research session and torn
 * down on release() or at process exit. Generation calls are serialized:
 * at most one complete() is in flight at any time and others queue.
 *
 * Design Pattern: Singleton resource holder with lazy initialization
 */

#ifndef DEEPDIVE_SESSION_CACHE_HPP
#define DEEPDIVE_SESSION_CACHE_HPP

#include "oracle/language_oracle.hpp"
#include "oracle/oracle_factory.hpp"
#include "research_config.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Loaded oracle and when it was loaded
 */
struct CacheEntry {
    std::unique_ptr<LanguageOracle> oracle;
    std::chrono::system_clock::time_point load_timestamp;
};

/**
 * @brief One archived query/answer pair
 */
struct HistoryEntry {
    std::string query;
    std::string answer;
    std::chrono::system_clock::time_point timestamp;

    HistoryEntry() : timestamp(std::chrono::system_clock::now()) {}
    HistoryEntry(const std::string& query_, const std::string& answer_)
        : query(query_), answer(answer_), timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief Shared oracle handle and query history
 *
 * Usage Example:
 *   @code
 *   SessionCache& cache = SessionCache::get_instance();
 *   cache.configure(config.oracle);
 *   std::string text = cache.generate(prompt, 0.6, 2048);   // loads on first call
 *   cache.add_exchange(query, text);
 *   cache.release();
 *   @endcode
 */
class SessionCache {
public:
    using OracleCreator = std::function<std::unique_ptr<LanguageOracle>()>;

    static SessionCache& get_instance();

    /**
     * @brief Set the oracle configuration, releasing any loaded oracle
     *
     * @param config Oracle type, endpoint and timeouts
     * @param creator Optional override of the factory, used to inject test oracles
     */
    void configure(const OracleConfig& config, OracleCreator creator = nullptr);

    /**
     * @brief Create and load the oracle if not already loaded
     *
     * @throws OracleLoadFailed If loading fails
     * @throws ConfigurationError If the oracle type is unknown
     */
    void acquire();

    /**
     * @brief Serialized generation on the shared oracle, acquiring it first if needed
     *
     * @throws OracleLoadFailed If the oracle cannot be loaded
     * @throws OracleUnavailable If generation fails
     */
    std::string generate(const std::string& prompt, double temperature, int max_tokens);

    /**
     * @brief Dispose the oracle; the next acquire() loads it again
     */
    void release() noexcept;

    bool is_loaded() const;

    std::optional<std::chrono::system_clock::time_point> load_timestamp() const;

    /**
     * @brief Number of successful loads since process start
     */
    size_t load_count() const;

    /**
     * @throws OracleUnavailable If no oracle is loaded
     */
    OracleInfo info() const;

    void add_exchange(const std::string& query, const std::string& answer);
    std::vector<HistoryEntry> history() const;
    void clear_history();

    /**
     * @brief Oldest entries are dropped beyond this many (default 20)
     */
    void set_history_limit(size_t limit);

private:
    SessionCache();
    ~SessionCache();

    SessionCache(const SessionCache&) = delete;
    SessionCache& operator=(const SessionCache&) = delete;
    SessionCache(SessionCache&&) = delete;
    SessionCache& operator=(SessionCache&&) = delete;

    // Lock order: generation_mutex_ before mutex_
    std::mutex generation_mutex_;
    mutable std::mutex mutex_;
    OracleConfig config_;
    OracleCreator creator_;
    OracleFactory factory_;
    std::optional<CacheEntry> entry_;
    size_t load_count_;

    mutable std::mutex history_mutex_;
    std::vector<HistoryEntry> history_;
    size_t history_limit_;

    LanguageOracle& acquire_locked();
    void release_locked() noexcept;
};

} // namespace deepdive

#endif // DEEPDIVE_SESSION_CACHE_HPP
