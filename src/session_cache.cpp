#include "session_cache.hpp"
#include "logger.hpp"

namespace deepdive {

SessionCache& SessionCache::get_instance() {
    static SessionCache instance;
    return instance;
}

SessionCache::SessionCache() : load_count_(0), history_limit_(20) {}

SessionCache::~SessionCache() {
    release();
}

void SessionCache::configure(const OracleConfig& config, OracleCreator creator) {
    std::lock_guard<std::mutex> generation_lock(generation_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    release_locked();
    config_ = config;
    creator_ = std::move(creator);
}

LanguageOracle& SessionCache::acquire_locked() {
    if (entry_) {
        return *entry_->oracle;
    }

    std::unique_ptr<LanguageOracle> oracle = creator_ ? creator_() : factory_.create_oracle(config_.type);
    if (!oracle) {
        throw OracleLoadFailed("no oracle could be created for type '" + config_.type + "'");
    }

    try {
        oracle->load(config_);
    } catch (const OracleLoadFailed&) {
        throw;
    } catch (const OracleUnavailable& e) {
        throw OracleLoadFailed(e.detail());
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleLoadFailed(e.what());
    }

    CacheEntry entry;
    entry.oracle = std::move(oracle);
    entry.load_timestamp = std::chrono::system_clock::now();
    entry_ = std::move(entry);
    ++load_count_;

    Logger::get_instance().debug("Language model loaded", {
        {"type", config_.type}, {"model", entry_->oracle->get_info().model}
    });
    return *entry_->oracle;
}

void SessionCache::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    acquire_locked();
}

std::string SessionCache::generate(const std::string& prompt, double temperature, int max_tokens) {
    std::lock_guard<std::mutex> generation_lock(generation_mutex_);

    LanguageOracle* oracle = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        oracle = &acquire_locked();
    }

    try {
        return oracle->complete(prompt, temperature, max_tokens);
    } catch (const ResearchError&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleUnavailable(std::string("generation failed: ") + e.what());
    }
}

void SessionCache::release_locked() noexcept {
    if (entry_) {
        entry_->oracle->dispose();
        entry_.reset();
    }
}

void SessionCache::release() noexcept {
    std::lock_guard<std::mutex> generation_lock(generation_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    release_locked();
}

bool SessionCache::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_.has_value();
}

std::optional<std::chrono::system_clock::time_point> SessionCache::load_timestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entry_) {
        return std::nullopt;
    }
    return entry_->load_timestamp;
}

size_t SessionCache::load_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_count_;
}

OracleInfo SessionCache::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entry_) {
        throw OracleUnavailable("oracle not loaded");
    }
    return entry_->oracle->get_info();
}

void SessionCache::add_exchange(const std::string& query, const std::string& answer) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.emplace_back(query, answer);
    while (history_.size() > history_limit_) {
        history_.erase(history_.begin());
    }
}

std::vector<HistoryEntry> SessionCache::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

void SessionCache::clear_history() {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.clear();
}

void SessionCache::set_history_limit(size_t limit) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_limit_ = limit;
    while (history_.size() > history_limit_) {
        history_.erase(history_.begin());
    }
}

} // namespace deepdive
