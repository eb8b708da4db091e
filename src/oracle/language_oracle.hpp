/**
 * @file language_oracle.hpp
 * @brief Abstract interface for pluggable language model backends
 *
 * The research engine treats the model as a stateless text-completion
 * oracle: a prompt and sampling parameters go in, text comes out. Backends
 * are created by OracleFactory and owned by the SessionCache.
 *
 * Design Principles:
 * - Stateless: each complete() call is independent
 * - Not re-entrant: callers serialize generation (SessionCache does this)
 * - Explicit lifecycle: load() before use, dispose() when done
 */

#ifndef DEEPDIVE_LANGUAGE_ORACLE_HPP
#define DEEPDIVE_LANGUAGE_ORACLE_HPP

#include "research_config.hpp"
#include <memory>
#include <string>

namespace deepdive {

/**
 * @brief Oracle metadata
 */
struct OracleInfo {
    std::string name;           ///< Human-readable backend name
    std::string oracle_type;    ///< Registered type, e.g. "llama_server"
    std::string model;          ///< Model identifier as reported by the backend or config
    int context_size;           ///< Context window in tokens

    OracleInfo(
        const std::string& name_,
        const std::string& oracle_type_,
        const std::string& model_ = "",
        int context_size_ = 0
    ) : name(name_), oracle_type(oracle_type_), model(model_), context_size(context_size_) {}
};

/**
 * @brief Abstract text-completion backend
 *
 * Lifecycle:
 *   1. load(config) - connect to or load the model
 *   2. complete(prompt, temperature, max_tokens) - may be called many times
 *   3. dispose() - release the model
 *
 * Usage Example:
 *   @code
 *   OracleFactory factory;
 *   auto oracle = factory.create_oracle("llama_server");
 *   oracle->load(config.oracle);
 *   std::string text = oracle->complete("List three facts about Gutenberg.", 0.4, 150);
 *   oracle->dispose();
 *   @endcode
 */
class LanguageOracle {
public:
    virtual ~LanguageOracle() = default;

    /**
     * @brief Connect to or load the model
     *
     * @throws OracleUnavailable If the backend cannot be reached or the model is missing
     */
    virtual void load(const OracleConfig& config) = 0;

    /**
     * @brief Generate a completion
     *
     * @param prompt Full prompt text
     * @param temperature Sampling temperature
     * @param max_tokens Upper bound on generated tokens
     * @return Generated text (may be empty)
     *
     * @throws OracleUnavailable If the oracle is not loaded or generation fails
     */
    virtual std::string complete(const std::string& prompt, double temperature, int max_tokens) = 0;

    virtual OracleInfo get_info() const = 0;

    /**
     * @brief Release the model
     *
     * @note This method must not throw exceptions
     */
    virtual void dispose() noexcept = 0;

    virtual bool is_loaded() const = 0;
};

} // namespace deepdive

#endif // DEEPDIVE_LANGUAGE_ORACLE_HPP
