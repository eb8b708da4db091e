/**
 * @file oracle_factory.hpp
 * @brief Factory for creating language oracles by type
 *
 * Design Pattern: Factory Method with Registry
 * - Each backend registers a factory function under a type string
 * - The session cache requests oracles by the configured oracle.type
 */

#ifndef DEEPDIVE_ORACLE_FACTORY_HPP
#define DEEPDIVE_ORACLE_FACTORY_HPP

#include "oracle/language_oracle.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace deepdive {

/**
 * @brief Oracle type identifiers
 */
namespace OracleType {
    constexpr const char* LLAMA_SERVER = "llama_server";
}

/**
 * @brief Factory for creating oracle instances
 *
 * Usage Example:
 *   @code
 *   OracleFactory factory;
 *   factory.register_oracle("scripted", [] { return std::make_unique<ScriptedOracle>(); });
 *   auto oracle = factory.create_oracle("scripted");
 *   @endcode
 */
class OracleFactory {
public:
    using FactoryFunction = std::function<std::unique_ptr<LanguageOracle>()>;

    /**
     * @brief Constructor - registers built-in oracle types
     */
    OracleFactory();

    /**
     * @throws ConfigurationError If oracle_type is unknown
     */
    std::unique_ptr<LanguageOracle> create_oracle(const std::string& oracle_type) const;

    /**
     * @throws ConfigurationError If oracle_type is already registered
     */
    void register_oracle(const std::string& oracle_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& oracle_type) const;

    std::vector<std::string> list_oracle_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;

    static std::unique_ptr<LanguageOracle> create_llama_server_oracle();
};

} // namespace deepdive

#endif // DEEPDIVE_ORACLE_FACTORY_HPP
