#include "oracle/oracle_factory.hpp"
#include "oracle/llama_server_oracle.hpp"

namespace deepdive {

OracleFactory::OracleFactory() {
    registry_[OracleType::LLAMA_SERVER] = create_llama_server_oracle;
}

std::unique_ptr<LanguageOracle> OracleFactory::create_oracle(const std::string& oracle_type) const {
    auto it = registry_.find(oracle_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw ConfigurationError("Unknown oracle type: " + oracle_type + ". Available types: " + types);
    }

    return it->second();
}

void OracleFactory::register_oracle(const std::string& oracle_type, FactoryFunction factory_fn) {
    if (registry_.find(oracle_type) != registry_.end()) {
        throw ConfigurationError("Oracle type already registered: " + oracle_type);
    }
    registry_[oracle_type] = std::move(factory_fn);
}

bool OracleFactory::is_registered(const std::string& oracle_type) const {
    return registry_.find(oracle_type) != registry_.end();
}

std::vector<std::string> OracleFactory::list_oracle_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

std::unique_ptr<LanguageOracle> OracleFactory::create_llama_server_oracle() {
    return std::make_unique<LlamaServerOracle>();
}

} // namespace deepdive
