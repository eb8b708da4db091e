#ifndef DEEPDIVE_CONFIG_PARSER_HPP
#define DEEPDIVE_CONFIG_PARSER_HPP

#include "research_config.hpp"
#include <stdexcept>
#include <string>

namespace deepdive {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a research configuration from a JSON file
 *
 * Relative paths (the log file) are resolved against the directory of the file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed and validated configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 * @throws ConfigurationError if a value is out of range
 */
ResearchConfig parse_research_config_from_file(const std::string& file_path);

/**
 * @brief Parses a research configuration from a JSON string
 *
 * Missing sections and fields keep their defaults. String values undergo
 * environment variable expansion.
 *
 * @param json_string JSON configuration as string
 * @return Parsed and validated configuration
 * @throws ConfigParseError if JSON is invalid or a field has the wrong type
 * @throws ConfigurationError if a value is out of range
 */
ResearchConfig parse_research_config_from_string(const std::string& json_string);

/**
 * @brief Applies DEEPDIVE_ORACLE_URL and DEEPDIVE_ORACLE_API_KEY when set
 */
void apply_environment_overrides(ResearchConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path (absolute paths are returned unchanged)
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace deepdive

#endif // DEEPDIVE_CONFIG_PARSER_HPP
