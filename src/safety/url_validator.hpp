/**
 * @file url_validator.hpp
 * @brief Server-side request forgery guard for outbound fetches
 *
 * Every URL the retrieval pipeline is about to fetch (including every redirect
 * hop and robots.txt) passes through UrlValidator::validate(). A URL is only
 * accepted when its scheme and port are allowed and every address its host
 * resolves to is publicly routable. The resolved addresses are returned so the
 * fetch can be pinned to them, closing the DNS-rebinding window between
 * validation and connection.
 */

#ifndef DEEPDIVE_SAFETY_URL_VALIDATOR_HPP
#define DEEPDIVE_SAFETY_URL_VALIDATOR_HPP

#include "research_config.hpp"
#include <functional>
#include <string>
#include <vector>

namespace deepdive {
namespace safety {

enum class RejectReason {
    NONE,
    MALFORMED,
    BAD_SCHEME,
    TOO_LONG,
    DISALLOWED_PORT,
    NUMERIC_HOST,        ///< Integer, octal or hex host encodings
    INTERNAL_ADDRESS,    ///< Loopback, private, link-local, multicast, reserved
    UNRESOLVABLE
};

inline std::string reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::MALFORMED: return "MALFORMED";
        case RejectReason::BAD_SCHEME: return "BAD_SCHEME";
        case RejectReason::TOO_LONG: return "TOO_LONG";
        case RejectReason::DISALLOWED_PORT: return "DISALLOWED_PORT";
        case RejectReason::NUMERIC_HOST: return "NUMERIC_HOST";
        case RejectReason::INTERNAL_ADDRESS: return "INTERNAL_ADDRESS";
        case RejectReason::UNRESOLVABLE: return "UNRESOLVABLE";
        default: return "UNKNOWN";
    }
}

struct ValidationResult {
    bool ok;
    RejectReason reason;
    std::string detail;
    std::string host;
    int port;
    std::vector<std::string> addresses;   ///< Validated addresses to pin the connection to

    ValidationResult() : ok(false), reason(RejectReason::MALFORMED), port(0) {}

    /**
     * @brief CURLOPT_RESOLVE entry pinning host:port to the validated addresses
     */
    std::string resolve_entry() const;
};

class UrlValidator {
public:
    /**
     * @brief Host name to textual IP addresses; empty result means "does not resolve"
     */
    using Resolver = std::function<std::vector<std::string>(const std::string& host)>;

    /**
     * @param config Port policy and length limit
     * @param resolver DNS resolver, system_resolve when empty
     */
    explicit UrlValidator(const SafetyConfig& config = SafetyConfig(), Resolver resolver = nullptr);

    ValidationResult validate(const std::string& url) const;

    /**
     * @brief True for any address a fetch must never reach
     *
     * Unparseable input counts as internal.
     */
    static bool is_internal_address(const std::string& address);

    /**
     * @brief getaddrinfo-based resolver returning every A/AAAA address
     */
    static std::vector<std::string> system_resolve(const std::string& host);

private:
    SafetyConfig config_;
    Resolver resolver_;

    bool is_port_allowed(int port) const;
};

} // namespace safety
} // namespace deepdive

#endif // DEEPDIVE_SAFETY_URL_VALIDATOR_HPP
