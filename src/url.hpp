/**
 * @file url.hpp
 * @brief Minimal absolute URL parsing, resolution and normalization
 */

#ifndef DEEPDIVE_URL_HPP
#define DEEPDIVE_URL_HPP

#include <optional>
#include <string>

namespace deepdive {

/**
 * @brief Components of an absolute hierarchical URL
 *
 * Scheme and host are lower-cased. IPv6 literal hosts are stored without brackets.
 */
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;
    int port;                ///< Explicit port, -1 when absent
    std::string path;        ///< Always starts with '/' (or is empty)
    std::string query;       ///< Without the leading '?'
    bool has_query;
    std::string fragment;    ///< Without the leading '#'
    bool ipv6_literal;

    Url() : port(-1), has_query(false), ipv6_literal(false) {}

    /**
     * @brief Port in effect: explicit port or the scheme default
     */
    int effective_port() const;

    std::string host_for_url() const;

    /**
     * @brief scheme://host[:port], port omitted when it is the scheme default
     */
    std::string origin() const;

    std::string path_and_query() const;

    std::string to_string() const;
};

/**
 * @brief Parse an absolute URL
 *
 * @return Parsed URL, or nullopt for relative references, control characters,
 *         whitespace, an empty host or an out-of-range port
 */
std::optional<Url> parse_url(const std::string& text);

/**
 * @brief Resolve a (possibly relative) reference against an absolute base URL
 *
 * @return Absolute URL, or an empty string when base cannot be parsed
 */
std::string resolve_url(const std::string& base, const std::string& reference);

/**
 * @brief Canonical form used for source deduplication
 *
 * Lower-cases scheme and host, drops the default port, the fragment, tracking
 * parameters (utm_*, fbclid, gclid) and a trailing slash. When ignore_query is
 * set the whole query string is dropped.
 */
std::string normalize_url(const std::string& url, bool ignore_query = false);

/**
 * @brief Decode %XX escapes and '+' in a query component
 */
std::string url_decode(const std::string& value);

/**
 * @brief Encode a string for use as a query parameter value
 */
std::string url_encode(const std::string& value);

int default_port_for_scheme(const std::string& scheme);

} // namespace deepdive

#endif // DEEPDIVE_URL_HPP
