#include "safety/url_validator.hpp"
#include "url.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace deepdive {
namespace safety {

namespace {

bool is_internal_v4(uint32_t a) {
    uint32_t first = a >> 24;
    if (first == 0 || first == 10 || first == 127) return true;      // this-network, private, loopback
    if ((a & 0xFFC00000u) == 0x64400000u) return true;               // 100.64.0.0/10 carrier-grade NAT
    if ((a & 0xFFFF0000u) == 0xA9FE0000u) return true;               // 169.254.0.0/16 link-local
    if ((a & 0xFFF00000u) == 0xAC100000u) return true;               // 172.16.0.0/12
    if ((a & 0xFFFFFF00u) == 0xC0000000u) return true;               // 192.0.0.0/24
    if ((a & 0xFFFFFF00u) == 0xC0000200u) return true;               // 192.0.2.0/24
    if ((a & 0xFFFF0000u) == 0xC0A80000u) return true;               // 192.168.0.0/16
    if ((a & 0xFFFE0000u) == 0xC6120000u) return true;               // 198.18.0.0/15
    if ((a & 0xFFFFFF00u) == 0xC6336400u) return true;               // 198.51.100.0/24
    if ((a & 0xFFFFFF00u) == 0xCB007100u) return true;               // 203.0.113.0/24
    if (first >= 224) return true;                                   // multicast, reserved, broadcast
    return false;
}

uint32_t v4_from_bytes(const unsigned char* b) {
    return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

bool all_zero(const unsigned char* b, size_t count) {
    return std::all_of(b, b + count, [](unsigned char c) { return c == 0; });
}

bool is_internal_v6(const unsigned char* b) {
    if (all_zero(b, 16)) return true;                                      // ::
    if (all_zero(b, 15) && b[15] == 1) return true;                        // ::1
    if (all_zero(b, 10) && b[10] == 0xff && b[11] == 0xff) {               // ::ffff:a.b.c.d
        return is_internal_v4(v4_from_bytes(b + 12));
    }
    if (all_zero(b, 12)) return true;                                      // ::a.b.c.d (deprecated)
    if (b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xff && b[3] == 0x9b &&
        all_zero(b + 4, 8)) {                                              // 64:ff9b::/96 NAT64
        return is_internal_v4(v4_from_bytes(b + 12));
    }
    if (b[0] == 0x20 && b[1] == 0x02) {                                    // 2002::/16 6to4
        return is_internal_v4(v4_from_bytes(b + 2));
    }
    if (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) return true;                // fe80::/10 link-local
    if (b[0] == 0xfe && (b[1] & 0xc0) == 0xc0) return true;                // fec0::/10 site-local
    if ((b[0] & 0xfe) == 0xfc) return true;                                // fc00::/7 unique-local
    if (b[0] == 0xff) return true;                                         // ff00::/8 multicast
    if (b[0] == 0x20 && b[1] == 0x01 && b[2] == 0x0d && b[3] == 0xb8) {    // 2001:db8::/32
        return true;
    }
    return false;
}

bool is_numeric_label(const std::string& label) {
    if (label.empty()) {
        return false;
    }
    if (label.size() >= 2 && label[0] == '0' && (label[1] == 'x' || label[1] == 'X')) {
        return std::all_of(label.begin() + 2, label.end(),
                           [](unsigned char c) { return std::isxdigit(c) != 0; });
    }
    return std::all_of(label.begin(), label.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split_labels(const std::string& host) {
    std::vector<std::string> labels;
    size_t start = 0;
    while (true) {
        size_t dot = host.find('.', start);
        labels.push_back(host.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return labels;
}

// Dotted quad with four decimal octets and no leading zeros
bool is_canonical_ipv4(const std::vector<std::string>& labels) {
    if (labels.size() != 4) {
        return false;
    }
    for (const auto& label : labels) {
        if (label.empty() || label.size() > 3 ||
            !std::all_of(label.begin(), label.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        if (label.size() > 1 && label[0] == '0') {
            return false;
        }
        if (std::stoi(label) > 255) {
            return false;
        }
    }
    return true;
}

ValidationResult reject(RejectReason reason, const std::string& detail) {
    ValidationResult result;
    result.ok = false;
    result.reason = reason;
    result.detail = detail;
    return result;
}

} // namespace

std::string ValidationResult::resolve_entry() const {
    if (addresses.empty() || (addresses.size() == 1 && addresses[0] == host)) {
        return "";
    }
    std::string entry = host + ":" + std::to_string(port) + ":";
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) entry += ",";
        if (addresses[i].find(':') != std::string::npos) {
            entry += "[" + addresses[i] + "]";
        } else {
            entry += addresses[i];
        }
    }
    return entry;
}

UrlValidator::UrlValidator(const SafetyConfig& config, Resolver resolver)
    : config_(config), resolver_(std::move(resolver)) {
    if (!resolver_) {
        resolver_ = &UrlValidator::system_resolve;
    }
}

bool UrlValidator::is_port_allowed(int port) const {
    if (std::find(config_.denied_ports.begin(), config_.denied_ports.end(), port) !=
        config_.denied_ports.end()) {
        return false;
    }
    return std::find(config_.allowed_ports.begin(), config_.allowed_ports.end(), port) !=
           config_.allowed_ports.end();
}

ValidationResult UrlValidator::validate(const std::string& url) const {
    if (url.size() > config_.max_url_length) {
        return reject(RejectReason::TOO_LONG,
                      "URL length " + std::to_string(url.size()) + " exceeds " +
                      std::to_string(config_.max_url_length));
    }

    auto parsed = parse_url(url);
    if (!parsed) {
        return reject(RejectReason::MALFORMED, "URL could not be parsed");
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return reject(RejectReason::BAD_SCHEME, "scheme '" + parsed->scheme + "' is not allowed");
    }
    if (!parsed->userinfo.empty()) {
        return reject(RejectReason::MALFORMED, "embedded credentials are not allowed");
    }

    std::string host = parsed->host;
    int port = parsed->effective_port();

    if (!is_port_allowed(port)) {
        return reject(RejectReason::DISALLOWED_PORT, "port " + std::to_string(port) + " is not allowed");
    }

    ValidationResult result;
    result.host = host;
    result.port = port;

    if (parsed->ipv6_literal) {
        in6_addr v6;
        if (inet_pton(AF_INET6, host.c_str(), &v6) != 1) {
            return reject(RejectReason::MALFORMED, "invalid IPv6 literal");
        }
        if (is_internal_address(host)) {
            return reject(RejectReason::INTERNAL_ADDRESS, "address " + host + " is internal");
        }
        result.ok = true;
        result.reason = RejectReason::NONE;
        result.addresses.push_back(host);
        return result;
    }

    for (char c : host) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '.' && c != '_') {
            return reject(RejectReason::MALFORMED, "invalid character in host");
        }
    }

    std::string bare_host = host;
    if (!bare_host.empty() && bare_host.back() == '.') {
        bare_host.pop_back();
    }
    std::vector<std::string> labels = split_labels(bare_host);
    if (std::any_of(labels.begin(), labels.end(), [](const std::string& l) { return l.empty(); })) {
        return reject(RejectReason::MALFORMED, "empty label in host");
    }

    if (bare_host == "localhost" ||
        (bare_host.size() > 10 && bare_host.compare(bare_host.size() - 10, 10, ".localhost") == 0)) {
        return reject(RejectReason::INTERNAL_ADDRESS, "host " + host + " is local");
    }

    if (is_numeric_label(labels.back())) {
        if (!is_canonical_ipv4(labels)) {
            return reject(RejectReason::NUMERIC_HOST, "non-canonical numeric host " + host);
        }
        if (is_internal_address(bare_host)) {
            return reject(RejectReason::INTERNAL_ADDRESS, "address " + bare_host + " is internal");
        }
        result.ok = true;
        result.reason = RejectReason::NONE;
        result.addresses.push_back(bare_host);
        return result;
    }

    std::vector<std::string> addresses;
    try {
        addresses = resolver_(bare_host);
    } catch (const std::exception& e) {
        return reject(RejectReason::UNRESOLVABLE, "resolution of " + host + " failed: " + e.what());
    }
    if (addresses.empty()) {
        return reject(RejectReason::UNRESOLVABLE, "host " + host + " does not resolve");
    }

    for (const auto& address : addresses) {
        if (is_internal_address(address)) {
            return reject(RejectReason::INTERNAL_ADDRESS,
                          "host " + host + " resolves to internal address " + address);
        }
    }

    result.ok = true;
    result.reason = RejectReason::NONE;
    result.addresses = addresses;
    return result;
}

bool UrlValidator::is_internal_address(const std::string& address) {
    in_addr v4;
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return is_internal_v4(ntohl(v4.s_addr));
    }
    in6_addr v6;
    if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
        return is_internal_v6(v6.s6_addr);
    }
    return true;
}

std::vector<std::string> UrlValidator::system_resolve(const std::string& host) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* info = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &info) != 0 || info == nullptr) {
        return {};
    }

    std::vector<std::string> addresses;
    char buffer[INET6_ADDRSTRLEN];
    for (addrinfo* it = info; it != nullptr; it = it->ai_next) {
        const char* text = nullptr;
        if (it->ai_family == AF_INET) {
            auto* sin = reinterpret_cast<sockaddr_in*>(it->ai_addr);
            text = inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer));
        } else if (it->ai_family == AF_INET6) {
            auto* sin6 = reinterpret_cast<sockaddr_in6*>(it->ai_addr);
            text = inet_ntop(AF_INET6, &sin6->sin6_addr, buffer, sizeof(buffer));
        }
        if (text && std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
            addresses.emplace_back(text);
        }
    }
    freeaddrinfo(info);

    return addresses;
}

} // namespace safety
} // namespace deepdive
