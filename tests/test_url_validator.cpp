/**
 * @file test_url_validator.cpp
 * @brief Unit tests for the outbound URL guard
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/safety/url_validator.hpp"
#include <map>
#include <stdexcept>

using namespace deepdive;
using namespace deepdive::safety;

namespace {

UrlValidator::Resolver table_resolver(std::map<std::string, std::vector<std::string>> table) {
    return [table](const std::string& host) -> std::vector<std::string> {
        if (host == "explode.example") {
            throw std::runtime_error("resolver crashed");
        }
        auto it = table.find(host);
        return it == table.end() ? std::vector<std::string>() : it->second;
    };
}

UrlValidator make_validator() {
    return UrlValidator(SafetyConfig(), table_resolver({
        {"example.com", {"93.184.216.34"}},
        {"dual.example", {"93.184.216.34", "2606:2800:220:1:248:1893:25c8:1946"}},
        {"rebind.example", {"93.184.216.34", "10.1.2.3"}},
        {"metadata.example", {"169.254.169.254"}},
        {"v6local.example", {"fd00::1"}},
    }));
}

} // namespace

TEST_CASE("UrlValidator: accepts public URLs", "[safety][url_validator]") {
    UrlValidator validator = make_validator();

    SECTION("resolved host is pinned") {
        ValidationResult result = validator.validate("https://example.com/article");
        REQUIRE(result.ok);
        REQUIRE(result.reason == RejectReason::NONE);
        REQUIRE(result.host == "example.com");
        REQUIRE(result.port == 443);
        REQUIRE(result.addresses == std::vector<std::string>{"93.184.216.34"});
        REQUIRE(result.resolve_entry() == "example.com:443:93.184.216.34");
    }

    SECTION("IPv6 addresses are bracketed in the pin entry") {
        ValidationResult result = validator.validate("http://dual.example/");
        REQUIRE(result.ok);
        REQUIRE(result.resolve_entry() ==
                "dual.example:80:93.184.216.34,[2606:2800:220:1:248:1893:25c8:1946]");
    }

    SECTION("public IPv4 literal needs no resolution") {
        ValidationResult result = validator.validate("http://93.184.216.34/");
        REQUIRE(result.ok);
        REQUIRE(result.resolve_entry().empty());
    }
}

TEST_CASE("UrlValidator: scheme, length and port policy", "[safety][url_validator]") {
    UrlValidator validator = make_validator();

    REQUIRE(validator.validate("ftp://example.com/file").reason == RejectReason::BAD_SCHEME);
    REQUIRE(validator.validate("file:///etc/passwd").reason == RejectReason::MALFORMED);
    REQUIRE(validator.validate("gopher://example.com/").reason == RejectReason::BAD_SCHEME);
    REQUIRE(validator.validate("not a url").reason == RejectReason::MALFORMED);
    REQUIRE(validator.validate("http://user:pw@example.com/").reason == RejectReason::MALFORMED);
    REQUIRE(validator.validate("http://example.com:8080/").reason == RejectReason::DISALLOWED_PORT);
    REQUIRE(validator.validate("https://example.com:22/").reason == RejectReason::DISALLOWED_PORT);

    std::string long_url = "https://example.com/" + std::string(3000, 'a');
    REQUIRE(validator.validate(long_url).reason == RejectReason::TOO_LONG);

    SECTION("denied ports win over allowed ports") {
        SafetyConfig config;
        config.allowed_ports = {80, 443, 8080};
        config.denied_ports = {8080};
        UrlValidator strict(config, table_resolver({{"example.com", {"93.184.216.34"}}}));
        REQUIRE(strict.validate("http://example.com:8080/").reason == RejectReason::DISALLOWED_PORT);
    }
}

TEST_CASE("UrlValidator: internal destinations are refused", "[safety][url_validator]") {
    UrlValidator validator = make_validator();

    SECTION("literal addresses") {
        REQUIRE(validator.validate("http://127.0.0.1/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://10.0.0.8/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://192.168.1.1/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://172.20.0.1/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://169.254.169.254/latest/meta-data").reason ==
                RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://0.0.0.0/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://[::1]/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://[::ffff:127.0.0.1]/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://[fe80::1]/").reason == RejectReason::INTERNAL_ADDRESS);
    }

    SECTION("local host names") {
        REQUIRE(validator.validate("http://localhost/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://LOCALHOST./").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("http://api.localhost/").reason == RejectReason::INTERNAL_ADDRESS);
    }

    SECTION("alternate numeric encodings") {
        REQUIRE(validator.validate("http://2130706433/").reason == RejectReason::NUMERIC_HOST);
        REQUIRE(validator.validate("http://0x7f000001/").reason == RejectReason::NUMERIC_HOST);
        REQUIRE(validator.validate("http://0177.0.0.1/").reason == RejectReason::NUMERIC_HOST);
        REQUIRE(validator.validate("http://127.1/").reason == RejectReason::NUMERIC_HOST);
    }

    SECTION("names resolving to internal addresses") {
        REQUIRE(validator.validate("https://metadata.example/").reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(validator.validate("https://v6local.example/").reason == RejectReason::INTERNAL_ADDRESS);
    }

    SECTION("one internal address among several is enough") {
        ValidationResult result = validator.validate("https://rebind.example/");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.reason == RejectReason::INTERNAL_ADDRESS);
        REQUIRE(result.detail.find("10.1.2.3") != std::string::npos);
    }
}

TEST_CASE("UrlValidator: resolution failures", "[safety][url_validator]") {
    UrlValidator validator = make_validator();

    REQUIRE(validator.validate("https://unknown.example/").reason == RejectReason::UNRESOLVABLE);

    ValidationResult crashed = validator.validate("https://explode.example/");
    REQUIRE(crashed.reason == RejectReason::UNRESOLVABLE);
    REQUIRE(crashed.detail.find("resolver crashed") != std::string::npos);
}

TEST_CASE("UrlValidator: address classification", "[safety][url_validator]") {
    REQUIRE(UrlValidator::is_internal_address("127.0.0.1"));
    REQUIRE(UrlValidator::is_internal_address("100.64.0.1"));
    REQUIRE(UrlValidator::is_internal_address("224.0.0.1"));
    REQUIRE(UrlValidator::is_internal_address("255.255.255.255"));
    REQUIRE(UrlValidator::is_internal_address("fc00::1"));
    REQUIRE(UrlValidator::is_internal_address("ff02::1"));
    REQUIRE(UrlValidator::is_internal_address("64:ff9b::a00:1"));
    REQUIRE(UrlValidator::is_internal_address("garbage"));

    REQUIRE_FALSE(UrlValidator::is_internal_address("8.8.8.8"));
    REQUIRE_FALSE(UrlValidator::is_internal_address("93.184.216.34"));
    REQUIRE_FALSE(UrlValidator::is_internal_address("2606:4700:4700::1111"));
    REQUIRE_FALSE(UrlValidator::is_internal_address("::ffff:8.8.8.8"));
}
