/**
 * @file test_robots_checker.cpp
 * @brief Unit tests for robots.txt parsing and the per-origin policy cache
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/safety/robots_checker.hpp"
#include "test_doubles.hpp"
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace deepdive;
using namespace deepdive::safety;
using namespace deepdive::testing;

TEST_CASE("RobotsPolicy: pattern matching", "[safety][robots]") {
    REQUIRE(RobotsPolicy::pattern_matches("/private", "/private/page"));
    REQUIRE(RobotsPolicy::pattern_matches("/", "/anything"));
    REQUIRE_FALSE(RobotsPolicy::pattern_matches("/private", "/public"));

    SECTION("wildcards") {
        REQUIRE(RobotsPolicy::pattern_matches("/*.pdf", "/docs/report.pdf"));
        REQUIRE(RobotsPolicy::pattern_matches("/a*c", "/abbbc/d"));
        REQUIRE_FALSE(RobotsPolicy::pattern_matches("/a*c", "/abbb"));
    }

    SECTION("end anchor") {
        REQUIRE(RobotsPolicy::pattern_matches("/*.pdf$", "/docs/report.pdf"));
        REQUIRE_FALSE(RobotsPolicy::pattern_matches("/*.pdf$", "/docs/report.pdf?x=1"));
        REQUIRE(RobotsPolicy::pattern_matches("/exact$", "/exact"));
        REQUIRE_FALSE(RobotsPolicy::pattern_matches("/exact$", "/exact/more"));
    }
}

TEST_CASE("RobotsPolicy: group selection and precedence", "[safety][robots]") {
    const std::string robots =
        "# comment line\n"
        "User-agent: *\n"
        "Disallow: /private\n"
        "Allow: /private/press\n"
        "\n"
        "User-agent: DeepDive\n"
        "User-agent: OtherBot\n"
        "Disallow: /archive\n"
        "Crawl-delay: 5\n"
        "\n"
        "User-agent: BadBot\n"
        "Disallow: /\n";

    RobotsPolicy policy = RobotsPolicy::parse(robots);
    REQUIRE(policy.group_count() == 3);

    SECTION("wildcard group applies to unknown agents") {
        REQUIRE_FALSE(policy.is_allowed("/private/data", "Mozilla/5.0 (X11; Linux x86_64)"));
        REQUIRE(policy.is_allowed("/private/press/release", "Mozilla/5.0"));
        REQUIRE(policy.is_allowed("/archive/1999", "Mozilla/5.0"));
    }

    SECTION("named group replaces the wildcard group") {
        REQUIRE_FALSE(policy.is_allowed("/archive/1999", "DeepDive/1.0 (+https://example.org/bot)"));
        REQUIRE(policy.is_allowed("/private/data", "deepdive"));
        REQUIRE_FALSE(policy.is_allowed("/archive", "OtherBot"));
    }

    SECTION("full disallow") {
        REQUIRE_FALSE(policy.is_allowed("/", "BadBot/2.1"));
        REQUIRE_FALSE(policy.is_allowed("/any/path?q=1", "BadBot"));
    }

    SECTION("robots.txt itself is always allowed") {
        REQUIRE(policy.is_allowed("/robots.txt", "BadBot"));
    }

    SECTION("equal length tie goes to allow") {
        RobotsPolicy tie = RobotsPolicy::parse("User-agent: *\nDisallow: /page\nAllow: /page\n");
        REQUIRE(tie.is_allowed("/page", "x"));
    }

    SECTION("empty disallow allows everything") {
        RobotsPolicy open = RobotsPolicy::parse("User-agent: *\nDisallow:\n");
        REQUIRE(open.is_allowed("/anything", "x"));
    }

    SECTION("rules before any user-agent line are ignored") {
        RobotsPolicy orphan = RobotsPolicy::parse("Disallow: /\n");
        REQUIRE(orphan.group_count() == 0);
        REQUIRE(orphan.is_allowed("/", "x"));
    }
}

TEST_CASE("RobotsChecker: caches one policy per origin", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    fetcher->add_robots("https://news.example", "User-agent: *\nDisallow: /members\n");

    RobotsChecker checker(fetcher, SafetyConfig());

    REQUIRE(checker.is_allowed("https://news.example/story/1", "DeepDive"));
    REQUIRE_FALSE(checker.is_allowed("https://news.example/members/area", "DeepDive"));
    REQUIRE(checker.is_allowed("https://news.example/story/2?page=3", "DeepDive"));

    REQUIRE(checker.fetch_count() == 1);
    REQUIRE(checker.cached_origins() == 1);
    REQUIRE(fetcher->count_for("https://news.example/robots.txt") == 1);

    SECTION("different port is a different origin") {
        SafetyConfig config;
        config.allowed_ports = {80, 443, 8443};
        RobotsChecker other(fetcher, config);
        other.is_allowed("https://news.example/a", "DeepDive");
        other.is_allowed("https://news.example:8443/a", "DeepDive");
        REQUIRE(other.cached_origins() == 2);
    }
}

TEST_CASE("RobotsChecker: unavailable robots.txt allows everything", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    fetcher->add_page("https://error.example/robots.txt", "oops", "text/plain", 503);
    fetcher->add_timeouts("https://slow.example/robots.txt", 10);

    RobotsChecker checker(fetcher, SafetyConfig());

    REQUIRE(checker.is_allowed("https://missing.example/page", "DeepDive"));
    REQUIRE(checker.is_allowed("https://error.example/page", "DeepDive"));
    REQUIRE(checker.is_allowed("https://slow.example/page", "DeepDive"));

    SECTION("negative entries are kept until the TTL expires") {
        REQUIRE(checker.is_allowed("https://missing.example/other", "DeepDive"));
        REQUIRE(fetcher->count_for("https://missing.example/robots.txt") == 1);
    }

    SECTION("zero TTL retries on the next check") {
        SafetyConfig config;
        config.robots_negative_ttl_s = 0;
        RobotsChecker retrying(fetcher, config);
        retrying.is_allowed("https://missing.example/a", "DeepDive");
        retrying.is_allowed("https://missing.example/b", "DeepDive");
        REQUIRE(retrying.fetch_count() == 2);
    }
}

TEST_CASE("RobotsChecker: request details", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    fetcher->add_robots("https://pinned.example", "User-agent: *\nAllow: /\n");

    SafetyConfig config;
    config.robots_user_agent = "DeepDive";
    config.robots_timeout_ms = 1234;
    UrlValidator validator(config, fake_resolver());
    RobotsChecker checker(fetcher, config, &validator);

    REQUIRE(checker.is_allowed("https://pinned.example/a", ""));

    std::vector<net::HttpRequest> requests = fetcher->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].user_agent == "DeepDive");
    REQUIRE(requests[0].timeout_ms == 1234);
    REQUIRE(requests[0].resolve == std::vector<std::string>{"pinned.example:443:93.184.216.34"});
}

TEST_CASE("RobotsChecker: unparseable and cancelled checks are refused", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    RobotsChecker checker(fetcher, SafetyConfig());

    REQUIRE_FALSE(checker.is_allowed("not a url", "DeepDive"));

    CancellationToken cancel;
    cancel.cancel();
    REQUIRE_FALSE(checker.is_allowed("https://fresh.example/page", "DeepDive", &cancel));
    REQUIRE(fetcher->requests().empty());
}

TEST_CASE("RobotsChecker: concurrent callers share one download", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    fetcher->latency = std::chrono::milliseconds(20);
    fetcher->add_robots("https://busy.example", "User-agent: *\nDisallow: /x\n");

    RobotsChecker checker(fetcher, SafetyConfig());

    std::vector<std::future<bool>> results;
    for (int i = 0; i < 8; ++i) {
        results.push_back(std::async(std::launch::async, [&checker, i]() {
            return checker.is_allowed("https://busy.example/page/" + std::to_string(i), "DeepDive");
        }));
    }
    for (auto& result : results) {
        REQUIRE(result.get());
    }
    REQUIRE(fetcher->count_for("https://busy.example/robots.txt") == 1);
}

TEST_CASE("RobotsChecker: downloads go through the fetch gate", "[safety][robots]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    fetcher->add_robots("https://gated.example", "User-agent: *\nAllow: /\n");

    FetchGate gate(1, std::chrono::milliseconds(150));
    RobotsChecker checker(fetcher, SafetyConfig(), nullptr, &gate);

    SECTION("the download waits for a free slot") {
        FetchGate::Permit held = gate.acquire("busy.example");
        auto check = std::async(std::launch::async, [&checker]() {
            return checker.is_allowed("https://gated.example/a", "DeepDive");
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE(fetcher->requests().empty());

        held.release();
        REQUIRE(check.get());
        REQUIRE(fetcher->count_for("https://gated.example/robots.txt") == 1);
    }

    SECTION("a page request to the same host is spaced after it") {
        auto start = FetchGate::Clock::now();
        REQUIRE(checker.is_allowed("https://gated.example/a", "DeepDive"));
        { FetchGate::Permit page = gate.acquire("gated.example"); }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(FetchGate::Clock::now() - start);
        REQUIRE(elapsed.count() >= 140);
    }

    SECTION("cancelled while queued leaves nothing cached") {
        FetchGate::Permit held = gate.acquire("busy.example");
        CancellationToken cancel;
        auto check = std::async(std::launch::async, [&checker, &cancel]() {
            return checker.is_allowed("https://gated.example/a", "DeepDive", &cancel);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        cancel.cancel();
        REQUIRE_FALSE(check.get());
        REQUIRE(fetcher->requests().empty());
    }
}
