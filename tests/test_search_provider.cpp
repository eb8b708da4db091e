/**
 * @file test_search_provider.cpp
 * @brief Unit tests for the DuckDuckGo HTML search adapter
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/retrieval/search_provider.hpp"
#include "test_doubles.hpp"

using namespace deepdive;
using namespace deepdive::testing;

namespace {

const char* const RESULT_PAGE =
    "<html><body><div class='results'>"
    "<div class='result results_links result--ad'>"
    "  <a class='result__a' href='https://ads.example/buy'>Sponsored printer deals</a>"
    "</div>"
    "<div class='result results_links'>"
    "  <h2><a class='result__a' href='//duckduckgo.com/l/?uddg=https%3A%2F%2Fen.wikipedia.org%2Fwiki%2FPrinting_press&amp;rut=abc'>"
    "Printing press - <b>Wikipedia</b></a></h2>"
    "  <a class='result__snippet'>The printing press is a mechanical   device.</a>"
    "</div>"
    "<div class='result'>"
    "  <a class='result__a' href='https://www.britannica.com/technology/printing-press'>Printing press | Britannica</a>"
    "  <div class='result__snippet'>Invented by Gutenberg</div>"
    "</div>"
    "<div class='result'>"
    "  <a class='result__a' href='https://en.wikipedia.org/wiki/Printing_press#History'>Duplicate</a>"
    "</div>"
    "<div class='result'>"
    "  <a class='result__a' href='//duckduckgo.com/?q=more+results'>More results</a>"
    "</div>"
    "<div class='result'>"
    "  <a class='result__a' href='https://history.example/press'>History of the press</a>"
    "</div>"
    "</div></body></html>";

} // namespace

TEST_CASE("DuckDuckGoSearchProvider: parses organic results", "[search]") {
    std::vector<SearchResult> results = DuckDuckGoSearchProvider::parse_results(RESULT_PAGE, 10);

    REQUIRE(results.size() == 3);

    REQUIRE(results[0].url == "https://en.wikipedia.org/wiki/Printing_press");
    REQUIRE(results[0].title == "Printing press - Wikipedia");
    REQUIRE(results[0].snippet == "The printing press is a mechanical device.");

    REQUIRE(results[1].url == "https://www.britannica.com/technology/printing-press");
    REQUIRE(results[1].snippet == "Invented by Gutenberg");

    REQUIRE(results[2].url == "https://history.example/press");
    REQUIRE(results[2].snippet.empty());

    SECTION("top_k caps the result count") {
        REQUIRE(DuckDuckGoSearchProvider::parse_results(RESULT_PAGE, 2).size() == 2);
    }

    SECTION("page without results") {
        REQUIRE(DuckDuckGoSearchProvider::parse_results("<html><body>No results.</body></html>", 5).empty());
    }
}

TEST_CASE("DuckDuckGoSearchProvider: redirect unwrapping", "[search]") {
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect(
                "//duckduckgo.com/l/?uddg=https%3A%2F%2Fexample.com%2Fa%3Fb%3D1&rut=x") ==
            "https://example.com/a?b=1");
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect(
                "https://duckduckgo.com/l/?kh=-1&uddg=https%3A%2F%2Fexample.org%2F") ==
            "https://example.org/");
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect("https://example.com/direct") ==
            "https://example.com/direct");
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect("https://duckduckgo.com/about").empty());
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect("//duckduckgo.com/l/?rut=x").empty());
    REQUIRE(DuckDuckGoSearchProvider::unwrap_redirect("/relative/link").empty());
}

TEST_CASE("DuckDuckGoSearchProvider: search requests", "[search]") {
    quiet_logging();
    auto fetcher = std::make_shared<FakePageFetcher>();
    RetrievalConfig config;
    config.request_timeout_ms = 3000;
    DuckDuckGoSearchProvider provider(fetcher, config);

    SECTION("query is encoded into the endpoint") {
        fetcher->add_page(config.search_endpoint + "?q=history+of+printing", RESULT_PAGE);

        std::vector<SearchResult> results = provider.search("history of printing", 5);
        REQUIRE(results.size() == 3);

        std::vector<net::HttpRequest> requests = fetcher->requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].user_agent == config.user_agents.front());
        REQUIRE(requests[0].timeout_ms == 6000);
    }

    SECTION("engine errors yield no results") {
        fetcher->add_page(config.search_endpoint + "?q=blocked", "rate limited", "text/html", 429);
        REQUIRE(provider.search("blocked", 5).empty());
    }

    SECTION("transport failures yield no results") {
        fetcher->add_timeouts(config.search_endpoint + "?q=slow", 1);
        REQUIRE(provider.search("slow", 5).empty());
    }

    REQUIRE(provider.name() == "duckduckgo");
}
