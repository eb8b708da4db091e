/**
 * @file test_context_aggregator.cpp
 * @brief Unit tests for corpus deduplication, citation numbering and coverage
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/context_aggregator.hpp"
#include "../src/research_config.hpp"
#include "test_doubles.hpp"

using namespace deepdive;
using namespace deepdive::testing;

TEST_CASE("ContextAggregator: merge assigns stable citation indices", "[aggregator]") {
    ContextAggregator aggregator;

    std::vector<Source> first = {
        make_source("https://a.example/one", "alpha text"),
        make_source("https://b.example/two", "", "q", FetchStatus::BLOCKED_ROBOTS),
        make_source("https://c.example/three", "gamma text"),
        make_source("https://A.example/one/", "duplicate of alpha"),
    };

    std::vector<Source> merged = aggregator.merge({}, first);

    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0].citation_index == 1);
    REQUIRE(merged[0].extracted_text == "alpha text");
    REQUIRE(merged[1].citation_index == 0);
    REQUIRE(merged[1].fetch_status == FetchStatus::BLOCKED_ROBOTS);
    REQUIRE(merged[2].citation_index == 2);

    SECTION("later iterations continue the numbering") {
        std::vector<Source> second = {
            make_source("https://a.example/one#intro", "same page again"),
            make_source("https://d.example/four", "delta text"),
        };
        std::vector<Source> again = aggregator.merge(merged, second);

        REQUIRE(again.size() == 4);
        REQUIRE(again[0].extracted_text == "alpha text");
        REQUIRE(again[3].url == "https://d.example/four");
        REQUIRE(again[3].citation_index == 3);
    }

    SECTION("the first sighting of a URL wins") {
        std::vector<Source> retry = {make_source("https://b.example/two", "now reachable")};
        std::vector<Source> again = aggregator.merge(merged, retry);
        REQUIRE(again.size() == 3);
        REQUIRE(again[1].fetch_status == FetchStatus::BLOCKED_ROBOTS);
    }

    SECTION("unusable sources never carry text") {
        Source empty_ok = make_source("https://e.example/", "");
        Source failed = make_source("https://f.example/", "");
        failed.fetch_status = FetchStatus::FETCH_ERROR;
        failed.extracted_text = "partial body";
        std::vector<Source> again = aggregator.merge(merged, {empty_ok, failed});
        REQUIRE(again[3].citation_index == 0);
        REQUIRE(again[4].citation_index == 0);
        REQUIRE(again[4].extracted_text.empty());
    }
}

TEST_CASE("ContextAggregator: query string handling", "[aggregator]") {
    std::vector<Source> incoming = {
        make_source("https://news.example/story?page=1", "page one"),
        make_source("https://news.example/story?page=2", "page two"),
        make_source("https://news.example/story?utm_source=feed&page=1", "tracked"),
    };

    SECTION("default configuration ignores the query string") {
        ResearchConfig config;
        REQUIRE(config.retrieval.dedupe_ignore_query);

        std::vector<Source> merged =
            ContextAggregator(config.retrieval.dedupe_ignore_query).merge({}, incoming);
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].extracted_text == "page one");
        REQUIRE(ContextAggregator().merge({}, incoming).size() == 1);
        REQUIRE(ContextAggregator().dedupe_key("https://News.example/story?x=1") ==
                "https://news.example/story");
    }

    SECTION("query-sensitive mode still drops tracking parameters") {
        std::vector<Source> merged = ContextAggregator(false).merge({}, incoming);
        REQUIRE(merged.size() == 2);
        REQUIRE(merged[1].extracted_text == "page two");
    }
}

TEST_CASE("ContextAggregator: corpus view and coverage", "[aggregator]") {
    ContextAggregator aggregator;
    std::vector<Source> sources = aggregator.merge({}, {
        make_source("https://www.history.example/a", "one two three four"),
        make_source("https://blocked.example/", "", "q", FetchStatus::BLOCKED_URL),
        make_source("https://history.example/b", "five six"),
        make_source("https://other.example/c", "seven\n eight\tnine"),
    });

    std::vector<const Source*> corpus = ContextAggregator::corpus(sources);
    REQUIRE(corpus.size() == 3);
    REQUIRE(corpus[0]->citation_index == 1);
    REQUIRE(corpus[2]->citation_index == 3);

    CoverageSignal signal = ContextAggregator::coverage(sources);
    REQUIRE(signal.usable_sources == 3);
    REQUIRE(signal.total_words == 9);
    REQUIRE(signal.distinct_hosts == 2);
    REQUIRE(signal.meets(9, 2));
    REQUIRE_FALSE(signal.meets(10, 2));
    REQUIRE_FALSE(signal.meets(9, 3));

    REQUIRE(ContextAggregator::coverage({}).usable_sources == 0);
    REQUIRE(ContextAggregator::count_words("") == 0);
    REQUIRE(ContextAggregator::count_words("  spaced   out  ") == 2);
    REQUIRE(ContextAggregator::host_of("https://www.example.com/x") == "example.com");
    REQUIRE(ContextAggregator::host_of("garbage").empty());
}

TEST_CASE("ContextAggregator: corpus summary", "[aggregator]") {
    ContextAggregator aggregator;
    Source first = make_source("https://www.press.example/gutenberg", "Movable type arrived in Mainz.");
    first.title = "Gutenberg";
    Source second = make_source("https://asia.example/bi-sheng", std::string(400, 'x'));
    second.title = "Bi Sheng";
    std::vector<Source> sources = aggregator.merge({}, {first, second});

    std::string summary = ContextAggregator::corpus_summary(sources, 2000);
    REQUIRE(summary.rfind("[1] Gutenberg (press.example): Movable type arrived in Mainz.\n", 0) == 0);
    REQUIRE(summary.find("[2] Bi Sheng (asia.example): ") != std::string::npos);
    REQUIRE(summary.size() < 400);

    SECTION("size limit drops whole lines") {
        std::string short_summary = ContextAggregator::corpus_summary(sources, 80);
        REQUIRE(short_summary == "[1] Gutenberg (press.example): Movable type arrived in Mainz.\n");
        REQUIRE(ContextAggregator::corpus_summary(sources, 10).empty());
    }
}
