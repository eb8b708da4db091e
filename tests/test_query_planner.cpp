/**
 * @file test_query_planner.cpp
 * @brief Unit tests for QueryPlanner against a scripted language model
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/query_planner.hpp"
#include "test_doubles.hpp"

using namespace deepdive;
using namespace deepdive::testing;

namespace {

const std::string USER_QUERY = "history of the printing press";

bool is_strict_prompt(const std::string& prompt) {
    return prompt.find("JSON array:") != std::string::npos;
}

} // namespace

TEST_CASE("QueryPlanner: initial decomposition", "[query_planner]") {
    quiet_logging();
    ResearchContext ctx("planner-test");

    SECTION("User query first, generated queries deduplicated and capped") {
        auto script = install_oracle([](const std::string&) {
            return std::string("[\"printing press inventor\", \"History of  the Printing Press\", "
                               "\"gutenberg bible\", \"movable type china\"]");
        });
        QueryPlanner planner;

        PlanResult plan = planner.plan_initial(USER_QUERY, 3, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{USER_QUERY, "printing press inventor", "gutenberg bible"});
        REQUIRE_FALSE(plan.used_fallback);
        REQUIRE(plan.oracle_calls == 1);
        REQUIRE(script->prompts.size() == 1);
        REQUIRE(script->prompts[0].find("generate 3 diverse") != std::string::npos);
        REQUIRE(script->prompts[0].find("User Query: \"" + USER_QUERY + "\"") != std::string::npos);
    }

    SECTION("Original query left out when disabled") {
        install_oracle([](const std::string&) {
            return std::string("[\"printing press inventor\", \"gutenberg bible\"]");
        });
        PlannerConfig config;
        config.include_original_query = false;
        QueryPlanner planner(config);

        PlanResult plan = planner.plan_initial(USER_QUERY, 3, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"printing press inventor", "gutenberg bible"});
    }

    SECTION("Unusable answer is retried with the strict prompt") {
        auto script = install_oracle([](const std::string& prompt) {
            return is_strict_prompt(prompt) ? std::string("[\"early printed books\"]") : std::string("");
        });
        PlannerConfig config;
        config.include_original_query = false;
        QueryPlanner planner(config);

        PlanResult plan = planner.plan_initial(USER_QUERY, 2, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"early printed books"});
        REQUIRE(plan.oracle_calls == 2);
        REQUIRE_FALSE(plan.used_fallback);
        REQUIRE(is_strict_prompt(script->prompts[1]));
    }

    SECTION("Two unusable answers fall back to the user query") {
        install_oracle([](const std::string&) { return std::string("   "); });
        QueryPlanner planner;

        PlanResult plan = planner.plan_initial(USER_QUERY, 3, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{USER_QUERY});
        REQUIRE(plan.used_fallback);
        REQUIRE(plan.oracle_calls == 2);
    }

    SECTION("Oracle failure is a warning, not an error") {
        auto script = install_oracle();
        script->fail_generation = true;
        QueryPlanner planner;

        PlanResult plan;
        REQUIRE_NOTHROW(plan = planner.plan_initial(USER_QUERY, 3, {}, ctx));

        REQUIRE(plan.queries == std::vector<std::string>{USER_QUERY});
        REQUIRE(plan.used_fallback);
        REQUIRE(plan.warnings.size() == 2);
    }

    SECTION("Arrays inside reasoning blocks are ignored") {
        install_oracle([](const std::string&) {
            return std::string("<think>Maybe [\"draft idea\"]? No.</think>\n[\"gutenberg bible\"]");
        });
        PlannerConfig config;
        config.include_original_query = false;
        QueryPlanner planner(config);

        PlanResult plan = planner.plan_initial(USER_QUERY, 3, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"gutenberg bible"});
        REQUIRE(plan.oracle_calls == 1);
    }

    SECTION("A model that cannot be loaded is not papered over") {
        auto script = install_oracle();
        script->fail_load = true;
        QueryPlanner planner;

        REQUIRE_THROWS_AS(planner.plan_initial(USER_QUERY, 3, {}, ctx), OracleLoadFailed);
        REQUIRE(script->prompts.empty());
    }

    SECTION("Oversized candidates are discarded") {
        install_oracle([](const std::string&) {
            return "[\"" + std::string(300, 'x') + "\", \"short one\"]";
        });
        PlannerConfig config;
        config.include_original_query = false;
        QueryPlanner planner(config);

        PlanResult plan = planner.plan_initial(USER_QUERY, 3, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"short one"});
    }

    SECTION("Zero requested queries still plans one") {
        install_oracle([](const std::string&) { return std::string("[\"a\", \"bb query\", \"cc query\"]"); });
        PlannerConfig config;
        config.include_original_query = false;
        QueryPlanner planner(config);

        PlanResult plan = planner.plan_initial(USER_QUERY, 0, {}, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"bb query"});
    }
}

TEST_CASE("QueryPlanner: refinement", "[query_planner]") {
    quiet_logging();
    ResearchContext ctx("planner-test");
    std::vector<SubQuery> issued = {SubQuery(USER_QUERY, 1), SubQuery("gutenberg bible", 1)};
    const std::string summary = "[1] Gutenberg (press.example): Movable type arrived in Mainz.\n";

    SECTION("New queries only, capped at the remaining budget") {
        auto script = install_oracle([](const std::string&) {
            return std::string("[\"Gutenberg  Bible\", \"printing in korea\", \"press and reformation\", "
                               "\"incunabula\"]");
        });
        QueryPlanner planner;

        PlanResult plan = planner.plan_refinement(USER_QUERY, summary, 2, issued, ctx);

        REQUIRE(plan.queries == std::vector<std::string>{"printing in korea", "press and reformation"});
        REQUIRE_FALSE(plan.explicit_none);
        REQUIRE(plan.oracle_calls == 1);
        REQUIRE(is_refinement_prompt(script->prompts[0]));
    }

    SECTION("NONE means the query is covered") {
        install_oracle([](const std::string&) { return std::string("NONE"); });
        QueryPlanner planner;

        PlanResult plan = planner.plan_refinement(USER_QUERY, summary, 2, issued, ctx);

        REQUIRE(plan.queries.empty());
        REQUIRE(plan.explicit_none);
        REQUIRE(plan.oracle_calls == 1);
    }

    SECTION("Only repeats of earlier searches yield an empty plan without retry") {
        install_oracle([](const std::string&) {
            return std::string("[\"GUTENBERG BIBLE\", \"history of the printing press\"]");
        });
        QueryPlanner planner;

        PlanResult plan = planner.plan_refinement(USER_QUERY, summary, 2, issued, ctx);

        REQUIRE(plan.queries.empty());
        REQUIRE_FALSE(plan.used_fallback);
        REQUIRE(plan.oracle_calls == 1);
    }

    SECTION("Unusable answers end in an empty plan") {
        install_oracle([](const std::string&) { return std::string(""); });
        QueryPlanner planner;

        PlanResult plan = planner.plan_refinement(USER_QUERY, summary, 2, issued, ctx);

        REQUIRE(plan.queries.empty());
        REQUIRE(plan.used_fallback);
        REQUIRE(plan.oracle_calls == 2);
    }

    SECTION("No budget left means no model call") {
        auto script = install_oracle([](const std::string&) { return std::string("[\"anything\"]"); });
        QueryPlanner planner;

        PlanResult plan = planner.plan_refinement(USER_QUERY, summary, 0, issued, ctx);

        REQUIRE(plan.queries.empty());
        REQUIRE(plan.oracle_calls == 0);
        REQUIRE(script->prompts.empty());
    }

    SECTION("Corpus digest is truncated") {
        auto script = install_oracle([](const std::string&) { return std::string("NONE"); });
        PlannerConfig config;
        config.corpus_summary_chars = 10;
        QueryPlanner planner(config);

        planner.plan_refinement(USER_QUERY, "0123456789ABCDEF", 1, issued, ctx);

        REQUIRE(script->prompts[0].find("0123456789\nAlready searched:") != std::string::npos);
        REQUIRE(script->prompts[0].find("ABCDEF") == std::string::npos);
    }
}

TEST_CASE("QueryPlanner: prompts", "[query_planner]") {
    QueryPlanner planner;

    SECTION("Refinement prompt lists earlier searches") {
        std::vector<SubQuery> issued = {SubQuery("gutenberg bible", 1), SubQuery("movable type", 1)};
        std::string prompt = planner.build_refinement_prompt(USER_QUERY, "", 2, issued);

        REQUIRE(prompt.find("Sources found so far:\n(none)\n") != std::string::npos);
        REQUIRE(prompt.find("- gutenberg bible\n- movable type\n") != std::string::npos);
        REQUIRE(prompt.find("up to 2 new search engine queries") != std::string::npos);
        REQUIRE(prompt.find("reply with NONE") != std::string::npos);
    }

    SECTION("Strict prompt asks for a bare array") {
        std::string prompt = planner.build_strict_prompt(USER_QUERY, 4);

        REQUIRE(prompt.find("ONLY a JSON array of 4") != std::string::npos);
        REQUIRE(prompt.find("Topic: \"" + USER_QUERY + "\"") != std::string::npos);
    }
}
