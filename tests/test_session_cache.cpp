/**
 * @file test_session_cache.cpp
 * @brief Unit tests for SessionCache, OracleFactory and the llama-server wire format
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/oracle/llama_server_oracle.hpp"
#include "../src/oracle/oracle_factory.hpp"
#include "../src/session_cache.hpp"
#include "test_doubles.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <thread>

using namespace deepdive;
using namespace deepdive::testing;

namespace {

class ThrowingOracle : public LanguageOracle {
public:
    void load(const OracleConfig&) override { throw std::runtime_error("socket closed"); }
    std::string complete(const std::string&, double, int) override { return ""; }
    OracleInfo get_info() const override { return OracleInfo("Throwing", "throwing"); }
    void dispose() noexcept override {}
    bool is_loaded() const override { return false; }
};

} // namespace

TEST_CASE("SessionCache: lazy load and reuse", "[session_cache]") {
    quiet_logging();
    SessionCache& cache = SessionCache::get_instance();

    SECTION("Oracle is loaded once and reused") {
        auto script = install_oracle([](const std::string& prompt) { return "echo: " + prompt; });
        REQUIRE_FALSE(cache.is_loaded());
        REQUIRE_FALSE(cache.load_timestamp().has_value());
        size_t loads_before = cache.load_count();

        REQUIRE(cache.generate("one", 0.4, 10) == "echo: one");
        REQUIRE(cache.generate("two", 0.4, 10) == "echo: two");

        REQUIRE(cache.is_loaded());
        REQUIRE(cache.load_timestamp().has_value());
        REQUIRE(cache.load_count() == loads_before + 1);
        REQUIRE(script->loads == 1);
        REQUIRE(cache.info().oracle_type == "scripted");
    }

    SECTION("Release disposes and the next use loads again") {
        auto script = install_oracle([](const std::string&) { return std::string("ok"); });
        cache.acquire();
        cache.release();

        REQUIRE_FALSE(cache.is_loaded());
        REQUIRE(script->disposals == 1);
        REQUIRE_THROWS_AS(cache.info(), OracleUnavailable);

        cache.generate("again", 0.4, 10);
        REQUIRE(script->loads == 2);
    }

    SECTION("Reconfiguring releases the loaded oracle") {
        auto first = install_oracle([](const std::string&) { return std::string("first"); });
        cache.acquire();

        auto second = install_oracle([](const std::string&) { return std::string("second"); });

        REQUIRE(first->disposals == 1);
        REQUIRE(cache.generate("x", 0.4, 10) == "second");
        REQUIRE(second->loads == 1);
    }

    SECTION("Load failure is OracleUnavailable and leaves nothing loaded") {
        auto script = install_oracle();
        script->fail_load = true;

        REQUIRE_THROWS_AS(cache.generate("x", 0.4, 10), OracleLoadFailed);
        REQUIRE_FALSE(cache.is_loaded());

        try {
            cache.acquire();
            FAIL("acquire should throw");
        } catch (const OracleLoadFailed& e) {
            REQUIRE(std::string(e.what()) ==
                    "Language model unavailable: failed to load language model: scripted load failure");
        }
    }

    SECTION("Foreign exceptions from a backend are wrapped") {
        cache.configure(OracleConfig(), []() { return std::make_unique<ThrowingOracle>(); });

        REQUIRE_THROWS_AS(cache.acquire(), OracleLoadFailed);
    }

    SECTION("Unknown oracle type is a configuration error") {
        OracleConfig config;
        config.type = "no_such_backend";
        cache.configure(config);

        REQUIRE_THROWS_AS(cache.acquire(), ConfigurationError);
    }

    cache.release();
}

TEST_CASE("SessionCache: generation is serialized", "[session_cache]") {
    quiet_logging();
    SessionCache& cache = SessionCache::get_instance();

    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    install_oracle([&](const std::string&) {
        int now = ++in_flight;
        int seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        --in_flight;
        return std::string("done");
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&cache]() { cache.generate("prompt", 0.4, 10); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(max_in_flight == 1);
    cache.release();
}

TEST_CASE("SessionCache: history", "[session_cache]") {
    SessionCache& cache = SessionCache::get_instance();
    cache.clear_history();

    SECTION("Exchanges are kept oldest first") {
        cache.add_exchange("first question", "first answer");
        cache.add_exchange("second question", "second answer");

        std::vector<HistoryEntry> history = cache.history();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].query == "first question");
        REQUIRE(history[1].answer == "second answer");
    }

    SECTION("Limit drops the oldest entries") {
        cache.set_history_limit(2);
        cache.add_exchange("q1", "a1");
        cache.add_exchange("q2", "a2");
        cache.add_exchange("q3", "a3");

        std::vector<HistoryEntry> history = cache.history();
        REQUIRE(history.size() == 2);
        REQUIRE(history[0].query == "q2");
        REQUIRE(history[1].query == "q3");

        cache.set_history_limit(20);
    }

    SECTION("Clear empties the history") {
        cache.add_exchange("q", "a");
        cache.clear_history();
        REQUIRE(cache.history().empty());
    }

    cache.clear_history();
}

TEST_CASE("OracleFactory: registry", "[oracle]") {
    OracleFactory factory;

    SECTION("llama_server is built in") {
        REQUIRE(factory.is_registered(OracleType::LLAMA_SERVER));
        auto oracle = factory.create_oracle("llama_server");
        REQUIRE(oracle != nullptr);
        REQUIRE_FALSE(oracle->is_loaded());
        REQUIRE(oracle->get_info().oracle_type == "llama_server");
    }

    SECTION("Unknown types are rejected") {
        REQUIRE_THROWS_AS(factory.create_oracle("gpt"), ConfigurationError);
    }

    SECTION("Custom types can be registered once") {
        auto script = std::make_shared<OracleScript>();
        factory.register_oracle("scripted", [script]() { return std::make_unique<ScriptedOracle>(script); });

        REQUIRE(factory.is_registered("scripted"));
        REQUIRE(factory.list_oracle_types().size() == 2);
        REQUIRE_THROWS_AS(
            factory.register_oracle("scripted", [script]() { return std::make_unique<ScriptedOracle>(script); }),
            ConfigurationError);
    }
}

TEST_CASE("LlamaServerOracle: completion wire format", "[oracle]") {
    SECTION("Request body") {
        nlohmann::json request = nlohmann::json::parse(
            LlamaServerOracle::build_completion_request("Write a report", 0.6, 512, {"</s>"}));

        REQUIRE(request["prompt"] == "Write a report");
        REQUIRE(request["n_predict"] == 512);
        REQUIRE(request["temperature"].get<double>() == 0.6);
        REQUIRE(request["stop"] == nlohmann::json::array({"</s>"}));
    }

    SECTION("Stop sequences are omitted when empty") {
        nlohmann::json request = nlohmann::json::parse(
            LlamaServerOracle::build_completion_request("p", 0.4, 10, {}));
        REQUIRE_FALSE(request.contains("stop"));
    }

    SECTION("Response content") {
        REQUIRE(LlamaServerOracle::parse_completion_response(
                    "{\"content\": \"The press\", \"stop\": true}") == "The press");
    }

    SECTION("Malformed responses") {
        REQUIRE_THROWS_AS(LlamaServerOracle::parse_completion_response("not json"), OracleUnavailable);
        REQUIRE_THROWS_AS(LlamaServerOracle::parse_completion_response("{\"text\": \"x\"}"), OracleUnavailable);
        REQUIRE_THROWS_AS(LlamaServerOracle::parse_completion_response("{\"content\": 3}"), OracleUnavailable);
    }

    SECTION("Completion before load fails") {
        LlamaServerOracle oracle;
        REQUIRE_THROWS_AS(oracle.complete("p", 0.4, 10), OracleUnavailable);
    }

    SECTION("Load without an endpoint fails") {
        LlamaServerOracle oracle;
        OracleConfig config;
        config.endpoint = "";
        REQUIRE_THROWS_AS(oracle.load(config), OracleUnavailable);
    }
}
