/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include "test_doubles.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace deepdive;
using json = nlohmann::json;

namespace {

std::string log_path() {
    return (std::filesystem::temp_directory_path() / "deepdive_test_logger.log").string();
}

void log_to_file(LogLevel min_level, bool as_json = true) {
    std::filesystem::remove(log_path());
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = log_path();
    config.enable_json = as_json;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines() {
    Logger::get_instance().flush();
    std::ifstream file(log_path());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::vector<json> read_events() {
    std::vector<json> events;
    for (const std::string& line : read_lines()) {
        events.push_back(json::parse(line));
    }
    return events;
}

void reset_logger() {
    testing::quiet_logging();
    std::filesystem::remove(log_path());
}

} // namespace

TEST_CASE("Logger: configuration", "[logger]") {
    SECTION("Defaults") {
        LoggerConfig config;
        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console);
        REQUIRE_FALSE(config.enable_file);
        REQUIRE(config.enable_json);
    }

    SECTION("Level names round trip, unknown names read as INFO") {
        REQUIRE(string_to_level(level_to_string(LogLevel::WARN)) == LogLevel::WARN);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Minimum level can be changed at runtime") {
        Logger& logger = Logger::get_instance();
        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
        reset_logger();
    }
}

TEST_CASE("Logger: structured events", "[logger]") {
    Logger& logger = Logger::get_instance();
    ResearchContext ctx("c0ffee01");
    ctx.iteration = 2;
    ctx.phase = "RETRIEVING";

    SECTION("Session start carries the context") {
        log_to_file(LogLevel::INFO);
        logger.log_session_start(ctx, "history of the printing press", 3, 0.6, false);

        std::vector<json> events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["event"] == "session_start");
        REQUIRE(events[0]["session_id"] == "c0ffee01");
        REQUIRE(events[0]["iteration"] == "2");
        REQUIRE(events[0]["phase"] == "RETRIEVING");
        REQUIRE(events[0]["query"] == "history of the printing press");
        REQUIRE(events[0]["max_iterations"] == "3");
        REQUIRE(events[0]["offline"] == "false");
        REQUIRE(events[0]["level"] == "INFO");
        REQUIRE(events[0].contains("timestamp"));
    }

    SECTION("Usable sources log at INFO, rejects at DEBUG") {
        log_to_file(LogLevel::INFO);

        Source ok = testing::make_source("https://press.example/a", "Some text");
        ok.http_status = 200;
        Source blocked = testing::make_source("https://blocked.example/b", "", "q", FetchStatus::BLOCKED_ROBOTS);
        blocked.error_detail = "disallowed by robots.txt";

        logger.log_source_outcome(ctx, ok);
        logger.log_source_outcome(ctx, blocked);

        std::vector<json> events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["status"] == "OK");
        REQUIRE(events[0]["chars"] == "9");
        REQUIRE(events[0]["http_status"] == "200");

        log_to_file(LogLevel::DEBUG);
        logger.log_source_outcome(ctx, blocked);
        events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["status"] == "BLOCKED_ROBOTS");
        REQUIRE(events[0]["detail"] == "disallowed by robots.txt");
        REQUIRE(events[0]["level"] == "DEBUG");
    }

    SECTION("Failed model calls are warnings") {
        log_to_file(LogLevel::WARN);
        logger.log_oracle_call(ctx, "synthesis", 1200, 0, 15.0, false);
        logger.log_oracle_call(ctx, "plan_initial", 300, 80, 5.0, true);

        std::vector<json> events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["purpose"] == "synthesis");
        REQUIRE(events[0]["success"] == "false");
    }

    SECTION("Planned sub-queries are listed") {
        log_to_file(LogLevel::INFO);
        logger.log_subqueries(ctx, {"gutenberg bible", "movable type"});

        std::vector<json> events = read_events();
        REQUIRE(events[0]["count"] == "2");
        REQUIRE(events[0]["subquery_0"] == "gutenberg bible");
        REQUIRE(events[0]["subquery_1"] == "movable type");
    }

    SECTION("Control characters are escaped") {
        log_to_file(LogLevel::INFO);
        logger.log_warning(ctx, "line one\nline \"two\"\t\x01");

        std::vector<std::string> lines = read_lines();
        REQUIRE(lines.size() == 1);
        json event = json::parse(lines[0]);
        REQUIRE(event["warning"] == "line one\nline \"two\"\t\x01");
    }

    SECTION("Plain text output") {
        log_to_file(LogLevel::INFO, false);
        logger.log_error(ctx, "synthesis failed");

        std::vector<std::string> lines = read_lines();
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("[ERROR] Research error {") != std::string::npos);
        REQUIRE(lines[0].find("error_message=synthesis failed") != std::string::npos);
    }

    reset_logger();
}

TEST_CASE("Logger: secrets and long values", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("mask_secret") {
        REQUIRE(Logger::mask_secret("short") == "***");
        REQUIRE(Logger::mask_secret("12345678") == "***");
        REQUIRE(Logger::mask_secret("sk-1234567890abcdef") == "sk-1...cdef");
    }

    SECTION("Fields named like secrets are masked") {
        log_to_file(LogLevel::DEBUG);
        logger.info("Language model connected", {
            {"endpoint", "http://127.0.0.1:8080"},
            {"api_key", "sk-1234567890abcdef"},
            {"Auth-Token", "tok"},
            {"client_secret", "s3cr3t-value-long"}
        });

        std::vector<json> events = read_events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0]["endpoint"] == "http://127.0.0.1:8080");
        REQUIRE(events[0]["api_key"] == "sk-1...cdef");
        REQUIRE(events[0]["Auth-Token"] == "***");
        REQUIRE(events[0]["client_secret"] == "s3cr...long");
    }

    SECTION("Long values are cut above DEBUG") {
        std::string long_value(600, 'x');

        log_to_file(LogLevel::DEBUG);
        logger.info("info", {{"output", long_value}});
        logger.debug("debug", {{"output", long_value}});

        std::vector<json> events = read_events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0]["output"] == std::string(512, 'x') + "...");
        REQUIRE(events[1]["output"] == long_value);
    }

    reset_logger();
}
