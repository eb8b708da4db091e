#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdlib>
#include "config_parser.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "session_cache.hpp"
#include "io/report_writer.hpp"
#include "retrieval/page_fetcher.hpp"
#include "retrieval/retrieval_pipeline.hpp"
#include "retrieval/search_provider.hpp"

namespace {

struct CLIArgs {
    std::string query;
    std::string config_path;
    std::string output_path;
    double temperature = -1.0;       // < 0: keep config value
    long max_iterations = -1;        // < 0: keep config value
    bool offline = false;
    bool concise = false;
    bool detailed = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "DeepDive research agent v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options] [query]\n\n";
    std::cerr << "Without a query an interactive session is started.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --query <text>              Research question (alternative to the positional argument)\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --temperature <t>           Synthesis temperature (default: 0.6)\n";
    std::cerr << "  --max-iterations <n>        Research iterations (default: 3)\n";
    std::cerr << "  --offline                   Answer from the model alone, no web access\n";
    std::cerr << "  --concise                   Short report, at most 3 bullet points\n";
    std::cerr << "  --detailed                  Long report with statistics and quotes\n";
    std::cerr << "  --output <path>             Also write the report (.md or .json)\n";
    std::cerr << "  --verbose                   Debug logging\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Interactive commands: exit, quit, history, clear\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  DEEPDIVE_ORACLE_URL         Language model server URL\n";
    std::cerr << "  DEEPDIVE_ORACLE_API_KEY     Bearer token for the model server\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --max-iterations 2 --output report.md \"history of the printing press\"\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--query" && i + 1 < argc) {
                args.query = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--temperature" && i + 1 < argc) {
                args.temperature = std::stod(argv[++i]);
            } else if (arg == "--max-iterations" && i + 1 < argc) {
                args.max_iterations = std::stol(argv[++i]);
            } else if (arg == "--offline") {
                args.offline = true;
            } else if (arg == "--concise") {
                args.concise = true;
            } else if (arg == "--detailed") {
                args.detailed = true;
            } else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            } else if (!arg.empty() && arg[0] != '-') {
                if (!args.query.empty()) {
                    args.query += " ";
                }
                args.query += arg;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid numeric argument\n\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.concise && args.detailed) {
        std::cerr << "Error: --concise and --detailed are mutually exclusive\n";
        valid = false;
    }
    if (args.max_iterations == 0 || args.max_iterations < -1) {
        std::cerr << "Error: --max-iterations must be at least 1\n";
        valid = false;
    }
    if (args.temperature != -1.0 && (args.temperature < 0.0 || args.temperature > 2.0)) {
        std::cerr << "Error: --temperature must be between 0 and 2\n";
        valid = false;
    }
    if (!args.config_path.empty()) {
        std::ifstream f(args.config_path);
        if (!f.good()) {
            std::cerr << "Error: Config file not found: " << args.config_path << "\n";
            valid = false;
        }
    }
    return valid;
}

void apply_cli_overrides(const CLIArgs& args, deepdive::ResearchConfig& config) {
    if (args.temperature >= 0.0) config.agent.temperature = args.temperature;
    if (args.max_iterations > 0) config.agent.max_iterations = static_cast<size_t>(args.max_iterations);
    if (args.offline) config.agent.offline = true;
    if (args.concise) config.agent.detail_level = deepdive::DetailLevel::CONCISE;
    if (args.detailed) config.agent.detail_level = deepdive::DetailLevel::DETAILED;
    if (args.verbose) config.logging.min_level = deepdive::LogLevel::DEBUG;
}

void print_progress(const deepdive::ProgressEvent& event) {
    std::cerr << "[" << deepdive::phase_to_string(event.phase);
    if (event.iteration > 0) {
        std::cerr << " " << event.iteration;
    }
    std::cerr << "] " << event.message << "\n";
}

void print_history() {
    std::vector<deepdive::HistoryEntry> history = deepdive::SessionCache::get_instance().history();
    if (history.empty()) {
        std::cout << "No previous queries.\n";
        return;
    }
    for (size_t i = 0; i < history.size(); ++i) {
        std::cout << (i + 1) << ". " << history[i].query << "\n";
    }
}

/**
 * @brief Research one query and print the report
 *
 * @return true on success
 */
bool research(const std::string& query,
              const deepdive::ResearchConfig& config,
              const std::shared_ptr<deepdive::PageFetcher>& fetcher,
              const std::string& output_path) {
    std::shared_ptr<deepdive::SubQueryRetriever> retriever;
    if (!config.agent.offline) {
        auto search = std::make_shared<deepdive::DuckDuckGoSearchProvider>(fetcher, config.retrieval);
        // One pipeline per query: robots cache and politeness state are per session
        retriever = std::make_shared<deepdive::RetrievalPipeline>(search, fetcher, config.retrieval, config.safety);
    }

    deepdive::ResearchOrchestrator orchestrator(config, retriever);
    deepdive::ResearchOutcome outcome = orchestrator.run(query, print_progress);

    std::cout << "\n";
    deepdive::io::write_report_markdown(std::cout, outcome);
    std::cout << std::endl;

    if (!outcome.success) {
        std::cerr << "Research failed during " << deepdive::phase_to_string(outcome.failed_phase)
                  << ": " << outcome.error_message << "\n";
    } else {
        std::cerr << "Finished in " << static_cast<long>(outcome.total_time_ms) << " ms ("
                  << outcome.stop_reason << ", " << outcome.session.iteration_count << " iteration(s), "
                  << outcome.report->citations.size() << " citation(s))\n";
    }

    if (!output_path.empty()) {
        deepdive::io::write_report(output_path, outcome);
        std::cerr << "Report written to " << output_path << "\n";
    }
    return outcome.success;
}

int run_interactive(const deepdive::ResearchConfig& config,
                    const std::shared_ptr<deepdive::PageFetcher>& fetcher,
                    const std::string& output_path) {
    std::cerr << "DeepDive interactive session. Type 'exit' to quit.\n";

    std::string line;
    while (true) {
        std::cout << "\ndeepdive> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos) {
            continue;
        }
        line = line.substr(start, line.find_last_not_of(" \t\r") - start + 1);

        if (line == "exit" || line == "quit") {
            break;
        } else if (line == "history") {
            print_history();
        } else if (line == "clear") {
            deepdive::SessionCache::get_instance().clear_history();
            std::cout << "History cleared.\n";
        } else {
            try {
                research(line, config, fetcher, output_path);
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
            }
        }
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    int exit_code = 0;
    try {
        deepdive::ResearchConfig config;
        if (!args.config_path.empty()) {
            config = deepdive::parse_research_config_from_file(args.config_path);
        }
        deepdive::apply_environment_overrides(config);
        apply_cli_overrides(args, config);
        config.validate();

        deepdive::Logger::get_instance().configure(config.logging);
        deepdive::SessionCache::get_instance().configure(config.oracle);

        auto fetcher = std::make_shared<deepdive::CurlPageFetcher>();

        if (args.query.empty()) {
            exit_code = run_interactive(config, fetcher, args.output_path);
        } else {
            exit_code = research(args.query, config, fetcher, args.output_path) ? 0 : 1;
        }
    } catch (const deepdive::ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    deepdive::SessionCache::get_instance().release();
    return exit_code;
}
