#include "synthesizer.hpp"
#include "response_parser.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

namespace deepdive {

namespace {

const char* const SYSTEM_PROMPT =
    "You are a research assistant. Your sole purpose is to write a comprehensive report based *only* "
    "on the provided search results.\n\n"
    "**Instructions:**\n"
    "1.  **Strictly Adhere to Sources:** Base your entire report on the information given in the "
    "'[Source X]' entries. Do not add external knowledge.\n"
    "2.  **Structure the Report:** Organize your response into:\n"
    "    *   **Executive Summary:** A brief, high-level summary of the main findings.\n"
    "    *   **Detailed Findings:** A thorough breakdown of the information as bullet points, "
    "organized by key themes.\n"
    "    *   **Conclusion:** A summary of the most important points.\n"
    "3.  **Cite Everything:** For every piece of information you use, cite the source using the "
    "format `[Source X]`. Multiple sources can be cited like `[Source 1, 3]`. Only use source "
    "numbers that appear in the search results.\n"
    "4.  **Synthesize, Don't List:** Weave the information together into a coherent narrative. "
    "If sources conflict, note the discrepancy.\n"
    "5.  **Format with Markdown:** Use headers and bullet points.";

const char* const OFFLINE_SYSTEM_PROMPT =
    "You are a research assistant. No web search results are available for this query, so answer "
    "from your general knowledge and state clearly where you are uncertain.\n\n"
    "**Instructions:**\n"
    "1.  Organize your response into **Executive Summary**, **Detailed Findings** (bullet points) "
    "and **Conclusion**.\n"
    "2.  Do not cite sources and do not invent references or URLs.\n"
    "3.  Format with Markdown.";

std::string take_words(const std::string& text, size_t max_words) {
    std::istringstream stream(text);
    std::string word;
    std::string result;
    size_t count = 0;
    while (count < max_words && stream >> word) {
        if (!result.empty()) {
            result += ' ';
        }
        result += word;
        ++count;
    }
    return result;
}

size_t word_count(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    size_t count = 0;
    while (stream >> word) {
        ++count;
    }
    return count;
}

} // namespace

Synthesizer::Synthesizer(const SynthesisConfig& config) : config_(config) {}

std::string Synthesizer::build_system_prompt(DetailLevel detail_level, bool with_sources) {
    std::string prompt = with_sources ? SYSTEM_PROMPT : OFFLINE_SYSTEM_PROMPT;
    if (detail_level == DetailLevel::CONCISE) {
        prompt += "\n\nFORMAT: Maximum 3 bullet points total. Be extremely concise.";
    } else if (detail_level == DetailLevel::DETAILED) {
        prompt += "\n\nFORMAT: Include specific statistics and direct quotes where available.";
    }
    return prompt;
}

std::string Synthesizer::build_context(const std::vector<const Source*>& corpus,
                                       std::set<size_t>& included) const {
    std::string context;
    size_t used_words = 0;

    for (const Source* source : corpus) {
        size_t words = word_count(source->extracted_text);
        std::string content = source->extracted_text;
        if (used_words + words > config_.max_context_words) {
            if (used_words > 0) {
                break;
            }
            content = take_words(content, config_.max_context_words) + "...";
            words = config_.max_context_words;
        }
        used_words += words;

        context += "[Source " + std::to_string(source->citation_index) + "] " + source->url + "\n";
        context += "Title: " + (source->title.empty() ? std::string("N/A") : source->title) + "\n";
        context += "Content: " + content + "\n---\n";
        included.insert(source->citation_index);
    }
    return context;
}

std::string Synthesizer::build_history(const std::vector<HistoryEntry>& history) const {
    if (history.empty() || config_.history_turns == 0) {
        return "";
    }

    size_t first = history.size() > config_.history_turns ? history.size() - config_.history_turns : 0;
    std::string text = "PREVIOUS CONVERSATION:\n";
    for (size_t i = first; i < history.size(); ++i) {
        std::string answer = history[i].answer;
        if (answer.size() > config_.history_answer_chars) {
            answer = answer.substr(0, config_.history_answer_chars) + "...";
        }
        text += "User asked: " + history[i].query + "\nYou answered: " + answer + "\n---\n";
    }
    text += "CURRENT QUERY:\n";
    return text;
}

std::string Synthesizer::build_prompt(const std::string& user_query,
                                      const std::vector<const Source*>& corpus,
                                      const SynthesisOptions& options,
                                      std::set<size_t>& included) const {
    bool with_sources = !options.offline && !corpus.empty();

    std::string prompt = build_system_prompt(options.detail_level, with_sources) + "\n\n";
    prompt += build_history(options.history);

    if (with_sources) {
        prompt += "Please write a detailed research report on the query: \"" + user_query + "\"\n\n";
        prompt += "Use the following search results as your only source of information:\n---\n";
        prompt += build_context(corpus, included);
        prompt += "---\n\n";
    } else {
        prompt += "Please write a research report on the query: \"" + user_query + "\"\n\n";
    }
    prompt += "Report:\n";
    return prompt;
}

Report Synthesizer::build_report(const std::string& text,
                                 const std::vector<const Source*>& corpus,
                                 const std::set<size_t>& valid) {
    Report report;
    std::set<size_t> used;
    report.body = parsing::trim(parsing::filter_citations(text, valid, &used));

    parsing::ReportSections sections = parsing::split_sections(report.body);
    report.summary = sections.summary;
    report.findings = sections.findings;
    report.conclusion = sections.conclusion;

    for (size_t index : used) {
        for (const Source* source : corpus) {
            if (source->citation_index == index) {
                report.citations.emplace_back(index, source->url, source->title);
                break;
            }
        }
    }
    report.external_sources_consulted = !corpus.empty();
    return report;
}

Report Synthesizer::no_sources_report(const std::string& user_query) {
    Report report;
    report.summary = "No sources were retrievable for \"" + user_query +
                     "\", so no report grounded in web content could be written. "
                     "Try rephrasing the query or check network access.";
    report.body = report.summary;
    report.notice = "No sources were retrievable";
    report.external_sources_consulted = false;
    return report;
}

std::string Synthesizer::summarize_source(const Source& source,
                                         double temperature,
                                         const ResearchContext& ctx) const {
    std::string prompt = "Summarize the following text in under " + std::to_string(config_.summary_max_words) +
                         " words, focusing on the key facts and figures:\n\n" +
                         source.extracted_text + "\n\nSummary:\n";
    std::string fallback = take_words(source.extracted_text, config_.summary_max_words) + "...";

    Logger& logger = Logger::get_instance();
    auto start = std::chrono::steady_clock::now();
    std::string summary;
    try {
        summary = SessionCache::get_instance().generate(prompt, std::min(temperature, 0.3),
                                                        static_cast<int>(config_.summary_max_words) * 2);
    } catch (const OracleUnavailable& e) {
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        logger.log_oracle_call(ctx, "summarize", prompt.size(), 0, elapsed, false);
        logger.log_warning(ctx, "Summarizing " + source.url + " failed, truncating: " + e.what());
        return fallback;
    }
    double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    logger.log_oracle_call(ctx, "summarize", prompt.size(), summary.size(), elapsed, true);

    summary = parsing::strip_reasoning_blocks(summary);
    return summary.empty() ? fallback : summary;
}

Report Synthesizer::synthesize(const std::string& user_query,
                               const std::vector<const Source*>& corpus,
                               const SynthesisOptions& options,
                               const ResearchContext& ctx) const {
    Logger& logger = Logger::get_instance();

    if (corpus.empty() && !options.offline) {
        logger.log_warning(ctx, "Corpus is empty, writing a no-sources report");
        return no_sources_report(user_query);
    }

    // Condensed copies stand in for long extracts; url, title and index are unchanged
    std::vector<Source> condensed;
    std::vector<const Source*> context_corpus = corpus;
    if (config_.summarize_long_sources && !options.offline) {
        condensed.reserve(corpus.size());
        for (size_t i = 0; i < corpus.size(); ++i) {
            if (word_count(corpus[i]->extracted_text) <= config_.summary_threshold_words) {
                continue;
            }
            condensed.push_back(*corpus[i]);
            condensed.back().extracted_text = summarize_source(*corpus[i], options.temperature, ctx);
            context_corpus[i] = &condensed.back();
        }
    }

    std::set<size_t> included;
    std::string prompt = build_prompt(user_query, context_corpus, options, included);
    logger.debug("Synthesis prompt", {{"prompt", prompt}});

    auto start = std::chrono::steady_clock::now();
    std::string text;
    try {
        text = SessionCache::get_instance().generate(prompt, options.temperature, config_.max_tokens);
    } catch (const OracleUnavailable&) {
        double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        logger.log_oracle_call(ctx, "synthesis", prompt.size(), 0, elapsed, false);
        throw;
    }
    double elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    logger.log_oracle_call(ctx, "synthesis", prompt.size(), text.size(), elapsed, true);

    text = parsing::strip_reasoning_blocks(text);
    if (text.empty()) {
        throw OracleUnavailable("model returned an empty report");
    }

    if (options.offline) {
        Report report = build_report(parsing::strip_citations(text), {}, {});
        report.notice = NO_SOURCES_NOTICE;
        return report;
    }
    return build_report(text, corpus, included);
}

} // namespace deepdive
