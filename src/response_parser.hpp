/**
 * @file response_parser.hpp
 * @brief Parsing of free-form language model output
 *
 * Model output is untrusted text. Every parser here has an explicit fallback
 * chain and never throws on malformed input.
 */

#ifndef DEEPDIVE_RESPONSE_PARSER_HPP
#define DEEPDIVE_RESPONSE_PARSER_HPP

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace deepdive {
namespace parsing {

/**
 * @brief Result of parsing a sub-query list
 */
struct QueryListParse {
    std::vector<std::string> queries;
    bool explicit_none;     ///< Model answered "NONE" or an empty JSON array
    std::string method;     ///< "json", "quoted", "lines" or "" when nothing matched

    QueryListParse() : explicit_none(false) {}
};

/**
 * @brief Extract a list of search queries
 *
 * Tries, in order: the first JSON array of strings, double-quoted strings,
 * then one query per line (or per ';' on a single line) with list markers
 * removed.
 */
QueryListParse parse_query_list(const std::string& output);

/**
 * @brief Report text split into its three sections
 */
struct ReportSections {
    std::string summary;
    std::vector<std::string> findings;
    std::string conclusion;
};

/**
 * @brief Split report text on Summary / Findings / Conclusion headings
 *
 * Without recognizable headings the first paragraph becomes the summary,
 * list items the findings and the last non-list paragraph the conclusion.
 */
ReportSections split_sections(const std::string& text);

/**
 * @brief Every citation index referenced in text
 *
 * Recognized groups: [k], [k, m], [k-m], [k; m], [k and m], the same with a
 * Source or Sources keyword, (Source k ...), and any short bracket or paren
 * group that names "Source k" somewhere inside.
 */
std::set<size_t> cited_indices(const std::string& text);

/**
 * @brief Rewrite citation groups keeping only indices in valid
 *
 * Groups left empty are removed along with the space before them.
 *
 * @param used Receives the indices that survived, may be nullptr
 */
std::string filter_citations(const std::string& text,
                             const std::set<size_t>& valid,
                             std::set<size_t>* used = nullptr);

/**
 * @brief Remove every citation group
 */
std::string strip_citations(const std::string& text);

/**
 * @brief Remove reasoning and tool-call blocks emitted by reasoning models
 *
 * Drops <think>, <thinking>, <thought>, <reasoning>, <plan>, <tool_call>,
 * <call>, <execute>, <human_input> and <tool_code*> elements with their
 * content. An unclosed block runs to the end of the output; a closing
 * </think> without its opening tag (the chat template opened it) drops
 * everything before it.
 */
std::string strip_reasoning_blocks(const std::string& output);

std::string trim(const std::string& value);

/**
 * @brief Case- and whitespace-insensitive identity of a query
 */
std::string query_key(const std::string& query);

} // namespace parsing
} // namespace deepdive

#endif // DEEPDIVE_RESPONSE_PARSER_HPP
