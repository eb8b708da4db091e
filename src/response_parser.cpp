#include "response_parser.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

namespace deepdive {
namespace parsing {

namespace {

enum class Section { NONE, SUMMARY, FINDINGS, CONCLUSION };

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Index of the ']' closing the '[' at open, npos if unbalanced
size_t matching_bracket(const std::string& text, size_t open) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

std::string strip_quotes(std::string value) {
    value = trim(value);
    while (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'') ||
            (first == '`' && last == '`')) {
            value = trim(value.substr(1, value.size() - 2));
        } else {
            break;
        }
    }
    return value;
}

// "- x", "* x", "• x", "1. x", "2) x" -> "x"; empty when the line is not a list item
std::string list_item_text(const std::string& line) {
    std::string value = trim(line);
    if (starts_with(value, "- ") || starts_with(value, "* ") || starts_with(value, "+ ")) {
        return trim(value.substr(2));
    }
    if (starts_with(value, "\xE2\x80\xA2")) {
        return trim(value.substr(3));
    }
    size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits > 0 && digits + 1 < value.size() &&
        (value[digits] == '.' || value[digits] == ')') && value[digits + 1] == ' ') {
        return trim(value.substr(digits + 2));
    }
    return "";
}

bool is_none_answer(const std::string& text) {
    std::string value = to_lower(strip_quotes(text));
    while (!value.empty() && (value.back() == '.' || value.back() == '!')) {
        value.pop_back();
    }
    return value == "none" || value == "[]" || value == "no new queries";
}

Section classify_heading(std::string head) {
    head = trim(head);
    while (!head.empty() && (head.front() == '#' || head.front() == '*' || head.front() == '_' ||
                             std::isspace(static_cast<unsigned char>(head.front())))) {
        head.erase(head.begin());
    }
    while (!head.empty() && (head.back() == '*' || head.back() == '_' || head.back() == ':' ||
                             head.back() == '#' || std::isspace(static_cast<unsigned char>(head.back())))) {
        head.pop_back();
    }
    size_t digits = 0;
    while (digits < head.size() && std::isdigit(static_cast<unsigned char>(head[digits]))) {
        ++digits;
    }
    if (digits > 0 && digits < head.size() && (head[digits] == '.' || head[digits] == ')')) {
        head = trim(head.substr(digits + 1));
    }

    std::string lowered = to_lower(head);
    if (lowered == "summary" || lowered == "executive summary" || lowered == "overview") {
        return Section::SUMMARY;
    }
    if (lowered == "findings" || lowered == "detailed findings" || lowered == "key findings") {
        return Section::FINDINGS;
    }
    if (lowered == "conclusion" || lowered == "conclusions") {
        return Section::CONCLUSION;
    }
    return Section::NONE;
}

// Heading line, optionally with content after a colon ("Summary: ...")
Section heading_of(const std::string& line, std::string& rest) {
    rest.clear();
    std::string value = trim(line);
    if (value.empty()) {
        return Section::NONE;
    }
    Section section = value.size() <= 80 ? classify_heading(value) : Section::NONE;
    if (section != Section::NONE) {
        return section;
    }
    size_t colon = value.find(':');
    if (colon == std::string::npos || colon > 40) {
        return Section::NONE;
    }
    section = classify_heading(value.substr(0, colon + 1));
    if (section != Section::NONE) {
        rest = trim(value.substr(colon + 1));
        while (!rest.empty() && (rest.front() == '*' || rest.front() == '_')) {
            rest = trim(rest.substr(1));
        }
    }
    return section;
}

void append_text(std::string& target, const std::string& text, bool new_paragraph) {
    if (text.empty()) {
        return;
    }
    if (!target.empty()) {
        target += new_paragraph ? "\n\n" : " ";
    }
    target += text;
}

struct CitationGroup {
    size_t begin;
    size_t end;              ///< One past the closing bracket
    char open;               ///< '[' or '('
    bool source_prefix;
    std::vector<size_t> indices;

    CitationGroup() : begin(0), end(0), open('['), source_prefix(false) {}
};

constexpr size_t MAX_RANGE_SPAN = 50;
constexpr size_t MAX_LOOSE_GROUP_CHARS = 120;

char closing_for(char open) {
    return open == '(' ? ')' : ']';
}

bool match_keyword(const std::string& text, size_t pos, const std::string& keyword) {
    if (pos + keyword.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

bool skip_source_keyword(const std::string& text, size_t& i) {
    if (match_keyword(text, i, "sources")) {
        i += 7;
        return true;
    }
    if (match_keyword(text, i, "source")) {
        i += 6;
        return true;
    }
    return false;
}

bool read_index(const std::string& text, size_t& i, size_t& value) {
    size_t digits = 0;
    value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (++digits > 6) {
            return false;
        }
        value = value * 10 + static_cast<size_t>(text[i] - '0');
        ++i;
    }
    return digits > 0;
}

// "[3]", "[1, 4]", "[1-3]", "[Source 1; Source 9]", "[Sources 2 and 9]", "(Source 4)".
// Parenthesized groups need the Source keyword.
bool parse_strict_group(const std::string& text, size_t open, CitationGroup& group) {
    const char close = closing_for(text[open]);
    size_t i = open + 1;
    auto skip_spaces = [&]() {
        while (i < text.size() && text[i] == ' ') ++i;
    };

    skip_spaces();
    group.source_prefix = skip_source_keyword(text, i);
    if (group.open == '(' && !group.source_prefix) {
        return false;
    }
    skip_spaces();

    while (true) {
        size_t first = 0;
        if (!read_index(text, i, first)) {
            return false;
        }
        skip_spaces();
        if (i < text.size() && text[i] == '-') {
            ++i;
            skip_spaces();
            skip_source_keyword(text, i);
            skip_spaces();
            size_t last = 0;
            if (!read_index(text, i, last) || last < first || last - first > MAX_RANGE_SPAN) {
                return false;
            }
            for (size_t k = first; k <= last; ++k) {
                group.indices.push_back(k);
            }
            skip_spaces();
        } else {
            group.indices.push_back(first);
        }

        if (i < text.size() && text[i] == close) {
            group.end = i + 1;
            return true;
        }
        if (i < text.size() && (text[i] == ',' || text[i] == ';' || text[i] == '&')) {
            ++i;
            skip_spaces();
        }
        if (match_keyword(text, i, "and ")) {
            i += 4;
            skip_spaces();
        } else if (i > 0 && text[i - 1] != ' ' && text[i - 1] != ',' &&
                   text[i - 1] != ';' && text[i - 1] != '&') {
            return false;
        }
        skip_source_keyword(text, i);
        skip_spaces();
    }
}

// Any short group naming "Source <n>", e.g. "[see Source 3]"
bool parse_loose_group(const std::string& text, size_t open, CitationGroup& group) {
    const char close = closing_for(text[open]);
    size_t end = text.find(close, open + 1);
    if (end == std::string::npos || end - open > MAX_LOOSE_GROUP_CHARS) {
        return false;
    }
    std::string inner = text.substr(open + 1, end - open - 1);
    if (inner.find(text[open]) != std::string::npos || inner.find('\n') != std::string::npos) {
        return false;
    }

    for (size_t i = 0; i < inner.size(); ++i) {
        if (i > 0 && std::isalpha(static_cast<unsigned char>(inner[i - 1]))) {
            continue;
        }
        size_t j = i;
        if (!skip_source_keyword(inner, j)) {
            continue;
        }
        while (j < inner.size() && (inner[j] == ' ' || inner[j] == '#')) {
            ++j;
        }
        size_t value = 0;
        if (read_index(inner, j, value)) {
            group.indices.push_back(value);
        }
    }
    if (group.indices.empty()) {
        return false;
    }
    group.source_prefix = true;
    group.end = end + 1;
    return true;
}

bool parse_citation_group(const std::string& text, size_t open, CitationGroup& group) {
    group = CitationGroup();
    group.begin = open;
    group.open = text[open];
    if (parse_strict_group(text, open, group)) {
        return true;
    }

    group.indices.clear();
    return parse_loose_group(text, open, group);
}

std::vector<CitationGroup> find_citation_groups(const std::string& text) {
    std::vector<CitationGroup> groups;
    for (size_t pos = text.find_first_of("[("); pos != std::string::npos;
         pos = text.find_first_of("[(", pos + 1)) {
        CitationGroup group;
        if (parse_citation_group(text, pos, group)) {
            groups.push_back(group);
            pos = group.end - 1;
        }
    }
    return groups;
}

bool is_reasoning_tag(const std::string& name) {
    static const char* const TAGS[] = {
        "think", "thinking", "thought", "reasoning", "plan",
        "tool_call", "call", "execute", "human_input"
    };
    for (const char* tag : TAGS) {
        if (name == tag) {
            return true;
        }
    }
    return starts_with(name, "tool_code") || starts_with(name, "tool_output");
}

// Lower-cased element name of an opening tag at pos, empty if none
std::string opening_tag_name(const std::string& lower, size_t pos) {
    size_t i = pos + 1;
    while (i < lower.size() && (std::islower(static_cast<unsigned char>(lower[i])) || lower[i] == '_')) {
        ++i;
    }
    if (i == pos + 1 || i >= lower.size() || (lower[i] != '>' && lower[i] != ' ')) {
        return "";
    }
    return lower.substr(pos + 1, i - pos - 1);
}

void clean_queries(std::vector<std::string>& queries) {
    std::vector<std::string> cleaned;
    for (const std::string& query : queries) {
        std::string value = strip_quotes(query);
        if (!value.empty() && !is_none_answer(value)) {
            cleaned.push_back(value);
        }
    }
    queries.swap(cleaned);
}

} // namespace

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string query_key(const std::string& query) {
    std::string key;
    bool pending_space = false;
    for (char c : query) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !key.empty();
            continue;
        }
        if (pending_space) {
            key += ' ';
            pending_space = false;
        }
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

std::string strip_reasoning_blocks(const std::string& output) {
    std::string text = output;
    std::string lower = to_lower(output);

    size_t pos = lower.find('<');
    while (pos != std::string::npos) {
        std::string name = opening_tag_name(lower, pos);
        if (name.empty() || !is_reasoning_tag(name)) {
            pos = lower.find('<', pos + 1);
            continue;
        }

        size_t close = lower.find("</" + name + ">", pos);
        size_t end = close == std::string::npos ? lower.size() : close + name.size() + 3;
        text.erase(pos, end - pos);
        lower.erase(pos, end - pos);
        pos = lower.find('<', pos);
    }

    for (const char* closing : {"</think>", "</thinking>"}) {
        size_t orphan = lower.rfind(closing);
        if (orphan != std::string::npos) {
            size_t end = orphan + std::string(closing).size();
            text.erase(0, end);
            lower.erase(0, end);
        }
    }

    return trim(text);
}

QueryListParse parse_query_list(const std::string& output) {
    QueryListParse result;
    std::string text = trim(output);
    if (text.empty()) {
        return result;
    }
    if (is_none_answer(text)) {
        result.explicit_none = true;
        result.method = "none";
        return result;
    }

    for (size_t pos = text.find('['); pos != std::string::npos; pos = text.find('[', pos + 1)) {
        size_t end = matching_bracket(text, pos);
        if (end == std::string::npos) {
            continue;
        }
        try {
            nlohmann::json array = nlohmann::json::parse(text.substr(pos, end - pos + 1));
            if (!array.is_array()) {
                continue;
            }
            if (array.empty()) {
                result.explicit_none = true;
                result.method = "json";
                return result;
            }
            for (const auto& element : array) {
                if (element.is_string()) {
                    result.queries.push_back(element.get<std::string>());
                } else if (element.is_object() && element.contains("query") && element["query"].is_string()) {
                    result.queries.push_back(element["query"].get<std::string>());
                }
            }
            clean_queries(result.queries);
            if (!result.queries.empty()) {
                result.method = "json";
                return result;
            }
        } catch (const nlohmann::json::parse_error&) {
            continue;
        }
    }

    size_t open = text.find('"');
    while (open != std::string::npos) {
        size_t close = text.find('"', open + 1);
        if (close == std::string::npos) {
            break;
        }
        std::string candidate = trim(text.substr(open + 1, close - open - 1));
        if (candidate.size() >= 3 && candidate.find('\n') == std::string::npos) {
            result.queries.push_back(candidate);
        }
        open = text.find('"', close + 1);
    }
    clean_queries(result.queries);
    if (!result.queries.empty()) {
        result.method = "quoted";
        return result;
    }

    std::vector<std::string> lines = split_lines(text);
    if (lines.size() == 1) {
        lines.clear();
        std::string part;
        std::istringstream stream(text);
        while (std::getline(stream, part, ';')) {
            lines.push_back(part);
        }
    }
    for (const std::string& line : lines) {
        std::string value = trim(line);
        std::string item = list_item_text(value);
        if (!item.empty()) {
            value = item;
        }
        if (value.empty() || value.back() == ':' || value.front() == '[' || value.front() == '{') {
            continue;
        }
        result.queries.push_back(value);
    }
    clean_queries(result.queries);
    if (!result.queries.empty()) {
        result.method = "lines";
    }
    return result;
}

ReportSections split_sections(const std::string& text) {
    ReportSections sections;
    std::vector<std::string> lines = split_lines(text);

    bool has_headings = false;
    for (const std::string& line : lines) {
        std::string rest;
        if (heading_of(line, rest) != Section::NONE) {
            has_headings = true;
            break;
        }
    }

    if (has_headings) {
        Section current = Section::NONE;
        std::string preamble;
        bool blank_before = false;
        bool finding_open = false;

        for (const std::string& raw : lines) {
            std::string rest;
            Section heading = heading_of(raw, rest);
            if (heading != Section::NONE) {
                current = heading;
                finding_open = false;
                blank_before = false;
                if (rest.empty()) {
                    continue;
                }
            }

            std::string line = heading != Section::NONE ? rest : trim(raw);
            if (line.empty()) {
                blank_before = true;
                finding_open = false;
                continue;
            }

            switch (current) {
                case Section::NONE:
                    append_text(preamble, line, blank_before);
                    break;
                case Section::SUMMARY:
                    append_text(sections.summary, line, blank_before);
                    break;
                case Section::CONCLUSION:
                    append_text(sections.conclusion, line, blank_before);
                    break;
                case Section::FINDINGS: {
                    std::string item = list_item_text(line);
                    if (!item.empty()) {
                        sections.findings.push_back(item);
                        finding_open = true;
                    } else if (finding_open && !sections.findings.empty()) {
                        sections.findings.back() += " " + line;
                    } else {
                        sections.findings.push_back(line);
                        finding_open = true;
                    }
                    break;
                }
            }
            blank_before = false;
        }

        if (sections.summary.empty()) {
            sections.summary = preamble;
        }
        return sections;
    }

    // No headings: paragraphs and list items
    std::vector<std::string> paragraphs;
    std::string paragraph;
    for (const std::string& raw : lines) {
        std::string line = trim(raw);
        std::string item = list_item_text(line);
        if (!item.empty()) {
            if (!paragraph.empty()) {
                paragraphs.push_back(paragraph);
                paragraph.clear();
            }
            sections.findings.push_back(item);
            continue;
        }
        if (line.empty()) {
            if (!paragraph.empty()) {
                paragraphs.push_back(paragraph);
                paragraph.clear();
            }
            continue;
        }
        append_text(paragraph, line, false);
    }
    if (!paragraph.empty()) {
        paragraphs.push_back(paragraph);
    }

    if (!paragraphs.empty()) {
        sections.summary = paragraphs.front();
    }
    if (paragraphs.size() > 1) {
        sections.conclusion = paragraphs.back();
        for (size_t i = 1; i + 1 < paragraphs.size(); ++i) {
            sections.findings.push_back(paragraphs[i]);
        }
    }
    return sections;
}

std::set<size_t> cited_indices(const std::string& text) {
    std::set<size_t> indices;
    for (const CitationGroup& group : find_citation_groups(text)) {
        indices.insert(group.indices.begin(), group.indices.end());
    }
    return indices;
}

std::string filter_citations(const std::string& text,
                             const std::set<size_t>& valid,
                             std::set<size_t>* used) {
    std::string result;
    size_t cursor = 0;

    for (const CitationGroup& group : find_citation_groups(text)) {
        result += text.substr(cursor, group.begin - cursor);
        cursor = group.end;

        std::vector<size_t> kept;
        for (size_t index : group.indices) {
            if (valid.count(index) > 0 && std::find(kept.begin(), kept.end(), index) == kept.end()) {
                kept.push_back(index);
            }
        }

        if (kept.empty()) {
            while (!result.empty() && result.back() == ' ') {
                result.pop_back();
            }
            continue;
        }

        std::string rewritten(1, group.open);
        if (group.source_prefix) {
            rewritten += "Source ";
        }
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) rewritten += ", ";
            rewritten += std::to_string(kept[i]);
            if (used) {
                used->insert(kept[i]);
            }
        }
        rewritten += closing_for(group.open);
        result += rewritten;
    }

    result += text.substr(cursor);
    return result;
}

std::string strip_citations(const std::string& text) {
    return filter_citations(text, {});
}

} // namespace parsing
} // namespace deepdive
