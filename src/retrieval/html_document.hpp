/**
 * @file html_document.hpp
 * @brief RAII wrapper around a gumbo parse tree with small query helpers
 */

#ifndef DEEPDIVE_RETRIEVAL_HTML_DOCUMENT_HPP
#define DEEPDIVE_RETRIEVAL_HTML_DOCUMENT_HPP

#include <gumbo.h>
#include <functional>
#include <string>
#include <vector>

namespace deepdive {

class HtmlDocument {
public:
    using NodePredicate = std::function<bool(const GumboNode*)>;

    /**
     * @throws ExtractionEmpty if the parser produces no document
     */
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    /**
     * @brief The <html> element
     */
    const GumboNode* root() const;

    /**
     * @brief Whitespace-collapsed text of the first <title>, empty if none
     */
    std::string title() const;

    /**
     * @brief First element in document order satisfying predicate, nullptr if none
     */
    const GumboNode* find_first(const NodePredicate& predicate) const;

    std::vector<const GumboNode*> find_all(const NodePredicate& predicate) const;

    /**
     * @brief First element at or below start satisfying predicate, nullptr if none
     */
    static const GumboNode* find_in(const GumboNode* start, const NodePredicate& predicate);

    static std::string attribute(const GumboNode* node, const char* name);
    static bool has_class(const GumboNode* node, const std::string& class_name);
    static bool is_element(const GumboNode* node, GumboTag tag);

    /**
     * @brief Text below node, block elements separated by spaces
     *
     * @param skip Elements for which skip returns true are left out with their subtree
     */
    static std::string text_content(const GumboNode* node, const NodePredicate& skip = nullptr);

private:
    std::string source_;    ///< gumbo keeps pointers into the parsed buffer
    GumboOutput* output_;
};

/**
 * @brief Collapse whitespace runs to single spaces and trim both ends
 */
std::string collapse_whitespace(const std::string& text);

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_HTML_DOCUMENT_HPP
