/**
 * @file content_extractor.hpp
 * @brief Boilerplate-stripping main text extraction from HTML pages
 */

#ifndef DEEPDIVE_RETRIEVAL_CONTENT_EXTRACTOR_HPP
#define DEEPDIVE_RETRIEVAL_CONTENT_EXTRACTOR_HPP

#include <cstddef>
#include <string>

namespace deepdive {

struct ExtractedContent {
    std::string title;
    std::string text;        ///< Whitespace-collapsed, truncated main text
    size_t full_length;      ///< Length before truncation
    bool boilerplate;        ///< Short text dominated by legal/navigation phrases

    ExtractedContent() : full_length(0), boilerplate(false) {}
};

/**
 * @brief Extracts the main readable text of a page
 *
 * Scripts, styles, navigation, headers, footers, asides, forms and elements
 * marked as menus, ads, cookie banners or share widgets are removed. The first
 * main-content container found (article, main, [role=main], common CMS content
 * classes, #main, #content) is used, otherwise the whole body.
 */
class ContentExtractor {
public:
    explicit ContentExtractor(size_t max_chars = 2000);

    /**
     * @throws ExtractionEmpty if the HTML cannot be parsed at all
     */
    ExtractedContent extract(const std::string& html) const;

    /**
     * @brief Cut text to max_chars on a word boundary, appending "..." when shortened
     */
    static std::string truncate(const std::string& text, size_t max_chars);

    static bool is_boilerplate(const std::string& text);

private:
    size_t max_chars_;
};

} // namespace deepdive

#endif // DEEPDIVE_RETRIEVAL_CONTENT_EXTRACTOR_HPP
