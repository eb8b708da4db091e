#include "retrieval/content_extractor.hpp"
#include "retrieval/html_document.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>
#include <vector>

namespace deepdive {

namespace {

const char* const NOISE_KEYWORDS[] = {
    "nav", "navbar", "navigation", "menu", "sidebar", "footer", "cookie", "cookies",
    "consent", "banner", "ad", "ads", "advert", "advertisement", "sponsored", "share",
    "sharing", "social", "comment", "comments", "related", "breadcrumb", "breadcrumbs",
    "newsletter", "popup", "modal", "subscribe", "promo"
};

const char* const NOISE_ROLES[] = {
    "navigation", "banner", "contentinfo", "complementary", "dialog", "search"
};

const char* const BOILERPLATE_PHRASES[] = {
    "cookie policy", "terms of service", "privacy policy",
    "all rights reserved", "sign up", "log in", "subscribe"
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// "site-nav__item" matches "nav"; "navigator" does not
bool has_noise_token(const std::string& attribute_value) {
    std::string lowered = to_lower(attribute_value);
    std::string part;
    auto flush = [&part]() {
        bool hit = false;
        for (const char* keyword : NOISE_KEYWORDS) {
            if (part == keyword) {
                hit = true;
                break;
            }
        }
        part.clear();
        return hit;
    };
    for (char c : lowered) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            part += c;
        } else if (flush()) {
            return true;
        }
    }
    return flush();
}

bool is_noise(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT) {
        return false;
    }

    switch (node->v.element.tag) {
        case GUMBO_TAG_HEAD:
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_FORM:
        case GUMBO_TAG_BUTTON:
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_SVG:
        case GUMBO_TAG_TEMPLATE:
        case GUMBO_TAG_SELECT:
            return true;
        default:
            break;
    }

    std::string role = to_lower(HtmlDocument::attribute(node, "role"));
    for (const char* noise_role : NOISE_ROLES) {
        if (role == noise_role) {
            return true;
        }
    }
    if (HtmlDocument::attribute(node, "aria-hidden") == "true") {
        return true;
    }

    return has_noise_token(HtmlDocument::attribute(node, "class")) ||
           has_noise_token(HtmlDocument::attribute(node, "id"));
}

bool inside_noise(const GumboNode* node) {
    for (const GumboNode* p = node->parent; p != nullptr; p = p->parent) {
        if (is_noise(p)) {
            return true;
        }
    }
    return false;
}

std::vector<HtmlDocument::NodePredicate> content_selectors() {
    auto by_class = [](const char* name) {
        return [name](const GumboNode* node) { return HtmlDocument::has_class(node, name); };
    };
    auto by_id = [](const char* name) {
        return [name](const GumboNode* node) { return HtmlDocument::attribute(node, "id") == name; };
    };

    return {
        [](const GumboNode* node) { return HtmlDocument::is_element(node, GUMBO_TAG_ARTICLE); },
        [](const GumboNode* node) { return HtmlDocument::is_element(node, GUMBO_TAG_MAIN); },
        by_class("post-content"),
        by_class("entry-content"),
        by_class("td-post-content"),
        by_class("single-post-content"),
        by_class("article-body"),
        [](const GumboNode* node) { return HtmlDocument::attribute(node, "role") == "main"; },
        by_id("main"),
        by_id("content")
    };
}

} // namespace

ContentExtractor::ContentExtractor(size_t max_chars) : max_chars_(max_chars) {}

ExtractedContent ContentExtractor::extract(const std::string& html) const {
    HtmlDocument document(html);

    ExtractedContent content;
    content.title = document.title();

    std::string text;
    for (const auto& selector : content_selectors()) {
        for (const GumboNode* candidate : document.find_all(selector)) {
            if (is_noise(candidate) || inside_noise(candidate)) {
                continue;
            }
            text = collapse_whitespace(HtmlDocument::text_content(candidate, is_noise));
            if (!text.empty()) {
                break;
            }
        }
        if (!text.empty()) {
            break;
        }
    }

    if (text.empty()) {
        const GumboNode* body = document.find_first([](const GumboNode* node) {
            return HtmlDocument::is_element(node, GUMBO_TAG_BODY);
        });
        text = collapse_whitespace(HtmlDocument::text_content(body ? body : document.root(), is_noise));
    }

    content.full_length = text.size();
    content.boilerplate = is_boilerplate(text);
    content.text = truncate(text, max_chars_);
    return content;
}

std::string ContentExtractor::truncate(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }

    size_t cut = max_chars;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    size_t space = text.rfind(' ', cut);
    if (space != std::string::npos && space > max_chars / 2) {
        cut = space;
    }

    std::string result = text.substr(0, cut);
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result + "...";
}

bool ContentExtractor::is_boilerplate(const std::string& text) {
    if (text.size() >= 500) {
        return false;
    }
    std::string lowered = to_lower(text);
    for (const char* phrase : BOILERPLATE_PHRASES) {
        if (lowered.find(phrase) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace deepdive
