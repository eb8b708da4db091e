#include "retrieval/html_document.hpp"
#include "research_types.hpp"
#include <cctype>
#include <sstream>
#include <utility>

namespace deepdive {

namespace {

bool is_inline_tag(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_A:
        case GUMBO_TAG_ABBR:
        case GUMBO_TAG_B:
        case GUMBO_TAG_BDI:
        case GUMBO_TAG_BDO:
        case GUMBO_TAG_CITE:
        case GUMBO_TAG_CODE:
        case GUMBO_TAG_DFN:
        case GUMBO_TAG_EM:
        case GUMBO_TAG_I:
        case GUMBO_TAG_KBD:
        case GUMBO_TAG_MARK:
        case GUMBO_TAG_Q:
        case GUMBO_TAG_S:
        case GUMBO_TAG_SAMP:
        case GUMBO_TAG_SMALL:
        case GUMBO_TAG_SPAN:
        case GUMBO_TAG_STRONG:
        case GUMBO_TAG_SUB:
        case GUMBO_TAG_SUP:
        case GUMBO_TAG_TIME:
        case GUMBO_TAG_U:
        case GUMBO_TAG_VAR:
            return true;
        default:
            return false;
    }
}

// Pre-order walk without recursion; deeply nested markup must not exhaust the stack
void walk(const GumboNode* start, const std::function<bool(const GumboNode*)>& visit) {
    std::vector<const GumboNode*> stack;
    stack.push_back(start);
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT) {
            continue;
        }
        if (!visit(node)) {
            return;
        }
        const GumboVector& children = node->v.element.children;
        for (unsigned int i = children.length; i > 0; --i) {
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
        }
    }
}

} // namespace

HtmlDocument::HtmlDocument(const std::string& html)
    : source_(html), output_(nullptr) {
    output_ = gumbo_parse_with_options(&kGumboDefaultOptions, source_.data(), source_.size());
    if (output_ == nullptr || output_->root == nullptr) {
        throw ExtractionEmpty("HTML parser produced no document");
    }
}

HtmlDocument::~HtmlDocument() {
    if (output_) {
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
    }
}

const GumboNode* HtmlDocument::root() const {
    return output_->root;
}

std::string HtmlDocument::title() const {
    const GumboNode* title = find_first([](const GumboNode* node) {
        return is_element(node, GUMBO_TAG_TITLE);
    });
    return title ? collapse_whitespace(text_content(title)) : "";
}

const GumboNode* HtmlDocument::find_first(const NodePredicate& predicate) const {
    return find_in(root(), predicate);
}

const GumboNode* HtmlDocument::find_in(const GumboNode* start, const NodePredicate& predicate) {
    const GumboNode* found = nullptr;
    if (start == nullptr) {
        return found;
    }
    walk(start, [&](const GumboNode* node) {
        if (predicate(node)) {
            found = node;
            return false;
        }
        return true;
    });
    return found;
}

std::vector<const GumboNode*> HtmlDocument::find_all(const NodePredicate& predicate) const {
    std::vector<const GumboNode*> found;
    walk(root(), [&](const GumboNode* node) {
        if (predicate(node)) {
            found.push_back(node);
        }
        return true;
    });
    return found;
}

std::string HtmlDocument::attribute(const GumboNode* node, const char* name) {
    if (node == nullptr || node->type != GUMBO_NODE_ELEMENT) {
        return "";
    }
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : "";
}

bool HtmlDocument::has_class(const GumboNode* node, const std::string& class_name) {
    std::istringstream classes(attribute(node, "class"));
    std::string token;
    while (classes >> token) {
        if (token == class_name) {
            return true;
        }
    }
    return false;
}

bool HtmlDocument::is_element(const GumboNode* node, GumboTag tag) {
    return node != nullptr && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

std::string HtmlDocument::text_content(const GumboNode* node, const NodePredicate& skip) {
    std::string text;
    if (node == nullptr) {
        return text;
    }

    // Second member marks the closing visit of a block element
    std::vector<std::pair<const GumboNode*, bool>> stack;
    stack.emplace_back(node, false);

    while (!stack.empty()) {
        auto [current, closing] = stack.back();
        stack.pop_back();

        if (closing) {
            text += ' ';
            continue;
        }

        switch (current->type) {
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_CDATA:
            case GUMBO_NODE_WHITESPACE:
                text += current->v.text.text;
                break;
            case GUMBO_NODE_ELEMENT: {
                if (skip && current != node && skip(current)) {
                    break;
                }
                bool block = !is_inline_tag(current->v.element.tag);
                if (block) {
                    text += ' ';
                    stack.emplace_back(current, true);
                }
                const GumboVector& children = current->v.element.children;
                for (unsigned int i = children.length; i > 0; --i) {
                    stack.emplace_back(static_cast<const GumboNode*>(children.data[i - 1]), false);
                }
                break;
            }
            default:
                break;
        }
    }

    return text;
}

std::string collapse_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
        } else {
            if (pending_space) {
                result += ' ';
                pending_space = false;
            }
            result += c;
        }
    }
    return result;
}

} // namespace deepdive
