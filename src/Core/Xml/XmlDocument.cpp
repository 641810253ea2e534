/**
 * @file XmlDocument.cpp
 * @brief libxml2-backed document parsing, lookup and mutation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/XmlDocument.hpp>
#include <Gsa/Core/Logger.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <limits>
#include <vector>

namespace Gsa::Xml {

namespace {

/// No network, keep blanks and CDATA sections, no entity substitution.
/// HUGE lifts the per-node text limit; callers bound the document size.
constexpr int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR |
                              XML_PARSE_NOWARNING | XML_PARSE_HUGE;

bool isWhitespaceOnly(const xmlChar* text) noexcept {
    if (text == nullptr) {
        return true;
    }
    for (const xmlChar* p = text; *p; ++p) {
        if (*p != ' ' && *p != '\t' && *p != '\n' && *p != '\r') {
            return false;
        }
    }
    return true;
}

bool isBlankText(const xmlNode* node) noexcept {
    return node != nullptr && node->type == XML_TEXT_NODE &&
           isWhitespaceOnly(node->content);
}

void freeNode(xmlNodePtr node) noexcept {
    xmlUnlinkNode(node);
    xmlFreeNode(node);
}

void replaceOrDrop(xmlNodePtr textNode, const std::string& content) {
    if (content.empty()) {
        freeNode(textNode);
    } else {
        xmlNodeSetContentLen(textNode, BAD_CAST content.data(),
                             static_cast<int>(content.size()));
    }
}

/// Indentation after the last line break of the preceding sibling
void trimTrailingIndent(xmlNodePtr textNode) {
    std::string content(reinterpret_cast<const char*>(textNode->content));
    size_t lastBreak = content.find_last_of('\n');
    content.erase(lastBreak == std::string::npos ? 0 : lastBreak + 1);
    replaceOrDrop(textNode, content);
}

/// Line break at the start of the following sibling
void trimLeadingBreak(xmlNodePtr textNode) {
    std::string content(reinterpret_cast<const char*>(textNode->content));
    if (content.compare(0, 2, "\r\n") == 0) {
        content.erase(0, 2);
    } else if (!content.empty() && content[0] == '\n') {
        content.erase(0, 1);
    } else {
        return;
    }
    replaceOrDrop(textNode, content);
}

/// Pre-order search, stops once `limit` matches are collected
void collectElements(xmlNodePtr first, std::string_view tag,
                     std::vector<xmlNodePtr>& matches, size_t limit) {
    for (xmlNodePtr cur = first; cur != nullptr && matches.size() < limit; cur = cur->next) {
        if (cur->type != XML_ELEMENT_NODE) {
            continue;
        }
        if (qualifiedName(cur) == tag) {
            matches.push_back(cur);
        }
        collectElements(cur->children, tag, matches, limit);
    }
}

} // namespace

// ============================================================================
// Document
// ============================================================================

void Document::DocDeleter::operator()(_xmlDoc* doc) const noexcept {
    if (doc != nullptr) {
        xmlFreeDoc(doc);
    }
}

Document::Document(_xmlDoc* doc) noexcept : m_doc(doc) {}

Document::Document(Document&& other) noexcept = default;
Document& Document::operator=(Document&& other) noexcept = default;
Document::~Document() = default;

Result<Document> Document::load(ByteSpan bytes) {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return ErrorCode::FileTooLarge;
    }

    xmlDocPtr doc = xmlReadMemory(reinterpret_cast<const char*>(bytes.data()),
                                  static_cast<int>(bytes.size()),
                                  nullptr, nullptr, PARSE_OPTIONS);
    if (doc == nullptr) {
        const xmlError* error = xmlGetLastError();
        if (error != nullptr && error->message != nullptr) {
            GSA_LOG_DEBUG_F("XML parse failed at line %d: %s",
                            error->line, error->message);
        } else {
            GSA_LOG_DEBUG("XML parse failed");
        }
        return ErrorCode::XmlParseFailed;
    }

    if (xmlDocGetRootElement(doc) == nullptr) {
        xmlFreeDoc(doc);
        return ErrorCode::XmlParseFailed;
    }

    return Document(doc);
}

Node Document::root() const noexcept {
    return m_doc ? xmlDocGetRootElement(m_doc.get()) : nullptr;
}

Result<Node> Document::findSingle(std::string_view tag) const {
    std::vector<xmlNodePtr> matches;
    collectElements(root(), tag, matches, 2);

    if (matches.empty()) {
        GSA_LOG_DEBUG_F("Element <%.*s> not found",
                        static_cast<int>(tag.size()), tag.data());
        return ErrorCode::ElementNotFound;
    }
    if (matches.size() > 1) {
        GSA_LOG_DEBUG_F("Element <%.*s> occurs more than once",
                        static_cast<int>(tag.size()), tag.data());
        return ErrorCode::DuplicateElement;
    }
    return matches.front();
}

Node Document::findFirst(std::string_view tag) const {
    std::vector<xmlNodePtr> matches;
    collectElements(root(), tag, matches, 1);
    return matches.empty() ? nullptr : matches.front();
}

// ============================================================================
// Node helpers
// ============================================================================

std::string qualifiedName(ConstNode node) {
    if (node == nullptr || node->name == nullptr) {
        return std::string();
    }

    std::string name;
    if (node->type == XML_ELEMENT_NODE && node->ns != nullptr && node->ns->prefix != nullptr) {
        name = reinterpret_cast<const char*>(node->ns->prefix);
        name += ':';
    }
    name += reinterpret_cast<const char*>(node->name);
    return name;
}

bool hasChildren(ConstNode node) noexcept {
    return node != nullptr && node->children != nullptr;
}

bool isCharacterData(ConstNode node) noexcept {
    return node != nullptr &&
           (node->type == XML_TEXT_NODE || node->type == XML_CDATA_SECTION_NODE);
}

Result<std::string> firstChildText(ConstNode element) {
    if (element == nullptr || element->type != XML_ELEMENT_NODE) {
        return ErrorCode::InvalidArgument;
    }

    const xmlNode* child = element->children;
    if (child == nullptr) {
        return std::string();
    }
    if (!isCharacterData(child)) {
        return ErrorCode::UnexpectedNodeType;
    }
    if (child->content == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(child->content));
}

Result<void> setText(Node element, std::string_view text) {
    if (element == nullptr || element->type != XML_ELEMENT_NODE) {
        return ErrorCode::InvalidArgument;
    }
    if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return ErrorCode::InvalidArgument;
    }

    xmlNodePtr child = element->children;
    if (child == nullptr) {
        xmlNodePtr created = xmlNewDocTextLen(element->doc,
                                              BAD_CAST text.data(),
                                              static_cast<int>(text.size()));
        if (created == nullptr) {
            return ErrorCode::AllocationFailed;
        }
        if (xmlAddChild(element, created) == nullptr) {
            xmlFreeNode(created);
            return ErrorCode::InternalError;
        }
        return Result<void>::Success();
    }

    if (!isCharacterData(child)) {
        return ErrorCode::UnexpectedNodeType;
    }

    xmlNodeSetContentLen(child, BAD_CAST text.data(), static_cast<int>(text.size()));
    return Result<void>::Success();
}

void removeChildren(Node element) noexcept {
    if (element == nullptr) {
        return;
    }
    while (element->children != nullptr) {
        freeNode(element->children);
    }
}

void removeFromParent(Node node, WhitespaceFixup fixup) {
    if (node == nullptr) {
        return;
    }

    xmlNodePtr prev = node->prev;
    xmlNodePtr next = node->next;
    freeNode(node);

    if (fixup != WhitespaceFixup::ElementLine) {
        return;
    }

    if (isBlankText(prev)) {
        trimTrailingIndent(prev);
    }
    if (isBlankText(next)) {
        trimLeadingBreak(next);
    }
}

bool isWithin(ConstNode node, ConstNode ancestor) noexcept {
    if (ancestor == nullptr) {
        return false;
    }
    for (const xmlNode* cur = node; cur != nullptr; cur = cur->parent) {
        if (cur == ancestor) {
            return true;
        }
    }
    return false;
}

} // namespace Gsa::Xml
