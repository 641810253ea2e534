/**
 * @file XmlSerializer.cpp
 * @brief Byte-exact serializer matching the appliance exporter's output
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * The signature is an HMAC over serialized bytes, so every rule here is
 * load-bearing: one extra newline or a different attribute order changes
 * the digest.
 */

#include <Gsa/Core/XmlDocument.hpp>

#include <libxml/tree.h>
#include <libxml/xmlmemory.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace Gsa::Xml {

namespace {

constexpr const char* XML_DECLARATION = "<?xml version=\"1.0\" ?>";

void appendRaw(std::string& out, const xmlChar* text) {
    if (text != nullptr) {
        out += reinterpret_cast<const char*>(text);
    }
}

void appendEscaped(std::string& out, const xmlChar* text) {
    if (text == nullptr) {
        return;
    }
    for (const xmlChar* p = text; *p; ++p) {
        switch (*p) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '"': out += "&quot;"; break;
            case '>': out += "&gt;"; break;
            default: out += static_cast<char>(*p); break;
        }
    }
}

/// Content with entity references expanded
std::string expandedContent(const xmlNode* node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return std::string();
    }
    std::string result(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return result;
}

std::string attributeName(const xmlAttr* attr) {
    std::string name;
    if (attr->ns != nullptr && attr->ns->prefix != nullptr) {
        name = reinterpret_cast<const char*>(attr->ns->prefix);
        name += ':';
    }
    name += reinterpret_cast<const char*>(attr->name);
    return name;
}

/// Namespace declarations count as ordinary attributes for ordering
void appendAttributes(std::string& out, const xmlNode* element) {
    std::vector<std::pair<std::string, std::string>> attributes;

    for (const xmlNs* ns = element->nsDef; ns != nullptr; ns = ns->next) {
        std::string name = "xmlns";
        if (ns->prefix != nullptr) {
            name += ':';
            name += reinterpret_cast<const char*>(ns->prefix);
        }
        std::string href;
        if (ns->href != nullptr) {
            href = reinterpret_cast<const char*>(ns->href);
        }
        attributes.emplace_back(std::move(name), std::move(href));
    }

    for (const xmlAttr* attr = element->properties; attr != nullptr; attr = attr->next) {
        attributes.emplace_back(attributeName(attr),
                                expandedContent(reinterpret_cast<const xmlNode*>(attr)));
    }

    std::sort(attributes.begin(), attributes.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (const auto& [name, value] : attributes) {
        out += ' ';
        out += name;
        out += "=\"";
        appendEscaped(out, reinterpret_cast<const xmlChar*>(value.c_str()));
        out += '"';
    }
}

void appendDoctype(std::string& out, const xmlNode* node) {
    const xmlDtd* dtd = reinterpret_cast<const xmlDtd*>(node);

    out += "<!DOCTYPE ";
    appendRaw(out, dtd->name);
    if (dtd->ExternalID != nullptr) {
        out += "  PUBLIC '";
        appendRaw(out, dtd->ExternalID);
        out += "'  '";
        appendRaw(out, dtd->SystemID);
        out += '\'';
    } else if (dtd->SystemID != nullptr) {
        out += "  SYSTEM '";
        appendRaw(out, dtd->SystemID);
        out += '\'';
    }

    // The internal subset is rebuilt from the parsed declarations
    if (dtd->children != nullptr) {
        xmlBufferPtr buffer = xmlBufferCreate();
        if (buffer != nullptr) {
            for (xmlNodePtr decl = dtd->children; decl != nullptr; decl = decl->next) {
                xmlNodeDump(buffer, dtd->doc, decl, 0, 0);
            }
            out += " [";
            appendRaw(out, xmlBufferContent(buffer));
            out += ']';
            xmlBufferFree(buffer);
        }
    }
    out += '>';
}

void appendNode(std::string& out, const xmlNode* node);

void appendChildren(std::string& out, const xmlNode* parent) {
    for (const xmlNode* child = parent->children; child != nullptr; child = child->next) {
        appendNode(out, child);
    }
}

void appendNode(std::string& out, const xmlNode* node) {
    switch (node->type) {
        case XML_ELEMENT_NODE: {
            std::string name = qualifiedName(node);
            out += '<';
            out += name;
            appendAttributes(out, node);
            if (node->children == nullptr) {
                out += "/>";
            } else {
                out += '>';
                appendChildren(out, node);
                out += "</";
                out += name;
                out += '>';
            }
            break;
        }

        case XML_TEXT_NODE:
            appendEscaped(out, node->content);
            break;

        case XML_CDATA_SECTION_NODE:
            out += "<![CDATA[";
            appendRaw(out, node->content);
            out += "]]>";
            break;

        case XML_ENTITY_REF_NODE: {
            std::string content = expandedContent(node);
            appendEscaped(out, reinterpret_cast<const xmlChar*>(content.c_str()));
            break;
        }

        case XML_COMMENT_NODE:
            out += "<!--";
            appendRaw(out, node->content);
            out += "-->";
            break;

        case XML_PI_NODE:
            out += "<?";
            appendRaw(out, node->name);
            out += ' ';
            appendRaw(out, node->content);
            out += "?>";
            break;

        case XML_DTD_NODE:
            appendDoctype(out, node);
            break;

        case XML_DOCUMENT_NODE:
            out += XML_DECLARATION;
            appendChildren(out, node);
            break;

        default:
            // XInclude markers and DTD declarations outside a DTD carry no output
            break;
    }
}

} // namespace

std::string serialize(ConstNode node) {
    std::string out;
    if (node != nullptr) {
        appendNode(out, node);
    }
    return out;
}

std::string Document::serialize(const SerializeOptions& options) const {
    std::string out = XML_DECLARATION;
    if (!m_doc) {
        return out;
    }

    for (const xmlNode* child = m_doc->children; child != nullptr; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && !options.rootOnOwnLine.empty() &&
            qualifiedName(child) == options.rootOnOwnLine) {
            out += '\n';
        }
        appendNode(out, child);
    }
    return out;
}

} // namespace Gsa::Xml
