/**
 * @file XmlDocument.hpp
 * @brief In-memory XML tree with a legacy-compatible serializer
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Thin RAII layer over a libxml2 tree. Parsing keeps every whitespace text
 * node and every CDATA section, so the tree can be written back out by
 * serialize() exactly the way the appliance's own exporter writes it:
 * - `<?xml version="1.0" ?>` declaration, no newline after it
 * - attributes sorted by qualified name
 * - `&`, `<`, `"` and `>` escaped in text and attribute values
 * - childless elements written as `<tag/>`
 *
 * Nodes are plain libxml2 pointers owned by their Document; they are
 * invalidated when the Document is destroyed or the node is removed.
 */

#pragma once

#ifndef GSA_CORE_XML_DOCUMENT_HPP
#define GSA_CORE_XML_DOCUMENT_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <string>
#include <string_view>
#include <memory>

struct _xmlDoc;
struct _xmlNode;

namespace Gsa::Xml {

/// Non-owning handle to a node of a Document
using Node = _xmlNode*;

/// Non-owning read-only handle to a node of a Document
using ConstNode = const _xmlNode*;

/**
 * @brief What to do with the whitespace around a removed element
 */
enum class WhitespaceFixup {
    /// Only the element itself is removed
    None,

    /// Also remove the element's line layout: the indentation run at the end
    /// of a preceding whitespace-only text sibling and the leading line break
    /// of a following whitespace-only text sibling
    ElementLine
};

/**
 * @brief Options for whole-document serialization
 */
struct SerializeOptions {
    /// Put a line break in front of the root start tag when the root
    /// element has this name (empty disables)
    std::string rootOnOwnLine;
};

/**
 * @brief Owning XML document
 *
 * Move-only. Parsing never touches the network and never loads external
 * DTDs or entities.
 */
class Document {
public:
    /**
     * @brief Parse a document from UTF-8 (or self-declared encoding) bytes
     * @return Document, or ErrorCode::XmlParseFailed when not well-formed
     */
    static Result<Document> load(ByteSpan bytes);

    /// @overload
    static Result<Document> load(std::string_view text) {
        return load(asBytes(text));
    }

    Document(Document&& other) noexcept;
    Document& operator=(Document&& other) noexcept;
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    /// Root element, or nullptr for an empty document
    [[nodiscard]] Node root() const noexcept;

    /**
     * @brief Find the only element with a given qualified name
     * @return The element; ErrorCode::ElementNotFound when there is none,
     *         ErrorCode::DuplicateElement when there is more than one
     */
    [[nodiscard]] Result<Node> findSingle(std::string_view tag) const;

    /**
     * @brief Find the first element (document order) with a qualified name
     * @return The element or nullptr
     */
    [[nodiscard]] Node findFirst(std::string_view tag) const;

    /// Serialize the whole document
    [[nodiscard]] std::string serialize(const SerializeOptions& options = {}) const;

private:
    struct DocDeleter {
        void operator()(_xmlDoc* doc) const noexcept;
    };

    explicit Document(_xmlDoc* doc) noexcept;

    std::unique_ptr<_xmlDoc, DocDeleter> m_doc;
};

/**
 * @brief Serialize a node and its descendants
 *
 * Element nodes are written as a complete `<tag ...>...</tag>` fragment;
 * character data, comments and processing instructions as themselves.
 */
[[nodiscard]] std::string serialize(ConstNode node);

/// Qualified name (`prefix:local` or `local`) of an element
[[nodiscard]] std::string qualifiedName(ConstNode node);

/// Whether the node has at least one child node
[[nodiscard]] bool hasChildren(ConstNode node) noexcept;

/// Whether the node is a text or CDATA section node
[[nodiscard]] bool isCharacterData(ConstNode node) noexcept;

/**
 * @brief Character data held by an element's first child
 * @return Empty string for an element without children;
 *         ErrorCode::UnexpectedNodeType when the first child is not text/CDATA
 */
[[nodiscard]] Result<std::string> firstChildText(ConstNode element);

/**
 * @brief Replace the character data of an element's first child
 *
 * The first child keeps its node kind (text stays text, CDATA stays CDATA).
 * An element without children gets a new text child.
 *
 * @return ErrorCode::UnexpectedNodeType when the first child is not text/CDATA
 */
Result<void> setText(Node element, std::string_view text);

/// Remove every child of an element
void removeChildren(Node element) noexcept;

/**
 * @brief Unlink a node from its parent and free it
 *
 * The node handle is invalid afterwards.
 */
void removeFromParent(Node node, WhitespaceFixup fixup = WhitespaceFixup::None);

/// Whether `node` is `ancestor` or lies below it
[[nodiscard]] bool isWithin(ConstNode node, ConstNode ancestor) noexcept;

} // namespace Gsa::Xml

#endif // GSA_CORE_XML_DOCUMENT_HPP
