/**
 * @file test_xml_document.cpp
 * @brief Unit tests for XML parsing, lookup, mutation and serialization
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/XmlDocument.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Gsa;
using namespace Gsa::Xml;

namespace {

const std::string DECL = "<?xml version=\"1.0\" ?>";

Document loadOrFail(std::string_view text) {
    auto result = Document::load(text);
    if (result.isFailure()) {
        throw std::runtime_error("fixture document failed to parse");
    }
    return std::move(result).value();
}

std::string roundTrip(std::string_view text) {
    return loadOrFail(text).serialize();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(XmlParse, MalformedDocument_Fails) {
    auto result = Document::load(std::string_view("<eef><config></eef>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::XmlParseFailed);
}

TEST(XmlParse, EmptyInput_Fails) {
    auto result = Document::load(std::string_view(""));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::XmlParseFailed);
}

TEST(XmlParse, TrailingGarbage_Fails) {
    auto result = Document::load(std::string_view("<eef/><eef/>"));

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::XmlParseFailed);
}

TEST(XmlParse, RootElement) {
    Document doc = loadOrFail("<eef><config/></eef>");

    ASSERT_NE(doc.root(), nullptr);
    EXPECT_EQ(qualifiedName(doc.root()), "eef");
}

TEST(XmlParse, DeclaredEncoding_ConvertedToUtf8) {
    Document doc = loadOrFail("<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><a>caf\xe9</a>");

    EXPECT_EQ(doc.serialize(), DECL + "<a>caf\xc3\xa9</a>");
}

TEST(XmlParse, MoveTransfersOwnership) {
    Document first = loadOrFail("<eef/>");
    Node root = first.root();

    Document second = std::move(first);

    EXPECT_EQ(second.root(), root);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(XmlSerialize, DeclarationWithoutTrailingNewline) {
    EXPECT_EQ(roundTrip("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<eef/>\n"),
              DECL + "<eef/>");
}

TEST(XmlSerialize, RootOnOwnLine) {
    Document doc = loadOrFail("<eef><config/></eef>");

    SerializeOptions options;
    options.rootOnOwnLine = "eef";
    EXPECT_EQ(doc.serialize(options), DECL + "\n<eef><config/></eef>");

    options.rootOnOwnLine = "config";
    EXPECT_EQ(doc.serialize(options), DECL + "<eef><config/></eef>")
        << "Only the root element is ever moved";
}

TEST(XmlSerialize, WhitespaceTextPreserved) {
    EXPECT_EQ(roundTrip("<a>\n  <b/>\n\t<c> </c>\n</a>"),
              DECL + "<a>\n  <b/>\n\t<c> </c>\n</a>");
}

TEST(XmlSerialize, AttributesSortedByName) {
    EXPECT_EQ(roundTrip("<a zeta=\"1\" Beta=\"2\" alpha=\"3\"/>"),
              DECL + "<a Beta=\"2\" alpha=\"3\" zeta=\"1\"/>");
}

TEST(XmlSerialize, NamespaceDeclarationsSortedWithAttributes) {
    EXPECT_EQ(roundTrip("<r xmlns:b=\"urn:b\" id=\"7\" xmlns=\"urn:a\"><b:x b:y=\"1\"/></r>"),
              DECL + "<r id=\"7\" xmlns=\"urn:a\" xmlns:b=\"urn:b\"><b:x b:y=\"1\"/></r>");
}

TEST(XmlSerialize, TextEscaping) {
    EXPECT_EQ(roundTrip("<a>1 &lt; 2 &amp;&amp; \"q\" &gt; 'x'</a>"),
              DECL + "<a>1 &lt; 2 &amp;&amp; &quot;q&quot; &gt; 'x'</a>");
}

TEST(XmlSerialize, AttributeEscaping) {
    EXPECT_EQ(roundTrip("<a v='x&gt;y\"z&lt;&amp;'/>"),
              DECL + "<a v=\"x&gt;y&quot;z&lt;&amp;\"/>");
}

TEST(XmlSerialize, EmptyElementsSelfClose) {
    EXPECT_EQ(roundTrip("<a><b></b><c/><d x=\"1\"></d></a>"),
              DECL + "<a><b/><c/><d x=\"1\"/></a>");
}

TEST(XmlSerialize, CDataVerbatim) {
    EXPECT_EQ(roundTrip("<a><![CDATA[\n<&>\"\n  ]]></a>"),
              DECL + "<a><![CDATA[\n<&>\"\n  ]]></a>");
}

TEST(XmlSerialize, CommentsAndProcessingInstructions) {
    EXPECT_EQ(roundTrip("<!--top--><a><!-- inner --><?pi data here?><?pi2?></a>"),
              DECL + "<!--top--><a><!-- inner --><?pi data here?><?pi2 ?></a>");
}

TEST(XmlSerialize, DoctypeSystem) {
    EXPECT_EQ(roundTrip("<!DOCTYPE eef SYSTEM \"eef.dtd\"><eef/>"),
              DECL + "<!DOCTYPE eef  SYSTEM 'eef.dtd'><eef/>");
}

TEST(XmlSerialize, DoctypePublic) {
    EXPECT_EQ(roundTrip("<!DOCTYPE eef PUBLIC \"-//p\" \"s.dtd\"><eef/>"),
              DECL + "<!DOCTYPE eef  PUBLIC '-//p'  's.dtd'><eef/>");
}

TEST(XmlSerialize, EntityReferenceWrittenExpanded) {
    std::string out = roundTrip("<!DOCTYPE eef [<!ENTITY foo \"a&amp;b\">]><eef>&foo;</eef>");

    EXPECT_NE(out.find("<eef>a&amp;b</eef>"), std::string::npos) << out;
    EXPECT_EQ(out.find("&foo;"), std::string::npos) << out;
}

TEST(XmlSerialize, SingleNodeFragment) {
    Document doc = loadOrFail("<eef>\n  <config a=\"1\"><x>t</x></config>\n</eef>");

    auto config = doc.findSingle("config");
    ASSERT_TRUE(config.isSuccess());

    EXPECT_EQ(serialize(config.value()), "<config a=\"1\"><x>t</x></config>");
    EXPECT_EQ(serialize(nullptr), "");
}

// ============================================================================
// Lookup
// ============================================================================

TEST(XmlLookup, FindSingle_Found) {
    Document doc = loadOrFail("<eef><config><uar_data/></config></eef>");

    auto result = doc.findSingle("uar_data");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(qualifiedName(result.value()), "uar_data");
}

TEST(XmlLookup, FindSingle_Missing) {
    Document doc = loadOrFail("<eef><config/></eef>");

    auto result = doc.findSingle("uar_data");

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::ElementNotFound);
}

TEST(XmlLookup, FindSingle_DuplicateAtAnyDepth) {
    Document doc = loadOrFail("<eef><config><uar_data/></config><x><y><uar_data/></y></x></eef>");

    auto result = doc.findSingle("uar_data");

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::DuplicateElement);
}

TEST(XmlLookup, FindSingle_MatchesRoot) {
    Document doc = loadOrFail("<config><a/></config>");

    auto result = doc.findSingle("config");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), doc.root());
}

TEST(XmlLookup, FindFirst_DocumentOrder) {
    Document doc = loadOrFail("<eef><a><s id=\"1\"/></a><s id=\"2\"/></eef>");

    Node first = doc.findFirst("s");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(serialize(first), "<s id=\"1\"/>");
    EXPECT_EQ(doc.findFirst("missing"), nullptr);
}

TEST(XmlLookup, QualifiedNameIncludesPrefix) {
    Document doc = loadOrFail("<r xmlns:g=\"urn:g\"><g:config/></r>");

    EXPECT_EQ(doc.findFirst("config"), nullptr);
    EXPECT_NE(doc.findFirst("g:config"), nullptr);
}

// ============================================================================
// Text Access and Mutation
// ============================================================================

TEST(XmlText, FirstChildText) {
    Document doc = loadOrFail("<a><t>hello</t><c><![CDATA[ raw ]]></c><e/><n><x/>tail</n></a>");

    auto text = firstChildText(doc.findFirst("t"));
    ASSERT_TRUE(text.isSuccess());
    EXPECT_EQ(text.value(), "hello");

    auto cdata = firstChildText(doc.findFirst("c"));
    ASSERT_TRUE(cdata.isSuccess());
    EXPECT_EQ(cdata.value(), " raw ");

    auto empty = firstChildText(doc.findFirst("e"));
    ASSERT_TRUE(empty.isSuccess());
    EXPECT_EQ(empty.value(), "");

    auto nested = firstChildText(doc.findFirst("n"));
    ASSERT_TRUE(nested.isFailure());
    EXPECT_EQ(nested.error(), ErrorCode::UnexpectedNodeType);
}

TEST(XmlText, FirstChildText_NotAnElement) {
    auto result = firstChildText(nullptr);

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::InvalidArgument);
}

TEST(XmlText, SetText_KeepsCDataKind) {
    Document doc = loadOrFail("<a><![CDATA[old]]></a>");

    ASSERT_TRUE(setText(doc.root(), "n<e>w").isSuccess());

    EXPECT_EQ(doc.serialize(), DECL + "<a><![CDATA[n<e>w]]></a>");
}

TEST(XmlText, SetText_KeepsTextKindAndEscapes) {
    Document doc = loadOrFail("<a>old</a>");

    ASSERT_TRUE(setText(doc.root(), "x & y").isSuccess());

    EXPECT_EQ(doc.serialize(), DECL + "<a>x &amp; y</a>");
}

TEST(XmlText, SetText_EmptyElementGetsTextChild) {
    Document doc = loadOrFail("<eef><signature/></eef>");
    Node signature = doc.findFirst("signature");

    ASSERT_TRUE(setText(signature, "abc").isSuccess());

    EXPECT_EQ(doc.serialize(), DECL + "<eef><signature>abc</signature></eef>");
    auto text = firstChildText(signature);
    ASSERT_TRUE(text.isSuccess());
    EXPECT_EQ(text.value(), "abc");
}

TEST(XmlText, SetText_ElementChildRejected) {
    Document doc = loadOrFail("<a><b/></a>");

    auto result = setText(doc.root(), "x");

    ASSERT_TRUE(result.isFailure());
    EXPECT_EQ(result.error(), ErrorCode::UnexpectedNodeType);
    EXPECT_EQ(doc.serialize(), DECL + "<a><b/></a>");
}

TEST(XmlText, RemoveChildren) {
    Document doc = loadOrFail("<eef><signature>abc<x/><!--c--></signature></eef>");

    removeChildren(doc.findFirst("signature"));

    EXPECT_EQ(doc.serialize(), DECL + "<eef><signature/></eef>");
}

TEST(XmlText, HasChildren) {
    Document doc = loadOrFail("<eef><a/><b></b><c> </c></eef>");

    EXPECT_FALSE(hasChildren(doc.findFirst("a")));
    EXPECT_FALSE(hasChildren(doc.findFirst("b")));
    EXPECT_TRUE(hasChildren(doc.findFirst("c")));
    EXPECT_FALSE(hasChildren(nullptr));
}

// ============================================================================
// Element Removal
// ============================================================================

TEST(XmlRemove, WithoutFixupKeepsWhitespace) {
    Document doc = loadOrFail("<r>\n  <a/>\n  <b/>\n</r>");

    removeFromParent(doc.findFirst("a"));

    EXPECT_EQ(doc.serialize(), DECL + "<r>\n  \n  <b/>\n</r>");
}

TEST(XmlRemove, ElementLineRemovesTheLine) {
    Document doc = loadOrFail("<r>\n  <a/>\n  <b/>\n</r>");

    removeFromParent(doc.findFirst("a"), WhitespaceFixup::ElementLine);

    EXPECT_EQ(doc.serialize(), DECL + "<r>\n  <b/>\n</r>");
}

TEST(XmlRemove, ElementLineDropsEmptiedSiblings) {
    Document doc = loadOrFail("<r>  <a/>\n</r>");

    removeFromParent(doc.findFirst("a"), WhitespaceFixup::ElementLine);

    EXPECT_EQ(doc.serialize(), DECL + "<r/>");
}

TEST(XmlRemove, ElementLineLeavesNonBlankSiblings) {
    Document doc = loadOrFail("<r>text\n  <a/>\nmore</r>");

    removeFromParent(doc.findFirst("a"), WhitespaceFixup::ElementLine);

    EXPECT_EQ(doc.serialize(), DECL + "<r>text\n  \nmore</r>");
}

TEST(XmlRemove, IsWithin) {
    Document doc = loadOrFail("<eef><config><signature/></config><signature/></eef>");
    Node config = doc.findFirst("config");
    Node inner = doc.findFirst("signature");

    EXPECT_TRUE(isWithin(inner, config));
    EXPECT_TRUE(isWithin(config, config));
    EXPECT_FALSE(isWithin(config, inner));
    EXPECT_FALSE(isWithin(inner, nullptr));
}
