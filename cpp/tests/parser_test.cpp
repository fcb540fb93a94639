#include <gtest/gtest.h>
#include "svgcore/document/parser.h"
#include "svgcore/document/serializer.h"
#include "tests/test_common.h"

#include <libxml/xmlerror.h>
#include <libxml/xmlversion.h>

using namespace svgcore;

namespace {

class ParserTest : public ::testing::Test {
protected:
    ParserTest() : tokens_(svgcore_test::kTestSeed), parser_(tokens_) {}

    TokenSource tokens_;
    Parser parser_;
};

int g_hostErrors = 0;

#if LIBXML_VERSION >= 21200
void countHostError(void*, const xmlError*) { g_hostErrors++; }
#else
void countHostError(void*, xmlErrorPtr) { g_hostErrors++; }
#endif

const ElementNode& childElement(const Document& doc, NodeIndex parent, std::size_t pos) {
    return doc.node(doc.node(parent).children.at(doc.childSlotForElementPosition(parent, pos)));
}

} // namespace

TEST_F(ParserTest, BuildsTreeAndHierarchy) {
    ParseResult result = parser_.parse(svgcore_test::kSampleSvg);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.errors.empty());
    ASSERT_NE(result.document, nullptr);

    const Document& doc = *result.document;
    EXPECT_EQ(doc.elementCount(), 5u);

    const ElementNode& root = doc.node(doc.root());
    EXPECT_EQ(root.tag, "svg");
    ASSERT_NE(root.attributes.find("xmlns"), nullptr);
    EXPECT_EQ(*root.attributes.find("xmlns"), "http://www.w3.org/2000/svg");

    const ElementNode& rect = childElement(doc, doc.root(), 0);
    EXPECT_EQ(rect.kind, ElementKind::Rect);
    EXPECT_EQ(rect.originalId, "r1");
    EXPECT_FALSE(rect.attributes.has("id"));

    ASSERT_EQ(result.tree.size(), 1u);
    EXPECT_EQ(result.tree[0].id, "svg-node-1");
    ASSERT_EQ(result.tree[0].children.size(), 3u);
    EXPECT_EQ(result.tree[0].children[2].tag, "g");
    EXPECT_EQ(result.tree[0].children[2].originalId, "grp");
    ASSERT_EQ(result.tree[0].children[2].children.size(), 1u);
    EXPECT_EQ(result.tree[0].children[2].children[0].kind, ElementKind::Line);
    EXPECT_EQ(countHierarchyNodes(result.tree), 5u);
}

TEST_F(ParserTest, EveryElementIsStamped) {
    ParseResult result = parser_.parse(svgcore_test::kSampleSvg);
    ASSERT_TRUE(result.success);
    std::size_t count = 0;
    result.document->forEachElement([&](NodeIndex, const ElementNode& n) {
        EXPECT_FALSE(n.token.isNull());
        EXPECT_FALSE(n.internalId.empty());
        count++;
    });
    EXPECT_EQ(count, 5u);
    EXPECT_EQ(result.synthesizedTokens, 5u);
}

TEST_F(ParserTest, EmptyInputIsRejected) {
    ParseResult result = parser_.parse("   \n\t ");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.document, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Document is empty");
}

TEST_F(ParserTest, MalformedMarkupReportsLocation) {
    ParseResult result = parser_.parse("<svg>\n<rect>\n</svg>");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.document, nullptr);
    ASSERT_FALSE(result.errors.empty());
    EXPECT_GE(result.errors[0].line, 1);
    EXPECT_FALSE(result.errors[0].message.empty());
}

TEST_F(ParserTest, RootMustBeSvg) {
    ParseResult result = parser_.parse("<html><body/></html>");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "Root element must be <svg>");
}

TEST_F(ParserTest, FragmentAcceptsAnyRoot) {
    ParseResult result = parser_.parseFragment("<rect x=\"1\" y=\"2\"/>");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.tree.empty());
    const ElementNode& root = result.document->node(result.document->root());
    EXPECT_EQ(root.tag, "rect");
    EXPECT_EQ(*root.attributes.find("y"), "2");
}

TEST_F(ParserTest, CommentsAndProcessingInstructionsAreDropped) {
    ParseResult result = parser_.parse("<svg><!-- note --><?pi data?><rect/></svg>");
    ASSERT_TRUE(result.success);
    const Document& doc = *result.document;
    ASSERT_EQ(doc.node(doc.root()).children.size(), 1u);
    EXPECT_EQ(childElement(doc, doc.root(), 0).tag, "rect");
}

TEST_F(ParserTest, TextContentIsKeptVerbatimInTextElements) {
    ParseResult result = parser_.parse("<svg>\n  <text x=\"1\"> a &amp;  b </text>\n</svg>");
    ASSERT_TRUE(result.success);
    const Document& doc = *result.document;

    // Whitespace between svg children is not content.
    const ElementNode& root = doc.node(doc.root());
    ASSERT_EQ(root.children.size(), 1u);

    const ElementNode& text = doc.node(root.children[0]);
    ASSERT_EQ(text.children.size(), 1u);
    const ElementNode& run = doc.node(text.children[0]);
    EXPECT_EQ(run.type, NodeType::TextRun);
    EXPECT_EQ(run.text, " a &  b ");
}

TEST_F(ParserTest, CdataBecomesText) {
    ParseResult result = parser_.parse("<svg><style><![CDATA[rect { fill: red; }]]></style></svg>");
    ASSERT_TRUE(result.success);
    const Document& doc = *result.document;
    const ElementNode& style = childElement(doc, doc.root(), 0);
    ASSERT_EQ(style.children.size(), 1u);
    EXPECT_EQ(doc.node(style.children[0]).text, "rect { fill: red; }");
}

TEST_F(ParserTest, PrefixedAttributesKeepTheirPrefix) {
    ParseResult result = parser_.parse(
        "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">"
        "<use xlink:href=\"#a\"/></svg>");
    ASSERT_TRUE(result.success);
    const Document& doc = *result.document;
    const ElementNode& root = doc.node(doc.root());
    EXPECT_TRUE(root.attributes.has("xmlns:xlink"));
    const ElementNode& use = childElement(doc, doc.root(), 0);
    ASSERT_NE(use.attributes.find("xlink:href"), nullptr);
    EXPECT_EQ(*use.attributes.find("xlink:href"), "#a");
}

TEST_F(ParserTest, UnknownElementsPassThrough) {
    ParseResult result = parser_.parse("<svg><defs><linearGradient id=\"lg\"><stop offset=\"0\"/></linearGradient></defs></svg>");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.document->elementCount(), 4u);
    result.document->forEachElement([](NodeIndex, const ElementNode& n) {
        if (n.tag == "linearGradient") EXPECT_EQ(n.kind, ElementKind::Passthrough);
    });
}

TEST_F(ParserTest, ParseSerializeIsIdempotent) {
    ParseResult first = parser_.parse(svgcore_test::kSampleSvg);
    ASSERT_TRUE(first.success);
    const std::string once = serialize(*first.document, SerializeOptions{});

    ParseResult second = parser_.parse(once);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(serialize(*second.document, SerializeOptions{}), once);
}

TEST_F(ParserTest, InternalFormPreservesTokens) {
    ParseResult first = parser_.parse(svgcore_test::kSampleSvg);
    ASSERT_TRUE(first.success);

    SerializeOptions internal;
    internal.keepUUID = true;
    internal.prettyPrint = false;
    ParseResult second = parser_.parse(serialize(*first.document, internal));
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.synthesizedTokens, 0u);
    EXPECT_EQ(documentDigest(*second.document), documentDigest(*first.document));
}

TEST_F(ParserTest, RestoresHostErrorHandler) {
    int hostContext = 0;
    g_hostErrors = 0;
    xmlSetStructuredErrorFunc(&hostContext, countHostError);

    const ParseResult bad = parser_.parse("<svg><rect></svg>");
    EXPECT_FALSE(bad.success);
    EXPECT_FALSE(bad.errors.empty());
    EXPECT_EQ(g_hostErrors, 0);
    EXPECT_TRUE(xmlStructuredError == countHostError);
    EXPECT_EQ(xmlStructuredErrorContext, &hostContext);

    xmlSetStructuredErrorFunc(nullptr, nullptr);
}
