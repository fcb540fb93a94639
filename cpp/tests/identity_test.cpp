#include <gtest/gtest.h>
#include "svgcore/document/identity_assigner.h"
#include "svgcore/document/identity_token.h"
#include "svgcore/document/parser.h"

#include <unordered_set>

using namespace svgcore;

namespace {
constexpr const char* kStamp = "123e4567-e89b-42d3-a456-426614174000";

std::vector<const ElementNode*> elements(const Document& doc) {
    std::vector<const ElementNode*> out;
    doc.forEachElement([&](NodeIndex, const ElementNode& n) { out.push_back(&n); });
    return out;
}
} // namespace

TEST(IdentityTokenTest, ParsesAndFormatsCanonicalText) {
    IdentityToken t;
    ASSERT_TRUE(IdentityToken::parse(kStamp, t));
    EXPECT_EQ(t.toString(), kStamp);

    IdentityToken upper;
    ASSERT_TRUE(IdentityToken::parse("123E4567-E89B-42D3-A456-426614174000", upper));
    EXPECT_EQ(upper, t);
}

TEST(IdentityTokenTest, RejectsMalformedText) {
    IdentityToken t;
    EXPECT_FALSE(IdentityToken::parse("", t));
    EXPECT_FALSE(IdentityToken::parse("not-a-token", t));
    EXPECT_FALSE(IdentityToken::parse("123e4567e89b-42d3-a456-4266141740000", t));
    EXPECT_FALSE(IdentityToken::parse("00000000-0000-0000-0000-000000000000", t));
    EXPECT_TRUE(t.isNull());
}

TEST(TokenSourceTest, SeededSourcesAreReproducible) {
    TokenSource a(7);
    TokenSource b(7);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(a.next(), b.next());
    }
    EXPECT_EQ(a.issuedCount(), 8u);
}

TEST(TokenSourceTest, TokensAreVersionFourAndDistinct) {
    TokenSource source(99);
    std::unordered_set<IdentityToken, IdentityTokenHash> seen;
    for (int i = 0; i < 256; ++i) {
        const IdentityToken t = source.next();
        EXPECT_FALSE(t.isNull());
        EXPECT_EQ(t.toString()[14], '4');
        EXPECT_TRUE(seen.insert(t).second);
    }
}

TEST(IdentityAssignerTest, KeepsFirstStampAndReplacesDuplicates) {
    TokenSource tokens(1);
    Parser parser(tokens);
    const std::string text = std::string("<svg><rect data-uuid=\"") + kStamp + "\"/><rect data-uuid=\"" + kStamp + "\"/></svg>";
    ParseResult result = parser.parse(text);
    ASSERT_TRUE(result.success);

    const auto els = elements(*result.document);
    ASSERT_EQ(els.size(), 3u);
    EXPECT_EQ(els[1]->token.toString(), kStamp);
    EXPECT_NE(els[2]->token, els[1]->token);
    EXPECT_FALSE(els[2]->token.isNull());
    EXPECT_EQ(result.synthesizedTokens, 2u);
}

TEST(IdentityAssignerTest, MalformedStampIsReplaced) {
    TokenSource tokens(1);
    Parser parser(tokens);
    ParseResult result = parser.parse("<svg data-uuid=\"garbage\"/>");
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.document->node(result.document->root()).token.isNull());
    EXPECT_EQ(result.synthesizedTokens, 1u);
}

TEST(IdentityAssignerTest, DuplicateIdsGetSuffixesThatAvoidAuthoredIds) {
    TokenSource tokens(1);
    Parser parser(tokens);
    ParseResult result = parser.parse("<svg><rect id=\"a\"/><rect id=\"a\"/><rect id=\"a-2\"/></svg>");
    ASSERT_TRUE(result.success);

    const auto els = elements(*result.document);
    ASSERT_EQ(els.size(), 4u);
    EXPECT_EQ(els[1]->originalId, "a");
    EXPECT_EQ(els[2]->originalId, "a-3");
    EXPECT_EQ(els[3]->originalId, "a-2");
}

TEST(IdentityAssignerTest, InternalIdsSkipAuthoredIds) {
    TokenSource tokens(1);
    Parser parser(tokens);
    ParseResult result = parser.parse("<svg><rect id=\"svg-node-1\"/><circle/></svg>");
    ASSERT_TRUE(result.success);

    const auto els = elements(*result.document);
    ASSERT_EQ(els.size(), 3u);
    EXPECT_EQ(els[0]->internalId, "svg-node-2");
    EXPECT_EQ(els[1]->internalId, "svg-node-3");
    EXPECT_EQ(els[1]->originalId, "svg-node-1");
    EXPECT_EQ(els[2]->internalId, "svg-node-4");
}

TEST(IdentityAssignerTest, CustomPrefix) {
    TokenSource tokens(1);
    ParserOptions options;
    options.idPrefix = "el";
    Parser parser(tokens, options);
    ParseResult result = parser.parse("<svg><g/></svg>");
    ASSERT_TRUE(result.success);
    const auto els = elements(*result.document);
    EXPECT_EQ(els[0]->internalId, "el-1");
    EXPECT_EQ(els[1]->internalId, "el-2");
}

TEST(IdentityAssignerTest, ReassignIsStableForStampedDocument) {
    TokenSource tokens(3);
    Parser parser(tokens);
    ParseResult result = parser.parse("<svg><rect/><g><circle/></g></svg>");
    ASSERT_TRUE(result.success);

    std::vector<IdentityToken> before;
    for (const auto* n : elements(*result.document)) before.push_back(n->token);

    IdentityAssigner assigner(tokens, "svg-node");
    assigner.assign(*result.document);
    EXPECT_EQ(assigner.lastSynthesizedCount(), 0u);

    std::vector<IdentityToken> after;
    for (const auto* n : elements(*result.document)) after.push_back(n->token);
    EXPECT_EQ(before, after);
}
