#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/document.h"
#include "svgcore/document/identity_token.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

struct ParserOptions {
    std::string idPrefix = "svg-node";
    std::string tokenAttribute = "data-uuid";
};

struct ParseResult {
    bool success = false;
    std::unique_ptr<Document> document;
    std::vector<HierarchyNode> tree;
    std::vector<ParseError> errors;
    std::size_t synthesizedTokens = 0;
};

/**
 * Markup -> identity-stamped Document, backed by libxml2.
 *
 * A failed result never carries a document; callers keep whatever they had.
 */
class Parser {
public:
    explicit Parser(TokenSource& tokens, ParserOptions options = {});

    // Full document. The root element must be <svg>.
    ParseResult parse(std::string_view text);

    // One element subtree of any tag; the hierarchy is left empty.
    ParseResult parseFragment(std::string_view text);

    const ParserOptions& options() const noexcept { return options_; }

private:
    ParseResult parseImpl(std::string_view text, bool requireSvgRoot);

    TokenSource& tokens_;
    ParserOptions options_;
};

} // namespace svgcore
