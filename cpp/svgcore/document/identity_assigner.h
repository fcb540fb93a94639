#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/identity_token.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace svgcore {

class Document;

/**
 * Stamps identity onto a freshly parsed tree, in document order.
 *
 * On entry each element's token holds the stamp read from the markup (null
 * when absent or malformed) and originalId holds the authored `id`. On exit
 * every element has a document-unique token, a unique original id where one
 * was authored, and a fresh internal id.
 */
class IdentityAssigner {
public:
    IdentityAssigner(TokenSource& tokens, std::string_view idPrefix);

    void assign(Document& doc);

    // Tokens synthesized by the last assign() (absent, malformed or duplicate stamps).
    std::size_t lastSynthesizedCount() const noexcept { return synthesized_; }

private:
    TokenSource& tokens_;
    std::string prefix_;
    std::size_t synthesized_ = 0;
};

} // namespace svgcore
