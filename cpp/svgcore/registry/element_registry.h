#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/identity_token.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace svgcore {

class Document;

/**
 * Derived index token -> live node for the current Document. Rebuilt from
 * scratch on every accepted document; it is never patched incrementally.
 */
class ElementRegistry {
public:
    void rebuild(const Document* doc);
    void clear();

    NodeIndex byToken(const IdentityToken& token) const noexcept;
    // Internal id first, then original id.
    NodeIndex byId(std::string_view id) const;

    bool tokenForId(std::string_view id, IdentityToken& out) const;
    std::string idForToken(const IdentityToken& token) const;

    bool contains(const IdentityToken& token) const noexcept { return byToken(token) != kInvalidNode; }
    std::size_t size() const noexcept { return order_.size(); }
    const std::vector<IdentityToken>& tokensInDocumentOrder() const noexcept { return order_; }
    // Pre-order rank of a token, or size() when unknown.
    std::size_t orderOf(const IdentityToken& token) const noexcept;

    const Document* document() const noexcept { return doc_; }

private:
    const Document* doc_ = nullptr;
    std::unordered_map<IdentityToken, NodeIndex, IdentityTokenHash> byToken_;
    std::unordered_map<IdentityToken, std::size_t, IdentityTokenHash> rank_;
    std::unordered_map<std::string, NodeIndex> byInternalId_;
    std::unordered_map<std::string, NodeIndex> byOriginalId_;
    std::vector<IdentityToken> order_;
};

} // namespace svgcore
