#include "svgcore/registry/element_registry.h"
#include "svgcore/document/document.h"

namespace svgcore {

void ElementRegistry::clear() {
    doc_ = nullptr;
    byToken_.clear();
    rank_.clear();
    byInternalId_.clear();
    byOriginalId_.clear();
    order_.clear();
}

void ElementRegistry::rebuild(const Document* doc) {
    clear();
    doc_ = doc;
    if (!doc) return;

    doc->forEachElement([&](NodeIndex i, const ElementNode& n) {
        if (!n.token.isNull() && byToken_.emplace(n.token, i).second) {
            rank_.emplace(n.token, order_.size());
            order_.push_back(n.token);
        }
        if (!n.internalId.empty()) byInternalId_.emplace(n.internalId, i);
        if (!n.originalId.empty()) byOriginalId_.emplace(n.originalId, i);
    });
}

NodeIndex ElementRegistry::byToken(const IdentityToken& token) const noexcept {
    auto it = byToken_.find(token);
    return it == byToken_.end() ? kInvalidNode : it->second;
}

NodeIndex ElementRegistry::byId(std::string_view id) const {
    if (id.empty()) return kInvalidNode;
    const std::string key(id);
    auto it = byInternalId_.find(key);
    if (it != byInternalId_.end()) return it->second;
    it = byOriginalId_.find(key);
    return it == byOriginalId_.end() ? kInvalidNode : it->second;
}

bool ElementRegistry::tokenForId(std::string_view id, IdentityToken& out) const {
    const NodeIndex i = byId(id);
    if (i == kInvalidNode || !doc_) return false;
    out = doc_->node(i).token;
    return !out.isNull();
}

std::string ElementRegistry::idForToken(const IdentityToken& token) const {
    const NodeIndex i = byToken(token);
    if (i == kInvalidNode || !doc_) return std::string();
    return doc_->node(i).internalId;
}

std::size_t ElementRegistry::orderOf(const IdentityToken& token) const noexcept {
    auto it = rank_.find(token);
    return it == rank_.end() ? order_.size() : it->second;
}

} // namespace svgcore
