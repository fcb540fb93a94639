#include "svgcore/document/identity_assigner.h"
#include "svgcore/document/document.h"
#include "svgcore/core/logging.h"

#include <unordered_set>
#include <vector>

namespace svgcore {

IdentityAssigner::IdentityAssigner(TokenSource& tokens, std::string_view idPrefix)
    : tokens_(tokens), prefix_(idPrefix) {}

void IdentityAssigner::assign(Document& doc) {
    synthesized_ = 0;
    const std::vector<NodeIndex> order = doc.elementsInDocumentOrder();

    std::unordered_set<std::string> authored;
    for (const NodeIndex i : order) {
        const std::string& id = doc.node(i).originalId;
        if (!id.empty()) authored.insert(id);
    }

    std::unordered_set<IdentityToken, IdentityTokenHash> seenTokens;
    std::unordered_set<std::string> usedIds;
    seenTokens.reserve(order.size());

    // Pass 1: tokens and original ids.
    for (const NodeIndex i : order) {
        ElementNode& n = doc.node(i);

        if (n.token.isNull() || !seenTokens.insert(n.token).second) {
            IdentityToken fresh = tokens_.next();
            while (!seenTokens.insert(fresh).second) fresh = tokens_.next();
            n.token = fresh;
            synthesized_++;
        }

        if (n.originalId.empty()) continue;
        if (usedIds.insert(n.originalId).second) continue;

        const std::string base = n.originalId;
        for (std::size_t suffix = 2;; ++suffix) {
            std::string candidate = base + "-" + std::to_string(suffix);
            if (authored.count(candidate) != 0 || usedIds.count(candidate) != 0) continue;
            SVGCORE_LOG_DEBUG("duplicate id '%s' renamed to '%s'", base.c_str(), candidate.c_str());
            usedIds.insert(candidate);
            n.originalId = std::move(candidate);
            break;
        }
    }

    // Pass 2: internal ids, skipping anything an author could address.
    std::size_t counter = 0;
    for (const NodeIndex i : order) {
        std::string candidate;
        do {
            candidate = prefix_ + "-" + std::to_string(++counter);
        } while (usedIds.count(candidate) != 0);
        doc.node(i).internalId = std::move(candidate);
    }
}

} // namespace svgcore
