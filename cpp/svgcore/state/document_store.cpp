#include "svgcore/state/document_store.h"
#include "svgcore/core/logging.h"

#include <algorithm>
#include <unordered_set>

namespace svgcore {

std::uint32_t DocumentStore::subscribe(std::uint32_t fields, StoreListener listener) {
    if (!listener || fields == 0) return 0;
    Subscriber sub;
    sub.id = nextSubscriberId_++;
    sub.fields = fields;
    sub.listener = std::move(listener);
    subscribers_.push_back(std::move(sub));
    return subscribers_.back().id;
}

bool DocumentStore::unsubscribe(std::uint32_t subscriptionId) {
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
        if (it->id != subscriptionId || !it->active) continue;
        if (delivering_) {
            it->active = false;
        } else {
            subscribers_.erase(it);
        }
        return true;
    }
    return false;
}

std::size_t DocumentStore::subscriberCount() const noexcept {
    std::size_t count = 0;
    for (const auto& s : subscribers_) {
        if (s.active) count++;
    }
    return count;
}

void DocumentStore::setDocument(std::unique_ptr<Document> doc, std::vector<HierarchyNode> tree, std::string rawText) {
    QueuedDocument next{std::move(doc), std::move(tree), std::move(rawText)};
    if (delivering_) {
        SVGCORE_LOG_DEBUG("setDocument queued during delivery");
        queuedDocuments_.push_back(std::move(next));
        return;
    }
    applyDocument(std::move(next));
    flushPendingChanges();
}

void DocumentStore::clearDocument() {
    setDocument(nullptr, {}, std::string());
}

void DocumentStore::updateRawSVG(std::string text) {
    if (text == rawText_) return;
    rawText_ = std::move(text);
    recordChanged(fieldMask(StoreField::RawText));
    flushPendingChanges();
}

void DocumentStore::setSelection(const std::vector<IdentityToken>& tokens) {
    std::vector<IdentityToken> next = normalizeSelection(tokens);
    if (next == selection_) return;
    selection_ = std::move(next);
    recordChanged(fieldMask(StoreField::Selection));
    flushPendingChanges();
}

void DocumentStore::setHoveredToken(const IdentityToken& token) {
    IdentityToken next = token;
    if (!next.isNull() && !registry_.contains(next)) next = IdentityToken{};
    if (next == hovered_) return;
    hovered_ = next;
    recordChanged(fieldMask(StoreField::Hover));
    flushPendingChanges();
}

std::vector<std::string> DocumentStore::selectedIds() const {
    std::vector<std::string> ids;
    ids.reserve(selection_.size());
    for (const auto& t : selection_) ids.push_back(registry_.idForToken(t));
    return ids;
}

std::vector<NodeIndex> DocumentStore::selectedElements() const {
    std::vector<NodeIndex> nodes;
    nodes.reserve(selection_.size());
    for (const auto& t : selection_) nodes.push_back(registry_.byToken(t));
    return nodes;
}

bool DocumentStore::isSelected(const IdentityToken& token) const noexcept {
    return std::find(selection_.begin(), selection_.end(), token) != selection_.end();
}

std::vector<IdentityToken> DocumentStore::normalizeSelection(const std::vector<IdentityToken>& tokens) const {
    std::vector<IdentityToken> out;
    std::unordered_set<IdentityToken, IdentityTokenHash> seen;
    out.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (!registry_.contains(t)) continue;
        if (!seen.insert(t).second) continue;
        out.push_back(t);
    }
    std::sort(out.begin(), out.end(), [&](const IdentityToken& a, const IdentityToken& b) {
        return registry_.orderOf(a) < registry_.orderOf(b);
    });
    return out;
}

void DocumentStore::applyDocument(QueuedDocument&& next) {
    document_ = std::move(next.doc);
    tree_ = std::move(next.tree);
    rawText_ = std::move(next.rawText);
    lastValidRawText_ = rawText_;
    generation_++;
    if (document_) document_->setGeneration(generation_);
    registry_.rebuild(document_.get());
    recordChanged(fieldMask(StoreField::Document) | fieldMask(StoreField::RawText) | fieldMask(StoreField::HierarchyTree));

    std::vector<IdentityToken> kept = normalizeSelection(selection_);
    if (kept != selection_) {
        SVGCORE_LOG_DEBUG("selection intersected: %zu -> %zu", selection_.size(), kept.size());
        selection_ = std::move(kept);
        recordChanged(fieldMask(StoreField::Selection));
    }
    if (!hovered_.isNull() && !registry_.contains(hovered_)) {
        hovered_ = IdentityToken{};
        recordChanged(fieldMask(StoreField::Hover));
    }
}

void DocumentStore::flushPendingChanges() {
    if (delivering_) return;
    delivering_ = true;

    while (pendingMask_ != 0 || !queuedDocuments_.empty()) {
        if (!queuedDocuments_.empty()) {
            QueuedDocument next = std::move(queuedDocuments_.front());
            queuedDocuments_.pop_front();
            applyDocument(std::move(next));
        }

        StoreChange change;
        change.mask = pendingMask_;
        change.generation = generation_;
        pendingMask_ = 0;

        // Listeners added during this round start with the next one.
        const std::size_t count = subscribers_.size();
        for (std::size_t i = 0; i < count; ++i) {
            if (!subscribers_[i].active || (subscribers_[i].fields & change.mask) == 0) continue;
            const StoreListener listener = subscribers_[i].listener;
            listener(change);
        }
    }

    subscribers_.erase(
        std::remove_if(subscribers_.begin(), subscribers_.end(), [](const Subscriber& s) { return !s.active; }),
        subscribers_.end());
    delivering_ = false;
}

} // namespace svgcore
