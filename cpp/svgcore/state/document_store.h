#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/document.h"
#include "svgcore/document/identity_token.h"
#include "svgcore/registry/element_registry.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace svgcore {

enum class StoreField : std::uint32_t {
    Document = 1 << 0,
    RawText = 1 << 1,
    HierarchyTree = 1 << 2,
    Selection = 1 << 3,
    Hover = 1 << 4,
    All = (1 << 5) - 1,
};

inline std::uint32_t fieldMask(StoreField f) noexcept { return static_cast<std::uint32_t>(f); }

struct StoreChange {
    std::uint32_t mask = 0;        // StoreField bits changed in this round
    std::uint64_t generation = 0;  // document generation at delivery time
};

using StoreListener = std::function<void(const StoreChange&)>;

/**
 * Observable container for the open document and everything derived from it.
 *
 * Mutations record a pending field mask and flush synchronously. Listeners
 * are called in subscription order, only for the fields they asked for.
 * A setDocument() or clearDocument() issued from inside a listener is queued
 * and applied once the current round has been delivered; other field changes
 * made by a listener are delivered in the next round of the same flush.
 */
class DocumentStore {
public:
    DocumentStore() = default;
    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    std::uint32_t subscribe(std::uint32_t fields, StoreListener listener);
    bool unsubscribe(std::uint32_t subscriptionId);

    void setDocument(std::unique_ptr<Document> doc, std::vector<HierarchyNode> tree, std::string rawText);
    void updateRawSVG(std::string text);
    void clearDocument();

    // Selection and hover writes. Only the Selection Manager should call these.
    void setSelection(const std::vector<IdentityToken>& tokens);
    void setHoveredToken(const IdentityToken& token);

    bool hasDocument() const noexcept { return document_ != nullptr; }
    const Document* document() const noexcept { return document_.get(); }
    // Live access for in-place gesture previews; no notification is sent.
    Document* mutableDocument() noexcept { return document_.get(); }

    const std::string& rawText() const noexcept { return rawText_; }
    const std::string& lastValidRawText() const noexcept { return lastValidRawText_; }
    const std::vector<HierarchyNode>& hierarchyTree() const noexcept { return tree_; }
    const ElementRegistry& registry() const noexcept { return registry_; }

    // Tokens in document order.
    const std::vector<IdentityToken>& selection() const noexcept { return selection_; }
    const IdentityToken& hoveredToken() const noexcept { return hovered_; }

    std::vector<std::string> selectedIds() const;
    std::vector<NodeIndex> selectedElements() const;
    bool hasSelection() const noexcept { return !selection_.empty(); }
    std::size_t selectionCount() const noexcept { return selection_.size(); }
    bool isSelected(const IdentityToken& token) const noexcept;

    std::uint64_t generation() const noexcept { return generation_; }
    std::size_t subscriberCount() const noexcept;

private:
    struct Subscriber {
        std::uint32_t id = 0;
        std::uint32_t fields = 0;
        StoreListener listener;
        bool active = true;
    };

    struct QueuedDocument {
        std::unique_ptr<Document> doc;
        std::vector<HierarchyNode> tree;
        std::string rawText;
    };

    void applyDocument(QueuedDocument&& next);
    std::vector<IdentityToken> normalizeSelection(const std::vector<IdentityToken>& tokens) const;
    void recordChanged(std::uint32_t mask) noexcept { pendingMask_ |= mask; }
    void flushPendingChanges();

    std::unique_ptr<Document> document_;
    std::vector<HierarchyNode> tree_;
    std::string rawText_;
    std::string lastValidRawText_;
    ElementRegistry registry_;
    std::vector<IdentityToken> selection_;
    IdentityToken hovered_;
    std::uint64_t generation_ = 0;

    std::vector<Subscriber> subscribers_;
    std::uint32_t nextSubscriberId_ = 1;
    std::uint32_t pendingMask_ = 0;
    bool delivering_ = false;
    std::deque<QueuedDocument> queuedDocuments_;
};

} // namespace svgcore
