#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/identity_token.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

struct Attribute {
    std::string name;
    std::string value;

    friend bool operator==(const Attribute& a, const Attribute& b) {
        return a.name == b.name && a.value == b.value;
    }
};

// Insertion-ordered attribute map. Overwriting keeps the original position.
class AttributeList {
public:
    using const_iterator = std::vector<Attribute>::const_iterator;

    const std::string* find(std::string_view name) const noexcept;
    bool has(std::string_view name) const noexcept { return find(name) != nullptr; }
    void set(std::string_view name, std::string_view value);
    // Like set, but a new attribute lands at index instead of the end.
    void insert(std::size_t index, std::string_view name, std::string_view value);
    std::size_t indexOf(std::string_view name) const noexcept;
    bool remove(std::string_view name);
    void clear() noexcept { items_.clear(); }

    std::size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }
    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }

    friend bool operator==(const AttributeList& a, const AttributeList& b) { return a.items_ == b.items_; }
    friend bool operator!=(const AttributeList& a, const AttributeList& b) { return !(a == b); }

private:
    std::vector<Attribute> items_;
};

// An attribute as it stood when captured; present=false records its absence.
struct AttributeState {
    std::string name;
    bool present = false;
    std::string value;
    std::size_t position = 0;
};

std::vector<AttributeState> captureAttributes(const AttributeList& attrs, const std::vector<const char*>& names);
void restoreAttributes(AttributeList& attrs, const std::vector<AttributeState>& states);

struct ElementNode {
    NodeType type = NodeType::Element;
    ElementKind kind = ElementKind::Passthrough;
    std::string tag;
    AttributeList attributes;
    IdentityToken token;
    std::string internalId;  // addressing id, never exported
    std::string originalId;  // author-visible id, exported as `id`
    std::string text;        // payload of TextRun nodes
    NodeIndex parent = kInvalidNode;
    std::vector<NodeIndex> children;

    bool isElement() const noexcept { return type == NodeType::Element; }
};

ElementKind elementKindForTag(std::string_view tag) noexcept;
const char* elementKindName(ElementKind kind) noexcept;

// Elements whose character data is significant, including whitespace-only runs.
bool isTextBearingTag(std::string_view tag) noexcept;

/**
 * Arena-owned element tree. Nodes are addressed by index and never move
 * while the Document is alive; detaching a node only unlinks it.
 */
class Document {
public:
    Document() = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // Full copy of the arena; node indices stay valid in the copy.
    std::unique_ptr<Document> clone() const;

    NodeIndex createElement(std::string_view tag);
    NodeIndex createTextRun(std::string_view text);

    void setRoot(NodeIndex root) noexcept { root_ = root; }
    NodeIndex root() const noexcept { return root_; }
    bool hasRoot() const noexcept { return root_ != kInvalidNode; }

    ElementNode& node(NodeIndex i) { return nodes_[i]; }
    const ElementNode& node(NodeIndex i) const { return nodes_[i]; }
    ElementNode* tryNode(NodeIndex i) noexcept { return i < nodes_.size() ? &nodes_[i] : nullptr; }
    const ElementNode* tryNode(NodeIndex i) const noexcept { return i < nodes_.size() ? &nodes_[i] : nullptr; }
    std::size_t arenaSize() const noexcept { return nodes_.size(); }

    bool appendChild(NodeIndex parent, NodeIndex child);
    // index past the end appends
    bool insertChild(NodeIndex parent, std::size_t index, NodeIndex child);
    // Unlinks child from its parent. previousIndex receives its former slot.
    bool detach(NodeIndex child, std::size_t* previousIndex = nullptr);

    bool isAncestor(NodeIndex ancestor, NodeIndex node) const noexcept;

    // Position among element siblings only (text runs are skipped).
    std::size_t elementPosition(NodeIndex child) const noexcept;
    // Converts an element-only position back to a raw children slot.
    std::size_t childSlotForElementPosition(NodeIndex parent, std::size_t elementPos) const noexcept;

    // Pre-order walk over reachable elements.
    template <typename Fn>
    void forEachElement(Fn&& fn) const {
        if (root_ == kInvalidNode) return;
        std::vector<NodeIndex> stack;
        stack.push_back(root_);
        while (!stack.empty()) {
            const NodeIndex i = stack.back();
            stack.pop_back();
            const ElementNode& n = nodes_[i];
            if (!n.isElement()) continue;
            fn(i, n);
            for (auto it = n.children.rbegin(); it != n.children.rend(); ++it) {
                stack.push_back(*it);
            }
        }
    }

    std::vector<NodeIndex> elementsInDocumentOrder() const;
    std::size_t elementCount() const;

    // Deep-copies a subtree of another document into this arena, detached.
    NodeIndex importSubtree(const Document& other, NodeIndex otherNode);

    const std::string& rawText() const noexcept { return rawText_; }
    void setRawText(std::string text) { rawText_ = std::move(text); }

    std::uint64_t generation() const noexcept { return generation_; }
    void setGeneration(std::uint64_t g) noexcept { generation_ = g; }

private:
    std::vector<ElementNode> nodes_;
    NodeIndex root_ = kInvalidNode;
    std::string rawText_;
    std::uint64_t generation_ = 0;
};

// Display-only mirror of the element tree, rebuilt with every Document.
struct HierarchyNode {
    std::string id;
    std::string tag;
    std::string originalId;
    IdentityToken token;
    ElementKind kind = ElementKind::Passthrough;
    std::vector<HierarchyNode> children;
};

std::vector<HierarchyNode> buildHierarchy(const Document& doc);
std::size_t countHierarchyNodes(const std::vector<HierarchyNode>& tree) noexcept;

} // namespace svgcore
