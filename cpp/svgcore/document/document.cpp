#include "svgcore/document/document.h"

#include <algorithm>

namespace svgcore {

// =============================================================================
// AttributeList
// =============================================================================

const std::string* AttributeList::find(std::string_view name) const noexcept {
    for (const auto& a : items_) {
        if (a.name == name) return &a.value;
    }
    return nullptr;
}

void AttributeList::set(std::string_view name, std::string_view value) {
    for (auto& a : items_) {
        if (a.name == name) {
            a.value.assign(value.data(), value.size());
            return;
        }
    }
    items_.push_back(Attribute{std::string(name), std::string(value)});
}

void AttributeList::insert(std::size_t index, std::string_view name, std::string_view value) {
    for (auto& a : items_) {
        if (a.name == name) {
            a.value.assign(value.data(), value.size());
            return;
        }
    }
    if (index > items_.size()) index = items_.size();
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), Attribute{std::string(name), std::string(value)});
}

std::size_t AttributeList::indexOf(std::string_view name) const noexcept {
    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (items_[i].name == name) return i;
    }
    return items_.size();
}

bool AttributeList::remove(std::string_view name) {
    auto it = std::find_if(items_.begin(), items_.end(), [&](const Attribute& a) { return a.name == name; });
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
}

std::vector<AttributeState> captureAttributes(const AttributeList& attrs, const std::vector<const char*>& names) {
    std::vector<AttributeState> out;
    out.reserve(names.size());
    for (const char* name : names) {
        AttributeState st;
        st.name = name;
        const std::string* v = attrs.find(name);
        st.present = v != nullptr;
        if (v) st.value = *v;
        st.position = attrs.indexOf(name);
        out.push_back(std::move(st));
    }
    return out;
}

void restoreAttributes(AttributeList& attrs, const std::vector<AttributeState>& states) {
    for (const auto& st : states) {
        if (!st.present) attrs.remove(st.name);
    }
    // Ascending positions, so each re-inserted attribute finds its earlier neighbours in place.
    std::vector<const AttributeState*> present;
    for (const auto& st : states) {
        if (st.present) present.push_back(&st);
    }
    std::sort(present.begin(), present.end(),
        [](const AttributeState* a, const AttributeState* b) { return a->position < b->position; });
    for (const AttributeState* st : present) attrs.insert(st->position, st->name, st->value);
}

// =============================================================================
// Kinds
// =============================================================================

ElementKind elementKindForTag(std::string_view tag) noexcept {
    if (tag == "rect") return ElementKind::Rect;
    if (tag == "circle") return ElementKind::Circle;
    if (tag == "ellipse") return ElementKind::Ellipse;
    if (tag == "line") return ElementKind::Line;
    if (tag == "g") return ElementKind::Group;
    if (tag == "text") return ElementKind::Text;
    return ElementKind::Passthrough;
}

const char* elementKindName(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::Rect: return "rect";
        case ElementKind::Circle: return "circle";
        case ElementKind::Ellipse: return "ellipse";
        case ElementKind::Line: return "line";
        case ElementKind::Group: return "group";
        case ElementKind::Text: return "text";
        case ElementKind::Passthrough: return "passthrough";
    }
    return "passthrough";
}

bool isTextBearingTag(std::string_view tag) noexcept {
    return tag == "text" || tag == "tspan" || tag == "textPath" || tag == "title" || tag == "desc"
        || tag == "style" || tag == "script";
}

// =============================================================================
// Document
// =============================================================================

std::unique_ptr<Document> Document::clone() const {
    auto copy = std::make_unique<Document>();
    copy->nodes_ = nodes_;
    copy->root_ = root_;
    copy->rawText_ = rawText_;
    copy->generation_ = generation_;
    return copy;
}

NodeIndex Document::createElement(std::string_view tag) {
    ElementNode n;
    n.type = NodeType::Element;
    n.tag.assign(tag.data(), tag.size());
    n.kind = elementKindForTag(tag);
    nodes_.push_back(std::move(n));
    return static_cast<NodeIndex>(nodes_.size() - 1);
}

NodeIndex Document::createTextRun(std::string_view text) {
    ElementNode n;
    n.type = NodeType::TextRun;
    n.text.assign(text.data(), text.size());
    nodes_.push_back(std::move(n));
    return static_cast<NodeIndex>(nodes_.size() - 1);
}

bool Document::appendChild(NodeIndex parent, NodeIndex child) {
    if (parent >= nodes_.size()) return false;
    return insertChild(parent, nodes_[parent].children.size(), child);
}

bool Document::insertChild(NodeIndex parent, std::size_t index, NodeIndex child) {
    if (parent >= nodes_.size() || child >= nodes_.size()) return false;
    if (parent == child || isAncestor(child, parent)) return false;
    if (!nodes_[parent].isElement()) return false;
    if (nodes_[child].parent != kInvalidNode) detach(child);

    auto& kids = nodes_[parent].children;
    if (index > kids.size()) index = kids.size();
    kids.insert(kids.begin() + static_cast<std::ptrdiff_t>(index), child);
    nodes_[child].parent = parent;
    return true;
}

bool Document::detach(NodeIndex child, std::size_t* previousIndex) {
    if (child >= nodes_.size()) return false;
    const NodeIndex parent = nodes_[child].parent;
    if (parent == kInvalidNode) {
        if (child == root_) {
            root_ = kInvalidNode;
            if (previousIndex) *previousIndex = 0;
            return true;
        }
        return false;
    }
    auto& kids = nodes_[parent].children;
    auto it = std::find(kids.begin(), kids.end(), child);
    if (it == kids.end()) return false;
    if (previousIndex) *previousIndex = static_cast<std::size_t>(it - kids.begin());
    kids.erase(it);
    nodes_[child].parent = kInvalidNode;
    return true;
}

bool Document::isAncestor(NodeIndex ancestor, NodeIndex node) const noexcept {
    if (node >= nodes_.size()) return false;
    NodeIndex cur = nodes_[node].parent;
    while (cur != kInvalidNode) {
        if (cur == ancestor) return true;
        cur = nodes_[cur].parent;
    }
    return false;
}

std::size_t Document::elementPosition(NodeIndex child) const noexcept {
    if (child >= nodes_.size()) return 0;
    const NodeIndex parent = nodes_[child].parent;
    if (parent == kInvalidNode) return 0;
    std::size_t pos = 0;
    for (const NodeIndex k : nodes_[parent].children) {
        if (k == child) return pos;
        if (nodes_[k].isElement()) pos++;
    }
    return pos;
}

std::size_t Document::childSlotForElementPosition(NodeIndex parent, std::size_t elementPos) const noexcept {
    if (parent >= nodes_.size()) return 0;
    const auto& kids = nodes_[parent].children;
    std::size_t seen = 0;
    for (std::size_t slot = 0; slot < kids.size(); ++slot) {
        if (!nodes_[kids[slot]].isElement()) continue;
        if (seen == elementPos) return slot;
        seen++;
    }
    return kids.size();
}

std::vector<NodeIndex> Document::elementsInDocumentOrder() const {
    std::vector<NodeIndex> out;
    forEachElement([&](NodeIndex i, const ElementNode&) { out.push_back(i); });
    return out;
}

std::size_t Document::elementCount() const {
    std::size_t count = 0;
    forEachElement([&](NodeIndex, const ElementNode&) { count++; });
    return count;
}

NodeIndex Document::importSubtree(const Document& other, NodeIndex otherNode) {
    const ElementNode* src = other.tryNode(otherNode);
    if (!src) return kInvalidNode;

    ElementNode copy;
    copy.type = src->type;
    copy.kind = src->kind;
    copy.tag = src->tag;
    copy.attributes = src->attributes;
    copy.token = src->token;
    copy.internalId = src->internalId;
    copy.originalId = src->originalId;
    copy.text = src->text;
    nodes_.push_back(std::move(copy));
    const NodeIndex dst = static_cast<NodeIndex>(nodes_.size() - 1);

    // Children are copied by index; nodes_ may reallocate in the recursion.
    const std::vector<NodeIndex> srcChildren = src->children;
    for (const NodeIndex c : srcChildren) {
        const NodeIndex imported = importSubtree(other, c);
        if (imported == kInvalidNode) continue;
        nodes_[imported].parent = dst;
        nodes_[dst].children.push_back(imported);
    }
    return dst;
}

// =============================================================================
// Hierarchy
// =============================================================================

namespace {

void buildHierarchyNode(const Document& doc, NodeIndex i, HierarchyNode& out) {
    const ElementNode& n = doc.node(i);
    out.id = n.internalId;
    out.tag = n.tag;
    out.originalId = n.originalId;
    out.token = n.token;
    out.kind = n.kind;
    for (const NodeIndex c : n.children) {
        if (!doc.node(c).isElement()) continue;
        out.children.emplace_back();
        buildHierarchyNode(doc, c, out.children.back());
    }
}

} // namespace

std::vector<HierarchyNode> buildHierarchy(const Document& doc) {
    std::vector<HierarchyNode> tree;
    if (!doc.hasRoot()) return tree;
    tree.emplace_back();
    buildHierarchyNode(doc, doc.root(), tree.back());
    return tree;
}

std::size_t countHierarchyNodes(const std::vector<HierarchyNode>& tree) noexcept {
    std::size_t count = 0;
    for (const auto& n : tree) {
        count += 1 + countHierarchyNodes(n.children);
    }
    return count;
}

} // namespace svgcore
