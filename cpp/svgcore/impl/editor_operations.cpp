// EditorContext operation pipeline: commit, replay dispatch and the
// per-kind forward/backward actions.

#include "svgcore/editor.h"
#include "svgcore/core/logging.h"
#include "svgcore/interaction/geometry.h"

namespace svgcore {

EditorError EditorContext::commitOperation(Operation&& op) {
    if (!store_.hasDocument()) {
        setError(EditorError::NoDocument, "no document is open");
        return EditorError::NoDocument;
    }

    if (op.kind == OperationKind::Move && op.positions.empty()) {
        const Document& doc = *store_.document();
        for (const auto& token : op.tokens) {
            const NodeIndex n = store_.registry().byToken(token);
            if (n != kInvalidNode) op.positions.push_back(PositionSnapshot{token, capturePosition(doc.node(n))});
        }
    }

    const double t0 = svgcore_now_ms();
    const EditorError err = applyOperation(op, true);
    if (err != EditorError::Ok) {
        SVGCORE_LOG_WARN("commit of '%s' failed: %s", op.label.c_str(), editorErrorName(err));
        return err;
    }
    history_.push(std::move(op));
    commitCount_++;
    lastCommitMs_ = static_cast<float>(svgcore_now_ms() - t0);
    return EditorError::Ok;
}

EditorError EditorContext::applyOperation(const Operation& op, bool forward) {
    if (!store_.hasDocument()) {
        setError(EditorError::NoDocument, "no document is open");
        return EditorError::NoDocument;
    }
    // Live previews must not leak into the serialized document.
    gestures_.cancel();
    gestures_.cancelDraft();

    switch (op.kind) {
        case OperationKind::Move: return applyMove(op, forward);
        case OperationKind::Create: return applyCreate(op, forward);
        case OperationKind::Delete: return applyDelete(op, forward);
        case OperationKind::SetAttribute: return applySetAttribute(op, forward);
        case OperationKind::ReplaceDocument: return applyReplaceDocument(op, forward);
    }
    setError(EditorError::InvalidOperation, "unknown operation kind");
    return EditorError::InvalidOperation;
}

// =============================================================================
// Structural commit
// =============================================================================

std::unique_ptr<Document> EditorContext::workingCopy() const {
    return store_.document()->clone();
}

EditorError EditorContext::structuralCommit(const Document& working) {
    const double t0 = svgcore_now_ms();
    const std::string text = internalForm(working);
    lastSerializeMs_ = static_cast<float>(svgcore_now_ms() - t0);
    return replaceFromInternalText(text);
}

EditorError EditorContext::replaceFromInternalText(const std::string& text) {
    ParseResult result = timedParse(text);
    if (!result.success) {
        const std::string detail = result.errors.empty() ? std::string("unknown error") : result.errors.front().message;
        setError(EditorError::ReplayFailed, "re-parse failed: " + detail);
        return EditorError::ReplayFailed;
    }
    std::string raw = exportForm(*result.document);
    result.document->setRawText(raw);
    store_.setDocument(std::move(result.document), std::move(result.tree), std::move(raw));
    return EditorError::Ok;
}

// =============================================================================
// Fragments
// =============================================================================

FragmentEntry EditorContext::captureFragment(const Document& doc, NodeIndex node) const {
    const ElementNode& n = doc.node(node);
    SerializeOptions options;
    options.keepUUID = true;
    options.prettyPrint = false;
    options.tokenAttribute = config_.tokenAttribute;

    FragmentEntry entry;
    entry.token = n.token;
    if (n.parent != kInvalidNode) entry.parentToken = doc.node(n.parent).token;
    entry.index = doc.elementPosition(node);
    entry.fragment = serializeElement(doc, node, options);
    return entry;
}

EditorError EditorContext::insertFragment(Document& doc, const FragmentEntry& entry) {
    const ElementRegistry& registry = store_.registry();
    const NodeIndex parent = registry.byToken(entry.parentToken);
    if (parent == kInvalidNode) {
        setError(EditorError::ReplayFailed, "parent " + entry.parentToken.toString() + " no longer exists");
        return EditorError::ReplayFailed;
    }

    ParseResult fragment = parser_.parseFragment(entry.fragment);
    if (!fragment.success || !fragment.document->hasRoot()) {
        setError(EditorError::ReplayFailed, "stored fragment could not be parsed");
        return EditorError::ReplayFailed;
    }

    const NodeIndex imported = doc.importSubtree(*fragment.document, fragment.document->root());
    if (imported == kInvalidNode) {
        setError(EditorError::ReplayFailed, "stored fragment is empty");
        return EditorError::ReplayFailed;
    }
    doc.insertChild(parent, doc.childSlotForElementPosition(parent, entry.index), imported);
    return EditorError::Ok;
}

// =============================================================================
// Per-kind actions
// =============================================================================

EditorError EditorContext::applyMove(const Operation& op, bool forward) {
    const ElementRegistry& registry = store_.registry();

    std::vector<NodeIndex> nodes;
    nodes.reserve(op.tokens.size());
    for (const auto& token : op.tokens) {
        const NodeIndex n = registry.byToken(token);
        if (n == kInvalidNode) {
            setError(EditorError::ReplayFailed, "moved element " + token.toString() + " no longer exists");
            return EditorError::ReplayFailed;
        }
        nodes.push_back(n);
    }

    std::unique_ptr<Document> working = workingCopy();
    if (forward) {
        for (const NodeIndex n : nodes) translateElement(working->node(n), op.dx, op.dy);
    } else if (!op.positions.empty()) {
        // Undo writes back what the attributes were, not the inverse translation.
        for (const auto& snap : op.positions) {
            const NodeIndex n = registry.byToken(snap.token);
            if (n == kInvalidNode) {
                setError(EditorError::ReplayFailed, "moved element " + snap.token.toString() + " no longer exists");
                return EditorError::ReplayFailed;
            }
            restoreAttributes(working->node(n).attributes, snap.before);
        }
    } else {
        for (const NodeIndex n : nodes) translateElement(working->node(n), -op.dx, -op.dy);
    }
    return structuralCommit(*working);
}

EditorError EditorContext::applyCreate(const Operation& op, bool forward) {
    if (op.entries.empty()) {
        setError(EditorError::InvalidOperation, "create without a fragment");
        return EditorError::InvalidOperation;
    }
    const FragmentEntry& entry = op.entries.front();
    const NodeIndex existing = store_.registry().byToken(entry.token);
    std::unique_ptr<Document> working = workingCopy();

    if (forward) {
        if (existing != kInvalidNode) {
            setError(EditorError::ReplayFailed, "element " + entry.token.toString() + " already exists");
            return EditorError::ReplayFailed;
        }
        const EditorError err = insertFragment(*working, entry);
        if (err != EditorError::Ok) return err;
        return structuralCommit(*working);
    }

    if (existing == kInvalidNode) {
        setError(EditorError::ReplayFailed, "created element " + entry.token.toString() + " no longer exists");
        return EditorError::ReplayFailed;
    }
    working->detach(existing);
    return structuralCommit(*working);
}

EditorError EditorContext::applyDelete(const Operation& op, bool forward) {
    const ElementRegistry& registry = store_.registry();
    const NodeIndex root = store_.document()->root();
    std::unique_ptr<Document> working = workingCopy();

    if (forward) {
        std::vector<NodeIndex> nodes;
        nodes.reserve(op.entries.size());
        for (const auto& entry : op.entries) {
            const NodeIndex n = registry.byToken(entry.token);
            if (n == kInvalidNode || n == root) {
                setError(EditorError::ReplayFailed, "deleted element " + entry.token.toString() + " no longer exists");
                return EditorError::ReplayFailed;
            }
            nodes.push_back(n);
        }
        for (const NodeIndex n : nodes) working->detach(n);
        return structuralCommit(*working);
    }

    // Entries are in document order, so earlier siblings are back in place
    // before a later index is resolved.
    for (const auto& entry : op.entries) {
        if (registry.contains(entry.token)) {
            setError(EditorError::ReplayFailed, "element " + entry.token.toString() + " already exists");
            return EditorError::ReplayFailed;
        }
        if (!registry.contains(entry.parentToken)) {
            setError(EditorError::ReplayFailed, "parent " + entry.parentToken.toString() + " no longer exists");
            return EditorError::ReplayFailed;
        }
    }
    for (const auto& entry : op.entries) {
        const EditorError err = insertFragment(*working, entry);
        if (err != EditorError::Ok) return err;
    }
    return structuralCommit(*working);
}

EditorError EditorContext::applySetAttribute(const Operation& op, bool forward) {
    const NodeIndex n = store_.registry().byToken(op.target);
    if (n == kInvalidNode) {
        setError(EditorError::ReplayFailed, "element " + op.target.toString() + " no longer exists");
        return EditorError::ReplayFailed;
    }
    std::unique_ptr<Document> working = workingCopy();
    ElementNode& node = working->node(n);

    const bool present = forward ? op.hasNewValue : op.hasOldValue;
    const std::string& value = forward ? op.newValue : op.oldValue;

    if (op.name == "id") {
        node.originalId = present ? value : std::string();
    } else if (present) {
        node.attributes.set(op.name, value);
    } else {
        node.attributes.remove(op.name);
    }
    return structuralCommit(*working);
}

EditorError EditorContext::applyReplaceDocument(const Operation& op, bool forward) {
    return replaceFromInternalText(forward ? op.afterText : op.beforeText);
}

} // namespace svgcore
