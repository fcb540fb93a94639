#include "svgcore/history/history_types.h"

namespace svgcore {

const char* operationKindName(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Move: return "move";
        case OperationKind::Create: return "create";
        case OperationKind::Delete: return "delete";
        case OperationKind::SetAttribute: return "set-attribute";
        case OperationKind::ReplaceDocument: return "replace-document";
    }
    return "unknown";
}

std::string Operation::describe() const {
    std::string out = label;
    out += " (";
    out += operationKindName(kind);
    out += ')';
    return out;
}

Operation makeMoveOperation(std::vector<IdentityToken> tokens, double dx, double dy,
    std::vector<PositionSnapshot> positions) {
    Operation op;
    op.kind = OperationKind::Move;
    op.label = tokens.size() == 1 ? "Move element" : "Move elements";
    op.tokens = std::move(tokens);
    op.dx = dx;
    op.dy = dy;
    op.positions = std::move(positions);
    return op;
}

Operation makeCreateOperation(FragmentEntry entry, std::string label) {
    Operation op;
    op.kind = OperationKind::Create;
    op.label = std::move(label);
    op.entries.push_back(std::move(entry));
    return op;
}

Operation makeDeleteOperation(std::vector<FragmentEntry> entries) {
    Operation op;
    op.kind = OperationKind::Delete;
    op.label = entries.size() == 1 ? "Delete element" : "Delete elements";
    op.entries = std::move(entries);
    return op;
}

Operation makeSetAttributeOperation(const IdentityToken& target, std::string name,
    const std::string* oldValue, const std::string* newValue) {
    Operation op;
    op.kind = OperationKind::SetAttribute;
    op.label = (newValue ? "Set " : "Remove ") + name;
    op.target = target;
    op.name = std::move(name);
    if (oldValue) {
        op.hasOldValue = true;
        op.oldValue = *oldValue;
    }
    if (newValue) {
        op.hasNewValue = true;
        op.newValue = *newValue;
    }
    return op;
}

Operation makeReplaceDocumentOperation(std::string beforeText, std::string afterText) {
    Operation op;
    op.kind = OperationKind::ReplaceDocument;
    op.label = "Edit source";
    op.beforeText = std::move(beforeText);
    op.afterText = std::move(afterText);
    return op;
}

} // namespace svgcore
