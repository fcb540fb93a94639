#pragma once

#include "svgcore/core/types.h"
#include "svgcore/document/document.h"
#include "svgcore/document/identity_token.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace svgcore {

enum class OperationKind : std::uint8_t {
    Move = 0,
    Create = 1,
    Delete = 2,
    SetAttribute = 3,
    ReplaceDocument = 4,
};

const char* operationKindName(OperationKind kind) noexcept;

// One element subtree and where it sits. index counts element siblings only.
struct FragmentEntry {
    IdentityToken token;
    IdentityToken parentToken;
    std::size_t index = 0;
    std::string fragment;  // keepUUID serialization of the subtree
};

// Position attributes of one moved element before the move.
struct PositionSnapshot {
    IdentityToken token;
    std::vector<AttributeState> before;
};

/**
 * Reversible edit. Only the fields of the active kind are meaningful:
 *   Move            tokens, dx, dy, positions (restored verbatim on undo)
 *   Create          entries[0]
 *   Delete          entries, in document order
 *   SetAttribute    target, name, old/new value (absent when has* is false)
 *   ReplaceDocument beforeText, afterText
 * Replay is a pure function of these fields and the current document.
 */
struct Operation {
    OperationKind kind = OperationKind::Move;
    std::string label;

    std::vector<IdentityToken> tokens;
    double dx = 0.0;
    double dy = 0.0;
    std::vector<PositionSnapshot> positions;

    std::vector<FragmentEntry> entries;

    IdentityToken target;
    std::string name;
    bool hasOldValue = false;
    std::string oldValue;
    bool hasNewValue = false;
    std::string newValue;

    std::string beforeText;
    std::string afterText;

    std::string describe() const;
};

Operation makeMoveOperation(std::vector<IdentityToken> tokens, double dx, double dy,
    std::vector<PositionSnapshot> positions = {});
Operation makeCreateOperation(FragmentEntry entry, std::string label);
Operation makeDeleteOperation(std::vector<FragmentEntry> entries);
Operation makeSetAttributeOperation(const IdentityToken& target, std::string name,
    const std::string* oldValue, const std::string* newValue);
Operation makeReplaceDocumentOperation(std::string beforeText, std::string afterText);

// Executes an Operation's forward (forward=true) or backward action.
class OperationApplier {
public:
    virtual ~OperationApplier() = default;
    virtual EditorError applyOperation(const Operation& op, bool forward) = 0;
};

} // namespace svgcore
