#pragma once

#include "svgcore/core/config.h"
#include "svgcore/core/types.h"
#include "svgcore/document/document.h"
#include "svgcore/document/identity_token.h"
#include "svgcore/interaction/interaction_types.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

class EditorContext;
class DocumentStore;
class SelectionManager;

/**
 * Two-phase pointer gestures. While a gesture is live the open Document is
 * mutated in place with no history and no structural replace; release turns
 * the whole gesture into one Operation committed through the EditorContext.
 */
class GestureEngine {
public:
    GestureEngine(EditorContext& editor, DocumentStore& store, SelectionManager& selection, const EditorConfig& config);

    GestureState getState() const noexcept { return session_.state; }
    bool isGestureActive() const noexcept { return session_.state != GestureState::Idle; }
    bool isDraftActive() const noexcept { return draft_.active; }

    // ==============================================================================
    // Drag-to-move
    // ==============================================================================
    // Arms on a selectable element. Returns false when the id is not one.
    bool pointerDown(std::string_view id, double x, double y);
    void pointerMove(double x, double y);
    GestureOutcome pointerUp();
    // Cancels a live drag; an armed press is simply dropped.
    GestureOutcome pointerLeave();
    // Reverts any live mutation and forgets the gesture.
    void cancel();

    const std::vector<IdentityToken>& getMovingTokens() const noexcept { return session_.tokens; }
    Point2 getTotalDelta() const noexcept;

    // Bounds of every moving element (or the draft preview), computed on demand.
    std::vector<Bounds> getSelectionOutline() const;

    // ==============================================================================
    // Primitive creation (preview element)
    // ==============================================================================
    bool beginDraft(DraftTool tool, double x, double y);
    void updateDraft(double x, double y);
    GestureOutcome commitDraft();
    void cancelDraft();

    NodeIndex getDraftPreview() const noexcept { return draft_.preview; }
    // The preview node while it is still linked into the open document.
    NodeIndex livePreview() const noexcept;

private:
    struct MoveSnapshot {
        IdentityToken token;
        NodeIndex node = kInvalidNode;
        std::vector<AttributeState> attributes;
    };

    struct SessionState {
        GestureState state = GestureState::Idle;
        std::vector<IdentityToken> tokens;
        std::vector<IdentityToken> selectionBefore;
        double anchorX = 0.0;
        double anchorY = 0.0;
        double lastX = 0.0;
        double lastY = 0.0;
        std::uint64_t generation = 0;
        std::vector<MoveSnapshot> snapshots;
    };

    struct DraftState {
        bool active = false;
        DraftTool tool = DraftTool::Rect;
        double startX = 0.0;
        double startY = 0.0;
        double currentX = 0.0;
        double currentY = 0.0;
        NodeIndex preview = kInvalidNode;
        std::uint64_t generation = 0;
    };

    void captureSnapshots();
    void revertLiveMutations();
    bool sessionDocumentValid() const noexcept;

    // Preview element helpers
    void upsertPreview();
    void removePreview();

    EditorContext& editor_;
    DocumentStore& store_;
    SelectionManager& selection_;
    const EditorConfig& config_;

    SessionState session_;
    DraftState draft_;
};

// Tag written for a creation tool.
const char* draftToolTag(DraftTool tool) noexcept;

// Final attributes of a primitive drawn from (startX, startY) to (currentX, currentY).
// Extents below the minimum size fall back to the tool defaults.
void writePrimitiveAttributes(AttributeList& attrs, DraftTool tool,
    double startX, double startY, double currentX, double currentY);

} // namespace svgcore
