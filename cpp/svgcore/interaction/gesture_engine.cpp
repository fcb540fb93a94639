#include "svgcore/interaction/gesture_engine.h"
#include "svgcore/interaction/geometry.h"
#include "svgcore/editor.h"
#include "svgcore/history/history_types.h"
#include "svgcore/selection/selection_manager.h"
#include "svgcore/state/document_store.h"
#include "svgcore/core/logging.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace svgcore {

GestureEngine::GestureEngine(EditorContext& editor, DocumentStore& store, SelectionManager& selection, const EditorConfig& config)
    : editor_(editor), store_(store), selection_(selection), config_(config) {}

bool GestureEngine::sessionDocumentValid() const noexcept {
    return store_.hasDocument() && store_.generation() == session_.generation;
}

Point2 GestureEngine::getTotalDelta() const noexcept {
    if (session_.state == GestureState::Idle) return Point2{0.0, 0.0};
    return Point2{session_.lastX - session_.anchorX, session_.lastY - session_.anchorY};
}

bool GestureEngine::pointerDown(std::string_view id, double x, double y) {
    if (session_.state != GestureState::Idle) cancel();
    if (draft_.active) return false;

    const Document* doc = store_.document();
    if (!doc) return false;

    const ElementRegistry& registry = store_.registry();
    IdentityToken clicked;
    if (!registry.tokenForId(id, clicked)) return false;
    if (registry.byToken(clicked) == doc->root()) return false;

    std::vector<IdentityToken> candidates;
    if (store_.isSelected(clicked)) {
        candidates = store_.selection();
    } else {
        candidates.push_back(clicked);
    }

    // A child of a moving group already moves with it.
    std::unordered_set<NodeIndex> movingNodes;
    for (const auto& t : candidates) movingNodes.insert(registry.byToken(t));
    std::vector<IdentityToken> moving;
    for (const auto& t : candidates) {
        const NodeIndex n = registry.byToken(t);
        if (n == kInvalidNode || n == doc->root()) continue;
        bool nested = false;
        for (NodeIndex p = doc->node(n).parent; p != kInvalidNode; p = doc->node(p).parent) {
            if (movingNodes.count(p) != 0) {
                nested = true;
                break;
            }
        }
        if (!nested) moving.push_back(t);
    }
    if (moving.empty()) return false;

    session_ = SessionState{};
    session_.state = GestureState::Armed;
    session_.tokens = std::move(moving);
    session_.selectionBefore = store_.selection();
    session_.anchorX = session_.lastX = x;
    session_.anchorY = session_.lastY = y;
    session_.generation = store_.generation();
    return true;
}

void GestureEngine::captureSnapshots() {
    const ElementRegistry& registry = store_.registry();
    const Document* doc = store_.document();
    session_.snapshots.clear();
    session_.snapshots.reserve(session_.tokens.size());

    for (const auto& t : session_.tokens) {
        MoveSnapshot snap;
        snap.token = t;
        snap.node = registry.byToken(t);
        if (snap.node == kInvalidNode) continue;
        snap.attributes = capturePosition(doc->node(snap.node));
        session_.snapshots.push_back(std::move(snap));
    }
}

void GestureEngine::revertLiveMutations() {
    if (!sessionDocumentValid()) return;
    Document* doc = store_.mutableDocument();
    for (const auto& snap : session_.snapshots) {
        restoreAttributes(doc->node(snap.node).attributes, snap.attributes);
    }
}

void GestureEngine::pointerMove(double x, double y) {
    if (session_.state == GestureState::Idle) return;
    if (!sessionDocumentValid()) {
        SVGCORE_LOG_DEBUG("gesture dropped: document replaced mid-gesture");
        session_ = SessionState{};
        return;
    }

    if (session_.state == GestureState::Armed) {
        captureSnapshots();
        session_.state = GestureState::Live;
    }

    const double dx = x - session_.lastX;
    const double dy = y - session_.lastY;
    session_.lastX = x;
    session_.lastY = y;
    if (dx == 0.0 && dy == 0.0) return;

    Document* doc = store_.mutableDocument();
    for (const auto& snap : session_.snapshots) {
        translateElement(doc->node(snap.node), dx, dy);
    }
}

GestureOutcome GestureEngine::pointerUp() {
    if (session_.state == GestureState::Idle) return GestureOutcome::None;
    if (!sessionDocumentValid()) {
        session_ = SessionState{};
        return GestureOutcome::Cancelled;
    }
    if (session_.state == GestureState::Armed) {
        session_ = SessionState{};
        return GestureOutcome::Click;
    }

    const Point2 total = getTotalDelta();
    revertLiveMutations();
    std::vector<IdentityToken> tokens = std::move(session_.tokens);
    const std::vector<IdentityToken> selectionBefore = std::move(session_.selectionBefore);
    std::vector<PositionSnapshot> positions;
    positions.reserve(session_.snapshots.size());
    for (auto& snap : session_.snapshots) {
        positions.push_back(PositionSnapshot{snap.token, std::move(snap.attributes)});
    }
    session_ = SessionState{};

    if (std::hypot(total.x, total.y) < config_.dragEpsilon) return GestureOutcome::Click;

    const EditorError err = editor_.commitOperation(
        makeMoveOperation(std::move(tokens), total.x, total.y, std::move(positions)));
    if (err != EditorError::Ok) return GestureOutcome::Failed;

    selection_.selectTokens(selectionBefore);
    return GestureOutcome::Committed;
}

GestureOutcome GestureEngine::pointerLeave() {
    if (session_.state == GestureState::Idle) return GestureOutcome::None;
    const bool live = session_.state == GestureState::Live;
    cancel();
    return live ? GestureOutcome::Cancelled : GestureOutcome::None;
}

void GestureEngine::cancel() {
    if (session_.state == GestureState::Live) revertLiveMutations();
    session_ = SessionState{};
}

std::vector<Bounds> GestureEngine::getSelectionOutline() const {
    std::vector<Bounds> out;
    const Document* doc = store_.document();
    if (!doc) return out;

    if (draft_.active) {
        if (store_.generation() == draft_.generation && draft_.preview != kInvalidNode) {
            out.push_back(elementBounds(*doc, draft_.preview));
        }
        return out;
    }

    if (session_.state != GestureState::Idle && sessionDocumentValid()) {
        for (const auto& t : session_.tokens) {
            const NodeIndex n = store_.registry().byToken(t);
            if (n != kInvalidNode) out.push_back(elementBounds(*doc, n));
        }
        return out;
    }

    for (const NodeIndex n : store_.selectedElements()) {
        if (n != kInvalidNode) out.push_back(elementBounds(*doc, n));
    }
    return out;
}

} // namespace svgcore
