// GestureEngine primitive creation: preview element and Create commit.

#include "svgcore/interaction/gesture_engine.h"
#include "svgcore/editor.h"
#include "svgcore/document/document.h"
#include "svgcore/document/serializer.h"
#include "svgcore/history/history_types.h"
#include "svgcore/state/document_store.h"
#include "svgcore/core/logging.h"
#include "svgcore/core/string_utils.h"

#include <algorithm>
#include <cmath>

namespace svgcore {

namespace {

constexpr double kMinPrimitiveSize = 10.0;

constexpr const char* kDefaultText = "Text";

std::string num(double v) {
    return formatNumber(v);
}

} // namespace

const char* draftToolTag(DraftTool tool) noexcept {
    switch (tool) {
        case DraftTool::Rect: return "rect";
        case DraftTool::Circle: return "circle";
        case DraftTool::Ellipse: return "ellipse";
        case DraftTool::Line: return "line";
        case DraftTool::Path: return "path";
        case DraftTool::Text: return "text";
        case DraftTool::Group: return "g";
    }
    return "rect";
}

void writePrimitiveAttributes(AttributeList& attrs, DraftTool tool,
    double startX, double startY, double currentX, double currentY) {
    const double width = std::fabs(currentX - startX);
    const double height = std::fabs(currentY - startY);

    switch (tool) {
        case DraftTool::Rect:
            attrs.set("x", num(std::min(startX, currentX)));
            attrs.set("y", num(std::min(startY, currentY)));
            attrs.set("width", num(width < kMinPrimitiveSize ? 100.0 : width));
            attrs.set("height", num(height < kMinPrimitiveSize ? 80.0 : height));
            attrs.set("fill", "#3b82f6");
            attrs.set("stroke", "#1e40af");
            attrs.set("stroke-width", "2");
            break;
        case DraftTool::Circle: {
            const double radius = std::hypot(width, height) / 2.0;
            attrs.set("cx", num(startX));
            attrs.set("cy", num(startY));
            attrs.set("r", num(radius < kMinPrimitiveSize ? 50.0 : radius));
            attrs.set("fill", "#10b981");
            attrs.set("stroke", "#047857");
            attrs.set("stroke-width", "2");
            break;
        }
        case DraftTool::Ellipse:
            attrs.set("cx", num(startX));
            attrs.set("cy", num(startY));
            attrs.set("rx", num(width < kMinPrimitiveSize ? 60.0 : width / 2.0));
            attrs.set("ry", num(height < kMinPrimitiveSize ? 40.0 : height / 2.0));
            attrs.set("fill", "#8b5cf6");
            attrs.set("stroke", "#6d28d9");
            attrs.set("stroke-width", "2");
            break;
        case DraftTool::Line: {
            double x2 = currentX;
            double y2 = currentY;
            if (std::hypot(currentX - startX, currentY - startY) < kMinPrimitiveSize) {
                x2 = startX + 100.0;
                y2 = startY;
            }
            attrs.set("x1", num(startX));
            attrs.set("y1", num(startY));
            attrs.set("x2", num(x2));
            attrs.set("y2", num(y2));
            attrs.set("stroke", "#ef4444");
            attrs.set("stroke-width", "3");
            attrs.set("stroke-linecap", "round");
            break;
        }
        case DraftTool::Path: {
            double endX = currentX;
            double endY = currentY;
            if (std::hypot(currentX - startX, currentY - startY) < kMinPrimitiveSize) {
                endX = startX + 100.0;
                endY = startY + 50.0;
            }
            const double midX = (startX + endX) / 2.0;
            const double midY = (startY + endY) / 2.0;
            attrs.set("d", "M " + num(startX) + " " + num(startY) + " Q " + num(midX) + " " + num(startY) + ", "
                + num(midX) + " " + num(midY) + " T " + num(endX) + " " + num(endY));
            attrs.set("fill", "none");
            attrs.set("stroke", "#f59e0b");
            attrs.set("stroke-width", "3");
            attrs.set("stroke-linecap", "round");
            attrs.set("stroke-linejoin", "round");
            break;
        }
        case DraftTool::Text:
            attrs.set("x", num(startX));
            attrs.set("y", num(startY));
            attrs.set("fill", "#1f2937");
            attrs.set("font-size", "24");
            attrs.set("font-family", "Arial, sans-serif");
            break;
        case DraftTool::Group:
            attrs.set("transform", "translate(" + num(startX) + ", " + num(startY) + ")");
            break;
    }
}

bool GestureEngine::beginDraft(DraftTool tool, double x, double y) {
    if (draft_.active) cancelDraft();
    if (session_.state != GestureState::Idle) cancel();

    const Document* doc = store_.document();
    if (!doc || !doc->hasRoot()) return false;

    draft_ = DraftState{};
    draft_.active = true;
    draft_.tool = tool;
    draft_.startX = draft_.currentX = x;
    draft_.startY = draft_.currentY = y;
    draft_.generation = store_.generation();
    upsertPreview();
    return true;
}

void GestureEngine::updateDraft(double x, double y) {
    if (!draft_.active) return;
    if (store_.generation() != draft_.generation) {
        SVGCORE_LOG_DEBUG("draft dropped: document replaced mid-gesture");
        draft_ = DraftState{};
        return;
    }
    draft_.currentX = x;
    draft_.currentY = y;
    upsertPreview();
}

void GestureEngine::cancelDraft() {
    if (!draft_.active) return;
    removePreview();
    draft_ = DraftState{};
}

GestureOutcome GestureEngine::commitDraft() {
    if (!draft_.active) return GestureOutcome::None;
    if (store_.generation() != draft_.generation || !store_.hasDocument()) {
        draft_ = DraftState{};
        return GestureOutcome::Cancelled;
    }
    removePreview();

    const Document& doc = *store_.document();
    const ElementNode& root = doc.node(doc.root());
    std::size_t index = 0;
    for (const NodeIndex c : root.children) {
        if (doc.node(c).isElement()) index++;
    }

    Document scratch;
    const NodeIndex el = scratch.createElement(draftToolTag(draft_.tool));
    writePrimitiveAttributes(scratch.node(el).attributes, draft_.tool,
        draft_.startX, draft_.startY, draft_.currentX, draft_.currentY);
    if (draft_.tool == DraftTool::Text) {
        scratch.appendChild(el, scratch.createTextRun(kDefaultText));
    }
    const IdentityToken token = editor_.issueToken();
    scratch.node(el).token = token;

    SerializeOptions fragmentOptions;
    fragmentOptions.keepUUID = true;
    fragmentOptions.prettyPrint = false;
    fragmentOptions.tokenAttribute = config_.tokenAttribute;

    FragmentEntry entry;
    entry.token = token;
    entry.parentToken = root.token;
    entry.index = index;
    entry.fragment = serializeElement(scratch, el, fragmentOptions);

    const std::string label = std::string("Create ") + draftToolTag(draft_.tool);
    draft_ = DraftState{};

    editor_.selectOnNextDocument(token);
    const EditorError err = editor_.commitOperation(makeCreateOperation(std::move(entry), label));
    if (err != EditorError::Ok) {
        editor_.clearPendingSelection();
        return GestureOutcome::Failed;
    }
    return GestureOutcome::Committed;
}

NodeIndex GestureEngine::livePreview() const noexcept {
    if (!draft_.active || store_.generation() != draft_.generation) return kInvalidNode;
    return draft_.preview;
}

void GestureEngine::upsertPreview() {
    Document* doc = store_.mutableDocument();
    if (!doc) return;

    if (draft_.preview == kInvalidNode) {
        draft_.preview = doc->createElement(draftToolTag(draft_.tool));
        if (draft_.tool == DraftTool::Text) {
            doc->appendChild(draft_.preview, doc->createTextRun(kDefaultText));
        }
        doc->appendChild(doc->root(), draft_.preview);
    }

    AttributeList& attrs = doc->node(draft_.preview).attributes;
    attrs.clear();
    writePrimitiveAttributes(attrs, draft_.tool, draft_.startX, draft_.startY, draft_.currentX, draft_.currentY);
    attrs.set("opacity", "0.5");
    attrs.set("stroke-dasharray", "4 4");
}

void GestureEngine::removePreview() {
    if (draft_.preview == kInvalidNode) return;
    if (store_.generation() == draft_.generation) {
        Document* doc = store_.mutableDocument();
        if (doc) doc->detach(draft_.preview);
    }
    draft_.preview = kInvalidNode;
}

} // namespace svgcore
