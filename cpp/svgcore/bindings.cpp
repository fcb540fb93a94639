#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "svgcore/editor.h"

#include <cinttypes>
#include <cstdio>

#ifdef EMSCRIPTEN
using svgcore::DraftTool;
using svgcore::EditorContext;
using svgcore::EditorError;
using svgcore::EditorStats;
using svgcore::GestureOutcome;
using svgcore::ParseError;

EMSCRIPTEN_BINDINGS(svgcore_module) {
    emscripten::enum_<EditorError>("EditorError")
        .value("Ok", EditorError::Ok)
        .value("NoDocument", EditorError::NoDocument)
        .value("ParseFailed", EditorError::ParseFailed)
        .value("InvalidAttribute", EditorError::InvalidAttribute)
        .value("ElementNotFound", EditorError::ElementNotFound)
        .value("ReplayFailed", EditorError::ReplayFailed)
        .value("InvalidOperation", EditorError::InvalidOperation);

    emscripten::enum_<GestureOutcome>("GestureOutcome")
        .value("None", GestureOutcome::None)
        .value("Click", GestureOutcome::Click)
        .value("Committed", GestureOutcome::Committed)
        .value("Cancelled", GestureOutcome::Cancelled)
        .value("Failed", GestureOutcome::Failed);

    emscripten::enum_<DraftTool>("DraftTool")
        .value("Rect", DraftTool::Rect)
        .value("Circle", DraftTool::Circle)
        .value("Ellipse", DraftTool::Ellipse)
        .value("Line", DraftTool::Line)
        .value("Path", DraftTool::Path)
        .value("Text", DraftTool::Text)
        .value("Group", DraftTool::Group);

    emscripten::class_<EditorContext>("EditorContext")
        .constructor<>()
        .function("newDocument", &EditorContext::newDocument)
        .function("closeDocument", &EditorContext::closeDocument)
        .function("loadText", &EditorContext::loadText)
        .function("applyRawText", &EditorContext::applyRawText)
        .function("updateRawText", &EditorContext::updateRawText)
        .function("rollbackRawText", &EditorContext::rollbackRawText)
        .function("exportText", &EditorContext::exportText)
        .function("hasDocument", &EditorContext::hasDocument)
        .function("getRawText", emscripten::optional_override([](EditorContext& self) {
            return self.store().rawText();
        }))
        .function("setAttribute", &EditorContext::setAttribute)
        .function("removeAttribute", &EditorContext::removeAttribute)
        .function("deleteSelection", &EditorContext::deleteSelection)
        .function("undo", &EditorContext::undo)
        .function("redo", &EditorContext::redo)
        .function("canUndo", &EditorContext::canUndo)
        .function("canRedo", &EditorContext::canRedo)
        .function("setPrettyPrint", &EditorContext::setPrettyPrint)
        .function("getPrettyPrint", &EditorContext::getPrettyPrint)
        // Selection
        .function("select", &EditorContext::select)
        .function("toggleSelection", &EditorContext::toggleSelection)
        .function("clearSelection", &EditorContext::clearSelection)
        .function("getSelectedIds", &EditorContext::getSelectedIds)
        // Gestures
        .function("pointerDown", &EditorContext::pointerDown)
        .function("pointerMove", &EditorContext::pointerMove)
        .function("pointerUp", &EditorContext::pointerUp)
        .function("pointerLeave", &EditorContext::pointerLeave)
        .function("beginDraft", &EditorContext::beginDraft)
        .function("updateDraft", &EditorContext::updateDraft)
        .function("commitDraft", &EditorContext::commitDraft)
        .function("cancelDraft", &EditorContext::cancelDraft)
        // Diagnostics
        .function("getLastError", &EditorContext::getLastError)
        .function("getLastErrorMessage", emscripten::optional_override([](const EditorContext& self) {
            return self.getLastErrorMessage();
        }))
        .function("getLastParseErrors", emscripten::optional_override([](const EditorContext& self) {
            return self.getLastParseErrors();
        }))
        .function("getStats", &EditorContext::getStats)
        // 64-bit digest as hex; avoids BigInt on the JS side.
        .function("getDocumentDigest", emscripten::optional_override([](const EditorContext& self) {
            char buf[17];
            std::snprintf(buf, sizeof(buf), "%016" PRIx64, self.getDocumentDigest());
            return std::string(buf);
        }));

    emscripten::value_object<ParseError>("ParseError")
        .field("line", &ParseError::line)
        .field("column", &ParseError::column)
        .field("message", &ParseError::message);

    emscripten::value_object<EditorStats>("EditorStats")
        .field("generation", &EditorStats::generation)
        .field("elementCount", &EditorStats::elementCount)
        .field("historySize", &EditorStats::historySize)
        .field("historyCursor", &EditorStats::historyCursor)
        .field("commitCount", &EditorStats::commitCount)
        .field("lastParseMs", &EditorStats::lastParseMs)
        .field("lastSerializeMs", &EditorStats::lastSerializeMs)
        .field("lastCommitMs", &EditorStats::lastCommitMs);

    emscripten::register_vector<std::string>("VectorString");
    emscripten::register_vector<ParseError>("VectorParseError");
}
#endif
