#pragma once

#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "svgcore/core/config.h"
#include "svgcore/core/types.h"
#include "svgcore/core/util.h"

#include "svgcore/document/document.h"
#include "svgcore/document/identity_token.h"
#include "svgcore/document/parser.h"
#include "svgcore/document/serializer.h"
#include "svgcore/history/history_manager.h"
#include "svgcore/history/history_types.h"
#include "svgcore/interaction/gesture_engine.h"
#include "svgcore/selection/selection_manager.h"
#include "svgcore/state/document_store.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace svgcore {

/**
 * Application context of one open editor. Owns every service, wires them
 * together and is the only place Operations are applied. Construct as many
 * as needed; nothing here is global.
 */
class EditorContext : public OperationApplier {
public:
    explicit EditorContext(EditorConfig config = EditorConfig{});
    ~EditorContext() override;

    EditorContext(const EditorContext&) = delete;
    EditorContext& operator=(const EditorContext&) = delete;

    // ==============================================================================
    // Document lifecycle
    // ==============================================================================
    void newDocument();
    void closeDocument();
    // Replaces the document and resets history. On failure the open document is kept.
    EditorError loadText(const std::string& text);
    // Raw-text panel commit; undoable.
    EditorError applyRawText(const std::string& text);
    // Raw-text panel typing. Updates only the text mirror.
    void updateRawText(const std::string& text);
    void rollbackRawText();
    std::string exportText() const;
    bool hasDocument() const noexcept { return store_.hasDocument(); }

    // ==============================================================================
    // Edits
    // ==============================================================================
    EditorError setAttribute(const std::string& id, const std::string& name, const std::string& value);
    EditorError removeAttribute(const std::string& id, const std::string& name);
    EditorError deleteSelection();

    EditorError undo();
    EditorError redo();
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }

    void setPrettyPrint(bool enabled);
    bool getPrettyPrint() const noexcept { return config_.prettyPrint; }

    // ==============================================================================
    // Selection and gestures (thin forwards for the browser binding)
    // ==============================================================================
    void select(const std::vector<std::string>& ids) { selection_.select(ids); }
    void toggleSelection(const std::string& id) { selection_.toggleSelection(id); }
    void clearSelection() { selection_.clearSelection(); }
    std::vector<std::string> getSelectedIds() const { return selection_.getSelectedIds(); }

    bool pointerDown(const std::string& id, double x, double y) { return gestures_.pointerDown(id, x, y); }
    void pointerMove(double x, double y) { gestures_.pointerMove(x, y); }
    GestureOutcome pointerUp() { return gestures_.pointerUp(); }
    GestureOutcome pointerLeave() { return gestures_.pointerLeave(); }
    bool beginDraft(DraftTool tool, double x, double y) { return gestures_.beginDraft(tool, x, y); }
    void updateDraft(double x, double y) { gestures_.updateDraft(x, y); }
    GestureOutcome commitDraft() { return gestures_.commitDraft(); }
    void cancelDraft() { gestures_.cancelDraft(); }

    // ==============================================================================
    // Services
    // ==============================================================================
    DocumentStore& store() noexcept { return store_; }
    const DocumentStore& store() const noexcept { return store_; }
    SelectionManager& selection() noexcept { return selection_; }
    HistoryManager& history() noexcept { return history_; }
    const HistoryManager& history() const noexcept { return history_; }
    GestureEngine& gestures() noexcept { return gestures_; }
    Parser& parser() noexcept { return parser_; }
    const EditorConfig& config() const noexcept { return config_; }

    // ==============================================================================
    // Errors and diagnostics
    // ==============================================================================
    EditorError getLastError() const noexcept { return lastError_; }
    const std::string& getLastErrorMessage() const noexcept { return lastErrorMessage_; }
    const std::vector<ParseError>& getLastParseErrors() const noexcept { return lastParseErrors_; }
    void clearError() const;

    EditorStats getStats() const;
    std::uint64_t getDocumentDigest() const;

    // ==============================================================================
    // Operation pipeline
    // ==============================================================================
    // Applies op forward and, when that succeeds, pushes it onto history.
    EditorError commitOperation(Operation&& op);
    EditorError applyOperation(const Operation& op, bool forward) override;

    IdentityToken issueToken() { return tokens_.next(); }
    // The token is selected once a document containing it has been delivered.
    void selectOnNextDocument(const IdentityToken& token) { pendingSelection_ = token; }
    void clearPendingSelection() noexcept { pendingSelection_ = IdentityToken{}; }

private:
    // serialize(keepUUID) -> parse -> setDocument. Actions edit a working copy
    // so the open document is only replaced once the re-parse has succeeded.
    std::unique_ptr<Document> workingCopy() const;
    EditorError structuralCommit(const Document& working);
    EditorError replaceFromInternalText(const std::string& text);
    ParseResult timedParse(const std::string& text);

    EditorError applyMove(const Operation& op, bool forward);
    EditorError applyCreate(const Operation& op, bool forward);
    EditorError applyDelete(const Operation& op, bool forward);
    EditorError applySetAttribute(const Operation& op, bool forward);
    EditorError applyReplaceDocument(const Operation& op, bool forward);

    EditorError insertFragment(Document& doc, const FragmentEntry& entry);
    FragmentEntry captureFragment(const Document& doc, NodeIndex node) const;

    std::string exportForm(const Document& doc, NodeIndex omit = kInvalidNode) const;
    std::string internalForm(const Document& doc) const;
    void resetSession();
    void onDocumentDelivered();

    void setError(EditorError err, std::string message) const;

    EditorConfig config_;
    TokenSource tokens_;
    Parser parser_;
    DocumentStore store_;
    SelectionManager selection_;
    HistoryManager history_;
    GestureEngine gestures_;

    std::uint32_t documentSubscription_ = 0;
    IdentityToken pendingSelection_;

    mutable EditorError lastError_{EditorError::Ok};
    mutable std::string lastErrorMessage_;
    std::vector<ParseError> lastParseErrors_;

    std::uint32_t commitCount_ = 0;
    float lastParseMs_ = 0.0f;
    float lastSerializeMs_ = 0.0f;
    float lastCommitMs_ = 0.0f;
};

} // namespace svgcore
