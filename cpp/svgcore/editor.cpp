#include "svgcore/editor.h"
#include "svgcore/core/logging.h"
#include "svgcore/validation/attribute_validation.h"

#include <unordered_set>

namespace svgcore {

namespace {

constexpr const char* kBlankDocument =
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"800\" height=\"600\" viewBox=\"0 0 800 600\"></svg>";

ParserOptions parserOptionsFor(const EditorConfig& config) {
    ParserOptions options;
    options.idPrefix = config.idPrefix;
    options.tokenAttribute = config.tokenAttribute;
    return options;
}

} // namespace

EditorContext::EditorContext(EditorConfig config)
    : config_(std::move(config)),
      tokens_(config_.tokenSeed),
      parser_(tokens_, parserOptionsFor(config_)),
      selection_(store_),
      history_(config_.historyCapacity),
      gestures_(*this, store_, selection_, config_) {
    documentSubscription_ = store_.subscribe(fieldMask(StoreField::Document), [this](const StoreChange&) {
        onDocumentDelivered();
    });
}

EditorContext::~EditorContext() {
    store_.unsubscribe(documentSubscription_);
}

void EditorContext::clearError() const {
    lastError_ = EditorError::Ok;
    lastErrorMessage_.clear();
}

void EditorContext::setError(EditorError err, std::string message) const {
    lastError_ = err;
    lastErrorMessage_ = std::move(message);
}

std::string EditorContext::exportForm(const Document& doc, NodeIndex omit) const {
    SerializeOptions options;
    options.omitNode = omit;
    options.prettyPrint = config_.prettyPrint;
    options.indent = config_.indent;
    options.tokenAttribute = config_.tokenAttribute;
    return serialize(doc, options);
}

std::string EditorContext::internalForm(const Document& doc) const {
    SerializeOptions options;
    options.keepUUID = true;
    options.prettyPrint = false;
    options.tokenAttribute = config_.tokenAttribute;
    return serialize(doc, options);
}

ParseResult EditorContext::timedParse(const std::string& text) {
    const double t0 = svgcore_now_ms();
    ParseResult result = parser_.parse(text);
    lastParseMs_ = static_cast<float>(svgcore_now_ms() - t0);
    return result;
}

void EditorContext::resetSession() {
    gestures_.cancel();
    gestures_.cancelDraft();
    history_.clear();
    pendingSelection_ = IdentityToken{};
    lastParseErrors_.clear();
}

void EditorContext::onDocumentDelivered() {
    if (pendingSelection_.isNull()) return;
    if (!store_.registry().contains(pendingSelection_)) return;
    const IdentityToken token = pendingSelection_;
    pendingSelection_ = IdentityToken{};
    selection_.selectTokens({token});
}

// =============================================================================
// Document lifecycle
// =============================================================================

void EditorContext::newDocument() {
    clearError();
    resetSession();
    selection_.clearSelection();
    store_.setHoveredToken(IdentityToken{});

    ParseResult result = timedParse(kBlankDocument);
    if (!result.success) {
        setError(EditorError::ParseFailed, result.errors.empty() ? "blank document rejected" : result.errors.front().message);
        return;
    }
    std::string raw = exportForm(*result.document);
    result.document->setRawText(raw);
    store_.setDocument(std::move(result.document), std::move(result.tree), std::move(raw));
}

void EditorContext::closeDocument() {
    clearError();
    resetSession();
    store_.clearDocument();
}

EditorError EditorContext::loadText(const std::string& text) {
    clearError();
    ParseResult result = timedParse(text);
    if (!result.success) {
        lastParseErrors_ = std::move(result.errors);
        setError(EditorError::ParseFailed, lastParseErrors_.front().message);
        return EditorError::ParseFailed;
    }

    resetSession();
    std::string raw = exportForm(*result.document);
    result.document->setRawText(raw);
    store_.setDocument(std::move(result.document), std::move(result.tree), std::move(raw));
    return EditorError::Ok;
}

EditorError EditorContext::applyRawText(const std::string& text) {
    if (!store_.hasDocument()) return loadText(text);
    clearError();

    ParseResult result = timedParse(text);
    if (!result.success) {
        lastParseErrors_ = std::move(result.errors);
        setError(EditorError::ParseFailed, lastParseErrors_.front().message);
        SVGCORE_LOG_DEBUG("raw text rejected; last valid text retained");
        return EditorError::ParseFailed;
    }
    lastParseErrors_.clear();

    gestures_.cancel();
    gestures_.cancelDraft();

    std::string raw = exportForm(*result.document);
    if (raw == exportForm(*store_.document())) {
        // Formatting-only edit: refresh the mirror, nothing to undo.
        store_.updateRawSVG(std::move(raw));
        return EditorError::Ok;
    }

    std::string before = internalForm(*store_.document());
    std::string after = internalForm(*result.document);
    result.document->setRawText(raw);
    store_.setDocument(std::move(result.document), std::move(result.tree), std::move(raw));
    history_.push(makeReplaceDocumentOperation(std::move(before), std::move(after)));
    commitCount_++;
    return EditorError::Ok;
}

void EditorContext::updateRawText(const std::string& text) {
    store_.updateRawSVG(text);
}

void EditorContext::rollbackRawText() {
    lastParseErrors_.clear();
    store_.updateRawSVG(store_.lastValidRawText());
}

std::string EditorContext::exportText() const {
    const Document* doc = store_.document();
    if (!doc) return std::string();
    return exportForm(*doc, gestures_.livePreview());
}

void EditorContext::setPrettyPrint(bool enabled) {
    if (config_.prettyPrint == enabled) return;
    config_.prettyPrint = enabled;
    const Document* doc = store_.document();
    if (doc) store_.updateRawSVG(exportForm(*doc, gestures_.livePreview()));
}

// =============================================================================
// Edits
// =============================================================================

EditorError EditorContext::setAttribute(const std::string& id, const std::string& name, const std::string& value) {
    clearError();
    const Document* doc = store_.document();
    if (!doc) {
        setError(EditorError::NoDocument, "no document is open");
        return EditorError::NoDocument;
    }

    IdentityToken target;
    if (!store_.registry().tokenForId(id, target)) {
        setError(EditorError::ElementNotFound, "no element with id '" + id + "'");
        return EditorError::ElementNotFound;
    }
    if (name.empty() || name == config_.tokenAttribute) {
        setError(EditorError::InvalidAttribute, "attribute name '" + name + "' is reserved");
        return EditorError::InvalidAttribute;
    }
    if (!isValidAttributeName(name)) {
        setError(EditorError::InvalidAttribute, "Attribute name \"" + name + "\" is not a valid XML name");
        return EditorError::InvalidAttribute;
    }

    const ValidationResult check = validateAttribute(name, value);
    if (!check.valid) {
        setError(EditorError::InvalidAttribute, check.message);
        return EditorError::InvalidAttribute;
    }

    const ElementNode& node = doc->node(store_.registry().byToken(target));
    const std::string* current = nullptr;
    if (name == "id") {
        if (!node.originalId.empty()) current = &node.originalId;
    } else {
        current = node.attributes.find(name);
    }
    if (current && *current == value) return EditorError::Ok;

    return commitOperation(makeSetAttributeOperation(target, name, current, &value));
}

EditorError EditorContext::removeAttribute(const std::string& id, const std::string& name) {
    clearError();
    const Document* doc = store_.document();
    if (!doc) {
        setError(EditorError::NoDocument, "no document is open");
        return EditorError::NoDocument;
    }

    IdentityToken target;
    if (!store_.registry().tokenForId(id, target)) {
        setError(EditorError::ElementNotFound, "no element with id '" + id + "'");
        return EditorError::ElementNotFound;
    }

    const ElementNode& node = doc->node(store_.registry().byToken(target));
    const std::string* current = nullptr;
    if (name == "id") {
        if (!node.originalId.empty()) current = &node.originalId;
    } else {
        current = node.attributes.find(name);
    }
    if (!current) return EditorError::Ok;

    return commitOperation(makeSetAttributeOperation(target, name, current, nullptr));
}

EditorError EditorContext::deleteSelection() {
    clearError();
    const Document* doc = store_.document();
    if (!doc) {
        setError(EditorError::NoDocument, "no document is open");
        return EditorError::NoDocument;
    }
    if (!store_.hasSelection()) return EditorError::Ok;

    const std::vector<NodeIndex> selected = store_.selectedElements();
    const std::unordered_set<NodeIndex> selectedSet(selected.begin(), selected.end());

    std::vector<FragmentEntry> entries;
    for (const NodeIndex n : selected) {
        if (n == kInvalidNode || n == doc->root()) continue;
        bool folded = false;
        for (NodeIndex p = doc->node(n).parent; p != kInvalidNode; p = doc->node(p).parent) {
            if (selectedSet.count(p) != 0) {
                folded = true;
                break;
            }
        }
        if (!folded) entries.push_back(captureFragment(*doc, n));
    }
    if (entries.empty()) {
        setError(EditorError::InvalidOperation, "the document root cannot be deleted");
        return EditorError::InvalidOperation;
    }

    return commitOperation(makeDeleteOperation(std::move(entries)));
}

EditorError EditorContext::undo() {
    clearError();
    return history_.undo(*this);
}

EditorError EditorContext::redo() {
    clearError();
    return history_.redo(*this);
}

// =============================================================================
// Diagnostics
// =============================================================================

EditorStats EditorContext::getStats() const {
    EditorStats s;
    s.generation = static_cast<std::uint32_t>(store_.generation());
    s.elementCount = static_cast<std::uint32_t>(store_.registry().size());
    s.historySize = static_cast<std::uint32_t>(history_.getHistorySize());
    s.historyCursor = static_cast<std::uint32_t>(history_.getCursor());
    s.commitCount = commitCount_;
    s.lastParseMs = lastParseMs_;
    s.lastSerializeMs = lastSerializeMs_;
    s.lastCommitMs = lastCommitMs_;
    return s;
}

std::uint64_t EditorContext::getDocumentDigest() const {
    const Document* doc = store_.document();
    return doc ? documentDigest(*doc) : 0;
}

} // namespace svgcore
