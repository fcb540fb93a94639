#include "svgcore/history/history_manager.h"
#include "svgcore/core/logging.h"

namespace svgcore {

HistoryManager::HistoryManager(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    historyGeneration_++;
}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

void HistoryManager::push(Operation&& op) {
    if (replaying_) {
        SVGCORE_LOG_WARN("history push ignored during replay: %s", op.describe().c_str());
        return;
    }
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(op));
    cursor_ = history_.size();
    evictOverflow();
    historyGeneration_++;
}

void HistoryManager::setCapacity(std::size_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
    if (history_.size() > capacity_) {
        evictOverflow();
        historyGeneration_++;
    }
}

void HistoryManager::evictOverflow() {
    if (history_.size() <= capacity_) return;
    const std::size_t excess = history_.size() - capacity_;
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(excess));
    cursor_ = cursor_ > excess ? cursor_ - excess : 0;
}

EditorError HistoryManager::undo(OperationApplier& applier) {
    if (!canUndo()) return EditorError::Ok;
    // A copy: a listener reached during replay may clear the stack.
    const Operation op = history_[cursor_ - 1];
    const std::uint32_t generation = historyGeneration_;

    replaying_ = true;
    const EditorError err = applier.applyOperation(op, false);
    replaying_ = false;

    if (err != EditorError::Ok) {
        SVGCORE_LOG_WARN("undo failed for %s: %s", op.describe().c_str(), editorErrorName(err));
        return err;
    }
    if (historyGeneration_ != generation) {
        SVGCORE_LOG_DEBUG("history reset during undo of %s; cursor left as is", op.describe().c_str());
        return EditorError::Ok;
    }
    cursor_--;
    historyGeneration_++;
    return EditorError::Ok;
}

EditorError HistoryManager::redo(OperationApplier& applier) {
    if (!canRedo()) return EditorError::Ok;
    // A copy: a listener reached during replay may clear the stack.
    const Operation op = history_[cursor_];
    const std::uint32_t generation = historyGeneration_;

    replaying_ = true;
    const EditorError err = applier.applyOperation(op, true);
    replaying_ = false;

    if (err != EditorError::Ok) {
        SVGCORE_LOG_WARN("redo failed for %s: %s", op.describe().c_str(), editorErrorName(err));
        return err;
    }
    if (historyGeneration_ != generation) {
        SVGCORE_LOG_DEBUG("history reset during redo of %s; cursor left as is", op.describe().c_str());
        return EditorError::Ok;
    }
    cursor_++;
    historyGeneration_++;
    return EditorError::Ok;
}

const Operation* HistoryManager::peekUndo() const noexcept {
    return canUndo() ? &history_[cursor_ - 1] : nullptr;
}

const Operation* HistoryManager::peekRedo() const noexcept {
    return canRedo() ? &history_[cursor_] : nullptr;
}

std::string HistoryManager::peekUndoLabel() const {
    const Operation* op = peekUndo();
    return op ? op->label : std::string();
}

std::string HistoryManager::peekRedoLabel() const {
    const Operation* op = peekRedo();
    return op ? op->label : std::string();
}

} // namespace svgcore
