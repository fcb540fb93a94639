#pragma once

#include "svgcore/history/history_types.h"
#include "svgcore/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace svgcore {

// Linear undo/redo stack. history_[0, cursor_) is undoable, the rest redoable.
class HistoryManager {
public:
    explicit HistoryManager(std::size_t capacity = 50);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Boundary calls are no-ops returning Ok. On a failed action the cursor stays put.
    EditorError undo(OperationApplier& applier);
    EditorError redo(OperationApplier& applier);

    // Appends and discards the redo tail; evicts the oldest entry past capacity.
    void push(Operation&& op);
    void clear();

    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    std::size_t getCapacity() const noexcept { return capacity_; }
    void setCapacity(std::size_t capacity);
    std::uint32_t getGeneration() const noexcept { return historyGeneration_; }
    bool isReplaying() const noexcept { return replaying_; }

    const Operation* peekUndo() const noexcept;
    const Operation* peekRedo() const noexcept;
    std::string peekUndoLabel() const;
    std::string peekRedoLabel() const;
    const Operation& entryAt(std::size_t i) const { return history_[i]; }

private:
    void evictOverflow();

    std::vector<Operation> history_;
    std::size_t cursor_ = 0;
    std::size_t capacity_ = 50;
    std::uint32_t historyGeneration_ = 0;
    bool replaying_ = false;
};

} // namespace svgcore
