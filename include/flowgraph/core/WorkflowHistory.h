#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace flowgraph {

/// Bounded undo/redo stacks of full snapshots.
///
/// record() pushes onto the undo stack, evicting the oldest entry once the
/// capacity is exceeded, and clears the redo stack. undo()/redo() trade the
/// caller's current snapshot for the one on top of the opposite stack.
template <typename Snapshot>
class WorkflowHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 60;

    explicit WorkflowHistory(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    void record(Snapshot snapshot) {
        redo_.clear();
        pushBounded(undo_, std::move(snapshot));
    }

    /// @return the snapshot to restore, or std::nullopt when nothing can be undone
    std::optional<Snapshot> undo(Snapshot current) {
        if (undo_.empty()) {
            return std::nullopt;
        }
        Snapshot previous = std::move(undo_.back());
        undo_.pop_back();
        pushBounded(redo_, std::move(current));
        return previous;
    }

    /// @return the snapshot to restore, or std::nullopt when nothing can be redone
    std::optional<Snapshot> redo(Snapshot current) {
        if (redo_.empty()) {
            return std::nullopt;
        }
        Snapshot next = std::move(redo_.back());
        redo_.pop_back();
        pushBounded(undo_, std::move(current));
        return next;
    }

    bool canUndo() const { return !undo_.empty(); }
    bool canRedo() const { return !redo_.empty(); }
    size_t undoDepth() const { return undo_.size(); }
    size_t redoDepth() const { return redo_.size(); }
    size_t capacity() const { return capacity_; }

    void clear() {
        undo_.clear();
        redo_.clear();
    }

private:
    void pushBounded(std::deque<Snapshot>& stack, Snapshot snapshot) {
        if (capacity_ == 0) {
            return;
        }
        stack.push_back(std::move(snapshot));
        while (stack.size() > capacity_) {
            stack.pop_front();
        }
    }

    std::deque<Snapshot> undo_;
    std::deque<Snapshot> redo_;
    size_t capacity_;
};

}  // namespace flowgraph
