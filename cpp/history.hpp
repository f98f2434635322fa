#ifndef HISTORY_HPP
#define HISTORY_HPP

#include "game_defs.hpp"
#include <optional>
#include <vector>

// Undo/redo stacks of full board copies
class History {
public:
    // Pushes onto the undo stack and invalidates the redo stack
    void record(GameSnapshot snapshot);

    // Pops the undo stack and pushes `current` onto the redo stack.
    // Returns the snapshot to restore, or nothing when there is no history.
    std::optional<GameSnapshot> undo(GameSnapshot current);
    std::optional<GameSnapshot> redo(GameSnapshot current);

    void clear();

    bool can_undo() const { return !undo_stack_.empty(); }
    bool can_redo() const { return !redo_stack_.empty(); }
    size_t undo_size() const { return undo_stack_.size(); }
    size_t redo_size() const { return redo_stack_.size(); }
    const std::vector<GameSnapshot>& undo_stack() const { return undo_stack_; }

private:
    std::vector<GameSnapshot> undo_stack_;
    std::vector<GameSnapshot> redo_stack_;
};

#endif // HISTORY_HPP
