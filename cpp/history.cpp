#include "history.hpp"
#include <utility>

void History::record(GameSnapshot snapshot) {
    undo_stack_.push_back(std::move(snapshot));
    redo_stack_.clear();
}

std::optional<GameSnapshot> History::undo(GameSnapshot current) {
    if (undo_stack_.empty()) return std::nullopt;
    GameSnapshot prev = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    redo_stack_.push_back(std::move(current));
    return prev;
}

std::optional<GameSnapshot> History::redo(GameSnapshot current) {
    if (redo_stack_.empty()) return std::nullopt;
    GameSnapshot next = std::move(redo_stack_.back());
    redo_stack_.pop_back();
    undo_stack_.push_back(std::move(current));
    return next;
}

void History::clear() {
    undo_stack_.clear();
    redo_stack_.clear();
}
