// tests/test_history.cpp

#include <gtest/gtest.h>

#include "board_builder.hpp"
#include "history.hpp"

static GameSnapshot snap(const std::vector<std::string>& tokens, int score, const char* label) {
    GameSnapshot s;
    s.board = makeBoard(3, tokens);
    s.score = score;
    s.label = label;
    return s;
}

TEST(History, EmptyStacksReturnNothing) {
    History h;
    EXPECT_FALSE(h.undo(GameSnapshot()).has_value());
    EXPECT_FALSE(h.redo(GameSnapshot()).has_value());
    EXPECT_FALSE(h.can_redo());
}

TEST(History, UndoThenRedoWalksBothStacks) {
    History h;
    GameSnapshot before = snap({"2", "2", ".", ".", ".", ".", ".", ".", "."}, 0, "Move left");
    GameSnapshot after = snap({"4", ".", ".", ".", "2", ".", ".", ".", "."}, 4, "Undo");
    h.record(before);

    auto restored = h.undo(after);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->board, before.board);
    EXPECT_EQ(restored->score, 0);
    EXPECT_EQ(h.undo_size(), 0u);
    EXPECT_EQ(h.redo_size(), 1u);

    auto replayed = h.redo(*restored);
    ASSERT_TRUE(replayed.has_value());
    EXPECT_EQ(replayed->board, after.board);
    EXPECT_EQ(replayed->score, 4);
    EXPECT_EQ(h.undo_size(), 1u);
    EXPECT_EQ(h.redo_size(), 0u);
}

TEST(History, NewRecordInvalidatesRedo) {
    History h;
    h.record(snap({"2", ".", ".", ".", ".", ".", ".", ".", "."}, 0, "Move up"));
    h.undo(snap({"4", ".", ".", ".", ".", ".", ".", ".", "."}, 4, "Undo"));
    ASSERT_TRUE(h.can_redo());

    h.record(snap({"2", ".", ".", ".", ".", ".", ".", ".", "."}, 0, "Glass Removed"));
    EXPECT_FALSE(h.can_redo());
    EXPECT_EQ(h.undo_stack().back().label, "Glass Removed");
}

TEST(History, SnapshotsAreIndependentCopies) {
    History h;
    GameSnapshot s = snap({"2", ".", ".", ".", ".", ".", ".", ".", "."}, 0, "Move down");
    h.record(s);
    s.board.cells[0] = Tile();
    EXPECT_EQ(h.undo_stack().back().board.cells[0].value, 2);
}

TEST(History, ClearEmptiesBothStacks) {
    History h;
    h.record(GameSnapshot());
    h.record(GameSnapshot());
    h.undo(GameSnapshot());
    h.clear();
    EXPECT_FALSE(h.can_undo());
    EXPECT_FALSE(h.can_redo());
}
