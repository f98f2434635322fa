#ifndef MERGE_HPP
#define MERGE_HPP

#include "game_defs.hpp" // For Board, Tile, Line, Direction

#include <vector>

// Lowercase names used in logs, undo labels and self-play output
const char* kindName(TileKind kind);
const char* directionName(Direction dir);

// Pretty-printer for the game board
void printBoard(const Board& board);

struct LineResult {
    Line cells;
    int score_delta = 0;
};

// Slides one line toward index 0 and merges pairs.
// Obstacles slide like any tile but never merge. Merged tiles are issued
// fresh ids from next_id and do not merge again within the same call.
LineResult compactLine(const Line& cells, TileId& next_id);

// Cell indices of line k, ordered so that the compaction target comes first.
std::vector<int> lineIndices(int size, Direction dir, int k);

Line readLine(const Board& board, const std::vector<int>& indices);
void writeLine(Board& board, const std::vector<int>& indices, const Line& cells);

struct MoveOutcome {
    Board board;
    int score_delta = 0;
    bool changed = false;
};

// Applies a directional move to a copy of the board. No spawning happens here.
MoveOutcome applyMove(const Board& board, Direction dir, TileId& next_id);

// Checks if the game is over: full board, only Number tiles, no equal neighbours
bool gameOver(const Board& board);

// --- Utility functions often needed by AI or game logic ---

int emptyCount(const Board& board);
std::vector<int> emptyIndices(const Board& board);

// Finds the highest tile value currently on the board
int maxTile(const Board& board);

// Calculates the sum of all tile values on the board
int boardSum(const Board& board);

// Next target value shown to the player: max(2048, 2 * highest tile)
int nextGoal(const Board& board);

#endif // MERGE_HPP
