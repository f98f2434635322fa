#pragma once
#include "merge.hpp"

// All four directions in the order the advisor tries them
extern const Direction ALL_DIRECTIONS[4];

// Find the best direction for the board, planning up to two moves ahead.
// Spawns are not simulated. Returns the index into ALL_DIRECTIONS, or -1
// when no direction changes the board.
int findBestMove(const Board& board, int searchDepth = 2);
