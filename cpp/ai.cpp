#include "ai.hpp"
#include <limits>

const Direction ALL_DIRECTIONS[4] = {Direction::Up, Direction::Down, Direction::Left, Direction::Right};

// Evaluate the board reached after a move sequence
int evaluateBoard(const Board& board, int scoreGained, int highestTileBefore) {
    int score = 0;

    // Heavily reward total points scored (prefers combos)
    score += scoreGained * 20;

    // Reward for highest tile made (encourages big merges)
    score += (maxTile(board) - highestTileBefore) * 4;

    // Reward empty space (keep options open)
    score += emptyCount(board) * 100;

    if (gameOver(board)) score -= 20000; // Dead board
    return score;
}

int findBestMove(const Board& board, int searchDepth) {
    int bestMove = -1;
    int bestScore = std::numeric_limits<int>::min();
    const int highestTileBefore = maxTile(board);
    TileId scratch_id = 1; // simulated merges never reach the live game

    for (int first = 0; first < 4; ++first) {
        MoveOutcome afterFirst = applyMove(board, ALL_DIRECTIONS[first], scratch_id);
        if (!afterFirst.changed) continue;

        int seqScore = evaluateBoard(afterFirst.board, afterFirst.score_delta, highestTileBefore);
        if (searchDepth >= 2) {
            // Prefer first moves that enable the best follow-up
            int bestSecondScore = std::numeric_limits<int>::min();
            for (int second = 0; second < 4; ++second) {
                MoveOutcome afterSecond = applyMove(afterFirst.board, ALL_DIRECTIONS[second], scratch_id);
                if (!afterSecond.changed) continue;
                int s = evaluateBoard(afterSecond.board, afterFirst.score_delta + afterSecond.score_delta,
                                      highestTileBefore);
                if (s > bestSecondScore) bestSecondScore = s;
            }
            if (bestSecondScore != std::numeric_limits<int>::min()) seqScore = bestSecondScore;
        }

        if (seqScore > bestScore) {
            bestScore = seqScore;
            bestMove = first;
        }
    }
    return bestMove;
}
