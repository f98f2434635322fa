#include "powerups.hpp"
#include <algorithm>
#include <numeric>
#include <vector>

void activateBomb(Board& board, int index) {
    const int row = index / board.size;
    const int col = index % board.size;
    for (int r = row - 1; r <= row + 1; ++r) {
        for (int c = col - 1; c <= col + 1; ++c) {
            if (r >= 0 && r < board.size && c >= 0 && c < board.size) {
                board.at(r, c) = Tile();
            }
        }
    }
}

void activateSurge(Board& board, int index) {
    const int row = index / board.size;
    const int col = index % board.size;
    for (int c = 0; c < board.size; ++c) board.at(row, c) = Tile();
    for (int r = 0; r < board.size; ++r) board.at(r, col) = Tile();
}

void activateGlass(Board& board, int index) {
    board.cells[index] = Tile();
}

void activateShuffle(Board& board, int index, std::mt19937& rng_engine) {
    std::vector<Tile> tiles;
    for (int i = 0; i < static_cast<int>(board.cells.size()); ++i) {
        if (i != index && !board.cells[i].empty()) tiles.push_back(board.cells[i]);
    }
    std::shuffle(tiles.begin(), tiles.end(), rng_engine);

    std::vector<int> targets(board.cells.size());
    std::iota(targets.begin(), targets.end(), 0);
    std::shuffle(targets.begin(), targets.end(), rng_engine);

    std::fill(board.cells.begin(), board.cells.end(), Tile());
    for (size_t i = 0; i < tiles.size(); ++i) {
        board.cells[targets[i]] = tiles[i];
    }
}

bool activatePowerup(Board& board, int index, std::mt19937& rng_engine) {
    if (index < 0 || index >= static_cast<int>(board.cells.size())) return false;
    const Tile& tile = board.cells[index];
    if (tile.empty()) return false;

    switch (tile.kind) {
    case TileKind::Bomb: activateBomb(board, index); return true;
    case TileKind::Surge: activateSurge(board, index); return true;
    case TileKind::Glass: activateGlass(board, index); return true;
    case TileKind::Shuffle: activateShuffle(board, index, rng_engine); return true;
    case TileKind::Number:
    case TileKind::Joker:
        break;
    }
    return false;
}

const char* powerupLabel(TileKind kind) {
    switch (kind) {
    case TileKind::Bomb: return "Bomb Used";
    case TileKind::Surge: return "Surge Used";
    case TileKind::Glass: return "Glass Removed";
    case TileKind::Shuffle: return "Shuffle Used";
    case TileKind::Number:
    case TileKind::Joker:
        break;
    }
    return "";
}
