#ifndef GAME_DEFS_HPP
#define GAME_DEFS_HPP

#include <cstdint>
#include <string>
#include <vector>

// Define fundamental types for clarity
using TileId = std::uint64_t; // 0 is reserved for "no tile"

enum class TileKind {
    Number,
    Bomb,    // Explodes 3x3
    Joker,   // Wildcard
    Surge,   // Clears row & column
    Shuffle, // Randomizes board positions
    Glass    // Tap to remove self
};

enum class Direction { Up, Down, Left, Right };

struct Tile {
    TileId id = 0;
    int value = 0;
    TileKind kind = TileKind::Number;

    bool empty() const { return id == 0; }
    bool operator==(const Tile& other) const {
        return id == other.id && value == other.value && kind == other.kind;
    }
    bool operator!=(const Tile& other) const { return !(*this == other); }
};

using Line = std::vector<Tile>; // One row or column, empty cells have id 0

// Square grid stored row-major: index = row * size + col
struct Board {
    int size = 0;
    std::vector<Tile> cells;

    Board() = default;
    explicit Board(int n) : size(n), cells(static_cast<size_t>(n * n)) {}

    Tile& at(int row, int col) { return cells[row * size + col]; }
    const Tile& at(int row, int col) const { return cells[row * size + col]; }

    bool operator==(const Board& other) const { return size == other.size && cells == other.cells; }
    bool operator!=(const Board& other) const { return !(*this == other); }
};

struct GameSnapshot {
    Board board;
    int score = 0;
    std::string label;
};

struct GameResult {
    int score = 0;
    int moves = 0;
    double duration = 0.0;  // seconds, as reported by the presentation clock
    int grid_size = 0;
    std::int64_t timestamp = 0; // unix seconds
};

// === Game Configuration ===
const int GRID_MIN = 3;
const int GRID_MAX = 8;
const int DEFAULT_GRID_SIZE = 4;
const int BASE_GOAL = 2048;

const double MAX_SPAWN_PROBABILITY = 0.4;   // 40% ceiling on powerup frequency
const double DEFAULT_SPAWN_PROBABILITY = 0.05;
const double MIN_POWERUP_WEIGHT = 1.0;
const double MAX_POWERUP_WEIGHT = 10.0;
const double NUMBER_TWO_PROBABILITY = 0.9;  // otherwise a 4 spawns

const int POWERUP_KIND_COUNT = 5;
// ==========================

// Bomb, Surge, Shuffle and Glass block merges and react to taps
inline bool isObstacle(TileKind kind) {
    return kind != TileKind::Number && kind != TileKind::Joker;
}

#endif // GAME_DEFS_HPP
