#include "merge.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

const char* kindName(TileKind kind) {
    switch (kind) {
    case TileKind::Number: return "number";
    case TileKind::Bomb: return "bomb";
    case TileKind::Joker: return "joker";
    case TileKind::Surge: return "surge";
    case TileKind::Shuffle: return "shuffle";
    case TileKind::Glass: return "glass";
    }
    return "unknown";
}

const char* directionName(Direction dir) {
    switch (dir) {
    case Direction::Up: return "up";
    case Direction::Down: return "down";
    case Direction::Left: return "left";
    case Direction::Right: return "right";
    }
    return "unknown";
}

// Pretty-printer (tight ASCII)
void printBoard(const Board& board) {
    for (int row = 0; row < board.size; ++row) {
        for (int col = 0; col < board.size; ++col) {
            const Tile& t = board.at(row, col);
            if (t.empty())
                std::cout << std::setw(8) << '.';
            else if (t.kind == TileKind::Number)
                std::cout << std::setw(8) << t.value;
            else
                std::cout << std::setw(8) << kindName(t.kind);
        }
        std::cout << '\n';
    }
    std::cout << std::string(board.size * 8, '-') << "\n\n";
}

LineResult compactLine(const Line& cells, TileId& next_id) {
    Line dense;
    dense.reserve(cells.size());
    for (const Tile& t : cells) {
        if (!t.empty()) dense.push_back(t);
    }

    LineResult result;
    result.cells.reserve(cells.size());

    size_t i = 0;
    while (i < dense.size()) {
        const Tile& current = dense[i];
        if (i + 1 >= dense.size()) {
            result.cells.push_back(current);
            break;
        }
        const Tile& next = dense[i + 1];

        // Obstacles act as walls: emit and re-examine the neighbour on its own
        if (isObstacle(current.kind) || isObstacle(next.kind)) {
            result.cells.push_back(current);
            ++i;
            continue;
        }

        int merged_value = 0;
        if (current.kind == TileKind::Joker || next.kind == TileKind::Joker) {
            int base = std::max(current.value, next.value);
            merged_value = (base == 0 ? 2 : base) * 2;
        } else if (current.value == next.value) {
            merged_value = current.value * 2;
        }

        if (merged_value > 0) {
            Tile merged;
            merged.id = next_id++;
            merged.value = merged_value;
            merged.kind = TileKind::Number;
            result.cells.push_back(merged);
            result.score_delta += merged_value;
            i += 2;
        } else {
            result.cells.push_back(current);
            ++i;
        }
    }

    result.cells.resize(cells.size()); // pad with empty tiles
    return result;
}

std::vector<int> lineIndices(int size, Direction dir, int k) {
    std::vector<int> indices;
    indices.reserve(size);
    for (int j = 0; j < size; ++j) {
        switch (dir) {
        case Direction::Left: indices.push_back(k * size + j); break;
        case Direction::Right: indices.push_back(k * size + (size - 1 - j)); break;
        case Direction::Up: indices.push_back(j * size + k); break;
        case Direction::Down: indices.push_back((size - 1 - j) * size + k); break;
        }
    }
    return indices;
}

Line readLine(const Board& board, const std::vector<int>& indices) {
    Line line;
    line.reserve(indices.size());
    for (int idx : indices) line.push_back(board.cells[idx]);
    return line;
}

void writeLine(Board& board, const std::vector<int>& indices, const Line& cells) {
    if (cells.size() != indices.size()) {
        throw std::invalid_argument("writeLine: line length does not match index count");
    }
    for (size_t j = 0; j < indices.size(); ++j) board.cells[indices[j]] = cells[j];
}

MoveOutcome applyMove(const Board& board, Direction dir, TileId& next_id) {
    MoveOutcome outcome;
    outcome.board = Board(board.size);
    for (int k = 0; k < board.size; ++k) {
        std::vector<int> indices = lineIndices(board.size, dir, k);
        LineResult line = compactLine(readLine(board, indices), next_id);
        writeLine(outcome.board, indices, line.cells);
        outcome.score_delta += line.score_delta;
    }
    outcome.changed = outcome.board != board;
    return outcome;
}

bool gameOver(const Board& board) {
    for (const Tile& t : board.cells) {
        if (t.empty()) return false;
        // Any unconsumed powerup is an escape route
        if (t.kind != TileKind::Number) return false;
    }
    for (int r = 0; r < board.size; ++r) {
        for (int c = 0; c < board.size; ++c) {
            int v = board.at(r, c).value;
            if (c + 1 < board.size && board.at(r, c + 1).value == v) return false;
            if (r + 1 < board.size && board.at(r + 1, c).value == v) return false;
        }
    }
    return true;
}

int emptyCount(const Board& board) {
    return static_cast<int>(std::count_if(board.cells.begin(), board.cells.end(),
                                          [](const Tile& t) { return t.empty(); }));
}

std::vector<int> emptyIndices(const Board& board) {
    std::vector<int> indices;
    for (int i = 0; i < static_cast<int>(board.cells.size()); ++i) {
        if (board.cells[i].empty()) indices.push_back(i);
    }
    return indices;
}

int maxTile(const Board& board) {
    int max_val = 0;
    for (const Tile& t : board.cells) {
        if (!t.empty() && t.value > max_val) max_val = t.value;
    }
    return max_val;
}

int boardSum(const Board& board) {
    int sum = 0;
    for (const Tile& t : board.cells) sum += t.value;
    return sum;
}

int nextGoal(const Board& board) {
    return std::max(BASE_GOAL, maxTile(board) * 2);
}
