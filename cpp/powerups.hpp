#ifndef POWERUPS_HPP
#define POWERUPS_HPP

#include "game_defs.hpp"
#include <random>

void activateBomb(Board& board, int index);
void activateSurge(Board& board, int index);
void activateGlass(Board& board, int index);

// Consumes the Shuffle tile and scatters every other tile over a random
// set of cells. Tile ids are preserved.
void activateShuffle(Board& board, int index, std::mt19937& rng_engine);

// Dispatches on the tile at index. Returns false (and leaves the board
// untouched) for empty cells, Number and Joker tiles.
bool activatePowerup(Board& board, int index, std::mt19937& rng_engine);

// Undo-history label for tapping a tile of the given kind
const char* powerupLabel(TileKind kind);

#endif // POWERUPS_HPP
