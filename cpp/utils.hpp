#ifndef UTILS_HPP
#define UTILS_HPP

#include "game_defs.hpp" // For Board, Tile
#include "settings.hpp"  // For Settings
#include <map>           // For the powerup bag
#include <optional>
#include <random>        // For tile generation

// Generates a 'bag' of powerup kinds and their weights.
// Disabled kinds are left out so they can never be drawn.
std::map<TileKind, double> makeBag(const Settings& settings);

// Helper to pick a kind from the bag based on weights.
// Returns Number when the bag is empty or carries no weight.
TileKind pickKindFromBag(const std::map<TileKind, double>& bag, std::mt19937& rng_engine);

// 2 with probability NUMBER_TWO_PROBABILITY, else 4
int drawNumberValue(std::mt19937& rng_engine);

struct SpawnedTile {
    int index = -1;
    Tile tile;
};

// Places one tile in a uniformly chosen empty cell.
// Returns nothing when the board is full.
std::optional<SpawnedTile> spawnTile(Board& board, const Settings& settings,
                                     std::mt19937& rng_engine, TileId& next_id);

#endif // UTILS_HPP
