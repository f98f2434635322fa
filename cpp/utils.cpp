#include "utils.hpp"
#include "merge.hpp"    // For emptyIndices
#include <vector>       // For std::discrete_distribution

std::map<TileKind, double> makeBag(const Settings& settings) {
    std::map<TileKind, double> bag;
    for (TileKind kind : POWERUP_KINDS) {
        const PowerupConfig& cfg = powerupConfig(settings, kind);
        if (cfg.enabled && cfg.weight > 0.0) {
            bag[kind] = cfg.weight;
        }
    }
    return bag;
}

TileKind pickKindFromBag(const std::map<TileKind, double>& bag, std::mt19937& rng_engine) {
    std::vector<TileKind> kinds;
    std::vector<double> weights;
    double total = 0.0;
    for (const auto& pair : bag) {
        kinds.push_back(pair.first);
        weights.push_back(pair.second);
        total += pair.second;
    }
    if (kinds.empty() || total <= 0.0) {
        return TileKind::Number;
    }

    std::discrete_distribution<> dist(weights.begin(), weights.end());
    return kinds[dist(rng_engine)];
}

int drawNumberValue(std::mt19937& rng_engine) {
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    return roll(rng_engine) < NUMBER_TWO_PROBABILITY ? 2 : 4;
}

std::optional<SpawnedTile> spawnTile(Board& board, const Settings& settings,
                                     std::mt19937& rng_engine, TileId& next_id) {
    std::vector<int> empty = emptyIndices(board);
    if (empty.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, empty.size() - 1);
    SpawnedTile spawned;
    spawned.index = empty[pick(rng_engine)];

    TileKind kind = TileKind::Number;
    if (powerupsActive(settings)) {
        std::uniform_real_distribution<double> roll(0.0, 1.0);
        if (roll(rng_engine) < settings.spawn_probability) {
            kind = pickKindFromBag(makeBag(settings), rng_engine);
        }
    }

    spawned.tile.id = next_id++;
    spawned.tile.kind = kind;
    spawned.tile.value = (kind == TileKind::Number) ? drawNumberValue(rng_engine) : 0;

    board.cells[spawned.index] = spawned.tile;
    return spawned;
}
