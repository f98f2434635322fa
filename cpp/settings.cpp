#include "settings.hpp"
#include "merge.hpp" // For kindName
#include <cmath>
#include <iostream>
#include <stdexcept>

const TileKind POWERUP_KINDS[POWERUP_KIND_COUNT] = {
    TileKind::Bomb, TileKind::Joker, TileKind::Surge, TileKind::Shuffle, TileKind::Glass};

const PowerupConfig& powerupConfig(const Settings& settings, TileKind kind) {
    switch (kind) {
    case TileKind::Bomb: return settings.bomb;
    case TileKind::Joker: return settings.joker;
    case TileKind::Surge: return settings.surge;
    case TileKind::Shuffle: return settings.shuffle;
    case TileKind::Glass: return settings.glass;
    case TileKind::Number: break;
    }
    throw std::invalid_argument("powerupConfig: Number tiles have no powerup config");
}

PowerupConfig& powerupConfig(Settings& settings, TileKind kind) {
    switch (kind) {
    case TileKind::Bomb: return settings.bomb;
    case TileKind::Joker: return settings.joker;
    case TileKind::Surge: return settings.surge;
    case TileKind::Shuffle: return settings.shuffle;
    case TileKind::Glass: return settings.glass;
    case TileKind::Number: break;
    }
    throw std::invalid_argument("powerupConfig: Number tiles have no powerup config");
}

bool powerupsActive(const Settings& settings) {
    return settings.allow_undo_redo && settings.master_powerups;
}

int sanitizeSettings(Settings& settings) {
    const Settings defaults{};
    int replaced = 0;

    if (settings.grid_size < GRID_MIN || settings.grid_size > GRID_MAX) {
        std::cerr << "[SETTINGS] grid_size " << settings.grid_size << " out of range, using "
                  << defaults.grid_size << std::endl;
        settings.grid_size = defaults.grid_size;
        ++replaced;
    }

    if (!std::isfinite(settings.spawn_probability) || settings.spawn_probability < 0.0 ||
        settings.spawn_probability > MAX_SPAWN_PROBABILITY) {
        std::cerr << "[SETTINGS] spawn_probability " << settings.spawn_probability
                  << " out of range, using " << defaults.spawn_probability << std::endl;
        settings.spawn_probability = defaults.spawn_probability;
        ++replaced;
    }

    for (TileKind kind : POWERUP_KINDS) {
        PowerupConfig& cfg = powerupConfig(settings, kind);
        if (!std::isfinite(cfg.weight) || cfg.weight < MIN_POWERUP_WEIGHT || cfg.weight > MAX_POWERUP_WEIGHT) {
            double fallback = powerupConfig(defaults, kind).weight;
            std::cerr << "[SETTINGS] " << kindName(kind) << " weight " << cfg.weight
                      << " out of range, using " << fallback << std::endl;
            cfg.weight = fallback;
            ++replaced;
        }
    }
    return replaced;
}
