#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "game_defs.hpp"

struct PowerupConfig {
    bool enabled = true;
    double weight = 5.0; // 1.0 to 10.0
};

struct Settings {
    int grid_size = DEFAULT_GRID_SIZE;

    bool allow_undo_redo = true; // false = hardcore mode, also disables powerup spawns

    // Powerups master control
    bool master_powerups = true;
    double spawn_probability = DEFAULT_SPAWN_PROBABILITY;

    // Individual powerup configs
    PowerupConfig bomb{true, 5.0};
    PowerupConfig joker{true, 3.0};
    PowerupConfig surge{true, 3.0};
    PowerupConfig shuffle{true, 2.0};
    PowerupConfig glass{true, 6.0};
};

// Kinds that can be drawn by the spawner, in draw order
extern const TileKind POWERUP_KINDS[POWERUP_KIND_COUNT];

const PowerupConfig& powerupConfig(const Settings& settings, TileKind kind);
PowerupConfig& powerupConfig(Settings& settings, TileKind kind);

// Hardcore mode or a disabled master flag means only Number tiles spawn
bool powerupsActive(const Settings& settings);

// Replaces every out-of-range or non-finite field with its default.
// Returns the number of fields that were replaced.
int sanitizeSettings(Settings& settings);

#endif // SETTINGS_HPP
