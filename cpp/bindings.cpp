#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "ai.hpp"
#include "game.hpp"
#include "game_defs.hpp"
#include "settings.hpp"

#include <iostream>

namespace py = pybind11;

namespace {

void read_powerup(const py::dict& d, const char* key, PowerupConfig& cfg) {
    if (!d.contains(key)) return;
    py::dict entry = d[key].cast<py::dict>();
    if (entry.contains("enabled")) cfg.enabled = entry["enabled"].cast<bool>();
    if (entry.contains("weight")) cfg.weight = entry["weight"].cast<double>();
}

// Settings come from the persistence blob on the Python side. Anything that
// fails to convert drops the whole blob back to defaults.
Settings settings_from_dict(const py::dict& d) {
    Settings settings;
    try {
        if (d.contains("grid_size")) settings.grid_size = d["grid_size"].cast<int>();
        if (d.contains("allow_undo_redo")) settings.allow_undo_redo = d["allow_undo_redo"].cast<bool>();
        if (d.contains("master_powerups")) settings.master_powerups = d["master_powerups"].cast<bool>();
        if (d.contains("spawn_probability")) settings.spawn_probability = d["spawn_probability"].cast<double>();
        read_powerup(d, "bomb", settings.bomb);
        read_powerup(d, "joker", settings.joker);
        read_powerup(d, "surge", settings.surge);
        read_powerup(d, "shuffle", settings.shuffle);
        read_powerup(d, "glass", settings.glass);
    } catch (const std::exception& e) { // cast_error, type_error, error_already_set
        std::cerr << "[SETTINGS] Failed to load settings, using defaults: " << e.what() << std::endl;
        return Settings();
    }
    sanitizeSettings(settings);
    return settings;
}

py::dict powerup_to_dict(const PowerupConfig& cfg) {
    py::dict d;
    d["enabled"] = cfg.enabled;
    d["weight"] = cfg.weight;
    return d;
}

py::dict settings_to_dict(const Settings& s) {
    py::dict d;
    d["grid_size"] = s.grid_size;
    d["allow_undo_redo"] = s.allow_undo_redo;
    d["master_powerups"] = s.master_powerups;
    d["spawn_probability"] = s.spawn_probability;
    d["bomb"] = powerup_to_dict(s.bomb);
    d["joker"] = powerup_to_dict(s.joker);
    d["surge"] = powerup_to_dict(s.surge);
    d["shuffle"] = powerup_to_dict(s.shuffle);
    d["glass"] = powerup_to_dict(s.glass);
    return d;
}

} // namespace

PYBIND11_MODULE(_glass_engine, m) {
    m.doc() = "Pybind11 bindings for the C++ powerup 2048 board engine";

    m.attr("GRID_MIN") = py::int_(GRID_MIN);
    m.attr("GRID_MAX") = py::int_(GRID_MAX);

    py::enum_<Direction>(m, "Direction")
        .value("UP", Direction::Up)
        .value("DOWN", Direction::Down)
        .value("LEFT", Direction::Left)
        .value("RIGHT", Direction::Right);

    py::enum_<TileKind>(m, "TileKind")
        .value("NUMBER", TileKind::Number)
        .value("BOMB", TileKind::Bomb)
        .value("JOKER", TileKind::Joker)
        .value("SURGE", TileKind::Surge)
        .value("SHUFFLE", TileKind::Shuffle)
        .value("GLASS", TileKind::Glass);

    py::class_<PowerupConfig>(m, "PowerupConfig")
        .def(py::init<>())
        .def_readwrite("enabled", &PowerupConfig::enabled)
        .def_readwrite("weight", &PowerupConfig::weight);

    py::class_<Settings>(m, "Settings")
        .def(py::init<>())
        .def_readwrite("grid_size", &Settings::grid_size)
        .def_readwrite("allow_undo_redo", &Settings::allow_undo_redo)
        .def_readwrite("master_powerups", &Settings::master_powerups)
        .def_readwrite("spawn_probability", &Settings::spawn_probability)
        .def_readwrite("bomb", &Settings::bomb)
        .def_readwrite("joker", &Settings::joker)
        .def_readwrite("surge", &Settings::surge)
        .def_readwrite("shuffle", &Settings::shuffle)
        .def_readwrite("glass", &Settings::glass);

    m.def("settings_from_dict", &settings_from_dict,
          "Builds Settings from a persisted dict, falling back to defaults on bad data.", py::arg("data"));
    m.def("settings_to_dict", &settings_to_dict, "Converts Settings to a plain dict for persistence.",
          py::arg("settings"));

    py::class_<MutationResult>(m, "MutationResult")
        .def_readonly("changed", &MutationResult::changed)
        .def_readonly("score_delta", &MutationResult::score_delta)
        .def_readonly("game_ended", &MutationResult::game_ended);

    py::class_<GameResult>(m, "GameResult")
        .def_readonly("score", &GameResult::score)
        .def_readonly("moves", &GameResult::moves)
        .def_readonly("duration", &GameResult::duration)
        .def_readonly("grid_size", &GameResult::grid_size)
        .def_readonly("timestamp", &GameResult::timestamp);

    py::class_<Game>(m, "Game")
        .def(py::init<>())
        .def(py::init<const Settings&, unsigned int>(), py::arg("settings"), py::arg("seed"))
        .def("reset", &Game::reset, "Finishes the current game and starts a new one.")
        .def("move", &Game::move, "Slides every tile in the given direction.", py::arg("direction"))
        .def("activate", &Game::activate, "Taps the powerup at a cell index.", py::arg("index"))
        .def("undo", &Game::undo)
        .def("redo", &Game::redo)
        .def("is_game_over", &Game::is_game_over, "Checks if the game is over.")
        .def("is_paused", &Game::is_paused)
        .def("pause", &Game::pause)
        .def("resume", &Game::resume)
        .def("tick", &Game::tick, "Advances the session clock.", py::arg("seconds"))
        .def("set_grid_size", &Game::set_grid_size, py::arg("size"))
        .def("set_settings", &Game::set_settings, py::arg("settings"))
        .def_property_readonly("settings", &Game::settings)
        .def_property_readonly("score", &Game::score)
        .def_property_readonly("moves", &Game::moves)
        .def_property_readonly("grid_size", &Game::grid_size)
        .def_property_readonly("elapsed", &Game::elapsed)
        .def("best_score", &Game::best_score)
        .def("set_best_score", &Game::set_best_score, py::arg("grid_size"), py::arg("score"))
        .def("reset_high_scores", &Game::reset_high_scores)
        .def("new_high_score", &Game::new_high_score)
        .def("next_goal", &Game::next_goal)
        .def("can_undo", [](const Game& g) { return g.history().can_undo(); })
        .def("can_redo", [](const Game& g) { return g.history().can_redo(); })
        .def("set_result_callback", &Game::set_result_callback,
             "Registers a callable receiving the GameResult of each finished game.", py::arg("callback"))
        .def("last_result", &Game::last_result)
        .def("get_flat_values", &Game::get_flat_values,
             "Returns tile values row-major (0 for empty cells and non-Joker powerups).")
        .def("get_flat_kinds", &Game::get_flat_kinds, "Returns tile kinds row-major.")
        .def("suggest_move", [](const Game& g) -> py::object {
                 int idx = g.suggest_move();
                 if (idx < 0) return py::none();
                 return py::cast(ALL_DIRECTIONS[idx]);
             },
             "Gets a direction suggestion from the move advisor, or None.");
}
