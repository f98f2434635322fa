#include "game.hpp"
#include "ai.hpp"       // For findBestMove
#include "merge.hpp"    // For applyMove, gameOver, nextGoal, kindName
#include "powerups.hpp" // For activatePowerup
#include "utils.hpp"    // For spawnTile
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <utility>

Game::Game(const Settings& settings, unsigned int seed) : settings_(settings), rng_engine_(seed) {
    sanitizeSettings(settings_);
    new_game();
}

void Game::reset() {
    finish_current_game();
    new_game();
}

void Game::new_game() {
    board_ = Board(settings_.grid_size);
    score_ = 0;
    moves_ = 0;
    elapsed_ = 0.0;
    history_.clear();
    game_over_ = false;
    result_emitted_ = false;
    paused_ = false;
    high_score_broken_ = false;

    spawnTile(board_, settings_, rng_engine_, next_id_);
    spawnTile(board_, settings_, rng_engine_, next_id_);

    clock_running_ = true;
}

void Game::finish_current_game() {
    if (result_emitted_) return;
    if (score_ <= 0 && moves_ <= 0) return;

    GameResult result;
    result.score = score_;
    result.moves = moves_;
    result.duration = elapsed_;
    result.grid_size = board_.size;
    result.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();

    result_emitted_ = true;
    last_result_ = result;
    std::cout << "[ENGINE] Game finished. Score=" << result.score << ", Moves=" << result.moves
              << ", Grid=" << result.grid_size << "x" << result.grid_size << std::endl;
    if (on_result_) on_result_(result);
}

void Game::record_snapshot(const char* label) {
    if (!settings_.allow_undo_redo) return;
    GameSnapshot snap;
    snap.board = board_;
    snap.score = score_;
    snap.label = label;
    history_.record(std::move(snap));
}

MutationResult Game::move(Direction dir) {
    MutationResult result;
    if (game_over_ || paused_) return result;

    MoveOutcome outcome = applyMove(board_, dir, next_id_);
    if (!outcome.changed) return result; // pressing into a wall costs nothing

    record_snapshot((std::string("Move ") + directionName(dir)).c_str());
    ++moves_;
    board_ = std::move(outcome.board);
    score_ += outcome.score_delta;

    spawnTile(board_, settings_, rng_engine_, next_id_);
    update_high_scores();

    result.changed = true;
    result.score_delta = outcome.score_delta;
    result.game_ended = check_game_over();
    return result;
}

MutationResult Game::activate(int index) {
    MutationResult result;
    if (game_over_ || paused_) return result;
    if (index < 0 || index >= static_cast<int>(board_.cells.size())) {
        std::cerr << "[ENGINE] Tap index " << index << " outside a " << board_.size << "x" << board_.size
                  << " board." << std::endl;
        return result;
    }

    const Tile& tile = board_.cells[index];
    if (tile.empty() || !isObstacle(tile.kind)) return result;

    record_snapshot(powerupLabel(tile.kind));
    result.changed = activatePowerup(board_, index, rng_engine_);
    result.game_ended = check_game_over();
    return result;
}

MutationResult Game::undo() {
    MutationResult result;
    if (!settings_.allow_undo_redo || paused_ || game_over_) return result;

    GameSnapshot current;
    current.board = board_;
    current.score = score_;
    current.label = "Undo";
    std::optional<GameSnapshot> prev = history_.undo(std::move(current));
    if (!prev) return result;

    result.changed = true;
    result.score_delta = prev->score - score_;
    board_ = std::move(prev->board);
    score_ = prev->score;
    if (moves_ > 0) --moves_;
    return result;
}

MutationResult Game::redo() {
    MutationResult result;
    if (!settings_.allow_undo_redo || paused_ || game_over_) return result;

    GameSnapshot current;
    current.board = board_;
    current.score = score_;
    current.label = "Redo";
    std::optional<GameSnapshot> next = history_.redo(std::move(current));
    if (!next) return result;

    result.changed = true;
    result.score_delta = next->score - score_;
    board_ = std::move(next->board);
    score_ = next->score;
    ++moves_;
    return result;
}

bool Game::check_game_over() {
    if (game_over_ || !gameOver(board_)) return false;

    clock_running_ = false;
    finish_current_game();
    game_over_ = true;
    std::cout << "[ENGINE] Game over." << std::endl;
    return true;
}

void Game::pause() {
    if (game_over_) return;
    paused_ = true;
    clock_running_ = false;
}

void Game::resume() {
    if (game_over_) return;
    paused_ = false;
    clock_running_ = true;
}

void Game::tick(double seconds) {
    if (!clock_running_ || paused_ || game_over_ || !(seconds > 0.0)) return;
    elapsed_ += seconds;
}

bool Game::set_grid_size(int size) {
    if (size < GRID_MIN || size > GRID_MAX) {
        std::cerr << "[ENGINE] Grid size " << size << " not in [" << GRID_MIN << ", " << GRID_MAX << "]."
                  << std::endl;
        return false;
    }
    if (size == board_.size) return false;

    finish_current_game();
    settings_.grid_size = size;
    new_game();
    return true;
}

void Game::set_settings(Settings settings) {
    sanitizeSettings(settings);
    const int requested_size = settings.grid_size;
    settings.grid_size = settings_.grid_size;
    settings_ = settings;
    set_grid_size(requested_size);
}

int Game::best_score() const {
    auto it = best_scores_.find(board_.size);
    return it == best_scores_.end() ? 0 : it->second;
}

void Game::set_best_score(int grid_size, int score) {
    best_scores_[grid_size] = score;
}

void Game::reset_high_scores() {
    best_scores_.clear();
}

void Game::update_high_scores() {
    int& best = best_scores_[board_.size];
    const int old_best = best;
    if (score_ <= old_best) return;

    best = score_;
    if (old_best > 0 && !high_score_broken_) {
        high_score_broken_ = true;
        std::cout << "[ENGINE] New best score " << score_ << " on " << board_.size << "x" << board_.size
                  << std::endl;
    }
}

int Game::next_goal() const {
    return nextGoal(board_);
}

GameSnapshot Game::snapshot_for_persistence() const {
    GameSnapshot snap;
    snap.board = board_;
    snap.score = score_;
    snap.label = "Current";
    return snap;
}

std::vector<int> Game::get_flat_values() const {
    std::vector<int> flat_state;
    flat_state.reserve(board_.cells.size());
    for (const Tile& t : board_.cells) flat_state.push_back(t.value);
    return flat_state;
}

std::vector<TileKind> Game::get_flat_kinds() const {
    std::vector<TileKind> flat_kinds;
    flat_kinds.reserve(board_.cells.size());
    for (const Tile& t : board_.cells) flat_kinds.push_back(t.kind);
    return flat_kinds;
}

bool Game::set_full_game_state(const Board& board, int score) {
    if (board.size != settings_.grid_size || board.cells.size() != static_cast<size_t>(board.size * board.size)) {
        std::cerr << "[ENGINE] Error: board of size " << board.size << " does not fit a " << settings_.grid_size
                  << "x" << settings_.grid_size << " game." << std::endl;
        return false;
    }

    std::set<TileId> ids;
    TileId highest = 0;
    for (size_t i = 0; i < board.cells.size(); ++i) {
        const Tile& t = board.cells[i];
        if (t.empty()) {
            if (t != Tile()) {
                std::cerr << "[ENGINE] Error: empty cell " << i << " carries a value or kind." << std::endl;
                return false;
            }
            continue;
        }
        // Numbers are positive, powerups (Joker included) carry no value
        const bool bad_value = (t.kind == TileKind::Number) ? t.value <= 0 : t.value != 0;
        if (bad_value) {
            std::cerr << "[ENGINE] Error: " << kindName(t.kind) << " tile at cell " << i << " has value "
                      << t.value << "." << std::endl;
            return false;
        }
        if (!ids.insert(t.id).second) {
            std::cerr << "[ENGINE] Error: tile id " << t.id << " appears twice." << std::endl;
            return false;
        }
        if (t.id > highest) highest = t.id;
    }

    board_ = board;
    score_ = score;
    history_.clear();
    if (next_id_ <= highest) next_id_ = highest + 1;

    // An installed terminal board is over without emitting a result
    game_over_ = gameOver(board_);
    result_emitted_ = game_over_;
    clock_running_ = !game_over_ && !paused_;
    return true;
}

int Game::suggest_move() const {
    if (game_over_) return -1;
    return findBestMove(board_, 2);
}
