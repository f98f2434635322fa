#ifndef GAME_HPP
#define GAME_HPP

#include "game_defs.hpp" // For Board, Tile, GameSnapshot, GameResult
#include "settings.hpp"  // For Settings
#include "history.hpp"   // For History
#include <functional>
#include <map>
#include <optional>
#include <random>       // For std::mt19937
#include <vector>

// What a mutation did, so callers can animate without re-deriving it
struct MutationResult {
    bool changed = false;
    int score_delta = 0;
    bool game_ended = false;
};

class Game {
public:
    using ResultCallback = std::function<void(const GameResult&)>;

    explicit Game(const Settings& settings = Settings(), unsigned int seed = std::random_device{}());

    // Finishes the running game (emitting its result unless it already ended)
    // and starts a new one.
    void reset();
    // Starts a fresh board without emitting a result
    void new_game();
    // Emits a GameResult if the game has any score or moves.
    // At most one result is emitted per game.
    void finish_current_game();

    MutationResult move(Direction dir);
    MutationResult activate(int index);
    MutationResult undo();
    MutationResult redo();

    bool is_game_over() const { return game_over_; }
    bool is_paused() const { return paused_; }
    void pause();
    void resume();

    // Session clock, driven by the presentation layer
    void tick(double seconds);
    double elapsed() const { return elapsed_; }
    bool clock_running() const { return clock_running_; }

    // Returns false when size is out of range or unchanged
    bool set_grid_size(int size);
    void set_settings(Settings settings);
    const Settings& settings() const { return settings_; }

    int best_score() const;
    void set_best_score(int grid_size, int score);
    void reset_high_scores();
    bool new_high_score() const { return high_score_broken_; }
    int next_goal() const;

    void set_result_callback(ResultCallback callback) { on_result_ = std::move(callback); }
    const std::optional<GameResult>& last_result() const { return last_result_; }

    GameSnapshot snapshot_for_persistence() const;
    const Board& board() const { return board_; }
    int score() const { return score_; }
    int moves() const { return moves_; }
    int grid_size() const { return board_.size; }
    const History& history() const { return history_; }

    std::vector<int> get_flat_values() const;
    std::vector<TileKind> get_flat_kinds() const;

    // Installs a board and score, clearing history. Rejects boards whose
    // size differs from the configured grid size, duplicate ids, empty cells
    // holding data, non-positive Numbers and powerups with a value.
    bool set_full_game_state(const Board& board, int score);

    // Index into ALL_DIRECTIONS, or -1 when every direction is blocked
    int suggest_move() const;

private:
    void record_snapshot(const char* label);
    void update_high_scores();
    bool check_game_over();

    Settings settings_;
    std::mt19937 rng_engine_;
    TileId next_id_ = 1;

    Board board_;
    int score_ = 0;
    int moves_ = 0;
    History history_;

    bool game_over_ = false;
    bool result_emitted_ = false;
    bool paused_ = false;
    bool clock_running_ = false;
    double elapsed_ = 0.0;

    std::map<int, int> best_scores_; // grid size -> best score
    bool high_score_broken_ = false;

    ResultCallback on_result_;
    std::optional<GameResult> last_result_;
};

#endif // GAME_HPP
