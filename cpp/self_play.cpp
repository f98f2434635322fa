#include "ai.hpp"        // For ALL_DIRECTIONS
#include "game.hpp"      // For Game
#include "game_defs.hpp" // For TileKind
#include "merge.hpp"     // For kindName, directionName, maxTile, printBoard

#include <fstream>
#include <iostream>
#include <random>       // For std::random_device
#include <sstream>      // For std::ostringstream
#include <stdexcept>
#include <string>
#include <vector>

// Function to serialize the board values to a flat JSON array string, row-major
std::string serializeValues(const Game& game) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (int v : game.get_flat_values()) {
        if (!first) oss << ",";
        oss << v;
        first = false;
    }
    oss << "]";
    return oss.str();
}

std::string serializeKinds(const Game& game) {
    std::ostringstream oss;
    oss << "[";
    const Board& board = game.board();
    for (size_t i = 0; i < board.cells.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << (board.cells[i].empty() ? "empty" : kindName(board.cells[i].kind)) << "\"";
    }
    oss << "]";
    return oss.str();
}

// First tappable powerup in index order, or -1
int findTappable(const Board& board) {
    for (int i = 0; i < static_cast<int>(board.cells.size()); ++i) {
        const Tile& t = board.cells[i];
        if (!t.empty() && isObstacle(t.kind)) return i;
    }
    return -1;
}

int main(int argc, char** argv) {
    int num_episodes = 100;
    unsigned int seed = std::random_device{}();
    std::string output_file_path = "data/self_play.jsonl";

    try {
        if (argc > 1) num_episodes = std::stoi(argv[1]);
        if (argc > 2) seed = static_cast<unsigned int>(std::stoul(argv[2]));
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [episodes] [seed] [output]" << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (argc > 3) output_file_path = argv[3];

    std::ofstream outfile(output_file_path);
    if (!outfile.is_open()) {
        std::cerr << "Error: Could not open " << output_file_path << " for writing." << std::endl;
        std::cerr << "Please ensure the 'data' directory exists relative to the executable's CWD." << std::endl;
        return 1;
    }

    const int MAX_STEPS_PER_EPISODE = 100000;
    long total_steps_logged = 0;
    long total_score_all_episodes = 0;

    Settings settings;
    Game game(settings, seed);

    for (int i = 0; i < num_episodes; ++i) {
        if (i > 0) game.reset();
        int steps_this_episode = 0;

        while (!game.is_game_over() && steps_this_episode < MAX_STEPS_PER_EPISODE) {
            std::string state_before_action_str = serializeValues(game);
            std::string kinds_before_action_str = serializeKinds(game);

            std::string action;
            MutationResult result;
            int tap = findTappable(game.board());
            if (tap >= 0) {
                action = "tap:" + std::to_string(tap);
                result = game.activate(tap);
            } else {
                int best = game.suggest_move();
                if (best < 0) {
                    std::cout << "[ERROR] No direction changes the board. Ending episode prematurely." << std::endl;
                    break;
                }
                action = directionName(ALL_DIRECTIONS[best]);
                result = game.move(ALL_DIRECTIONS[best]);
            }

            outfile << "{";
            outfile << "\"state\":" << state_before_action_str << ",";
            outfile << "\"kinds\":" << kinds_before_action_str << ",";
            outfile << "\"action\":\"" << action << "\",";
            outfile << "\"reward\":" << result.score_delta << ",";
            outfile << "\"next_state\":" << serializeValues(game) << ",";
            outfile << "\"done\":" << (result.game_ended ? "true" : "false");
            outfile << "}\n";
            total_steps_logged++;
            steps_this_episode++;
        }

        total_score_all_episodes += game.score();
        std::cout << "Episode " << i + 1 << "/" << num_episodes << " finished. Score: " << game.score()
                  << ", Max tile: " << maxTile(game.board()) << ", Steps in episode: " << steps_this_episode
                  << std::endl;
    }

    outfile.close();
    if (num_episodes > 0) {
        std::cout << "\nFinal board of the last episode:" << std::endl;
        printBoard(game.board());
    }
    std::cout << "Self-play data generation complete." << std::endl;
    std::cout << "Seed: " << seed << std::endl;
    std::cout << "Total episodes run: " << num_episodes << std::endl;
    std::cout << "Total steps logged: " << total_steps_logged << std::endl;
    if (num_episodes > 0) {
        double avg_score = static_cast<double>(total_score_all_episodes) / num_episodes;
        std::cout << "Average score per episode: " << avg_score << std::endl;
    }
    std::cout << "Data saved to " << output_file_path << std::endl;
    return 0;
}
