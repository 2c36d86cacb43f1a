#pragma once

#include "board/cell.hpp"
#include "knowledge/inference_engine.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace minelogic {

/// Game configuration parameters.
struct GameConfig {
    int height = 8;
    int width = 8;
    int mines = 8;
    uint32_t seed = 42;     // Seeds both mine placement and random moves
    int max_moves = 0;      // 0 = unlimited

    /// Throws std::invalid_argument describing the first bad field.
    void validate() const {
        if (height <= 0 || width <= 0) {
            throw std::invalid_argument("GameConfig: height and width must be positive");
        }
        if (mines < 0 || static_cast<long long>(mines) > static_cast<long long>(height) * width) {
            throw std::invalid_argument("GameConfig: mines must be in [0, height * width]");
        }
        if (max_moves < 0) {
            throw std::invalid_argument("GameConfig: max_moves must be >= 0");
        }
    }
};

enum class GameOutcome {
    InProgress,
    Won,        // every mine identified, or every safe cell revealed
    Lost,       // revealed a mine
    Exhausted   // no move available, or max_moves reached
};

inline std::string outcomeName(GameOutcome outcome) {
    switch (outcome) {
        case GameOutcome::InProgress: return "in_progress";
        case GameOutcome::Won:        return "won";
        case GameOutcome::Lost:       return "lost";
        case GameOutcome::Exhausted:  return "exhausted";
    }
    return "unknown";
}

/// One revealed cell.
struct MoveRecord {
    Cell cell;
    bool inferred = false;      // true = proven safe, false = random guess
    bool hit_mine = false;
    int adjacent_mines = -1;    // -1 when hit_mine
    PropagationStats stats;
};

/// Final state of one game.
struct GameResult {
    GameOutcome outcome = GameOutcome::InProgress;
    std::vector<MoveRecord> moves;
    int guesses = 0;
    int inferred_moves = 0;
    size_t mines_found = 0;
    size_t mines_total = 0;
};

} // namespace minelogic
