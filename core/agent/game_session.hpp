#pragma once

#include "agent/game_state.hpp"
#include "board/minefield.hpp"
#include "knowledge/inference_engine.hpp"

#include <cstdint>
#include <vector>

namespace minelogic {

// ─── Game Session ──────────────────────────────────────────────
// The game loop around one InferenceEngine: play a proven-safe cell
// when one exists, otherwise guess, reveal it on the Minefield and
// feed the neighbor count back as an observation.

class GameSession {
public:
    /// Random board from `config`. Throws std::invalid_argument on a bad config.
    explicit GameSession(const GameConfig& config);

    /// Play on a given board.
    GameSession(Minefield field, uint32_t seed = 42, int max_moves = 0);

    /// Make one move. Returns the outcome after it; a finished game is
    /// left untouched.
    GameOutcome step();

    /// Step until the game is over.
    GameResult play();

    GameOutcome outcome() const { return outcome_; }
    GameResult result() const;

    const Minefield& minefield() const { return field_; }
    const InferenceEngine& engine() const { return engine_; }
    const std::vector<MoveRecord>& history() const { return history_; }

private:
    Minefield field_;
    InferenceEngine engine_;
    int max_moves_ = 0;
    std::vector<MoveRecord> history_;
    GameOutcome outcome_ = GameOutcome::InProgress;

    GameOutcome evaluate() const;
};

} // namespace minelogic
