#pragma once

#include "agent/game_state.hpp"

#include <vector>

namespace minelogic {

/// Aggregate over a batch of self-played games.
struct SelfPlaySummary {
    int games = 0;
    int wins = 0;
    int losses = 0;
    int exhausted = 0;
    int guesses = 0;
    int inferred_moves = 0;

    double winRate() const {
        return games > 0 ? static_cast<double>(wins) / games : 0.0;
    }

    /// Share of all moves that were proven safe rather than guessed.
    double inferenceRate() const {
        int total = guesses + inferred_moves;
        return total > 0 ? static_cast<double>(inferred_moves) / total : 0.0;
    }

    void add(const GameResult& result);
};

/// Play `games` games; game i uses seed config.seed + i.
/// Throws std::invalid_argument on a bad config or negative `games`.
SelfPlaySummary runSelfPlay(const GameConfig& config, int games);

} // namespace minelogic
