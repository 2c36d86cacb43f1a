#include "agent/self_play.hpp"
#include "agent/game_session.hpp"

#include <stdexcept>

namespace minelogic {

void SelfPlaySummary::add(const GameResult& result) {
    games++;
    switch (result.outcome) {
        case GameOutcome::Won:       wins++; break;
        case GameOutcome::Lost:      losses++; break;
        case GameOutcome::Exhausted: exhausted++; break;
        case GameOutcome::InProgress: break;
    }
    guesses += result.guesses;
    inferred_moves += result.inferred_moves;
}

SelfPlaySummary runSelfPlay(const GameConfig& config, int games) {
    config.validate();
    if (games < 0) {
        throw std::invalid_argument("runSelfPlay: games must be >= 0");
    }

    SelfPlaySummary summary;
    for (int i = 0; i < games; i++) {
        GameConfig game_config = config;
        game_config.seed = config.seed + static_cast<uint32_t>(i);
        GameSession session(game_config);
        summary.add(session.play());
    }
    return summary;
}

} // namespace minelogic
