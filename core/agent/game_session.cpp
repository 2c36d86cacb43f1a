#include "agent/game_session.hpp"

#include <optional>
#include <utility>

namespace minelogic {

namespace {

Minefield makeMinefield(const GameConfig& config) {
    config.validate();
    return Minefield(config.height, config.width, config.mines, config.seed);
}

} // namespace

GameSession::GameSession(const GameConfig& config)
    : GameSession(makeMinefield(config), config.seed, config.max_moves) {}

GameSession::GameSession(Minefield field, uint32_t seed, int max_moves)
    : field_(std::move(field)),
      engine_(field_.height(), field_.width(), seed),
      max_moves_(max_moves) {
    outcome_ = evaluate();
}

GameOutcome GameSession::step() {
    if (outcome_ != GameOutcome::InProgress) return outcome_;

    if (max_moves_ > 0 && history_.size() >= static_cast<size_t>(max_moves_)) {
        outcome_ = GameOutcome::Exhausted;
        return outcome_;
    }

    bool inferred = true;
    std::optional<Cell> move = engine_.chooseSafeMove();
    if (!move) {
        inferred = false;
        move = engine_.chooseRandomMove();
    }
    if (!move) {
        outcome_ = GameOutcome::Exhausted;
        return outcome_;
    }

    MoveRecord record;
    record.cell = *move;
    record.inferred = inferred;

    if (field_.isMine(*move)) {
        record.hit_mine = true;
        history_.push_back(record);
        outcome_ = GameOutcome::Lost;
        return outcome_;
    }

    record.adjacent_mines = field_.nearbyMines(*move);
    record.stats = engine_.recordObservation(*move, record.adjacent_mines);
    history_.push_back(record);

    outcome_ = evaluate();
    return outcome_;
}

GameResult GameSession::play() {
    while (step() == GameOutcome::InProgress) {}
    return result();
}

GameResult GameSession::result() const {
    GameResult result;
    result.outcome = outcome_;
    result.moves = history_;
    for (const auto& move : history_) {
        if (move.inferred) result.inferred_moves++;
        else result.guesses++;
    }
    result.mines_found = engine_.knownMines().size();
    result.mines_total = field_.mineCount();
    return result;
}

GameOutcome GameSession::evaluate() const {
    if (field_.won(engine_.knownMines())) return GameOutcome::Won;
    if (engine_.movesMade().size() == field_.safeCellCount()) return GameOutcome::Won;
    return GameOutcome::InProgress;
}

} // namespace minelogic
