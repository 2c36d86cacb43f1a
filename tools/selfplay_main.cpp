// minelogic_selfplay: plays Minesweeper games with the inference agent
// and reports how often it wins.
//
// Usage:
//   minelogic_selfplay [--height N] [--width N] [--mines N]
//                      [--seed N] [--games N] [--max-moves N] [--verbose]
//
// With --games 1 (the default) the board and every move are printed.

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "agent/game_session.hpp"
#include "agent/game_state.hpp"
#include "agent/self_play.hpp"
#include "cli_options.hpp"

using namespace minelogic;

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--height N] [--width N] [--mines N] [--seed N]"
                 " [--games N] [--max-moves N] [--verbose]\n";
}

void playSingle(const CliOptions& opts) {
    GameSession session(opts.config);
    session.minefield().render(std::cout);

    while (session.step() == GameOutcome::InProgress) {
        if (!opts.verbose) continue;
        const MoveRecord& move = session.history().back();
        std::cout << (move.inferred ? "safe  " : "guess ") << move.cell
                  << " -> " << move.adjacent_mines
                  << " (passes=" << move.stats.passes
                  << ", +safe=" << move.stats.cells_marked_safe
                  << ", +mine=" << move.stats.cells_marked_mine
                  << ", derived=" << move.stats.constraints_derived << ")\n";
    }

    GameResult result = session.result();
    if (result.outcome == GameOutcome::Lost) {
        std::cout << "Hit mine at " << result.moves.back().cell << "\n";
    }
    std::cout << "Outcome: " << outcomeName(result.outcome) << "\n"
              << "Moves: " << result.moves.size()
              << " (" << result.inferred_moves << " inferred, "
              << result.guesses << " guessed)\n"
              << "Mines flagged: " << result.mines_found << "/" << result.mines_total << "\n";
}

void playBatch(const CliOptions& opts) {
    SelfPlaySummary summary = runSelfPlay(opts.config, opts.games);
    std::cout << "Games: " << summary.games << "\n"
              << "Won: " << summary.wins
              << "  Lost: " << summary.losses
              << "  Exhausted: " << summary.exhausted << "\n"
              << std::fixed << std::setprecision(3)
              << "Win rate: " << summary.winRate() << "\n"
              << "Inferred move share: " << summary.inferenceRate() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        if (opts.games == 1) {
            playSingle(opts);
        } else {
            playBatch(opts);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
