#include <gtest/gtest.h>
#include "agent/game_session.hpp"

#include <set>
#include <stdexcept>

using namespace minelogic;

// ─── Game Session ──────────────────────────────────────────────

TEST(GameSessionTest, NoMinesIsWonImmediately) {
    GameSession session(Minefield(3, 3, std::set<Cell>{}));
    EXPECT_EQ(session.outcome(), GameOutcome::Won);

    GameResult result = session.play();
    EXPECT_EQ(result.outcome, GameOutcome::Won);
    EXPECT_TRUE(result.moves.empty());
}

TEST(GameSessionTest, AllMinesBoardIsWonWithoutMoving) {
    // No safe cell is left to reveal, so there is nothing to play.
    GameSession session(Minefield(2, 2, 4, 3));
    EXPECT_EQ(session.outcome(), GameOutcome::Won);

    GameResult result = session.play();
    EXPECT_EQ(result.outcome, GameOutcome::Won);
    EXPECT_TRUE(result.moves.empty());
    EXPECT_EQ(result.guesses, 0);
}

TEST(GameSessionTest, GuessOnKnownLayoutWinsOrLoses) {
    // One mine in two cells: the first move is always a guess. Guessing
    // (0,1) reveals 1, which proves (0,0) a mine; guessing (0,0) loses.
    int losses = 0;
    int wins = 0;
    for (uint32_t seed = 0; seed < 64; seed++) {
        GameSession session(Minefield(1, 2, std::set<Cell>{Cell(0, 0)}), seed);
        GameResult result = session.play();
        ASSERT_EQ(result.moves.size(), 1u) << "seed " << seed;
        const MoveRecord& move = result.moves[0];
        EXPECT_FALSE(move.inferred);

        if (move.cell == Cell(0, 0)) {
            EXPECT_EQ(result.outcome, GameOutcome::Lost);
            EXPECT_TRUE(move.hit_mine);
            EXPECT_EQ(move.adjacent_mines, -1);
            losses++;
        } else {
            EXPECT_EQ(move.cell, Cell(0, 1));
            EXPECT_EQ(result.outcome, GameOutcome::Won);
            EXPECT_EQ(move.adjacent_mines, 1);
            EXPECT_EQ(session.engine().knownMines(), (std::set<Cell>{Cell(0, 0)}));
            wins++;
        }
    }
    EXPECT_GT(losses, 0);
    EXPECT_GT(wins, 0);
}

TEST(GameSessionTest, StepAfterGameOverIsNoop) {
    for (uint32_t seed = 0; seed < 64; seed++) {
        GameSession session(Minefield(1, 2, std::set<Cell>{Cell(0, 0)}), seed);
        GameOutcome outcome = session.play().outcome;
        if (outcome != GameOutcome::Lost) continue;

        size_t moves = session.history().size();
        EXPECT_EQ(session.step(), GameOutcome::Lost);
        EXPECT_EQ(session.history().size(), moves);
        return;
    }
    FAIL() << "no seed guessed the mine first";
}

TEST(GameSessionTest, MaxMovesExhausts) {
    GameConfig config;
    config.height = 8;
    config.width = 8;
    config.mines = 10;
    config.max_moves = 1;

    GameSession session(config);
    GameResult result = session.play();
    EXPECT_NE(result.outcome, GameOutcome::InProgress);
    EXPECT_LE(result.moves.size(), 1u);
    if (result.outcome == GameOutcome::Exhausted) {
        EXPECT_EQ(result.moves.size(), 1u);
    }
}

TEST(GameSessionTest, InvalidConfigThrows) {
    GameConfig config;
    config.height = 3;
    config.width = 3;
    config.mines = 10;
    EXPECT_THROW(GameSession{config}, std::invalid_argument);

    config.mines = 1;
    config.max_moves = -1;
    EXPECT_THROW(GameSession{config}, std::invalid_argument);
}

TEST(GameSessionTest, ReplayIsDeterministic) {
    GameConfig config;
    config.seed = 99;
    GameResult first = GameSession(config).play();
    GameResult second = GameSession(config).play();

    EXPECT_EQ(first.outcome, second.outcome);
    ASSERT_EQ(first.moves.size(), second.moves.size());
    for (size_t i = 0; i < first.moves.size(); i++) {
        EXPECT_EQ(first.moves[i].cell, second.moves[i].cell);
    }
}

TEST(GameSessionTest, InferredMovesNeverHitMines) {
    for (uint32_t seed = 0; seed < 50; seed++) {
        GameConfig config;
        config.height = 6;
        config.width = 6;
        config.mines = 5;
        config.seed = seed;

        GameSession session(config);
        GameResult result = session.play();
        ASSERT_FALSE(result.moves.empty());

        std::set<Cell> played;
        for (size_t i = 0; i < result.moves.size(); i++) {
            const MoveRecord& move = result.moves[i];
            EXPECT_TRUE(played.insert(move.cell).second) << "replayed " << move.cell;
            if (move.inferred) {
                EXPECT_FALSE(move.hit_mine) << "seed " << seed;
            }
            if (i + 1 < result.moves.size()) {
                EXPECT_FALSE(move.hit_mine);
            }
        }
        EXPECT_EQ(static_cast<size_t>(result.guesses + result.inferred_moves), result.moves.size());

        switch (result.outcome) {
            case GameOutcome::Lost:
                EXPECT_TRUE(result.moves.back().hit_mine);
                break;
            case GameOutcome::Won:
                EXPECT_TRUE(result.mines_found == result.mines_total ||
                            session.engine().movesMade().size() ==
                                session.minefield().safeCellCount());
                break;
            default:
                ADD_FAILURE() << "unexpected outcome " << outcomeName(result.outcome);
        }
    }
}

TEST(GameSessionTest, OutcomeNames) {
    EXPECT_EQ(outcomeName(GameOutcome::Won), "won");
    EXPECT_EQ(outcomeName(GameOutcome::Lost), "lost");
    EXPECT_EQ(outcomeName(GameOutcome::Exhausted), "exhausted");
    EXPECT_EQ(outcomeName(GameOutcome::InProgress), "in_progress");
}
