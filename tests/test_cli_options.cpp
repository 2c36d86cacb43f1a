#include <gtest/gtest.h>
#include "cli_options.hpp"

#include <limits>
#include <stdexcept>

using namespace minelogic;

// ─── Flag values ───────────────────────────────────────────────

TEST(CliOptionsTest, ParsesInRangeValues) {
    EXPECT_EQ(parseIntFlag("--height", "16"), 16);
    EXPECT_EQ(parseIntFlag("--max-moves", "-3"), -3);
    EXPECT_EQ(parseSeedFlag("--seed", "0"), 0u);
    EXPECT_EQ(parseSeedFlag("--seed", "4294967295"), std::numeric_limits<uint32_t>::max());
}

TEST(CliOptionsTest, RejectsMalformedValues) {
    EXPECT_THROW(parseIntFlag("--height", nullptr), std::invalid_argument);
    EXPECT_THROW(parseIntFlag("--height", ""), std::invalid_argument);
    EXPECT_THROW(parseIntFlag("--height", "12x"), std::invalid_argument);
}

TEST(CliOptionsTest, RejectsValuesOutsideTargetType) {
    EXPECT_THROW(parseSeedFlag("--seed", "-1"), std::invalid_argument);
    EXPECT_THROW(parseSeedFlag("--seed", "4294967296"), std::invalid_argument);
    EXPECT_THROW(parseIntFlag("--height", "2147483648"), std::invalid_argument);
    EXPECT_THROW(parseIntFlag("--width", "-2147483649"), std::invalid_argument);
    EXPECT_THROW(parseIntFlag("--games", "99999999999999999999999"), std::invalid_argument);
}

// ─── Argument lists ────────────────────────────────────────────

TEST(CliOptionsTest, ParseArgsFillsConfig) {
    const char* argv[] = {"minelogic_selfplay", "--height", "5", "--width", "6",
                          "--mines", "4", "--seed", "9", "--games", "3", "--verbose"};
    CliOptions opts = parseArgs(12, argv);
    EXPECT_EQ(opts.config.height, 5);
    EXPECT_EQ(opts.config.width, 6);
    EXPECT_EQ(opts.config.mines, 4);
    EXPECT_EQ(opts.config.seed, 9u);
    EXPECT_EQ(opts.games, 3);
    EXPECT_TRUE(opts.verbose);
}

TEST(CliOptionsTest, ParseArgsRejectsBadInput) {
    const char* negative_seed[] = {"minelogic_selfplay", "--seed", "-1"};
    EXPECT_THROW(parseArgs(3, negative_seed), std::invalid_argument);

    const char* unknown[] = {"minelogic_selfplay", "--depth", "3"};
    EXPECT_THROW(parseArgs(3, unknown), std::invalid_argument);

    const char* missing[] = {"minelogic_selfplay", "--mines"};
    EXPECT_THROW(parseArgs(2, missing), std::invalid_argument);

    const char* too_many_mines[] = {"minelogic_selfplay", "--height", "2", "--width", "2",
                                    "--mines", "5"};
    EXPECT_THROW(parseArgs(7, too_many_mines), std::invalid_argument);
}
