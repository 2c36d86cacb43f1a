#pragma once

#include "agent/game_state.hpp"

#include <string>

namespace minelogic {

/// Command-line settings for minelogic_selfplay.
struct CliOptions {
    GameConfig config;
    int games = 1;
    bool verbose = false;
};

/// Parse a base-10 integer flag value into an int. Throws
/// std::invalid_argument when missing, malformed, or outside int's range.
int parseIntFlag(const std::string& flag, const char* value);

/// Same as parseIntFlag for an unsigned 32-bit value; negatives are rejected.
uint32_t parseSeedFlag(const std::string& flag, const char* value);

/// Parse argv into options and validate the resulting GameConfig.
/// Throws std::invalid_argument on any bad flag or value.
CliOptions parseArgs(int argc, const char* const* argv);

} // namespace minelogic
