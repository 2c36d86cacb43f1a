#include "cli_options.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace minelogic {

namespace {

template <typename T>
T parseNumber(const std::string& flag, const char* value) {
    if (!value) {
        throw std::invalid_argument("Missing value for " + flag);
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        throw std::invalid_argument("Invalid number for " + flag + ": " + value);
    }
    // Reject rather than wrap: "--seed -1" must not become 4294967295.
    if (errno == ERANGE ||
        parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
        parsed > static_cast<long long>(std::numeric_limits<T>::max())) {
        throw std::invalid_argument("Out of range for " + flag + ": " + value);
    }
    return static_cast<T>(parsed);
}

} // namespace

int parseIntFlag(const std::string& flag, const char* value) {
    return parseNumber<int>(flag, value);
}

uint32_t parseSeedFlag(const std::string& flag, const char* value) {
    return parseNumber<uint32_t>(flag, value);
}

CliOptions parseArgs(int argc, const char* const* argv) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (arg == "--height") {
            opts.config.height = parseIntFlag(arg, next); i++;
        } else if (arg == "--width") {
            opts.config.width = parseIntFlag(arg, next); i++;
        } else if (arg == "--mines") {
            opts.config.mines = parseIntFlag(arg, next); i++;
        } else if (arg == "--seed") {
            opts.config.seed = parseSeedFlag(arg, next); i++;
        } else if (arg == "--games") {
            opts.games = parseIntFlag(arg, next); i++;
        } else if (arg == "--max-moves") {
            opts.config.max_moves = parseIntFlag(arg, next); i++;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    opts.config.validate();
    return opts;
}

} // namespace minelogic
