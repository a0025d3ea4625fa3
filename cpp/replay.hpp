#ifndef REPLAY_HPP
#define REPLAY_HPP

#include "game_defs.hpp" // For Coord, Digit, TerminalKind
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

class Game;

// Command-line settings of the replay logger.
struct ReplayOptions {
    bool show_help = false;
    bool has_seed = false;
    std::uint64_t seed = 0;
    std::string board_path;
    std::string moves_path;
    std::string out_path;
    bool moore = false;
    bool debug = false;
    bool show_board = false;
};

// Parses `--key=value` style arguments (argv without the program name).
// Throws GameError(InvalidArgument) on an unknown option or a bad seed.
ReplayOptions parseReplayOptions(const std::vector<std::string>& args);
void printReplayUsage(std::ostream& out);

// e.g. "[5,-1,3,...]", row-major, -1 for free tiles
std::string serializeFlat(const std::vector<Digit>& values);
// e.g. "[[4,4],[4,5]]"
std::string serializeCoords(const std::vector<Coord>& coords);
const char* terminalName(TerminalKind kind);

struct ReplayStats {
    long moves_read = 0;
    long moves_rejected = 0;
};

// Plays "row col" lines from `moves` until the input ends or the game is over.
// Each accepted placement becomes one JSON object on its own line of `json_out`;
// malformed or rejected moves are reported on `warnings` and skipped.
// When `board_out` is non-null the board is printed there after every placement.
ReplayStats replayMoves(Game& game, std::istream& moves, std::ostream& json_out, std::ostream& warnings,
                        std::ostream* board_out);

#endif // REPLAY_HPP
