#include "replay.hpp"
#include "clear.hpp"     // For printBoard
#include "errors.hpp"    // For GameError
#include "game.hpp"      // For Game

#include <array>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace {
bool hasPrefix(const std::string& arg, const std::string& prefix) {
    return arg.compare(0, prefix.size(), prefix) == 0;
}

std::uint64_t parseSeed(const std::string& value) {
    try {
        size_t used = 0;
        if (value.empty() || value[0] == '-') throw std::invalid_argument(value);
        unsigned long long seed = std::stoull(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return seed;
    } catch (const std::logic_error&) {
        throw GameError(ErrorCode::InvalidArgument, "--seed expects an unsigned integer, got '" + value + "'");
    }
}
}

ReplayOptions parseReplayOptions(const std::vector<std::string>& args) {
    ReplayOptions opts;
    for (const std::string& arg : args) {
        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (hasPrefix(arg, "--seed=")) {
            opts.seed = parseSeed(arg.substr(7));
            opts.has_seed = true;
        } else if (hasPrefix(arg, "--board=")) {
            opts.board_path = arg.substr(8);
        } else if (hasPrefix(arg, "--moves=")) {
            opts.moves_path = arg.substr(8);
        } else if (hasPrefix(arg, "--out=")) {
            opts.out_path = arg.substr(6);
        } else if (arg == "--moore") {
            opts.moore = true;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg == "--show-board") {
            opts.show_board = true;
        } else {
            throw GameError(ErrorCode::InvalidArgument, "unknown option '" + arg + "'");
        }
    }
    return opts;
}

void printReplayUsage(std::ostream& out) {
    out << "Usage: replay_logger [--seed=N] [--board=FILE] [--moves=FILE] [--out=FILE]\n"
           "                     [--moore] [--show-board] [--debug]\n"
           "Plays 'row col' moves (one per line, stdin by default) and writes one JSON\n"
           "object per placement.\n";
}

std::string serializeFlat(const std::vector<Digit>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::string serializeCoords(const std::vector<Coord>& coords) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < coords.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "[" << coords[i].row << "," << coords[i].col << "]";
    }
    oss << "]";
    return oss.str();
}

const char* terminalName(TerminalKind kind) {
    switch (kind) {
        case TerminalKind::Ongoing: return "ongoing";
        case TerminalKind::Won:     return "won";
        case TerminalKind::Stuck:   return "stuck";
    }
    return "unknown";
}

ReplayStats replayMoves(Game& game, std::istream& moves, std::ostream& json_out, std::ostream& warnings,
                        std::ostream* board_out) {
    ReplayStats stats;
    std::string line;
    while (!game.is_game_over() && std::getline(moves, line)) {
        std::istringstream fields(line);
        int row = 0;
        int col = 0;
        if (!(fields >> row)) continue; // blank line
        ++stats.moves_read;
        if (!(fields >> col)) {
            warnings << "[WARNING] Move " << stats.moves_read << " '" << line << "' needs a row and a column."
                     << std::endl;
            ++stats.moves_rejected;
            continue;
        }

        std::string state_before = serializeFlat(game.get_flat_state());
        std::array<Digit, LOOKAHEAD> nexts = game.get_nexts();

        PlacementResult result;
        try {
            result = game.place_next(row, col);
        } catch (const GameError& e) {
            warnings << "[WARNING] Move " << stats.moves_read << " (" << row << "," << col
                     << ") rejected: " << e.what() << std::endl;
            ++stats.moves_rejected;
            continue;
        }

        json_out << "{";
        json_out << "\"step\":" << game.num_placed() << ",";
        json_out << "\"state\":" << state_before << ",";
        json_out << "\"nexts\":" << serializeFlat(std::vector<Digit>(nexts.begin(), nexts.end())) << ",";
        json_out << "\"row\":" << row << ",";
        json_out << "\"col\":" << col << ",";
        json_out << "\"digit\":" << nexts[0] << ",";
        json_out << "\"matched\":" << (result.matched ? "true" : "false") << ",";
        json_out << "\"cleared\":" << serializeCoords(result.cleared_tiles) << ",";
        json_out << "\"next_state\":" << serializeFlat(game.get_flat_state()) << ",";
        json_out << "\"terminal\":\"" << terminalName(result.terminal.kind) << "\"";
        json_out << "}\n";
        json_out.flush();

        if (board_out) printBoard(*board_out, game.board());
    }
    return stats;
}
