#include "game.hpp"       // For Game
#include "clear.hpp"      // For printBoard
#include "errors.hpp"     // For GameError
#include "replay.hpp"     // For parseReplayOptions, replayMoves, terminalName
#include "utils.hpp"      // For loadGridFile, entropySeed, setDebugLogging

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        ReplayOptions opts = parseReplayOptions(std::vector<std::string>(argv + 1, argv + argc));
        if (opts.show_help) {
            printReplayUsage(std::cout);
            return 0;
        }
        setDebugLogging(opts.debug);

        std::uint64_t seed = opts.has_seed ? opts.seed : entropySeed();
        Rules rules(opts.moore ? Adjacency::Moore : Adjacency::Orthogonal);

        std::ifstream moves_file;
        if (!opts.moves_path.empty()) {
            moves_file.open(opts.moves_path);
            if (!moves_file.is_open()) {
                std::cerr << "Error: Could not open " << opts.moves_path << " for reading." << std::endl;
                return 1;
            }
        }
        std::istream& moves = opts.moves_path.empty() ? std::cin : moves_file;

        std::ofstream out_file;
        if (!opts.out_path.empty()) {
            out_file.open(opts.out_path);
            if (!out_file.is_open()) {
                std::cerr << "Error: Could not open " << opts.out_path << " for writing." << std::endl;
                return 1;
            }
        }
        std::ostream& outfile = opts.out_path.empty() ? std::cout : out_file;
        // Progress goes wherever the JSON lines do not.
        std::ostream& info = opts.out_path.empty() ? std::cerr : std::cout;

        Game game(seed, rules);
        if (!opts.board_path.empty()) game.load_grid(loadGridFile(opts.board_path));
        info << "Seed: " << seed << std::endl;
        if (opts.show_board) printBoard(info, game.board());

        ReplayStats stats = replayMoves(game, moves, outfile, std::cerr, opts.show_board ? &info : nullptr);

        TerminalState final_state = game.terminal_state();
        info << "\nReplay complete." << std::endl;
        info << "Moves read: " << stats.moves_read << ", rejected: " << stats.moves_rejected << std::endl;
        info << "Placements: " << game.num_placed() << ", tiles left: " << game.board().occupiedCount() << std::endl;
        info << "Result: " << terminalName(final_state.kind) << std::endl;
        return 0;
    } catch (const GameError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        if (e.code() == ErrorCode::InvalidArgument) printReplayUsage(std::cerr);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
