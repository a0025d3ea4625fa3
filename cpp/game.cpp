#include "game.hpp"
#include "errors.hpp"
#include "utils.hpp"   // For deriveSeed, entropySeed, makeStartingGrid
#include <iostream>
#include <string>

namespace {
const std::uint64_t kStreamSeedId = 0;
const std::uint64_t kBoardSeedId = 1;
}

Game::Game() : Game(entropySeed()) {}

Game::Game(std::uint64_t seed, Rules rules)
    : seed_(seed),
      rules_(rules),
      board_rng_(deriveSeed(seed, kBoardSeedId)),
      stream_(deriveSeed(seed, kStreamSeedId)),
      board_(makeStartingGrid(board_rng_), stream_, rules) {}

Game::Game(const Grid& starting_values, std::uint64_t seed, Rules rules)
    : seed_(seed),
      rules_(rules),
      board_rng_(deriveSeed(seed, kBoardSeedId)),
      stream_(deriveSeed(seed, kStreamSeedId)),
      board_(starting_values, stream_, rules) {}

void Game::reset() {
    board_ = Board(makeStartingGrid(board_rng_), stream_, rules_);
    if (debugLoggingEnabled()) {
        std::cout << "[GAME_DEBUG] New round, " << board_.occupiedCount() << " tiles to clear" << std::endl;
    }
}

void Game::load_grid(const Grid& starting_values) {
    board_ = Board(starting_values, stream_, rules_);
    if (debugLoggingEnabled()) {
        std::cout << "[GAME_DEBUG] Loaded board, " << board_.occupiedCount() << " tiles to clear" << std::endl;
    }
}

void Game::load_flat_state(const std::vector<Digit>& flat_board_data) {
    if (flat_board_data.size() != static_cast<size_t>(TILE_COUNT)) {
        throw GameError(ErrorCode::InvalidBoard, "expected " + std::to_string(TILE_COUNT) + " values, got " +
                                                     std::to_string(flat_board_data.size()));
    }
    Grid grid;
    for (int i = 0; i < TILE_COUNT; ++i) grid[i] = flat_board_data[i];
    load_grid(grid);
}

PlacementResult Game::place_next(int row, int col) {
    PlacementResult result = board_.place(row, col, stream_.peek(1));
    stream_.next();
    return result;
}

std::array<Digit, LOOKAHEAD> Game::get_nexts() const {
    return stream_.window();
}

std::vector<Digit> Game::get_flat_state() const {
    return board_.flatValues();
}

bool Game::is_game_over() const {
    return board_.isTerminal();
}

int Game::num_placed() const {
    return board_.placementsMade();
}

TerminalState Game::terminal_state() const {
    return board_.terminalState();
}

bool Game::find_free(const Coord& from, Direction direction, Coord& out) const {
    return board_.findFree(from, direction, out);
}
