#ifndef GAME_HPP
#define GAME_HPP

#include "game_defs.hpp"    // For Digit, Grid, Rules, PlacementResult, LOOKAHEAD
#include "board.hpp"        // For Board
#include "digit_stream.hpp" // For DigitStream
#include <array>
#include <cstdint>
#include <random>           // For std::mt19937_64
#include <vector>

// One play session: a board and the digit stream that feeds it.
class Game {
public:
    Game(); // Seeded from std::random_device
    explicit Game(std::uint64_t seed, Rules rules = Rules());
    // Starts from a predefined board instead of a random one.
    Game(const Grid& starting_values, std::uint64_t seed, Rules rules = Rules());

    // The board refers to stream_, so a session is pinned in memory.
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // New round on a fresh random board; the digit stream keeps running.
    void reset();
    // New round on the given board.
    void load_grid(const Grid& starting_values);
    // Same, from a flat row-major list of TILE_COUNT values (NO_DIGIT = free).
    void load_flat_state(const std::vector<Digit>& flat_board_data);

    // Places the head of the stream on (row, col) and consumes it.
    // Throws GameError like Board::place; nothing changes then.
    PlacementResult place_next(int row, int col);

    std::array<Digit, LOOKAHEAD> get_nexts() const;
    std::vector<Digit> get_flat_state() const;
    bool is_game_over() const;
    int num_placed() const;
    TerminalState terminal_state() const;
    bool find_free(const Coord& from, Direction direction, Coord& out) const;

    const Board& board() const { return board_; }
    const DigitStream& stream() const { return stream_; }
    std::uint64_t seed() const { return seed_; }
    const Rules& rules() const { return rules_; }

private:
    std::uint64_t seed_;
    Rules rules_;
    std::mt19937_64 board_rng_; // Starting grids; independent of the digit stream
    DigitStream stream_;
    Board board_;
};

#endif // GAME_HPP
