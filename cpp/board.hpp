#ifndef BOARD_HPP
#define BOARD_HPP

#include "game_defs.hpp" // For Tile, Grid, Coord, Rules, PlacementResult
#include <array>
#include <vector>

class DigitStream;

// ROWS x COLS grid of tiles paired with the digit stream it is fed from.
// The board only reads the stream (to check the head digit); the caller
// consumes it after each accepted placement.
class Board {
public:
    // Every non-NO_DIGIT value in `starting_values` becomes a Fixed tile.
    // An empty grid starts Won and a full one Stuck.
    // Throws GameError(InvalidBoard) on a value outside 0..9.
    // The board keeps a reference to `stream`, which must outlive it.
    Board(const Grid& starting_values, const DigitStream& stream, Rules rules = Rules());

    // Places `digit` on the free tile (row, col) and clears the tile and its
    // occupied neighbours when their sum mod 10 equals the digit.
    // Throws GameError with GameOver, OutOfBounds, TileOccupied or
    // DigitMismatch (digit differs from stream head); the board is unchanged then.
    PlacementResult place(int row, int col, Digit digit);

    Digit valueAt(int row, int col) const;        // NO_DIGIT when free
    const Tile& tileAt(int row, int col) const;
    std::vector<Coord> freeTiles() const;         // row-major, recomputed on each call
    std::vector<Digit> flatValues() const;        // row-major, NO_DIGIT when free

    // Next free tile starting from `from`: Any scans row-major from the tile
    // after `from`, the compass directions scan the row or column of `from`,
    // wrapping around. Returns false when no such tile exists.
    bool findFree(const Coord& from, Direction direction, Coord& out) const;

    bool isTerminal() const { return terminal_.is_over(); }
    TerminalState terminalState() const { return terminal_; }
    int placementsMade() const { return placements_made_; }
    int occupiedCount() const { return occupied_count_; }
    int freeCount() const { return TILE_COUNT - occupied_count_; }
    const Rules& rules() const { return rules_; }
    const DigitStream& stream() const { return *stream_; }

private:
    static int index(int row, int col) { return row * COLS + col; }
    static bool inBounds(int row, int col) { return row >= 0 && row < ROWS && col >= 0 && col < COLS; }
    void checkBounds(int row, int col) const;
    TerminalState evaluateTerminal() const;

    std::array<Tile, TILE_COUNT> tiles_;
    const DigitStream* stream_;
    Rules rules_;
    int placements_made_;
    int occupied_count_;
    TerminalState terminal_;
};

#endif // BOARD_HPP
