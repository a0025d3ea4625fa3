#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include "board.hpp"
#include "digit_stream.hpp"
#include "game_defs.hpp"
#include "utils.hpp"

#include <cstddef>
#include <memory>
#include <vector>

// Digit source that replays `script` in a loop.
inline DigitStream::Source scriptedSource(const std::vector<Digit>& script) {
    std::shared_ptr<std::size_t> pos = std::make_shared<std::size_t>(0);
    return [script, pos]() -> Digit {
        Digit d = script[*pos % script.size()];
        ++*pos;
        return d;
    };
}

// Empty grid with the given (row, col, value) entries set.
struct TileSpec {
    int row;
    int col;
    Digit value;
};

inline Grid gridWith(const std::vector<TileSpec>& tiles) {
    Grid grid = makeEmptyGrid();
    for (const TileSpec& t : tiles) grid[t.row * COLS + t.col] = t.value;
    return grid;
}

inline int countOccupied(const Board& board) {
    int n = 0;
    for (int row = 0; row < ROWS; ++row)
        for (int col = 0; col < COLS; ++col)
            if (board.valueAt(row, col) != NO_DIGIT) ++n;
    return n;
}

// Everything a caller can observe about a board.
struct BoardSnapshot {
    std::vector<Digit> values;
    int occupied;
    int placements;
    TerminalKind terminal;
    Digit head;

    explicit BoardSnapshot(const Board& board)
        : values(board.flatValues()),
          occupied(board.occupiedCount()),
          placements(board.placementsMade()),
          terminal(board.terminalState().kind),
          head(board.stream().peek(1)) {}

    bool operator==(const BoardSnapshot& other) const {
        return values == other.values && occupied == other.occupied && placements == other.placements &&
               terminal == other.terminal && head == other.head;
    }
};

#endif // TEST_SUPPORT_HPP
