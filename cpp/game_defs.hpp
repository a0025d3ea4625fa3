#ifndef GAME_DEFS_HPP
#define GAME_DEFS_HPP

#include <array>
#include <vector>

// Define fundamental types for clarity
using Digit = int;               // A stone value, 0..9
const Digit NO_DIGIT = -1;       // Marks a free tile

// === Game Configuration ===
const int ROWS = 9;              // Number of rows on the game board
const int COLS = 9;              // Number of columns on the game board
const int TILE_COUNT = ROWS * COLS;
const int BORDER = 1;            // Width of the ring that starts empty
const int NUM_DIGITS = 10;       // Digits are drawn from 0..NUM_DIGITS-1
const int LOOKAHEAD = 4;         // Upcoming digits visible to the player
// ==========================

enum class Origin { Fixed, Placed };

struct Tile {
    Digit value;
    Origin origin;

    bool is_free() const { return value == NO_DIGIT; }
};

struct Coord {
    int row;
    int col;
};

inline bool operator==(const Coord& a, const Coord& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Coord& a, const Coord& b) { return !(a == b); }
inline bool operator<(const Coord& a, const Coord& b) {
    return a.row < b.row || (a.row == b.row && a.col < b.col);
}

// Starting values in row-major order; NO_DIGIT for tiles that start free.
using Grid = std::array<Digit, TILE_COUNT>;

enum class Adjacency {
    Orthogonal,  // up, down, left, right
    Moore        // the four orthogonal tiles plus the four diagonals
};

// Rule set a board is played with.
struct Rules {
    Adjacency adjacency;

    Rules() : adjacency(Adjacency::Orthogonal) {}
    explicit Rules(Adjacency adj) : adjacency(adj) {}
};

enum class TerminalKind { Ongoing, Won, Stuck };

struct TerminalState {
    TerminalKind kind;
    int placements;  // the score when kind == Won

    bool is_over() const { return kind != TerminalKind::Ongoing; }
};

struct PlacementResult {
    bool matched;
    std::vector<Coord> cleared_tiles;  // row-major, no duplicates
    TerminalState terminal;
};

// Preferred scan direction when looking for the next free tile.
enum class Direction { Any, North, South, East, West };

#endif // GAME_DEFS_HPP
