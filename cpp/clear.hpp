#ifndef CLEAR_HPP
#define CLEAR_HPP

#include "game_defs.hpp" // For Coord, Digit, Adjacency
#include <iosfwd>
#include <vector>

class Board;

// Outcome of checking a placement before it is applied.
struct ClearPlan {
    bool matched;
    int neighbor_sum;               // sum of occupied neighbour values, mod 10
    std::vector<Coord> to_clear;    // placed tile plus its occupied neighbours, row-major; empty unless matched
};

// In-bounds neighbours of (row, col), in row-major order.
std::vector<Coord> neighborsOf(int row, int col, Adjacency adjacency);

// Neighbours of (row, col) that currently hold a digit.
std::vector<Coord> occupiedNeighbors(const Board& board, int row, int col);

// Sum of the values at `tiles`, mod 10.
int neighborSum(const Board& board, const std::vector<Coord>& tiles);

// Decides whether placing `digit` on the free tile (row, col) is a match.
// A match needs at least one occupied neighbour and a neighbour sum (mod 10)
// equal to the digit. Single pass: clearing never re-triggers a check.
ClearPlan evaluatePlacement(const Board& board, int row, int col, Digit digit);

// Pretty-printer for the game board
void printBoard(std::ostream& out, const Board& board);

#endif // CLEAR_HPP
