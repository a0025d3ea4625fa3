#include "clear.hpp"
#include "board.hpp"
#include "digit_stream.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string>

namespace {
const int kOrthogonalCount = 4;
const int kMooreCount = 8;
// Row-major order: the Moore offsets, of which indices 1, 3, 4, 6 are orthogonal.
const int kDeltaRow[kMooreCount] = {-1, -1, -1, 0, 0, 1, 1, 1};
const int kDeltaCol[kMooreCount] = {-1, 0, 1, -1, 1, -1, 0, 1};
const int kOrthogonalIndex[kOrthogonalCount] = {1, 3, 4, 6};
}

std::vector<Coord> neighborsOf(int row, int col, Adjacency adjacency) {
    std::vector<Coord> result;
    result.reserve(kMooreCount);
    for (int k = 0; k < kMooreCount; ++k) {
        if (adjacency == Adjacency::Orthogonal &&
            std::find(kOrthogonalIndex, kOrthogonalIndex + kOrthogonalCount, k) ==
                kOrthogonalIndex + kOrthogonalCount) {
            continue;
        }
        int r = row + kDeltaRow[k];
        int c = col + kDeltaCol[k];
        if (r >= 0 && r < ROWS && c >= 0 && c < COLS) {
            result.push_back(Coord{r, c});
        }
    }
    return result;
}

std::vector<Coord> occupiedNeighbors(const Board& board, int row, int col) {
    std::vector<Coord> result;
    for (const Coord& n : neighborsOf(row, col, board.rules().adjacency)) {
        if (board.valueAt(n.row, n.col) != NO_DIGIT) {
            result.push_back(n);
        }
    }
    return result;
}

int neighborSum(const Board& board, const std::vector<Coord>& tiles) {
    int sum = 0;
    for (const Coord& t : tiles) {
        sum += board.valueAt(t.row, t.col);
    }
    return sum % 10;
}

ClearPlan evaluatePlacement(const Board& board, int row, int col, Digit digit) {
    ClearPlan plan;
    std::vector<Coord> occupied = occupiedNeighbors(board, row, col);
    plan.neighbor_sum = neighborSum(board, occupied);
    plan.matched = !occupied.empty() && plan.neighbor_sum == digit;
    if (plan.matched) {
        plan.to_clear = occupied;
        plan.to_clear.push_back(Coord{row, col});
        std::sort(plan.to_clear.begin(), plan.to_clear.end());
    }
    return plan;
}

void printBoard(std::ostream& out, const Board& board) {
    out << "   ";
    for (int col = 0; col < COLS; ++col) out << std::setw(2) << col;
    out << '\n';
    for (int row = 0; row < ROWS; ++row) {
        out << std::setw(2) << row << ' ';
        for (int col = 0; col < COLS; ++col) {
            Digit v = board.valueAt(row, col);
            if (v == NO_DIGIT)
                out << std::setw(2) << '.';
            else
                out << std::setw(2) << v;
        }
        out << '\n';
    }
    out << std::string(3 + COLS * 2, '-') << '\n';
    out << "next:";
    for (Digit d : board.stream().window()) out << ' ' << d;
    out << "  placed: " << board.placementsMade() << "\n\n";
}
