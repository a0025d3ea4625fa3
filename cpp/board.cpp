#include "board.hpp"
#include "clear.hpp"
#include "digit_stream.hpp"
#include "errors.hpp"
#include "utils.hpp"     // For debugLoggingEnabled
#include <iostream>
#include <string>

namespace {
std::string coordText(int row, int col) {
    return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
}
}

Board::Board(const Grid& starting_values, const DigitStream& stream, Rules rules)
    : stream_(&stream), rules_(rules), placements_made_(0), occupied_count_(0),
      terminal_(TerminalState{TerminalKind::Ongoing, 0}) {
    for (int i = 0; i < TILE_COUNT; ++i) {
        Digit v = starting_values[i];
        if (v != NO_DIGIT && (v < 0 || v >= NUM_DIGITS)) {
            throw GameError(ErrorCode::InvalidBoard,
                            "starting value " + std::to_string(v) + " at " + coordText(i / COLS, i % COLS));
        }
        tiles_[i] = Tile{v, Origin::Fixed};
        if (v != NO_DIGIT) ++occupied_count_;
    }
    // An empty starting grid is already won, a full one can take no placement.
    terminal_ = evaluateTerminal();
}

void Board::checkBounds(int row, int col) const {
    if (!inBounds(row, col)) {
        throw GameError(ErrorCode::OutOfBounds, coordText(row, col) + " is outside the board");
    }
}

Digit Board::valueAt(int row, int col) const {
    checkBounds(row, col);
    return tiles_[index(row, col)].value;
}

const Tile& Board::tileAt(int row, int col) const {
    checkBounds(row, col);
    return tiles_[index(row, col)];
}

std::vector<Coord> Board::freeTiles() const {
    std::vector<Coord> result;
    result.reserve(freeCount());
    for (int i = 0; i < TILE_COUNT; ++i) {
        if (tiles_[i].is_free()) result.push_back(Coord{i / COLS, i % COLS});
    }
    return result;
}

std::vector<Digit> Board::flatValues() const {
    std::vector<Digit> flat;
    flat.reserve(TILE_COUNT);
    for (const Tile& t : tiles_) flat.push_back(t.value);
    return flat;
}

TerminalState Board::evaluateTerminal() const {
    if (occupied_count_ == 0) return TerminalState{TerminalKind::Won, placements_made_};
    if (occupied_count_ == TILE_COUNT) return TerminalState{TerminalKind::Stuck, placements_made_};
    return TerminalState{TerminalKind::Ongoing, placements_made_};
}

PlacementResult Board::place(int row, int col, Digit digit) {
    if (terminal_.is_over()) {
        throw GameError(ErrorCode::GameOver, "no placement possible on a finished board");
    }
    checkBounds(row, col);
    Tile& target = tiles_[index(row, col)];
    if (!target.is_free()) {
        throw GameError(ErrorCode::TileOccupied, coordText(row, col) + " already holds " + std::to_string(target.value));
    }
    Digit head = stream_->peek(1);
    if (digit != head) {
        throw GameError(ErrorCode::DigitMismatch,
                        "placing " + std::to_string(digit) + " but the stream head is " + std::to_string(head));
    }

    ClearPlan plan = evaluatePlacement(*this, row, col, digit);

    target.value = digit;
    target.origin = Origin::Placed;
    ++occupied_count_;
    if (plan.matched) {
        for (const Coord& c : plan.to_clear) {
            tiles_[index(c.row, c.col)].value = NO_DIGIT;
            --occupied_count_;
        }
    }
    ++placements_made_;
    terminal_ = evaluateTerminal();

    if (debugLoggingEnabled()) {
        std::cout << "[PLACE_DEBUG] Digit=" << digit << " at " << coordText(row, col)
                  << " neighbour sum=" << plan.neighbor_sum << (plan.matched ? " MATCH" : " no match")
                  << " cleared=" << plan.to_clear.size() << " occupied=" << occupied_count_
                  << " placements=" << placements_made_ << std::endl;
    }

    PlacementResult result;
    result.matched = plan.matched;
    result.cleared_tiles = plan.to_clear;
    result.terminal = terminal_;
    return result;
}

bool Board::findFree(const Coord& from, Direction direction, Coord& out) const {
    checkBounds(from.row, from.col);
    if (occupied_count_ == TILE_COUNT) return false;

    switch (direction) {
        case Direction::Any: {
            // Row-major from the tile after `from`, ending on `from` itself.
            int start = index(from.row, from.col) + 1;
            for (int k = 0; k < TILE_COUNT; ++k) {
                int i = (start + k) % TILE_COUNT;
                if (tiles_[i].is_free()) {
                    out = Coord{i / COLS, i % COLS};
                    return true;
                }
            }
            return false;
        }
        case Direction::North:
        case Direction::South: {
            int step = direction == Direction::North ? ROWS - 1 : 1;
            for (int k = 1; k <= ROWS; ++k) {
                int r = (from.row + k * step) % ROWS;
                if (tiles_[index(r, from.col)].is_free()) {
                    out = Coord{r, from.col};
                    return true;
                }
            }
            return false;
        }
        case Direction::East:
        case Direction::West: {
            int step = direction == Direction::West ? COLS - 1 : 1;
            for (int k = 1; k <= COLS; ++k) {
                int c = (from.col + k * step) % COLS;
                if (tiles_[index(from.row, c)].is_free()) {
                    out = Coord{from.row, c};
                    return true;
                }
            }
            return false;
        }
    }
    return false;
}
