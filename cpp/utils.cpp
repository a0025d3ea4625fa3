#include "utils.hpp"
#include "errors.hpp"
#include <fstream>
#include <istream>
#include <limits>
#include <sstream>

namespace {
bool debug_logging = false;
}

Digit drawDigit(std::mt19937_64& rng_engine) {
    // Largest multiple of NUM_DIGITS representable; values at or above it are redrawn.
    const std::uint64_t max_value = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t limit = max_value - (max_value % NUM_DIGITS);
    std::uint64_t x;
    do {
        x = rng_engine();
    } while (x >= limit);
    return static_cast<Digit>(x % NUM_DIGITS);
}

std::uint64_t deriveSeed(std::uint64_t seed, std::uint64_t stream_id) {
    std::uint64_t z = seed + (stream_id + 1) * 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

std::uint64_t entropySeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

Grid makeEmptyGrid() {
    Grid grid;
    grid.fill(NO_DIGIT);
    return grid;
}

Grid makeStartingGrid(std::mt19937_64& rng_engine) {
    Grid grid = makeEmptyGrid();
    for (int row = BORDER; row < ROWS - BORDER; ++row) {
        for (int col = BORDER; col < COLS - BORDER; ++col) {
            grid[row * COLS + col] = drawDigit(rng_engine);
        }
    }
    return grid;
}

Grid parseGrid(std::istream& in) {
    Grid grid = makeEmptyGrid();
    std::string line;
    int row = 0;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string cells;
        for (char ch : line) {
            if (ch != ' ' && ch != '\t' && ch != '\r') cells.push_back(ch);
        }
        if (cells.empty() || cells[0] == '#') continue;

        if (row >= ROWS) {
            throw GameError(ErrorCode::InvalidBoard,
                            "line " + std::to_string(line_no) + ": more than " + std::to_string(ROWS) + " rows");
        }
        if (static_cast<int>(cells.size()) != COLS) {
            throw GameError(ErrorCode::InvalidBoard,
                            "line " + std::to_string(line_no) + ": expected " + std::to_string(COLS) +
                                " cells, got " + std::to_string(cells.size()));
        }
        for (int col = 0; col < COLS; ++col) {
            char ch = cells[col];
            if (ch == '.') {
                grid[row * COLS + col] = NO_DIGIT;
            } else if (ch >= '0' && ch <= '9') {
                grid[row * COLS + col] = ch - '0';
            } else {
                throw GameError(ErrorCode::InvalidBoard,
                                "line " + std::to_string(line_no) + ": unexpected character '" + ch + "'");
            }
        }
        ++row;
    }
    if (row != ROWS) {
        throw GameError(ErrorCode::InvalidBoard,
                        "expected " + std::to_string(ROWS) + " rows, got " + std::to_string(row));
    }
    return grid;
}

Grid loadGridFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GameError(ErrorCode::InvalidBoard, "could not open " + path);
    }
    return parseGrid(file);
}

std::string formatGrid(const Grid& grid) {
    std::ostringstream oss;
    for (int row = 0; row < ROWS; ++row) {
        for (int col = 0; col < COLS; ++col) {
            Digit v = grid[row * COLS + col];
            oss << (v == NO_DIGIT ? '.' : static_cast<char>('0' + v));
        }
        oss << '\n';
    }
    return oss.str();
}

void setDebugLogging(bool enabled) {
    debug_logging = enabled;
}

bool debugLoggingEnabled() {
    return debug_logging;
}
