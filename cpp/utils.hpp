#ifndef UTILS_HPP
#define UTILS_HPP

#include "game_defs.hpp" // For Digit, Grid
#include <cstdint>
#include <iosfwd>
#include <random>        // For digit generation
#include <string>

// Draws one digit uniformly from 0..NUM_DIGITS-1.
// Uses rejection sampling on the raw engine output instead of
// std::uniform_int_distribution, whose algorithm differs between standard
// libraries; a given seed therefore yields the same digits everywhere.
Digit drawDigit(std::mt19937_64& rng_engine);

// Mixes a user seed with a stream id (SplitMix64 finalizer) so that one seed
// can drive several independent engines.
std::uint64_t deriveSeed(std::uint64_t seed, std::uint64_t stream_id);

// A fresh seed from std::random_device.
std::uint64_t entropySeed();

// Random starting grid: the centre (ROWS-2*BORDER) x (COLS-2*BORDER) region
// holds random digits, the border ring is free.
Grid makeStartingGrid(std::mt19937_64& rng_engine);

// Grid with every tile free.
Grid makeEmptyGrid();

// Plain-text board format: ROWS lines of COLS characters, '0'-'9' for a
// starting digit and '.' for a free tile. Whitespace inside a line is ignored,
// as are blank lines and lines starting with '#'.
// Throws GameError(InvalidBoard) on malformed input.
Grid parseGrid(std::istream& in);
Grid loadGridFile(const std::string& path);
std::string formatGrid(const Grid& grid);

// Process-wide switch for the [..._DEBUG] trace lines; off by default.
void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

#endif // UTILS_HPP
