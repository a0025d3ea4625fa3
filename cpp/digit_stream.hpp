#ifndef DIGIT_STREAM_HPP
#define DIGIT_STREAM_HPP

#include "game_defs.hpp" // For Digit, LOOKAHEAD
#include <array>
#include <cstdint>
#include <functional>

// Infinite sequence of digits with a fixed look-ahead window.
// Position 1 is the head: the only digit that may be placed next.
class DigitStream {
public:
    using Source = std::function<Digit()>;

    // Uniform digits from a std::mt19937_64 seeded with `seed`.
    explicit DigitStream(std::uint64_t seed);
    // Digits from an arbitrary source; every value must be in 0..NUM_DIGITS-1.
    explicit DigitStream(Source source);

    // n-th upcoming digit, 1-indexed. Throws GameError(OutOfRange) unless 1 <= n <= LOOKAHEAD.
    Digit peek(int n) const;

    // Consumes the head, shifts the window left and draws a new last digit.
    Digit next();

    // The whole window, head first.
    const std::array<Digit, LOOKAHEAD>& window() const { return lookahead_; }

    // Number of digits consumed so far.
    std::uint64_t consumed() const { return consumed_; }

private:
    Digit draw();
    void fill();

    Source source_;
    std::array<Digit, LOOKAHEAD> lookahead_;
    std::uint64_t consumed_;
};

#endif // DIGIT_STREAM_HPP
