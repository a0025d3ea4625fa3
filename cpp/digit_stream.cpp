#include "digit_stream.hpp"
#include "errors.hpp"
#include "utils.hpp"     // For drawDigit, debugLoggingEnabled
#include <iostream>
#include <random>
#include <string>

DigitStream::DigitStream(std::uint64_t seed) : consumed_(0) {
    std::mt19937_64 rng_engine(seed);
    source_ = [rng_engine]() mutable { return drawDigit(rng_engine); };
    fill();
}

DigitStream::DigitStream(Source source) : source_(source), consumed_(0) {
    if (!source_) {
        throw GameError(ErrorCode::InvalidArgument, "digit stream needs a source");
    }
    fill();
}

void DigitStream::fill() {
    for (int i = 0; i < LOOKAHEAD; ++i) {
        lookahead_[i] = draw();
    }
}

Digit DigitStream::draw() {
    Digit d = source_();
    if (d < 0 || d >= NUM_DIGITS) {
        throw GameError(ErrorCode::OutOfRange, "digit source produced " + std::to_string(d));
    }
    return d;
}

Digit DigitStream::peek(int n) const {
    if (n < 1 || n > LOOKAHEAD) {
        throw GameError(ErrorCode::OutOfRange,
                        "peek position " + std::to_string(n) + " outside 1.." + std::to_string(LOOKAHEAD));
    }
    return lookahead_[n - 1];
}

Digit DigitStream::next() {
    Digit incoming = draw();
    Digit head = lookahead_[0];
    for (int i = 1; i < LOOKAHEAD; ++i) {
        lookahead_[i - 1] = lookahead_[i];
    }
    lookahead_[LOOKAHEAD - 1] = incoming;
    ++consumed_;
    if (debugLoggingEnabled()) {
        std::cout << "[STREAM_DEBUG] Consumed " << head << ", window now ";
        for (Digit d : lookahead_) std::cout << d;
        std::cout << std::endl;
    }
    return head;
}
