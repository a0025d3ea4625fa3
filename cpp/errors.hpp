#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

enum class ErrorCode {
    OutOfBounds,     // coordinate outside the board
    TileOccupied,    // placement on a tile that already holds a digit
    DigitMismatch,   // digit is not the head of the stream
    OutOfRange,      // look-ahead position outside 1..LOOKAHEAD
    GameOver,        // mutating call after the game ended
    InvalidBoard,    // malformed starting grid or board file
    InvalidArgument  // bad command-line value
};

// Short stable name for an error code, e.g. "TileOccupied".
const char* errorCodeName(ErrorCode code);

// Every rejection raised by the engine. Nothing is mutated before one is thrown.
class GameError : public std::runtime_error {
public:
    GameError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

#endif // ERRORS_HPP
