#include "errors.hpp"

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OutOfBounds:     return "OutOfBounds";
        case ErrorCode::TileOccupied:    return "TileOccupied";
        case ErrorCode::DigitMismatch:   return "DigitMismatch";
        case ErrorCode::OutOfRange:      return "OutOfRange";
        case ErrorCode::GameOver:        return "GameOver";
        case ErrorCode::InvalidBoard:    return "InvalidBoard";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

GameError::GameError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(errorCodeName(code)) + ": " + message), code_(code) {}
