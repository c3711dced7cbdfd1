#pragma once
#include <stdexcept>
#include <string>

namespace salvage {

enum class ErrorCode {
    MalformedDescriptor,
    UnsupportedErasureType,
    InconsistentPieceLength,
    NotEnoughPieces,
    UnsupportedCipher,
    NoContract,
    Transport,
    Io,
    Config
};

const char* error_code_name(ErrorCode code);

// Structural failures. Per-host failures never throw, they travel as values.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ErrorCode code() const noexcept { return code_; }
private:
    ErrorCode code_;
};

} // namespace salvage
