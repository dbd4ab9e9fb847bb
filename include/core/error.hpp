// error.hpp — typed failures reported by the engine and its loaders
#pragma once

#include <stdexcept>
#include <string>

namespace core {

enum class ErrorKind {
    EmptyInput,
    NonPositiveWeight,
    InvalidNumber,
    DivisionByZero,
    InfeasibleThresholds,
    InvalidAssignment,
    VerificationFailed,
    IoError,
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying an ErrorKind; what() is "<Kind>: <message>".
 * @note The computation is pure, so none of these is ever retried.
 */
class SolverError : public std::runtime_error {
public:
    SolverError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }
    /// The message without the kind prefix.
    const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace core
