// error.cpp — error kind names

#include "core/error.hpp"

namespace core {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::EmptyInput:           return "EmptyInput";
        case ErrorKind::NonPositiveWeight:    return "NonPositiveWeight";
        case ErrorKind::InvalidNumber:        return "InvalidNumber";
        case ErrorKind::DivisionByZero:       return "DivisionByZero";
        case ErrorKind::InfeasibleThresholds: return "InfeasibleThresholds";
        case ErrorKind::InvalidAssignment:    return "InvalidAssignment";
        case ErrorKind::VerificationFailed:   return "VerificationFailed";
        case ErrorKind::IoError:              return "IoError";
    }
    return "Unknown";
}

SolverError::SolverError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind), message_(message) {}

} // namespace core
