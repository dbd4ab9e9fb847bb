// verifier.cpp

#include "verify/verifier.hpp"

#include <string>
#include <utility>

#include "core/log.hpp"

namespace verify {

VerificationFailed::VerificationFailed(oracle::Violation violation)
    : core::SolverError(core::ErrorKind::VerificationFailed, violation.describe()),
      violation_(std::move(violation)) {}

std::optional<oracle::Violation> check_assignment(const model::WeightModel& model, const engine::Thresholds& th,
                                                  engine::ProblemKind kind, const engine::Assignment& tickets) {
    // Always exact, whatever mode produced the assignment.
    const oracle::ConstraintOracle oracle(model, th, kind, oracle::Mode::Exact);
    auto violation = oracle.find_violation(tickets);
    if (violation) core::log::debug("verification failed: ", violation->describe());
    else           core::log::debug("verification passed for N=", engine::total_of(tickets));
    return violation;
}

void verify_assignment(const model::WeightModel& model, const engine::Thresholds& th,
                       engine::ProblemKind kind, const engine::Assignment& tickets) {
    if (auto violation = check_assignment(model, th, kind, tickets)) throw VerificationFailed(std::move(*violation));
}

void check_structure(const model::WeightModel& model, const engine::Solution& s, ticket_t ceiling) {
    using core::ErrorKind;
    if (s.tickets.size() != model.size()) {
        throw core::SolverError(ErrorKind::InvalidAssignment, "assignment has " + std::to_string(s.tickets.size()) +
                                                                  " entries for " + std::to_string(model.size()) +
                                                                  " parties");
    }
    if (engine::total_of(s.tickets) != s.total) {
        throw core::SolverError(ErrorKind::VerificationFailed, "tickets sum to " +
                                                                   std::to_string(engine::total_of(s.tickets)) +
                                                                   ", expected " + std::to_string(s.total));
    }
    for (std::size_t pos = 1; pos < model.size(); ++pos) {
        const std::size_t heavier = model.party_at(pos - 1);
        const std::size_t lighter = model.party_at(pos);
        if (model.weight(heavier) == model.weight(lighter) && s.tickets[heavier] != s.tickets[lighter]) {
            throw core::SolverError(ErrorKind::VerificationFailed,
                                    "parties " + std::to_string(heavier) + " and " + std::to_string(lighter) +
                                        " have equal weight but hold " + std::to_string(s.tickets[heavier]) +
                                        " and " + std::to_string(s.tickets[lighter]) + " tickets");
        }
        if (s.tickets[heavier] < s.tickets[lighter]) {
            throw core::SolverError(ErrorKind::VerificationFailed,
                                    "party " + std::to_string(heavier) + " outweighs party " +
                                        std::to_string(lighter) + " but holds fewer tickets");
        }
    }
    if (s.total > ceiling) {
        throw core::SolverError(ErrorKind::VerificationFailed, "total " + std::to_string(s.total) +
                                                                   " exceeds the search bound " +
                                                                   std::to_string(ceiling));
    }
}

} // namespace verify
