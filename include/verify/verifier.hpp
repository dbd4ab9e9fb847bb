// verifier.hpp — independent re-check of a ticket assignment
#pragma once

#include <optional>

#include "core/error.hpp"
#include "engine/problem.hpp"
#include "model/weights.hpp"
#include "oracle/oracle.hpp"

namespace verify {

/**
 * @brief Raised when an assignment breaks a critical coalition bound; carries
 *        the first offending coalition found in sorted order.
 */
class VerificationFailed : public core::SolverError {
public:
    explicit VerificationFailed(oracle::Violation violation);

    const oracle::Violation& violation() const noexcept { return violation_; }
    const core::Rational& weight_share() const noexcept { return violation_.coalition.weight_share; }
    const core::Rational& ticket_share() const noexcept { return violation_.coalition.ticket_share; }

private:
    oracle::Violation violation_;
};

/**
 * @brief Re-derive the critical coalitions with a fresh exact oracle and return
 *        the first violation, if any. Never modifies the assignment.
 * @throws SolverError(InvalidAssignment) on wrong length or zero total.
 */
std::optional<oracle::Violation> check_assignment(const model::WeightModel& model, const engine::Thresholds& th,
                                                  engine::ProblemKind kind, const engine::Assignment& tickets);

/**
 * @brief check_assignment that throws.
 * @throws VerificationFailed
 */
void verify_assignment(const model::WeightModel& model, const engine::Thresholds& th,
                       engine::ProblemKind kind, const engine::Assignment& tickets);

/**
 * @brief Structural checks no coalition covers: the tickets sum to s.total,
 *        equal weights hold equal counts and heavier parties never fewer, and
 *        s.total does not exceed `ceiling`.
 * @throws SolverError(VerificationFailed) naming the offending parties (no
 *         coalition, so not a VerificationFailed), SolverError(InvalidAssignment)
 *         on wrong length.
 */
void check_structure(const model::WeightModel& model, const engine::Solution& s, ticket_t ceiling);

} // namespace verify
