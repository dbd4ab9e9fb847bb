// solve.hpp — public entry points of the allocation engine
#pragma once

#include <vector>

#include "core/rational.hpp"
#include "engine/problem.hpp"

namespace engine {

/**
 * @brief Minimal total and one assignment for (weights, tw, tn, kind).
 *
 * Pure: no shared state, so independent solves may run concurrently and
 * repeated solves return identical results.
 *
 * @throws SolverError(EmptyInput | NonPositiveWeight | InfeasibleThresholds).
 *         With options.debug, SolverError(VerificationFailed) on a defect:
 *         verify::VerificationFailed when a coalition is violated, a plain
 *         SolverError from verify::check_structure otherwise.
 */
Solution solve(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
               const SolveOptions& options = {});

/// Sum-only view of solve().
ticket_t solve_total(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
                     const SolveOptions& options = {});

/**
 * @brief Check any assignment against the critical coalitions.
 * @throws verify::VerificationFailed with the first offending coalition,
 *         SolverError(InvalidAssignment) on wrong length or zero total.
 */
void verify(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
            const Assignment& tickets);

} // namespace engine
