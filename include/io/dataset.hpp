// dataset.hpp — weight files in, ticket assignments out
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "core/rational.hpp"
#include "engine/problem.hpp"

namespace io {

/**
 * @brief Read party weights: whitespace-separated tokens (normally one per
 *        line), blank lines ignored, '#' starts a comment.
 * @throws SolverError(InvalidNumber | DivisionByZero | NonPositiveWeight) with
 *         the offending line number; SolverError(EmptyInput) if none is found.
 */
std::vector<core::Rational> read_weights(std::istream& in);

/**
 * @brief read_weights on a file; "-" reads stdin.
 * @throws SolverError(IoError) if the file cannot be opened.
 */
std::vector<core::Rational> load_weights(const std::string& path);

/**
 * @brief Space-separated tickets in party order, or the total only.
 */
void write_solution(std::ostream& out, const engine::Solution& solution, bool sum_only);

} // namespace io
