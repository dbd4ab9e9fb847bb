// problem.hpp — problem kinds, thresholds and result types shared by the engine
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "core/rational.hpp"

namespace engine {

/**
 * @brief WR: coalitions below tw of the weight stay below tn of the tickets.
 *        WQ: coalitions at or above tw of the weight get at least tn of the tickets.
 *
 * Weight separation is reserved and not implemented.
 */
enum class ProblemKind { WeightRestriction, WeightQualification };

const char* to_string(ProblemKind kind) noexcept;

/// Accepts "wr" / "wq" (any case); nullopt otherwise.
std::optional<ProblemKind> parse_problem_kind(std::string_view text) noexcept;

struct Thresholds {
    core::Rational tw; // share of total weight
    core::Rational tn; // share of total tickets
};

/**
 * @brief Reject thresholds outside the open interval (0, 1).
 * @throws SolverError(InfeasibleThresholds)
 */
void validate_thresholds(const Thresholds& th);

/**
 * @brief True when a closed-form bound exists (WR: tw < tn, WQ: tw > tn).
 */
bool has_closed_form_bound(const Thresholds& th, ProblemKind kind);

/// Tickets per party, indexed by original party index.
using Assignment = std::vector<ticket_t>;

ticket_t total_of(const Assignment& tickets) noexcept;

struct Solution {
    ticket_t total{0};
    Assignment tickets;
    bool minimal{true}; // false when the search budget ran out below total
};

struct SolveOptions {
    bool allow_zero_tickets{false};   // else every party gets >= 1 ticket
    bool linear{false};               // certify with the fractional-knapsack bound
    bool debug{false};                // re-verify the final assignment
    std::size_t max_search_steps{CORE_SEARCH_MAX_STEPS};
    std::size_t max_search_nodes{CORE_SEARCH_MAX_NODES};     // oracle calls of the exhaustive search
    std::size_t max_scan_totals{CORE_FALLBACK_MAX_TICKETS};  // totals tried without a closed-form bound
};

} // namespace engine
