// allocator.hpp — minimal-total search and ticket construction
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "engine/problem.hpp"
#include "model/weights.hpp"
#include "oracle/oracle.hpp"

namespace alloc {

/**
 * @brief Finds the smallest total N that admits a valid assignment and
 *        returns one.
 *
 * Only class-uniform assignments are built: parties of equal weight form a
 * class and share one count, and counts never increase along the canonical
 * order. Every party gets at least the floor (1, or 0 with allow_zero_tickets).
 *
 * solve() runs in three stages:
 *  1. a partition argument rejects thresholds that no total can satisfy;
 *  2. with a closed-form bound (WR: tw < tn, WQ: tw > tn) the proportional
 *     allocation floor + floor(w_i * M / W) is valid at the closed-form M, and
 *     a binary search on M shrinks it;
 *  3. totals from lower_bound() upwards are searched exhaustively, class by
 *     class, pruning on the oracle's bound checks. The first total with an
 *     assignment is the minimum. When the oracle-call budget runs out the
 *     stage-2 allocation is returned with Solution::minimal cleared.
 */
class Allocator {
public:
    /**
     * @throws SolverError(InfeasibleThresholds) if tw or tn is outside (0, 1).
     */
    Allocator(const model::WeightModel& model, const engine::Thresholds& th,
              engine::ProblemKind kind, const engine::SolveOptions& options = {});

    const oracle::ConstraintOracle& oracle() const noexcept { return oracle_; }

    /// n with the one-ticket floor, 1 without.
    ticket_t lower_bound() const noexcept;

    /**
     * @brief Search ceiling. Closed form when the thresholds admit one (the
     *        proportional allocation is valid there), otherwise the last total
     *        the ascending scan tries (lower_bound() + max_scan_totals - 1).
     * @throws SolverError(InfeasibleThresholds) if the closed form overflows ticket_t.
     */
    ticket_t upper_bound() const;

    /// floor + floor(w_i * spare / W) per party.
    engine::Assignment proportional(ticket_t spare) const;

    /// Why no total at all can be valid, or nullopt when no partition argument applies.
    std::optional<std::string> infeasibility() const;

    /**
     * @brief A valid class-uniform assignment of exactly `total` tickets.
     *
     * nullopt when none exists or when max_search_nodes oracle calls did not
     * settle the question.
     */
    std::optional<engine::Assignment> construct(ticket_t total) const;

    /**
     * @throws SolverError(InfeasibleThresholds) if infeasibility() applies, or
     *         if no total up to the ceiling has an assignment.
     */
    engine::Solution solve() const;

private:
    enum class Outcome { Found, Exhausted, OutOfBudget };

    struct Class {
        std::size_t first; // canonical position of the heaviest member
        std::size_t size;
    };

    struct Search {
        ticket_t total;
        std::size_t budget;
        std::vector<ticket_t> values; // per class
        engine::Assignment bound;     // per party
    };

    ticket_t spare_ceiling() const;
    engine::Solution bisect() const;
    Outcome search(ticket_t total, std::size_t& budget, engine::Assignment& out) const;
    Outcome descend(Search& s, std::size_t c, ticket_t cap, ticket_t left) const;
    void fill_bound(Search& s, std::size_t c, ticket_t value) const;

    const model::WeightModel& model_;
    oracle::ConstraintOracle oracle_;  // mode follows options.linear
    oracle::ConstraintOracle exact_;
    engine::SolveOptions options_;
    ticket_t floor_;
    bool closed_form_;
    std::vector<Class> classes_;
    std::vector<std::size_t> after_; // parties in classes c+1.. for each class c
};

} // namespace alloc
