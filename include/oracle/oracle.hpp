// oracle.hpp — critical-coalition constraint checks for WR / WQ
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/rational.hpp"
#include "engine/problem.hpp"
#include "model/weights.hpp"

namespace oracle {

/**
 * @brief Exact: the class-suffix dynamic program decides every assignment.
 *        Linear: the fractional-knapsack bound certifies feasibility during
 *        the search; it never accepts an invalid assignment but may reject a
 *        valid one.
 */
enum class Mode { Exact, Linear };

struct Coalition {
    std::vector<std::size_t> parties; // original indices, ascending
    core::Rational weight_share;
    core::Rational ticket_share;
    ticket_t tickets{0};
};

struct Violation {
    engine::ProblemKind kind;
    engine::Thresholds thresholds;
    Coalition coalition;

    std::string describe() const;
};

/**
 * @brief Answers "does this assignment honor the problem's constraint" without
 *        enumerating the 2^n coalitions.
 *
 * Critical coalitions, in the order they are examined:
 *  1. sorted-order coalitions: bottom-k suffixes for WR (lightest parties whose
 *     share stays < tw), top-k prefixes for WQ (heaviest parties from the first
 *     prefix reaching tw onwards);
 *  2. class suffixes: among parties holding the same ticket count only the
 *     lightest k can be binding, so the lightest coalition holding a given
 *     number of tickets is a union of per-class suffixes. A dynamic program
 *     over the classes finds it.
 * WQ is checked through complements: a coalition of weight >= tw*W holding
 * < tn*N tickets exists iff a coalition of weight <= (1-tw)*W holds
 * >= N - ceil(tn*N) + 1 tickets.
 *
 * Boundary convention: a share equal to tw is "< tw" for nobody (WR leaves it
 * unconstrained) and ">= tw" for WQ.
 */
class ConstraintOracle {
public:
    /**
     * @throws SolverError(InfeasibleThresholds) if tw or tn is outside (0, 1).
     */
    ConstraintOracle(const model::WeightModel& model, engine::Thresholds th,
                     engine::ProblemKind kind, Mode mode = Mode::Exact);

    engine::ProblemKind kind() const noexcept { return kind_; }
    const engine::Thresholds& thresholds() const noexcept { return th_; }
    const model::WeightModel& model() const noexcept { return model_; }
    Mode mode() const noexcept { return mode_; }

    /// Whether a coalition with this weight share is subject to the constraint.
    bool constrains(const core::Rational& weight_share) const;

    /// Whether a constrained coalition may hold `tickets` out of `total`.
    bool satisfies(ticket_t tickets, ticket_t total) const;

    /// WR: most tickets a constrained coalition may hold (ceil(tn*N) - 1).
    /// WQ: fewest tickets a constrained coalition must hold (ceil(tn*N)).
    ticket_t ticket_bound(ticket_t total) const;

    /// Sorted prefix/suffix scan only; first violation in sorted order.
    std::optional<Violation> scan_critical(const engine::Assignment& tickets) const;

    /// Exact decision for any assignment (monotone or not).
    /// @throws SolverError(InvalidAssignment) on wrong length or zero total.
    std::optional<Violation> find_violation(const engine::Assignment& tickets) const;

    bool feasible(const engine::Assignment& tickets) const { return !find_violation(tickets); }

    /**
     * @brief Acceptance under this oracle's mode. Exact agrees with feasible();
     *        Linear accepts only what the fractional certificate proves.
     */
    bool accepts(const engine::Assignment& tickets) const;

    /**
     * @brief Whether some constrained coalition breaks the bound when shares are
     *        taken against `total` tickets rather than the bound's own sum.
     *
     * Always exact. WR callers pass a componentwise lower bound of the
     * assignment being built, WQ callers an upper bound; a violation then holds
     * for every assignment of `total` tickets between them.
     * @throws SolverError(InvalidAssignment) on wrong length.
     */
    bool violated_at(const engine::Assignment& bound, ticket_t total) const;

    /**
     * @brief Fractional-knapsack certificate (greedy by tickets per weight).
     * @return true if the assignment is certainly valid.
     */
    bool certify_linear(const engine::Assignment& tickets) const;

    Coalition make_coalition(std::vector<std::size_t> parties, const engine::Assignment& tickets) const;

private:
    void check_shape(const engine::Assignment& tickets) const;
    ticket_t knapsack_target(ticket_t held, ticket_t total) const;
    std::vector<std::size_t> complement(const std::vector<std::size_t>& parties) const;
    Violation make_violation(std::vector<std::size_t> parties, const engine::Assignment& tickets) const;
    std::optional<std::vector<std::size_t>> scan_parties(const engine::Assignment& tickets, ticket_t total) const;
    bool certify_at(const engine::Assignment& tickets, ticket_t total) const;
    std::optional<std::vector<std::size_t>> knapsack_witness(const engine::Assignment& tickets, ticket_t total) const;

    const model::WeightModel& model_;
    engine::Thresholds th_;
    engine::ProblemKind kind_;
    Mode mode_;
    core::Integer capacity_; // scaled weight limit of the knapsack side
};

} // namespace oracle
