// weights.hpp — sorted, indexed view of one solve's party weights
#pragma once

#include <cstddef>
#include <vector>

#include "core/rational.hpp"

namespace model {

/**
 * @brief Immutable weight structure for one solve.
 *
 * Positions refer to the canonical order: descending weight, ties by
 * ascending original index. Parties are original indices 0..n-1.
 *
 * Besides the exact weights the model keeps integer-scaled copies
 * (w_i * lcm(denominators) / gcd(numerators)); shares computed from them are
 * identical to the exact shares.
 */
class WeightModel {
public:
    /**
     * @throws SolverError(EmptyInput) if weights is empty,
     *         SolverError(NonPositiveWeight) if any weight is <= 0.
     */
    explicit WeightModel(std::vector<core::Rational> weights);

    std::size_t size() const noexcept { return weights_.size(); }

    const core::Rational& total() const noexcept { return total_; }
    const core::Rational& weight(std::size_t party) const { return weights_.at(party); }
    const std::vector<core::Rational>& weights() const noexcept { return weights_; }

    const core::Rational& sorted_weight(std::size_t pos) const { return weights_[order_.at(pos)]; }
    std::size_t party_at(std::size_t pos) const { return order_.at(pos); }
    std::size_t position_of(std::size_t party) const { return position_.at(party); }
    const std::vector<std::size_t>& order() const noexcept { return order_; }

    /// Sum of the k heaviest weights; k in [0, n].
    const core::Rational& prefix_sum(std::size_t k) const { return prefix_.at(k); }

    /// prefix_sum(k) / W, O(1).
    core::Rational weight_share_of_top_k(std::size_t k) const;
    /// Share of the k lightest parties, O(1).
    core::Rational weight_share_of_bottom_k(std::size_t k) const;
    /// w / W for an arbitrary coalition weight.
    core::Rational share_of(const core::Rational& w) const;

    const core::Integer& scaled_weight(std::size_t party) const { return scaled_.at(party); }
    const core::Integer& scaled_total() const noexcept { return scaled_total_; }

private:
    std::vector<core::Rational> weights_;
    std::vector<std::size_t> order_;
    std::vector<std::size_t> position_;
    std::vector<core::Rational> prefix_;
    core::Rational total_;
    std::vector<core::Integer> scaled_;
    core::Integer scaled_total_;
};

} // namespace model
