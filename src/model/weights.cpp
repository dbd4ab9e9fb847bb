// weights.cpp — canonical ordering, prefix sums and integer scaling

#include "model/weights.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

#include "core/error.hpp"

namespace model {

WeightModel::WeightModel(std::vector<core::Rational> weights) : weights_(std::move(weights)) {
    using core::ErrorKind;
    using core::SolverError;

    const std::size_t n = weights_.size();
    if (n == 0) throw SolverError(ErrorKind::EmptyInput, "no party weights given");
    for (std::size_t i = 0; i < n; ++i) {
        if (sgn(weights_[i]) <= 0) {
            throw SolverError(ErrorKind::NonPositiveWeight,
                              "weight of party " + std::to_string(i) + " is " + core::to_string(weights_[i]));
        }
    }

    order_.resize(n);
    std::iota(order_.begin(), order_.end(), std::size_t{0});
    std::stable_sort(order_.begin(), order_.end(),
                     [&](std::size_t a, std::size_t b) { return weights_[a] > weights_[b]; });

    position_.resize(n);
    for (std::size_t pos = 0; pos < n; ++pos) position_[order_[pos]] = pos;

    prefix_.assign(n + 1, core::Rational(0));
    for (std::size_t pos = 0; pos < n; ++pos) prefix_[pos + 1] = prefix_[pos] + weights_[order_[pos]];
    total_ = prefix_[n];

    // Clear denominators, then strip the common factor of the numerators.
    core::Integer lcm_den(1);
    for (const auto& w : weights_) mpz_lcm(lcm_den.get_mpz_t(), lcm_den.get_mpz_t(), w.get_den_mpz_t());
    scaled_.resize(n);
    core::Integer gcd_num(0);
    for (std::size_t i = 0; i < n; ++i) {
        scaled_[i] = weights_[i].get_num() * (lcm_den / weights_[i].get_den());
        mpz_gcd(gcd_num.get_mpz_t(), gcd_num.get_mpz_t(), scaled_[i].get_mpz_t());
    }
    scaled_total_ = 0;
    for (auto& s : scaled_) {
        s /= gcd_num;
        scaled_total_ += s;
    }
}

core::Rational WeightModel::weight_share_of_top_k(std::size_t k) const {
    return core::Rational(prefix_.at(k) / total_);
}

core::Rational WeightModel::weight_share_of_bottom_k(std::size_t k) const {
    const std::size_t n = size();
    return core::Rational((total_ - prefix_.at(n - std::min(k, n))) / total_);
}

core::Rational WeightModel::share_of(const core::Rational& w) const {
    return core::checked_div(w, total_);
}

} // namespace model
