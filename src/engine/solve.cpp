// solve.cpp — facade wiring weight model, allocator and verifier

#include "engine/solve.hpp"

#include "alloc/allocator.hpp"
#include "core/log.hpp"
#include "model/weights.hpp"
#include "verify/verifier.hpp"

namespace engine {

Solution solve(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
               const SolveOptions& options) {
    const model::WeightModel model(weights);
    const alloc::Allocator allocator(model, th, kind, options);

    core::log::info("Problem: ", to_string(kind), " < n=", model.size(), ", tw=", th.tw, ", tn=", th.tn, " >");
    core::log::info("Total weight: ", model.total());
    core::log::info("Threshold weight: ", core::Rational(th.tw * model.total()));

    Solution solution = allocator.solve();

    if (options.debug) {
        core::log::debug("Verifying the final solution...");
        verify::check_structure(model, solution, allocator.upper_bound());
        // Fresh model: the check must not share state with the allocator.
        const model::WeightModel fresh(weights);
        verify::verify_assignment(fresh, th, kind, solution.tickets);
    }

    core::log::info("Total tickets allocated: ", solution.total, solution.minimal ? "." : " (not proven minimal).");
    return solution;
}

ticket_t solve_total(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
                     const SolveOptions& options) {
    return solve(weights, th, kind, options).total;
}

void verify(const std::vector<core::Rational>& weights, const Thresholds& th, ProblemKind kind,
            const Assignment& tickets) {
    const model::WeightModel model(weights);
    verify::verify_assignment(model, th, kind, tickets);
}

} // namespace engine
