// allocator.cpp — partition certificates, proportional bisection, class search on N

#include "alloc/allocator.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "core/error.hpp"
#include "core/log.hpp"

namespace alloc {

using engine::ProblemKind;

Allocator::Allocator(const model::WeightModel& model, const engine::Thresholds& th,
                     ProblemKind kind, const engine::SolveOptions& options)
    : model_(model),
      oracle_(model, th, kind, options.linear ? oracle::Mode::Linear : oracle::Mode::Exact),
      exact_(model, th, kind, oracle::Mode::Exact),
      options_(options),
      floor_(options.allow_zero_tickets ? 0 : 1),
      closed_form_(engine::has_closed_form_bound(th, kind)) {
    for (std::size_t pos = 0; pos < model_.size(); ++pos) {
        if (!classes_.empty() && model_.sorted_weight(classes_.back().first) == model_.sorted_weight(pos)) {
            ++classes_.back().size;
        } else {
            classes_.push_back({pos, 1});
        }
    }
    after_.assign(classes_.size(), 0);
    for (std::size_t c = classes_.size(); c-- > 1;) after_[c - 1] = after_[c] + classes_[c].size;
}

ticket_t Allocator::lower_bound() const noexcept {
    return floor_ ? static_cast<ticket_t>(model_.size()) : ticket_t{1};
}

// Spare tickets at which the proportional allocation is valid.
ticket_t Allocator::spare_ceiling() const {
    const auto& th = oracle_.thresholds();
    const core::Rational n(static_cast<unsigned long>(model_.size()));
    core::Rational extra;
    if (oracle_.kind() == ProblemKind::WeightRestriction) {
        // floor: t(S) < n + tw*M <= tn*M < tn*N. Without it N may fall up to
        // n - 1 short of M.
        extra = floor_ ? core::Rational(n * (2 - th.tn) / (th.tn - th.tw))
                       : core::Rational(n / (th.tn - th.tw));
    } else {
        // floor: t(S) > tw*M >= tn*(n + M)
        extra = floor_ ? core::Rational(th.tn * n / (th.tw - th.tn))
                       : core::Rational(n / (th.tw - th.tn));
    }
    const ticket_t base = floor_ * static_cast<ticket_t>(model_.size());
    const core::Integer bound = core::ceil(extra) + core::to_integer(base);
    const auto total = core::to_ticket(bound);
    if (!total) {
        throw core::SolverError(core::ErrorKind::InfeasibleThresholds,
                                "ticket bound " + bound.get_str() + " exceeds the ticket range");
    }
    return *total - base;
}

ticket_t Allocator::upper_bound() const {
    if (closed_form_) {
        return std::max(spare_ceiling() + floor_ * static_cast<ticket_t>(model_.size()), lower_bound());
    }
    return lower_bound() + static_cast<ticket_t>(std::max<std::size_t>(options_.max_scan_totals, 1)) - 1;
}

engine::Assignment Allocator::proportional(ticket_t spare) const {
    const core::Integer M = core::to_integer(spare);
    const core::Integer& W = model_.scaled_total();
    engine::Assignment out(model_.size(), floor_);
    core::Integer share;
    for (std::size_t p = 0; p < model_.size(); ++p) {
        mpz_fdiv_q(share.get_mpz_t(), core::Integer(model_.scaled_weight(p) * M).get_mpz_t(), W.get_mpz_t());
        out[p] += static_cast<ticket_t>(share.get_ui()); // share <= spare
    }
    return out;
}

std::optional<std::string> Allocator::infeasibility() const {
    const auto& th = oracle_.thresholds();
    const core::Integer& W = model_.scaled_total();

    if (oracle_.kind() == ProblemKind::WeightQualification) {
        // Disjoint coalitions of weight >= tw*W each need ceil(tn*N) tickets.
        const core::Integer need = core::ceil(core::Rational(th.tw * W));
        std::size_t groups = 0;
        std::size_t left = 0;
        core::Integer acc(0);
        for (std::size_t pos = 0; pos < model_.size(); ++pos) {
            acc += model_.scaled_weight(model_.party_at(pos));
            ++left;
            if (acc >= need) {
                ++groups;
                acc = 0;
                left = 0;
            }
        }
        const core::Rational demand(th.tn * static_cast<unsigned long>(groups));
        if (demand > 1) {
            return std::to_string(groups) + " disjoint coalitions each hold at least tw=" + core::to_string(th.tw) +
                   " of the weight and together need more than every ticket";
        }
        if (demand == 1 && left > 0 && floor_ > 0) {
            return std::to_string(groups) + " disjoint coalitions each hold at least tw=" + core::to_string(th.tw) +
                   " of the weight and together need every ticket, leaving none for the other " +
                   std::to_string(left) + " parties";
        }
        return std::nullopt;
    }

    // First-fit decreasing into coalitions lighter than tw*W; each stays below tn*N.
    const core::Integer room = core::ceil(core::Rational(th.tw * W)) - 1;
    std::vector<core::Integer> bins;
    for (std::size_t pos = 0; pos < model_.size(); ++pos) {
        const core::Integer& w = model_.scaled_weight(model_.party_at(pos));
        if (w > room) return std::nullopt;
        auto fit = std::find_if(bins.begin(), bins.end(), [&](const core::Integer& b) { return b + w <= room; });
        if (fit == bins.end()) {
            bins.push_back(w);
        } else {
            *fit += w;
        }
    }
    if (core::Rational(th.tn * static_cast<unsigned long>(bins.size())) <= 1) {
        return "the parties split into " + std::to_string(bins.size()) + " coalitions below tw=" +
               core::to_string(th.tw) + " of the weight, which cannot all stay below tn=" +
               core::to_string(th.tn) + " of the tickets";
    }
    return std::nullopt;
}

// Smallest spare whose proportional allocation the oracle accepts, assuming
// acceptance grows with the spare; the ceiling needs no check.
engine::Solution Allocator::bisect() const {
    auto accepted = [&](ticket_t spare) {
        const auto t = proportional(spare);
        return engine::total_of(t) > 0 && oracle_.accepts(t);
    };

    ticket_t hi = spare_ceiling();
    if (accepted(0)) {
        hi = 0;
    } else {
        ticket_t lo = 0;
        std::size_t steps = 0;
        while (hi - lo > 1) {
            if (steps == options_.max_search_steps) {
                core::log::warn("proportional search stopped after ", steps, " steps");
                break;
            }
            ++steps;
            const ticket_t mid = lo + (hi - lo) / 2;
            const bool ok = accepted(mid);
            core::log::debug("proportional step ", steps, ": spare ", mid, ok ? " accepted" : " rejected");
            (ok ? hi : lo) = mid;
        }
    }
    engine::Assignment tickets = proportional(hi);
    const ticket_t total = engine::total_of(tickets);
    core::log::debug("proportional allocation: N=", total, " (spare ", hi, ")");
    return engine::Solution{total, std::move(tickets), true};
}

// WR checks classes after c at the floor (a lower bound of any completion),
// WQ at `value` (an upper bound, since counts never increase).
void Allocator::fill_bound(Search& s, std::size_t c, ticket_t value) const {
    const bool wr = exact_.kind() == ProblemKind::WeightRestriction;
    for (std::size_t k = 0; k < classes_.size(); ++k) {
        const ticket_t v = k < c ? s.values[k] : (k == c || !wr ? value : floor_);
        const Class& cls = classes_[k];
        for (std::size_t pos = cls.first; pos < cls.first + cls.size; ++pos) s.bound[model_.party_at(pos)] = v;
    }
}

Allocator::Outcome Allocator::descend(Search& s, std::size_t c, ticket_t cap, ticket_t left) const {
    const ticket_t size = static_cast<ticket_t>(classes_[c].size);
    const ticket_t rest = static_cast<ticket_t>(after_[c]);
    if (left < floor_ * rest) return Outcome::Exhausted;

    // size*x + rest*floor <= left <= (size + rest)*x
    const ticket_t hi = std::min(cap, (left - floor_ * rest) / size);
    const ticket_t lo = std::max(floor_, (left + size + rest - 1) / (size + rest));
    if (lo > hi) return Outcome::Exhausted;

    // Proportional share first, then alternately above and below it.
    const core::Integer share = core::to_integer(s.total) *
                                model_.scaled_weight(model_.party_at(classes_[c].first)) / model_.scaled_total();
    const ticket_t hint = std::clamp(core::to_ticket(share).value_or(hi), lo, hi);
    std::vector<ticket_t> order{hint};
    for (ticket_t d = 1; hint + d <= hi || hint >= lo + d; ++d) {
        if (hint + d <= hi) order.push_back(hint + d);
        if (hint >= lo + d) order.push_back(hint - d);
    }

    const bool last = c + 1 == classes_.size();
    for (const ticket_t x : order) {
        if (s.budget == 0) return Outcome::OutOfBudget;
        --s.budget;
        fill_bound(s, c, x);
        if (exact_.violated_at(s.bound, s.total)) continue;
        s.values[c] = x;
        if (last) return Outcome::Found;
        const Outcome r = descend(s, c + 1, x, left - x * size);
        if (r != Outcome::Exhausted) return r;
    }
    return Outcome::Exhausted;
}

Allocator::Outcome Allocator::search(ticket_t total, std::size_t& budget, engine::Assignment& out) const {
    if (total < lower_bound()) return Outcome::Exhausted;
    Search s{total, budget, std::vector<ticket_t>(classes_.size(), 0), engine::Assignment(model_.size(), 0)};
    const Outcome r = descend(s, 0, std::numeric_limits<ticket_t>::max(), total);
    static constexpr const char* kVerdict[] = {"assignment found", "no assignment", "budget exhausted"};
    core::log::debug("N=", total, ": ", kVerdict[static_cast<int>(r)], " after ", budget - s.budget, " oracle calls");
    budget = s.budget;
    if (r == Outcome::Found) out = s.bound;
    return r;
}

std::optional<engine::Assignment> Allocator::construct(ticket_t total) const {
    std::size_t budget = options_.max_search_nodes;
    engine::Assignment out;
    if (search(total, budget, out) != Outcome::Found) return std::nullopt;
    return out;
}

engine::Solution Allocator::solve() const {
    const auto& th = oracle_.thresholds();
    if (auto reason = infeasibility()) {
        throw core::SolverError(core::ErrorKind::InfeasibleThresholds, "no valid assignment exists: " + *reason);
    }

    const ticket_t low = lower_bound();
    ticket_t high = upper_bound();
    std::optional<engine::Solution> best;
    if (closed_form_) {
        best = bisect();
        if (options_.linear) {
            best->minimal = best->total == low;
            return std::move(*best);
        }
        high = best->total - 1;
    }
    core::log::debug("exhaustive search over N in [", low, ", ", high, "]");

    std::size_t budget = options_.max_search_nodes;
    engine::Assignment found;
    for (ticket_t total = low; total <= high; ++total) {
        const Outcome r = search(total, budget, found);
        if (r == Outcome::Found) return engine::Solution{total, std::move(found), true};
        if (r == Outcome::OutOfBudget) {
            if (best) {
                core::log::warn("search budget of ", options_.max_search_nodes, " oracle calls exhausted at N=", total,
                                "; N=", best->total, " may not be minimal");
                best->minimal = false;
                return std::move(*best);
            }
            throw core::SolverError(core::ErrorKind::InfeasibleThresholds,
                                    "search budget of " + std::to_string(options_.max_search_nodes) +
                                        " oracle calls exhausted at N=" + std::to_string(total) +
                                        " without finding an assignment");
        }
    }
    if (best) return std::move(*best);
    throw core::SolverError(core::ErrorKind::InfeasibleThresholds,
                            "no valid assignment with at most " + std::to_string(high) + " tickets (tw=" +
                                core::to_string(th.tw) + ", tn=" + core::to_string(th.tn) +
                                " admits no closed-form ticket bound)");
}

} // namespace alloc
